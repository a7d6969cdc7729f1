// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * End-to-end tests of TransferClient wiring over a scripted HTTP client
 */

#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "test_helpers.hpp"
#include "transfer_client.hpp"
#include "transfer_error.hpp"

using namespace sluice::transfer;
using namespace sluice::transfer::test;

namespace {

const char* kApi = "https://api.example.com/oss/v2";
const char* kSignUrl = "https://api.example.com/oss/v2/buckets/bucket/objects/obj/signeds3upload";
const char* kDownloadUrl =
  "https://api.example.com/oss/v2/buckets/bucket/objects/obj/signeds3download";

}  // namespace

class TransferClientTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir_ = createTempDir("sluice_client_test_");
    config_.api.base_url = kApi;
    config_.api.access_token = "token";
    config_.state_dir = test_dir_ + "/state";
    config_.retry.jitter = false;
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(test_dir_, ec);
  }

  std::unique_ptr<TransferClient> makeClient(FakeHttpClient** http_out) {
    auto http = std::make_unique<FakeHttpClient>();
    *http_out = http.get();
    return std::make_unique<TransferClient>(
      config_, std::move(http), std::make_unique<FileTransferStateStore>(config_.state_dir),
      [this](std::chrono::milliseconds d) {
        sleeps_.push_back(d.count());
      }
    );
  }

  std::string test_dir_;
  TransferConfig config_;
  std::vector<int64_t> sleeps_;
};

TEST_F(TransferClientTest, DefaultOptionsFollowConfig) {
  config_.upload.chunk_size_mb = 8;
  config_.upload.concurrency = 3;
  FakeHttpClient* http = nullptr;
  auto client = makeClient(&http);

  auto options = client->defaultUploadOptions();
  EXPECT_EQ(options.chunk_size, 8 * kMiB);
  EXPECT_EQ(options.concurrency, 3);
  EXPECT_FALSE(options.resume);
}

TEST_F(TransferClientTest, UploadsThroughProviderAndStorage) {
  FakeHttpClient* http = nullptr;
  auto client = makeClient(&http);

  http->enqueue(kSignUrl, makeResponse(200, R"({"uploadKey": "k1", "urls": ["https://s3/p1"]})"));
  http->enqueue(
    kSignUrl,
    makeResponse(200, R"({"bucketKey": "bucket", "objectKey": "obj", "objectId": "id-1", "size": 2048})")
  );

  std::string path = createTestFile(test_dir_ + "/file.bin", 2048);
  auto info = client->upload("bucket", "obj", path, client->defaultUploadOptions());

  EXPECT_EQ(info.object_id, "id-1");
  EXPECT_EQ(info.size, 2048u);
  EXPECT_EQ(http->storedBody("https://s3/p1"), patternBytes(0, 2048));

  auto calls = http->calls();
  ASSERT_EQ(calls.size(), 3u);
  EXPECT_EQ(calls[0].method, HttpMethod::Get);
  EXPECT_EQ(calls[1].method, HttpMethod::Put);
  EXPECT_EQ(calls[2].method, HttpMethod::Post);
}

TEST_F(TransferClientTest, SigningFailureIsRetried) {
  config_.retry.max_retries = 2;
  FakeHttpClient* http = nullptr;
  auto client = makeClient(&http);

  http->enqueue(kSignUrl, makeResponse(500, "oops"));
  http->enqueue(kSignUrl, makeResponse(200, R"({"uploadKey": "k1", "urls": ["https://s3/p1"]})"));
  http->enqueue(
    kSignUrl, makeResponse(200, R"({"bucketKey": "bucket", "objectKey": "obj", "objectId": "id"})")
  );

  std::string path = createTestFile(test_dir_ + "/file.bin", 100);
  EXPECT_NO_THROW(client->upload("bucket", "obj", path, client->defaultUploadOptions()));
  EXPECT_EQ(http->callCount(kSignUrl), 3u);
}

TEST_F(TransferClientTest, SigningNotFoundIsNotRetried) {
  config_.retry.max_retries = 3;
  FakeHttpClient* http = nullptr;
  auto client = makeClient(&http);

  const std::string sign_url = std::string(kSignUrl) + "?parts=3";
  http->enqueue(sign_url, makeResponse(404, "bucket not found"));

  std::string path = createTestFile(test_dir_ + "/big.bin", 12 * kMiB);
  try {
    client->upload("bucket", "obj", path, client->defaultUploadOptions());
    FAIL() << "expected TransferError";
  } catch (const TransferError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::HttpStatus);
    EXPECT_EQ(e.statusCode(), 404);
    EXPECT_TRUE(e.completedParts().empty());
  }

  EXPECT_EQ(http->callCount(sign_url), 1u);
  EXPECT_EQ(http->calls().size(), 1u);
  EXPECT_TRUE(sleeps_.empty());
  FileTransferStateStore store(config_.state_dir);
  EXPECT_FALSE(store.load("bucket", "obj").has_value());
  EXPECT_FALSE(fs::exists(store.statePath("bucket", "obj")));
}

TEST_F(TransferClientTest, SigningUnavailableIsRetriedUntilExhausted) {
  config_.retry.max_retries = 3;
  FakeHttpClient* http = nullptr;
  auto client = makeClient(&http);

  for (int i = 0; i < 4; ++i) {
    http->enqueue(kSignUrl, makeResponse(503, "unavailable"));
  }

  std::string path = createTestFile(test_dir_ + "/file.bin", 100);
  try {
    client->upload("bucket", "obj", path, client->defaultUploadOptions());
    FAIL() << "expected TransferError";
  } catch (const TransferError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::HttpStatus);
    EXPECT_EQ(e.statusCode(), 503);
  }

  EXPECT_EQ(http->callCount(kSignUrl), 4u);
  EXPECT_EQ(sleeps_.size(), 3u);
}

TEST_F(TransferClientTest, DownloadsThroughProvider) {
  FakeHttpClient* http = nullptr;
  auto client = makeClient(&http);

  http->enqueue(kDownloadUrl, makeResponse(200, R"({"url": "https://s3/obj", "size": 5})"));
  http->setContent("https://s3/obj", "hello");

  std::string output = test_dir_ + "/out/hello.txt";
  EXPECT_EQ(client->download("bucket", "obj", output), 5u);
  EXPECT_EQ(readFile(output), "hello");
}

TEST_F(TransferClientTest, ProductionWiringCreatesStateDir) {
  TransferClient client(config_);
  EXPECT_TRUE(fs::is_directory(config_.state_dir));
  EXPECT_EQ(client.config().api.base_url, kApi);
}

TEST_F(TransferClientTest, EmptyBaseUrlRejected) {
  config_.api.base_url.clear();
  EXPECT_THROW({ TransferClient client(config_); }, TransferError);
}
