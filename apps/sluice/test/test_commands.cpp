// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Tests for the sluice command line front end
 */

#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>
#include <functional>
#include <string>
#include <vector>

#include <test_helpers.hpp>
#include <transfer_state_store.hpp>

#include "../commands.hpp"

using namespace sluice::transfer;
using namespace sluice::transfer::test;
using sluice::cli::Commands;

namespace {

const char* kSignUrl = "https://api.example.com/oss/v2/buckets/bucket/objects/obj/signeds3upload";
const char* kDownloadUrl =
  "https://api.example.com/oss/v2/buckets/bucket/objects/obj/signeds3download";

}  // namespace

class CommandsTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir_ = createTempDir("sluice_cli_test_");
    setenv("SLUICE_BASE_URL", "https://api.example.com/oss/v2", 1);
    setenv("SLUICE_STATE_DIR", (test_dir_ + "/state").c_str(), 1);
    unsetenv("SLUICE_TOKEN");
    unsetenv("SLUICE_TIMEOUT");
  }

  void TearDown() override {
    unsetenv("SLUICE_BASE_URL");
    unsetenv("SLUICE_STATE_DIR");
    std::error_code ec;
    fs::remove_all(test_dir_, ec);
  }

  Commands::ClientFactory factory() {
    return [this](const TransferConfig& config) {
      seen_config_ = config;
      ++clients_created_;
      auto http = std::make_unique<FakeHttpClient>();
      if (script_) {
        script_(*http);
      }
      return std::make_unique<TransferClient>(
        config, std::move(http), std::make_unique<FileTransferStateStore>(config.state_dir),
        [](std::chrono::milliseconds) {}
      );
    };
  }

  int run(const std::vector<std::string>& args) {
    std::vector<std::string> storage = {"sluice"};
    storage.insert(storage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    for (auto& arg : storage) {
      argv.push_back(&arg[0]);
    }
    Commands commands(factory());
    return commands.execute(static_cast<int>(argv.size()), argv.data());
  }

  std::string test_dir_;
  std::function<void(FakeHttpClient&)> script_;
  TransferConfig seen_config_;
  int clients_created_ = 0;
};

TEST_F(CommandsTest, HelpPrintsUsage) {
  testing::internal::CaptureStdout();
  EXPECT_EQ(run({"help"}), 0);
  std::string out = testing::internal::GetCapturedStdout();
  EXPECT_NE(out.find("Usage: sluice"), std::string::npos);
  EXPECT_NE(out.find("--resume"), std::string::npos);
}

TEST_F(CommandsTest, NoArgumentsPrintsUsage) {
  testing::internal::CaptureStdout();
  EXPECT_EQ(run({}), 0);
  EXPECT_NE(testing::internal::GetCapturedStdout().find("Commands:"), std::string::npos);
}

TEST_F(CommandsTest, UnknownCommandFails) {
  testing::internal::CaptureStderr();
  EXPECT_EQ(run({"sync"}), 1);
  EXPECT_NE(testing::internal::GetCapturedStderr().find("Unknown command"), std::string::npos);
}

TEST_F(CommandsTest, UnknownOptionFails) {
  EXPECT_EQ(run({"upload", "--fast", "bucket", "obj", "file"}), 1);
  EXPECT_EQ(clients_created_, 0);
}

TEST_F(CommandsTest, WrongArgumentCountFails) {
  EXPECT_EQ(run({"upload", "bucket", "obj"}), 1);
  EXPECT_EQ(run({"download", "bucket"}), 1);
  EXPECT_EQ(clients_created_, 0);
}

TEST_F(CommandsTest, NonNumericFlagFails) {
  EXPECT_EQ(run({"upload", "bucket", "obj", "file", "--concurrency", "many"}), 1);
  EXPECT_EQ(run({"upload", "bucket", "obj", "file", "--concurrency", "0"}), 1);
  EXPECT_EQ(run({"upload", "bucket", "obj", "file", "--chunk-size-mb"}), 1);
  EXPECT_EQ(clients_created_, 0);
}

TEST_F(CommandsTest, MissingBaseUrlFails) {
  unsetenv("SLUICE_BASE_URL");
  testing::internal::CaptureStderr();
  EXPECT_EQ(run({"download", "bucket", "obj", test_dir_ + "/out"}), 1);
  EXPECT_NE(testing::internal::GetCapturedStderr().find("api.base_url"), std::string::npos);
  EXPECT_EQ(clients_created_, 0);
}

TEST_F(CommandsTest, OutOfRangeChunkSizeFails) {
  testing::internal::CaptureStderr();
  EXPECT_EQ(run({"upload", "bucket", "obj", "file", "--chunk-size-mb", "200"}), 1);
  EXPECT_NE(testing::internal::GetCapturedStderr().find("chunk_size_mb"), std::string::npos);
}

TEST_F(CommandsTest, UploadSucceeds) {
  std::string path = createTestFile(test_dir_ + "/file.bin", 4096);
  script_ = [](FakeHttpClient& http) {
    http.enqueue(kSignUrl, makeResponse(200, R"({"uploadKey": "k", "urls": ["https://s3/p1"]})"));
    http.enqueue(
      kSignUrl,
      makeResponse(200, R"({"bucketKey": "bucket", "objectKey": "obj", "objectId": "id-9", "size": 4096})")
    );
  };

  testing::internal::CaptureStdout();
  EXPECT_EQ(run({"upload", "bucket", "obj", path, "--concurrency", "4", "--chunk-size-mb", "8"}), 0);
  std::string out = testing::internal::GetCapturedStdout();
  EXPECT_NE(out.find("Uploaded bucket/obj"), std::string::npos);
  EXPECT_NE(out.find("id-9"), std::string::npos);

  // Flags override configured values
  EXPECT_EQ(seen_config_.upload.concurrency, 4);
  EXPECT_EQ(seen_config_.upload.chunk_size_mb, 8u);
}

TEST_F(CommandsTest, UploadFailureReportsError) {
  std::string path = createTestFile(test_dir_ + "/file.bin", 100);
  script_ = [](FakeHttpClient& http) {
    http.enqueue(kSignUrl, makeResponse(403, "Token expired"));
  };

  testing::internal::CaptureStderr();
  EXPECT_EQ(run({"upload", "bucket", "obj", path}), 1);
  std::string err = testing::internal::GetCapturedStderr();
  EXPECT_NE(err.find("Error:"), std::string::npos);
  EXPECT_NE(err.find("HTTP 403"), std::string::npos);
}

TEST_F(CommandsTest, MissingFileReportsError) {
  testing::internal::CaptureStderr();
  EXPECT_EQ(run({"upload", "bucket", "obj", test_dir_ + "/nope.bin"}), 1);
  EXPECT_NE(testing::internal::GetCapturedStderr().find("cannot stat"), std::string::npos);
}

TEST_F(CommandsTest, DownloadSucceeds) {
  script_ = [](FakeHttpClient& http) {
    http.enqueue(kDownloadUrl, makeResponse(200, R"({"url": "https://s3/obj", "size": 11})"));
    http.setContent("https://s3/obj", "hello world");
  };

  std::string output = test_dir_ + "/downloads/obj.txt";
  testing::internal::CaptureStdout();
  EXPECT_EQ(run({"download", "bucket", "obj", output}), 0);
  EXPECT_NE(testing::internal::GetCapturedStdout().find("Downloaded bucket/obj"), std::string::npos);
  EXPECT_EQ(readFile(output), "hello world");
}

TEST_F(CommandsTest, ConfigFileIsLoaded) {
  unsetenv("SLUICE_BASE_URL");
  std::string config_path = test_dir_ + "/sluice.yaml";
  std::ofstream(config_path) << "api:\n  base_url: https://api.example.com/oss/v2\n"
                             << "  access_token: from-file\n"
                             << "retry:\n  max_retries: 1\n";
  script_ = [](FakeHttpClient& http) {
    http.enqueue(kDownloadUrl, makeResponse(200, R"({"url": "https://s3/obj"})"));
    http.setContent("https://s3/obj", "x");
  };

  EXPECT_EQ(run({"--config", config_path, "download", "bucket", "obj", test_dir_ + "/o"}), 0);
  EXPECT_EQ(seen_config_.api.access_token, "from-file");
  EXPECT_EQ(seen_config_.retry.max_retries, 1);
}

TEST_F(CommandsTest, MissingConfigFileFails) {
  EXPECT_EQ(run({"--config", test_dir_ + "/absent.yaml", "download", "b", "o", "out"}), 1);
  EXPECT_EQ(clients_created_, 0);
}
