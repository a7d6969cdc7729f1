// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for TransferState
 */

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "transfer_error.hpp"
#include "transfer_planner.hpp"
#include "transfer_state.hpp"

using namespace sluice::transfer;

class TransferStateTest : public ::testing::Test {
protected:
  void SetUp() override {
    state_ = TransferState::create(
      "bucket", "dir/object.bin", "/data/object.bin", Fingerprint{12 * kMiB, 1700000000},
      5 * kMiB, "session-1"
    );
  }

  TransferState state_;
};

TEST_F(TransferStateTest, CreateDerivesPartCount) {
  EXPECT_EQ(state_.total_parts, 3u);
  EXPECT_EQ(state_.chunk_size, 5 * kMiB);
  EXPECT_EQ(state_.file_size, 12 * kMiB);
  EXPECT_EQ(state_.file_mtime, 1700000000);
  EXPECT_EQ(state_.session_token, "session-1");
  EXPECT_TRUE(state_.completed_parts.empty());
  EXPECT_GT(state_.started_at, 0);
  EXPECT_TRUE(state_.isValid());
}

TEST_F(TransferStateTest, CreateRejectsZeroChunk) {
  EXPECT_THROW(
    TransferState::create("b", "o", "/p", Fingerprint{10, 1}, 0, "s"), TransferError
  );
}

TEST_F(TransferStateTest, PartGeometry) {
  EXPECT_EQ(state_.partOffset(1), 0u);
  EXPECT_EQ(state_.partOffset(3), 10 * kMiB);
  EXPECT_EQ(state_.partLength(1), 5 * kMiB);
  EXPECT_EQ(state_.partLength(3), 2 * kMiB);
}

TEST_F(TransferStateTest, MarkCompletedTracksRemaining) {
  EXPECT_EQ(state_.remainingParts(), (std::vector<uint32_t>{1, 2, 3}));

  state_.markCompleted(2, "etag-2");
  EXPECT_EQ(state_.remainingParts(), (std::vector<uint32_t>{1, 3}));
  EXPECT_EQ(state_.part_etags.at(2), "etag-2");
  EXPECT_EQ(state_.completedBytes(), 5 * kMiB);

  state_.markCompleted(3, "etag-3");
  state_.markCompleted(1, "etag-1");
  EXPECT_TRUE(state_.remainingParts().empty());
  EXPECT_TRUE(state_.isComplete());
  EXPECT_EQ(state_.completedBytes(), 12 * kMiB);
}

TEST_F(TransferStateTest, MarkCompletedIsIdempotent) {
  state_.markCompleted(1, "a");
  state_.markCompleted(1, "b");
  EXPECT_EQ(state_.completed_parts.size(), 1u);
  EXPECT_EQ(state_.part_etags.at(1), "b");
}

TEST_F(TransferStateTest, MarkCompletedRejectsOutOfRange) {
  EXPECT_THROW(state_.markCompleted(0, "x"), TransferError);
  EXPECT_THROW(state_.markCompleted(4, "x"), TransferError);
  EXPECT_TRUE(state_.completed_parts.empty());
}

TEST_F(TransferStateTest, InvalidWhenPartCountDisagrees) {
  state_.total_parts = 4;
  std::string reason;
  EXPECT_FALSE(state_.isValid(&reason));
  EXPECT_NE(reason.find("total_parts"), std::string::npos);
}

TEST_F(TransferStateTest, InvalidWhenChunkSizeOutOfRange) {
  // Hand-edited record: 1-byte chunks with a consistent part count
  state_.chunk_size = 1;
  state_.total_parts = partCount(state_.file_size, 1);
  std::string reason;
  EXPECT_FALSE(state_.isValid(&reason));
  EXPECT_NE(reason.find("chunk_size"), std::string::npos);

  state_.chunk_size = kMaxChunkSize + 1;
  state_.total_parts = 1;
  EXPECT_FALSE(state_.isValid());

  state_.chunk_size = kMaxChunkSize;
  EXPECT_TRUE(state_.isValid());
}

TEST_F(TransferStateTest, InvalidWhenCompletedPartOutOfRange) {
  state_.completed_parts.insert(7);
  state_.part_etags[7] = "e";
  EXPECT_FALSE(state_.isValid());
}

TEST_F(TransferStateTest, InvalidWhenEtagsDisagree) {
  state_.completed_parts.insert(1);
  EXPECT_FALSE(state_.isValid());

  state_.part_etags[2] = "e";
  state_.part_etags[1] = "e";
  EXPECT_FALSE(state_.isValid());
}

TEST_F(TransferStateTest, JsonUsesStableFieldNames) {
  state_.markCompleted(1, "etag-1");
  nlohmann::json j = state_;

  EXPECT_EQ(j.at("bucket_key"), "bucket");
  EXPECT_EQ(j.at("object_key"), "dir/object.bin");
  EXPECT_EQ(j.at("file_path"), "/data/object.bin");
  EXPECT_EQ(j.at("file_size"), 12 * kMiB);
  EXPECT_EQ(j.at("chunk_size"), 5 * kMiB);
  EXPECT_EQ(j.at("total_parts"), 3);
  EXPECT_EQ(j.at("completed_parts"), nlohmann::json::array({1}));
  EXPECT_EQ(j.at("part_etags").at("1"), "etag-1");
  EXPECT_EQ(j.at("session_token"), "session-1");
  EXPECT_EQ(j.at("file_mtime"), 1700000000);
  EXPECT_TRUE(j.contains("started_at"));

  TransferState parsed = j.get<TransferState>();
  EXPECT_EQ(parsed.completed_parts, state_.completed_parts);
  EXPECT_EQ(parsed.part_etags, state_.part_etags);
  EXPECT_EQ(parsed.fingerprint(), state_.fingerprint());
  EXPECT_EQ(parsed.started_at, state_.started_at);
}

TEST_F(TransferStateTest, JsonMissingFieldThrows) {
  nlohmann::json j = state_;
  j.erase("chunk_size");
  EXPECT_THROW(j.get<TransferState>(), nlohmann::json::exception);
}

TEST(FingerprintTest, Equality) {
  EXPECT_EQ((Fingerprint{10, 5}), (Fingerprint{10, 5}));
  EXPECT_NE((Fingerprint{10, 5}), (Fingerprint{11, 5}));
  EXPECT_NE((Fingerprint{10, 5}), (Fingerprint{10, 6}));
}
