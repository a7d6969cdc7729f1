// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include <gtest/gtest.h>

#include "transfer_planner.hpp"

using namespace sluice::transfer;

TEST(TransferPlannerTest, PartCountRoundsUp) {
  EXPECT_EQ(partCount(12 * kMiB, 5 * kMiB), 3u);
  EXPECT_EQ(partCount(10 * kMiB, 5 * kMiB), 2u);
  EXPECT_EQ(partCount(10 * kMiB + 1, 5 * kMiB), 3u);
  EXPECT_EQ(partCount(1, 5 * kMiB), 1u);
}

TEST(TransferPlannerTest, PartCountNeverZero) {
  EXPECT_EQ(partCount(0, 5 * kMiB), 1u);
  EXPECT_EQ(partCount(100, 0), 1u);
}

TEST(TransferPlannerTest, ClampChunkSize) {
  EXPECT_EQ(clampChunkSize(1), kMinChunkSize);
  EXPECT_EQ(clampChunkSize(0), kMinChunkSize);
  EXPECT_EQ(clampChunkSize(8 * kMiB), 8 * kMiB);
  EXPECT_EQ(clampChunkSize(500 * kMiB), kMaxChunkSize);
}

TEST(TransferPlannerTest, SmallFilesGoSinglePart) {
  auto plan = planTransfer(1024);
  EXPECT_FALSE(plan.isMultipart());
  EXPECT_EQ(plan.total_parts, 1u);
  EXPECT_EQ(plan.chunk_size, 1024u);

  auto boundary = planTransfer(kMultipartThreshold);
  EXPECT_EQ(boundary.strategy, TransferStrategy::SinglePart);

  auto empty = planTransfer(0);
  EXPECT_EQ(empty.strategy, TransferStrategy::SinglePart);
  EXPECT_EQ(empty.total_parts, 1u);
}

TEST(TransferPlannerTest, LargeFilesGoMultipart) {
  auto plan = planTransfer(kMultipartThreshold + 1);
  EXPECT_TRUE(plan.isMultipart());
  EXPECT_EQ(plan.chunk_size, kDefaultChunkSize);
  EXPECT_EQ(plan.total_parts, 2u);

  auto big = planTransfer(12 * kMiB, 5 * kMiB);
  EXPECT_EQ(big.total_parts, 3u);
}

TEST(TransferPlannerTest, MultipartChunkIsClamped) {
  auto plan = planTransfer(300 * kMiB, 500 * kMiB);
  EXPECT_EQ(plan.chunk_size, kMaxChunkSize);
  EXPECT_EQ(plan.total_parts, 3u);

  auto small_chunk = planTransfer(12 * kMiB, kMiB);
  EXPECT_EQ(small_chunk.chunk_size, kMinChunkSize);
  EXPECT_EQ(small_chunk.total_parts, 3u);
}
