// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_TRANSFER_PLANNER_HPP
#define SLUICE_TRANSFER_PLANNER_HPP

#include <cstdint>

namespace sluice {
namespace transfer {

constexpr uint64_t kMiB = 1024ULL * 1024ULL;

constexpr uint64_t kDefaultChunkSize = 5 * kMiB;    // Smallest part S3 accepts
constexpr uint64_t kMinChunkSize = 5 * kMiB;
constexpr uint64_t kMaxChunkSize = 100 * kMiB;
constexpr uint64_t kMultipartThreshold = 5 * kMiB;  // Files up to this size go single-part

enum class TransferStrategy { SinglePart, Multipart };

struct TransferPlan {
  TransferStrategy strategy = TransferStrategy::SinglePart;
  uint64_t chunk_size = 0;   // Whole file for SinglePart
  uint32_t total_parts = 1;

  bool isMultipart() const {
    return strategy == TransferStrategy::Multipart;
  }
};

/**
 * ceil(file_size / chunk_size), never less than 1
 */
uint32_t partCount(uint64_t file_size, uint64_t chunk_size);

/**
 * Clamp a requested chunk size into [kMinChunkSize, kMaxChunkSize]
 */
uint64_t clampChunkSize(uint64_t requested);

/**
 * Choose single-part or multipart upload for a file.
 *
 * @param file_size Size of the source file in bytes
 * @param chunk_size Part size for multipart, clamped into the allowed range
 */
TransferPlan planTransfer(uint64_t file_size, uint64_t chunk_size = kDefaultChunkSize);

}  // namespace transfer
}  // namespace sluice

#endif  // SLUICE_TRANSFER_PLANNER_HPP
