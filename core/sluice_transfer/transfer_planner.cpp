// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transfer_planner.hpp"

#include <algorithm>

namespace sluice {
namespace transfer {

uint32_t partCount(uint64_t file_size, uint64_t chunk_size) {
  if (chunk_size == 0 || file_size == 0) {
    return 1;
  }
  return static_cast<uint32_t>((file_size + chunk_size - 1) / chunk_size);
}

uint64_t clampChunkSize(uint64_t requested) {
  return std::clamp(requested, kMinChunkSize, kMaxChunkSize);
}

TransferPlan planTransfer(uint64_t file_size, uint64_t chunk_size) {
  TransferPlan plan;
  if (file_size <= kMultipartThreshold) {
    plan.strategy = TransferStrategy::SinglePart;
    plan.chunk_size = file_size;
    plan.total_parts = 1;
    return plan;
  }

  plan.strategy = TransferStrategy::Multipart;
  plan.chunk_size = clampChunkSize(chunk_size);
  plan.total_parts = partCount(file_size, plan.chunk_size);
  return plan;
}

}  // namespace transfer
}  // namespace sluice
