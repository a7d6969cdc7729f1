// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_TRANSFER_STATE_HPP
#define SLUICE_TRANSFER_STATE_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace sluice {
namespace transfer {

/**
 * (size, mtime) of a local file. mtime is in whole seconds since the epoch.
 */
struct Fingerprint {
  uint64_t file_size = 0;
  int64_t file_mtime = 0;

  bool operator==(const Fingerprint& other) const {
    return file_size == other.file_size && file_mtime == other.file_mtime;
  }
  bool operator!=(const Fingerprint& other) const {
    return !(*this == other);
  }
};

/**
 * Resumable record of one multipart upload, keyed by (bucket_key, object_key).
 *
 * Invariants (checked by isValid()):
 * - total_parts == ceil(file_size / chunk_size) and total_parts >= 1
 * - completed_parts is a subset of {1..total_parts}
 * - the keys of part_etags equal completed_parts
 *
 * chunk_size is fixed at creation and never re-derived.
 */
struct TransferState {
  std::string bucket_key;
  std::string object_key;
  std::string local_path;
  uint64_t file_size = 0;
  uint64_t chunk_size = 0;
  uint32_t total_parts = 0;
  std::set<uint32_t> completed_parts;
  std::map<uint32_t, std::string> part_etags;
  std::string session_token;
  int64_t started_at = 0;  // Unix seconds
  int64_t file_mtime = 0;

  /**
   * New record with no completed parts, started now.
   */
  static TransferState create(
    const std::string& bucket_key, const std::string& object_key, const std::string& local_path,
    const Fingerprint& fingerprint, uint64_t chunk_size, const std::string& session_token
  );

  Fingerprint fingerprint() const {
    return Fingerprint{file_size, file_mtime};
  }

  /**
   * {1..total_parts} minus completed_parts, ascending
   */
  std::vector<uint32_t> remainingParts() const;

  /**
   * Record a confirmed part. Throws TransferError(InvalidArgument) for a
   * part number outside [1, total_parts].
   */
  void markCompleted(uint32_t part_number, const std::string& etag);

  /**
   * Byte offset of a 1-indexed part
   */
  uint64_t partOffset(uint32_t part_number) const;

  /**
   * Byte length of a 1-indexed part; the last part may be short
   */
  uint64_t partLength(uint32_t part_number) const;

  uint64_t completedBytes() const;

  bool isComplete() const {
    return completed_parts.size() == total_parts;
  }

  /**
   * Check the invariants listed above.
   *
   * @param reason Receives a description of the first violation, may be null
   */
  bool isValid(std::string* reason = nullptr) const;
};

void to_json(nlohmann::json& j, const TransferState& state);
void from_json(const nlohmann::json& j, TransferState& state);

}  // namespace transfer
}  // namespace sluice

#endif  // SLUICE_TRANSFER_STATE_HPP
