// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_TRANSFER_STATE_STORE_HPP
#define SLUICE_TRANSFER_STATE_STORE_HPP

#include <optional>
#include <string>

#include "transfer_state.hpp"

namespace sluice {
namespace transfer {

/**
 * Durable storage of resumable upload records, one per (bucket, object).
 */
class ITransferStateStore {
public:
  virtual ~ITransferStateStore() = default;

  /**
   * @return The record, or std::nullopt when none exists or it is unreadable.
   *         Corruption is never reported as an error.
   */
  virtual std::optional<TransferState> load(
    const std::string& bucket_key, const std::string& object_key
  ) = 0;

  /**
   * Persist the full record atomically. Throws TransferError(Io) on failure.
   */
  virtual void save(const TransferState& state) = 0;

  /**
   * Delete the record. Deleting an absent record is not an error.
   * Throws TransferError(Io) on failure.
   */
  virtual void remove(const std::string& bucket_key, const std::string& object_key) = 0;
};

/**
 * Replace every character outside [A-Za-z0-9_-] with '_'
 */
std::string sanitizeKey(const std::string& raw);

/**
 * File name of the record for (bucket, object):
 * upload_<sanitized bucket_object, at most 96 chars>_<sha256 of bucket NUL object>.json
 *
 * Distinct keys never share a record, even when they sanitize alike.
 */
std::string stateFileName(const std::string& bucket_key, const std::string& object_key);

/**
 * JSON file per record under an explicit state directory.
 *
 * Writes go to a temporary file in the same directory which is then renamed
 * over the record, so readers never observe a half-written file.
 */
class FileTransferStateStore : public ITransferStateStore {
public:
  /**
   * @param state_dir Directory for state records, created if missing.
   *                  Throws TransferError(Io) when it cannot be created.
   */
  explicit FileTransferStateStore(const std::string& state_dir);

  std::optional<TransferState> load(
    const std::string& bucket_key, const std::string& object_key
  ) override;
  void save(const TransferState& state) override;
  void remove(const std::string& bucket_key, const std::string& object_key) override;

  std::string statePath(const std::string& bucket_key, const std::string& object_key) const;

  const std::string& stateDir() const {
    return state_dir_;
  }

private:
  std::string state_dir_;
};

}  // namespace transfer
}  // namespace sluice

#endif  // SLUICE_TRANSFER_STATE_STORE_HPP
