// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transfer_state_store.hpp"

#include <openssl/evp.h>
#include <unistd.h>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "transfer_error.hpp"

#define SLUICE_LOG_COMPONENT "state_store"
#include <sluice_log_macros.hpp>

namespace fs = std::filesystem;

namespace sluice {
namespace transfer {

using ::sluice::logging::kv;

std::string sanitizeKey(const std::string& raw) {
  std::string safe = raw;
  for (auto& c : safe) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (!std::isalnum(uc) && c != '-' && c != '_') {
      c = '_';
    }
  }
  return safe;
}

namespace {

// Readable part of a record name; the digest keeps names distinct
constexpr size_t kMaxReadableNameLength = 96;

std::string sha256Hex(const std::string& data) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (EVP_Digest(data.data(), data.size(), hash, &hash_len, EVP_sha256(), nullptr) != 1) {
    throw TransferError(ErrorKind::Io, "cannot compute state record name digest");
  }

  std::ostringstream ss;
  ss << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < hash_len; ++i) {
    ss << std::setw(2) << static_cast<unsigned>(hash[i]);
  }
  return ss.str();
}

}  // namespace

std::string stateFileName(const std::string& bucket_key, const std::string& object_key) {
  std::string readable = sanitizeKey(bucket_key + "_" + object_key);
  if (readable.size() > kMaxReadableNameLength) {
    readable.resize(kMaxReadableNameLength);
  }
  std::string raw_key = bucket_key;
  raw_key.push_back('\0');
  raw_key += object_key;
  return "upload_" + readable + "_" + sha256Hex(raw_key) + ".json";
}

FileTransferStateStore::FileTransferStateStore(const std::string& state_dir)
    : state_dir_(state_dir) {
  if (state_dir_.empty()) {
    throw TransferError(ErrorKind::InvalidArgument, "state directory is empty");
  }
  std::error_code ec;
  fs::create_directories(state_dir_, ec);
  if (ec) {
    throw TransferError(
      ErrorKind::Io, "cannot create state directory " + state_dir_ + ": " + ec.message()
    );
  }
}

std::string FileTransferStateStore::statePath(
  const std::string& bucket_key, const std::string& object_key
) const {
  return (fs::path(state_dir_) / stateFileName(bucket_key, object_key)).string();
}

std::optional<TransferState> FileTransferStateStore::load(
  const std::string& bucket_key, const std::string& object_key
) {
  const std::string path = statePath(bucket_key, object_key);

  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return std::nullopt;
  }

  std::ifstream in(path);
  if (!in) {
    SLUICE_LOG_WARN("State record unreadable, starting fresh" << kv("path", path));
    return std::nullopt;
  }

  nlohmann::json j = nlohmann::json::parse(in, nullptr, false);
  if (j.is_discarded()) {
    SLUICE_LOG_WARN("State record is not valid JSON, starting fresh" << kv("path", path));
    return std::nullopt;
  }

  TransferState state;
  try {
    j.get_to(state);
  } catch (const nlohmann::json::exception& e) {
    SLUICE_LOG_WARN(
      "State record has missing or mistyped fields, starting fresh" << kv("path", path)
                                                                      << kv("error", e.what())
    );
    return std::nullopt;
  } catch (const std::logic_error& e) {
    // std::stoul on a non-numeric part_etags key
    SLUICE_LOG_WARN(
      "State record has a malformed part number, starting fresh" << kv("path", path)
                                                                   << kv("error", e.what())
    );
    return std::nullopt;
  }

  std::string reason;
  if (!state.isValid(&reason)) {
    SLUICE_LOG_WARN(
      "State record violates invariants, starting fresh" << kv("path", path)
                                                           << kv("reason", reason)
    );
    return std::nullopt;
  }

  // Hand-copied or renamed record
  if (state.bucket_key != bucket_key || state.object_key != object_key) {
    SLUICE_LOG_WARN(
      "State record belongs to a different object, ignoring"
      << kv("path", path) << kv("recorded_bucket", state.bucket_key)
      << kv("recorded_object", state.object_key)
    );
    return std::nullopt;
  }

  return state;
}

void FileTransferStateStore::save(const TransferState& state) {
  const std::string path = statePath(state.bucket_key, state.object_key);
  const std::string tmp_path = path + ".tmp." + std::to_string(::getpid());

  {
    std::ofstream out(tmp_path, std::ios::out | std::ios::trunc);
    if (!out) {
      throw TransferError(ErrorKind::Io, "cannot open " + tmp_path + " for writing");
    }
    out << nlohmann::json(state).dump(2);
    out.flush();
    if (!out) {
      std::error_code ignored;
      fs::remove(tmp_path, ignored);
      throw TransferError(ErrorKind::Io, "failed writing state record " + tmp_path);
    }
  }

  std::error_code ec;
  fs::rename(tmp_path, path, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp_path, ignored);
    throw TransferError(
      ErrorKind::Io, "cannot move state record into place at " + path + ": " + ec.message()
    );
  }

  SLUICE_LOG_DEBUG(
    "State saved" << kv("path", path) << kv("completed", state.completed_parts.size())
                  << kv("total", state.total_parts)
  );
}

void FileTransferStateStore::remove(const std::string& bucket_key, const std::string& object_key) {
  const std::string path = statePath(bucket_key, object_key);
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    throw TransferError(
      ErrorKind::Io, "cannot delete state record " + path + ": " + ec.message()
    );
  }
}

}  // namespace transfer
}  // namespace sluice
