// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transfer_state.hpp"

#include <algorithm>
#include <chrono>

#include "transfer_error.hpp"
#include "transfer_planner.hpp"

namespace sluice {
namespace transfer {

TransferState TransferState::create(
  const std::string& bucket_key, const std::string& object_key, const std::string& local_path,
  const Fingerprint& fingerprint, uint64_t chunk_size, const std::string& session_token
) {
  if (chunk_size == 0) {
    throw TransferError(ErrorKind::InvalidArgument, "chunk size must be positive");
  }

  TransferState state;
  state.bucket_key = bucket_key;
  state.object_key = object_key;
  state.local_path = local_path;
  state.file_size = fingerprint.file_size;
  state.file_mtime = fingerprint.file_mtime;
  state.chunk_size = chunk_size;
  state.total_parts = partCount(fingerprint.file_size, chunk_size);
  state.session_token = session_token;
  state.started_at = std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch()
  )
                       .count();
  return state;
}

std::vector<uint32_t> TransferState::remainingParts() const {
  std::vector<uint32_t> remaining;
  for (uint64_t part = 1; part <= total_parts; ++part) {
    if (completed_parts.count(static_cast<uint32_t>(part)) == 0) {
      remaining.push_back(static_cast<uint32_t>(part));
    }
  }
  return remaining;
}

void TransferState::markCompleted(uint32_t part_number, const std::string& etag) {
  if (part_number < 1 || part_number > total_parts) {
    throw TransferError(
      ErrorKind::InvalidArgument, "part " + std::to_string(part_number) + " outside 1.." +
                                    std::to_string(total_parts)
    );
  }
  completed_parts.insert(part_number);
  part_etags[part_number] = etag;
}

uint64_t TransferState::partOffset(uint32_t part_number) const {
  return static_cast<uint64_t>(part_number - 1) * chunk_size;
}

uint64_t TransferState::partLength(uint32_t part_number) const {
  uint64_t offset = partOffset(part_number);
  if (offset >= file_size) {
    return 0;
  }
  return std::min(chunk_size, file_size - offset);
}

uint64_t TransferState::completedBytes() const {
  uint64_t bytes = 0;
  for (uint32_t part : completed_parts) {
    bytes += partLength(part);
  }
  return bytes;
}

bool TransferState::isValid(std::string* reason) const {
  auto fail = [reason](const std::string& message) {
    if (reason) {
      *reason = message;
    }
    return false;
  };

  if (bucket_key.empty() || object_key.empty()) {
    return fail("empty bucket or object key");
  }
  if (chunk_size < kMinChunkSize || chunk_size > kMaxChunkSize) {
    return fail(
      "chunk_size " + std::to_string(chunk_size) + " outside " + std::to_string(kMinChunkSize) +
      ".." + std::to_string(kMaxChunkSize)
    );
  }
  if (total_parts < 1) {
    return fail("total_parts is zero");
  }
  if (total_parts != partCount(file_size, chunk_size)) {
    return fail(
      "total_parts " + std::to_string(total_parts) + " does not match file_size/chunk_size"
    );
  }
  for (uint32_t part : completed_parts) {
    if (part < 1 || part > total_parts) {
      return fail("completed part " + std::to_string(part) + " out of range");
    }
  }
  if (part_etags.size() != completed_parts.size()) {
    return fail("part_etags and completed_parts differ");
  }
  for (const auto& entry : part_etags) {
    if (completed_parts.count(entry.first) == 0) {
      return fail("etag recorded for incomplete part " + std::to_string(entry.first));
    }
  }
  return true;
}

void to_json(nlohmann::json& j, const TransferState& state) {
  nlohmann::json etags = nlohmann::json::object();
  for (const auto& entry : state.part_etags) {
    etags[std::to_string(entry.first)] = entry.second;
  }

  j = nlohmann::json{
    {"bucket_key", state.bucket_key},
    {"object_key", state.object_key},
    {"file_path", state.local_path},
    {"file_size", state.file_size},
    {"chunk_size", state.chunk_size},
    {"total_parts", state.total_parts},
    {"completed_parts", std::vector<uint32_t>(state.completed_parts.begin(), state.completed_parts.end())},
    {"part_etags", etags},
    {"session_token", state.session_token},
    {"started_at", state.started_at},
    {"file_mtime", state.file_mtime},
  };
}

void from_json(const nlohmann::json& j, TransferState& state) {
  j.at("bucket_key").get_to(state.bucket_key);
  j.at("object_key").get_to(state.object_key);
  j.at("file_path").get_to(state.local_path);
  j.at("file_size").get_to(state.file_size);
  j.at("chunk_size").get_to(state.chunk_size);
  j.at("total_parts").get_to(state.total_parts);
  j.at("session_token").get_to(state.session_token);
  j.at("started_at").get_to(state.started_at);
  j.at("file_mtime").get_to(state.file_mtime);

  state.completed_parts.clear();
  for (const auto& part : j.at("completed_parts")) {
    state.completed_parts.insert(part.get<uint32_t>());
  }

  state.part_etags.clear();
  for (const auto& item : j.at("part_etags").items()) {
    // Keys are decimal part numbers; std::stoul throws on garbage
    unsigned long part = std::stoul(item.key());
    state.part_etags[static_cast<uint32_t>(part)] = item.value().get<std::string>();
  }
}

}  // namespace transfer
}  // namespace sluice
