// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transfer_error.hpp"

#include <sstream>
#include <utility>

namespace sluice {
namespace transfer {

namespace {

// Error pages from object stores can be large HTML documents
constexpr size_t kMaxBodyInMessage = 512;

}  // namespace

const char* toString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::HttpStatus:
      return "http_status";
    case ErrorKind::Timeout:
      return "timeout";
    case ErrorKind::Connect:
      return "connect";
    case ErrorKind::Transport:
      return "transport";
    case ErrorKind::InvalidResponse:
      return "invalid_response";
    case ErrorKind::Io:
      return "io";
    case ErrorKind::InvalidArgument:
      return "invalid_argument";
  }
  return "unknown";
}

TransferError::TransferError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message)
    , kind_(kind) {}

TransferError::TransferError(
  ErrorKind kind, const std::string& message, int status_code, std::string body,
  std::vector<uint32_t> completed_parts
)
    : std::runtime_error(message)
    , kind_(kind)
    , status_code_(status_code)
    , body_(std::move(body))
    , completed_parts_(std::move(completed_parts)) {}

TransferError TransferError::httpStatus(
  int status_code, const std::string& body, const std::string& context
) {
  std::ostringstream oss;
  oss << context << " failed (HTTP " << status_code << ")";
  if (!body.empty()) {
    oss << ": " << body.substr(0, kMaxBodyInMessage);
    if (body.size() > kMaxBodyInMessage) {
      oss << "...";
    }
  }
  return TransferError(ErrorKind::HttpStatus, oss.str(), status_code, body, {});
}

TransferError TransferError::withContext(const std::string& prefix) const {
  return TransferError(
    kind_, prefix + ": " + what(), status_code_, body_, completed_parts_
  );
}

TransferError TransferError::withCompletedParts(
  std::vector<uint32_t> parts, uint32_t total_parts
) const {
  std::ostringstream oss;
  oss << what() << " (completed parts: ";
  if (parts.empty()) {
    oss << "none";
  } else {
    for (size_t i = 0; i < parts.size(); ++i) {
      if (i > 0) oss << ",";
      oss << parts[i];
    }
  }
  oss << " of " << total_parts << ")";
  return TransferError(kind_, oss.str(), status_code_, body_, std::move(parts));
}

}  // namespace transfer
}  // namespace sluice
