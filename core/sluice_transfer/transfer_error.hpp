// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_TRANSFER_ERROR_HPP
#define SLUICE_TRANSFER_ERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace sluice {
namespace transfer {

/**
 * Classification of transfer failures.
 *
 * Retry decisions are made on the kind alone, see RetryExecutor::isRetryable().
 */
enum class ErrorKind {
  HttpStatus,       // Server answered with a non-2xx status
  Timeout,          // Connect or request timer expired
  Connect,          // Resolve, TCP connect or TLS handshake failed
  Transport,        // Connection broke while sending or receiving
  InvalidResponse,  // 2xx answer with an unusable body or headers
  Io,               // Local file or state directory failure
  InvalidArgument   // Caller supplied something unusable
};

const char* toString(ErrorKind kind);

/**
 * The single exception type thrown across the transfer engine's public surface.
 */
class TransferError : public std::runtime_error {
public:
  TransferError(ErrorKind kind, const std::string& message);

  /**
   * Non-2xx HTTP response. The message carries the status and a bounded
   * prefix of the body; the full body is kept in body().
   */
  static TransferError httpStatus(int status_code, const std::string& body,
                                  const std::string& context);

  ErrorKind kind() const {
    return kind_;
  }

  /**
   * HTTP status code, 0 unless kind() == ErrorKind::HttpStatus
   */
  int statusCode() const {
    return status_code_;
  }

  const std::string& body() const {
    return body_;
  }

  /**
   * Parts that were confirmed before the transfer failed (multipart uploads only).
   */
  const std::vector<uint32_t>& completedParts() const {
    return completed_parts_;
  }

  /**
   * Copy with "<prefix>: " prepended to the message. Kind, status, body and
   * completed parts are preserved.
   */
  TransferError withContext(const std::string& prefix) const;

  TransferError withCompletedParts(std::vector<uint32_t> parts, uint32_t total_parts) const;

private:
  TransferError(ErrorKind kind, const std::string& message, int status_code, std::string body,
                std::vector<uint32_t> completed_parts);

  ErrorKind kind_;
  int status_code_ = 0;
  std::string body_;
  std::vector<uint32_t> completed_parts_;
};

}  // namespace transfer
}  // namespace sluice

#endif  // SLUICE_TRANSFER_ERROR_HPP
