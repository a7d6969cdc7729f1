// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_UPLOAD_ENGINE_TEST_HELPERS_HPP
#define SLUICE_UPLOAD_ENGINE_TEST_HELPERS_HPP

// This header is for testing only - exposes internal implementations
// for dependency injection in tests

#include <cstdint>
#include <string>
#include <vector>

#include "http_client.hpp"
#include "transfer_interfaces.hpp"

namespace sluice {
namespace transfer {

// Defined in upload_engine.cpp

/**
 * Strip surrounding double quotes from an ETag header value
 */
std::string trimEtag(const std::string& raw);

/**
 * Read exactly `length` bytes at `offset`.
 * Throws TransferError(Io) when the file cannot be opened or is too short.
 */
std::string readChunkImpl(
  const std::string& path, uint64_t offset, uint64_t length, IFileStreamFactory& streams
);

/**
 * PUT one part body to a signed URL and return its trimmed ETag.
 * Throws TransferError(HttpStatus) on a non-2xx answer.
 */
std::string putPartImpl(IHttpClient& http, const std::string& url, const std::string& body);

/**
 * Throws TransferError(InvalidResponse) unless `urls` has exactly `expected` entries
 */
void checkUrlCountImpl(const std::vector<std::string>& urls, uint32_t expected);

}  // namespace transfer
}  // namespace sluice

#endif  // SLUICE_UPLOAD_ENGINE_TEST_HELPERS_HPP
