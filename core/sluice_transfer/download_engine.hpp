// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_DOWNLOAD_ENGINE_HPP
#define SLUICE_DOWNLOAD_ENGINE_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "http_client.hpp"
#include "retry_executor.hpp"
#include "signed_url_provider.hpp"
#include "transfer_interfaces.hpp"

namespace sluice {
namespace transfer {

/**
 * Downloads an object through pre-signed GET URLs into a local file.
 *
 * No resumable state is kept: each attempt truncates the output and starts
 * again from byte zero.
 */
class DownloadEngine {
public:
  DownloadEngine(
    ISignedUrlProvider& provider, IHttpClient& http, const RetryExecutor& retry,
    const IFileSystem& filesystem
  );

  // Non-copyable
  DownloadEngine(const DownloadEngine&) = delete;
  DownloadEngine& operator=(const DownloadEngine&) = delete;

  /**
   * @return Number of bytes written to output_path
   */
  uint64_t download(
    const std::string& bucket_key, const std::string& object_key, const std::string& output_path,
    const ProgressCallback& on_progress = nullptr
  );

private:
  /**
   * One attempt: truncate the output and append every segment in order
   */
  uint64_t fetchSegments(
    const std::vector<std::string>& urls, const std::string& output_path, uint64_t total_bytes,
    const ProgressCallback& on_progress
  );

  ISignedUrlProvider& provider_;
  IHttpClient& http_;
  const RetryExecutor& retry_;
  const IFileSystem& filesystem_;
};

}  // namespace transfer
}  // namespace sluice

#endif  // SLUICE_DOWNLOAD_ENGINE_HPP
