// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_UPLOAD_ENGINE_HPP
#define SLUICE_UPLOAD_ENGINE_HPP

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "http_client.hpp"
#include "retry_executor.hpp"
#include "signed_url_provider.hpp"
#include "transfer_interfaces.hpp"
#include "transfer_planner.hpp"
#include "transfer_state_store.hpp"

namespace sluice {
namespace transfer {

struct UploadOptions {
  bool resume = false;                    // Reuse a matching state record
  uint64_t chunk_size = kDefaultChunkSize;
  int concurrency = 1;                    // Parts in flight; 1 uploads strictly in order
  ProgressCallback on_progress;
};

/**
 * Uploads a local file through pre-signed PUT URLs.
 *
 * Files above the multipart threshold are split into parts. After every
 * confirmed part the state record is saved, so an interrupted upload can be
 * resumed with `resume = true` and only the missing parts are sent.
 *
 * Every network call goes through the RetryExecutor. A terminal failure is
 * thrown as TransferError carrying completedParts(); the state record is
 * kept for the next resume.
 */
class UploadEngine {
public:
  UploadEngine(
    ISignedUrlProvider& provider, ITransferStateStore& store, IHttpClient& http,
    const RetryExecutor& retry, const IFileSystem& filesystem, IFileStreamFactory& streams
  );

  // Non-copyable
  UploadEngine(const UploadEngine&) = delete;
  UploadEngine& operator=(const UploadEngine&) = delete;

  ObjectInfo upload(
    const std::string& bucket_key, const std::string& object_key, const std::string& local_path,
    const UploadOptions& options = {}
  );

private:
  ObjectInfo uploadSinglePart(
    const std::string& bucket_key, const std::string& object_key, const std::string& local_path,
    uint64_t file_size, const UploadOptions& options
  );

  ObjectInfo uploadMultipart(
    const std::string& bucket_key, const std::string& object_key, const std::string& local_path,
    const Fingerprint& fingerprint, const TransferPlan& plan, const UploadOptions& options
  );

  /**
   * Load a resumable record or open a fresh session, returning the state and
   * the signed URL for every part.
   */
  TransferState prepareState(
    const std::string& bucket_key, const std::string& object_key, const std::string& local_path,
    const Fingerprint& fingerprint, const TransferPlan& plan, bool resume,
    std::vector<std::string>& urls
  );

  void uploadParts(
    TransferState& state, const std::vector<std::string>& urls, const UploadOptions& options
  );

  ISignedUrlProvider& provider_;
  ITransferStateStore& store_;
  IHttpClient& http_;
  const RetryExecutor& retry_;
  const IFileSystem& filesystem_;
  IFileStreamFactory& streams_;

  // Guards state mutation, save() and progress reporting during part uploads
  std::mutex state_mutex_;
};

}  // namespace transfer
}  // namespace sluice

#endif  // SLUICE_UPLOAD_ENGINE_HPP
