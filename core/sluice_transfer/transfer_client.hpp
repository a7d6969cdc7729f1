// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_TRANSFER_CLIENT_HPP
#define SLUICE_TRANSFER_CLIENT_HPP

#include <cstdint>
#include <memory>
#include <string>

#include "download_engine.hpp"
#include "http_client.hpp"
#include "retry_executor.hpp"
#include "signed_url_provider.hpp"
#include "transfer_config.hpp"
#include "transfer_interfaces.hpp"
#include "transfer_state_store.hpp"
#include "upload_engine.hpp"

namespace sluice {
namespace transfer {

/**
 * Wires the transfer components together from a TransferConfig.
 *
 * Owns the HTTP client, the signed URL provider, the state store, the retry
 * executor and both engines.
 */
class TransferClient {
public:
  /**
   * Production wiring: Beast HTTP client, OSS provider, file state store under
   * config.state_dir. Throws TransferError when the state directory cannot be
   * created or the base URL is empty.
   */
  explicit TransferClient(const TransferConfig& config);

  /**
   * Wiring with an injected HTTP client and state store, used by tests
   *
   * @param sleep Backoff sleep passed to the RetryExecutor, nullptr for real sleeping
   */
  TransferClient(
    const TransferConfig& config, std::unique_ptr<IHttpClient> http,
    std::unique_ptr<ITransferStateStore> store, RetryExecutor::SleepFunction sleep = nullptr
  );

  ~TransferClient();

  // Non-copyable
  TransferClient(const TransferClient&) = delete;
  TransferClient& operator=(const TransferClient&) = delete;

  /**
   * Upload options seeded from config.upload
   */
  UploadOptions defaultUploadOptions() const;

  ObjectInfo upload(
    const std::string& bucket_key, const std::string& object_key, const std::string& local_path,
    const UploadOptions& options
  );

  uint64_t download(
    const std::string& bucket_key, const std::string& object_key, const std::string& output_path,
    const ProgressCallback& on_progress = nullptr
  );

  const TransferConfig& config() const {
    return config_;
  }

private:
  void buildEngines(RetryExecutor::SleepFunction sleep);

  TransferConfig config_;
  std::unique_ptr<IHttpClient> http_;
  std::unique_ptr<ITransferStateStore> store_;
  std::unique_ptr<ISignedUrlProvider> provider_;
  std::unique_ptr<RetryExecutor> retry_;
  std::unique_ptr<IFileSystem> filesystem_;
  std::unique_ptr<IFileStreamFactory> streams_;
  std::unique_ptr<UploadEngine> upload_engine_;
  std::unique_ptr<DownloadEngine> download_engine_;
};

}  // namespace transfer
}  // namespace sluice

#endif  // SLUICE_TRANSFER_CLIENT_HPP
