// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transfer_client.hpp"

#include "transfer_impl.hpp"

#define SLUICE_LOG_COMPONENT "transfer_client"
#include <sluice_log_macros.hpp>

namespace sluice {
namespace transfer {

using ::sluice::logging::kv;

TransferClient::TransferClient(const TransferConfig& config)
    : config_(config)
    , http_(std::make_unique<BeastHttpClient>(config.httpClientConfig()))
    , store_(std::make_unique<FileTransferStateStore>(
        config.state_dir.empty() ? default_state_dir() : config.state_dir
      )) {
  buildEngines(nullptr);
}

TransferClient::TransferClient(
  const TransferConfig& config, std::unique_ptr<IHttpClient> http,
  std::unique_ptr<ITransferStateStore> store, RetryExecutor::SleepFunction sleep
)
    : config_(config)
    , http_(std::move(http))
    , store_(std::move(store)) {
  buildEngines(std::move(sleep));
}

TransferClient::~TransferClient() = default;

void TransferClient::buildEngines(RetryExecutor::SleepFunction sleep) {
  provider_ = std::make_unique<OssSignedUrlProvider>(config_.providerConfig(), *http_);
  retry_ = std::make_unique<RetryExecutor>(config_.retryConfig(), std::move(sleep));
  filesystem_ = std::make_unique<FileSystemImpl>();
  streams_ = std::make_unique<FileStreamFactoryImpl>();
  upload_engine_ = std::make_unique<UploadEngine>(
    *provider_, *store_, *http_, *retry_, *filesystem_, *streams_
  );
  download_engine_ = std::make_unique<DownloadEngine>(*provider_, *http_, *retry_, *filesystem_);

  SLUICE_LOG_DEBUG(
    "Transfer client ready" << kv("base_url", config_.api.base_url)
                            << kv("state_dir", config_.state_dir)
                            << kv("max_retries", config_.retry.max_retries)
  );
}

UploadOptions TransferClient::defaultUploadOptions() const {
  UploadOptions options;
  options.chunk_size = config_.upload.chunk_size_mb * kMiB;
  options.concurrency = config_.upload.concurrency;
  return options;
}

ObjectInfo TransferClient::upload(
  const std::string& bucket_key, const std::string& object_key, const std::string& local_path,
  const UploadOptions& options
) {
  return upload_engine_->upload(bucket_key, object_key, local_path, options);
}

uint64_t TransferClient::download(
  const std::string& bucket_key, const std::string& object_key, const std::string& output_path,
  const ProgressCallback& on_progress
) {
  return download_engine_->download(bucket_key, object_key, output_path, on_progress);
}

}  // namespace transfer
}  // namespace sluice
