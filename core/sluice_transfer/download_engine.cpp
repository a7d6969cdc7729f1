// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "download_engine.hpp"

#include <filesystem>
#include <fstream>

#include "transfer_error.hpp"

#define SLUICE_LOG_COMPONENT "download_engine"
#include <sluice_log_macros.hpp>

namespace fs = std::filesystem;

namespace sluice {
namespace transfer {

using ::sluice::logging::kv;
using ::sluice::logging::redact_url;

DownloadEngine::DownloadEngine(
  ISignedUrlProvider& provider, IHttpClient& http, const RetryExecutor& retry,
  const IFileSystem& filesystem
)
    : provider_(provider)
    , http_(http)
    , retry_(retry)
    , filesystem_(filesystem) {}

uint64_t DownloadEngine::download(
  const std::string& bucket_key, const std::string& object_key, const std::string& output_path,
  const ProgressCallback& on_progress
) {
  if (bucket_key.empty() || object_key.empty()) {
    throw TransferError(ErrorKind::InvalidArgument, "bucket and object key must not be empty");
  }
  if (output_path.empty()) {
    throw TransferError(ErrorKind::InvalidArgument, "output path must not be empty");
  }

  SLUICE_LOG_SCOPED_CONTEXT(bucket_key, object_key);

  auto signed_download = retry_.execute(
    [&]() {
      return provider_.getSignedDownload(bucket_key, object_key);
    },
    "request signed download URL"
  );
  const std::vector<std::string> urls = signed_download.segmentUrls();
  const uint64_t total_bytes = signed_download.size.value_or(0);

  fs::path parent = fs::path(output_path).parent_path();
  if (!parent.empty() && !filesystem_.create_directories(parent.string())) {
    throw TransferError(ErrorKind::Io, "cannot create directory " + parent.string());
  }

  SLUICE_LOG_INFO(
    "Starting download" << kv("path", output_path) << kv("segments", urls.size())
                        << kv("bytes", total_bytes)
  );

  uint64_t written = 0;
  try {
    written = retry_.execute(
      [&]() {
        return fetchSegments(urls, output_path, total_bytes, on_progress);
      },
      "download object"
    );
  } catch (const TransferError& e) {
    throw e.withContext("download of " + bucket_key + "/" + object_key);
  }

  if (on_progress && total_bytes == 0) {
    on_progress(written, written);
  }
  if (total_bytes != 0 && written != total_bytes) {
    SLUICE_LOG_WARN(
      "Downloaded size differs from reported object size" << kv("written", written)
                                                          << kv("expected", total_bytes)
    );
  }

  SLUICE_LOG_INFO("Download complete" << kv("path", output_path) << kv("bytes", written));
  return written;
}

uint64_t DownloadEngine::fetchSegments(
  const std::vector<std::string>& urls, const std::string& output_path, uint64_t total_bytes,
  const ProgressCallback& on_progress
) {
  std::ofstream out(output_path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out) {
    throw TransferError(ErrorKind::Io, "cannot open " + output_path + " for writing");
  }

  uint64_t written = 0;
  if (on_progress) {
    on_progress(0, total_bytes);
  }

  for (size_t i = 0; i < urls.size(); ++i) {
    HttpRequest request;
    request.method = HttpMethod::Get;
    request.url = urls[i];

    auto response = http_.stream(request, [&](const char* data, std::size_t size) {
      out.write(data, static_cast<std::streamsize>(size));
      if (!out) {
        throw TransferError(ErrorKind::Io, "failed writing " + output_path);
      }
      written += size;
      if (on_progress) {
        on_progress(written, total_bytes);
      }
    });

    if (!response.ok()) {
      throw TransferError::httpStatus(response.status, response.body, "GET " + redact_url(urls[i]));
    }
    SLUICE_LOG_DEBUG("Segment downloaded" << kv("segment", i + 1) << kv("of", urls.size()));
  }

  out.flush();
  if (!out) {
    throw TransferError(ErrorKind::Io, "failed flushing " + output_path);
  }
  return written;
}

}  // namespace transfer
}  // namespace sluice
