// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_engine.hpp"

#include <algorithm>
#include <exception>
#include <optional>
#include <thread>

#include "transfer_error.hpp"
#include "upload_engine_test_helpers.hpp"

#define SLUICE_LOG_COMPONENT "upload_engine"
#include <sluice_log_macros.hpp>

namespace sluice {
namespace transfer {

using ::sluice::logging::kv;
using ::sluice::logging::redact_url;

// Internal implementation with dependency injection
// Exposed for testing via upload_engine_test_helpers.hpp
std::string trimEtag(const std::string& raw) {
  size_t begin = 0;
  size_t end = raw.size();
  while (begin < end && raw[begin] == '"') {
    ++begin;
  }
  while (end > begin && raw[end - 1] == '"') {
    --end;
  }
  return raw.substr(begin, end - begin);
}

std::string readChunkImpl(
  const std::string& path, uint64_t offset, uint64_t length, IFileStreamFactory& streams
) {
  auto stream = streams.create_file_stream(path, std::ios::in | std::ios::binary);
  if (!stream) {
    throw TransferError(ErrorKind::Io, "cannot open " + path + " for reading");
  }

  stream->seekg(static_cast<std::streamoff>(offset), std::ios::beg);
  if (stream->fail()) {
    throw TransferError(
      ErrorKind::Io, "cannot seek to offset " + std::to_string(offset) + " in " + path
    );
  }

  std::string buffer(static_cast<size_t>(length), '\0');
  if (length > 0) {
    stream->read(&buffer[0], static_cast<std::streamsize>(length));
  }
  if (static_cast<uint64_t>(stream->gcount()) != length) {
    throw TransferError(
      ErrorKind::Io, "short read from " + path + " at offset " + std::to_string(offset) +
                       ": expected " + std::to_string(length) + " bytes, got " +
                       std::to_string(stream->gcount())
    );
  }
  return buffer;
}

std::string putPartImpl(IHttpClient& http, const std::string& url, const std::string& body) {
  HttpRequest request;
  request.method = HttpMethod::Put;
  request.url = url;
  request.headers["Content-Type"] = "application/octet-stream";
  request.body = body;

  auto response = http.send(request);
  if (!response.ok()) {
    throw TransferError::httpStatus(response.status, response.body, "PUT " + redact_url(url));
  }

  std::string etag = trimEtag(response.header("etag"));
  if (etag.empty()) {
    SLUICE_LOG_WARN("Part accepted without an ETag" << kv("url", redact_url(url)));
  }
  return etag;
}

void checkUrlCountImpl(const std::vector<std::string>& urls, uint32_t expected) {
  if (urls.size() != expected) {
    throw TransferError(
      ErrorKind::InvalidResponse,
      "expected " + std::to_string(expected) + " URLs but got " + std::to_string(urls.size())
    );
  }
}

UploadEngine::UploadEngine(
  ISignedUrlProvider& provider, ITransferStateStore& store, IHttpClient& http,
  const RetryExecutor& retry, const IFileSystem& filesystem, IFileStreamFactory& streams
)
    : provider_(provider)
    , store_(store)
    , http_(http)
    , retry_(retry)
    , filesystem_(filesystem)
    , streams_(streams) {}

ObjectInfo UploadEngine::upload(
  const std::string& bucket_key, const std::string& object_key, const std::string& local_path,
  const UploadOptions& options
) {
  if (bucket_key.empty() || object_key.empty()) {
    throw TransferError(ErrorKind::InvalidArgument, "bucket and object key must not be empty");
  }

  SLUICE_LOG_SCOPED_CONTEXT(bucket_key, object_key);

  auto fingerprint = filesystem_.fingerprint(local_path);
  if (!fingerprint) {
    throw TransferError(ErrorKind::Io, "cannot stat " + local_path);
  }

  if (options.chunk_size != clampChunkSize(options.chunk_size)) {
    SLUICE_LOG_WARN(
      "Chunk size out of range, clamping" << kv("requested", options.chunk_size)
                                          << kv("used", clampChunkSize(options.chunk_size))
    );
  }

  auto plan = planTransfer(fingerprint->file_size, options.chunk_size);
  if (!plan.isMultipart()) {
    return uploadSinglePart(bucket_key, object_key, local_path, fingerprint->file_size, options);
  }
  return uploadMultipart(bucket_key, object_key, local_path, *fingerprint, plan, options);
}

ObjectInfo UploadEngine::uploadSinglePart(
  const std::string& bucket_key, const std::string& object_key, const std::string& local_path,
  uint64_t file_size, const UploadOptions& options
) {
  SLUICE_LOG_INFO("Starting single-part upload" << kv("path", local_path) << kv("bytes", file_size));

  // A multipart record left for this object can no longer apply
  store_.remove(bucket_key, object_key);

  auto signed_upload = retry_.execute(
    [&]() {
      return provider_.getSignedUpload(bucket_key, object_key, std::nullopt, std::string());
    },
    "request signed upload URL"
  );
  if (signed_upload.urls.empty()) {
    throw TransferError(ErrorKind::InvalidResponse, "no upload URL returned for " + object_key);
  }

  if (options.on_progress) {
    options.on_progress(0, file_size);
  }

  std::string body = readChunkImpl(local_path, 0, file_size, streams_);
  const std::string& url = signed_upload.urls.front();
  try {
    retry_.execute(
      [&]() {
        return putPartImpl(http_, url, body);
      },
      "upload object body"
    );
  } catch (const TransferError& e) {
    throw e.withContext("upload of " + bucket_key + "/" + object_key);
  }

  if (options.on_progress) {
    options.on_progress(file_size, file_size);
  }

  auto info = retry_.execute(
    [&]() {
      return provider_.completeSignedUpload(bucket_key, object_key, signed_upload.upload_key);
    },
    "complete upload"
  );

  SLUICE_LOG_INFO("Upload complete" << kv("object_id", info.object_id) << kv("bytes", info.size));
  return info;
}

TransferState UploadEngine::prepareState(
  const std::string& bucket_key, const std::string& object_key, const std::string& local_path,
  const Fingerprint& fingerprint, const TransferPlan& plan, bool resume,
  std::vector<std::string>& urls
) {
  std::optional<TransferState> state;

  if (resume) {
    state = store_.load(bucket_key, object_key);
    if (state && state->fingerprint() != fingerprint) {
      SLUICE_LOG_DEBUG(
        "Source file changed since state was written, discarding"
        << kv("recorded_size", state->file_size) << kv("recorded_mtime", state->file_mtime)
        << kv("current_size", fingerprint.file_size) << kv("current_mtime", fingerprint.file_mtime)
      );
      store_.remove(bucket_key, object_key);
      state.reset();
    }
  } else {
    store_.remove(bucket_key, object_key);
  }

  if (state) {
    SLUICE_LOG_INFO(
      "Resuming upload" << kv("completed", state->completed_parts.size())
                        << kv("total", state->total_parts) << kv("chunk_size", state->chunk_size)
    );

    // Signed URLs are short-lived; re-sign the full part set of the existing session
    const uint32_t total_parts = state->total_parts;
    const std::string session = state->session_token;
    auto signed_upload = retry_.execute(
      [&]() {
        return provider_.getSignedUpload(bucket_key, object_key, total_parts, session);
      },
      "re-sign upload URLs"
    );
    checkUrlCountImpl(signed_upload.urls, total_parts);
    if (signed_upload.upload_key != session) {
      SLUICE_LOG_DEBUG("Provider returned a different upload key on resume, keeping the recorded one");
    }
    urls = std::move(signed_upload.urls);
    return *state;
  }

  auto signed_upload = retry_.execute(
    [&]() {
      return provider_.getSignedUpload(bucket_key, object_key, plan.total_parts, std::string());
    },
    "request signed upload URLs"
  );
  checkUrlCountImpl(signed_upload.urls, plan.total_parts);

  TransferState fresh = TransferState::create(
    bucket_key, object_key, local_path, fingerprint, plan.chunk_size, signed_upload.upload_key
  );
  // Saved before any part so a crash from here on leaves a resumable record
  store_.save(fresh);

  SLUICE_LOG_INFO(
    "Starting multipart upload" << kv("path", local_path) << kv("bytes", fresh.file_size)
                                << kv("parts", fresh.total_parts)
                                << kv("chunk_size", fresh.chunk_size)
  );
  urls = std::move(signed_upload.urls);
  return fresh;
}

void UploadEngine::uploadParts(
  TransferState& state, const std::vector<std::string>& urls, const UploadOptions& options
) {
  const std::vector<uint32_t> remaining = state.remainingParts();
  uint64_t transferred = state.completedBytes();

  if (options.on_progress) {
    options.on_progress(transferred, state.file_size);
  }
  if (remaining.empty()) {
    return;
  }

  size_t next = 0;
  std::optional<TransferError> first_error;
  std::exception_ptr other_error;

  auto worker = [&]() {
    SLUICE_LOG_SCOPED_CONTEXT(state.bucket_key, state.object_key);
    while (true) {
      uint32_t part = 0;
      {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (first_error || other_error || next >= remaining.size()) {
          return;
        }
        part = remaining[next++];
      }

      try {
        // chunk_size, file_size and local_path never change after creation
        const uint64_t offset = state.partOffset(part);
        const uint64_t length = state.partLength(part);
        std::string body = readChunkImpl(state.local_path, offset, length, streams_);

        const std::string& url = urls[part - 1];
        std::string etag = retry_.execute(
          [&]() {
            return putPartImpl(http_, url, body);
          },
          "upload part " + std::to_string(part)
        );

        std::lock_guard<std::mutex> lock(state_mutex_);
        state.markCompleted(part, etag);
        store_.save(state);
        transferred += length;
        SLUICE_LOG_DEBUG(
          "Part uploaded" << kv("part", part) << kv("bytes", length) << kv("etag", etag)
        );
        SLUICE_LOG_INFO_THROTTLE(
          2.0, "Upload progress" << kv("parts_done", state.completed_parts.size())
                                 << kv("parts_total", state.total_parts)
                                 << kv("bytes", transferred)
        );
        if (options.on_progress) {
          options.on_progress(transferred, state.file_size);
        }
      } catch (const TransferError& e) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!first_error && !other_error) {
          first_error = e.withContext("part " + std::to_string(part));
        }
        return;
      } catch (...) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!first_error && !other_error) {
          other_error = std::current_exception();
        }
        return;
      }
    }
  };

  const size_t workers = std::min(
    static_cast<size_t>(std::max(options.concurrency, 1)), remaining.size()
  );

  if (workers == 1) {
    worker();
  } else {
    SLUICE_LOG_DEBUG("Uploading parts concurrently" << kv("workers", workers));
    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
      threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
      thread.join();
    }
  }

  if (first_error) {
    throw *first_error;
  }
  if (other_error) {
    std::rethrow_exception(other_error);
  }
}

ObjectInfo UploadEngine::uploadMultipart(
  const std::string& bucket_key, const std::string& object_key, const std::string& local_path,
  const Fingerprint& fingerprint, const TransferPlan& plan, const UploadOptions& options
) {
  std::vector<std::string> urls;
  TransferState state =
    prepareState(bucket_key, object_key, local_path, fingerprint, plan, options.resume, urls);

  try {
    uploadParts(state, urls, options);

    const std::string session = state.session_token;
    auto info = retry_.execute(
      [&]() {
        return provider_.completeSignedUpload(bucket_key, object_key, session);
      },
      "complete upload"
    );

    store_.remove(bucket_key, object_key);
    SLUICE_LOG_INFO(
      "Upload complete" << kv("object_id", info.object_id) << kv("bytes", info.size)
                        << kv("parts", state.total_parts)
    );
    return info;
  } catch (const TransferError& e) {
    std::vector<uint32_t> done(state.completed_parts.begin(), state.completed_parts.end());
    SLUICE_LOG_ERROR(
      "Upload failed, completed parts stay resumable"
      << kv("completed", done.size()) << kv("total", state.total_parts)
      << kv("error", e.what())
    );
    throw e.withContext("upload of " + bucket_key + "/" + object_key)
      .withCompletedParts(std::move(done), state.total_parts);
  }
}

}  // namespace transfer
}  // namespace sluice
