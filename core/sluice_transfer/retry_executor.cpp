// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "retry_executor.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

#define SLUICE_LOG_COMPONENT "retry_executor"
#include <sluice_log_macros.hpp>

namespace sluice {
namespace transfer {

using ::sluice::logging::kv;

RetryExecutor::RetryExecutor(const RetryConfig& config, SleepFunction sleep)
    : config_(config)
    , sleep_(std::move(sleep))
    , rng_(std::random_device{}()) {
  if (!sleep_) {
    sleep_ = [](std::chrono::milliseconds delay) {
      std::this_thread::sleep_for(delay);
    };
  }
}

std::chrono::milliseconds RetryExecutor::getDelay(int attempt) const {
  double delay_ms = static_cast<double>(config_.base_delay.count()) *
                    std::pow(2.0, static_cast<double>(attempt));

  // Cap the unjittered component
  delay_ms = std::min(delay_ms, static_cast<double>(config_.max_wait.count()));

  if (config_.jitter && delay_ms > 0.0) {
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_real_distribution<> dist(0.0, delay_ms / 4.0);
    delay_ms += dist(rng_);
  }

  return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
}

bool RetryExecutor::isRetryable(const TransferError& error) {
  switch (error.kind()) {
    case ErrorKind::HttpStatus:
      return error.statusCode() == 429 ||
             (error.statusCode() >= 500 && error.statusCode() < 600);
    case ErrorKind::Timeout:
    case ErrorKind::Connect:
    case ErrorKind::Transport:
      return true;
    case ErrorKind::InvalidResponse:
    case ErrorKind::Io:
    case ErrorKind::InvalidArgument:
      return false;
  }
  return false;
}

void RetryExecutor::logRetry(
  const std::string& what, int attempt, std::chrono::milliseconds delay,
  const TransferError& error
) const {
  SLUICE_LOG_WARN(
    what << " failed, retrying" << kv("attempt", attempt) << kv("max_retries", config_.max_retries)
         << kv("delay_ms", delay.count()) << kv("kind", toString(error.kind()))
         << kv("error", error.what())
  );
}

void RetryExecutor::logExhausted(
  const std::string& what, int retries, const TransferError& error
) const {
  SLUICE_LOG_ERROR(
    what << " failed after retries" << kv("retries", retries) << kv("kind", toString(error.kind()))
         << kv("error", error.what())
  );
}

void RetryExecutor::logFatal(const std::string& what, const TransferError& error) const {
  SLUICE_LOG_DEBUG(
    what << " failed with non-retryable error" << kv("kind", toString(error.kind()))
         << kv("status", error.statusCode())
  );
}

}  // namespace transfer
}  // namespace sluice
