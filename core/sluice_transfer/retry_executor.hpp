// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_RETRY_EXECUTOR_HPP
#define SLUICE_RETRY_EXECUTOR_HPP

#include <chrono>
#include <functional>
#include <mutex>
#include <random>
#include <string>

#include "transfer_error.hpp"

namespace sluice {
namespace transfer {

/**
 * Configuration for retry behavior
 */
struct RetryConfig {
  int max_retries = 3;                          // Retries after the first attempt
  std::chrono::milliseconds base_delay{1000};   // Base of the exponential backoff
  std::chrono::milliseconds max_wait{60000};    // Cap on the unjittered delay
  bool jitter = true;                           // Add up to 25% random delay
};

/**
 * Runs a fallible operation, retrying transient failures with exponential
 * backoff and jitter.
 *
 * Operations signal failure by throwing TransferError. Only retryable kinds
 * are retried; anything else propagates on the first attempt. Any other
 * exception type passes through untouched.
 *
 * Thread-safe: one executor may be shared by concurrent part uploads.
 */
class RetryExecutor {
public:
  using SleepFunction = std::function<void(std::chrono::milliseconds)>;

  /**
   * @param config Retry limits and backoff parameters
   * @param sleep Backoff sleep, defaults to std::this_thread::sleep_for.
   *              Tests inject a recorder so they run instantly.
   */
  explicit RetryExecutor(const RetryConfig& config = {}, SleepFunction sleep = nullptr);

  /**
   * Delay before retry number `attempt` (1-indexed).
   *
   * delay = min(base_delay * 2^attempt, max_wait), plus jitter drawn
   * uniformly from [0, delay / 4] when enabled.
   */
  std::chrono::milliseconds getDelay(int attempt) const;

  /**
   * HTTP 429, HTTP 5xx, timeouts, connect and transport failures are retryable.
   * Every other kind is fatal.
   */
  static bool isRetryable(const TransferError& error);

  /**
   * Invoke `operation` until it succeeds, fails with a fatal error, or
   * max_retries retries have been spent. The last error is rethrown.
   *
   * @param operation Callable invoked with no arguments, repeatable
   * @param what Short description used in log records
   * @return Whatever `operation` returns
   */
  template<typename Fn>
  auto execute(Fn&& operation, const std::string& what) const -> decltype(operation()) {
    int attempt = 0;
    while (true) {
      try {
        return operation();
      } catch (const TransferError& e) {
        if (!isRetryable(e)) {
          logFatal(what, e);
          throw;
        }
        if (attempt >= config_.max_retries) {
          logExhausted(what, attempt, e);
          throw;
        }
        ++attempt;
        auto delay = getDelay(attempt);
        logRetry(what, attempt, delay, e);
        sleep_(delay);
      }
    }
  }

  int maxRetries() const {
    return config_.max_retries;
  }

  const RetryConfig& config() const {
    return config_;
  }

private:
  // Defined out of line so including this header does not pull in the log macros
  void logRetry(const std::string& what, int attempt, std::chrono::milliseconds delay,
                const TransferError& error) const;
  void logExhausted(const std::string& what, int retries, const TransferError& error) const;
  void logFatal(const std::string& what, const TransferError& error) const;

  RetryConfig config_;
  SleepFunction sleep_;
  mutable std::mt19937 rng_;      // mutable for const getDelay()
  mutable std::mutex rng_mutex_;  // protects rng_ for thread-safe jitter
};

}  // namespace transfer
}  // namespace sluice

#endif  // SLUICE_RETRY_EXECUTOR_HPP
