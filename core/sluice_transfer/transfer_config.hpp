// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_TRANSFER_CONFIG_HPP
#define SLUICE_TRANSFER_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <sluice_log_init.hpp>

#include "http_client.hpp"
#include "retry_executor.hpp"
#include "signed_url_provider.hpp"

namespace sluice {
namespace transfer {

struct ApiConfig {
  std::string base_url;
  std::string access_token;
  std::string region;
  std::optional<uint32_t> expiry_minutes;  // Provider default when unset
};

struct HttpConfig {
  int64_t connect_timeout_ms = 30000;
  int64_t request_timeout_ms = 120000;
  bool verify_ssl = true;
  std::string user_agent = "sluice/1.0";
};

struct RetrySettings {
  int max_retries = 3;
  int64_t base_delay_ms = 1000;
  int64_t max_wait_ms = 60000;
  bool jitter = true;
};

struct UploadSettings {
  uint64_t chunk_size_mb = 5;
  int concurrency = 1;
};

/**
 * Logging section as written in YAML; see TransferConfig::loggingConfig()
 */
struct LoggingSettings {
  bool console_enabled = true;
  bool console_colors = true;
  std::string console_level = "info";

  bool file_enabled = false;
  std::string file_level = "debug";
  std::string file_directory = "/tmp/sluice/logs";
  std::string file_pattern = "sluice_%Y%m%d_%H%M%S.log";
  std::string file_format = "text";  // "text" or "json"
  size_t rotation_size_mb = 50;
  size_t max_files = 10;
  bool rotate_at_midnight = true;
};

/**
 * Complete runtime configuration of the transfer client
 */
struct TransferConfig {
  ApiConfig api;
  HttpConfig http;
  RetrySettings retry;
  UploadSettings upload;
  std::string state_dir;  // Empty until defaults are resolved
  LoggingSettings logging;

  HttpClientConfig httpClientConfig() const;
  RetryConfig retryConfig() const;
  ProviderConfig providerConfig() const;

  /**
   * Sinks for the logging section with SLUICE_LOG_* environment overrides
   * applied. Unknown level names keep the sink defaults.
   */
  ::sluice::logging::LoggingConfig loggingConfig() const;
};

/**
 * $XDG_CACHE_HOME/sluice, else $HOME/.cache/sluice, else /tmp/sluice
 */
std::string default_state_dir();

}  // namespace transfer
}  // namespace sluice

#endif  // SLUICE_TRANSFER_CONFIG_HPP
