// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transfer_config.hpp"

#include <cstdlib>

namespace sluice {
namespace transfer {

HttpClientConfig TransferConfig::httpClientConfig() const {
  HttpClientConfig config;
  config.connect_timeout = std::chrono::milliseconds(http.connect_timeout_ms);
  config.request_timeout = std::chrono::milliseconds(http.request_timeout_ms);
  config.verify_ssl = http.verify_ssl;
  config.user_agent = http.user_agent;
  return config;
}

RetryConfig TransferConfig::retryConfig() const {
  RetryConfig config;
  config.max_retries = retry.max_retries;
  config.base_delay = std::chrono::milliseconds(retry.base_delay_ms);
  config.max_wait = std::chrono::milliseconds(retry.max_wait_ms);
  config.jitter = retry.jitter;
  return config;
}

ProviderConfig TransferConfig::providerConfig() const {
  ProviderConfig config;
  config.base_url = api.base_url;
  config.access_token = api.access_token;
  config.region = api.region;
  config.expiry_minutes = api.expiry_minutes;
  return config;
}

::sluice::logging::LoggingConfig TransferConfig::loggingConfig() const {
  namespace slog = ::sluice::logging;
  slog::LoggingConfig config;

  config.console.enabled = logging.console_enabled;
  config.console.colors = logging.console_colors;
  if (auto level = slog::parse_severity_level(logging.console_level)) {
    config.console.level = *level;
  }

  config.file.enabled = logging.file_enabled;
  if (auto level = slog::parse_severity_level(logging.file_level)) {
    config.file.level = *level;
  }
  config.file.directory = logging.file_directory;
  config.file.file_pattern = logging.file_pattern;
  config.file.format_json = (logging.file_format == "json");
  config.file.rotation_size_mb = logging.rotation_size_mb;
  config.file.max_files = static_cast<int>(logging.max_files);
  config.file.rotate_at_midnight = logging.rotate_at_midnight;

  slog::apply_env_overrides(config);
  return config;
}

std::string default_state_dir() {
  const char* xdg = std::getenv("XDG_CACHE_HOME");
  if (xdg && xdg[0] != '\0') {
    return std::string(xdg) + "/sluice";
  }
  const char* home = std::getenv("HOME");
  if (home && home[0] != '\0') {
    return std::string(home) + "/.cache/sluice";
  }
  return "/tmp/sluice";
}

}  // namespace transfer
}  // namespace sluice
