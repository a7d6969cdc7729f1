// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include "transfer_planner.hpp"

// Logging infrastructure
#define SLUICE_LOG_COMPONENT "config_parser"
#include <sluice_log_init.hpp>
#include <sluice_log_macros.hpp>

namespace sluice {
namespace transfer {

using ::sluice::logging::kv;

namespace {

constexpr int kMaxConcurrency = 16;
constexpr uint32_t kMaxExpiryMinutes = 60;

const char* get_env(const char* name) {
  const char* value = std::getenv(name);
  if (value && value[0] != '\0') {
    return value;
  }
  return nullptr;
}

}  // namespace

// ============================================================================
// ConfigParser Implementation
// ============================================================================

bool ConfigParser::load_from_file(const std::string& path, TransferConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(path);
    return load_from_string(YAML::Dump(yaml), config);
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML file: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::load_from_string(const std::string& yaml_content, TransferConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);

    if (node["api"] && !parse_api(node["api"], config.api)) {
      return false;
    }
    if (node["http"] && !parse_http(node["http"], config.http)) {
      return false;
    }
    if (node["retry"] && !parse_retry(node["retry"], config.retry)) {
      return false;
    }
    if (node["upload"] && !parse_upload(node["upload"], config.upload)) {
      return false;
    }
    if (node["state_dir"]) {
      config.state_dir = node["state_dir"].as<std::string>();
    }
    if (node["logging"] && !parse_logging(node["logging"], config.logging)) {
      return false;
    }

    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::parse_api(const YAML::Node& node, ApiConfig& api) {
  if (!node.IsMap()) {
    last_error_ = "api must be a mapping";
    return false;
  }
  if (node["base_url"]) {
    api.base_url = node["base_url"].as<std::string>();
  }
  if (node["access_token"]) {
    api.access_token = node["access_token"].as<std::string>();
  }
  if (node["region"]) {
    api.region = node["region"].as<std::string>();
  }
  if (node["expiry_minutes"]) {
    api.expiry_minutes = node["expiry_minutes"].as<uint32_t>();
  }
  return true;
}

bool ConfigParser::parse_http(const YAML::Node& node, HttpConfig& http) {
  if (!node.IsMap()) {
    last_error_ = "http must be a mapping";
    return false;
  }
  if (node["connect_timeout_ms"]) {
    http.connect_timeout_ms = node["connect_timeout_ms"].as<int64_t>();
  }
  if (node["request_timeout_ms"]) {
    http.request_timeout_ms = node["request_timeout_ms"].as<int64_t>();
  }
  if (node["verify_ssl"]) {
    http.verify_ssl = node["verify_ssl"].as<bool>();
  }
  if (node["user_agent"]) {
    http.user_agent = node["user_agent"].as<std::string>();
  }
  return true;
}

bool ConfigParser::parse_retry(const YAML::Node& node, RetrySettings& retry) {
  if (!node.IsMap()) {
    last_error_ = "retry must be a mapping";
    return false;
  }
  if (node["max_retries"]) {
    retry.max_retries = node["max_retries"].as<int>();
  }
  if (node["base_delay_ms"]) {
    retry.base_delay_ms = node["base_delay_ms"].as<int64_t>();
  }
  if (node["max_wait_ms"]) {
    retry.max_wait_ms = node["max_wait_ms"].as<int64_t>();
  }
  if (node["jitter"]) {
    retry.jitter = node["jitter"].as<bool>();
  }
  return true;
}

bool ConfigParser::parse_upload(const YAML::Node& node, UploadSettings& upload) {
  if (!node.IsMap()) {
    last_error_ = "upload must be a mapping";
    return false;
  }
  if (node["chunk_size_mb"]) {
    upload.chunk_size_mb = node["chunk_size_mb"].as<uint64_t>();
  }
  if (node["concurrency"]) {
    upload.concurrency = node["concurrency"].as<int>();
  }
  return true;
}

bool ConfigParser::parse_logging(const YAML::Node& node, LoggingSettings& logging) {
  // Parse console section
  if (node["console"]) {
    const auto& console = node["console"];
    if (console["enabled"]) {
      logging.console_enabled = console["enabled"].as<bool>();
    }
    if (console["colors"]) {
      logging.console_colors = console["colors"].as<bool>();
    }
    if (console["level"]) {
      logging.console_level = console["level"].as<std::string>();
    }
  }

  // Parse file section
  if (node["file"]) {
    const auto& file = node["file"];
    if (file["enabled"]) {
      logging.file_enabled = file["enabled"].as<bool>();
    }
    if (file["level"]) {
      logging.file_level = file["level"].as<std::string>();
    }
    if (file["directory"]) {
      logging.file_directory = file["directory"].as<std::string>();
    }
    if (file["pattern"]) {
      logging.file_pattern = file["pattern"].as<std::string>();
    }
    if (file["format"]) {
      logging.file_format = file["format"].as<std::string>();
    }
    if (file["rotation_size_mb"]) {
      logging.rotation_size_mb = file["rotation_size_mb"].as<size_t>();
    }
    if (file["max_files"]) {
      logging.max_files = file["max_files"].as<size_t>();
    }
    if (file["rotate_at_midnight"]) {
      logging.rotate_at_midnight = file["rotate_at_midnight"].as<bool>();
    }
  }

  return true;
}

void ConfigParser::apply_env_overrides(TransferConfig& config) {
  if (const char* base_url = get_env("SLUICE_BASE_URL")) {
    config.api.base_url = base_url;
  }
  if (const char* token = get_env("SLUICE_TOKEN")) {
    config.api.access_token = token;
  }
  if (const char* timeout = get_env("SLUICE_TIMEOUT")) {
    try {
      size_t consumed = 0;
      long long seconds = std::stoll(timeout, &consumed);
      if (consumed != std::string(timeout).size() || seconds <= 0) {
        throw std::invalid_argument("not a positive integer");
      }
      config.http.request_timeout_ms = seconds * 1000;
    } catch (const std::logic_error&) {
      SLUICE_LOG_WARN("Ignoring invalid SLUICE_TIMEOUT" << kv("value", timeout));
    }
  }
  if (const char* state_dir = get_env("SLUICE_STATE_DIR")) {
    config.state_dir = state_dir;
  }
  if (config.state_dir.empty()) {
    config.state_dir = default_state_dir();
  }
}

bool ConfigParser::validate(const TransferConfig& config, std::string& error_msg) {
  if (config.api.base_url.empty()) {
    error_msg = "api.base_url is empty (set it in the config file or SLUICE_BASE_URL)";
    return false;
  }
  if (!parse_url(config.api.base_url)) {
    error_msg = "api.base_url is not an http(s) URL: " + config.api.base_url;
    return false;
  }
  if (config.api.expiry_minutes &&
      (*config.api.expiry_minutes < 1 || *config.api.expiry_minutes > kMaxExpiryMinutes)) {
    error_msg = "api.expiry_minutes must be between 1 and 60";
    return false;
  }

  if (config.http.connect_timeout_ms <= 0) {
    error_msg = "http.connect_timeout_ms must be positive";
    return false;
  }
  if (config.http.request_timeout_ms <= 0) {
    error_msg = "http.request_timeout_ms must be positive";
    return false;
  }

  if (config.retry.max_retries < 0) {
    error_msg = "retry.max_retries must not be negative";
    return false;
  }
  if (config.retry.base_delay_ms < 0 || config.retry.max_wait_ms < 0) {
    error_msg = "retry delays must not be negative";
    return false;
  }

  const uint64_t chunk_bytes = config.upload.chunk_size_mb * kMiB;
  if (chunk_bytes < kMinChunkSize || chunk_bytes > kMaxChunkSize) {
    error_msg = "upload.chunk_size_mb must be between 5 and 100";
    return false;
  }
  if (config.upload.concurrency < 1 || config.upload.concurrency > kMaxConcurrency) {
    error_msg = "upload.concurrency must be between 1 and 16";
    return false;
  }

  if (config.state_dir.empty()) {
    error_msg = "state_dir is empty";
    return false;
  }

  if (!::sluice::logging::parse_severity_level(config.logging.console_level)) {
    error_msg = "logging.console.level is not a known level: " + config.logging.console_level;
    return false;
  }
  if (!::sluice::logging::parse_severity_level(config.logging.file_level)) {
    error_msg = "logging.file.level is not a known level: " + config.logging.file_level;
    return false;
  }
  if (config.logging.file_format != "text" && config.logging.file_format != "json") {
    error_msg = "logging.file.format must be text or json";
    return false;
  }

  return true;
}

}  // namespace transfer
}  // namespace sluice
