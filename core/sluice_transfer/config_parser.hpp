// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_CONFIG_PARSER_HPP
#define SLUICE_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <string>

#include "transfer_config.hpp"

namespace sluice {
namespace transfer {

class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from YAML file. Sections absent from the file keep
   * the values already in `config`.
   */
  bool load_from_file(const std::string& path, TransferConfig& config);

  /**
   * Load configuration from YAML string
   */
  bool load_from_string(const std::string& yaml_content, TransferConfig& config);

  /**
   * Apply environment overrides, then fill in the default state directory.
   *
   * Supported environment variables:
   *   SLUICE_BASE_URL   - api.base_url
   *   SLUICE_TOKEN      - api.access_token
   *   SLUICE_TIMEOUT    - http.request_timeout_ms, given in seconds
   *   SLUICE_STATE_DIR  - state_dir
   */
  static void apply_env_overrides(TransferConfig& config);

  /**
   * Validate configuration
   */
  static bool validate(const TransferConfig& config, std::string& error_msg);

  /**
   * Get last error message
   */
  std::string get_last_error() const {
    return last_error_;
  }

private:
  bool parse_api(const YAML::Node& node, ApiConfig& api);
  bool parse_http(const YAML::Node& node, HttpConfig& http);
  bool parse_retry(const YAML::Node& node, RetrySettings& retry);
  bool parse_upload(const YAML::Node& node, UploadSettings& upload);
  bool parse_logging(const YAML::Node& node, LoggingSettings& logging);

  // Last error message
  mutable std::string last_error_;
};

}  // namespace transfer
}  // namespace sluice

#endif  // SLUICE_CONFIG_PARSER_HPP
