// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_LOG_INIT_HPP
#define SLUICE_LOG_INIT_HPP

#include <optional>
#include <string>

#include "sluice_console_sink.hpp"
#include "sluice_file_sink.hpp"
#include "sluice_log_severity.hpp"

namespace sluice {
namespace logging {

struct LoggingConfig {
  ConsoleSinkConfig console;
  FileSinkConfig file;
};

/**
 * Accepts "debug", "info", "warn", "warning", "error", "fatal" (case-insensitive)
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Apply environment variable overrides to a LoggingConfig.
 *
 * Supported environment variables:
 *   SLUICE_LOG_LEVEL           - Global level (overrides both console and file)
 *   SLUICE_LOG_CONSOLE_LEVEL   - Console sink level
 *   SLUICE_LOG_CONSOLE_ENABLED - Enable console logging ("true" or "false")
 *   SLUICE_LOG_FILE_LEVEL      - File sink level
 *   SLUICE_LOG_FILE_ENABLED    - Enable file logging ("true" or "false")
 *   SLUICE_LOG_FILE_DIR        - Log file directory
 *   SLUICE_LOG_FORMAT          - File format ("json" or "text")
 *   NO_COLOR                   - Any value disables console colors
 *
 * Unparsable values leave the setting unchanged.
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Install the sinks described by `config`. Sinks installed by an earlier call
 * are drained and replaced, so the CLI can log while it reads its config file
 * and switch sinks afterwards.
 */
void init_logging(const LoggingConfig& config);

/**
 * Drain queued records and detach all sinks. Safe without a prior init.
 */
void shutdown_logging();

bool is_logging_initialized();

}  // namespace logging
}  // namespace sluice

#endif  // SLUICE_LOG_INIT_HPP
