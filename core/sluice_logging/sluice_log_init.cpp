// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "sluice_log_init.hpp"

#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>

#include "sluice_log_macros.hpp"

namespace sluice {
namespace logging {

namespace {

struct InstalledSinks {
  boost::shared_ptr<async_console_sink_t> console;
  boost::shared_ptr<async_file_sink_t> file;
  bool active = false;
};

std::mutex g_mutex;
InstalledSinks g_sinks;
std::once_flag g_common_attributes_once;

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return std::tolower(c);
  });
  return s;
}

std::optional<std::string> get_env(const char* name) {
  const char* value = std::getenv(name);
  if (value && value[0] != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

std::optional<bool> parse_bool(const std::string& s) {
  std::string lower = to_lower(s);
  if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
    return false;
  }
  return std::nullopt;
}

void override_level(const char* name, severity_level& level) {
  if (auto value = get_env(name)) {
    if (auto parsed = parse_severity_level(*value)) {
      level = *parsed;
    }
  }
}

void override_flag(const char* name, bool& flag) {
  if (auto value = get_env(name)) {
    if (auto parsed = parse_bool(*value)) {
      flag = *parsed;
    }
  }
}

// Unhook first so no new record reaches the sink, then drain its queue
template<typename Sink>
void detach(boost::shared_ptr<Sink>& sink) {
  if (!sink) {
    return;
  }
  boost::log::core::get()->remove_sink(sink);
  sink->stop();
  sink->flush();
  sink.reset();
}

// Caller holds g_mutex
void detach_all() {
  detach(g_sinks.console);
  detach(g_sinks.file);
  g_sinks.active = false;
}

}  // namespace

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  std::string lower = to_lower(level_str);

  if (lower == "debug") {
    return severity_level::debug;
  } else if (lower == "info") {
    return severity_level::info;
  } else if (lower == "warn" || lower == "warning") {
    return severity_level::warn;
  } else if (lower == "error") {
    return severity_level::error;
  } else if (lower == "fatal") {
    return severity_level::fatal;
  }

  return std::nullopt;
}

void apply_env_overrides(LoggingConfig& config) {
  override_level("SLUICE_LOG_LEVEL", config.console.level);
  override_level("SLUICE_LOG_LEVEL", config.file.level);
  override_level("SLUICE_LOG_CONSOLE_LEVEL", config.console.level);
  override_level("SLUICE_LOG_FILE_LEVEL", config.file.level);

  override_flag("SLUICE_LOG_CONSOLE_ENABLED", config.console.enabled);
  override_flag("SLUICE_LOG_FILE_ENABLED", config.file.enabled);

  if (auto dir = get_env("SLUICE_LOG_FILE_DIR")) {
    config.file.directory = *dir;
  }
  if (auto format = get_env("SLUICE_LOG_FORMAT")) {
    config.file.format_json = (to_lower(*format) == "json");
  }
  if (get_env("NO_COLOR")) {
    config.console.colors = false;
  }
}

logger_type& get_logger() {
  static logger_type instance;
  return instance;
}

void init_logging(const LoggingConfig& config) {
  std::lock_guard<std::mutex> lock(g_mutex);

  detach_all();

  // TimeStamp, ThreadID, ProcessID, LineID
  std::call_once(g_common_attributes_once, []() {
    boost::log::add_common_attributes();
  });

  auto core = boost::log::core::get();
  if (config.console.enabled) {
    g_sinks.console = create_console_sink(config.console);
    core->add_sink(g_sinks.console);
  }
  if (config.file.enabled) {
    g_sinks.file = create_file_sink(config.file);
    core->add_sink(g_sinks.file);
  }
  g_sinks.active = true;
}

void shutdown_logging() {
  std::lock_guard<std::mutex> lock(g_mutex);
  detach_all();
}

bool is_logging_initialized() {
  std::lock_guard<std::mutex> lock(g_mutex);
  return g_sinks.active;
}

}  // namespace logging
}  // namespace sluice
