// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_FILE_SINK_HPP
#define SLUICE_FILE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <cstdint>
#include <string>

#include "sluice_log_severity.hpp"

namespace sluice {
namespace logging {

/**
 * Async file sink with bounded queue.
 * Larger queue than the console sink for slower I/O.
 */
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_file_backend,
  boost::log::sinks::bounded_fifo_queue<5000, boost::log::sinks::drop_on_overflow>>
  async_file_sink_t;

/**
 * Rotating log file, off unless asked for. Debug level by default so a
 * failed transfer leaves its retry history behind.
 */
struct FileSinkConfig {
  bool enabled = false;
  severity_level level = severity_level::debug;
  std::string directory = "/tmp/sluice/logs";
  std::string file_pattern = "sluice_%Y%m%d_%H%M%S.log";
  uint64_t rotation_size_mb = 50;  // Rotate at 50MB
  bool rotate_at_midnight = true;  // Also rotate daily
  int max_files = 10;              // Keep 10 rotated files
  bool format_json = false;        // Plain text unless log aggregation wants JSON
};

/**
 * Create async file sink with size and time based rotation.
 * Falls back to <tmp>/sluice-logs when the configured directory cannot be created.
 * `enabled` is not consulted here.
 */
boost::shared_ptr<async_file_sink_t> create_file_sink(const FileSinkConfig& config);

}  // namespace logging
}  // namespace sluice

#endif  // SLUICE_FILE_SINK_HPP
