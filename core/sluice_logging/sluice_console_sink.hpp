// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_CONSOLE_SINK_HPP
#define SLUICE_CONSOLE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <ostream>

#include "sluice_log_severity.hpp"

namespace sluice {
namespace logging {

/**
 * Console output of the CLI. Records share stderr with the transfer
 * progress meter, which redraws its line with '\r'.
 */
struct ConsoleSinkConfig {
  bool enabled = true;
  bool colors = true;
  severity_level level = severity_level::info;

  // Prefix each record with "\r\033[K" so it replaces a half-drawn progress line
  bool clear_progress_line = false;

  // Not owned; std::clog when null
  std::ostream* stream = nullptr;
};

/**
 * Records queue up to 1000 deep and are dropped on overflow, never stalling
 * a part upload on a slow terminal.
 */
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_ostream_backend,
  boost::log::sinks::bounded_fifo_queue<1000, boost::log::sinks::drop_on_overflow>>
  async_console_sink_t;

/**
 * Line format: [LEVEL] [component] message key=value | bucket=.. object=..
 */
boost::shared_ptr<async_console_sink_t> create_console_sink(const ConsoleSinkConfig& config);

}  // namespace logging
}  // namespace sluice

#endif  // SLUICE_CONSOLE_SINK_HPP
