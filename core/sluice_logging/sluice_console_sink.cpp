// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "sluice_console_sink.hpp"

#include <boost/core/null_deleter.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>
#include <boost/make_shared.hpp>

#include <iostream>

#include "sluice_log_format.hpp"

namespace sluice {
namespace logging {

namespace expr = boost::log::expressions;

namespace {

const char* const kClearLine = "\r\033[K";
const char* const kResetColor = "\033[0m";

// Warnings and errors stand out, routine progress stays plain
const char* level_color(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "\033[2m";  // Dim
    case severity_level::warn:
      return "\033[33m";  // Yellow
    case severity_level::error:
    case severity_level::fatal:
      return "\033[1;31m";  // Bold red
    default:
      return nullptr;
  }
}

class ConsoleFormatter {
public:
  explicit ConsoleFormatter(const ConsoleSinkConfig& config)
      : colors_(config.colors)
      , clear_line_(config.clear_progress_line) {}

  void operator()(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) const {
    if (clear_line_) {
      strm << kClearLine;
    }

    auto sev = boost::log::extract<severity_level>("Severity", rec);
    const char* color = (colors_ && sev) ? level_color(*sev) : nullptr;
    if (color) {
      strm << color;
    }
    if (sev) {
      strm << "[" << *sev << "] ";
    }
    strm << rec[expr::smessage];
    append_transfer_context(rec, strm);
    if (color) {
      strm << kResetColor;
    }
  }

private:
  bool colors_;
  bool clear_line_;
};

}  // namespace

boost::shared_ptr<async_console_sink_t> create_console_sink(const ConsoleSinkConfig& config) {
  std::ostream* stream = config.stream ? config.stream : &std::clog;

  auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
  backend->add_stream(boost::shared_ptr<std::ostream>(stream, boost::null_deleter()));
  backend->auto_flush(true);

  auto sink = boost::make_shared<async_console_sink_t>(backend);
  sink->set_filter(severity >= config.level);
  sink->set_formatter(ConsoleFormatter(config));
  return sink;
}

}  // namespace logging
}  // namespace sluice
