// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "sluice_file_sink.hpp"

#include <boost/filesystem.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>
#include <boost/make_shared.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <sstream>

#include "sluice_log_format.hpp"

namespace sluice {
namespace logging {

namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;
namespace sinks = boost::log::sinks;

namespace {

template<typename T>
std::string to_text(const T& value) {
  std::ostringstream oss;
  oss << value;
  return oss.str();
}

/**
 * One JSON object per line:
 * {"ts", "level", "component", "msg", "thread_id", "bucket", "object"}
 *
 * The "[component] " prefix written by the SLUICE_LOG_* macros is lifted into
 * its own field so aggregators can filter on it.
 */
void json_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  nlohmann::json line;
  line["ts"] = record_timestamp(rec);

  if (auto sev = boost::log::extract<severity_level>("Severity", rec)) {
    line["level"] = to_text(*sev);
  }

  auto message = rec[expr::smessage];
  std::string text = message ? message.get() : std::string();
  if (!text.empty() && text[0] == '[') {
    auto close = text.find("] ");
    if (close != std::string::npos) {
      line["component"] = text.substr(1, close - 1);
      text.erase(0, close + 2);
    }
  }
  line["msg"] = text;

  using thread_id_t = boost::log::attributes::current_thread_id::value_type;
  if (auto thread_id = boost::log::extract<thread_id_t>("ThreadID", rec)) {
    line["thread_id"] = to_text(*thread_id);
  }
  if (auto bucket = boost::log::extract<std::string>(kBucketKeyAttr, rec)) {
    line["bucket"] = *bucket;
  }
  if (auto object = boost::log::extract<std::string>(kObjectKeyAttr, rec)) {
    line["object"] = *object;
  }

  // Object keys are not guaranteed UTF-8; never throw on the sink thread
  strm << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// [ts] [LEVEL] [component] message | bucket=.. object=..
void text_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  strm << "[" << record_timestamp(rec) << "] ";
  if (auto sev = boost::log::extract<severity_level>("Severity", rec)) {
    strm << "[" << *sev << "] ";
  }
  strm << rec[expr::smessage];
  append_transfer_context(rec, strm);
}

// Configured directory, or <tmp>/sluice-logs when it cannot be created
boost::filesystem::path resolve_log_directory(const FileSinkConfig& config) {
  boost::filesystem::path dir(config.directory);
  boost::system::error_code ec;
  boost::filesystem::create_directories(dir, ec);
  if (!ec) {
    return dir;
  }

  boost::system::error_code tmp_ec;
  auto fallback = boost::filesystem::temp_directory_path(tmp_ec);
  fallback = tmp_ec ? boost::filesystem::path("/tmp") : fallback;
  fallback /= "sluice-logs";
  boost::filesystem::create_directories(fallback, tmp_ec);

  // Sinks are not attached yet, so this goes straight to stderr
  std::cerr << "[sluice_logging] Warning: cannot create log directory '" << config.directory
            << "': " << ec.message() << "; logging to " << fallback.string() << "\n";
  return fallback;
}

}  // namespace

boost::shared_ptr<async_file_sink_t> create_file_sink(const FileSinkConfig& config) {
  const auto dir = resolve_log_directory(config);

  auto backend = boost::make_shared<sinks::text_file_backend>(
    keywords::file_name = (dir / config.file_pattern).string(),
    keywords::rotation_size = config.rotation_size_mb * 1024 * 1024,
    keywords::auto_flush = true
  );
  if (config.rotate_at_midnight) {
    backend->set_time_based_rotation(sinks::file::rotation_at_time_point(0, 0, 0));
  }

  // Old files beyond max_files are deleted at rotation
  backend->set_file_collector(
    sinks::file::make_collector(keywords::target = dir, keywords::max_files = config.max_files)
  );
  backend->scan_for_files();

  auto sink = boost::make_shared<async_file_sink_t>(backend);
  sink->set_filter(severity >= config.level);
  if (config.format_json) {
    sink->set_formatter(&json_formatter);
  } else {
    sink->set_formatter(&text_formatter);
  }
  return sink;
}

}  // namespace logging
}  // namespace sluice
