// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_LOG_MACROS_HPP
#define SLUICE_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/core.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/utility/unique_identifier_name.hpp>

#include <chrono>
#include <mutex>
#include <sstream>
#include <string>

#include "sluice_log_severity.hpp"

namespace sluice {
namespace logging {

typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Get the global logger instance.
 * Defined in sluice_log_init.cpp
 */
logger_type& get_logger();

/**
 * Key-value formatter for structured log messages.
 * Usage: SLUICE_LOG_INFO("Part uploaded" << kv("part", n));
 */
template<typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

template<>
inline std::string kv(const char* name, const std::string& value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

inline std::string kv(const char* name, const char* value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

/**
 * Strip the query string from a URL before it reaches a log record.
 * Pre-signed URLs carry their signature and credentials in the query.
 */
inline std::string redact_url(const std::string& url) {
  auto pos = url.find('?');
  if (pos == std::string::npos) {
    return url;
  }
  return url.substr(0, pos) + "?<redacted>";
}

/**
 * Attaches BucketKey and ObjectKey to every record from the current thread
 * while in scope. Attributes already set by an outer scope are left alone.
 */
class ScopedTransferContext {
public:
  ScopedTransferContext(const std::string& bucket_key, const std::string& object_key) {
    auto core = boost::log::core::get();
    auto bucket = core->add_thread_attribute(
      kBucketKeyAttr, boost::log::attributes::constant<std::string>(bucket_key)
    );
    if (bucket.second) {
      bucket_it_ = bucket.first;
      owns_bucket_ = true;
    }
    auto object = core->add_thread_attribute(
      kObjectKeyAttr, boost::log::attributes::constant<std::string>(object_key)
    );
    if (object.second) {
      object_it_ = object.first;
      owns_object_ = true;
    }
  }

  ~ScopedTransferContext() {
    auto core = boost::log::core::get();
    if (owns_object_) {
      core->remove_thread_attribute(object_it_);
    }
    if (owns_bucket_) {
      core->remove_thread_attribute(bucket_it_);
    }
  }

  ScopedTransferContext(const ScopedTransferContext&) = delete;
  ScopedTransferContext& operator=(const ScopedTransferContext&) = delete;

private:
  boost::log::attribute_set::iterator bucket_it_;
  boost::log::attribute_set::iterator object_it_;
  bool owns_bucket_ = false;
  bool owns_object_ = false;
};

}  // namespace logging
}  // namespace sluice

// =============================================================================
// Component identification
// Define SLUICE_LOG_COMPONENT before including this header:
//
//   #define SLUICE_LOG_COMPONENT "upload_engine"
//   #include <sluice_log_macros.hpp>
// =============================================================================
#ifndef SLUICE_LOG_COMPONENT
#define SLUICE_LOG_COMPONENT "sluice"
#endif

#ifdef NDEBUG
#define SLUICE_LOG_ENABLE_DEBUG 0
#else
#define SLUICE_LOG_ENABLE_DEBUG 1
#endif

#define SLUICE_LOG_SEV_IMPL(level, msg)                                                    \
  do {                                                                                      \
    BOOST_LOG_SEV(::sluice::logging::get_logger(), ::sluice::logging::severity_level::level) \
      << "[" << SLUICE_LOG_COMPONENT << "] " << msg;                                        \
  } while (0)

#define SLUICE_LOG_DEBUG(msg)      \
  do {                             \
    if (SLUICE_LOG_ENABLE_DEBUG) { \
      SLUICE_LOG_SEV_IMPL(debug, msg); \
    }                              \
  } while (0)

#define SLUICE_LOG_INFO(msg) SLUICE_LOG_SEV_IMPL(info, msg)
#define SLUICE_LOG_WARN(msg) SLUICE_LOG_SEV_IMPL(warn, msg)
#define SLUICE_LOG_ERROR(msg) SLUICE_LOG_SEV_IMPL(error, msg)

// =============================================================================
// Transfer context, cleared when the enclosing scope exits.
// Usage: SLUICE_LOG_SCOPED_CONTEXT(bucket_key, object_key);
// =============================================================================
#define SLUICE_LOG_SCOPED_CONTEXT(bucket_val, object_val)                             \
  ::sluice::logging::ScopedTransferContext BOOST_LOG_UNIQUE_IDENTIFIER_NAME(_sluice_ctx_)( \
    bucket_val, object_val                                                            \
  )

// =============================================================================
// At most one record per interval (seconds) per call site, for per-part chatter
// of concurrent uploads.
// Usage: SLUICE_LOG_INFO_THROTTLE(2.0, "Uploading" << kv("bytes", n));
// =============================================================================
#define SLUICE_LOG_INFO_THROTTLE(interval_sec, msg)                                          \
  do {                                                                                        \
    static std::chrono::steady_clock::time_point _sluice_last_log_time{};                     \
    static std::mutex _sluice_throttle_mutex;                                                 \
    auto _sluice_now = std::chrono::steady_clock::now();                                      \
    bool _sluice_should_log = false;                                                          \
    {                                                                                         \
      std::lock_guard<std::mutex> _sluice_lock(_sluice_throttle_mutex);                       \
      if (_sluice_now - _sluice_last_log_time >= std::chrono::duration<double>(interval_sec)) { \
        _sluice_last_log_time = _sluice_now;                                                  \
        _sluice_should_log = true;                                                            \
      }                                                                                       \
    }                                                                                         \
    if (_sluice_should_log) {                                                                 \
      SLUICE_LOG_INFO(msg);                                                                   \
    }                                                                                         \
  } while (0)

#endif  // SLUICE_LOG_MACROS_HPP
