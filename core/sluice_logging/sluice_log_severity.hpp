// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_LOG_SEVERITY_HPP
#define SLUICE_LOG_SEVERITY_HPP

#include <boost/log/expressions/keyword.hpp>

#include <cstddef>
#include <ostream>

namespace sluice {
namespace logging {

/**
 * Severity levels for sluice logging.
 * "Verbose" output of the transfer engine is emitted at debug.
 */
enum class severity_level { debug = 0, info = 1, warn = 2, error = 3, fatal = 4 };

inline std::ostream& operator<<(std::ostream& strm, severity_level level) {
  static const char* strings[] = {"DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
  if (static_cast<size_t>(level) < sizeof(strings) / sizeof(*strings))
    strm << strings[static_cast<size_t>(level)];
  else
    strm << static_cast<int>(level);
  return strm;
}

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

// Thread attributes set by SLUICE_LOG_SCOPED_CONTEXT
constexpr const char* kBucketKeyAttr = "BucketKey";
constexpr const char* kObjectKeyAttr = "ObjectKey";

}  // namespace logging
}  // namespace sluice

#endif  // SLUICE_LOG_SEVERITY_HPP
