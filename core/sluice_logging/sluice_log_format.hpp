// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_LOG_FORMAT_HPP
#define SLUICE_LOG_FORMAT_HPP

#include <boost/log/core/record_view.hpp>
#include <boost/log/utility/formatting_ostream.hpp>

#include <string>

#include "sluice_log_severity.hpp"

namespace sluice {
namespace logging {

/**
 * TimeStamp attribute as "YYYY-Mon-DD HH:MM:SS.ffffff", empty when absent
 */
std::string record_timestamp(boost::log::record_view const& rec);

/**
 * Appends " | bucket=<b> object=<o>" for records emitted inside a transfer
 * context. Writes nothing otherwise.
 */
void append_transfer_context(
  boost::log::record_view const& rec, boost::log::formatting_ostream& strm
);

}  // namespace logging
}  // namespace sluice

#endif  // SLUICE_LOG_FORMAT_HPP
