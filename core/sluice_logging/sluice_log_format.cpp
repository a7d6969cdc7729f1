// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "sluice_log_format.hpp"

#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/support/date_time.hpp>

#include <sstream>

namespace sluice {
namespace logging {

std::string record_timestamp(boost::log::record_view const& rec) {
  auto time_stamp = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec);
  if (!time_stamp) {
    return std::string();
  }
  std::ostringstream oss;
  oss << *time_stamp;
  return oss.str();
}

void append_transfer_context(
  boost::log::record_view const& rec, boost::log::formatting_ostream& strm
) {
  auto bucket = boost::log::extract<std::string>(kBucketKeyAttr, rec);
  auto object = boost::log::extract<std::string>(kObjectKeyAttr, rec);
  if (!bucket && !object) {
    return;
  }
  strm << " |";
  if (bucket) {
    strm << " bucket=" << *bucket;
  }
  if (object) {
    strm << " object=" << *object;
  }
}

}  // namespace logging
}  // namespace sluice
