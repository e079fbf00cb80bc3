// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "vidup_log_format.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>

#include <cstdio>

#include "vidup_log_severity.hpp"

namespace vidup {
namespace logging {

namespace expr = boost::log::expressions;

namespace {

// Indexed by severity_level
constexpr const char* kLevelColors[] = {
  "\033[36m",  // DEBUG cyan
  "\033[32m",  // INFO green
  "\033[33m",  // WARN yellow
  "\033[31m",  // ERROR red
  "\033[35m",  // FATAL magenta
};
constexpr const char* kColorReset = "\033[0m";

const char* level_color(severity_level level) {
  auto index = static_cast<std::size_t>(level);
  return index < kSeverityCount ? kLevelColors[index] : "";
}

}  // namespace

std::string escape_json(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 16);
  for (unsigned char c : s) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (c < 0x20) {
          char escaped[8];
          std::snprintf(escaped, sizeof(escaped), "\\u%04x", c);
          out += escaped;
        } else {
          out += static_cast<char>(c);
        }
    }
  }
  return out;
}

void format_text(
  boost::log::record_view const& rec, boost::log::formatting_ostream& strm, bool use_colors
) {
  if (auto ts = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec)) {
    strm << "[" << *ts << "] ";
  }

  if (auto level = rec[severity]) {
    if (use_colors) {
      strm << level_color(*level) << "[" << *level << "]" << kColorReset << " ";
    } else {
      strm << "[" << *level << "] ";
    }
  }

  if (auto component = rec[component_attr]) {
    strm << "[" << *component << "] ";
  }

  strm << rec[expr::smessage];

  auto upload_id = rec[upload_attr];
  auto chunk = rec[chunk_attr];
  if (upload_id || chunk) {
    strm << " |";
    if (upload_id) {
      strm << " upload_id=" << *upload_id;
    }
    if (chunk) {
      strm << " chunk=" << *chunk;
    }
  }
}

void format_json(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  strm << "{\"ts\":\"";
  if (auto ts = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec)) {
    strm << boost::posix_time::to_iso_extended_string(*ts);
  }
  strm << "\",\"level\":\"";
  if (auto level = rec[severity]) {
    strm << *level;
  }
  strm << "\"";

  if (auto component = rec[component_attr]) {
    strm << ",\"component\":\"" << escape_json(*component) << "\"";
  }

  strm << ",\"msg\":\"";
  if (auto message = rec[expr::smessage]) {
    strm << escape_json(*message);
  }
  strm << "\"";

  auto thread_id =
    boost::log::extract<boost::log::attributes::current_thread_id::value_type>("ThreadID", rec);
  if (thread_id) {
    strm << ",\"thread_id\":\"" << *thread_id << "\"";
  }
  if (auto upload_id = rec[upload_attr]) {
    strm << ",\"upload_id\":\"" << escape_json(*upload_id) << "\"";
  }
  if (auto chunk = rec[chunk_attr]) {
    strm << ",\"chunk\":" << *chunk;
  }

  strm << "}";
}

}  // namespace logging
}  // namespace vidup
