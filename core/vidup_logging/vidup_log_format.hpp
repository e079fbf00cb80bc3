// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIDUP_LOG_FORMAT_HPP
#define VIDUP_LOG_FORMAT_HPP

#include <boost/log/core/record_view.hpp>
#include <boost/log/expressions/keyword.hpp>
#include <boost/log/utility/formatting_ostream.hpp>

#include <cstdint>
#include <string>

namespace vidup {
namespace logging {

// Attributes attached to upload records besides Severity/TimeStamp/ThreadID.
//   Component - source component, added per record by the VIDUP_LOG_* macros
//   UploadID  - server session id, scoped by VIDUP_LOG_SCOPED_UPLOAD
//   Chunk     - 0-based chunk index, scoped by VIDUP_LOG_SCOPED_CHUNK
BOOST_LOG_ATTRIBUTE_KEYWORD(component_attr, "Component", std::string)
BOOST_LOG_ATTRIBUTE_KEYWORD(upload_attr, "UploadID", std::string)
BOOST_LOG_ATTRIBUTE_KEYWORD(chunk_attr, "Chunk", uint64_t)

/**
 * Escape a string for JSON output per RFC 8259.
 */
std::string escape_json(const std::string& s);

/**
 * One-line text rendering:
 *   [time] [LEVEL] [component] message | upload_id=... chunk=N
 *
 * @param use_colors Wrap the severity tag in ANSI color codes
 */
void format_text(
  boost::log::record_view const& rec, boost::log::formatting_ostream& strm, bool use_colors
);

/**
 * JSON-lines rendering with ts, level, component, msg, thread_id, upload_id
 * and chunk fields. Absent attributes are omitted.
 */
void format_json(boost::log::record_view const& rec, boost::log::formatting_ostream& strm);

}  // namespace logging
}  // namespace vidup

#endif  // VIDUP_LOG_FORMAT_HPP
