// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIDUP_LOG_SEVERITY_HPP
#define VIDUP_LOG_SEVERITY_HPP

#include <boost/log/expressions/keyword.hpp>

#include <cstddef>
#include <ostream>

namespace vidup {
namespace logging {

/**
 * Severity levels for vidup logging.
 * FATAL is reserved for conditions that end the process.
 */
enum class severity_level { debug = 0, info = 1, warn = 2, error = 3, fatal = 4 };

constexpr const char* kSeverityNames[] = {"DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
constexpr std::size_t kSeverityCount = sizeof(kSeverityNames) / sizeof(*kSeverityNames);

/**
 * Upper-case name of a level, or nullptr for a value outside the enum.
 */
inline const char* to_string(severity_level level) {
  auto index = static_cast<std::size_t>(level);
  return index < kSeverityCount ? kSeverityNames[index] : nullptr;
}

inline std::ostream& operator<<(std::ostream& strm, severity_level level) {
  if (const char* name = to_string(level)) {
    strm << name;
  } else {
    strm << static_cast<int>(level);
  }
  return strm;
}

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

}  // namespace logging
}  // namespace vidup

#endif  // VIDUP_LOG_SEVERITY_HPP
