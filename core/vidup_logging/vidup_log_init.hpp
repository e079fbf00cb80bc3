// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIDUP_LOG_INIT_HPP
#define VIDUP_LOG_INIT_HPP

#include <boost/log/sinks/sink.hpp>

#include <optional>
#include <string>

#include "vidup_console_sink.hpp"
#include "vidup_file_sink.hpp"
#include "vidup_log_severity.hpp"

namespace vidup {
namespace logging {

struct LoggingConfig {
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;

  bool file_enabled = false;
  FileSinkConfig file_config;
  severity_level file_level = severity_level::debug;
};

/**
 * Parse "debug", "info", "warn"/"warning", "error" or "fatal", ignoring case.
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Apply environment variable overrides to a LoggingConfig.
 *
 *   VIDUP_LOG_LEVEL           - Level for both sinks (the per-sink variables win)
 *   VIDUP_LOG_CONSOLE_LEVEL   - Console sink level
 *   VIDUP_LOG_CONSOLE_ENABLED - "true"/"false" (also yes/no, on/off, 1/0)
 *   VIDUP_LOG_FILE_LEVEL      - File sink level
 *   VIDUP_LOG_FILE_ENABLED    - "true"/"false"
 *   VIDUP_LOG_FILE_DIR        - Log file directory
 *   VIDUP_LOG_FORMAT          - File format, "json" or "text"
 *
 * Empty or unparsable values leave the setting unchanged.
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Install the configured sinks. Ignored if logging is already initialized.
 */
void init_logging(const LoggingConfig& config);

/**
 * Console at INFO, no file sink.
 */
void init_logging_default();

/**
 * Drain the async sinks and detach every sink, including ones added with
 * add_sink().
 */
void shutdown_logging();

void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink);

void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink);

void flush_logging();

/**
 * shutdown_logging() followed by init_logging() with env overrides applied.
 */
void reconfigure_logging(const LoggingConfig& config);

bool is_logging_initialized();

}  // namespace logging
}  // namespace vidup

#endif  // VIDUP_LOG_INIT_HPP
