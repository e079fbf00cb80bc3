// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIDUP_UPLOAD_CONFIG_PARSER_HPP
#define VIDUP_UPLOAD_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <string>

#include "uploader_config.hpp"

namespace vidup {
namespace logging {
struct LoggingConfig;
}
namespace uploader {
struct HttpConfig;
struct SessionConfig;
struct MonitorConfig;
}  // namespace uploader
}  // namespace vidup

namespace vidup {
namespace upload {

/**
 * Convert LoggingConfig to vidup::logging::LoggingConfig.
 * Unrecognized level names keep the logging library defaults.
 */
void convert_logging_config(
  const LoggingConfig& yaml_config, ::vidup::logging::LoggingConfig& log_config
);

/**
 * Engine settings derived from the parsed configuration
 */
::vidup::uploader::HttpConfig to_http_config(const UploaderConfig& config);
::vidup::uploader::SessionConfig to_session_config(const UploaderConfig& config);
::vidup::uploader::MonitorConfig to_monitor_config(const UploaderConfig& config);

class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from YAML file
   */
  bool load_from_file(const std::string& path, UploaderConfig& config);

  /**
   * Load configuration from YAML string. Keys that are absent keep their
   * current values in `config`.
   */
  bool load_from_string(const std::string& yaml_content, UploaderConfig& config);

  /**
   * Apply environment overrides (VIDUP_BASE_URL)
   */
  static void apply_env_overrides(UploaderConfig& config);

  /**
   * Validate configuration
   */
  static bool validate(const UploaderConfig& config, std::string& error_msg);

  /**
   * Get last error message
   */
  std::string get_last_error() const {
    return last_error_;
  }

private:
  bool parse_server(const YAML::Node& node, ServerConfig& server);
  bool parse_upload(const YAML::Node& node, TransferConfig& upload);
  bool parse_retry(const YAML::Node& node, RetryConfig& retry);
  bool parse_monitor(const YAML::Node& node, MonitorConfig& monitor);
  bool parse_logging(const YAML::Node& node, LoggingConfig& logging);

  // Last error message
  mutable std::string last_error_;
};

}  // namespace upload
}  // namespace vidup

#endif  // VIDUP_UPLOAD_CONFIG_PARSER_HPP
