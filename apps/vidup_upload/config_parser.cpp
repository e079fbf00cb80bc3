// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>

#include <http_client.hpp>
#include <status_monitor.hpp>
#include <upload_session.hpp>

#include <vidup_log_init.hpp>

namespace vidup {
namespace upload {

// ============================================================================
// ConfigParser Implementation
// ============================================================================

bool ConfigParser::load_from_file(const std::string& path, UploaderConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(path);
    return load_from_string(YAML::Dump(yaml), config);
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML file: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::load_from_string(const std::string& yaml_content, UploaderConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);
    if (node.IsNull()) {
      return true;
    }
    if (!node.IsMap()) {
      last_error_ = "Configuration root must be a mapping";
      return false;
    }

    if (node["server"] && !parse_server(node["server"], config.server)) {
      return false;
    }
    if (node["upload"] && !parse_upload(node["upload"], config.upload)) {
      return false;
    }
    if (node["retry"] && !parse_retry(node["retry"], config.retry)) {
      return false;
    }
    if (node["monitor"] && !parse_monitor(node["monitor"], config.monitor)) {
      return false;
    }
    if (node["logging"] && !parse_logging(node["logging"], config.logging)) {
      return false;
    }

    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::parse_server(const YAML::Node& node, ServerConfig& server) {
  if (!node.IsMap()) {
    last_error_ = "server must be a mapping";
    return false;
  }
  if (node["base_url"]) {
    server.base_url = node["base_url"].as<std::string>();
  }
  if (node["api_base_path"]) {
    server.api_base_path = node["api_base_path"].as<std::string>();
  }
  if (node["request_timeout_ms"]) {
    server.request_timeout_ms = node["request_timeout_ms"].as<int64_t>();
  }
  if (node["user_agent"]) {
    server.user_agent = node["user_agent"].as<std::string>();
  }
  return true;
}

bool ConfigParser::parse_upload(const YAML::Node& node, TransferConfig& upload) {
  if (!node.IsMap()) {
    last_error_ = "upload must be a mapping";
    return false;
  }
  if (node["chunk_size_bytes"]) {
    // Read as signed so a negative value is rejected instead of wrapping
    auto chunk_size = node["chunk_size_bytes"].as<int64_t>();
    if (chunk_size <= 0) {
      last_error_ = "upload.chunk_size_bytes must be > 0";
      return false;
    }
    upload.chunk_size_bytes = static_cast<uint64_t>(chunk_size);
  }
  if (node["max_concurrent_chunks"]) {
    upload.max_concurrent_chunks = node["max_concurrent_chunks"].as<int>();
  }
  return true;
}

bool ConfigParser::parse_retry(const YAML::Node& node, RetryConfig& retry) {
  if (!node.IsMap()) {
    last_error_ = "retry must be a mapping";
    return false;
  }
  if (node["max_retries"]) {
    retry.max_retries = node["max_retries"].as<int>();
  }
  if (node["initial_delay_ms"]) {
    retry.initial_delay_ms = node["initial_delay_ms"].as<int64_t>();
  }
  if (node["max_delay_ms"]) {
    retry.max_delay_ms = node["max_delay_ms"].as<int64_t>();
  }
  if (node["exponential_base"]) {
    retry.exponential_base = node["exponential_base"].as<double>();
  }
  if (node["jitter"]) {
    retry.jitter = node["jitter"].as<bool>();
  }
  if (node["jitter_factor"]) {
    retry.jitter_factor = node["jitter_factor"].as<double>();
  }
  return true;
}

bool ConfigParser::parse_monitor(const YAML::Node& node, MonitorConfig& monitor) {
  if (!node.IsMap()) {
    last_error_ = "monitor must be a mapping";
    return false;
  }
  if (node["max_attempts"]) {
    monitor.max_attempts = node["max_attempts"].as<int>();
  }
  if (node["interval_sec"]) {
    monitor.interval_sec = node["interval_sec"].as<int64_t>();
  }
  if (node["error_delay_sec"]) {
    monitor.error_delay_sec = node["error_delay_sec"].as<int64_t>();
  }
  return true;
}

bool ConfigParser::parse_logging(const YAML::Node& node, LoggingConfig& logging) {
  // Parse console section
  if (node["console"]) {
    const auto& console = node["console"];
    if (console["enabled"]) {
      logging.console_enabled = console["enabled"].as<bool>();
    }
    if (console["colors"]) {
      logging.console_colors = console["colors"].as<bool>();
    }
    if (console["level"]) {
      logging.console_level = console["level"].as<std::string>();
    }
  }

  // Parse file section
  if (node["file"]) {
    const auto& file = node["file"];
    if (file["enabled"]) {
      logging.file_enabled = file["enabled"].as<bool>();
    }
    if (file["level"]) {
      logging.file_level = file["level"].as<std::string>();
    }
    if (file["directory"]) {
      logging.file_directory = file["directory"].as<std::string>();
    }
    if (file["pattern"]) {
      logging.file_pattern = file["pattern"].as<std::string>();
    }
    if (file["format"]) {
      logging.file_format = file["format"].as<std::string>();
    }
    if (file["rotation_size_mb"]) {
      logging.rotation_size_mb = file["rotation_size_mb"].as<uint64_t>();
    }
    if (file["max_files"]) {
      logging.max_files = file["max_files"].as<int>();
    }
    if (file["rotate_at_midnight"]) {
      logging.rotate_at_midnight = file["rotate_at_midnight"].as<bool>();
    }
  }

  return true;
}

void ConfigParser::apply_env_overrides(UploaderConfig& config) {
  if (const char* base_url = std::getenv("VIDUP_BASE_URL")) {
    if (*base_url != '\0') {
      config.server.base_url = base_url;
    }
  }
}

bool ConfigParser::validate(const UploaderConfig& config, std::string& error_msg) {
  // The client speaks plain HTTP only
  if (config.server.base_url.find("http://") != 0) {
    error_msg = "Invalid server.base_url - must start with http://";
    return false;
  }

  if (config.server.request_timeout_ms <= 0) {
    error_msg = "Invalid server.request_timeout_ms - must be > 0";
    return false;
  }

  if (config.upload.chunk_size_bytes == 0) {
    error_msg = "Invalid upload.chunk_size_bytes - must be > 0";
    return false;
  }

  if (config.upload.max_concurrent_chunks < 1) {
    error_msg = "Invalid upload.max_concurrent_chunks - must be >= 1";
    return false;
  }

  if (config.retry.max_retries < 0 || config.retry.max_retries > 100) {
    error_msg = "Invalid retry.max_retries - must be between 0 and 100";
    return false;
  }

  if (config.retry.initial_delay_ms < 0) {
    error_msg = "Invalid retry.initial_delay_ms - must be >= 0";
    return false;
  }

  if (config.retry.max_delay_ms < 0) {
    error_msg = "Invalid retry.max_delay_ms - must be >= 0";
    return false;
  }

  if (config.retry.exponential_base < 1.0) {
    error_msg = "Invalid retry.exponential_base - must be >= 1.0";
    return false;
  }

  if (config.retry.jitter_factor < 0.0 || config.retry.jitter_factor >= 1.0) {
    error_msg = "Invalid retry.jitter_factor - must be in [0, 1)";
    return false;
  }

  if (config.monitor.max_attempts < 1) {
    error_msg = "Invalid monitor.max_attempts - must be >= 1";
    return false;
  }

  if (config.monitor.interval_sec < 0 || config.monitor.error_delay_sec < 0) {
    error_msg = "Invalid monitor delays - must be >= 0";
    return false;
  }

  if (config.logging.file_format != "json" && config.logging.file_format != "text") {
    error_msg = "Invalid logging.file.format - must be 'json' or 'text'";
    return false;
  }

  return true;
}

void convert_logging_config(
  const LoggingConfig& yaml_config, ::vidup::logging::LoggingConfig& log_config
) {
  // Console settings
  log_config.console_enabled = yaml_config.console_enabled;
  log_config.console_colors = yaml_config.console_colors;

  if (auto level = ::vidup::logging::parse_severity_level(yaml_config.console_level)) {
    log_config.console_level = *level;
  }

  // File settings
  log_config.file_enabled = yaml_config.file_enabled;

  if (auto level = ::vidup::logging::parse_severity_level(yaml_config.file_level)) {
    log_config.file_level = *level;
  }

  log_config.file_config.directory = yaml_config.file_directory;
  log_config.file_config.file_pattern = yaml_config.file_pattern;
  log_config.file_config.format_json = (yaml_config.file_format == "json");
  log_config.file_config.rotation_size_mb = yaml_config.rotation_size_mb;
  log_config.file_config.max_files = yaml_config.max_files;
  log_config.file_config.rotate_at_midnight = yaml_config.rotate_at_midnight;
}

::vidup::uploader::HttpConfig to_http_config(const UploaderConfig& config) {
  ::vidup::uploader::HttpConfig http;
  http.base_url = config.server.base_url;
  http.request_timeout = std::chrono::milliseconds(config.server.request_timeout_ms);
  http.user_agent = config.server.user_agent;
  return http;
}

::vidup::uploader::SessionConfig to_session_config(const UploaderConfig& config) {
  ::vidup::uploader::SessionConfig session;
  session.chunk_size = config.upload.chunk_size_bytes;
  session.max_concurrent_chunks = static_cast<size_t>(config.upload.max_concurrent_chunks);
  session.retry.max_retries = config.retry.max_retries;
  session.retry.initial_delay = std::chrono::milliseconds(config.retry.initial_delay_ms);
  session.retry.max_delay = std::chrono::milliseconds(config.retry.max_delay_ms);
  session.retry.exponential_base = config.retry.exponential_base;
  session.retry.jitter = config.retry.jitter;
  session.retry.jitter_factor = config.retry.jitter_factor;
  return session;
}

::vidup::uploader::MonitorConfig to_monitor_config(const UploaderConfig& config) {
  ::vidup::uploader::MonitorConfig monitor;
  monitor.max_attempts = config.monitor.max_attempts;
  monitor.interval = std::chrono::seconds(config.monitor.interval_sec);
  monitor.error_delay = std::chrono::seconds(config.monitor.error_delay_sec);
  return monitor;
}

}  // namespace upload
}  // namespace vidup
