// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIDUP_UPLOAD_UPLOADER_CONFIG_HPP
#define VIDUP_UPLOAD_UPLOADER_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace vidup {
namespace upload {

/**
 * Movie service endpoint
 */
struct ServerConfig {
  std::string base_url = "http://localhost:8080";
  std::string api_base_path = "/api/movies";
  int64_t request_timeout_ms = 30000;
  std::string user_agent = "Movie-Service-Client/1.0.0";
};

/**
 * Chunking and concurrency
 */
struct TransferConfig {
  uint64_t chunk_size_bytes = 5ULL * 1024 * 1024;
  int max_concurrent_chunks = 3;
};

/**
 * Per-chunk retry behavior
 */
struct RetryConfig {
  int max_retries = 3;
  int64_t initial_delay_ms = 1000;
  int64_t max_delay_ms = 300000;
  double exponential_base = 2.0;
  bool jitter = false;
  double jitter_factor = 0.5;
};

/**
 * Post-upload processing status polling
 */
struct MonitorConfig {
  int max_attempts = 30;
  int64_t interval_sec = 10;
  int64_t error_delay_sec = 5;
};

/**
 * Logging configuration as read from YAML
 */
struct LoggingConfig {
  // Console sink
  bool console_enabled = true;
  bool console_colors = true;
  std::string console_level = "info";

  // File sink
  bool file_enabled = false;
  std::string file_level = "debug";
  std::string file_directory = "/tmp/vidup";
  std::string file_pattern = "vidup_%Y%m%d_%H%M%S.log";
  std::string file_format = "text";  // "json" or "text"
  uint64_t rotation_size_mb = 50;
  int max_files = 10;
  bool rotate_at_midnight = true;
};

/**
 * Complete vidup_upload configuration
 */
struct UploaderConfig {
  ServerConfig server;
  TransferConfig upload;
  RetryConfig retry;
  MonitorConfig monitor;
  LoggingConfig logging;
};

}  // namespace upload
}  // namespace vidup

#endif  // VIDUP_UPLOAD_UPLOADER_CONFIG_HPP
