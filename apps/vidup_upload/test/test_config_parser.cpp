// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_config_parser.cpp
 * @brief Unit tests for ConfigParser and UploaderConfig
 *
 * Tests YAML parsing, validation, environment overrides and conversion to
 * the engine's configuration types.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include <http_client.hpp>
#include <status_monitor.hpp>
#include <upload_session.hpp>
#include <vidup_log_init.hpp>

#include "../config_parser.hpp"

namespace fs = std::filesystem;

using namespace vidup::upload;

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigParserTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir_ = fs::temp_directory_path() /
                ("vidup_config_test_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(test_dir_);
    unsetenv("VIDUP_BASE_URL");
  }

  void TearDown() override {
    unsetenv("VIDUP_BASE_URL");
    if (fs::exists(test_dir_)) {
      fs::remove_all(test_dir_);
    }
  }

  std::string write_test_file(const std::string& filename, const std::string& content) {
    auto path = test_dir_ / filename;
    std::ofstream file(path);
    file << content;
    return path.string();
  }

  fs::path test_dir_;
};

// ============================================================================
// Defaults
// ============================================================================

TEST_F(ConfigParserTest, DefaultsMatchClientDefaults) {
  UploaderConfig config;
  EXPECT_EQ(config.server.base_url, "http://localhost:8080");
  EXPECT_EQ(config.server.api_base_path, "/api/movies");
  EXPECT_EQ(config.server.request_timeout_ms, 30000);
  EXPECT_EQ(config.upload.chunk_size_bytes, 5ULL * 1024 * 1024);
  EXPECT_EQ(config.upload.max_concurrent_chunks, 3);
  EXPECT_EQ(config.retry.max_retries, 3);
  EXPECT_EQ(config.monitor.max_attempts, 30);
  EXPECT_EQ(config.monitor.interval_sec, 10);

  std::string error;
  EXPECT_TRUE(ConfigParser::validate(config, error)) << error;
}

TEST_F(ConfigParserTest, EmptyDocumentKeepsDefaults) {
  ConfigParser parser;
  UploaderConfig config;
  EXPECT_TRUE(parser.load_from_string("", config));
  EXPECT_EQ(config.server.base_url, "http://localhost:8080");
}

// ============================================================================
// Valid YAML Parsing Tests
// ============================================================================

TEST_F(ConfigParserTest, ParseValidFullConfig) {
  const std::string yaml = R"(
server:
  base_url: http://media.internal:9000
  api_base_path: /v2/movies
  request_timeout_ms: 15000
  user_agent: test-agent/2.0
upload:
  chunk_size_bytes: 1048576
  max_concurrent_chunks: 6
retry:
  max_retries: 5
  initial_delay_ms: 250
  max_delay_ms: 8000
  exponential_base: 3.0
  jitter: true
  jitter_factor: 0.25
monitor:
  max_attempts: 12
  interval_sec: 2
  error_delay_sec: 1
logging:
  console:
    enabled: false
    colors: false
    level: warn
  file:
    enabled: true
    level: info
    directory: /var/log/vidup
    pattern: upload_%N.log
    format: json
    rotation_size_mb: 20
    max_files: 4
    rotate_at_midnight: false
)";

  ConfigParser parser;
  UploaderConfig config;
  ASSERT_TRUE(parser.load_from_string(yaml, config)) << parser.get_last_error();

  EXPECT_EQ(config.server.base_url, "http://media.internal:9000");
  EXPECT_EQ(config.server.api_base_path, "/v2/movies");
  EXPECT_EQ(config.server.request_timeout_ms, 15000);
  EXPECT_EQ(config.server.user_agent, "test-agent/2.0");

  EXPECT_EQ(config.upload.chunk_size_bytes, 1048576u);
  EXPECT_EQ(config.upload.max_concurrent_chunks, 6);

  EXPECT_EQ(config.retry.max_retries, 5);
  EXPECT_EQ(config.retry.initial_delay_ms, 250);
  EXPECT_EQ(config.retry.max_delay_ms, 8000);
  EXPECT_DOUBLE_EQ(config.retry.exponential_base, 3.0);
  EXPECT_TRUE(config.retry.jitter);
  EXPECT_DOUBLE_EQ(config.retry.jitter_factor, 0.25);

  EXPECT_EQ(config.monitor.max_attempts, 12);
  EXPECT_EQ(config.monitor.interval_sec, 2);
  EXPECT_EQ(config.monitor.error_delay_sec, 1);

  EXPECT_FALSE(config.logging.console_enabled);
  EXPECT_FALSE(config.logging.console_colors);
  EXPECT_EQ(config.logging.console_level, "warn");
  EXPECT_TRUE(config.logging.file_enabled);
  EXPECT_EQ(config.logging.file_level, "info");
  EXPECT_EQ(config.logging.file_directory, "/var/log/vidup");
  EXPECT_EQ(config.logging.file_pattern, "upload_%N.log");
  EXPECT_EQ(config.logging.file_format, "json");
  EXPECT_EQ(config.logging.rotation_size_mb, 20u);
  EXPECT_EQ(config.logging.max_files, 4);
  EXPECT_FALSE(config.logging.rotate_at_midnight);

  std::string error;
  EXPECT_TRUE(ConfigParser::validate(config, error)) << error;
}

TEST_F(ConfigParserTest, PartialSectionKeepsOtherDefaults) {
  const std::string yaml = R"(
upload:
  max_concurrent_chunks: 1
)";

  ConfigParser parser;
  UploaderConfig config;
  ASSERT_TRUE(parser.load_from_string(yaml, config));
  EXPECT_EQ(config.upload.max_concurrent_chunks, 1);
  EXPECT_EQ(config.upload.chunk_size_bytes, 5ULL * 1024 * 1024);
  EXPECT_EQ(config.retry.max_retries, 3);
}

TEST_F(ConfigParserTest, LoadFromFile) {
  auto path = write_test_file("config.yaml", R"(
server:
  base_url: http://10.0.0.5:8080
monitor:
  max_attempts: 3
)");

  ConfigParser parser;
  UploaderConfig config;
  ASSERT_TRUE(parser.load_from_file(path, config)) << parser.get_last_error();
  EXPECT_EQ(config.server.base_url, "http://10.0.0.5:8080");
  EXPECT_EQ(config.monitor.max_attempts, 3);
}

// ============================================================================
// Error Handling Tests
// ============================================================================

TEST_F(ConfigParserTest, MissingFileFails) {
  ConfigParser parser;
  UploaderConfig config;
  EXPECT_FALSE(parser.load_from_file((test_dir_ / "missing.yaml").string(), config));
  EXPECT_NE(parser.get_last_error().find("not found"), std::string::npos);
}

TEST_F(ConfigParserTest, MalformedYamlFails) {
  ConfigParser parser;
  UploaderConfig config;
  EXPECT_FALSE(parser.load_from_string("server: [unclosed", config));
  EXPECT_FALSE(parser.get_last_error().empty());
}

TEST_F(ConfigParserTest, NonMappingRootFails) {
  ConfigParser parser;
  UploaderConfig config;
  EXPECT_FALSE(parser.load_from_string("- a\n- b\n", config));
  EXPECT_NE(parser.get_last_error().find("mapping"), std::string::npos);
}

TEST_F(ConfigParserTest, SectionMustBeMapping) {
  ConfigParser parser;
  UploaderConfig config;
  EXPECT_FALSE(parser.load_from_string("retry: 5\n", config));
  EXPECT_NE(parser.get_last_error().find("retry"), std::string::npos);
}

TEST_F(ConfigParserTest, WrongValueTypeFails) {
  ConfigParser parser;
  UploaderConfig config;
  EXPECT_FALSE(parser.load_from_string("upload:\n  max_concurrent_chunks: many\n", config));
  EXPECT_FALSE(parser.get_last_error().empty());
}

TEST_F(ConfigParserTest, NonPositiveChunkSizeRejected) {
  ConfigParser parser;
  UploaderConfig config;
  EXPECT_FALSE(parser.load_from_string("upload:\n  chunk_size_bytes: 0\n", config));
  EXPECT_FALSE(parser.load_from_string("upload:\n  chunk_size_bytes: -10\n", config));
  EXPECT_NE(parser.get_last_error().find("chunk_size_bytes"), std::string::npos);
}

// ============================================================================
// Validation Tests
// ============================================================================

TEST_F(ConfigParserTest, ValidateRejectsNonHttpUrl) {
  UploaderConfig config;
  std::string error;

  config.server.base_url = "ftp://example.com";
  EXPECT_FALSE(ConfigParser::validate(config, error));
  EXPECT_NE(error.find("base_url"), std::string::npos);

  config.server.base_url = "https://example.com";
  EXPECT_FALSE(ConfigParser::validate(config, error));
}

TEST_F(ConfigParserTest, ValidateRejectsBadTransferSettings) {
  std::string error;

  UploaderConfig zero_concurrency;
  zero_concurrency.upload.max_concurrent_chunks = 0;
  EXPECT_FALSE(ConfigParser::validate(zero_concurrency, error));
  EXPECT_NE(error.find("max_concurrent_chunks"), std::string::npos);

  UploaderConfig zero_timeout;
  zero_timeout.server.request_timeout_ms = 0;
  EXPECT_FALSE(ConfigParser::validate(zero_timeout, error));
}

TEST_F(ConfigParserTest, ValidateRejectsBadRetrySettings) {
  std::string error;

  UploaderConfig negative_retries;
  negative_retries.retry.max_retries = -1;
  EXPECT_FALSE(ConfigParser::validate(negative_retries, error));

  UploaderConfig small_base;
  small_base.retry.exponential_base = 0.5;
  EXPECT_FALSE(ConfigParser::validate(small_base, error));

  UploaderConfig full_jitter;
  full_jitter.retry.jitter_factor = 1.0;
  EXPECT_FALSE(ConfigParser::validate(full_jitter, error));

  UploaderConfig negative_delay;
  negative_delay.retry.initial_delay_ms = -5;
  EXPECT_FALSE(ConfigParser::validate(negative_delay, error));
}

TEST_F(ConfigParserTest, ValidateRejectsBadMonitorAndLogging) {
  std::string error;

  UploaderConfig no_attempts;
  no_attempts.monitor.max_attempts = 0;
  EXPECT_FALSE(ConfigParser::validate(no_attempts, error));

  UploaderConfig bad_format;
  bad_format.logging.file_format = "xml";
  EXPECT_FALSE(ConfigParser::validate(bad_format, error));
  EXPECT_NE(error.find("format"), std::string::npos);
}

// ============================================================================
// Environment Overrides
// ============================================================================

TEST_F(ConfigParserTest, EnvOverridesBaseUrl) {
  UploaderConfig config;
  setenv("VIDUP_BASE_URL", "http://override:1234", 1);
  ConfigParser::apply_env_overrides(config);
  EXPECT_EQ(config.server.base_url, "http://override:1234");
}

TEST_F(ConfigParserTest, EmptyEnvValueIgnored) {
  UploaderConfig config;
  setenv("VIDUP_BASE_URL", "", 1);
  ConfigParser::apply_env_overrides(config);
  EXPECT_EQ(config.server.base_url, "http://localhost:8080");
}

// ============================================================================
// Conversion Tests
// ============================================================================

TEST_F(ConfigParserTest, ConvertLoggingConfig) {
  LoggingConfig yaml_config;
  yaml_config.console_level = "error";
  yaml_config.file_enabled = true;
  yaml_config.file_level = "WARN";
  yaml_config.file_format = "json";
  yaml_config.file_directory = "/tmp/vidup_logs";
  yaml_config.max_files = 7;

  vidup::logging::LoggingConfig log_config;
  convert_logging_config(yaml_config, log_config);

  EXPECT_EQ(log_config.console_level, vidup::logging::severity_level::error);
  EXPECT_TRUE(log_config.file_enabled);
  EXPECT_EQ(log_config.file_level, vidup::logging::severity_level::warn);
  EXPECT_TRUE(log_config.file_config.format_json);
  EXPECT_EQ(log_config.file_config.directory, "/tmp/vidup_logs");
  EXPECT_EQ(log_config.file_config.max_files, 7);
}

TEST_F(ConfigParserTest, ConvertLoggingConfigKeepsDefaultOnUnknownLevel) {
  LoggingConfig yaml_config;
  yaml_config.console_level = "chatty";

  vidup::logging::LoggingConfig log_config;
  convert_logging_config(yaml_config, log_config);
  EXPECT_EQ(log_config.console_level, vidup::logging::severity_level::info);
}

TEST_F(ConfigParserTest, ConvertToEngineConfigs) {
  UploaderConfig config;
  config.server.base_url = "http://svc:81";
  config.server.request_timeout_ms = 1500;
  config.upload.chunk_size_bytes = 4096;
  config.upload.max_concurrent_chunks = 2;
  config.retry.max_retries = 1;
  config.retry.initial_delay_ms = 10;
  config.retry.max_delay_ms = 100;
  config.monitor.max_attempts = 4;
  config.monitor.interval_sec = 3;
  config.monitor.error_delay_sec = 2;

  auto http = to_http_config(config);
  EXPECT_EQ(http.base_url, "http://svc:81");
  EXPECT_EQ(http.request_timeout, std::chrono::milliseconds(1500));

  auto session = to_session_config(config);
  EXPECT_EQ(session.chunk_size, 4096u);
  EXPECT_EQ(session.max_concurrent_chunks, 2u);
  EXPECT_EQ(session.retry.max_retries, 1);
  EXPECT_EQ(session.retry.initial_delay, std::chrono::milliseconds(10));
  EXPECT_EQ(session.retry.max_delay, std::chrono::milliseconds(100));

  auto monitor = to_monitor_config(config);
  EXPECT_EQ(monitor.max_attempts, 4);
  EXPECT_EQ(monitor.interval, std::chrono::milliseconds(3000));
  EXPECT_EQ(monitor.error_delay, std::chrono::milliseconds(2000));
}
