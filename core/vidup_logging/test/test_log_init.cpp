// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_log_init.cpp
 * @brief Unit tests for logging initialization and configuration
 */

#include <gtest/gtest.h>

#include <cstdlib>
#include <sstream>
#include <string>

#include "vidup_log_init.hpp"
#include "vidup_log_macros.hpp"
#include "vidup_log_severity.hpp"

using namespace vidup::logging;

namespace {

void clear_log_env() {
  unsetenv("VIDUP_LOG_LEVEL");
  unsetenv("VIDUP_LOG_CONSOLE_LEVEL");
  unsetenv("VIDUP_LOG_FILE_LEVEL");
  unsetenv("VIDUP_LOG_FILE_DIR");
  unsetenv("VIDUP_LOG_FORMAT");
  unsetenv("VIDUP_LOG_FILE_ENABLED");
  unsetenv("VIDUP_LOG_CONSOLE_ENABLED");
}

}  // namespace

// ============================================================================
// Severity Level Tests
// ============================================================================

TEST(SeverityLevelTest, ParseValidLevels) {
  EXPECT_EQ(parse_severity_level("debug"), severity_level::debug);
  EXPECT_EQ(parse_severity_level("info"), severity_level::info);
  EXPECT_EQ(parse_severity_level("warn"), severity_level::warn);
  EXPECT_EQ(parse_severity_level("warning"), severity_level::warn);
  EXPECT_EQ(parse_severity_level("error"), severity_level::error);
  EXPECT_EQ(parse_severity_level("fatal"), severity_level::fatal);
}

TEST(SeverityLevelTest, ParseCaseInsensitive) {
  EXPECT_EQ(parse_severity_level("DEBUG"), severity_level::debug);
  EXPECT_EQ(parse_severity_level("Warn"), severity_level::warn);
}

TEST(SeverityLevelTest, ParseInvalidLevels) {
  EXPECT_FALSE(parse_severity_level("").has_value());
  EXPECT_FALSE(parse_severity_level("verbose").has_value());
  EXPECT_FALSE(parse_severity_level("info ").has_value());
}

TEST(SeverityLevelTest, OutputStream) {
  std::ostringstream oss;
  oss << severity_level::warn << " " << severity_level::fatal;
  EXPECT_EQ(oss.str(), "WARN FATAL");
}

TEST(SeverityLevelTest, OutputStreamOutOfRange) {
  std::ostringstream oss;
  oss << static_cast<severity_level>(42);
  EXPECT_EQ(oss.str(), "42");
}

// ============================================================================
// Environment Override Tests
// ============================================================================

class LoggingConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    clear_log_env();
  }

  void TearDown() override {
    clear_log_env();
  }
};

TEST_F(LoggingConfigTest, DefaultConfigValues) {
  LoggingConfig config;

  EXPECT_TRUE(config.console_enabled);
  EXPECT_TRUE(config.console_colors);
  EXPECT_EQ(config.console_level, severity_level::info);
  EXPECT_FALSE(config.file_enabled);
  EXPECT_EQ(config.file_level, severity_level::debug);
  EXPECT_EQ(config.file_config.directory, "/tmp/vidup");
  EXPECT_FALSE(config.file_config.format_json);
}

TEST_F(LoggingConfigTest, GlobalLevelAppliesToBothSinks) {
  LoggingConfig config;
  setenv("VIDUP_LOG_LEVEL", "warn", 1);

  apply_env_overrides(config);

  EXPECT_EQ(config.console_level, severity_level::warn);
  EXPECT_EQ(config.file_level, severity_level::warn);
}

TEST_F(LoggingConfigTest, SpecificLevelsWinOverGlobal) {
  LoggingConfig config;
  setenv("VIDUP_LOG_LEVEL", "warn", 1);
  setenv("VIDUP_LOG_CONSOLE_LEVEL", "error", 1);
  setenv("VIDUP_LOG_FILE_LEVEL", "debug", 1);

  apply_env_overrides(config);

  EXPECT_EQ(config.console_level, severity_level::error);
  EXPECT_EQ(config.file_level, severity_level::debug);
}

TEST_F(LoggingConfigTest, FileDirectoryAndFormat) {
  LoggingConfig config;
  setenv("VIDUP_LOG_FILE_DIR", "/tmp/vidup_test_logs", 1);
  setenv("VIDUP_LOG_FORMAT", "JSON", 1);

  apply_env_overrides(config);

  EXPECT_EQ(config.file_config.directory, "/tmp/vidup_test_logs");
  EXPECT_TRUE(config.file_config.format_json);

  setenv("VIDUP_LOG_FORMAT", "text", 1);
  apply_env_overrides(config);
  EXPECT_FALSE(config.file_config.format_json);
}

TEST_F(LoggingConfigTest, EnableDisableVariants) {
  LoggingConfig config;

  setenv("VIDUP_LOG_FILE_ENABLED", "yes", 1);
  setenv("VIDUP_LOG_CONSOLE_ENABLED", "off", 1);
  apply_env_overrides(config);
  EXPECT_TRUE(config.file_enabled);
  EXPECT_FALSE(config.console_enabled);

  setenv("VIDUP_LOG_FILE_ENABLED", "maybe", 1);
  apply_env_overrides(config);
  EXPECT_TRUE(config.file_enabled);  // Invalid value keeps current setting
}

TEST_F(LoggingConfigTest, InvalidLevelKeepsDefault) {
  LoggingConfig config;
  setenv("VIDUP_LOG_LEVEL", "loud", 1);

  apply_env_overrides(config);

  EXPECT_EQ(config.console_level, severity_level::info);
  EXPECT_EQ(config.file_level, severity_level::debug);
}

TEST_F(LoggingConfigTest, EmptyEnvVarIgnored) {
  LoggingConfig config;
  setenv("VIDUP_LOG_FILE_DIR", "", 1);

  apply_env_overrides(config);

  EXPECT_EQ(config.file_config.directory, "/tmp/vidup");
}

// ============================================================================
// Init / Shutdown Tests
// ============================================================================

class LoggingInitTest : public ::testing::Test {
protected:
  void SetUp() override {
    clear_log_env();
    if (is_logging_initialized()) {
      shutdown_logging();
    }
  }

  void TearDown() override {
    if (is_logging_initialized()) {
      shutdown_logging();
    }
  }
};

TEST_F(LoggingInitTest, InitDefault) {
  EXPECT_FALSE(is_logging_initialized());
  init_logging_default();
  EXPECT_TRUE(is_logging_initialized());
}

TEST_F(LoggingInitTest, ShutdownWhenNotInitialized) {
  EXPECT_NO_THROW(shutdown_logging());
  EXPECT_FALSE(is_logging_initialized());
}

TEST_F(LoggingInitTest, DoubleInitIsIdempotent) {
  init_logging_default();
  init_logging_default();
  EXPECT_TRUE(is_logging_initialized());

  shutdown_logging();
  EXPECT_FALSE(is_logging_initialized());
}

TEST_F(LoggingInitTest, Reconfigure) {
  LoggingConfig config;
  config.console_level = severity_level::info;
  init_logging(config);

  config.console_level = severity_level::debug;
  reconfigure_logging(config);

  EXPECT_TRUE(is_logging_initialized());
}

TEST_F(LoggingInitTest, MacrosWithScopedUpload) {
  LoggingConfig config;
  config.console_colors = false;
  init_logging(config);

  EXPECT_NO_THROW({
    VIDUP_LOG_SCOPED_UPLOAD("upload-123");
    VIDUP_LOG_INFO("chunk uploaded" << kv("chunk", 4) << kv("movie", std::string("m-1")));
    VIDUP_LOG_WARN_THROTTLE(1.0, "throttled" << kv("name", "value"));
  });
  EXPECT_NO_THROW(flush_logging());
}

TEST(KvTest, QuotesStrings) {
  EXPECT_EQ(kv("count", 3), " count=3");
  EXPECT_EQ(kv("name", std::string("a b")), " name=\"a b\"");
  EXPECT_EQ(kv("name", "x"), " name=\"x\"");
}
