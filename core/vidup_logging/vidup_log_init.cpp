// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "vidup_log_init.hpp"

#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <functional>
#include <mutex>
#include <vector>

#include "vidup_log_macros.hpp"

namespace vidup {
namespace logging {

namespace {

struct SinkRegistry {
  std::mutex mutex;
  bool initialized = false;
  boost::shared_ptr<async_console_sink_t> console;
  boost::shared_ptr<async_file_sink_t> file;
  std::vector<boost::shared_ptr<boost::log::sinks::sink>> attached;
};

SinkRegistry& registry() {
  static SinkRegistry instance;
  return instance;
}

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::optional<bool> parse_flag(const std::string& value) {
  static const char* const kTrue[] = {"true", "1", "yes", "on"};
  static const char* const kFalse[] = {"false", "0", "no", "off"};

  const std::string lower = lowercase(value);
  for (const char* word : kTrue) {
    if (lower == word) {
      return true;
    }
  }
  for (const char* word : kFalse) {
    if (lower == word) {
      return false;
    }
  }
  return std::nullopt;
}

struct EnvOverride {
  const char* name;
  std::function<void(LoggingConfig&, const std::string&)> apply;
};

// Applied in order, so the per-sink levels override VIDUP_LOG_LEVEL
const std::vector<EnvOverride>& env_overrides() {
  static const std::vector<EnvOverride> kOverrides = {
    {"VIDUP_LOG_LEVEL",
     [](LoggingConfig& c, const std::string& v) {
       if (auto level = parse_severity_level(v)) {
         c.console_level = *level;
         c.file_level = *level;
       }
     }},
    {"VIDUP_LOG_CONSOLE_LEVEL",
     [](LoggingConfig& c, const std::string& v) {
       c.console_level = parse_severity_level(v).value_or(c.console_level);
     }},
    {"VIDUP_LOG_CONSOLE_ENABLED",
     [](LoggingConfig& c, const std::string& v) {
       c.console_enabled = parse_flag(v).value_or(c.console_enabled);
     }},
    {"VIDUP_LOG_FILE_LEVEL",
     [](LoggingConfig& c, const std::string& v) {
       c.file_level = parse_severity_level(v).value_or(c.file_level);
     }},
    {"VIDUP_LOG_FILE_ENABLED",
     [](LoggingConfig& c, const std::string& v) {
       c.file_enabled = parse_flag(v).value_or(c.file_enabled);
     }},
    {"VIDUP_LOG_FILE_DIR",
     [](LoggingConfig& c, const std::string& v) {
       c.file_config.directory = v;
     }},
    {"VIDUP_LOG_FORMAT",
     [](LoggingConfig& c, const std::string& v) {
       c.file_config.format_json = lowercase(v) == "json";
     }},
  };
  return kOverrides;
}

void attach(SinkRegistry& reg, boost::shared_ptr<boost::log::sinks::sink> sink) {
  boost::log::core::get()->add_sink(sink);
  reg.attached.push_back(std::move(sink));
}

}  // namespace

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  const std::string lower = lowercase(level_str);
  if (lower == "warning") {
    return severity_level::warn;
  }
  for (std::size_t i = 0; i < kSeverityCount; ++i) {
    if (lower == lowercase(kSeverityNames[i])) {
      return static_cast<severity_level>(i);
    }
  }
  return std::nullopt;
}

void apply_env_overrides(LoggingConfig& config) {
  for (const auto& override_entry : env_overrides()) {
    const char* value = std::getenv(override_entry.name);
    if (value && *value != '\0') {
      override_entry.apply(config, value);
    }
  }
}

logger_type& get_logger() {
  static logger_type instance;
  return instance;
}

LogContext capture_log_context() {
  return boost::log::core::get()->get_thread_attributes();
}

ScopedLogContext::ScopedLogContext(const LogContext& context)
    : previous_(boost::log::core::get()->get_thread_attributes()) {
  boost::log::core::get()->set_thread_attributes(context);
}

ScopedLogContext::~ScopedLogContext() {
  boost::log::core::get()->set_thread_attributes(previous_);
}

void init_logging(const LoggingConfig& config) {
  auto& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  if (reg.initialized) {
    return;
  }

  // TimeStamp, ThreadID, ...
  boost::log::add_common_attributes();

  if (config.console_enabled) {
    reg.console = create_console_sink(config.console_level, config.console_colors);
    attach(reg, reg.console);
  }
  if (config.file_enabled) {
    reg.file = create_file_sink(config.file_config, config.file_level);
    attach(reg, reg.file);
  }

  reg.initialized = true;
}

void init_logging_default() {
  init_logging(LoggingConfig());
}

void shutdown_logging() {
  auto& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  if (!reg.initialized) {
    return;
  }

  // stop() drains the async queue before the feeding thread exits
  if (reg.console) {
    reg.console->stop();
    reg.console->flush();
  }
  if (reg.file) {
    reg.file->stop();
    reg.file->flush();
  }

  auto core = boost::log::core::get();
  for (auto& sink : reg.attached) {
    core->remove_sink(sink);
  }
  reg.attached.clear();
  reg.console.reset();
  reg.file.reset();
  reg.initialized = false;
}

void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink) {
  auto& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  attach(reg, std::move(sink));
}

void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink) {
  auto& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  boost::log::core::get()->remove_sink(sink);
  reg.attached.erase(
    std::remove(reg.attached.begin(), reg.attached.end(), sink), reg.attached.end()
  );
}

void flush_logging() {
  auto& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  if (reg.console) {
    reg.console->flush();
  }
  if (reg.file) {
    reg.file->flush();
  }
}

void reconfigure_logging(const LoggingConfig& config) {
  LoggingConfig effective = config;
  apply_env_overrides(effective);
  shutdown_logging();
  init_logging(effective);
}

bool is_logging_initialized() {
  auto& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  return reg.initialized;
}

}  // namespace logging
}  // namespace vidup
