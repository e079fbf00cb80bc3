// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIDUP_LOG_MACROS_HPP
#define VIDUP_LOG_MACROS_HPP

#include <boost/log/attributes/attribute_set.hpp>
#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <sstream>
#include <string>

#include "vidup_log_severity.hpp"

namespace vidup {
namespace logging {

typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

logger_type& get_logger();

/**
 * Key-value field appended to a message. Strings are quoted.
 * Usage: VIDUP_LOG_INFO("chunk uploaded" << kv("chunk", index));
 */
template <typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

template <>
inline std::string kv(const char* name, const std::string& value) {
  return std::string(" ") + name + "=\"" + value + "\"";
}

inline std::string kv(const char* name, const char* value) {
  return std::string(" ") + name + "=\"" + value + "\"";
}

/**
 * Scoped log attributes (upload id, chunk) of the calling thread.
 *
 * Chunk workers run on their own threads, which start with an empty context;
 * capture on the dispatching thread and install with ScopedLogContext so worker
 * records stay tagged with the upload they belong to.
 *
 * Install a ScopedLogContext before opening any scoped attribute on that
 * thread: it replaces the thread's attribute set, which invalidates guards
 * created earlier.
 */
using LogContext = boost::log::attribute_set;

LogContext capture_log_context();

class ScopedLogContext {
public:
  explicit ScopedLogContext(const LogContext& context);
  ~ScopedLogContext();

  ScopedLogContext(const ScopedLogContext&) = delete;
  ScopedLogContext& operator=(const ScopedLogContext&) = delete;

private:
  LogContext previous_;
};

}  // namespace logging
}  // namespace vidup

// Define VIDUP_LOG_COMPONENT before including this header:
//
//   #define VIDUP_LOG_COMPONENT "upload_session"
//   #include <vidup_log_macros.hpp>
#ifndef VIDUP_LOG_COMPONENT
#define VIDUP_LOG_COMPONENT "vidup"
#endif

// DEBUG records are compiled out of release builds
#ifdef NDEBUG
#define VIDUP_LOG_ENABLE_DEBUG 0
#else
#define VIDUP_LOG_ENABLE_DEBUG 1
#endif

#define VIDUP_LOG_IMPL(level, msg) \
  BOOST_LOG_SEV(::vidup::logging::get_logger(), ::vidup::logging::severity_level::level) \
    << ::boost::log::add_value("Component", VIDUP_LOG_COMPONENT) << msg

#define VIDUP_LOG_DEBUG(msg) \
  do { \
    if (VIDUP_LOG_ENABLE_DEBUG) { \
      VIDUP_LOG_IMPL(debug, msg); \
    } \
  } while (0)

#define VIDUP_LOG_INFO(msg) \
  do { \
    VIDUP_LOG_IMPL(info, msg); \
  } while (0)

#define VIDUP_LOG_WARN(msg) \
  do { \
    VIDUP_LOG_IMPL(warn, msg); \
  } while (0)

#define VIDUP_LOG_ERROR(msg) \
  do { \
    VIDUP_LOG_IMPL(error, msg); \
  } while (0)

#define VIDUP_LOG_FATAL(msg) \
  do { \
    VIDUP_LOG_IMPL(fatal, msg); \
  } while (0)

// Tag records of the current thread until the scope exits
#define VIDUP_LOG_SCOPED_UPLOAD(upload_id_val) \
  BOOST_LOG_SCOPED_THREAD_ATTR( \
    "UploadID", ::boost::log::attributes::constant<std::string>(upload_id_val) \
  )

#define VIDUP_LOG_SCOPED_CHUNK(chunk_index_val) \
  BOOST_LOG_SCOPED_THREAD_ATTR( \
    "Chunk", \
    ::boost::log::attributes::constant<uint64_t>(static_cast<uint64_t>(chunk_index_val)) \
  )

// At most one record per interval (seconds) per call site.
// Usage: VIDUP_LOG_INFO_THROTTLE(5.0, "progress" << kv("percent", pct));
#define VIDUP_LOG_THROTTLE_IMPL(level_macro, interval_sec, msg) \
  do { \
    static std::chrono::steady_clock::time_point _vidup_last_log_time{}; \
    static std::mutex _vidup_throttle_mutex; \
    bool _vidup_should_log = false; \
    { \
      std::lock_guard<std::mutex> _vidup_lock(_vidup_throttle_mutex); \
      auto _vidup_now = std::chrono::steady_clock::now(); \
      if (_vidup_now - _vidup_last_log_time >= std::chrono::duration<double>(interval_sec)) { \
        _vidup_last_log_time = _vidup_now; \
        _vidup_should_log = true; \
      } \
    } \
    if (_vidup_should_log) { \
      level_macro(msg); \
    } \
  } while (0)

#define VIDUP_LOG_INFO_THROTTLE(interval_sec, msg) \
  VIDUP_LOG_THROTTLE_IMPL(VIDUP_LOG_INFO, interval_sec, msg)
#define VIDUP_LOG_WARN_THROTTLE(interval_sec, msg) \
  VIDUP_LOG_THROTTLE_IMPL(VIDUP_LOG_WARN, interval_sec, msg)

#endif  // VIDUP_LOG_MACROS_HPP
