// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef DIRPUSH_LOG_MACROS_HPP
#define DIRPUSH_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <chrono>
#include <mutex>
#include <sstream>
#include <string>

#include "dirpush_log_severity.hpp"

namespace dirpush {
namespace logging {

// Thread-safe severity logger shared by every component
typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Get the process-wide logger instance.
 * Defined in dirpush_log_init.cpp
 */
logger_type& get_logger();

/**
 * Key-value formatter for structured log lines.
 * Usage: DIRPUSH_LOG_INFO("Uploaded" << kv("key", object_key));
 */
template<typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

template<>
inline std::string kv(const char* name, const std::string& value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

inline std::string kv(const char* name, const char* value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

}  // namespace logging
}  // namespace dirpush

// =============================================================================
// Component identification
// Define DIRPUSH_LOG_COMPONENT before including this header:
//
//   #define DIRPUSH_LOG_COMPONENT "upload_engine"
//   #include <dirpush_log_macros.hpp>
// =============================================================================
#ifndef DIRPUSH_LOG_COMPONENT
#define DIRPUSH_LOG_COMPONENT "dirpush"
#endif

// DEBUG records are compiled out of release builds
#ifdef NDEBUG
#define DIRPUSH_LOG_ENABLE_DEBUG 0
#else
#define DIRPUSH_LOG_ENABLE_DEBUG 1
#endif

#define DIRPUSH_LOG_SEV_IMPL(level, msg) \
  do { \
    BOOST_LOG_SEV(::dirpush::logging::get_logger(), ::dirpush::logging::severity_level::level) \
      << "[" << DIRPUSH_LOG_COMPONENT << "] " << msg; \
  } while (0)

#define DIRPUSH_LOG_DEBUG(msg) \
  do { \
    if (DIRPUSH_LOG_ENABLE_DEBUG) { \
      DIRPUSH_LOG_SEV_IMPL(debug, msg); \
    } \
  } while (0)

#define DIRPUSH_LOG_INFO(msg) DIRPUSH_LOG_SEV_IMPL(info, msg)
#define DIRPUSH_LOG_WARN(msg) DIRPUSH_LOG_SEV_IMPL(warn, msg)
#define DIRPUSH_LOG_ERROR(msg) DIRPUSH_LOG_SEV_IMPL(error, msg)
#define DIRPUSH_LOG_FATAL(msg) DIRPUSH_LOG_SEV_IMPL(fatal, msg)

// =============================================================================
// Per-thread transfer context, cleared when the scope exits.
// Usage: DIRPUSH_LOG_SCOPED_CONTEXT(worker_id, item.remote_key);
// =============================================================================
#define DIRPUSH_LOG_SCOPED_CONTEXT(worker_id_val, object_key_val) \
  ::boost::log::scoped_attribute _dirpush_worker_attr = \
    ::boost::log::add_scoped_thread_attribute( \
      "WorkerID", ::boost::log::attributes::constant<int>(worker_id_val) \
    ); \
  ::boost::log::scoped_attribute _dirpush_object_key_attr = \
    ::boost::log::add_scoped_thread_attribute( \
      "ObjectKey", ::boost::log::attributes::constant<std::string>(object_key_val) \
    )

// =============================================================================
// Time-based throttling: log at most once per interval (seconds) per call site.
// Usage: DIRPUSH_LOG_INFO_THROTTLE(2.0, "Progress" << kv("bytes", sent));
// =============================================================================
#define DIRPUSH_LOG_THROTTLE_IMPL(LOG_MACRO, interval_sec, msg) \
  do { \
    static std::chrono::steady_clock::time_point _dirpush_last_log_time{}; \
    static std::mutex _dirpush_throttle_mutex; \
    auto _dirpush_now = std::chrono::steady_clock::now(); \
    bool _dirpush_should_log = false; \
    { \
      std::lock_guard<std::mutex> _dirpush_lock(_dirpush_throttle_mutex); \
      if (_dirpush_now - _dirpush_last_log_time >= \
          std::chrono::duration<double>(interval_sec)) { \
        _dirpush_last_log_time = _dirpush_now; \
        _dirpush_should_log = true; \
      } \
    } \
    if (_dirpush_should_log) { \
      LOG_MACRO(msg); \
    } \
  } while (0)

#define DIRPUSH_LOG_DEBUG_THROTTLE(interval_sec, msg) \
  DIRPUSH_LOG_THROTTLE_IMPL(DIRPUSH_LOG_DEBUG, interval_sec, msg)
#define DIRPUSH_LOG_INFO_THROTTLE(interval_sec, msg) \
  DIRPUSH_LOG_THROTTLE_IMPL(DIRPUSH_LOG_INFO, interval_sec, msg)
#define DIRPUSH_LOG_WARN_THROTTLE(interval_sec, msg) \
  DIRPUSH_LOG_THROTTLE_IMPL(DIRPUSH_LOG_WARN, interval_sec, msg)

#endif  // DIRPUSH_LOG_MACROS_HPP
