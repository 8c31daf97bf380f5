// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PORTER_LOG_MACROS_HPP
#define PORTER_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <sstream>
#include <string>

#include "porter_log_severity.hpp"

namespace porter {
namespace logging {

typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Process-wide logger. Defined in porter_log_init.cpp.
 */
logger_type& get_logger();

/**
 * Key-value fragment for structured messages.
 * Usage: PORTER_LOG_INFO("uploaded" << kv("key", key) << kv("bytes", n));
 */
template <typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

template <>
inline std::string kv(const char* name, const std::string& value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

inline std::string kv(const char* name, const char* value) {
  return kv(name, std::string(value ? value : ""));
}

}  // namespace logging
}  // namespace porter

// Each translation unit defines PORTER_LOG_COMPONENT before including this header.
#ifndef PORTER_LOG_COMPONENT
#define PORTER_LOG_COMPONENT "porter"
#endif

#ifdef NDEBUG
#define PORTER_LOG_ENABLE_DEBUG 0
#else
#define PORTER_LOG_ENABLE_DEBUG 1
#endif

#define PORTER_LOG_SEV_(level, msg)                                                        \
  do {                                                                                     \
    BOOST_LOG_SEV(::porter::logging::get_logger(), ::porter::logging::severity_level::level) \
      << "[" << PORTER_LOG_COMPONENT << "] " << msg;                                       \
  } while (0)

#define PORTER_LOG_DEBUG(msg)      \
  do {                             \
    if (PORTER_LOG_ENABLE_DEBUG) { \
      PORTER_LOG_SEV_(debug, msg); \
    }                              \
  } while (0)

#define PORTER_LOG_INFO(msg) PORTER_LOG_SEV_(info, msg)
#define PORTER_LOG_WARN(msg) PORTER_LOG_SEV_(warn, msg)
#define PORTER_LOG_ERROR(msg) PORTER_LOG_SEV_(error, msg)

// Attaches the operation name and object key to every record emitted in the
// enclosing scope on this thread. At most one use per scope.
#define PORTER_LOG_SCOPED_CONTEXT(operation_val, key_val)                                 \
  ::boost::log::scoped_attribute _porter_log_ctx_operation =                              \
    ::boost::log::add_scoped_thread_attribute(                                            \
      "Operation", ::boost::log::attributes::constant<std::string>(operation_val)         \
    );                                                                                    \
  ::boost::log::scoped_attribute _porter_log_ctx_key =                                    \
    ::boost::log::add_scoped_thread_attribute(                                            \
      "ObjectKey", ::boost::log::attributes::constant<std::string>(key_val)               \
    )

// Logs at most once per interval_sec at the call site.
#define PORTER_LOG_THROTTLE_(level_macro, interval_sec, msg)                                   \
  do {                                                                                        \
    static std::chrono::steady_clock::time_point _porter_last_log_time{};                     \
    static std::mutex _porter_throttle_mutex;                                                 \
    static bool _porter_logged_once = false;                                                  \
    const auto _porter_now = std::chrono::steady_clock::now();                                \
    bool _porter_should_log = false;                                                          \
    {                                                                                         \
      std::lock_guard<std::mutex> _porter_lock(_porter_throttle_mutex);                       \
      if (!_porter_logged_once ||                                                             \
          _porter_now - _porter_last_log_time >= std::chrono::duration<double>(interval_sec)) { \
        _porter_logged_once = true;                                                           \
        _porter_last_log_time = _porter_now;                                                  \
        _porter_should_log = true;                                                            \
      }                                                                                       \
    }                                                                                         \
    if (_porter_should_log) {                                                                 \
      level_macro(msg);                                                                       \
    }                                                                                         \
  } while (0)

#define PORTER_LOG_DEBUG_THROTTLE(interval_sec, msg) \
  PORTER_LOG_THROTTLE_(PORTER_LOG_DEBUG, interval_sec, msg)
#define PORTER_LOG_INFO_THROTTLE(interval_sec, msg) \
  PORTER_LOG_THROTTLE_(PORTER_LOG_INFO, interval_sec, msg)
#define PORTER_LOG_WARN_THROTTLE(interval_sec, msg) \
  PORTER_LOG_THROTTLE_(PORTER_LOG_WARN, interval_sec, msg)
#define PORTER_LOG_ERROR_THROTTLE(interval_sec, msg) \
  PORTER_LOG_THROTTLE_(PORTER_LOG_ERROR, interval_sec, msg)

#endif  // PORTER_LOG_MACROS_HPP
