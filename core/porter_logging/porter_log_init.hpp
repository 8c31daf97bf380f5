// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PORTER_LOG_INIT_HPP
#define PORTER_LOG_INIT_HPP

#include <boost/log/sinks/sink.hpp>

#include <optional>
#include <string>

#include "porter_console_sink.hpp"
#include "porter_file_sink.hpp"
#include "porter_log_severity.hpp"

namespace porter {
namespace logging {

/**
 * Console and file sink settings for porter binaries.
 */
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
 *
 * @return The level, or std::nullopt for anything else
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Apply PORTER_LOG_* environment overrides in place.
 *
 *   PORTER_LOG_LEVEL           - both sinks
 *   PORTER_LOG_CONSOLE_LEVEL   - console sink
 *   PORTER_LOG_FILE_LEVEL      - file sink
 *   PORTER_LOG_FILE_DIR        - file sink directory
 *   PORTER_LOG_FORMAT          - "json" or "text"
 *   PORTER_LOG_FILE_ENABLED    - true/false
 *   PORTER_LOG_CONSOLE_ENABLED - true/false
 *
 * Unparseable values are ignored.
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Install the configured sinks. Calling it again without shutdown is a no-op.
 */
void init_logging(const LoggingConfig& config);

/**
 * Console at INFO with colors, no file sink.
 */
void init_logging_default();

/**
 * Stop the async sinks, drain their queues and detach every sink.
 */
void shutdown_logging();

/**
 * Attach an extra sink. It is detached again by shutdown_logging().
 */
void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink);

void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink);

void flush_logging();

/**
 * Shut down and re-initialize with env overrides applied on top of config.
 */
void reconfigure_logging(const LoggingConfig& config);

bool is_logging_initialized();

}  // namespace logging
}  // namespace porter

#endif  // PORTER_LOG_INIT_HPP
