// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PORTER_CONSOLE_SINK_HPP
#define PORTER_CONSOLE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include "porter_log_severity.hpp"

namespace porter {
namespace logging {

/**
 * Asynchronous console sink. The queue holds at most 1000 records and
 * drops new ones when full, so transfer workers never block on stderr.
 */
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_ostream_backend,
  boost::log::sinks::bounded_fifo_queue<1000, boost::log::sinks::drop_on_overflow>>
  async_console_sink_t;

/**
 * ANSI color escape for a severity level, empty for unknown levels.
 */
const char* severity_color(severity_level level);

/**
 * Create the console sink writing to std::clog.
 *
 * @param min_level Records below this level are filtered out
 * @param use_colors Wrap the severity tag in ANSI colors
 */
boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level = severity_level::info, bool use_colors = true
);

}  // namespace logging
}  // namespace porter

#endif  // PORTER_CONSOLE_SINK_HPP
