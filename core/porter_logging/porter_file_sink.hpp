// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PORTER_FILE_SINK_HPP
#define PORTER_FILE_SINK_HPP

#include <boost/log/core/record_view.hpp>
#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/formatting_ostream.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <cstdint>
#include <string>

#include "porter_log_severity.hpp"

namespace porter {
namespace logging {

/**
 * Asynchronous rotating file sink. The queue is larger than the console
 * queue since disk writes are slower.
 */
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_file_backend,
  boost::log::sinks::bounded_fifo_queue<5000, boost::log::sinks::drop_on_overflow>>
  async_file_sink_t;

/**
 * File sink settings.
 */
struct FileSinkConfig {
  std::string directory = "/var/log/porter";
  std::string file_pattern = "porter_%Y%m%d_%H%M%S.log";
  uint64_t rotation_size_mb = 50;
  bool rotate_at_midnight = true;
  int max_files = 10;
  bool format_json = true;
};

/**
 * Escape a string for embedding in a JSON string literal (RFC 8259).
 */
std::string escape_json(const std::string& s);

/**
 * One JSON object per line: ts, level, msg, thread_id, and the
 * operation/key context when present.
 */
void json_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm);

/**
 * Plain text line, same layout as the uncolored console output.
 */
void text_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm);

/**
 * Create a file sink with size and optional midnight rotation.
 * Falls back to /tmp when the configured directory cannot be created.
 *
 * @param config File sink settings
 * @param min_level Records below this level are filtered out
 */
boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level = severity_level::debug
);

}  // namespace logging
}  // namespace porter

#endif  // PORTER_FILE_SINK_HPP
