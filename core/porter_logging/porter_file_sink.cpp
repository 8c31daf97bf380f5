// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "porter_file_sink.hpp"

#include <boost/filesystem.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>

#include <cstdio>
#include <iostream>

namespace porter {
namespace logging {

namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;
namespace sinks = boost::log::sinks;

std::string escape_json(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 16);
  for (unsigned char c : s) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (c < 0x20) {
          char buf[8];
          snprintf(buf, sizeof(buf), "\\u%04x", c);
          out += buf;
        } else {
          out += static_cast<char>(c);
        }
    }
  }
  return out;
}

void json_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  strm << "{\"ts\":\"";
  if (auto ts = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec)) {
    strm << *ts;
  }
  strm << "\",\"level\":\"";
  if (auto sev = boost::log::extract<severity_level>("Severity", rec)) {
    strm << *sev;
  }
  strm << "\",\"msg\":\"";
  if (auto msg = rec[expr::smessage]) {
    strm << escape_json(msg.get());
  }
  strm << "\"";

  auto thread_id =
    boost::log::extract<boost::log::attributes::current_thread_id::value_type>("ThreadID", rec);
  if (thread_id) {
    strm << ",\"thread_id\":\"" << *thread_id << "\"";
  }
  if (auto operation = boost::log::extract<std::string>("Operation", rec)) {
    strm << ",\"op\":\"" << escape_json(*operation) << "\"";
  }
  if (auto object_key = boost::log::extract<std::string>("ObjectKey", rec)) {
    strm << ",\"key\":\"" << escape_json(*object_key) << "\"";
  }
  strm << "}";
}

void text_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  strm << "[";
  if (auto ts = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec)) {
    strm << *ts;
  }
  strm << "] ";
  if (auto sev = boost::log::extract<severity_level>("Severity", rec)) {
    strm << "[" << *sev << "] ";
  }
  strm << rec[expr::smessage];

  auto operation = boost::log::extract<std::string>("Operation", rec);
  auto object_key = boost::log::extract<std::string>("ObjectKey", rec);
  if (operation || object_key) {
    strm << " |";
    if (operation) strm << " op=" << *operation;
    if (object_key) strm << " key=" << *object_key;
  }
}

boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level
) {
  std::string log_directory = config.directory;
  boost::filesystem::path dir_path(log_directory);

  if (!boost::filesystem::exists(dir_path)) {
    boost::system::error_code ec;
    boost::filesystem::create_directories(dir_path, ec);
    if (ec) {
      // Logging is not up yet, so report on stderr.
      std::cerr << "[porter_logging] Warning: cannot create log directory '" << config.directory
                << "': " << ec.message() << ", using /tmp\n";
      log_directory = "/tmp";
    }
  }

  auto backend = boost::make_shared<sinks::text_file_backend>(
    keywords::file_name = log_directory + "/" + config.file_pattern,
    keywords::rotation_size = config.rotation_size_mb * 1024 * 1024,
    keywords::auto_flush = true
  );

  if (config.rotate_at_midnight) {
    backend->set_time_based_rotation(sinks::file::rotation_at_time_point(0, 0, 0));
  }

  backend->set_file_collector(sinks::file::make_collector(
    keywords::target = log_directory, keywords::max_files = config.max_files
  ));
  backend->scan_for_files();

  auto sink = boost::make_shared<async_file_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  if (config.format_json) {
    sink->set_formatter(&json_formatter);
  } else {
    sink->set_formatter(&text_formatter);
  }
  return sink;
}

}  // namespace logging
}  // namespace porter
