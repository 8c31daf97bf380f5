// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "porter_console_sink.hpp"

#include <boost/core/null_deleter.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>

#include <iostream>
#include <string>

namespace porter {
namespace logging {

namespace expr = boost::log::expressions;

const char* severity_color(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "\033[36m";
    case severity_level::info:
      return "\033[32m";
    case severity_level::warn:
      return "\033[33m";
    case severity_level::error:
      return "\033[31m";
    case severity_level::fatal:
      return "\033[35m";
  }
  return "";
}

namespace {

constexpr const char* kResetColor = "\033[0m";

void format_console_record(
  boost::log::record_view const& rec, boost::log::formatting_ostream& strm, bool use_colors
) {
  strm << "[";
  if (auto ts = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec)) {
    strm << *ts;
  }
  strm << "] ";

  if (auto sev = boost::log::extract<severity_level>("Severity", rec)) {
    if (use_colors) {
      strm << severity_color(*sev) << "[" << *sev << "]" << kResetColor << " ";
    } else {
      strm << "[" << *sev << "] ";
    }
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

}  // namespace

boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level, bool use_colors
) {
  auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
  backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
  backend->auto_flush(true);

  auto sink = boost::make_shared<async_console_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  sink->set_formatter(
    [use_colors](boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
      format_console_record(rec, strm, use_colors);
    }
  );
  return sink;
}

}  // namespace logging
}  // namespace porter
