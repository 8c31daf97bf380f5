// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PORTER_LOG_SEVERITY_HPP
#define PORTER_LOG_SEVERITY_HPP

#include <boost/log/expressions/keyword.hpp>

#include <ostream>

namespace porter {
namespace logging {

/**
 * Severity levels for porter logging.
 */
enum class severity_level { debug = 0, info = 1, warn = 2, error = 3, fatal = 4 };

inline std::ostream& operator<<(std::ostream& strm, severity_level level) {
  static const char* names[] = {"DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
  const auto index = static_cast<size_t>(level);
  if (index < sizeof(names) / sizeof(*names)) {
    strm << names[index];
  } else {
    strm << static_cast<int>(level);
  }
  return strm;
}

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

}  // namespace logging
}  // namespace porter

#endif  // PORTER_LOG_SEVERITY_HPP
