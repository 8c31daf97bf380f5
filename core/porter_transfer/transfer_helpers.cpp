// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transfer_helpers.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <cstdio>
#include <ctime>
#include <unordered_map>

namespace porter {
namespace transfer {

const char* uploadTypeName(UploadType type) {
  switch (type) {
    case UploadType::Simple:
      return "simple";
    case UploadType::Multipart:
      return "multipart";
    case UploadType::Stream:
      return "stream";
  }
  return "unknown";
}

std::string detectContentType(const std::string& key) {
  static const std::unordered_map<std::string, std::string> types = {
    {"txt", "text/plain"},
    {"log", "text/plain"},
    {"csv", "text/csv"},
    {"htm", "text/html"},
    {"html", "text/html"},
    {"css", "text/css"},
    {"js", "application/javascript"},
    {"json", "application/json"},
    {"xml", "application/xml"},
    {"yaml", "application/yaml"},
    {"yml", "application/yaml"},
    {"pdf", "application/pdf"},
    {"zip", "application/zip"},
    {"gz", "application/gzip"},
    {"tar", "application/x-tar"},
    {"7z", "application/x-7z-compressed"},
    {"doc", "application/msword"},
    {"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
    {"xls", "application/vnd.ms-excel"},
    {"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
    {"png", "image/png"},
    {"jpg", "image/jpeg"},
    {"jpeg", "image/jpeg"},
    {"gif", "image/gif"},
    {"bmp", "image/bmp"},
    {"svg", "image/svg+xml"},
    {"webp", "image/webp"},
    {"ico", "image/vnd.microsoft.icon"},
    {"mp3", "audio/mpeg"},
    {"wav", "audio/x-wav"},
    {"mp4", "video/mp4"},
    {"mov", "video/quicktime"},
    {"webm", "video/webm"},
    {"bin", "application/octet-stream"},
  };

  const auto slash = key.find_last_of('/');
  const auto dot = key.find_last_of('.');
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash) ||
      dot + 1 == key.size()) {
    return kDefaultContentType;
  }
  auto it = types.find(boost::algorithm::to_lower_copy(key.substr(dot + 1)));
  return it == types.end() ? std::string(kDefaultContentType) : it->second;
}

std::string formatFileSize(uint64_t bytes) {
  if (bytes == 0) {
    return "0 B";
  }
  static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
  double size = static_cast<double>(bytes);
  size_t unit = 0;
  while (size >= 1024.0 && unit < sizeof(units) / sizeof(*units) - 1) {
    size /= 1024.0;
    ++unit;
  }
  char buf[32];
  snprintf(buf, sizeof(buf), "%.2f %s", size, units[unit]);
  return buf;
}

std::string formatEta(double seconds) {
  const int64_t total = seconds > 0.0 ? static_cast<int64_t>(seconds) : 0;
  const int64_t hours = total / 3600;
  const int64_t minutes = (total % 3600) / 60;
  const int64_t secs = total % 60;
  char buf[32];
  if (hours > 0) {
    snprintf(
      buf, sizeof(buf), "%02lld:%02lld:%02lld", static_cast<long long>(hours),
      static_cast<long long>(minutes), static_cast<long long>(secs)
    );
  } else {
    snprintf(
      buf, sizeof(buf), "%02lld:%02lld", static_cast<long long>(minutes),
      static_cast<long long>(secs)
    );
  }
  return buf;
}

Metadata normalizeMetadataKeys(const Metadata& metadata) {
  static const std::string prefix = "x-amz-meta-";
  Metadata out;
  for (const auto& entry : metadata) {
    if (boost::algorithm::istarts_with(entry.first, prefix)) {
      out[entry.first.substr(prefix.size())] = entry.second;
    } else {
      out[entry.first] = entry.second;
    }
  }
  return out;
}

std::string stripEtagQuotes(const std::string& etag) {
  if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
    return etag.substr(1, etag.size() - 2);
  }
  return etag;
}

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm utc{};
  gmtime_r(&t, &utc);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return buf;
}

}  // namespace transfer
}  // namespace porter
