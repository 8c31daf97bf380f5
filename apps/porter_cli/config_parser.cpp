// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <chrono>
#include <cstdlib>

#define PORTER_LOG_COMPONENT "config_parser"
#include <porter_log_macros.hpp>

namespace porter {
namespace cli {

using logging::kv;

namespace {

template <typename T>
void read_field(const YAML::Node& node, const char* name, T& field) {
  if (node[name]) {
    field = node[name].as<T>();
  }
}

void read_env(const char* name, std::string& field) {
  const char* value = std::getenv(name);
  if (value && *value) {
    field = value;
  }
}

}  // namespace

transfer::TransferConfig to_transfer_config(const CliConfig& config) {
  transfer::TransferConfig out;
  const TransferConfigYaml& t = config.transfer;
  out.multipart_threshold = t.multipart_threshold_mb * transfer::kMiB;
  out.multipart_chunk_size = t.multipart_chunk_size_mb * transfer::kMiB;
  out.max_concurrent_uploads = t.max_concurrent_uploads;
  out.max_object_size = t.max_object_size_gb * transfer::kGiB;
  out.default_presigned_url_expiry = std::chrono::seconds(t.default_presigned_url_expiry_s);
  out.max_presigned_url_expiry = std::chrono::seconds(t.max_presigned_url_expiry_s);
  out.metadata_cache_ttl = std::chrono::seconds(t.metadata_cache_ttl_s);
  out.enable_metadata_cache = t.enable_metadata_cache;
  out.download_chunk_size = static_cast<size_t>(t.download_chunk_size_kb * 1024);

  const RetryConfigYaml& r = config.retry;
  out.retry.max_attempts = r.max_attempts;
  out.retry.base_delay = std::chrono::milliseconds(r.base_delay_ms);
  out.retry.max_delay = std::chrono::milliseconds(r.max_delay_ms);
  out.retry.exponential_base = r.exponential_base;
  out.retry.jitter = r.jitter;
  out.retry.skip_permanent_errors = r.skip_permanent_errors;
  return out;
}

void convert_logging_config(
  const LoggingConfigYaml& yaml_config, logging::LoggingConfig& log_config
) {
  log_config.console_enabled = yaml_config.console_enabled;
  log_config.console_colors = yaml_config.console_colors;
  if (auto level = logging::parse_severity_level(yaml_config.console_level)) {
    log_config.console_level = *level;
  }

  log_config.file_enabled = yaml_config.file_enabled;
  if (auto level = logging::parse_severity_level(yaml_config.file_level)) {
    log_config.file_level = *level;
  }

  log_config.file_config.directory = yaml_config.file_directory;
  log_config.file_config.file_pattern = yaml_config.file_pattern;
  log_config.file_config.format_json = (yaml_config.file_format == "json");
  log_config.file_config.rotation_size_mb = yaml_config.rotation_size_mb;
  log_config.file_config.max_files = yaml_config.max_files;
  log_config.file_config.rotate_at_midnight = yaml_config.rotate_at_midnight;
}

bool ConfigParser::load_from_file(const std::string& path, CliConfig& config) {
  try {
    YAML::Node node = YAML::LoadFile(path);
    return load_from_string(YAML::Dump(node), config);
  } catch (const YAML::Exception& e) {
    last_error_ = "cannot load " + path + ": " + e.what();
    PORTER_LOG_ERROR("YAML parsing error" << kv("path", path) << kv("error", e.what()));
    return false;
  }
}

bool ConfigParser::load_from_string(const std::string& yaml_content, CliConfig& config) {
  last_error_.clear();
  try {
    YAML::Node node = YAML::Load(yaml_content);
    if (node.IsNull()) {
      return true;
    }
    if (!node.IsMap()) {
      last_error_ = "top-level YAML node must be a mapping";
      return false;
    }

    if (node["storage"]) {
      parse_storage(node["storage"], config.storage);
    }
    if (node["transfer"]) {
      parse_transfer(node["transfer"], config.transfer);
    }
    if (node["retry"]) {
      parse_retry(node["retry"], config.retry);
    }
    // Optional, defaults apply when absent
    if (node["logging"]) {
      parse_logging(node["logging"], config.logging);
    }
    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = std::string("invalid YAML: ") + e.what();
    PORTER_LOG_ERROR("YAML parsing error" << kv("error", e.what()));
    return false;
  }
}

void ConfigParser::apply_env_overrides(CliConfig& config) {
  read_env("PORTER_ACCESS_KEY", config.storage.access_key);
  read_env("PORTER_SECRET_KEY", config.storage.secret_key);
  read_env("PORTER_REGION", config.storage.region);
  read_env("PORTER_BUCKET", config.storage.bucket);
  read_env("PORTER_ENDPOINT", config.storage.endpoint_url);
}

bool ConfigParser::validate(const CliConfig& config, std::string& error_msg) {
  if (config.storage.bucket.empty()) {
    error_msg = "storage.bucket is required";
    return false;
  }
  if (config.transfer.multipart_threshold_mb == 0) {
    error_msg = "transfer.multipart_threshold_mb must be positive";
    return false;
  }
  if (config.transfer.multipart_chunk_size_mb * transfer::kMiB < transfer::kMinMultipartChunkSize) {
    error_msg = "transfer.multipart_chunk_size_mb must be at least 5";
    return false;
  }
  if (config.transfer.max_concurrent_uploads < 1) {
    error_msg = "transfer.max_concurrent_uploads must be at least 1";
    return false;
  }
  if (config.retry.max_attempts < 1) {
    error_msg = "retry.max_attempts must be at least 1";
    return false;
  }
  if (config.transfer.default_presigned_url_expiry_s <= 0 ||
      config.transfer.default_presigned_url_expiry_s > config.transfer.max_presigned_url_expiry_s) {
    error_msg = "transfer.default_presigned_url_expiry_s must be in (0, max_presigned_url_expiry_s]";
    return false;
  }
  if (config.logging.file_format != "json" && config.logging.file_format != "text") {
    error_msg = "logging.file.format must be json or text";
    return false;
  }
  return true;
}

void ConfigParser::parse_storage(const YAML::Node& node, StorageConfigYaml& storage) {
  read_field(node, "endpoint_url", storage.endpoint_url);
  read_field(node, "bucket", storage.bucket);
  read_field(node, "region", storage.region);
  read_field(node, "use_ssl", storage.use_ssl);
  read_field(node, "verify_ssl", storage.verify_ssl);
  read_field(node, "access_key", storage.access_key);
  read_field(node, "secret_key", storage.secret_key);
  read_field(node, "connect_timeout_ms", storage.connect_timeout_ms);
  read_field(node, "request_timeout_ms", storage.request_timeout_ms);
}

void ConfigParser::parse_transfer(const YAML::Node& node, TransferConfigYaml& transfer) {
  read_field(node, "multipart_threshold_mb", transfer.multipart_threshold_mb);
  read_field(node, "multipart_chunk_size_mb", transfer.multipart_chunk_size_mb);
  read_field(node, "max_concurrent_uploads", transfer.max_concurrent_uploads);
  read_field(node, "max_object_size_gb", transfer.max_object_size_gb);
  read_field(node, "default_presigned_url_expiry_s", transfer.default_presigned_url_expiry_s);
  read_field(node, "max_presigned_url_expiry_s", transfer.max_presigned_url_expiry_s);
  read_field(node, "metadata_cache_ttl_s", transfer.metadata_cache_ttl_s);
  read_field(node, "enable_metadata_cache", transfer.enable_metadata_cache);
  read_field(node, "download_chunk_size_kb", transfer.download_chunk_size_kb);
}

void ConfigParser::parse_retry(const YAML::Node& node, RetryConfigYaml& retry) {
  read_field(node, "max_attempts", retry.max_attempts);
  read_field(node, "base_delay_ms", retry.base_delay_ms);
  read_field(node, "max_delay_ms", retry.max_delay_ms);
  read_field(node, "exponential_base", retry.exponential_base);
  read_field(node, "jitter", retry.jitter);
  read_field(node, "skip_permanent_errors", retry.skip_permanent_errors);
}

void ConfigParser::parse_logging(const YAML::Node& node, LoggingConfigYaml& logging) {
  if (node["console"]) {
    const auto& console = node["console"];
    read_field(console, "enabled", logging.console_enabled);
    read_field(console, "colors", logging.console_colors);
    read_field(console, "level", logging.console_level);
  }

  if (node["file"]) {
    const auto& file = node["file"];
    read_field(file, "enabled", logging.file_enabled);
    read_field(file, "level", logging.file_level);
    read_field(file, "directory", logging.file_directory);
    read_field(file, "pattern", logging.file_pattern);
    read_field(file, "format", logging.file_format);
    read_field(file, "rotation_size_mb", logging.rotation_size_mb);
    read_field(file, "max_files", logging.max_files);
    read_field(file, "rotate_at_midnight", logging.rotate_at_midnight);
  }
}

}  // namespace cli
}  // namespace porter
