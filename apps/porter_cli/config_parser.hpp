// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PORTER_CLI_CONFIG_PARSER_HPP
#define PORTER_CLI_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <string>

#include <porter_log_init.hpp>

#include "transfer_config.hpp"

namespace porter {
namespace cli {

/**
 * Object store connection settings
 */
struct StorageConfigYaml {
  std::string endpoint_url;          // S3-compatible endpoint (empty for AWS S3)
  std::string bucket;                // Required
  std::string region = "us-east-1";
  bool use_ssl = true;
  bool verify_ssl = true;
  std::string access_key;            // Empty falls back to AWS_ACCESS_KEY_ID
  std::string secret_key;            // Empty falls back to AWS_SECRET_ACCESS_KEY
  int connect_timeout_ms = 60000;
  int request_timeout_ms = 300000;
};

/**
 * Transfer engine settings
 */
struct TransferConfigYaml {
  uint64_t multipart_threshold_mb = 5;
  uint64_t multipart_chunk_size_mb = 8;
  int max_concurrent_uploads = 10;
  uint64_t max_object_size_gb = 5;
  int64_t default_presigned_url_expiry_s = 3600;
  int64_t max_presigned_url_expiry_s = 7 * 24 * 3600;
  int64_t metadata_cache_ttl_s = 300;
  bool enable_metadata_cache = true;
  uint64_t download_chunk_size_kb = 64;
};

/**
 * Retry policy for remote calls
 */
struct RetryConfigYaml {
  int max_attempts = 3;
  int base_delay_ms = 1000;
  int max_delay_ms = 60000;
  double exponential_base = 2.0;
  bool jitter = true;
  bool skip_permanent_errors = false;
};

/**
 * Logging configuration parsed from YAML.
 * Mirrors porter::logging::LoggingConfig.
 */
struct LoggingConfigYaml {
  // Console sink
  bool console_enabled = true;
  bool console_colors = true;
  std::string console_level = "info";  // debug, info, warn, error, fatal

  // File sink
  bool file_enabled = false;
  std::string file_level = "debug";
  std::string file_directory = "/var/log/porter";
  std::string file_pattern = "porter_%Y%m%d_%H%M%S.log";
  std::string file_format = "json";  // json or text
  uint64_t rotation_size_mb = 50;
  int max_files = 10;
  bool rotate_at_midnight = true;
};

struct CliConfig {
  StorageConfigYaml storage;
  TransferConfigYaml transfer;
  RetryConfigYaml retry;
  LoggingConfigYaml logging;
};

/**
 * Build the engine settings from the parsed sections
 */
transfer::TransferConfig to_transfer_config(const CliConfig& config);

/**
 * Bridge the YAML logging section to the logging library input.
 * Unparseable levels keep the library defaults.
 */
void convert_logging_config(
  const LoggingConfigYaml& yaml_config, logging::LoggingConfig& log_config
);

class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from YAML file, on top of the values already in config
   */
  bool load_from_file(const std::string& path, CliConfig& config);

  /**
   * Load configuration from YAML string, on top of the values already in config
   */
  bool load_from_string(const std::string& yaml_content, CliConfig& config);

  /**
   * Reason the last load failed
   */
  const std::string& last_error() const {
    return last_error_;
  }

  /**
   * Apply PORTER_ACCESS_KEY, PORTER_SECRET_KEY, PORTER_REGION,
   * PORTER_BUCKET and PORTER_ENDPOINT
   */
  static void apply_env_overrides(CliConfig& config);

  /**
   * Validate configuration
   */
  static bool validate(const CliConfig& config, std::string& error_msg);

private:
  void parse_storage(const YAML::Node& node, StorageConfigYaml& storage);
  void parse_transfer(const YAML::Node& node, TransferConfigYaml& transfer);
  void parse_retry(const YAML::Node& node, RetryConfigYaml& retry);
  void parse_logging(const YAML::Node& node, LoggingConfigYaml& logging);

  std::string last_error_;
};

}  // namespace cli
}  // namespace porter

#endif  // PORTER_CLI_CONFIG_PARSER_HPP
