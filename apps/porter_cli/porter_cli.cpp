// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

// porter_cli - command line front end for the porter transfer engine
// Uploads, downloads and manages objects in an S3-compatible bucket

#include <exception>
#include <iostream>
#include <memory>

#include <porter_log_init.hpp>

#include "aws_remote_store.hpp"
#include "commands.hpp"

namespace {

std::unique_ptr<porter::transfer::IRemoteStore> make_aws_store(
  const porter::cli::CliConfig& config
) {
  porter::transfer::AwsStoreConfig store;
  store.endpoint_url = config.storage.endpoint_url;
  store.bucket = config.storage.bucket;
  store.region = config.storage.region;
  store.use_ssl = config.storage.use_ssl;
  store.verify_ssl = config.storage.verify_ssl;
  store.access_key = config.storage.access_key;
  store.secret_key = config.storage.secret_key;
  store.connect_timeout_ms = config.storage.connect_timeout_ms;
  store.request_timeout_ms = config.storage.request_timeout_ms;
  store.max_connections = config.transfer.max_concurrent_uploads;
  return std::make_unique<porter::transfer::AwsRemoteStore>(store);
}

}  // namespace

/**
 * Main entry point for porter_cli
 */
int main(int argc, char* argv[]) {
  porter::cli::Commands commands(make_aws_store);

  int exit_code = 1;
  try {
    exit_code = commands.execute(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
  } catch (...) {
    std::cerr << "Error: Unknown exception occurred" << std::endl;
  }

  porter::logging::shutdown_logging();
  return exit_code;
}
