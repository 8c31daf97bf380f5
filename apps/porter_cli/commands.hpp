// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PORTER_CLI_COMMANDS_HPP
#define PORTER_CLI_COMMANDS_HPP

#include <nlohmann/json.hpp>

#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "config_parser.hpp"
#include "remote_store.hpp"
#include "transfer_engine.hpp"
#include "transfer_error.hpp"

namespace porter {
namespace cli {

/**
 * Process exit codes
 */
constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;        // Any other TransferError
constexpr int kExitUsage = 2;          // Bad arguments or configuration
constexpr int kExitNotFound = 3;
constexpr int kExitAccessDenied = 4;   // PermissionDenied, AuthFailure
constexpr int kExitRejected = 5;       // SizeExceeded, InvalidKey

int exit_code_for(transfer::ErrorKind kind);

/**
 * Command handler for porter_cli
 */
class Commands {
public:
  /**
   * Creates the remote store once the configuration is loaded
   */
  using StoreFactory =
    std::function<std::unique_ptr<transfer::IRemoteStore>(const CliConfig& config)>;

  explicit Commands(
    StoreFactory store_factory, std::istream& in = std::cin, std::ostream& out = std::cout,
    std::ostream& err = std::cerr
  );

  // Non-copyable
  Commands(const Commands&) = delete;
  Commands& operator=(const Commands&) = delete;

  /**
   * Parse and execute command line
   *
   * @return Process exit code
   */
  int execute(int argc, char* argv[]);

private:
  struct Arguments {
    std::string command;
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
    std::string config_path;
    bool verbose = false;
  };

  bool parse_arguments(int argc, char* argv[], Arguments& args, std::string& error_msg);
  bool load_config(const Arguments& args, CliConfig& config, std::string& error_msg);
  void init_logging(const CliConfig& config, bool verbose);

  int dispatch(transfer::TransferEngine& engine, const Arguments& args);

  int cmd_upload(transfer::TransferEngine& engine, const Arguments& args);
  int cmd_upload_stream(transfer::TransferEngine& engine, const Arguments& args);
  int cmd_download(transfer::TransferEngine& engine, const Arguments& args);
  int cmd_cat(transfer::TransferEngine& engine, const Arguments& args);
  int cmd_info(transfer::TransferEngine& engine, const Arguments& args);
  int cmd_exists(transfer::TransferEngine& engine, const Arguments& args);
  int cmd_list(transfer::TransferEngine& engine, const Arguments& args);
  int cmd_delete(transfer::TransferEngine& engine, const Arguments& args);
  int cmd_copy(transfer::TransferEngine& engine, const Arguments& args);
  int cmd_move(transfer::TransferEngine& engine, const Arguments& args);
  int cmd_presign(transfer::TransferEngine& engine, const Arguments& args);
  int cmd_set_metadata(transfer::TransferEngine& engine, const Arguments& args);

  int usage_error(const std::string& message);
  void print_json(const nlohmann::json& value);
  void print_usage();

  StoreFactory store_factory_;
  std::istream& in_;
  std::ostream& out_;
  std::ostream& err_;
};

}  // namespace cli
}  // namespace porter

#endif  // PORTER_CLI_COMMANDS_HPP
