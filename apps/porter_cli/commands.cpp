// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "commands.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <stdexcept>

#include <porter_log_init.hpp>

#include "progress_tracker.hpp"
#include "transfer_helpers.hpp"

#define PORTER_LOG_COMPONENT "porter_cli"
#include <porter_log_macros.hpp>

namespace porter {
namespace cli {

using logging::kv;
using nlohmann::json;

namespace {

constexpr size_t kStdinChunkSize = 64 * 1024;

const char* const kValueOptions[] = {
  "--max", "--token", "--source-bucket", "--expiry", "--content-type",
};

bool takes_value(const std::string& option) {
  for (const char* name : kValueOptions) {
    if (option == name) {
      return true;
    }
  }
  return false;
}

bool parse_int64(const std::string& text, int64_t& value) {
  if (text.empty()) {
    return false;
  }
  errno = 0;
  char* end = nullptr;
  const long long parsed = std::strtoll(text.c_str(), &end, 10);
  if (errno != 0 || end == nullptr || *end != '\0') {
    return false;
  }
  value = static_cast<int64_t>(parsed);
  return true;
}

std::optional<std::string> option(
  const std::map<std::string, std::string>& options, const std::string& name
) {
  auto it = options.find(name);
  if (it == options.end()) {
    return std::nullopt;
  }
  return it->second;
}

json metadata_json(const transfer::Metadata& metadata) {
  json out = json::object();
  for (const auto& entry : metadata) {
    out[entry.first] = entry.second;
  }
  return out;
}

json upload_json(const transfer::UploadResult& result) {
  return json{
    {"key", result.key},
    {"size", result.size},
    {"upload_type", transfer::uploadTypeName(result.upload_type)},
    {"etag", result.etag},
    {"total_parts", result.total_parts},
    {"upload_time", transfer::formatTimestamp(result.upload_time)},
  };
}

json file_info_json(const transfer::FileInfo& info) {
  return json{
    {"key", info.key},
    {"size", info.size},
    {"content_type", info.content_type},
    {"etag", info.etag},
    {"last_modified", info.last_modified},
    {"metadata", metadata_json(info.custom_metadata)},
    {"storage_class", info.storage_class},
    {"cache_control", info.cache_control},
    {"content_encoding", info.content_encoding},
  };
}

json copy_json(const transfer::CopyResult& result) {
  return json{
    {"source_bucket", result.source_bucket},
    {"source_key", result.source_key},
    {"destination_bucket", result.destination_bucket},
    {"destination_key", result.destination_key},
    {"etag", result.etag},
    {"copy_time", transfer::formatTimestamp(result.copy_time)},
  };
}

json error_json(const transfer::TransferError& error) {
  return json{
    {"error",
     {
       {"kind", transfer::errorKindName(error.kind())},
       {"operation", error.operation()},
       {"message", error.message()},
       {"provider_code", error.providerCode()},
     }},
  };
}

/**
 * Single-line progress on stderr, redrawn in place
 */
class ConsoleProgress : public transfer::IProgressObserver {
public:
  explicit ConsoleProgress(std::ostream& err)
      : err_(err) {}

  ~ConsoleProgress() override {
    if (drawn_) {
      err_ << std::endl;
    }
  }

  void onProgress(const transfer::ProgressSnapshot& snapshot) override {
    char percent[16];
    snprintf(percent, sizeof(percent), "%6.2f%%", snapshot.percentage);
    err_ << "\r" << percent << "  "
         << transfer::formatFileSize(snapshot.transferred_size) << " / "
         << transfer::formatFileSize(snapshot.total_size) << "  ETA "
         << transfer::formatEta(snapshot.eta_seconds) << std::flush;
    drawn_ = true;
  }

private:
  std::ostream& err_;
  bool drawn_ = false;
};

}  // namespace

int exit_code_for(transfer::ErrorKind kind) {
  switch (kind) {
    case transfer::ErrorKind::NotFound:
      return kExitNotFound;
    case transfer::ErrorKind::PermissionDenied:
    case transfer::ErrorKind::AuthFailure:
      return kExitAccessDenied;
    case transfer::ErrorKind::SizeExceeded:
    case transfer::ErrorKind::InvalidKey:
      return kExitRejected;
    case transfer::ErrorKind::BucketMissing:
    case transfer::ErrorKind::RateLimited:
    case transfer::ErrorKind::ServiceUnavailable:
    case transfer::ErrorKind::NetworkError:
    case transfer::ErrorKind::MultipartFailure:
    case transfer::ErrorKind::Generic:
      return kExitFailure;
  }
  return kExitFailure;
}

Commands::Commands(
  StoreFactory store_factory, std::istream& in, std::ostream& out, std::ostream& err
)
    : store_factory_(std::move(store_factory))
    , in_(in)
    , out_(out)
    , err_(err) {}

int Commands::execute(int argc, char* argv[]) {
  Arguments args;
  std::string error_msg;
  if (!parse_arguments(argc, argv, args, error_msg)) {
    return usage_error(error_msg);
  }

  if (args.command.empty() || args.command == "help" || args.command == "-h" ||
      args.command == "--help") {
    print_usage();
    return kExitSuccess;
  }

  CliConfig config;
  if (!load_config(args, config, error_msg)) {
    err_ << "Error: " << error_msg << std::endl;
    return kExitUsage;
  }
  init_logging(config, args.verbose);

  std::unique_ptr<transfer::TransferEngine> engine;
  try {
    engine = std::make_unique<transfer::TransferEngine>(
      store_factory_(config), to_transfer_config(config)
    );
  } catch (const std::invalid_argument& e) {
    err_ << "Error: " << e.what() << std::endl;
    return kExitUsage;
  }

  try {
    return dispatch(*engine, args);
  } catch (const transfer::TransferError& e) {
    err_ << error_json(e).dump(2) << std::endl;
    return exit_code_for(e.kind());
  }
}

bool Commands::parse_arguments(
  int argc, char* argv[], Arguments& args, std::string& error_msg
) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--verbose" || arg == "-v") {
      args.verbose = true;
    } else if (arg == "--config" || arg == "-c") {
      if (i + 1 >= argc) {
        error_msg = "missing value for " + arg;
        return false;
      }
      args.config_path = argv[++i];
    } else if (takes_value(arg)) {
      if (i + 1 >= argc) {
        error_msg = "missing value for " + arg;
        return false;
      }
      args.options[arg] = argv[++i];
    } else if (args.command.empty()) {
      args.command = arg;
    } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
      error_msg = "unknown option '" + arg + "'";
      return false;
    } else {
      args.positional.push_back(arg);
    }
  }
  return true;
}

bool Commands::load_config(const Arguments& args, CliConfig& config, std::string& error_msg) {
  std::string path = args.config_path;
  if (path.empty()) {
    if (const char* env_path = std::getenv("PORTER_CONFIG")) {
      path = env_path;
    }
  }

  ConfigParser parser;
  if (!path.empty() && !parser.load_from_file(path, config)) {
    error_msg = parser.last_error();
    return false;
  }
  ConfigParser::apply_env_overrides(config);
  return ConfigParser::validate(config, error_msg);
}

void Commands::init_logging(const CliConfig& config, bool verbose) {
  if (logging::is_logging_initialized()) {
    return;
  }
  logging::LoggingConfig log_config;
  convert_logging_config(config.logging, log_config);
  if (verbose) {
    log_config.console_level = logging::severity_level::debug;
  }
  logging::apply_env_overrides(log_config);
  logging::init_logging(log_config);
}

int Commands::dispatch(transfer::TransferEngine& engine, const Arguments& args) {
  PORTER_LOG_DEBUG(
    "Running command" << kv("command", args.command) << kv("bucket", engine.bucket())
  );

  if (args.command == "upload") {
    return cmd_upload(engine, args);
  } else if (args.command == "upload-stream") {
    return cmd_upload_stream(engine, args);
  } else if (args.command == "download") {
    return cmd_download(engine, args);
  } else if (args.command == "cat") {
    return cmd_cat(engine, args);
  } else if (args.command == "info") {
    return cmd_info(engine, args);
  } else if (args.command == "exists") {
    return cmd_exists(engine, args);
  } else if (args.command == "list") {
    return cmd_list(engine, args);
  } else if (args.command == "delete") {
    return cmd_delete(engine, args);
  } else if (args.command == "copy") {
    return cmd_copy(engine, args);
  } else if (args.command == "move") {
    return cmd_move(engine, args);
  } else if (args.command == "presign") {
    return cmd_presign(engine, args);
  } else if (args.command == "set-metadata") {
    return cmd_set_metadata(engine, args);
  }
  err_ << "Error: Unknown command '" << args.command << "'" << std::endl;
  print_usage();
  return kExitUsage;
}

int Commands::cmd_upload(transfer::TransferEngine& engine, const Arguments& args) {
  if (args.positional.empty() || args.positional.size() > 2) {
    return usage_error("upload <file> [key]");
  }
  transfer::UploadOptions options;
  options.content_type = option(args.options, "--content-type");

  std::unique_ptr<ConsoleProgress> progress;
  if (args.verbose) {
    progress = std::make_unique<ConsoleProgress>(err_);
    options.observer = progress.get();
  }
  const std::string key = args.positional.size() > 1 ? args.positional[1] : "";
  const transfer::UploadResult result = engine.upload(args.positional[0], key, options);
  progress.reset();
  print_json(upload_json(result));
  return kExitSuccess;
}

int Commands::cmd_upload_stream(transfer::TransferEngine& engine, const Arguments& args) {
  if (args.positional.size() != 1) {
    return usage_error("upload-stream <key>");
  }
  transfer::StreamUploadOptions options;
  options.content_type = option(args.options, "--content-type");

  transfer::ChunkProducer producer = [this]() -> std::optional<transfer::Bytes> {
    transfer::Bytes chunk(kStdinChunkSize);
    in_.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
    const std::streamsize count = in_.gcount();
    if (in_.bad()) {
      throw std::runtime_error("error reading standard input");
    }
    if (count <= 0) {
      return std::nullopt;
    }
    chunk.resize(static_cast<size_t>(count));
    return chunk;
  };

  print_json(upload_json(engine.uploadStream(producer, args.positional[0], options)));
  return kExitSuccess;
}

int Commands::cmd_download(transfer::TransferEngine& engine, const Arguments& args) {
  if (args.positional.size() != 2) {
    return usage_error("download <key> <destination>");
  }
  std::unique_ptr<ConsoleProgress> progress;
  if (args.verbose) {
    progress = std::make_unique<ConsoleProgress>(err_);
  }
  const transfer::DownloadResult result =
    engine.downloadFile(args.positional[0], args.positional[1], progress.get());
  progress.reset();
  print_json(json{
    {"key", result.key},
    {"local_path", result.local_path},
    {"size", result.size},
    {"download_time", transfer::formatTimestamp(result.download_time)},
  });
  return kExitSuccess;
}

int Commands::cmd_cat(transfer::TransferEngine& engine, const Arguments& args) {
  if (args.positional.empty() || args.positional.size() > 3) {
    return usage_error("cat <key> [start] [end]");
  }
  std::optional<uint64_t> start;
  std::optional<uint64_t> end;
  int64_t value = 0;
  if (args.positional.size() > 1) {
    if (!parse_int64(args.positional[1], value) || value < 0) {
      return usage_error("start must be a non-negative integer");
    }
    start = static_cast<uint64_t>(value);
  }
  if (args.positional.size() > 2) {
    if (!parse_int64(args.positional[2], value) || value < 0) {
      return usage_error("end must be a non-negative integer");
    }
    end = static_cast<uint64_t>(value);
  }

  transfer::DownloadStream stream = engine.downloadStream(args.positional[0], start, end);
  while (auto chunk = stream.next()) {
    out_.write(reinterpret_cast<const char*>(chunk->data()), static_cast<std::streamsize>(chunk->size()));
  }
  out_.flush();
  return kExitSuccess;
}

int Commands::cmd_info(transfer::TransferEngine& engine, const Arguments& args) {
  if (args.positional.size() != 1) {
    return usage_error("info <key>");
  }
  print_json(file_info_json(engine.getFileInfo(args.positional[0])));
  return kExitSuccess;
}

int Commands::cmd_exists(transfer::TransferEngine& engine, const Arguments& args) {
  if (args.positional.size() != 1) {
    return usage_error("exists <key>");
  }
  const bool exists = engine.fileExists(args.positional[0]);
  print_json(json{{"key", args.positional[0]}, {"exists", exists}});
  return kExitSuccess;
}

int Commands::cmd_list(transfer::TransferEngine& engine, const Arguments& args) {
  if (args.positional.size() > 1) {
    return usage_error("list [prefix] [--max N] [--token T]");
  }
  int64_t max_keys = transfer::kMaxListKeys;
  if (auto max = option(args.options, "--max")) {
    if (!parse_int64(*max, max_keys)) {
      return usage_error("--max must be an integer");
    }
  }
  const std::string prefix = args.positional.empty() ? "" : args.positional[0];
  const transfer::FileListPage page = engine.listFiles(
    prefix, static_cast<int>(std::max<int64_t>(0, std::min<int64_t>(max_keys, transfer::kMaxListKeys))),
    option(args.options, "--token")
  );

  json files = json::array();
  for (const auto& file : page.files) {
    files.push_back(json{
      {"key", file.key},
      {"size", file.size},
      {"last_modified", file.last_modified},
      {"etag", file.etag},
      {"storage_class", file.storage_class},
    });
  }
  json result{{"prefix", page.prefix}, {"files", files}, {"is_truncated", page.is_truncated}};
  if (page.next_continuation_token) {
    result["next_continuation_token"] = *page.next_continuation_token;
  }
  print_json(result);
  return kExitSuccess;
}

int Commands::cmd_delete(transfer::TransferEngine& engine, const Arguments& args) {
  if (args.positional.empty()) {
    return usage_error("delete <key...>");
  }
  std::map<std::string, bool> results;
  if (args.positional.size() == 1) {
    results[args.positional[0]] = engine.deleteFile(args.positional[0]);
  } else {
    results = engine.deleteFiles(args.positional);
  }

  json deleted = json::object();
  bool all_deleted = true;
  for (const auto& entry : results) {
    deleted[entry.first] = entry.second;
    all_deleted = all_deleted && entry.second;
  }
  print_json(json{{"deleted", deleted}});
  return all_deleted ? kExitSuccess : kExitFailure;
}

int Commands::cmd_copy(transfer::TransferEngine& engine, const Arguments& args) {
  if (args.positional.size() != 2) {
    return usage_error("copy <source> <destination> [--source-bucket B]");
  }
  print_json(copy_json(
    engine.copyFile(args.positional[0], args.positional[1], option(args.options, "--source-bucket"))
  ));
  return kExitSuccess;
}

int Commands::cmd_move(transfer::TransferEngine& engine, const Arguments& args) {
  if (args.positional.size() != 2) {
    return usage_error("move <source> <destination>");
  }
  const transfer::MoveResult result = engine.moveFile(args.positional[0], args.positional[1]);
  json value = copy_json(result.copy);
  value["move_time"] = transfer::formatTimestamp(result.move_time);
  print_json(value);
  return kExitSuccess;
}

int Commands::cmd_presign(transfer::TransferEngine& engine, const Arguments& args) {
  if (args.positional.empty() || args.positional.size() > 2) {
    return usage_error("presign <key> [get|put] [--expiry S]");
  }
  transfer::PresignOperation operation = transfer::PresignOperation::Get;
  if (args.positional.size() == 2) {
    if (args.positional[1] == "put") {
      operation = transfer::PresignOperation::Put;
    } else if (args.positional[1] != "get") {
      return usage_error("presign operation must be get or put");
    }
  }
  std::optional<int64_t> expiry;
  if (auto text = option(args.options, "--expiry")) {
    int64_t seconds = 0;
    if (!parse_int64(*text, seconds)) {
      return usage_error("--expiry must be an integer");
    }
    expiry = seconds;
  }

  const std::string url = engine.generatePresignedUrl(args.positional[0], operation, expiry);
  print_json(json{
    {"key", args.positional[0]},
    {"method", operation == transfer::PresignOperation::Get ? "GET" : "PUT"},
    {"url", url},
  });
  return kExitSuccess;
}

int Commands::cmd_set_metadata(transfer::TransferEngine& engine, const Arguments& args) {
  if (args.positional.size() < 2) {
    return usage_error("set-metadata <key> k=v... [--content-type T]");
  }
  transfer::Metadata metadata;
  for (size_t i = 1; i < args.positional.size(); ++i) {
    const std::string& pair = args.positional[i];
    const auto eq = pair.find('=');
    if (eq == std::string::npos || eq == 0) {
      return usage_error("metadata entries must look like key=value, got '" + pair + "'");
    }
    metadata[pair.substr(0, eq)] = pair.substr(eq + 1);
  }

  const transfer::UpdateResult result =
    engine.updateMetadata(args.positional[0], metadata, option(args.options, "--content-type"));
  print_json(json{
    {"key", result.key},
    {"etag", result.etag},
    {"metadata", metadata_json(result.updated_metadata)},
    {"update_time", transfer::formatTimestamp(result.update_time)},
  });
  return kExitSuccess;
}

int Commands::usage_error(const std::string& message) {
  err_ << "Usage: porter_cli " << message << std::endl;
  return kExitUsage;
}

void Commands::print_json(const json& value) {
  out_ << value.dump(2) << std::endl;
}

void Commands::print_usage() {
  out_ << "Usage: porter_cli <command> [arguments] [options]" << std::endl;
  out_ << std::endl;
  out_ << "Commands:" << std::endl;
  out_ << "  upload <file> [key]              Upload a local file" << std::endl;
  out_ << "  upload-stream <key>              Upload standard input" << std::endl;
  out_ << "  download <key> <dest>            Download an object to a file" << std::endl;
  out_ << "  cat <key> [start] [end]          Write an object (or byte range) to stdout"
       << std::endl;
  out_ << "  info <key>                       Show object metadata" << std::endl;
  out_ << "  exists <key>                     Check whether an object exists" << std::endl;
  out_ << "  list [prefix]                    List one page of objects" << std::endl;
  out_ << "  delete <key...>                  Delete one or more objects" << std::endl;
  out_ << "  copy <src> <dst>                 Server-side copy" << std::endl;
  out_ << "  move <src> <dst>                 Copy, then delete the source" << std::endl;
  out_ << "  presign <key> [get|put]          Generate a presigned URL" << std::endl;
  out_ << "  set-metadata <key> k=v...        Replace custom metadata" << std::endl;
  out_ << "  help                             Show this help message" << std::endl;
  out_ << std::endl;
  out_ << "Options:" << std::endl;
  out_ << "  --config, -c PATH     YAML configuration (default: $PORTER_CONFIG)" << std::endl;
  out_ << "  --content-type T      Content type for upload, upload-stream, set-metadata"
       << std::endl;
  out_ << "  --max N               Page size for list (1-1000)" << std::endl;
  out_ << "  --token T             Continuation token for list" << std::endl;
  out_ << "  --source-bucket B     Source bucket for copy" << std::endl;
  out_ << "  --expiry S            Presigned URL lifetime in seconds" << std::endl;
  out_ << "  --verbose, -v         Debug logging and progress output" << std::endl;
  out_ << std::endl;
  out_ << "Exit codes: 0 ok, 1 failure, 2 usage/config, 3 not found, 4 access denied,"
       << std::endl;
  out_ << "            5 size or key rejected" << std::endl;
}

}  // namespace cli
}  // namespace porter
