// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PORTER_TRANSFER_TYPES_HPP
#define PORTER_TRANSFER_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace porter {
namespace transfer {

class IProgressObserver;

using Bytes = std::vector<uint8_t>;
using Metadata = std::map<std::string, std::string>;

/**
 * Pulls the next chunk of a stream upload. std::nullopt ends the stream.
 */
using ChunkProducer = std::function<std::optional<Bytes>()>;

enum class UploadType { Simple, Multipart, Stream };

const char* uploadTypeName(UploadType type);

enum class PresignOperation { Get, Put };

/**
 * Object metadata as reported by a HEAD request.
 */
struct FileInfo {
  std::string key;
  uint64_t size = 0;
  std::string content_type;
  std::string etag;           // quotes stripped
  std::string last_modified;  // ISO-8601, UTC
  Metadata custom_metadata;   // keys without the x-amz-meta- prefix
  std::string storage_class = "STANDARD";
  std::string cache_control;
  std::string content_encoding;
};

/**
 * One entry of a list page.
 */
struct ObjectSummary {
  std::string key;
  uint64_t size = 0;
  std::string last_modified;
  std::string etag;
  std::string storage_class = "STANDARD";
};

struct CompletedPart {
  int part_number = 0;
  std::string etag;
};

struct UploadOptions {
  std::optional<std::string> content_type;
  Metadata metadata;
  IProgressObserver* observer = nullptr;  // not owned
};

struct StreamUploadOptions {
  std::optional<uint64_t> content_length;
  std::optional<std::string> content_type;
  Metadata metadata;
};

struct UploadResult {
  std::string key;
  uint64_t size = 0;
  UploadType upload_type = UploadType::Simple;
  std::string etag;
  int total_parts = 0;  // 0 unless multipart
  std::chrono::system_clock::time_point upload_time;
};

struct DownloadResult {
  std::string key;
  std::string local_path;
  uint64_t size = 0;
  std::chrono::system_clock::time_point download_time;
};

struct FileListPage {
  std::vector<ObjectSummary> files;
  bool is_truncated = false;
  std::optional<std::string> next_continuation_token;
  std::string prefix;
};

struct CopyResult {
  std::string source_key;
  std::string destination_key;
  std::string source_bucket;
  std::string destination_bucket;
  std::string etag;
  std::chrono::system_clock::time_point copy_time;
};

struct MoveResult {
  CopyResult copy;
  std::chrono::system_clock::time_point move_time;
};

struct UpdateResult {
  std::string key;
  std::string etag;
  Metadata updated_metadata;
  std::chrono::system_clock::time_point update_time;
};

}  // namespace transfer
}  // namespace porter

#endif  // PORTER_TRANSFER_TYPES_HPP
