// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transfer_engine.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <utility>

#include "error_classifier.hpp"
#include "local_io_impl.hpp"
#include "transfer_helpers.hpp"
#include "upload_session.hpp"

#define PORTER_LOG_COMPONENT "transfer_engine"
#include <porter_log_macros.hpp>

namespace fs = std::filesystem;

namespace porter {
namespace transfer {

using logging::kv;

namespace {

void logFailure(const TransferError& e) {
  PORTER_LOG_ERROR(
    e.what() << kv("kind", errorKindName(e.kind())) << kv("provider_code", e.providerCode())
  );
}

/**
 * Run fn with the operation/key logging context attached and log any
 * TransferError at ERROR before it propagates.
 *
 * Errors raised by an inner step (a remote call, key parsing) leave
 * tagged with the public operation; the step name moves into the message.
 */
template <typename Fn>
auto logged(const char* operation, const std::string& key, Fn&& fn) -> decltype(fn()) {
  PORTER_LOG_SCOPED_CONTEXT(operation, key);
  try {
    return fn();
  } catch (const TransferError& e) {
    if (e.operation() == operation) {
      logFailure(e);
      throw;
    }
    TransferError tagged(
      e.kind(), operation, e.operation() + ": " + e.message(), e.providerCode()
    );
    logFailure(tagged);
    throw tagged;
  }
}

TransferError localIoError(const std::string& operation, const std::string& message) {
  return TransferError(ErrorKind::Generic, operation, message, "LocalIOError");
}

}  // namespace

// ============================================================================
// DownloadStream
// ============================================================================

DownloadStream::DownloadStream(std::unique_ptr<IObjectBody> body, std::string key, size_t chunk_size)
    : body_(std::move(body))
    , key_(std::move(key))
    , chunk_size_(chunk_size == 0 ? 64 * 1024 : chunk_size) {}

std::optional<Bytes> DownloadStream::next() {
  if (finished_ || !body_) {
    return std::nullopt;
  }
  Bytes chunk;
  try {
    chunk = body_->read(chunk_size_);
  } catch (const std::exception& e) {
    finished_ = true;
    TransferError error = ErrorClassifier::classify(e, "download_stream");
    PORTER_LOG_ERROR(error.what() << kv("key", key_));
    throw error;
  }
  if (chunk.empty()) {
    finished_ = true;
    return std::nullopt;
  }
  return chunk;
}

uint64_t DownloadStream::contentLength() const {
  return body_ ? body_->contentLength() : 0;
}

// ============================================================================
// TransferEngine
// ============================================================================

TransferEngine::TransferEngine(
  std::unique_ptr<IRemoteStore> store, const TransferConfig& config,
  std::shared_ptr<IFileSystem> filesystem, std::shared_ptr<IFileStreamFactory> stream_factory
)
    : store_(std::move(store))
    , config_(config)
    , filesystem_(std::move(filesystem))
    , stream_factory_(std::move(stream_factory))
    , retry_handler_(config.retry)
    , cache_(config.metadata_cache_ttl) {
  if (!store_) {
    throw std::invalid_argument("TransferEngine requires a remote store");
  }
  if (config_.multipart_chunk_size == 0) {
    throw std::invalid_argument("multipart_chunk_size must be positive");
  }
  if (!filesystem_) {
    filesystem_ = std::make_shared<FileSystemImpl>();
  }
  if (!stream_factory_) {
    stream_factory_ = std::make_shared<FileStreamFactoryImpl>();
  }

  retry_handler_.setRetryListener(
    [](int attempt, std::chrono::milliseconds delay, const std::exception& error) {
      PORTER_LOG_WARN(
        "Remote call failed, retrying" << kv("attempt", attempt) << kv("delay_ms", delay.count())
                                       << kv("error", std::string(error.what()))
      );
    }
  );
  if (config_.retry.skip_permanent_errors) {
    retry_handler_.setRetryPredicate([](const std::exception& error) {
      return !ErrorClassifier::isPermanent(ErrorClassifier::classify(error, "retry").kind());
    });
  }
}

TransferEngine::~TransferEngine() = default;

const std::string& TransferEngine::bucket() const {
  return store_->bucket();
}

template <typename Call>
auto TransferEngine::remote(const std::string& operation, Call&& call) -> decltype(call()) {
  try {
    return retry_handler_.execute(std::forward<Call>(call));
  } catch (const std::exception& e) {
    throw ErrorClassifier::classify(e, operation);
  }
}

void TransferEngine::checkSize(uint64_t size, const std::string& operation) const {
  if (size > config_.max_object_size) {
    throw TransferError(
      ErrorKind::SizeExceeded, operation,
      "object size " + formatFileSize(size) + " exceeds limit " +
        formatFileSize(config_.max_object_size)
    );
  }
}

// ----------------------------------------------------------------------------
// Uploads
// ----------------------------------------------------------------------------

UploadResult TransferEngine::upload(
  const std::string& local_path, const std::string& key, const UploadOptions& options
) {
  const std::string raw_key = key.empty() ? fs::path(local_path).filename().string() : key;
  return logged("upload", raw_key, [&] {
    const ObjectKey object_key = ObjectKey::parse(raw_key);

    if (!filesystem_->is_regular_file(local_path)) {
      throw TransferError(
        ErrorKind::NotFound, "upload", "local file not found: " + local_path, "LocalFileNotFound"
      );
    }
    uint64_t size = 0;
    try {
      size = filesystem_->file_size(local_path);
    } catch (const std::exception& e) {
      throw localIoError("upload", "cannot stat " + local_path + ": " + e.what());
    }
    checkSize(size, "upload");

    PutObjectRequest request;
    request.key = object_key.str();
    request.content_type = options.content_type ? *options.content_type
                                                : detectContentType(object_key.str());
    request.metadata = normalizeMetadataKeys(options.metadata);

    auto input = stream_factory_->open_input(local_path);
    if (!input) {
      throw localIoError("upload", "cannot open " + local_path);
    }

    ProgressTracker tracker(size, options.observer);
    UploadResult result = size >= config_.multipart_threshold
                            ? uploadMultipart(object_key, *input, size, request, tracker)
                            : uploadSimple(object_key, *input, size, request, tracker);
    tracker.complete();
    cache_.invalidate(object_key.str());

    PORTER_LOG_INFO(
      "Upload complete" << kv("key", object_key.str()) << kv("size", formatFileSize(size))
                        << kv("type", uploadTypeName(result.upload_type))
                        << kv("parts", result.total_parts)
    );
    return result;
  });
}

UploadResult TransferEngine::uploadSimple(
  const ObjectKey& key, IInputFile& input, uint64_t size, const PutObjectRequest& request,
  ProgressTracker& tracker
) {
  Bytes body;
  if (!input.read_at(0, size, body)) {
    throw localIoError("upload", "short read on local file for " + key.str());
  }

  UploadResult result;
  result.key = key.str();
  result.size = size;
  result.upload_type = UploadType::Simple;
  result.etag = remote("put_object", [&] {
    return store_->putObject(request, body);
  });
  result.upload_time = std::chrono::system_clock::now();
  tracker.update(size);
  return result;
}

UploadResult TransferEngine::uploadMultipart(
  const ObjectKey& key, IInputFile& input, uint64_t size, const PutObjectRequest& request,
  ProgressTracker& tracker
) {
  std::string upload_id;
  try {
    upload_id = remote("create_multipart_upload", [&] {
      return store_->createMultipartUpload(request);
    });
  } catch (const TransferError& e) {
    throw TransferError(
      ErrorKind::MultipartFailure, "upload",
      std::string("initiate failed [") + errorKindName(e.kind()) + "]: " + e.message(),
      e.providerCode()
    );
  }

  UploadSession session(upload_id, key.str(), size, config_.multipart_chunk_size);
  PORTER_LOG_INFO(
    "Multipart session initiated" << kv("key", key.str()) << kv("upload_id", upload_id)
                                  << kv("parts", session.totalParts())
  );

  std::string etag;
  try {
    std::string error_msg;
    if (!session.transitionTo(SessionState::PartsUploading, error_msg)) {
      throw TransferError(ErrorKind::MultipartFailure, "upload", error_msg);
    }
    uploadParts(session, input, tracker);

    if (!session.transitionTo(SessionState::Completing, error_msg)) {
      throw TransferError(ErrorKind::MultipartFailure, "upload", error_msg);
    }
    const std::vector<CompletedPart> parts = session.completedParts();
    etag = remote("complete_multipart_upload", [&] {
      return store_->completeMultipartUpload(key.str(), upload_id, parts);
    });

    if (!session.transitionTo(SessionState::Completed, error_msg)) {
      throw TransferError(ErrorKind::MultipartFailure, "upload", error_msg);
    }
  } catch (const TransferError& e) {
    abortSession(session);
    if (e.kind() == ErrorKind::MultipartFailure) {
      throw;
    }
    throw TransferError(
      ErrorKind::MultipartFailure, "upload",
      std::string("[") + errorKindName(e.kind()) + "] " + e.message(), e.providerCode()
    );
  }

  PORTER_LOG_INFO(
    "Multipart session completed" << kv("key", key.str()) << kv("upload_id", upload_id)
  );

  UploadResult result;
  result.key = key.str();
  result.size = size;
  result.upload_type = UploadType::Multipart;
  result.etag = etag;
  result.total_parts = session.totalParts();
  result.upload_time = std::chrono::system_clock::now();
  return result;
}

void TransferEngine::uploadParts(
  UploadSession& session, IInputFile& input, ProgressTracker& tracker
) {
  const int total_parts = session.totalParts();
  const int worker_count = std::max(1, std::min(config_.max_concurrent_uploads, total_parts));

  std::atomic<int> next_index{0};
  std::atomic<bool> stop{false};
  std::mutex error_mutex;
  std::optional<TransferError> first_error;

  auto worker = [&] {
    while (!stop.load()) {
      const int index = next_index.fetch_add(1);
      if (index >= total_parts) {
        return;
      }
      const PartRange range = session.partRange(index);
      try {
        Bytes body;
        if (!input.read_at(range.offset, range.length, body)) {
          throw localIoError(
            "upload_part", "short read at offset " + std::to_string(range.offset)
          );
        }
        const std::string etag = remote("upload_part", [&] {
          return store_->uploadPart(session.key(), session.uploadId(), range.part_number, body);
        });
        session.recordPart(range.part_number, etag);
        tracker.update(range.length);
        PORTER_LOG_DEBUG(
          "Part uploaded" << kv("part", range.part_number) << kv("bytes", range.length)
        );
        PORTER_LOG_INFO_THROTTLE(
          5, "Multipart progress" << kv("key", session.key()) << kv("part", range.part_number)
                                  << kv("total_parts", total_parts)
        );
      } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!first_error) {
          first_error = ErrorClassifier::classify(e, "upload_part");
        }
        stop.store(true);
      }
    }
  };

  std::vector<std::thread> workers;
  workers.reserve(static_cast<size_t>(worker_count));
  try {
    for (int i = 0; i < worker_count; ++i) {
      workers.emplace_back(worker);
    }
  } catch (const std::system_error& e) {
    stop.store(true);
    for (auto& t : workers) {
      t.join();
    }
    throw TransferError(
      ErrorKind::Generic, "upload_part", std::string("cannot start part workers: ") + e.what(),
      "InternalError"
    );
  }
  for (auto& t : workers) {
    t.join();
  }

  if (first_error) {
    throw *first_error;
  }
}

void TransferEngine::abortSession(UploadSession& session) {
  std::string error_msg;
  if (!session.transitionTo(SessionState::Aborted, error_msg)) {
    PORTER_LOG_WARN(error_msg << kv("upload_id", session.uploadId()));
  }
  try {
    remote("abort_multipart_upload", [&] {
      store_->abortMultipartUpload(session.key(), session.uploadId());
    });
    PORTER_LOG_INFO(
      "Multipart session aborted" << kv("key", session.key())
                                  << kv("upload_id", session.uploadId())
    );
  } catch (const TransferError& e) {
    // The upload error is what the caller sees; the orphaned session is only logged.
    PORTER_LOG_ERROR(
      "Abort of multipart session failed" << kv("upload_id", session.uploadId())
                                          << kv("error", std::string(e.what()))
    );
  }
}

UploadResult TransferEngine::uploadStream(
  const Bytes& data, const std::string& key, const StreamUploadOptions& options
) {
  return logged("upload_stream", key, [&] {
    const ObjectKey object_key = ObjectKey::parse(key);
    checkSize(data.size(), "upload_stream");
    return putBuffer(object_key, data, options);
  });
}

UploadResult TransferEngine::uploadStream(
  const ChunkProducer& producer, const std::string& key, const StreamUploadOptions& options
) {
  return logged("upload_stream", key, [&] {
    const ObjectKey object_key = ObjectKey::parse(key);

    Bytes buffer;
    if (options.content_length) {
      checkSize(*options.content_length, "upload_stream");
      buffer.reserve(static_cast<size_t>(*options.content_length));
    }

    try {
      while (auto chunk = producer()) {
        buffer.insert(buffer.end(), chunk->begin(), chunk->end());
        checkSize(buffer.size(), "upload_stream");
      }
    } catch (const TransferError&) {
      throw;
    } catch (const std::exception& e) {
      throw TransferError(
        ErrorKind::Generic, "upload_stream", std::string("stream read failed: ") + e.what(),
        "StreamReadError"
      );
    }
    return putBuffer(object_key, buffer, options);
  });
}

UploadResult TransferEngine::putBuffer(
  const ObjectKey& key, const Bytes& data, const StreamUploadOptions& options
) {
  PutObjectRequest request;
  request.key = key.str();
  request.content_type = options.content_type.value_or(kDefaultContentType);
  request.metadata = normalizeMetadataKeys(options.metadata);

  UploadResult result;
  result.key = key.str();
  result.size = data.size();
  result.upload_type = UploadType::Stream;
  result.etag = remote("put_object", [&] {
    return store_->putObject(request, data);
  });
  result.upload_time = std::chrono::system_clock::now();
  cache_.invalidate(key.str());

  PORTER_LOG_INFO(
    "Stream upload complete" << kv("key", key.str()) << kv("size", formatFileSize(data.size()))
  );
  return result;
}

// ----------------------------------------------------------------------------
// Downloads
// ----------------------------------------------------------------------------

DownloadStream TransferEngine::downloadStream(
  const std::string& key, std::optional<uint64_t> start_byte, std::optional<uint64_t> end_byte
) {
  return logged("download_stream", key, [&] {
    const ObjectKey object_key = ObjectKey::parse(key);
    std::optional<ByteRange> range;
    if (start_byte || end_byte) {
      range = ByteRange{start_byte.value_or(0), end_byte};
      if (range->end && *range->end < range->start) {
        throw TransferError(
          ErrorKind::Generic, "download_stream", "range end precedes start: " + range->header(),
          "InvalidRange"
        );
      }
    }
    return openStream(object_key, range);
  });
}

DownloadStream TransferEngine::openStream(
  const ObjectKey& key, const std::optional<ByteRange>& range
) {
  auto body = remote("get_object", [&] {
    return store_->getObject(key.str(), range);
  });
  return DownloadStream(std::move(body), key.str(), config_.download_chunk_size);
}

DownloadResult TransferEngine::downloadFile(
  const std::string& key, const std::string& destination, IProgressObserver* observer
) {
  return logged("download_file", key, [&] {
    const ObjectKey object_key = ObjectKey::parse(key);
    const FileInfo info = lookupFileInfo(object_key, true);

    const fs::path parent = fs::path(destination).parent_path();
    if (!parent.empty() && !filesystem_->create_directories(parent.string())) {
      throw localIoError("download_file", "cannot create directory " + parent.string());
    }
    auto output = stream_factory_->open_output(destination);
    if (!output) {
      throw localIoError("download_file", "cannot open " + destination + " for writing");
    }

    ProgressTracker tracker(info.size, observer);
    DownloadStream stream = openStream(object_key, std::nullopt);
    uint64_t written = 0;
    while (auto chunk = stream.next()) {
      if (!output->write(*chunk)) {
        throw localIoError("download_file", "write failed on " + destination);
      }
      written += chunk->size();
      tracker.update(chunk->size());
    }
    if (!output->close()) {
      throw localIoError("download_file", "close failed on " + destination);
    }

    PORTER_LOG_INFO(
      "Download complete" << kv("key", object_key.str()) << kv("path", destination)
                          << kv("size", formatFileSize(written))
    );

    DownloadResult result;
    result.key = object_key.str();
    result.local_path = destination;
    result.size = written;
    result.download_time = std::chrono::system_clock::now();
    return result;
  });
}

// ----------------------------------------------------------------------------
// Metadata and listing
// ----------------------------------------------------------------------------

FileInfo TransferEngine::lookupFileInfo(const ObjectKey& key, bool use_cache) {
  if (use_cache && config_.enable_metadata_cache) {
    if (auto cached = cache_.get(key.str())) {
      PORTER_LOG_DEBUG("Metadata cache hit" << kv("key", key.str()));
      return *cached;
    }
  }
  const uint64_t generation = cache_.generation();
  FileInfo info = remote("head_object", [&] {
    return store_->headObject(key.str());
  });
  info.key = key.str();
  if (config_.enable_metadata_cache && !cache_.putIfUnchanged(key.str(), info, generation)) {
    PORTER_LOG_DEBUG("Metadata invalidated during lookup, not cached" << kv("key", key.str()));
  }
  return info;
}

FileInfo TransferEngine::getFileInfo(const std::string& key, bool use_cache) {
  return logged("get_file_info", key, [&] {
    return lookupFileInfo(ObjectKey::parse(key), use_cache);
  });
}

bool TransferEngine::fileExists(const std::string& key) {
  return logged("file_exists", key, [&] {
    const ObjectKey object_key = ObjectKey::parse(key);
    try {
      remote("head_object", [&] {
        return store_->headObject(object_key.str());
      });
      return true;
    } catch (const TransferError& e) {
      if (e.kind() == ErrorKind::NotFound) {
        return false;
      }
      throw;
    }
  });
}

FileListPage TransferEngine::listFiles(
  const std::string& prefix, int max_keys, const std::optional<std::string>& continuation_token
) {
  return logged("list_files", prefix, [&] {
    ListObjectsRequest request;
    request.prefix = KeyNormalizer::sanitizePrefix(prefix);
    request.max_keys = std::max(1, std::min(max_keys, kMaxListKeys));
    request.continuation_token = continuation_token;

    ListObjectsResult listing = remote("list_objects", [&] {
      return store_->listObjectsV2(request);
    });

    FileListPage page;
    page.files = std::move(listing.objects);
    page.is_truncated = listing.is_truncated;
    page.next_continuation_token = std::move(listing.next_continuation_token);
    page.prefix = request.prefix;
    return page;
  });
}

// ----------------------------------------------------------------------------
// Deletes, copies, moves
// ----------------------------------------------------------------------------

void TransferEngine::deleteObject(const ObjectKey& key) {
  remote("delete_object", [&] {
    store_->deleteObject(key.str());
  });
  cache_.invalidate(key.str());
  PORTER_LOG_INFO("Object deleted" << kv("key", key.str()));
}

bool TransferEngine::deleteFile(const std::string& key) {
  return logged("delete_file", key, [&] {
    deleteObject(ObjectKey::parse(key));
    return true;
  });
}

std::map<std::string, bool> TransferEngine::deleteFiles(const std::vector<std::string>& keys) {
  return logged("delete_files", std::to_string(keys.size()) + " keys", [&] {
    if (keys.size() > kMaxDeleteKeys) {
      throw TransferError(
        ErrorKind::Generic, "delete_files",
        "at most " + std::to_string(kMaxDeleteKeys) + " keys per batch, got " +
          std::to_string(keys.size()),
        "TooManyKeys"
      );
    }
    std::map<std::string, bool> results;
    if (keys.empty()) {
      return results;
    }

    std::vector<std::string> normalized;
    std::unordered_map<std::string, std::vector<std::string>> callers;
    normalized.reserve(keys.size());
    for (const auto& raw : keys) {
      const std::string object_key = ObjectKey::parse(raw).str();
      auto& origin = callers[object_key];
      if (origin.empty()) {
        normalized.push_back(object_key);
      }
      origin.push_back(raw);
    }

    const DeleteObjectsResult outcome = remote("delete_objects", [&] {
      return store_->deleteObjects(normalized);
    });

    auto mark = [&](const std::string& object_key, bool deleted) {
      auto it = callers.find(object_key);
      if (it == callers.end()) {
        return;
      }
      for (const auto& raw : it->second) {
        results[raw] = deleted;
      }
      if (deleted) {
        cache_.invalidate(object_key);
      }
    };

    for (const auto& key : outcome.deleted) {
      mark(key, true);
    }
    for (const auto& error : outcome.errors) {
      PORTER_LOG_ERROR(
        "Batch delete failed for key" << kv("key", error.key) << kv("code", error.code)
                                      << kv("message", error.message)
      );
      mark(error.key, false);
    }
    for (const auto& object_key : normalized) {
      if (results.count(callers[object_key].front()) == 0) {
        PORTER_LOG_DEBUG("Key not reported by batch delete, assuming deleted" << kv("key", object_key));
        mark(object_key, true);
      }
    }

    PORTER_LOG_INFO(
      "Batch delete finished" << kv("requested", keys.size())
                              << kv("failed", outcome.errors.size())
    );
    return results;
  });
}

CopyResult TransferEngine::copyObject(
  const std::string& source_key, const std::string& destination_key,
  const std::optional<std::string>& source_bucket
) {
  const ObjectKey source = ObjectKey::parse(source_key);
  const ObjectKey destination = ObjectKey::parse(destination_key);

  CopyObjectRequest request;
  request.source_bucket = source_bucket.value_or(store_->bucket());
  request.source_key = source.str();
  request.destination_key = destination.str();

  CopyResult result;
  result.etag = remote("copy_object", [&] {
    return store_->copyObject(request);
  });
  cache_.invalidate(destination.str());

  result.source_key = source.str();
  result.destination_key = destination.str();
  result.source_bucket = request.source_bucket;
  result.destination_bucket = store_->bucket();
  result.copy_time = std::chrono::system_clock::now();
  PORTER_LOG_INFO(
    "Object copied" << kv("from", result.source_bucket + "/" + result.source_key)
                    << kv("to", result.destination_key)
  );
  return result;
}

CopyResult TransferEngine::copyFile(
  const std::string& source_key, const std::string& destination_key,
  const std::optional<std::string>& source_bucket
) {
  return logged("copy_file", destination_key, [&] {
    return copyObject(source_key, destination_key, source_bucket);
  });
}

MoveResult TransferEngine::moveFile(
  const std::string& source_key, const std::string& destination_key
) {
  return logged("move_file", source_key, [&] {
    MoveResult result;
    result.copy = copyObject(source_key, destination_key, std::nullopt);
    try {
      deleteObject(ObjectKey::parse(source_key));
    } catch (const TransferError&) {
      PORTER_LOG_WARN(
        "Move copied the object but could not delete the source"
        << kv("source", result.copy.source_key) << kv("destination", result.copy.destination_key)
      );
      throw;
    }
    result.move_time = std::chrono::system_clock::now();
    return result;
  });
}

// ----------------------------------------------------------------------------
// Presigned URLs and metadata updates
// ----------------------------------------------------------------------------

std::string TransferEngine::generatePresignedUrl(
  const std::string& key, PresignOperation operation, std::optional<int64_t> expiry_seconds
) {
  return logged("generate_presigned_url", key, [&] {
    const ObjectKey object_key = ObjectKey::parse(key);
    const int64_t expiry = expiry_seconds.value_or(config_.default_presigned_url_expiry.count());
    if (expiry <= 0 || expiry > config_.max_presigned_url_expiry.count()) {
      throw TransferError(
        ErrorKind::Generic, "generate_presigned_url",
        "expiry " + std::to_string(expiry) + "s outside (0, " +
          std::to_string(config_.max_presigned_url_expiry.count()) + "]",
        "InvalidExpiry"
      );
    }
    return remote("generate_presigned_url", [&] {
      return store_->generatePresignedUrl(object_key.str(), operation, expiry);
    });
  });
}

UpdateResult TransferEngine::updateMetadata(
  const std::string& key, const Metadata& metadata, const std::optional<std::string>& content_type
) {
  return logged("update_metadata", key, [&] {
    const ObjectKey object_key = ObjectKey::parse(key);
    const FileInfo current = lookupFileInfo(object_key, false);

    CopyObjectRequest request;
    request.source_bucket = store_->bucket();
    request.source_key = object_key.str();
    request.destination_key = object_key.str();
    request.replace_metadata = true;
    request.metadata = normalizeMetadataKeys(metadata);
    if (content_type) {
      request.content_type = *content_type;
    } else if (!current.content_type.empty()) {
      request.content_type = current.content_type;
    } else {
      request.content_type = kDefaultContentType;
    }

    UpdateResult result;
    result.etag = remote("copy_object", [&] {
      return store_->copyObject(request);
    });
    cache_.invalidate(object_key.str());

    result.key = object_key.str();
    result.updated_metadata = request.metadata;
    result.update_time = std::chrono::system_clock::now();
    PORTER_LOG_INFO(
      "Metadata replaced" << kv("key", object_key.str()) << kv("entries", request.metadata.size())
    );
    return result;
  });
}

void TransferEngine::clearMetadataCache() {
  const size_t entries = cache_.size();
  cache_.clear();
  PORTER_LOG_INFO("Metadata cache cleared" << kv("entries", entries));
}

}  // namespace transfer
}  // namespace porter
