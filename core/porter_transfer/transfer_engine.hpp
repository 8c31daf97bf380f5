// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PORTER_TRANSFER_ENGINE_HPP
#define PORTER_TRANSFER_ENGINE_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "key_normalizer.hpp"
#include "local_io_interfaces.hpp"
#include "metadata_cache.hpp"
#include "progress_tracker.hpp"
#include "remote_store.hpp"
#include "retry_handler.hpp"
#include "transfer_config.hpp"
#include "transfer_error.hpp"
#include "transfer_types.hpp"

namespace porter {
namespace transfer {

class UploadSession;

/**
 * Lazy, finite sequence of byte chunks from one GET.
 *
 * Move-only and not restartable: resuming after partial consumption takes
 * a new downloadStream() call with an adjusted range.
 */
class DownloadStream {
public:
  DownloadStream(
    std::unique_ptr<IObjectBody> body, std::string key, size_t chunk_size
  );

  DownloadStream(DownloadStream&&) = default;
  DownloadStream& operator=(DownloadStream&&) = default;
  DownloadStream(const DownloadStream&) = delete;
  DownloadStream& operator=(const DownloadStream&) = delete;

  /**
   * Next chunk, or std::nullopt once the body is exhausted.
   *
   * @throws TransferError if the connection fails mid-body
   */
  std::optional<Bytes> next();

  /**
   * Content-Length reported for this response.
   */
  uint64_t contentLength() const;

  const std::string& key() const {
    return key_;
  }

private:
  std::unique_ptr<IObjectBody> body_;
  std::string key_;
  size_t chunk_size_;
  bool finished_ = false;
};

/**
 * Client-side transfer engine over an S3-style object store.
 *
 * Every operation is a blocking call that returns a result record or
 * throws TransferError. Keys are normalized with ObjectKey::parse before
 * any remote call; remote calls run under the configured RetryHandler.
 *
 * Uploads at or above multipart_threshold go through the multipart
 * protocol with up to max_concurrent_uploads parts in flight.
 *
 * Thread-safe: independent operations may run concurrently on one engine.
 */
class TransferEngine {
public:
  /**
   * @param store Remote store, owned by the engine
   * @param config Transfer settings
   * @param filesystem Local filesystem (std::filesystem when null)
   * @param stream_factory Local file streams (fstream when null)
   */
  explicit TransferEngine(
    std::unique_ptr<IRemoteStore> store, const TransferConfig& config = {},
    std::shared_ptr<IFileSystem> filesystem = nullptr,
    std::shared_ptr<IFileStreamFactory> stream_factory = nullptr
  );
  ~TransferEngine();

  TransferEngine(const TransferEngine&) = delete;
  TransferEngine& operator=(const TransferEngine&) = delete;
  TransferEngine(TransferEngine&&) = delete;
  TransferEngine& operator=(TransferEngine&&) = delete;

  /**
   * Upload a local file.
   *
   * @param local_path File to upload; must exist (NotFound otherwise)
   * @param key Destination key; empty uses the file name
   * @param options Content type (detected from the key when absent),
   *                custom metadata and an optional progress observer
   */
  UploadResult upload(
    const std::string& local_path, const std::string& key, const UploadOptions& options = {}
  );

  /**
   * Upload an in-memory buffer with a single put.
   */
  UploadResult uploadStream(
    const Bytes& data, const std::string& key, const StreamUploadOptions& options = {}
  );

  /**
   * Drain producer into memory, then upload it with a single put.
   * A declared content_length above max_object_size fails before any
   * chunk is pulled.
   */
  UploadResult uploadStream(
    const ChunkProducer& producer, const std::string& key,
    const StreamUploadOptions& options = {}
  );

  /**
   * Start a GET, optionally ranged (bytes=start-end, both inclusive).
   */
  DownloadStream downloadStream(
    const std::string& key, std::optional<uint64_t> start_byte = std::nullopt,
    std::optional<uint64_t> end_byte = std::nullopt
  );

  /**
   * Download key to destination, creating parent directories.
   */
  DownloadResult downloadFile(
    const std::string& key, const std::string& destination,
    IProgressObserver* observer = nullptr
  );

  /**
   * HEAD the object, consulting the metadata cache first when use_cache
   * is set and caching is enabled.
   */
  FileInfo getFileInfo(const std::string& key, bool use_cache = true);

  /**
   * False when the store reports the key missing; other failures throw.
   */
  bool fileExists(const std::string& key);

  /**
   * One page of keys under prefix. max_keys is clamped to [1, 1000].
   */
  FileListPage listFiles(
    const std::string& prefix = "", int max_keys = kMaxListKeys,
    const std::optional<std::string>& continuation_token = std::nullopt
  );

  bool deleteFile(const std::string& key);

  /**
   * Batch delete of up to 1000 keys.
   *
   * Keys the store reports as errors map to false. Keys it reports as
   * deleted, or does not mention at all, map to true.
   */
  std::map<std::string, bool> deleteFiles(const std::vector<std::string>& keys);

  /**
   * Server-side copy into this engine's bucket.
   *
   * @param source_bucket Defaults to this engine's bucket
   */
  CopyResult copyFile(
    const std::string& source_key, const std::string& destination_key,
    const std::optional<std::string>& source_bucket = std::nullopt
  );

  /**
   * Copy, then delete the source. A failed delete leaves both objects in
   * place and throws.
   */
  MoveResult moveFile(const std::string& source_key, const std::string& destination_key);

  /**
   * @param expiry_seconds Defaults to default_presigned_url_expiry; must be
   *        in (0, max_presigned_url_expiry]
   */
  std::string generatePresignedUrl(
    const std::string& key, PresignOperation operation,
    std::optional<int64_t> expiry_seconds = std::nullopt
  );

  /**
   * Replace the custom metadata (and optionally the content type) with a
   * copy onto the same key.
   */
  UpdateResult updateMetadata(
    const std::string& key, const Metadata& metadata,
    const std::optional<std::string>& content_type = std::nullopt
  );

  void clearMetadataCache();

  const TransferConfig& config() const {
    return config_;
  }

  const std::string& bucket() const;

private:
  UploadResult uploadSimple(
    const ObjectKey& key, IInputFile& input, uint64_t size, const PutObjectRequest& request,
    ProgressTracker& tracker
  );

  UploadResult uploadMultipart(
    const ObjectKey& key, IInputFile& input, uint64_t size, const PutObjectRequest& request,
    ProgressTracker& tracker
  );

  UploadResult putBuffer(
    const ObjectKey& key, const Bytes& data, const StreamUploadOptions& options
  );

  void uploadParts(UploadSession& session, IInputFile& input, ProgressTracker& tracker);

  FileInfo lookupFileInfo(const ObjectKey& key, bool use_cache);

  DownloadStream openStream(const ObjectKey& key, const std::optional<ByteRange>& range);

  CopyResult copyObject(
    const std::string& source_key, const std::string& destination_key,
    const std::optional<std::string>& source_bucket
  );

  void deleteObject(const ObjectKey& key);

  void abortSession(UploadSession& session);

  void checkSize(uint64_t size, const std::string& operation) const;

  /**
   * Run call under the retry handler and classify whatever escapes.
   */
  template <typename Call>
  auto remote(const std::string& operation, Call&& call) -> decltype(call());

  std::unique_ptr<IRemoteStore> store_;
  TransferConfig config_;
  std::shared_ptr<IFileSystem> filesystem_;
  std::shared_ptr<IFileStreamFactory> stream_factory_;
  RetryHandler retry_handler_;
  MetadataCache cache_;
};

}  // namespace transfer
}  // namespace porter

#endif  // PORTER_TRANSFER_ENGINE_HPP
