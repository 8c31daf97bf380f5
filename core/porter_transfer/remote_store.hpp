// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PORTER_REMOTE_STORE_HPP
#define PORTER_REMOTE_STORE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "transfer_types.hpp"

namespace porter {
namespace transfer {

/**
 * Failure reported by a remote store call.
 *
 * code is the provider's machine-readable error code ("NoSuchKey",
 * "SlowDown", ...). transportFailure marks calls that never got an HTTP
 * response (connection refused, DNS, timeouts).
 */
class RemoteStoreError : public std::runtime_error {
public:
  RemoteStoreError(
    std::string code, const std::string& message, int http_status = 0,
    bool transport_failure = false
  )
      : std::runtime_error(message)
      , code_(std::move(code))
      , http_status_(http_status)
      , transport_failure_(transport_failure) {}

  const std::string& code() const {
    return code_;
  }

  int httpStatus() const {
    return http_status_;
  }

  bool transportFailure() const {
    return transport_failure_;
  }

private:
  std::string code_;
  int http_status_;
  bool transport_failure_;
};

/**
 * Inclusive byte range for ranged GETs. An absent end means "to the end
 * of the object".
 */
struct ByteRange {
  uint64_t start = 0;
  std::optional<uint64_t> end;

  /**
   * HTTP Range header value, "bytes=<start>-[<end>]".
   */
  std::string header() const {
    std::string value = "bytes=" + std::to_string(start) + "-";
    if (end) {
      value += std::to_string(*end);
    }
    return value;
  }
};

/**
 * Incremental reader over a GET response body.
 */
class IObjectBody {
public:
  virtual ~IObjectBody() = default;

  /**
   * Read up to max_bytes. An empty result means the body is exhausted.
   * Throws RemoteStoreError if the connection fails mid-body.
   */
  virtual Bytes read(size_t max_bytes) = 0;

  /**
   * Content-Length of the response (the range length for ranged GETs).
   */
  virtual uint64_t contentLength() const = 0;
};

struct PutObjectRequest {
  std::string key;
  std::string content_type;
  Metadata metadata;
};

struct ListObjectsRequest {
  std::string prefix;
  int max_keys = 1000;
  std::optional<std::string> continuation_token;
};

struct ListObjectsResult {
  std::vector<ObjectSummary> objects;
  bool is_truncated = false;
  std::optional<std::string> next_continuation_token;
};

struct DeleteObjectError {
  std::string key;
  std::string code;
  std::string message;
};

struct DeleteObjectsResult {
  std::vector<std::string> deleted;
  std::vector<DeleteObjectError> errors;
};

struct CopyObjectRequest {
  std::string source_bucket;
  std::string source_key;
  std::string destination_key;
  // When set, metadata and content_type replace the source object's.
  bool replace_metadata = false;
  Metadata metadata;
  std::string content_type;
};

/**
 * Abstract S3-style object store.
 *
 * All calls throw RemoteStoreError on failure. Implementations must be
 * safe to call from several threads at once: multipart part uploads run
 * concurrently against the same store.
 */
class IRemoteStore {
public:
  virtual ~IRemoteStore() = default;

  /**
   * @return ETag of the stored object, quotes stripped
   */
  virtual std::string putObject(const PutObjectRequest& request, const Bytes& body) = 0;

  virtual std::unique_ptr<IObjectBody> getObject(
    const std::string& key, const std::optional<ByteRange>& range
  ) = 0;

  /**
   * Returns FileInfo with key, size and headers filled in. A missing
   * object throws RemoteStoreError with code "NoSuchKey".
   */
  virtual FileInfo headObject(const std::string& key) = 0;

  virtual ListObjectsResult listObjectsV2(const ListObjectsRequest& request) = 0;

  virtual void deleteObject(const std::string& key) = 0;

  virtual DeleteObjectsResult deleteObjects(const std::vector<std::string>& keys) = 0;

  /**
   * @return ETag of the new object
   */
  virtual std::string copyObject(const CopyObjectRequest& request) = 0;

  /**
   * @return Upload id of the new multipart session
   */
  virtual std::string createMultipartUpload(const PutObjectRequest& request) = 0;

  /**
   * @return ETag of the uploaded part
   */
  virtual std::string uploadPart(
    const std::string& key, const std::string& upload_id, int part_number, const Bytes& body
  ) = 0;

  virtual std::string completeMultipartUpload(
    const std::string& key, const std::string& upload_id, const std::vector<CompletedPart>& parts
  ) = 0;

  virtual void abortMultipartUpload(const std::string& key, const std::string& upload_id) = 0;

  virtual std::string generatePresignedUrl(
    const std::string& key, PresignOperation operation, int64_t expiry_seconds
  ) = 0;

  virtual const std::string& bucket() const = 0;
};

}  // namespace transfer
}  // namespace porter

#endif  // PORTER_REMOTE_STORE_HPP
