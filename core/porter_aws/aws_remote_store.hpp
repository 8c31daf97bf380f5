// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PORTER_AWS_REMOTE_STORE_HPP
#define PORTER_AWS_REMOTE_STORE_HPP

#include <memory>
#include <string>
#include <vector>

#include "remote_store.hpp"

namespace porter {
namespace transfer {

/**
 * Connection settings for AwsRemoteStore
 */
struct AwsStoreConfig {
  std::string endpoint_url;  // e.g. "http://localhost:9000"; empty for AWS S3
  std::string bucket;
  std::string region = "us-east-1";
  bool use_ssl = true;
  bool verify_ssl = true;

  // Empty values fall back to AWS_ACCESS_KEY_ID / AWS_SECRET_ACCESS_KEY
  std::string access_key;
  std::string secret_key;

  int connect_timeout_ms = 60000;
  int request_timeout_ms = 300000;

  // Connection pool ceiling; set to max_concurrent_uploads
  int max_connections = 10;
};

/**
 * IRemoteStore over the AWS SDK for C++ (Aws::S3::S3Client).
 *
 * Works with AWS S3 and S3-compatible services such as MinIO; a custom
 * endpoint switches to path-style addressing. SDK-internal retries are
 * disabled since TransferEngine retries on its own.
 *
 * SDK errors become RemoteStoreError carrying the S3 error code. A HEAD
 * 404 without a code is reported as NoSuchKey; requests that never got a
 * response are marked as transport failures.
 */
class AwsRemoteStore : public IRemoteStore {
public:
  explicit AwsRemoteStore(const AwsStoreConfig& config);
  ~AwsRemoteStore() override;

  AwsRemoteStore(const AwsRemoteStore&) = delete;
  AwsRemoteStore& operator=(const AwsRemoteStore&) = delete;
  AwsRemoteStore(AwsRemoteStore&&) = delete;
  AwsRemoteStore& operator=(AwsRemoteStore&&) = delete;

  std::string putObject(const PutObjectRequest& request, const Bytes& body) override;

  std::unique_ptr<IObjectBody> getObject(
    const std::string& key, const std::optional<ByteRange>& range
  ) override;

  FileInfo headObject(const std::string& key) override;

  ListObjectsResult listObjectsV2(const ListObjectsRequest& request) override;

  void deleteObject(const std::string& key) override;

  DeleteObjectsResult deleteObjects(const std::vector<std::string>& keys) override;

  std::string copyObject(const CopyObjectRequest& request) override;

  std::string createMultipartUpload(const PutObjectRequest& request) override;

  std::string uploadPart(
    const std::string& key, const std::string& upload_id, int part_number, const Bytes& body
  ) override;

  std::string completeMultipartUpload(
    const std::string& key, const std::string& upload_id,
    const std::vector<CompletedPart>& parts
  ) override;

  void abortMultipartUpload(const std::string& key, const std::string& upload_id) override;

  std::string generatePresignedUrl(
    const std::string& key, PresignOperation operation, int64_t expiry_seconds
  ) override;

  const std::string& bucket() const override;

  const std::string& endpoint() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace transfer
}  // namespace porter

#endif  // PORTER_AWS_REMOTE_STORE_HPP
