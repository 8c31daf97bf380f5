// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "aws_remote_store.hpp"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/http/HttpTypes.h>
#include <aws/core/utils/DateTime.h>
#include <aws/core/utils/StringUtils.h>
#include <aws/core/utils/memory/stl/AWSStringStream.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/CopyObjectRequest.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/Delete.h>
#include <aws/s3/model/DeleteObjectRequest.h>
#include <aws/s3/model/DeleteObjectsRequest.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/ListObjectsV2Request.h>
#include <aws/s3/model/ObjectIdentifier.h>
#include <aws/s3/model/ObjectStorageClass.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <aws/s3/model/StorageClass.h>
#include <aws/s3/model/UploadPartRequest.h>

#include <algorithm>
#include <cstdlib>
#include <mutex>

#include "error_classifier.hpp"
#include "transfer_helpers.hpp"

#define PORTER_LOG_COMPONENT "aws_remote_store"
#include <porter_log_macros.hpp>

namespace porter {
namespace transfer {

using logging::kv;

namespace {

// =============================================================================
// SDK lifecycle
// =============================================================================
// Aws::InitAPI / Aws::ShutdownAPI bracket every SDK object in the process.
// Stores share one reference-counted initialization.
// =============================================================================

class AwsSdkManager {
public:
  static AwsSdkManager& instance() {
    static AwsSdkManager instance;
    return instance;
  }

  void addRef() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
      options_.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Off;
      Aws::InitAPI(options_);
      initialized_ = true;
    }
    ++ref_count_;
  }

  void release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ref_count_ > 0 && --ref_count_ == 0 && initialized_) {
      Aws::ShutdownAPI(options_);
      initialized_ = false;
    }
  }

private:
  AwsSdkManager() = default;

  std::mutex mutex_;
  bool initialized_ = false;
  int ref_count_ = 0;
  Aws::SDKOptions options_;
};

RemoteStoreError toStoreError(const Aws::Client::AWSError<Aws::S3::S3Errors>& error) {
  std::string code = error.GetExceptionName().c_str();
  const auto response_code = error.GetResponseCode();
  const int http_status = static_cast<int>(response_code);

  // HEAD responses carry no body, so a missing key surfaces as a bare 404.
  if (error.GetErrorType() == Aws::S3::S3Errors::NO_SUCH_KEY ||
      (code.empty() && response_code == Aws::Http::HttpResponseCode::NOT_FOUND)) {
    code = "NoSuchKey";
  } else if (error.GetErrorType() == Aws::S3::S3Errors::NO_SUCH_BUCKET) {
    code = "NoSuchBucket";
  }

  const bool transport_failure =
    response_code == Aws::Http::HttpResponseCode::REQUEST_NOT_MADE ||
    error.GetErrorType() == Aws::S3::S3Errors::NETWORK_CONNECTION;
  if (code.empty()) {
    code = transport_failure ? "NetworkingError" : "HTTP" + std::to_string(http_status);
  }

  std::string message = error.GetMessage().c_str();
  if (message.empty()) {
    message = code;
  }
  PORTER_LOG_DEBUG(
    "S3 request failed" << kv("code", code) << kv("http_status", http_status)
                        << kv("retryable", transport_failure || ErrorClassifier::isRetryableCode(code))
  );
  return RemoteStoreError(code, message, http_status, transport_failure);
}

std::shared_ptr<Aws::IOStream> toBodyStream(const Bytes& body) {
  auto stream = Aws::MakeShared<Aws::StringStream>("porter");
  stream->write(reinterpret_cast<const char*>(body.data()), static_cast<std::streamsize>(body.size()));
  return stream;
}

Aws::Map<Aws::String, Aws::String> toAwsMetadata(const Metadata& metadata) {
  Aws::Map<Aws::String, Aws::String> out;
  for (const auto& entry : metadata) {
    out[entry.first.c_str()] = entry.second.c_str();
  }
  return out;
}

std::string isoTime(const Aws::Utils::DateTime& time) {
  return time.ToGmtString(Aws::Utils::DateFormat::ISO_8601).c_str();
}

/**
 * Response body of a GET. Owns the SDK result so the stream stays valid.
 */
class AwsObjectBody : public IObjectBody {
public:
  explicit AwsObjectBody(Aws::S3::Model::GetObjectResult result)
      : result_(std::move(result)) {}

  Bytes read(size_t max_bytes) override {
    Bytes chunk(max_bytes);
    auto& body = result_.GetBody();
    body.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(max_bytes));
    if (body.bad()) {
      throw RemoteStoreError("NetworkingError", "response body read failed", 0, true);
    }
    chunk.resize(static_cast<size_t>(body.gcount()));
    return chunk;
  }

  uint64_t contentLength() const override {
    return static_cast<uint64_t>(result_.GetContentLength());
  }

private:
  Aws::S3::Model::GetObjectResult result_;
};

}  // namespace

// =============================================================================
// AwsRemoteStore
// =============================================================================

class AwsRemoteStore::Impl {
public:
  AwsStoreConfig config;
  std::shared_ptr<Aws::S3::S3Client> client;

  Impl() {
    AwsSdkManager::instance().addRef();
  }

  ~Impl() {
    // The client must go before the SDK reference: release() may shut the SDK down.
    client.reset();
    AwsSdkManager::instance().release();
  }

  void initClient() {
    Aws::Client::ClientConfiguration client_config;
    client_config.region = config.region;

    if (!config.endpoint_url.empty()) {
      std::string endpoint = config.endpoint_url;
      if (endpoint.back() == '/') {
        endpoint.pop_back();
      }
      client_config.endpointOverride = endpoint;
    }

    client_config.verifySSL = config.verify_ssl;
    client_config.scheme = config.use_ssl ? Aws::Http::Scheme::HTTPS : Aws::Http::Scheme::HTTP;
    client_config.connectTimeoutMs = config.connect_timeout_ms;
    client_config.requestTimeoutMs = config.request_timeout_ms;
    client_config.maxConnections = static_cast<unsigned>(std::max(1, config.max_connections));
    client_config.retryStrategy =
      Aws::MakeShared<Aws::Client::DefaultRetryStrategy>("porter", 0);

    Aws::Auth::AWSCredentials credentials(config.access_key, config.secret_key);

    // Virtual-hosted addressing for AWS; S3-compatible endpoints need path style.
    const bool use_virtual_addressing = config.endpoint_url.empty();

    client = std::make_shared<Aws::S3::S3Client>(
      credentials, client_config, Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
      use_virtual_addressing
    );
  }
};

AwsRemoteStore::AwsRemoteStore(const AwsStoreConfig& config)
    : impl_(std::make_unique<Impl>()) {
  impl_->config = config;

  if (impl_->config.access_key.empty()) {
    if (const char* key = std::getenv("AWS_ACCESS_KEY_ID")) {
      impl_->config.access_key = key;
    }
  }
  if (impl_->config.secret_key.empty()) {
    if (const char* key = std::getenv("AWS_SECRET_ACCESS_KEY")) {
      impl_->config.secret_key = key;
    }
  }

  impl_->initClient();
  PORTER_LOG_INFO(
    "S3 store ready" << kv("bucket", impl_->config.bucket)
                     << kv("endpoint", impl_->config.endpoint_url.empty() ? std::string("aws")
                                                                           : impl_->config.endpoint_url)
                     << kv("region", impl_->config.region)
  );
}

AwsRemoteStore::~AwsRemoteStore() = default;

const std::string& AwsRemoteStore::bucket() const {
  return impl_->config.bucket;
}

const std::string& AwsRemoteStore::endpoint() const {
  return impl_->config.endpoint_url;
}

std::string AwsRemoteStore::putObject(const PutObjectRequest& request, const Bytes& body) {
  Aws::S3::Model::PutObjectRequest put;
  put.SetBucket(impl_->config.bucket);
  put.SetKey(request.key);
  put.SetContentType(request.content_type);
  put.SetMetadata(toAwsMetadata(request.metadata));
  put.SetContentLength(static_cast<long long>(body.size()));
  put.SetBody(toBodyStream(body));

  auto outcome = impl_->client->PutObject(put);
  if (!outcome.IsSuccess()) {
    throw toStoreError(outcome.GetError());
  }
  return stripEtagQuotes(outcome.GetResult().GetETag().c_str());
}

std::unique_ptr<IObjectBody> AwsRemoteStore::getObject(
  const std::string& key, const std::optional<ByteRange>& range
) {
  Aws::S3::Model::GetObjectRequest get;
  get.SetBucket(impl_->config.bucket);
  get.SetKey(key);
  if (range) {
    get.SetRange(range->header());
  }

  auto outcome = impl_->client->GetObject(get);
  if (!outcome.IsSuccess()) {
    throw toStoreError(outcome.GetError());
  }
  return std::make_unique<AwsObjectBody>(outcome.GetResultWithOwnership());
}

FileInfo AwsRemoteStore::headObject(const std::string& key) {
  Aws::S3::Model::HeadObjectRequest head;
  head.SetBucket(impl_->config.bucket);
  head.SetKey(key);

  auto outcome = impl_->client->HeadObject(head);
  if (!outcome.IsSuccess()) {
    throw toStoreError(outcome.GetError());
  }
  const auto& result = outcome.GetResult();

  FileInfo info;
  info.key = key;
  info.size = static_cast<uint64_t>(result.GetContentLength());
  info.content_type = result.GetContentType().c_str();
  info.etag = stripEtagQuotes(result.GetETag().c_str());
  info.last_modified = isoTime(result.GetLastModified());
  for (const auto& entry : result.GetMetadata()) {
    info.custom_metadata[entry.first.c_str()] = entry.second.c_str();
  }
  if (result.GetStorageClass() != Aws::S3::Model::StorageClass::NOT_SET) {
    info.storage_class =
      Aws::S3::Model::StorageClassMapper::GetNameForStorageClass(result.GetStorageClass()).c_str();
  }
  info.cache_control = result.GetCacheControl().c_str();
  info.content_encoding = result.GetContentEncoding().c_str();
  return info;
}

ListObjectsResult AwsRemoteStore::listObjectsV2(const ListObjectsRequest& request) {
  Aws::S3::Model::ListObjectsV2Request list;
  list.SetBucket(impl_->config.bucket);
  list.SetPrefix(request.prefix);
  list.SetMaxKeys(request.max_keys);
  if (request.continuation_token) {
    list.SetContinuationToken(*request.continuation_token);
  }

  auto outcome = impl_->client->ListObjectsV2(list);
  if (!outcome.IsSuccess()) {
    throw toStoreError(outcome.GetError());
  }
  const auto& result = outcome.GetResult();

  ListObjectsResult listing;
  for (const auto& object : result.GetContents()) {
    ObjectSummary summary;
    summary.key = object.GetKey().c_str();
    summary.size = static_cast<uint64_t>(object.GetSize());
    summary.last_modified = isoTime(object.GetLastModified());
    summary.etag = stripEtagQuotes(object.GetETag().c_str());
    if (object.GetStorageClass() != Aws::S3::Model::ObjectStorageClass::NOT_SET) {
      summary.storage_class = Aws::S3::Model::ObjectStorageClassMapper::GetNameForObjectStorageClass(
                                object.GetStorageClass()
      )
                                .c_str();
    }
    listing.objects.push_back(std::move(summary));
  }
  listing.is_truncated = result.GetIsTruncated();
  if (!result.GetNextContinuationToken().empty()) {
    listing.next_continuation_token = std::string(result.GetNextContinuationToken().c_str());
  }
  return listing;
}

void AwsRemoteStore::deleteObject(const std::string& key) {
  Aws::S3::Model::DeleteObjectRequest del;
  del.SetBucket(impl_->config.bucket);
  del.SetKey(key);

  auto outcome = impl_->client->DeleteObject(del);
  if (!outcome.IsSuccess()) {
    throw toStoreError(outcome.GetError());
  }
}

DeleteObjectsResult AwsRemoteStore::deleteObjects(const std::vector<std::string>& keys) {
  Aws::S3::Model::Delete batch;
  for (const auto& key : keys) {
    batch.AddObjects(Aws::S3::Model::ObjectIdentifier().WithKey(key));
  }
  Aws::S3::Model::DeleteObjectsRequest del;
  del.SetBucket(impl_->config.bucket);
  del.SetDelete(std::move(batch));

  auto outcome = impl_->client->DeleteObjects(del);
  if (!outcome.IsSuccess()) {
    throw toStoreError(outcome.GetError());
  }

  DeleteObjectsResult result;
  for (const auto& deleted : outcome.GetResult().GetDeleted()) {
    result.deleted.push_back(deleted.GetKey().c_str());
  }
  for (const auto& error : outcome.GetResult().GetErrors()) {
    result.errors.push_back(
      DeleteObjectError{error.GetKey().c_str(), error.GetCode().c_str(), error.GetMessage().c_str()}
    );
  }
  return result;
}

std::string AwsRemoteStore::copyObject(const CopyObjectRequest& request) {
  Aws::S3::Model::CopyObjectRequest copy;
  copy.SetBucket(impl_->config.bucket);
  copy.SetKey(request.destination_key);
  copy.SetCopySource(
    request.source_bucket + "/" +
    Aws::Utils::StringUtils::URLEncode(request.source_key.c_str()).c_str()
  );
  if (request.replace_metadata) {
    copy.SetMetadataDirective(Aws::S3::Model::MetadataDirective::REPLACE);
    copy.SetMetadata(toAwsMetadata(request.metadata));
    if (!request.content_type.empty()) {
      copy.SetContentType(request.content_type);
    }
  }

  auto outcome = impl_->client->CopyObject(copy);
  if (!outcome.IsSuccess()) {
    throw toStoreError(outcome.GetError());
  }
  return stripEtagQuotes(outcome.GetResult().GetCopyObjectResultDetails().GetETag().c_str());
}

std::string AwsRemoteStore::createMultipartUpload(const PutObjectRequest& request) {
  Aws::S3::Model::CreateMultipartUploadRequest create;
  create.SetBucket(impl_->config.bucket);
  create.SetKey(request.key);
  create.SetContentType(request.content_type);
  create.SetMetadata(toAwsMetadata(request.metadata));

  auto outcome = impl_->client->CreateMultipartUpload(create);
  if (!outcome.IsSuccess()) {
    throw toStoreError(outcome.GetError());
  }
  return outcome.GetResult().GetUploadId().c_str();
}

std::string AwsRemoteStore::uploadPart(
  const std::string& key, const std::string& upload_id, int part_number, const Bytes& body
) {
  Aws::S3::Model::UploadPartRequest part;
  part.SetBucket(impl_->config.bucket);
  part.SetKey(key);
  part.SetUploadId(upload_id);
  part.SetPartNumber(part_number);
  part.SetContentLength(static_cast<long long>(body.size()));
  part.SetBody(toBodyStream(body));

  auto outcome = impl_->client->UploadPart(part);
  if (!outcome.IsSuccess()) {
    throw toStoreError(outcome.GetError());
  }
  return stripEtagQuotes(outcome.GetResult().GetETag().c_str());
}

std::string AwsRemoteStore::completeMultipartUpload(
  const std::string& key, const std::string& upload_id, const std::vector<CompletedPart>& parts
) {
  Aws::S3::Model::CompletedMultipartUpload completed;
  for (const auto& part : parts) {
    completed.AddParts(
      Aws::S3::Model::CompletedPart().WithPartNumber(part.part_number).WithETag(part.etag)
    );
  }
  Aws::S3::Model::CompleteMultipartUploadRequest complete;
  complete.SetBucket(impl_->config.bucket);
  complete.SetKey(key);
  complete.SetUploadId(upload_id);
  complete.SetMultipartUpload(std::move(completed));

  auto outcome = impl_->client->CompleteMultipartUpload(complete);
  if (!outcome.IsSuccess()) {
    throw toStoreError(outcome.GetError());
  }
  return stripEtagQuotes(outcome.GetResult().GetETag().c_str());
}

void AwsRemoteStore::abortMultipartUpload(const std::string& key, const std::string& upload_id) {
  Aws::S3::Model::AbortMultipartUploadRequest abort;
  abort.SetBucket(impl_->config.bucket);
  abort.SetKey(key);
  abort.SetUploadId(upload_id);

  auto outcome = impl_->client->AbortMultipartUpload(abort);
  if (!outcome.IsSuccess()) {
    throw toStoreError(outcome.GetError());
  }
}

std::string AwsRemoteStore::generatePresignedUrl(
  const std::string& key, PresignOperation operation, int64_t expiry_seconds
) {
  const auto method = operation == PresignOperation::Put ? Aws::Http::HttpMethod::HTTP_PUT
                                                         : Aws::Http::HttpMethod::HTTP_GET;
  Aws::String url = impl_->client->GeneratePresignedUrl(
    impl_->config.bucket, key, method, static_cast<uint64_t>(expiry_seconds)
  );
  if (url.empty()) {
    throw RemoteStoreError("PresignFailed", "SDK returned an empty presigned URL for " + key);
  }
  PORTER_LOG_DEBUG("Presigned URL generated" << kv("key", key) << kv("expiry_s", expiry_seconds));
  return url.c_str();
}

}  // namespace transfer
}  // namespace porter
