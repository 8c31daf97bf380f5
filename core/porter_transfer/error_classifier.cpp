// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "error_classifier.hpp"

#include <set>
#include <unordered_map>

namespace porter {
namespace transfer {

ErrorKind ErrorClassifier::kindForCode(const std::string& code) {
  static const std::unordered_map<std::string, ErrorKind> table = {
    {"NoSuchBucket", ErrorKind::BucketMissing},
    {"NoSuchKey", ErrorKind::NotFound},
    {"AccessDenied", ErrorKind::PermissionDenied},
    {"InvalidAccessKeyId", ErrorKind::AuthFailure},
    {"SignatureDoesNotMatch", ErrorKind::AuthFailure},
    {"RequestTimeTooSkewed", ErrorKind::AuthFailure},
    {"ServiceUnavailable", ErrorKind::ServiceUnavailable},
    {"SlowDown", ErrorKind::RateLimited},
    {"RequestLimitExceeded", ErrorKind::RateLimited},
  };
  auto it = table.find(code);
  return it == table.end() ? ErrorKind::Generic : it->second;
}

TransferError ErrorClassifier::classify(
  const RemoteStoreError& error, const std::string& operation
) {
  std::string message = error.what();
  if (message.empty()) {
    message = error.code().empty() ? "unknown provider error" : error.code();
  }
  if (error.transportFailure()) {
    return TransferError(ErrorKind::NetworkError, operation, message, error.code());
  }
  return TransferError(kindForCode(error.code()), operation, message, error.code());
}

TransferError ErrorClassifier::classify(const std::exception& error, const std::string& operation) {
  if (auto transfer_error = dynamic_cast<const TransferError*>(&error)) {
    return *transfer_error;
  }
  if (auto store_error = dynamic_cast<const RemoteStoreError*>(&error)) {
    return classify(*store_error, operation);
  }
  return TransferError(ErrorKind::Generic, operation, error.what(), "InternalError");
}

bool ErrorClassifier::isTransient(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::RateLimited:
    case ErrorKind::ServiceUnavailable:
    case ErrorKind::NetworkError:
      return true;
    case ErrorKind::NotFound:
    case ErrorKind::BucketMissing:
    case ErrorKind::PermissionDenied:
    case ErrorKind::AuthFailure:
    case ErrorKind::SizeExceeded:
    case ErrorKind::InvalidKey:
    case ErrorKind::MultipartFailure:
    case ErrorKind::Generic:
      return false;
  }
  return false;
}

bool ErrorClassifier::isPermanent(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NotFound:
    case ErrorKind::BucketMissing:
    case ErrorKind::PermissionDenied:
    case ErrorKind::AuthFailure:
    case ErrorKind::SizeExceeded:
    case ErrorKind::InvalidKey:
      return true;
    // Generic covers provider codes like InternalError that may clear up.
    case ErrorKind::RateLimited:
    case ErrorKind::ServiceUnavailable:
    case ErrorKind::NetworkError:
    case ErrorKind::MultipartFailure:
    case ErrorKind::Generic:
      return false;
  }
  return false;
}

bool ErrorClassifier::isRetryableCode(const std::string& code) {
  static const std::set<std::string> retryable = {
    // S3/HTTP
    "RequestTimeout",
    "ServiceUnavailable",
    "InternalError",
    "SlowDown",
    "RequestLimitExceeded",
    "OperationAborted",
    // Network
    "ConnectionReset",
    "ConnectionTimeout",
    "ConnectionRefused",
    "NetworkingError",
    "UnknownEndpoint",
    // MinIO
    "XMinioServerNotInitialized",
    // Generic throttling
    "Throttling",
    "ThrottlingException",
    "TransientError",
  };
  return retryable.count(code) > 0;
}

}  // namespace transfer
}  // namespace porter
