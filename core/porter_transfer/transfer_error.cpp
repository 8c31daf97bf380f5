// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transfer_error.hpp"

#include <utility>

namespace porter {
namespace transfer {

const char* errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NotFound:
      return "not_found";
    case ErrorKind::BucketMissing:
      return "bucket_missing";
    case ErrorKind::PermissionDenied:
      return "permission_denied";
    case ErrorKind::AuthFailure:
      return "auth_failure";
    case ErrorKind::RateLimited:
      return "rate_limited";
    case ErrorKind::ServiceUnavailable:
      return "service_unavailable";
    case ErrorKind::NetworkError:
      return "network_error";
    case ErrorKind::SizeExceeded:
      return "size_exceeded";
    case ErrorKind::InvalidKey:
      return "invalid_key";
    case ErrorKind::MultipartFailure:
      return "multipart_failure";
    case ErrorKind::Generic:
      return "generic";
  }
  return "unknown";
}

TransferError::TransferError(
  ErrorKind kind, std::string operation, std::string message, std::string provider_code
)
    : std::runtime_error(
        operation + " failed [" + errorKindName(kind) + "]: " + message
      )
    , kind_(kind)
    , operation_(std::move(operation))
    , message_(std::move(message))
    , provider_code_(std::move(provider_code)) {}

}  // namespace transfer
}  // namespace porter
