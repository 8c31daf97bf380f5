// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PORTER_TRANSFER_ERROR_HPP
#define PORTER_TRANSFER_ERROR_HPP

#include <stdexcept>
#include <string>

namespace porter {
namespace transfer {

/**
 * Closed taxonomy of engine failures. Every failure leaving a
 * TransferEngine operation carries exactly one of these.
 */
enum class ErrorKind {
  NotFound,
  BucketMissing,
  PermissionDenied,
  AuthFailure,
  RateLimited,
  ServiceUnavailable,
  NetworkError,
  SizeExceeded,
  InvalidKey,
  MultipartFailure,
  Generic,
};

/**
 * Stable snake_case name, used in logs and CLI output.
 */
const char* errorKindName(ErrorKind kind);

/**
 * Domain error raised by the transfer engine.
 *
 * what() reads "<operation> failed [<kind>]: <message>".
 */
class TransferError : public std::runtime_error {
public:
  TransferError(
    ErrorKind kind, std::string operation, std::string message, std::string provider_code = ""
  );

  ErrorKind kind() const {
    return kind_;
  }

  const std::string& operation() const {
    return operation_;
  }

  const std::string& message() const {
    return message_;
  }

  /**
   * Provider error code the failure was classified from, or a
   * local code such as "LocalIOError". Empty when none applies.
   */
  const std::string& providerCode() const {
    return provider_code_;
  }

private:
  ErrorKind kind_;
  std::string operation_;
  std::string message_;
  std::string provider_code_;
};

}  // namespace transfer
}  // namespace porter

#endif  // PORTER_TRANSFER_ERROR_HPP
