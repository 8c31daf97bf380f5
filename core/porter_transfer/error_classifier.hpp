// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PORTER_ERROR_CLASSIFIER_HPP
#define PORTER_ERROR_CLASSIFIER_HPP

#include <exception>
#include <string>

#include "remote_store.hpp"
#include "transfer_error.hpp"

namespace porter {
namespace transfer {

/**
 * Translates provider errors into TransferError.
 *
 * Pure and deterministic: no I/O, no state.
 */
class ErrorClassifier {
public:
  /**
   * Map a provider error code to its kind. Unknown codes map to Generic.
   */
  static ErrorKind kindForCode(const std::string& code);

  /**
   * Classify a remote store failure. Transport failures are NetworkError
   * whatever their code.
   */
  static TransferError classify(const RemoteStoreError& error, const std::string& operation);

  /**
   * Classify any exception caught around a remote call.
   *
   * TransferError passes through unchanged, RemoteStoreError goes through
   * the code table and anything else becomes Generic("InternalError").
   */
  static TransferError classify(const std::exception& error, const std::string& operation);

  /**
   * True for kinds a retry can fix: RateLimited, ServiceUnavailable, NetworkError.
   */
  static bool isTransient(ErrorKind kind);

  /**
   * True for kinds a retry cannot fix, skipped when
   * RetryPolicy::skip_permanent_errors is set.
   */
  static bool isPermanent(ErrorKind kind);

  /**
   * True for provider codes of transient S3/HTTP/network failures.
   */
  static bool isRetryableCode(const std::string& code);
};

}  // namespace transfer
}  // namespace porter

#endif  // PORTER_ERROR_CLASSIFIER_HPP
