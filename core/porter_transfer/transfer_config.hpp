// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PORTER_TRANSFER_CONFIG_HPP
#define PORTER_TRANSFER_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>

#include "retry_handler.hpp"

namespace porter {
namespace transfer {

constexpr uint64_t kMiB = 1024ULL * 1024ULL;
constexpr uint64_t kGiB = 1024ULL * kMiB;

/**
 * Smallest part size S3 accepts for every part but the last.
 */
constexpr uint64_t kMinMultipartChunkSize = 5 * kMiB;

/**
 * Per-request limits of the S3 API.
 */
constexpr int kMaxListKeys = 1000;
constexpr size_t kMaxDeleteKeys = 1000;

/**
 * TransferEngine settings
 */
struct TransferConfig {
  uint64_t multipart_threshold = 5 * kMiB;  // Uploads at or above this go multipart
  uint64_t multipart_chunk_size = 8 * kMiB;
  int max_concurrent_uploads = 10;          // Parts in flight; also the store's connection ceiling
  uint64_t max_object_size = 5 * kGiB;

  RetryPolicy retry;

  std::chrono::seconds default_presigned_url_expiry{3600};
  std::chrono::seconds max_presigned_url_expiry{7 * 24 * 3600};

  std::chrono::seconds metadata_cache_ttl{300};
  bool enable_metadata_cache = true;

  // Chunk size for streaming downloads
  size_t download_chunk_size = 64 * 1024;
};

}  // namespace transfer
}  // namespace porter

#endif  // PORTER_TRANSFER_CONFIG_HPP
