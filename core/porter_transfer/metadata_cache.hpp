// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PORTER_METADATA_CACHE_HPP
#define PORTER_METADATA_CACHE_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "transfer_types.hpp"

namespace porter {
namespace transfer {

/**
 * TTL-bounded FileInfo cache keyed by object key.
 *
 * Expired entries are not evicted by get(); they stay until overwritten,
 * invalidated or cleared. Thread-safe.
 */
class MetadataCache {
public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  explicit MetadataCache(std::chrono::seconds ttl, Clock clock = nullptr);

  /**
   * @return The cached entry, or std::nullopt if missing or older than the TTL
   */
  std::optional<FileInfo> get(const std::string& key) const;

  void put(const std::string& key, const FileInfo& info);

  /**
   * Invalidation counter. Bumped by every invalidate() and clear().
   */
  uint64_t generation() const;

  /**
   * Store info only if no invalidation happened since generation() returned
   * observed_generation. Used to fill the cache from a remote lookup that
   * may race with a delete or overwrite of the same key.
   *
   * @return true if the entry was stored
   */
  bool putIfUnchanged(const std::string& key, const FileInfo& info, uint64_t observed_generation);

  void invalidate(const std::string& key);

  void clear();

  /**
   * Number of stored entries, expired ones included.
   */
  size_t size() const;

  std::chrono::seconds ttl() const {
    return ttl_;
  }

private:
  struct CacheEntry {
    FileInfo data;
    std::chrono::steady_clock::time_point cached_at;
  };

  std::chrono::seconds ttl_;
  Clock clock_;
  std::unordered_map<std::string, CacheEntry> entries_;
  uint64_t generation_ = 0;
  mutable std::mutex mutex_;
};

}  // namespace transfer
}  // namespace porter

#endif  // PORTER_METADATA_CACHE_HPP
