// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "metadata_cache.hpp"

#include <utility>

namespace porter {
namespace transfer {

MetadataCache::MetadataCache(std::chrono::seconds ttl, Clock clock)
    : ttl_(ttl)
    , clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] {
      return std::chrono::steady_clock::now();
    };
  }
}

std::optional<FileInfo> MetadataCache::get(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  if (clock_() - it->second.cached_at >= ttl_) {
    return std::nullopt;
  }
  return it->second.data;
}

void MetadataCache::put(const std::string& key, const FileInfo& info) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_[key] = CacheEntry{info, clock_()};
}

uint64_t MetadataCache::generation() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return generation_;
}

bool MetadataCache::putIfUnchanged(
  const std::string& key, const FileInfo& info, uint64_t observed_generation
) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (generation_ != observed_generation) {
    return false;
  }
  entries_[key] = CacheEntry{info, clock_()};
  return true;
}

void MetadataCache::invalidate(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.erase(key);
  ++generation_;
}

void MetadataCache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
  ++generation_;
}

size_t MetadataCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

}  // namespace transfer
}  // namespace porter
