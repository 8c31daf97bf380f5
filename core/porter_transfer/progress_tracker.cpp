// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "progress_tracker.hpp"

#include <exception>

#define PORTER_LOG_COMPONENT "progress_tracker"
#include <porter_log_macros.hpp>

namespace porter {
namespace transfer {

using logging::kv;

ProgressTracker::ProgressTracker(uint64_t total_size, IProgressObserver* observer, Clock clock)
    : total_size_(total_size)
    , observer_(observer)
    , clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] {
      return std::chrono::steady_clock::now();
    };
  }
  start_time_ = clock_();
}

void ProgressTracker::update(uint64_t bytes_transferred) {
  std::lock_guard<std::mutex> lock(mutex_);
  transferred_size_ += bytes_transferred;
  notifyLocked();
}

void ProgressTracker::complete() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (transferred_size_ < total_size_) {
    transferred_size_ = total_size_;
  }
  notifyLocked();
}

void ProgressTracker::notifyLocked() {
  if (!observer_) {
    return;
  }
  // An observer failure must not fail the transfer it reports on.
  try {
    observer_->onProgress(snapshotLocked());
  } catch (const std::exception& e) {
    PORTER_LOG_WARN(
      "Progress observer failed" << kv("error", std::string(e.what()))
                                 << kv("transferred", transferred_size_)
    );
  }
}

ProgressSnapshot ProgressTracker::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return snapshotLocked();
}

ProgressSnapshot ProgressTracker::snapshotLocked() const {
  ProgressSnapshot snap;
  snap.total_size = total_size_;
  snap.transferred_size = transferred_size_;
  snap.elapsed_seconds = std::chrono::duration<double>(clock_() - start_time_).count();

  if (total_size_ > 0) {
    snap.percentage =
      static_cast<double>(transferred_size_) / static_cast<double>(total_size_) * 100.0;
  }
  if (snap.elapsed_seconds > 0.0) {
    snap.throughput_bytes_per_sec =
      static_cast<double>(transferred_size_) / snap.elapsed_seconds;
  }
  if (snap.throughput_bytes_per_sec > 0.0 && total_size_ > transferred_size_) {
    snap.eta_seconds =
      static_cast<double>(total_size_ - transferred_size_) / snap.throughput_bytes_per_sec;
  }
  return snap;
}

}  // namespace transfer
}  // namespace porter
