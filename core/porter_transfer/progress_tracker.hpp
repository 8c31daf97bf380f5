// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PORTER_PROGRESS_TRACKER_HPP
#define PORTER_PROGRESS_TRACKER_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>

namespace porter {
namespace transfer {

struct ProgressSnapshot {
  uint64_t total_size = 0;
  uint64_t transferred_size = 0;
  double percentage = 0.0;
  double throughput_bytes_per_sec = 0.0;
  double elapsed_seconds = 0.0;
  double eta_seconds = 0.0;
};

/**
 * Receives a snapshot after every progress update.
 */
class IProgressObserver {
public:
  virtual ~IProgressObserver() = default;
  virtual void onProgress(const ProgressSnapshot& snapshot) = 0;
};

class NullProgressObserver : public IProgressObserver {
public:
  void onProgress(const ProgressSnapshot&) override {}
};

/**
 * Adapts a plain callable to IProgressObserver.
 */
class CallbackProgressObserver : public IProgressObserver {
public:
  using Callback = std::function<void(const ProgressSnapshot&)>;

  explicit CallbackProgressObserver(Callback callback)
      : callback_(std::move(callback)) {}

  void onProgress(const ProgressSnapshot& snapshot) override {
    if (callback_) {
      callback_(snapshot);
    }
  }

private:
  Callback callback_;
};

/**
 * Running byte count for one transfer.
 *
 *   percentage = transferred / total * 100   (0 when total is 0)
 *   throughput = transferred / elapsed       (0 when elapsed is 0)
 *   eta        = (total - transferred) / throughput (0 when throughput is 0)
 *
 * update() is safe to call from concurrent part workers. The observer is
 * notified while the tracker lock is held, so notifications never overlap
 * and always see a non-decreasing total. The observer must not call back
 * into the tracker. A std::exception thrown by the observer is logged and
 * dropped; the byte count still advances.
 */
class ProgressTracker {
public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  /**
   * @param total_size Expected bytes
   * @param observer Notified on every update; may be null. Not owned.
   * @param clock Time source, steady_clock::now by default
   */
  explicit ProgressTracker(
    uint64_t total_size, IProgressObserver* observer = nullptr, Clock clock = nullptr
  );

  /**
   * Add bytes_transferred to the running total and notify the observer.
   */
  void update(uint64_t bytes_transferred);

  /**
   * Bring the running total up to total_size and notify once more.
   */
  void complete();

  ProgressSnapshot snapshot() const;

private:
  ProgressSnapshot snapshotLocked() const;
  void notifyLocked();

  uint64_t total_size_;
  uint64_t transferred_size_ = 0;
  IProgressObserver* observer_;
  Clock clock_;
  std::chrono::steady_clock::time_point start_time_;
  mutable std::mutex mutex_;
};

}  // namespace transfer
}  // namespace porter

#endif  // PORTER_PROGRESS_TRACKER_HPP
