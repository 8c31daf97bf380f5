// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PORTER_RETRY_HANDLER_HPP
#define PORTER_RETRY_HANDLER_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <random>
#include <thread>
#include <utility>

namespace porter {
namespace transfer {

/**
 * Retry behavior for remote calls
 */
struct RetryPolicy {
  int max_attempts = 3;                        // Total attempts, including the first
  std::chrono::milliseconds base_delay{1000};  // Delay after the first failure
  std::chrono::milliseconds max_delay{60000};  // Cap before jitter
  double exponential_base = 2.0;
  bool jitter = true;                          // Adds up to 10% of the delay
  bool skip_permanent_errors = false;          // Stop early on errors a retry cannot fix
};

/**
 * Bounded exponential-backoff retry around a callable.
 *
 * Any std::exception counts as a failure. After the last attempt the
 * failure is rethrown unchanged; classification is the caller's job.
 *
 * Thread-safe: one handler can serve concurrent execute() calls.
 */
class RetryHandler {
public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  /**
   * Called before each backoff sleep.
   *
   * @param attempt The attempt that just failed (1-based)
   * @param delay The sleep about to happen
   * @param error The failure
   */
  using RetryListener =
    std::function<void(int attempt, std::chrono::milliseconds delay, const std::exception& error)>;

  /**
   * Returns false to stop retrying and rethrow immediately.
   */
  using RetryPredicate = std::function<bool(const std::exception& error)>;

  explicit RetryHandler(const RetryPolicy& policy = {}, Sleeper sleeper = nullptr)
      : policy_(policy)
      , sleeper_(std::move(sleeper))
      , rng_(std::random_device{}()) {
    if (!sleeper_) {
      sleeper_ = [](std::chrono::milliseconds delay) {
        std::this_thread::sleep_for(delay);
      };
    }
  }

  /**
   * Delay after failed attempt i (0-indexed):
   * min(base_delay * exponential_base^i, max_delay), plus
   * delay * 0.1 * U(0,1) when jitter is on.
   */
  std::chrono::milliseconds getDelay(int attempt) const {
    double delay_ms = static_cast<double>(policy_.base_delay.count()) *
                      std::pow(policy_.exponential_base, static_cast<double>(attempt));
    delay_ms = std::min(delay_ms, static_cast<double>(policy_.max_delay.count()));

    if (policy_.jitter) {
      std::lock_guard<std::mutex> lock(rng_mutex_);
      std::uniform_real_distribution<> dist(0.0, 1.0);
      delay_ms += delay_ms * 0.1 * dist(rng_);
    }

    return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
  }

  /**
   * Effective attempt limit; values below 1 count as 1.
   */
  int maxAttempts() const {
    return std::max(1, policy_.max_attempts);
  }

  void setRetryListener(RetryListener listener) {
    listener_ = std::move(listener);
  }

  void setRetryPredicate(RetryPredicate predicate) {
    predicate_ = std::move(predicate);
  }

  /**
   * Run op, retrying on std::exception up to maxAttempts() times.
   *
   * @return Whatever op returns
   */
  template <typename Operation>
  auto execute(Operation&& op) const -> decltype(op()) {
    const int attempts = maxAttempts();
    for (int attempt = 0;; ++attempt) {
      try {
        return op();
      } catch (const std::exception& e) {
        if (attempt + 1 >= attempts || (predicate_ && !predicate_(e))) {
          throw;
        }
        const auto delay = getDelay(attempt);
        if (listener_) {
          listener_(attempt + 1, delay, e);
        }
        sleeper_(delay);
      }
    }
  }

  const RetryPolicy& policy() const {
    return policy_;
  }

private:
  RetryPolicy policy_;
  Sleeper sleeper_;
  RetryListener listener_;
  RetryPredicate predicate_;
  mutable std::mt19937 rng_;
  mutable std::mutex rng_mutex_;
};

}  // namespace transfer
}  // namespace porter

#endif  // PORTER_RETRY_HANDLER_HPP
