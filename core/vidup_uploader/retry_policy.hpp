// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIDUP_RETRY_POLICY_HPP
#define VIDUP_RETRY_POLICY_HPP

#include <chrono>
#include <exception>
#include <functional>
#include <mutex>
#include <random>

#include "sleeper.hpp"
#include "upload_errors.hpp"

namespace vidup {
namespace uploader {

/**
 * Configuration for retry behavior
 */
struct RetryConfig {
  int max_retries = 3;                            // Retries after the first attempt
  std::chrono::milliseconds initial_delay{1000};  // Delay before the first retry
  std::chrono::milliseconds max_delay{300000};    // Backoff cap (5 minutes)
  double exponential_base = 2.0;                  // Exponential backoff base
  bool jitter = false;                            // Add random jitter
  double jitter_factor = 0.5;                     // Jitter range: [1-factor, 1+factor]
};

/**
 * Retry policy with exponential backoff.
 *
 * execute() runs an operation up to max_retries + 1 times. Between attempts it
 * reports the failure to the caller's callback, then waits on the injected
 * Sleeper for getDelay(n). The last failure is rethrown unchanged once the
 * budget is spent. Cancellation (an interrupted wait or a kCancelled error
 * from the operation) is never retried.
 *
 * The policy holds configuration only; one instance may serve several
 * concurrent execute() calls.
 */
class RetryPolicy {
public:
  /**
   * @param attempt 1-based number of the attempt that just failed
   * @param error The failure of that attempt
   */
  using FailureCallback = std::function<void(int attempt, const std::exception& error)>;

  RetryPolicy(const RetryConfig& config, Sleeper& sleeper);

  template <typename Operation>
  auto execute(Operation&& operation, const FailureCallback& on_failure = nullptr)
    -> decltype(operation()) {
    for (int retry_count = 0;; ++retry_count) {
      checkCancelled();
      try {
        return operation();
      } catch (const UploadError& e) {
        if (e.kind() == ErrorKind::kCancelled || !shouldRetry(retry_count)) {
          throw;
        }
        backoff(retry_count, e, on_failure);
      } catch (const std::exception& e) {
        if (!shouldRetry(retry_count)) {
          throw;
        }
        backoff(retry_count, e, on_failure);
      }
    }
  }

  /**
   * Delay before the next attempt.
   *
   * Delay formula: initial_delay * (base ^ retry_count), capped at max_delay,
   * optionally scaled by a jitter factor, never below 1ms.
   *
   * @param retry_count Retry about to happen (0-indexed)
   */
  std::chrono::milliseconds getDelay(int retry_count) const;

  bool shouldRetry(int retry_count) const {
    return retry_count < config_.max_retries;
  }

  int maxRetries() const {
    return config_.max_retries;
  }

  const RetryConfig& config() const {
    return config_;
  }

private:
  void checkCancelled() const;

  // Notifies the callback, logs, then sleeps. Throws kCancelled if the wait is interrupted.
  void backoff(int retry_count, const std::exception& error, const FailureCallback& on_failure);

  RetryConfig config_;
  Sleeper& sleeper_;
  mutable std::mt19937 rng_;
  mutable std::mutex rng_mutex_;
};

}  // namespace uploader
}  // namespace vidup

#endif  // VIDUP_RETRY_POLICY_HPP
