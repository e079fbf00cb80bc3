// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIDUP_SLEEPER_HPP
#define VIDUP_SLEEPER_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace vidup {
namespace uploader {

/**
 * Interruptible wait primitive used for retry backoff and status polling.
 *
 * Once cancel() is called every pending and future sleepFor() returns false
 * immediately until reset().
 */
class Sleeper {
public:
  virtual ~Sleeper() = default;

  /**
   * Block for the given duration.
   * @return true if the full duration elapsed, false if interrupted by cancel()
   */
  virtual bool sleepFor(std::chrono::milliseconds duration) = 0;

  virtual void cancel() = 0;

  virtual bool cancelled() const = 0;

  /**
   * Clear a previous cancellation so the sleeper can be reused.
   */
  virtual void reset() = 0;
};

/**
 * Sleeper backed by a condition variable. Thread-safe.
 */
class CancellableSleeper : public Sleeper {
public:
  CancellableSleeper() = default;

  CancellableSleeper(const CancellableSleeper&) = delete;
  CancellableSleeper& operator=(const CancellableSleeper&) = delete;

  bool sleepFor(std::chrono::milliseconds duration) override;
  void cancel() override;
  bool cancelled() const override;
  void reset() override;

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool cancelled_ = false;
};

}  // namespace uploader
}  // namespace vidup

#endif  // VIDUP_SLEEPER_HPP
