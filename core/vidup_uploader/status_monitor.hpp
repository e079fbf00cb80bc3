// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIDUP_STATUS_MONITOR_HPP
#define VIDUP_STATUS_MONITOR_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "movie_api.hpp"
#include "sleeper.hpp"
#include "upload_types.hpp"

namespace vidup {
namespace uploader {

struct MonitorConfig {
  int max_attempts = 30;
  std::chrono::milliseconds interval{10000};     // Between non-terminal polls
  std::chrono::milliseconds error_delay{5000};   // After a failed poll
};

/**
 * Polls a movie's processing status until it is READY or FAILED.
 */
class StatusMonitor {
public:
  /**
   * Advisory callback for every successful poll. attempt is 1-based.
   */
  using StatusCallback = std::function<void(const ProcessingStatus& status, int attempt)>;

  StatusMonitor(
    std::shared_ptr<IMovieApi> api, std::shared_ptr<Sleeper> sleeper = nullptr,
    const MonitorConfig& config = MonitorConfig()
  );

  /**
   * Poll with the configured attempt budget and interval.
   */
  std::optional<MovieInfo> monitor(
    const std::string& movie_id, const StatusCallback& on_status = nullptr
  );

  /**
   * Poll up to max_attempts times, waiting `interval` after each non-terminal
   * result and the configured error delay after each failed poll. No wait
   * follows the last attempt.
   *
   * @return Movie info once READY, std::nullopt if the budget ran out
   * @throws UploadError kProcessingFailed on FAILED, kStatusQuery if fetching
   *         the info of a READY movie fails, kCancelled if a wait was interrupted
   */
  std::optional<MovieInfo> monitor(
    const std::string& movie_id, int max_attempts, std::chrono::milliseconds interval,
    const StatusCallback& on_status = nullptr
  );

  /**
   * Interrupt a running monitor() from another thread.
   */
  void cancel() {
    sleeper_->cancel();
  }

  const MonitorConfig& config() const {
    return config_;
  }

private:
  void wait(std::chrono::milliseconds delay);

  std::shared_ptr<IMovieApi> api_;
  std::shared_ptr<Sleeper> sleeper_;
  MonitorConfig config_;
};

}  // namespace uploader
}  // namespace vidup

#endif  // VIDUP_STATUS_MONITOR_HPP
