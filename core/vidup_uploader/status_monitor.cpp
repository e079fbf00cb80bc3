// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "status_monitor.hpp"

#include "upload_errors.hpp"

#define VIDUP_LOG_COMPONENT "status_monitor"
#include <vidup_log_macros.hpp>

namespace vidup {
namespace uploader {

using vidup::logging::kv;

StatusMonitor::StatusMonitor(
  std::shared_ptr<IMovieApi> api, std::shared_ptr<Sleeper> sleeper, const MonitorConfig& config
)
    : api_(std::move(api))
    , sleeper_(sleeper ? std::move(sleeper) : std::make_shared<CancellableSleeper>())
    , config_(config) {
  if (!api_) {
    throw UploadError(ErrorKind::kInvalidArgument, "StatusMonitor requires a movie API client");
  }
}

std::optional<MovieInfo> StatusMonitor::monitor(
  const std::string& movie_id, const StatusCallback& on_status
) {
  return monitor(movie_id, config_.max_attempts, config_.interval, on_status);
}

void StatusMonitor::wait(std::chrono::milliseconds delay) {
  if (!sleeper_->sleepFor(delay)) {
    throw UploadError(ErrorKind::kCancelled, "Status monitoring cancelled");
  }
}

std::optional<MovieInfo> StatusMonitor::monitor(
  const std::string& movie_id, int max_attempts, std::chrono::milliseconds interval,
  const StatusCallback& on_status
) {
  VIDUP_LOG_INFO(
    "Monitoring processing status" << kv("movie_id", movie_id) << kv("max_attempts", max_attempts)
                                   << kv("interval_ms", interval.count())
  );

  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    if (sleeper_->cancelled()) {
      throw UploadError(ErrorKind::kCancelled, "Status monitoring cancelled");
    }
    const bool last = attempt == max_attempts;

    ProcessingStatus status;
    try {
      status = api_->getProcessingStatus(movie_id);
    } catch (const UploadError& e) {
      VIDUP_LOG_WARN(
        "Status poll failed" << kv("movie_id", movie_id) << kv("attempt", attempt)
                             << kv("error", std::string(e.what()))
      );
      if (!last) {
        wait(config_.error_delay);
      }
      continue;
    }

    VIDUP_LOG_INFO(
      "Processing status" << kv("movie_id", movie_id) << kv("attempt", attempt)
                          << kv("status", toString(status.state))
    );

    if (on_status) {
      try {
        on_status(status, attempt);
      } catch (const std::exception& e) {
        VIDUP_LOG_WARN("Status callback threw" << kv("error", std::string(e.what())));
      }
    }

    if (status.state == ProcessingState::kReady) {
      return api_->getMovieInfo(movie_id);
    }
    if (status.state == ProcessingState::kFailed) {
      VIDUP_LOG_ERROR("Processing failed" << kv("movie_id", movie_id));
      throw UploadError(ErrorKind::kProcessingFailed, "Processing failed for movie " + movie_id);
    }

    if (!last) {
      wait(interval);
    }
  }

  VIDUP_LOG_WARN(
    "Processing status monitoring timed out" << kv("movie_id", movie_id)
                                              << kv("attempts", max_attempts)
  );
  return std::nullopt;
}

}  // namespace uploader
}  // namespace vidup
