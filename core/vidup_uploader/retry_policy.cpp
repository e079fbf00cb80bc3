// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "retry_policy.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

#define VIDUP_LOG_COMPONENT "retry_policy"
#include <vidup_log_macros.hpp>

namespace vidup {
namespace uploader {

using vidup::logging::kv;

RetryPolicy::RetryPolicy(const RetryConfig& config, Sleeper& sleeper)
    : config_(config)
    , sleeper_(sleeper)
    , rng_(std::random_device{}()) {}

std::chrono::milliseconds RetryPolicy::getDelay(int retry_count) const {
  double delay_ms = static_cast<double>(config_.initial_delay.count()) *
                    std::pow(config_.exponential_base, static_cast<double>(retry_count));

  if (config_.max_delay.count() > 0) {
    delay_ms = std::min(delay_ms, static_cast<double>(config_.max_delay.count()));
  }

  if (config_.jitter) {
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_real_distribution<> dist(
      1.0 - config_.jitter_factor, 1.0 + config_.jitter_factor
    );
    delay_ms *= dist(rng_);
  }

  delay_ms = std::max(delay_ms, 1.0);

  return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
}

void RetryPolicy::checkCancelled() const {
  if (sleeper_.cancelled()) {
    throw UploadError(ErrorKind::kCancelled, "Operation cancelled before next attempt");
  }
}

void RetryPolicy::backoff(
  int retry_count, const std::exception& error, const FailureCallback& on_failure
) {
  auto delay = getDelay(retry_count);

  if (on_failure) {
    on_failure(retry_count + 1, error);
  }

  VIDUP_LOG_WARN(
    "Attempt " << (retry_count + 1) << " failed, retrying in " << delay.count() << "ms"
               << kv("error", std::string(error.what()))
  );

  if (!sleeper_.sleepFor(delay)) {
    throw UploadError(ErrorKind::kCancelled, "Retry backoff interrupted by cancellation");
  }
}

}  // namespace uploader
}  // namespace vidup
