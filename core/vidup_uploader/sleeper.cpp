// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "sleeper.hpp"

namespace vidup {
namespace uploader {

bool CancellableSleeper::sleepFor(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (cancelled_) {
    return false;
  }
  bool interrupted = cv_.wait_for(lock, duration, [this] {
    return cancelled_;
  });
  return !interrupted;
}

void CancellableSleeper::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

bool CancellableSleeper::cancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

void CancellableSleeper::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  cancelled_ = false;
}

}  // namespace uploader
}  // namespace vidup
