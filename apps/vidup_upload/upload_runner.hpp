// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIDUP_UPLOAD_RUNNER_HPP
#define VIDUP_UPLOAD_RUNNER_HPP

#include <atomic>
#include <functional>
#include <ostream>
#include <thread>

#include <byte_source.hpp>
#include <upload_session.hpp>

namespace vidup {
namespace upload {

/**
 * Polls a cancel flag from a background thread and calls `on_cancel` once
 * when it is raised. Stops polling on destruction.
 */
class CancelWatcher {
public:
  CancelWatcher(const std::atomic<bool>& flag, std::function<void()> on_cancel);
  ~CancelWatcher();

  CancelWatcher(const CancelWatcher&) = delete;
  CancelWatcher& operator=(const CancelWatcher&) = delete;

private:
  std::atomic<bool> done_{false};
  std::thread thread_;
};

/**
 * Initiate, upload every chunk, report server status and complete.
 *
 * `cancel_requested` is honored for the whole run. A request raised before
 * the session is active (for example during initiate) cancels the server
 * session as soon as initiate returns.
 *
 * @throws UploadError from any step; kCancelled when the flag was raised
 */
uploader::CompletionResult run_upload(
  uploader::UploadSession& session, const uploader::SourceFile& file,
  const uploader::UploadMetadata& metadata, const std::atomic<bool>& cancel_requested,
  std::ostream& out
);

}  // namespace upload
}  // namespace vidup

#endif  // VIDUP_UPLOAD_RUNNER_HPP
