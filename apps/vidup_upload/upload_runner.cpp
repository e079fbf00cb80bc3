// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_runner.hpp"

#include <chrono>
#include <string>

#include <upload_errors.hpp>

#define VIDUP_LOG_COMPONENT "vidup_upload"
#include <vidup_log_macros.hpp>

namespace vidup {
namespace upload {

using vidup::logging::kv;
using namespace vidup::uploader;

namespace {

constexpr auto kCancelPollInterval = std::chrono::milliseconds(100);

void cancel_session(UploadSession& session) {
  try {
    session.cancel();
  } catch (const UploadError& e) {
    VIDUP_LOG_WARN("Server-side cancellation failed" << kv("error", std::string(e.what())));
  }
}

void throw_if_cancelled(UploadSession& session, const std::atomic<bool>& cancel_requested) {
  if (!cancel_requested.load()) {
    return;
  }
  cancel_session(session);
  throw UploadError(ErrorKind::kCancelled, "Upload cancelled by user");
}

}  // namespace

CancelWatcher::CancelWatcher(const std::atomic<bool>& flag, std::function<void()> on_cancel)
    : thread_([this, &flag, on_cancel]() {
        while (!done_.load()) {
          if (flag.load()) {
            on_cancel();
            return;
          }
          std::this_thread::sleep_for(kCancelPollInterval);
        }
      }) {}

CancelWatcher::~CancelWatcher() {
  done_.store(true);
  if (thread_.joinable()) {
    thread_.join();
  }
}

CompletionResult run_upload(
  UploadSession& session, const SourceFile& file, const UploadMetadata& metadata,
  const std::atomic<bool>& cancel_requested, std::ostream& out
) {
  // Interrupts uploadAllChunks mid-batch. Before initiate returns there is
  // nothing to cancel yet, which the checks between steps cover.
  CancelWatcher watcher(cancel_requested, [&session]() {
    VIDUP_LOG_WARN("Cancellation requested");
    cancel_session(session);
  });

  try {
    throw_if_cancelled(session, cancel_requested);
    session.initiate(file, metadata);
    throw_if_cancelled(session, cancel_requested);
    out << "Upload session " << session.uploadId().value_or("") << " started, "
        << session.totalChunks() << " chunks" << std::endl;

    session.uploadAllChunks(file);
    out << std::endl;
    throw_if_cancelled(session, cancel_requested);

    auto status = session.checkStatus();
    out << "Server has " << status.uploaded_chunks << "/" << status.total_chunks << " chunks"
        << std::endl;
    throw_if_cancelled(session, cancel_requested);

    return session.complete();
  } catch (const UploadError& e) {
    // A step racing the watcher fails on the cancelled session; report the
    // cancellation rather than the state error it caused.
    if (cancel_requested.load() && e.kind() != ErrorKind::kCancelled) {
      throw UploadError(ErrorKind::kCancelled, "Upload cancelled by user");
    }
    throw;
  }
}

}  // namespace upload
}  // namespace vidup
