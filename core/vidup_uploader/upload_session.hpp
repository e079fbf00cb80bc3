// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIDUP_UPLOAD_SESSION_HPP
#define VIDUP_UPLOAD_SESSION_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "byte_source.hpp"
#include "chunk_dispatcher.hpp"
#include "movie_api.hpp"
#include "retry_policy.hpp"
#include "sleeper.hpp"
#include "upload_observer.hpp"
#include "upload_types.hpp"

namespace vidup {
namespace uploader {

constexpr uint64_t kDefaultChunkSize = 5ULL * 1024 * 1024;
constexpr size_t kDefaultMaxConcurrentChunks = 3;

struct SessionConfig {
  uint64_t chunk_size = kDefaultChunkSize;
  size_t max_concurrent_chunks = kDefaultMaxConcurrentChunks;
  RetryConfig retry;
};

/**
 * Client side of one chunked upload transaction.
 *
 * Lifecycle:
 *   initiate()        UNINITIATED/terminal -> ACTIVE (FAILED on server error)
 *   uploadAllChunks() ACTIVE, no state change
 *   complete()        ACTIVE -> COMPLETED (FAILED on server error)
 *   cancel()          ACTIVE/FAILED -> CANCELLED
 *
 * cancel() may be called from any thread, including while uploadAllChunks()
 * runs on another. It wakes pending backoff waits and stops further batches;
 * requests already on the wire finish but their acknowledgements are dropped.
 * All other operations are meant for a single controlling thread.
 */
class UploadSession {
public:
  /**
   * @param api Movie service binding
   * @param config Chunking, concurrency and retry settings
   * @param observer Transfer event sink (NullUploadObserver when null)
   * @param sleeper Backoff wait primitive (CancellableSleeper when null)
   */
  explicit UploadSession(
    std::shared_ptr<IMovieApi> api, const SessionConfig& config = SessionConfig(),
    std::shared_ptr<UploadObserver> observer = nullptr, std::shared_ptr<Sleeper> sleeper = nullptr
  );

  // Non-copyable, non-movable
  UploadSession(const UploadSession&) = delete;
  UploadSession& operator=(const UploadSession&) = delete;

  /**
   * Validate the file's media type and open a server session for it.
   *
   * @throws UploadError kInvalidState (already ACTIVE), kUnsupportedMediaType,
   *         kInvalidArgument (no source or empty file), kSessionInitiation
   */
  void initiate(const SourceFile& file, const UploadMetadata& metadata);

  /**
   * Upload every chunk of `file`, retrying each through the retry policy.
   * Chunks acknowledged before a failure stay acknowledged.
   *
   * @throws UploadError kNotInitiated, kInvalidArgument (size differs from the
   *         initiated size), kCancelled, or the last error of the failed chunk
   */
  void uploadAllChunks(const SourceFile& file);

  /**
   * Server-side view of the session. Does not modify local state.
   * @throws UploadError kNotInitiated, kStatusQuery
   */
  RemoteStatus checkStatus();

  /**
   * Reconcile with the server and finalize the upload.
   * @throws UploadError kNotInitiated, kStatusQuery, kIncompleteUpload, kCompletion
   */
  CompletionResult complete();

  /**
   * Abort the session. No-op when there is nothing to cancel.
   * @throws UploadError kCancellation if the server delete failed (state is CANCELLED regardless)
   */
  void cancel();

  SessionState state() const;
  std::optional<std::string> uploadId() const;
  uint64_t fileSize() const;
  uint64_t totalChunks() const;
  uint64_t uploadedChunksCount() const;
  std::set<uint64_t> acknowledgedChunks() const;

  /**
   * round(|acknowledged| / totalChunks * 100); 0 before initiate
   */
  int progress() const;

  const SessionConfig& config() const {
    return config_;
  }

private:
  void requireActive(const char* operation) const;
  int progressLocked() const;

  // Records an acknowledged chunk and notifies the observer. Drops the ack if
  // the session moved on (cancelled or re-initiated) since `generation`.
  void acknowledgeChunk(uint64_t generation, uint64_t chunk_index);
  void notifyRetry(uint64_t chunk_index, int attempt, const std::exception& error);

  std::shared_ptr<IMovieApi> api_;
  SessionConfig config_;
  std::shared_ptr<UploadObserver> observer_;
  std::shared_ptr<Sleeper> sleeper_;
  RetryPolicy retry_policy_;

  mutable std::mutex mutex_;
  SessionState state_ = SessionState::kUninitiated;
  std::optional<std::string> upload_id_;
  std::string filename_;
  uint64_t file_size_ = 0;
  uint64_t total_chunks_ = 0;
  std::set<uint64_t> acknowledged_;
  uint64_t generation_ = 0;
};

}  // namespace uploader
}  // namespace vidup

#endif  // VIDUP_UPLOAD_SESSION_HPP
