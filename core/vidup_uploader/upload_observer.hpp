// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIDUP_UPLOAD_OBSERVER_HPP
#define VIDUP_UPLOAD_OBSERVER_HPP

#include <cstdint>
#include <exception>

namespace vidup {
namespace uploader {

/**
 * Receives transfer events from an UploadSession.
 *
 * Callbacks run on chunk worker threads, serialized by the session's lock.
 * Implementations must not call back into the session. Exceptions thrown from
 * a callback are logged and dropped.
 */
class UploadObserver {
public:
  virtual ~UploadObserver() = default;

  /**
   * A chunk was acknowledged by the server.
   * @param chunk_index 0-based index
   * @param progress Percentage of acknowledged chunks after this one, 0-100
   */
  virtual void onChunkUploaded(uint64_t chunk_index, int progress) = 0;

  /**
   * A chunk attempt failed and will be retried.
   * @param attempt 1-based number of the attempt that failed
   */
  virtual void onChunkRetry(uint64_t chunk_index, int attempt, const std::exception& error) = 0;

  virtual void onProgress(int progress) = 0;
};

class NullUploadObserver : public UploadObserver {
public:
  void onChunkUploaded(uint64_t, int) override {}
  void onChunkRetry(uint64_t, int, const std::exception&) override {}
  void onProgress(int) override {}
};

}  // namespace uploader
}  // namespace vidup

#endif  // VIDUP_UPLOAD_OBSERVER_HPP
