// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIDUP_CHUNK_DISPATCHER_HPP
#define VIDUP_CHUNK_DISPATCHER_HPP

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>

#include "retry_policy.hpp"
#include "sleeper.hpp"

namespace vidup {
namespace uploader {

/**
 * Half-open byte range [start, end) of one chunk
 */
struct ChunkRange {
  uint64_t start = 0;
  uint64_t end = 0;

  uint64_t length() const {
    return end - start;
  }
};

/**
 * ceil(file_size / chunk_size)
 * @throws UploadError (kInvalidArgument) if chunk_size is zero
 */
uint64_t chunkCount(uint64_t file_size, uint64_t chunk_size);

/**
 * Byte range of chunk `index`. The last chunk may be shorter than chunk_size.
 * @throws UploadError (kInvalidArgument) if index is past the last chunk
 */
ChunkRange chunkRange(uint64_t index, uint64_t chunk_size, uint64_t file_size);

/**
 * Runs one operation per chunk index with bounded concurrency.
 *
 * Indices are dispatched in ascending batches of at most max_concurrent. Each
 * member of a batch runs on its own std::async task through the retry policy,
 * and the next batch starts only after every member of the current one has
 * settled. If any member failed for good, dispatch() rethrows the error of the
 * lowest failed index once its batch has settled; later batches never start.
 *
 * The sleeper's cancellation flag is checked before each batch.
 */
class ChunkDispatcher {
public:
  using ChunkOperation = std::function<void(uint64_t chunk_index)>;
  using RetryCallback =
    std::function<void(uint64_t chunk_index, int attempt, const std::exception& error)>;

  ChunkDispatcher(size_t max_concurrent, RetryPolicy& retry_policy, const Sleeper& sleeper);

  /**
   * @throws UploadError (kCancelled) if cancelled between batches, otherwise
   *         the last error of the first chunk that exhausted its retries
   */
  void dispatch(
    uint64_t total_chunks, const ChunkOperation& operation, const RetryCallback& on_retry = nullptr
  );

  size_t maxConcurrent() const {
    return max_concurrent_;
  }

private:
  size_t max_concurrent_;
  RetryPolicy& retry_policy_;
  const Sleeper& sleeper_;
};

}  // namespace uploader
}  // namespace vidup

#endif  // VIDUP_CHUNK_DISPATCHER_HPP
