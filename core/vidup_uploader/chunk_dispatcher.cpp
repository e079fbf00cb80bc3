// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "chunk_dispatcher.hpp"

#include <algorithm>
#include <future>
#include <vector>

#include "upload_errors.hpp"

#define VIDUP_LOG_COMPONENT "chunk_dispatcher"
#include <vidup_log_macros.hpp>

namespace vidup {
namespace uploader {

using vidup::logging::kv;

uint64_t chunkCount(uint64_t file_size, uint64_t chunk_size) {
  if (chunk_size == 0) {
    throw UploadError(ErrorKind::kInvalidArgument, "Chunk size must be positive");
  }
  return (file_size + chunk_size - 1) / chunk_size;
}

ChunkRange chunkRange(uint64_t index, uint64_t chunk_size, uint64_t file_size) {
  if (index >= chunkCount(file_size, chunk_size)) {
    throw UploadError(
      ErrorKind::kInvalidArgument, "Chunk index " + std::to_string(index) + " out of range"
    );
  }
  ChunkRange range;
  range.start = index * chunk_size;
  range.end = std::min(range.start + chunk_size, file_size);
  return range;
}

ChunkDispatcher::ChunkDispatcher(
  size_t max_concurrent, RetryPolicy& retry_policy, const Sleeper& sleeper
)
    : max_concurrent_(max_concurrent)
    , retry_policy_(retry_policy)
    , sleeper_(sleeper) {
  if (max_concurrent_ == 0) {
    throw UploadError(ErrorKind::kInvalidArgument, "max_concurrent must be positive");
  }
}

void ChunkDispatcher::dispatch(
  uint64_t total_chunks, const ChunkOperation& operation, const RetryCallback& on_retry
) {
  // Workers log under the caller's upload context
  const logging::LogContext log_context = logging::capture_log_context();

  for (uint64_t batch_start = 0; batch_start < total_chunks; batch_start += max_concurrent_) {
    if (sleeper_.cancelled()) {
      VIDUP_LOG_INFO("Dispatch cancelled" << kv("next_chunk", batch_start));
      throw UploadError(ErrorKind::kCancelled, "Upload cancelled");
    }

    uint64_t batch_end = std::min<uint64_t>(batch_start + max_concurrent_, total_chunks);
    VIDUP_LOG_DEBUG("Starting batch" << kv("first", batch_start) << kv("last", batch_end - 1));

    std::vector<std::future<void>> futures;
    futures.reserve(static_cast<size_t>(batch_end - batch_start));
    for (uint64_t index = batch_start; index < batch_end; ++index) {
      auto task = [this, index, &operation, &on_retry, &log_context]() {
        logging::ScopedLogContext context(log_context);
        VIDUP_LOG_SCOPED_CHUNK(index);
        retry_policy_.execute(
          [&operation, index]() {
            operation(index);
          },
          [&on_retry, index](int attempt, const std::exception& error) {
            if (on_retry) {
              on_retry(index, attempt, error);
            }
          }
        );
      };
      futures.push_back(std::async(std::launch::async, task));
    }

    // Barrier: every member settles before the batch's outcome is decided
    std::exception_ptr first_error;
    uint64_t failed_index = 0;
    for (size_t i = 0; i < futures.size(); ++i) {
      try {
        futures[i].get();
      } catch (const std::exception& e) {
        if (!first_error) {
          first_error = std::current_exception();
          failed_index = batch_start + i;
        }
        VIDUP_LOG_ERROR(
          "Chunk failed" << kv("chunk", batch_start + i) << kv("error", std::string(e.what()))
        );
      }
    }

    if (first_error) {
      VIDUP_LOG_ERROR("Dispatch aborted" << kv("failed_chunk", failed_index));
      std::rethrow_exception(first_error);
    }
  }
}

}  // namespace uploader
}  // namespace vidup
