// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_session.hpp"

#include <cmath>

#include "checksum.hpp"
#include "media_type.hpp"
#include "upload_errors.hpp"

#define VIDUP_LOG_COMPONENT "upload_session"
#include <vidup_log_macros.hpp>

namespace vidup {
namespace uploader {

using vidup::logging::kv;

UploadSession::UploadSession(
  std::shared_ptr<IMovieApi> api, const SessionConfig& config,
  std::shared_ptr<UploadObserver> observer, std::shared_ptr<Sleeper> sleeper
)
    : api_(std::move(api))
    , config_(config)
    , observer_(observer ? std::move(observer) : std::make_shared<NullUploadObserver>())
    , sleeper_(sleeper ? std::move(sleeper) : std::make_shared<CancellableSleeper>())
    , retry_policy_(config_.retry, *sleeper_) {
  if (!api_) {
    throw UploadError(ErrorKind::kInvalidArgument, "UploadSession requires a movie API client");
  }
  if (config_.chunk_size == 0) {
    throw UploadError(ErrorKind::kInvalidArgument, "Chunk size must be positive");
  }
  if (config_.max_concurrent_chunks == 0) {
    throw UploadError(ErrorKind::kInvalidArgument, "max_concurrent_chunks must be positive");
  }
}

void UploadSession::requireActive(const char* operation) const {
  if (state_ != SessionState::kActive) {
    throw UploadError(
      ErrorKind::kNotInitiated, std::string(operation) + " requires an active upload session (state: " +
                                  toString(state_) + ")"
    );
  }
}

void UploadSession::initiate(const SourceFile& file, const UploadMetadata& metadata) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::kActive) {
      throw UploadError(
        ErrorKind::kInvalidState, "Upload session already active" +
                                    (upload_id_ ? " (uploadId " + *upload_id_ + ")" : std::string())
      );
    }
  }

  auto mime_type = validateMediaType(file.declared_mime_type, file.name);

  if (!file.source) {
    throw UploadError(ErrorKind::kInvalidArgument, "Source file has no byte source: " + file.name);
  }
  uint64_t size = file.source->size();
  if (size == 0) {
    throw UploadError(ErrorKind::kInvalidArgument, "Cannot upload an empty file: " + file.name);
  }
  uint64_t total = chunkCount(size, config_.chunk_size);

  VIDUP_LOG_INFO(
    "Initiating upload" << kv("file", file.name) << kv("size", formatFileSize(size))
                        << kv("chunk_size", formatFileSize(config_.chunk_size))
                        << kv("total_chunks", total) << kv("mime_type", mime_type)
  );

  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++generation_;
    upload_id_.reset();
    filename_ = file.name;
    file_size_ = size;
    total_chunks_ = total;
    acknowledged_.clear();
  }
  sleeper_->reset();

  InitiateRequest request;
  request.filename = file.name;
  request.mime_type = mime_type;
  request.total_size = size;
  request.chunk_size = config_.chunk_size;
  request.metadata = metadata;

  std::string upload_id;
  try {
    upload_id = api_->initiateUpload(request);
  } catch (const UploadError& e) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = SessionState::kFailed;
    VIDUP_LOG_ERROR("Upload initiation failed" << kv("error", std::string(e.what())));
    throw;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  upload_id_ = upload_id;
  state_ = SessionState::kActive;
  VIDUP_LOG_INFO("Upload session started" << kv("upload_id", upload_id));
}

void UploadSession::uploadAllChunks(const SourceFile& file) {
  std::string upload_id;
  uint64_t generation = 0;
  uint64_t total = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    requireActive("uploadAllChunks");
    if (!file.source || file.source->size() != file_size_) {
      throw UploadError(
        ErrorKind::kInvalidArgument,
        "Source size " + std::to_string(file.size()) + " does not match initiated size " +
          std::to_string(file_size_)
      );
    }
    upload_id = *upload_id_;
    generation = generation_;
    total = total_chunks_;
  }

  VIDUP_LOG_SCOPED_UPLOAD(upload_id);
  VIDUP_LOG_INFO("Uploading chunks" << kv("total_chunks", total));

  const auto source = file.source;
  const uint64_t chunk_size = config_.chunk_size;
  const uint64_t file_size = source->size();

  ChunkDispatcher dispatcher(config_.max_concurrent_chunks, retry_policy_, *sleeper_);

  try {
    dispatcher.dispatch(
      total,
      [&](uint64_t index) {
        auto range = chunkRange(index, chunk_size, file_size);

        ChunkUploadRequest request;
        request.upload_id = upload_id;
        request.chunk_number = index;
        request.payload = source->read(range.start, range.length());
        request.checksum = computeChecksum(request.payload);

        api_->uploadChunk(request);
        acknowledgeChunk(generation, index);
      },
      [this](uint64_t index, int attempt, const std::exception& error) {
        notifyRetry(index, attempt, error);
      }
    );
  } catch (const UploadError& e) {
    if (e.kind() != ErrorKind::kCancelled && sleeper_->cancelled()) {
      throw UploadError(ErrorKind::kCancelled, std::string("Upload cancelled: ") + e.what());
    }
    throw;
  }

  if (sleeper_->cancelled()) {
    throw UploadError(ErrorKind::kCancelled, "Upload cancelled");
  }

  VIDUP_LOG_INFO("All chunks uploaded" << kv("total_chunks", total));
}

void UploadSession::acknowledgeChunk(uint64_t generation, uint64_t chunk_index) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (generation != generation_ || state_ != SessionState::kActive) {
    VIDUP_LOG_DEBUG("Discarding stale acknowledgement" << kv("chunk", chunk_index));
    return;
  }

  if (!acknowledged_.insert(chunk_index).second) {
    return;
  }

  int pct = progressLocked();
  VIDUP_LOG_DEBUG(
    "Chunk acknowledged" << kv("chunk", chunk_index) << kv("uploaded", acknowledged_.size())
                         << kv("total", total_chunks_) << kv("progress", pct)
  );

  try {
    observer_->onChunkUploaded(chunk_index, pct);
    observer_->onProgress(pct);
  } catch (const std::exception& e) {
    VIDUP_LOG_WARN("Upload observer threw" << kv("error", std::string(e.what())));
  }
}

void UploadSession::notifyRetry(uint64_t chunk_index, int attempt, const std::exception& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  try {
    observer_->onChunkRetry(chunk_index, attempt, error);
  } catch (const std::exception& e) {
    VIDUP_LOG_WARN("Upload observer threw" << kv("error", std::string(e.what())));
  }
}

RemoteStatus UploadSession::checkStatus() {
  std::string upload_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    requireActive("checkStatus");
    upload_id = *upload_id_;
  }

  auto status = api_->getUploadStatus(upload_id);
  VIDUP_LOG_INFO(
    "Upload status" << kv("upload_id", upload_id) << kv("uploaded", status.uploaded_chunks)
                    << kv("total", status.total_chunks)
                    << kv("missing", status.missing_chunks.size())
  );
  return status;
}

CompletionResult UploadSession::complete() {
  auto status = checkStatus();

  std::string upload_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    requireActive("complete");
    upload_id = *upload_id_;
  }

  if (!status.missing_chunks.empty()) {
    std::string missing;
    for (size_t i = 0; i < status.missing_chunks.size(); ++i) {
      if (i > 0) {
        missing += ", ";
      }
      missing += std::to_string(status.missing_chunks[i]);
    }
    VIDUP_LOG_WARN("Cannot complete upload, chunks missing" << kv("missing", missing));
    throw UploadError(ErrorKind::kIncompleteUpload, "Missing chunks: " + missing);
  }

  CompletionResult result;
  try {
    result = api_->completeUpload(upload_id);
  } catch (const UploadError& e) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::kActive) {
      state_ = SessionState::kFailed;
    }
    VIDUP_LOG_ERROR("Upload completion failed" << kv("error", std::string(e.what())));
    throw;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = SessionState::kCompleted;
  }
  VIDUP_LOG_INFO(
    "Upload completed" << kv("upload_id", upload_id) << kv("movie_id", result.movie_id)
                       << kv("status", result.status)
  );
  return result;
}

void UploadSession::cancel() {
  std::string upload_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    bool cancellable = state_ == SessionState::kActive ||
                       (state_ == SessionState::kFailed && upload_id_.has_value());
    if (!cancellable) {
      VIDUP_LOG_DEBUG("Nothing to cancel" << kv("state", toString(state_)));
      return;
    }
    upload_id = *upload_id_;
    upload_id_.reset();
    state_ = SessionState::kCancelled;
    ++generation_;
  }
  sleeper_->cancel();

  VIDUP_LOG_INFO("Cancelling upload" << kv("upload_id", upload_id));
  try {
    api_->cancelUpload(upload_id);
  } catch (const UploadError& e) {
    VIDUP_LOG_ERROR(
      "Server rejected cancellation" << kv("upload_id", upload_id)
                                     << kv("error", std::string(e.what()))
    );
    throw;
  }
}

SessionState UploadSession::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::optional<std::string> UploadSession::uploadId() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return upload_id_;
}

uint64_t UploadSession::fileSize() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return file_size_;
}

uint64_t UploadSession::totalChunks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return total_chunks_;
}

uint64_t UploadSession::uploadedChunksCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return acknowledged_.size();
}

std::set<uint64_t> UploadSession::acknowledgedChunks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return acknowledged_;
}

int UploadSession::progress() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return progressLocked();
}

int UploadSession::progressLocked() const {
  if (total_chunks_ == 0) {
    return 0;
  }
  return static_cast<int>(std::lround(
    static_cast<double>(acknowledged_.size()) / static_cast<double>(total_chunks_) * 100.0
  ));
}

}  // namespace uploader
}  // namespace vidup
