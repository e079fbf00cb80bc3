// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIDUP_UPLOAD_TYPES_HPP
#define VIDUP_UPLOAD_TYPES_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace vidup {
namespace uploader {

/**
 * Metadata for an upload that creates a new movie.
 */
struct NewMovieMetadata {
  std::string title;
  std::string description;
};

/**
 * Metadata for an upload that attaches to an existing movie.
 */
struct ExistingMovieTarget {
  std::string movie_id;
};

/**
 * Chosen once per initiate()
 */
using UploadMetadata = std::variant<NewMovieMetadata, ExistingMovieTarget>;

/**
 * Parameters of the initiate request
 */
struct InitiateRequest {
  std::string filename;
  std::string mime_type;
  uint64_t total_size = 0;
  uint64_t chunk_size = 0;
  UploadMetadata metadata;
};

/**
 * Parameters of a single chunk upload
 */
struct ChunkUploadRequest {
  std::string upload_id;
  uint64_t chunk_number = 0;
  std::string checksum;
  std::string payload;
};

/**
 * Server-side snapshot of an upload session.
 */
struct RemoteStatus {
  std::string upload_id;
  uint64_t total_chunks = 0;
  uint64_t uploaded_chunks = 0;
  double progress_percentage = 0.0;
  std::vector<uint64_t> missing_chunks;  // Ascending
};

struct CompletionResult {
  std::string movie_id;
  std::string status;
};

enum class ProcessingState {
  kPending,
  kProcessing,
  kReady,
  kFailed,
  kUnknown  // Any server value not listed above; treated as non-terminal
};

/**
 * Parse a server status string (case-insensitive). Unrecognized values map to kUnknown.
 */
ProcessingState parseProcessingState(const std::string& value);

const char* toString(ProcessingState state);

std::ostream& operator<<(std::ostream& os, ProcessingState state);

inline bool isTerminal(ProcessingState state) {
  return state == ProcessingState::kReady || state == ProcessingState::kFailed;
}

using QualityMap = std::map<std::string, std::string>;

struct ProcessingStatus {
  std::string movie_id;
  ProcessingState state = ProcessingState::kUnknown;
  std::string raw_status;
  std::optional<QualityMap> qualities;
};

struct MovieInfo {
  std::string movie_id;
  std::string title;
  std::string description;
  std::string status;
  std::optional<QualityMap> qualities;
};

/**
 * Upload session lifecycle
 *
 * UNINITIATED -> ACTIVE -> {COMPLETED | CANCELLED | FAILED}
 * Terminal states may be re-initiated.
 */
enum class SessionState {
  kUninitiated,
  kActive,
  kCompleted,
  kCancelled,
  kFailed
};

const char* toString(SessionState state);

std::ostream& operator<<(std::ostream& os, SessionState state);

/**
 * Human-readable byte count: "0 Bytes", "512 Bytes", "1.5 KB", "12 MB", "2.25 GB".
 * Values are rounded to two decimals with trailing zeros dropped.
 */
std::string formatFileSize(uint64_t bytes);

}  // namespace uploader
}  // namespace vidup

#endif  // VIDUP_UPLOAD_TYPES_HPP
