// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_errors.hpp"

namespace vidup {
namespace uploader {

const char* toString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kUnsupportedMediaType:
      return "UnsupportedMediaType";
    case ErrorKind::kNotInitiated:
      return "NotInitiated";
    case ErrorKind::kInvalidState:
      return "InvalidState";
    case ErrorKind::kInvalidArgument:
      return "InvalidArgument";
    case ErrorKind::kSessionInitiation:
      return "SessionInitiationError";
    case ErrorKind::kChunkUpload:
      return "ChunkUploadError";
    case ErrorKind::kStatusQuery:
      return "StatusQueryError";
    case ErrorKind::kCompletion:
      return "CompletionError";
    case ErrorKind::kCancellation:
      return "CancellationError";
    case ErrorKind::kIncompleteUpload:
      return "IncompleteUpload";
    case ErrorKind::kProcessingFailed:
      return "ProcessingFailed";
    case ErrorKind::kCancelled:
      return "Cancelled";
    case ErrorKind::kSourceRead:
      return "SourceReadError";
    case ErrorKind::kChecksum:
      return "ChecksumError";
  }
  return "Unknown";
}

std::ostream& operator<<(std::ostream& os, ErrorKind kind) {
  return os << toString(kind);
}

}  // namespace uploader
}  // namespace vidup
