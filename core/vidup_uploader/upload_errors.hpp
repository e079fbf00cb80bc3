// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIDUP_UPLOAD_ERRORS_HPP
#define VIDUP_UPLOAD_ERRORS_HPP

#include <ostream>
#include <stdexcept>
#include <string>

namespace vidup {
namespace uploader {

/**
 * Classification of every failure surfaced by the upload engine.
 */
enum class ErrorKind {
  kUnsupportedMediaType,    // Rejected before any request was sent
  kNotInitiated,            // Operation needs an active session
  kInvalidState,            // Operation not allowed in the current session state
  kInvalidArgument,         // Caller input does not match the session
  kSessionInitiation,       // initiate request failed
  kChunkUpload,             // Chunk request failed (after retries when surfaced by dispatch)
  kStatusQuery,             // status / processing status / resource info request failed
  kCompletion,              // complete request failed
  kCancellation,            // cancel (DELETE) request failed
  kIncompleteUpload,        // Server still reports missing chunks
  kProcessingFailed,        // Server-side processing reached FAILED
  kCancelled,               // Local cancellation interrupted the operation
  kSourceRead,              // Reading a byte range from the source failed
  kChecksum                 // Digest computation failed
};

const char* toString(ErrorKind kind);

std::ostream& operator<<(std::ostream& os, ErrorKind kind);

/**
 * Typed engine error. Every public engine operation either returns its result
 * or throws exactly one UploadError.
 */
class UploadError : public std::runtime_error {
public:
  UploadError(ErrorKind kind, const std::string& message, int http_status = 0)
      : std::runtime_error(message)
      , kind_(kind)
      , http_status_(http_status) {}

  ErrorKind kind() const {
    return kind_;
  }

  /**
   * HTTP status returned by the server, 0 when the failure happened before a
   * response was received.
   */
  int httpStatus() const {
    return http_status_;
  }

private:
  ErrorKind kind_;
  int http_status_;
};

}  // namespace uploader
}  // namespace vidup

#endif  // VIDUP_UPLOAD_ERRORS_HPP
