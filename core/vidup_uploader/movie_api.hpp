// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIDUP_MOVIE_API_HPP
#define VIDUP_MOVIE_API_HPP

#include <memory>
#include <string>

#include "http_client.hpp"
#include "upload_types.hpp"

namespace vidup {
namespace uploader {

constexpr const char* kDefaultApiBasePath = "/api/movies";

/**
 * Typed binding of the movie service upload endpoints.
 *
 * Each call either returns the parsed response or throws UploadError with the
 * kind of the failing operation. Implementations must allow concurrent
 * uploadChunk() calls.
 */
class IMovieApi {
public:
  virtual ~IMovieApi() = default;

  /**
   * @return Server-issued upload id
   * @throws UploadError (kSessionInitiation)
   */
  virtual std::string initiateUpload(const InitiateRequest& request) = 0;

  /**
   * @throws UploadError (kChunkUpload)
   */
  virtual void uploadChunk(const ChunkUploadRequest& request) = 0;

  /**
   * @throws UploadError (kStatusQuery)
   */
  virtual RemoteStatus getUploadStatus(const std::string& upload_id) = 0;

  /**
   * @throws UploadError (kCompletion)
   */
  virtual CompletionResult completeUpload(const std::string& upload_id) = 0;

  /**
   * @throws UploadError (kCancellation)
   */
  virtual void cancelUpload(const std::string& upload_id) = 0;

  /**
   * @throws UploadError (kStatusQuery)
   */
  virtual ProcessingStatus getProcessingStatus(const std::string& movie_id) = 0;

  /**
   * @throws UploadError (kStatusQuery)
   */
  virtual MovieInfo getMovieInfo(const std::string& movie_id) = 0;
};

/**
 * IMovieApi over an IHttpClient. Request and response bodies are JSON; a
 * response wrapped in {"data": {...}} is unwrapped before parsing.
 */
class MovieApiClient : public IMovieApi {
public:
  explicit MovieApiClient(
    std::shared_ptr<IHttpClient> http, std::string api_base_path = kDefaultApiBasePath
  );

  std::string initiateUpload(const InitiateRequest& request) override;
  void uploadChunk(const ChunkUploadRequest& request) override;
  RemoteStatus getUploadStatus(const std::string& upload_id) override;
  CompletionResult completeUpload(const std::string& upload_id) override;
  void cancelUpload(const std::string& upload_id) override;
  ProcessingStatus getProcessingStatus(const std::string& movie_id) override;
  MovieInfo getMovieInfo(const std::string& movie_id) override;

private:
  HttpResponse send(HttpMethod method, const std::string& path, const std::string& content_type = "",
                    const std::string& body = "");

  std::shared_ptr<IHttpClient> http_;
  std::string base_path_;
};

}  // namespace uploader
}  // namespace vidup

#endif  // VIDUP_MOVIE_API_HPP
