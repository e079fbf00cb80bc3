// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "movie_api.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <optional>
#include <vector>

#include "upload_errors.hpp"

#define VIDUP_LOG_COMPONENT "movie_api"
#include <vidup_log_macros.hpp>

namespace vidup {
namespace uploader {

using vidup::logging::kv;

namespace {

/**
 * Build the error for a failed HTTP exchange. The server's message field is
 * appended when the body carries one.
 */
UploadError httpFailure(ErrorKind kind, const std::string& what, const HttpResponse& response) {
  std::string message = what + " failed: " + response.error_message;
  if (!response.body.empty()) {
    try {
      auto body = nlohmann::json::parse(response.body);
      if (body.is_object() && body.contains("message") && body["message"].is_string()) {
        message += " (" + body["message"].get<std::string>() + ")";
      }
    } catch (const nlohmann::json::exception&) {
      // Non-JSON error body; the status line is enough
    }
  }
  VIDUP_LOG_DEBUG(
    "Request failed" << kv("operation", what) << kv("status", response.status_code)
                     << kv("error", response.error_message)
  );
  return UploadError(kind, message, response.status_code);
}

/**
 * Parse a response body and unwrap the {"data": ...} envelope if present.
 */
nlohmann::json parsePayload(ErrorKind kind, const std::string& what, const HttpResponse& response) {
  nlohmann::json body;
  try {
    body = nlohmann::json::parse(response.body);
  } catch (const nlohmann::json::parse_error& e) {
    throw UploadError(
      kind, what + " returned malformed JSON: " + std::string(e.what()), response.status_code
    );
  }
  if (body.is_object() && body.contains("data") && body["data"].is_object()) {
    return body["data"];
  }
  return body;
}

// Ids may be sent as JSON strings or numbers
std::string idField(const nlohmann::json& obj, const char* key) {
  const auto& value = obj.at(key);
  if (value.is_number_integer()) {
    return std::to_string(value.get<int64_t>());
  }
  return value.get<std::string>();  // throws type_error
}

std::optional<QualityMap> qualitiesField(const nlohmann::json& obj) {
  if (!obj.contains("qualities") || !obj["qualities"].is_object()) {
    return std::nullopt;
  }
  QualityMap qualities;
  for (const auto& [name, value] : obj["qualities"].items()) {
    qualities[name] = value.is_string() ? value.get<std::string>() : value.dump();
  }
  return qualities;
}

std::string stringField(const nlohmann::json& obj, const char* key) {
  if (!obj.contains(key) || obj[key].is_null()) {
    return "";
  }
  return obj[key].get<std::string>();
}

}  // namespace

MovieApiClient::MovieApiClient(std::shared_ptr<IHttpClient> http, std::string api_base_path)
    : http_(std::move(http))
    , base_path_(std::move(api_base_path)) {
  while (!base_path_.empty() && base_path_.back() == '/') {
    base_path_.pop_back();
  }
}

HttpResponse MovieApiClient::send(
  HttpMethod method, const std::string& path, const std::string& content_type,
  const std::string& body
) {
  HttpRequest request;
  request.method = method;
  request.target = base_path_ + path;
  request.content_type = content_type;
  request.body = body;
  return http_->send(request);
}

std::string MovieApiClient::initiateUpload(const InitiateRequest& request) {
  nlohmann::json payload = {
    {"filename", request.filename},
    {"mimeType", request.mime_type},
    {"totalSize", request.total_size},
    {"chunkSize", request.chunk_size},
  };
  if (const auto* meta = std::get_if<NewMovieMetadata>(&request.metadata)) {
    payload["movieTitle"] = meta->title;
    payload["movieDescription"] = meta->description;
  } else {
    payload["movieId"] = std::get<ExistingMovieTarget>(request.metadata).movie_id;
  }

  auto response =
    send(HttpMethod::kPost, "/chunk-upload/initiate", "application/json", payload.dump());
  if (!response.success) {
    throw httpFailure(ErrorKind::kSessionInitiation, "Upload initiation", response);
  }

  auto data = parsePayload(ErrorKind::kSessionInitiation, "Upload initiation", response);
  try {
    auto upload_id = idField(data, "uploadId");
    if (upload_id.empty()) {
      throw UploadError(
        ErrorKind::kSessionInitiation, "Upload initiation returned an empty uploadId",
        response.status_code
      );
    }
    return upload_id;
  } catch (const nlohmann::json::exception& e) {
    throw UploadError(
      ErrorKind::kSessionInitiation,
      "Upload initiation response is missing uploadId: " + std::string(e.what()),
      response.status_code
    );
  }
}

void MovieApiClient::uploadChunk(const ChunkUploadRequest& request) {
  nlohmann::json data = {
    {"uploadId", request.upload_id},
    {"chunkNumber", request.chunk_number},
    {"chunkSize", request.payload.size()},
    {"checksum", request.checksum},
  };

  std::vector<MultipartPart> parts = {
    {"chunk", "chunk_" + std::to_string(request.chunk_number), "application/octet-stream",
     request.payload},
    {"data", "", "application/json", data.dump()},
  };
  auto boundary = generate_multipart_boundary();

  auto response = send(
    HttpMethod::kPost,
    "/chunk-upload/" + request.upload_id + "/chunks/" + std::to_string(request.chunk_number),
    multipart_content_type(boundary), build_multipart_body(parts, boundary)
  );
  if (!response.success) {
    throw httpFailure(
      ErrorKind::kChunkUpload, "Chunk " + std::to_string(request.chunk_number) + " upload", response
    );
  }
}

RemoteStatus MovieApiClient::getUploadStatus(const std::string& upload_id) {
  auto response = send(HttpMethod::kGet, "/chunk-upload/" + upload_id + "/status");
  if (!response.success) {
    throw httpFailure(ErrorKind::kStatusQuery, "Upload status query", response);
  }

  auto data = parsePayload(ErrorKind::kStatusQuery, "Upload status query", response);
  try {
    RemoteStatus status;
    status.upload_id = data.contains("uploadId") ? idField(data, "uploadId") : upload_id;
    status.total_chunks = data.at("totalChunks").get<uint64_t>();
    status.uploaded_chunks = data.at("uploadedChunks").get<uint64_t>();
    status.progress_percentage = data.value("progressPercentage", 0.0);
    if (data.contains("missingChunks") && !data["missingChunks"].is_null()) {
      status.missing_chunks = data["missingChunks"].get<std::vector<uint64_t>>();
      std::sort(status.missing_chunks.begin(), status.missing_chunks.end());
    }
    return status;
  } catch (const nlohmann::json::exception& e) {
    throw UploadError(
      ErrorKind::kStatusQuery, "Malformed upload status response: " + std::string(e.what()),
      response.status_code
    );
  }
}

CompletionResult MovieApiClient::completeUpload(const std::string& upload_id) {
  auto response = send(HttpMethod::kPost, "/chunk-upload/" + upload_id + "/complete");
  if (!response.success) {
    throw httpFailure(ErrorKind::kCompletion, "Upload completion", response);
  }

  auto data = parsePayload(ErrorKind::kCompletion, "Upload completion", response);
  try {
    CompletionResult result;
    result.movie_id = idField(data, "movieId");
    result.status = stringField(data, "status");
    return result;
  } catch (const nlohmann::json::exception& e) {
    throw UploadError(
      ErrorKind::kCompletion, "Malformed completion response: " + std::string(e.what()),
      response.status_code
    );
  }
}

void MovieApiClient::cancelUpload(const std::string& upload_id) {
  auto response = send(HttpMethod::kDelete, "/chunk-upload/" + upload_id);
  if (!response.success) {
    throw httpFailure(ErrorKind::kCancellation, "Upload cancellation", response);
  }
}

ProcessingStatus MovieApiClient::getProcessingStatus(const std::string& movie_id) {
  auto response = send(HttpMethod::kGet, "/" + movie_id + "/status");
  if (!response.success) {
    throw httpFailure(ErrorKind::kStatusQuery, "Processing status query", response);
  }

  auto data = parsePayload(ErrorKind::kStatusQuery, "Processing status query", response);
  try {
    ProcessingStatus status;
    status.movie_id = data.contains("movieId") ? idField(data, "movieId") : movie_id;
    status.raw_status = data.at("status").get<std::string>();
    status.state = parseProcessingState(status.raw_status);
    status.qualities = qualitiesField(data);
    return status;
  } catch (const nlohmann::json::exception& e) {
    throw UploadError(
      ErrorKind::kStatusQuery, "Malformed processing status response: " + std::string(e.what()),
      response.status_code
    );
  }
}

MovieInfo MovieApiClient::getMovieInfo(const std::string& movie_id) {
  auto response = send(HttpMethod::kGet, "/" + movie_id);
  if (!response.success) {
    throw httpFailure(ErrorKind::kStatusQuery, "Movie info query", response);
  }

  auto data = parsePayload(ErrorKind::kStatusQuery, "Movie info query", response);
  try {
    MovieInfo info;
    info.movie_id = data.contains("movieId") ? idField(data, "movieId") : movie_id;
    info.title = stringField(data, "title");
    info.description = stringField(data, "description");
    info.status = stringField(data, "status");
    info.qualities = qualitiesField(data);
    return info;
  } catch (const nlohmann::json::exception& e) {
    throw UploadError(
      ErrorKind::kStatusQuery, "Malformed movie info response: " + std::string(e.what()),
      response.status_code
    );
  }
}

}  // namespace uploader
}  // namespace vidup
