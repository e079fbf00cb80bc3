// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIDUP_UPLOADER_MOCKS_HPP
#define VIDUP_UPLOADER_MOCKS_HPP

#include <gmock/gmock.h>

#include <memory>
#include <optional>
#include <string>

#include "file_access.hpp"
#include "http_client.hpp"
#include "movie_api.hpp"

namespace vidup {
namespace uploader {
namespace test {

class MockFileAccess : public IFileAccess {
public:
  MOCK_METHOD(
    std::optional<uint64_t>, regularFileSize, (const std::string& path), (const, override)
  );
  MOCK_METHOD(
    std::unique_ptr<IRangeReader>, openForRead, (const std::string& path), (const, override)
  );
};

class MockRangeReader : public IRangeReader {
public:
  MOCK_METHOD(bool, seek, (uint64_t offset), (override));
  MOCK_METHOD(uint64_t, readInto, (char* buffer, uint64_t length), (override));
};

class MockHttpClient : public IHttpClient {
public:
  MOCK_METHOD(HttpResponse, send, (const HttpRequest& request), (override));
};

class MockMovieApi : public IMovieApi {
public:
  MOCK_METHOD(std::string, initiateUpload, (const InitiateRequest& request), (override));
  MOCK_METHOD(void, uploadChunk, (const ChunkUploadRequest& request), (override));
  MOCK_METHOD(RemoteStatus, getUploadStatus, (const std::string& upload_id), (override));
  MOCK_METHOD(CompletionResult, completeUpload, (const std::string& upload_id), (override));
  MOCK_METHOD(void, cancelUpload, (const std::string& upload_id), (override));
  MOCK_METHOD(ProcessingStatus, getProcessingStatus, (const std::string& movie_id), (override));
  MOCK_METHOD(MovieInfo, getMovieInfo, (const std::string& movie_id), (override));
};

}  // namespace test
}  // namespace uploader
}  // namespace vidup

#endif  // VIDUP_UPLOADER_MOCKS_HPP
