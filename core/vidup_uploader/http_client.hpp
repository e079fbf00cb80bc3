// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIDUP_HTTP_CLIENT_HPP
#define VIDUP_HTTP_CLIENT_HPP

#include <chrono>
#include <string>
#include <vector>

namespace vidup {
namespace uploader {

enum class HttpMethod {
  kGet,
  kPost,
  kDelete
};

const char* toString(HttpMethod method);

struct HttpRequest {
  HttpMethod method = HttpMethod::kGet;
  std::string target;        // Path relative to the base URL, e.g. "/api/movies/42"
  std::string content_type;  // Empty when there is no body
  std::string body;
};

/**
 * Result of an HTTP request.
 */
struct HttpResponse {
  bool success = false;  // true for 2xx responses only
  int status_code = 0;   // 0 when no response was received
  std::string body;
  std::string error_message;
};

/**
 * Configuration for the HTTP client.
 */
struct HttpConfig {
  std::string base_url = "http://localhost:8080";
  std::chrono::milliseconds request_timeout{30000};
  std::string user_agent = "Movie-Service-Client/1.0.0";
};

/**
 * Synchronous HTTP transport.
 *
 * send() never throws: transport errors and non-2xx statuses are reported
 * through HttpResponse. Implementations must allow concurrent send() calls.
 */
class IHttpClient {
public:
  virtual ~IHttpClient() = default;

  virtual HttpResponse send(const HttpRequest& request) = 0;
};

/**
 * HttpClient over Boost.Beast. Opens one connection per request.
 * Only plain http:// base URLs are accepted.
 */
class BeastHttpClient : public IHttpClient {
public:
  explicit BeastHttpClient(const HttpConfig& config);

  // Non-copyable
  BeastHttpClient(const BeastHttpClient&) = delete;
  BeastHttpClient& operator=(const BeastHttpClient&) = delete;

  HttpResponse send(const HttpRequest& request) override;

  const HttpConfig& config() const {
    return config_;
  }

  /**
   * Split an http(s) URL into scheme, host, port and path.
   * @return false if the URL is malformed
   */
  static bool parse_url(
    const std::string& url, std::string& scheme, std::string& host, std::string& port,
    std::string& path
  );

private:
  HttpConfig config_;
};

/**
 * One part of a multipart/form-data body
 */
struct MultipartPart {
  std::string name;
  std::string filename;  // Omitted from the part headers when empty
  std::string content_type;
  std::string data;
};

/**
 * Random boundary token suitable for multipart/form-data
 */
std::string generate_multipart_boundary();

/**
 * Serialize parts into a multipart/form-data body delimited by `boundary`.
 */
std::string build_multipart_body(const std::vector<MultipartPart>& parts, const std::string& boundary);

inline std::string multipart_content_type(const std::string& boundary) {
  return "multipart/form-data; boundary=" + boundary;
}

}  // namespace uploader
}  // namespace vidup

#endif  // VIDUP_HTTP_CLIENT_HPP
