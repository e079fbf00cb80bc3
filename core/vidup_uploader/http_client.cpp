// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "http_client.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <algorithm>
#include <cctype>
#include <random>
#include <regex>

#define VIDUP_LOG_COMPONENT "http_client"
#include <vidup_log_macros.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace vidup {
namespace uploader {

using vidup::logging::kv;

const char* toString(HttpMethod method) {
  switch (method) {
    case HttpMethod::kGet:
      return "GET";
    case HttpMethod::kPost:
      return "POST";
    case HttpMethod::kDelete:
      return "DELETE";
  }
  return "GET";
}

namespace {

http::verb to_verb(HttpMethod method) {
  switch (method) {
    case HttpMethod::kGet:
      return http::verb::get;
    case HttpMethod::kPost:
      return http::verb::post;
    case HttpMethod::kDelete:
      return http::verb::delete_;
  }
  return http::verb::get;
}

// Start one asynchronous operation and run the context until it finishes.
template <class Start>
beast::error_code run_to_completion(net::io_context& ioc, Start&& start) {
  beast::error_code result;
  start([&result](beast::error_code ec, auto&&...) {
    result = ec;
  });
  ioc.restart();
  ioc.run();
  return result;
}

}  // namespace

BeastHttpClient::BeastHttpClient(const HttpConfig& config)
    : config_(config) {}

bool BeastHttpClient::parse_url(
  const std::string& url, std::string& scheme, std::string& host, std::string& port,
  std::string& path
) {
  // Format: http(s)://host(:port)/path
  static const std::regex url_regex(R"(^(https?)://([^/:]+)(?::(\d+))?(.*)$)", std::regex::icase);
  std::smatch match;

  if (!std::regex_match(url, match, url_regex)) {
    return false;
  }

  scheme = match[1].str();
  std::transform(scheme.begin(), scheme.end(), scheme.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  host = match[2].str();
  std::string port_str = match[3].str();
  path = match[4].str();

  // Strip trailing slash so base path + target does not double up
  while (!path.empty() && path.back() == '/') {
    path.pop_back();
  }

  if (port_str.empty()) {
    port = (scheme == "https") ? "443" : "80";
  } else {
    port = port_str;
  }

  return true;
}

HttpResponse BeastHttpClient::send(const HttpRequest& request) {
  HttpResponse result;

  std::string scheme, host, port, base_path;
  if (!parse_url(config_.base_url, scheme, host, port, base_path)) {
    result.error_message = "Invalid base URL: " + config_.base_url;
    return result;
  }
  if (scheme != "http") {
    result.error_message = "Unsupported URL scheme '" + scheme + "' (only http is supported)";
    return result;
  }

  std::string target = base_path + request.target;
  if (target.empty()) {
    target = "/";
  }

  VIDUP_LOG_DEBUG(
    "HTTP request" << kv("method", toString(request.method)) << kv("target", target)
                   << kv("body_bytes", request.body.size())
  );

  try {
    net::io_context ioc;
    tcp::resolver resolver(ioc);

    http::request<http::string_body> req{to_verb(request.method), target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, config_.user_agent);
    req.set(http::field::accept, "application/json");
    if (!request.content_type.empty()) {
      req.set(http::field::content_type, request.content_type);
    }
    req.body() = request.body;
    req.prepare_payload();

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(64 * 1024 * 1024);

    // tcp_stream deadlines only apply to asynchronous operations, so each
    // step is started async and driven to completion on this thread. One
    // expiry covers the whole exchange.
    beast::tcp_stream stream(ioc);
    auto const results = resolver.resolve(host, port);
    stream.expires_after(config_.request_timeout);

    beast::error_code ec = run_to_completion(ioc, [&](auto handler) {
      stream.async_connect(results, handler);
    });
    if (!ec) {
      ec = run_to_completion(ioc, [&](auto handler) {
        http::async_write(stream, req, handler);
      });
    }
    if (!ec) {
      ec = run_to_completion(ioc, [&](auto handler) {
        http::async_read(stream, buffer, parser, handler);
      });
    }
    if (ec == beast::error::timeout) {
      result.error_message =
        "HTTP request timed out after " + std::to_string(config_.request_timeout.count()) + " ms";
      VIDUP_LOG_WARN("HTTP request timed out" << kv("target", target));
      return result;
    }
    if (ec) {
      throw beast::system_error{ec};
    }
    http::response<http::string_body> res = parser.release();

    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
      VIDUP_LOG_WARN("Socket shutdown warning" << kv("error", ec.message()));
    }

    result.status_code = static_cast<int>(res.result_int());
    result.body = res.body();

    if (result.status_code >= 200 && result.status_code < 300) {
      result.success = true;
    } else {
      result.error_message = "Server returned status " + std::to_string(result.status_code);
    }

  } catch (const std::exception& e) {
    result.error_message = std::string("HTTP request failed: ") + e.what();
    VIDUP_LOG_ERROR(
      "HTTP request exception" << kv("target", target) << kv("error", std::string(e.what()))
    );
  }

  return result;
}

std::string generate_multipart_boundary() {
  static const char kAlphabet[] =
    "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
  thread_local std::mt19937 rng(std::random_device{}());
  std::uniform_int_distribution<size_t> dist(0, sizeof(kAlphabet) - 2);

  std::string boundary = "----VidupFormBoundary";
  for (int i = 0; i < 16; ++i) {
    boundary += kAlphabet[dist(rng)];
  }
  return boundary;
}

std::string build_multipart_body(
  const std::vector<MultipartPart>& parts, const std::string& boundary
) {
  std::string body;
  for (const auto& part : parts) {
    body += "--" + boundary + "\r\n";
    body += "Content-Disposition: form-data; name=\"" + part.name + "\"";
    if (!part.filename.empty()) {
      body += "; filename=\"" + part.filename + "\"";
    }
    body += "\r\n";
    if (!part.content_type.empty()) {
      body += "Content-Type: " + part.content_type + "\r\n";
    }
    body += "\r\n";
    body += part.data;
    body += "\r\n";
  }
  body += "--" + boundary + "--\r\n";
  return body;
}

}  // namespace uploader
}  // namespace vidup
