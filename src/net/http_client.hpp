#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "net/http_message.hpp"

namespace qrapi::net {

// HTTP request options
struct HttpOptions {
  std::string method = "GET";
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::milliseconds timeout{30000};
};

// Async HTTP client using ASIO
class HttpClient {
 public:
  explicit HttpClient(asio::io_context &io_ctx);

  ~HttpClient();

  // Async request with callback
  void request(const std::string &url, const HttpOptions &options, std::function<void(HttpResponse)> callback);

  // Async request returning future
  std::future<HttpResponse> request(const std::string &url, const HttpOptions &options);

  // Convenience methods
  std::future<HttpResponse> get(const std::string &url, const std::map<std::string, std::string> &headers = {});

  std::future<HttpResponse> post(const std::string &url, const std::string &body, const std::map<std::string, std::string> &headers = {});

 private:
  class Impl;

  std::unique_ptr<Impl> impl_;
};

// URL parsing helper
struct ParsedUrl {
  std::string scheme;
  std::string host;
  std::string port;
  std::string path;
  std::string query;

  bool is_https() const {
    return scheme == "https";
  }

  std::string port_or_default() const;

  // Value for the Host header: host, plus ":port" when one was given
  std::string host_header() const;

  static std::optional<ParsedUrl> parse(const std::string &url);

  // Resolve a Location header value against this URL
  std::string resolve(const std::string &location) const;
};

// Decode a "Transfer-Encoding: chunked" body. Returns nullopt if malformed.
std::optional<std::string> decode_chunked_body(const std::string &body);

}  // namespace qrapi::net
