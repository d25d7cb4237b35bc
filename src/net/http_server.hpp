#pragma once

#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "core/types.hpp"
#include "net/http_message.hpp"

namespace qrapi::net {

using RouteHandler = std::function<HttpResponse(const HttpRequest &)>;

struct ServerOptions {
  std::string host = "0.0.0.0";
  uint16_t port = 8000;  // 0 picks an ephemeral port
  int threads = 4;
  size_t max_body_bytes = 1024 * 1024;
  std::chrono::seconds read_timeout{30};
  bool cors = true;  // Access-Control-Allow-* on every response, OPTIONS preflight
};

// Minimal HTTP/1.1 server on ASIO. One request per connection.
class HttpServer {
 public:
  explicit HttpServer(ServerOptions options);

  ~HttpServer();

  HttpServer(const HttpServer &) = delete;
  HttpServer &operator=(const HttpServer &) = delete;

  // Register a handler for an exact method + path
  void route(const std::string &method, const std::string &path, RouteHandler handler);

  // Bind, listen and spin up the worker threads. Throws asio::system_error if the
  // address cannot be bound. Returns the bound port.
  uint16_t start();

  // Block until stop() is called (from a signal handler or another thread)
  void wait();

  void stop();

  uint16_t port() const;

  // Route lookup + error mapping, without any socket involved
  HttpResponse dispatch(const HttpRequest &request) const;

 private:
  class Impl;

  std::unique_ptr<Impl> impl_;
};

// Response helpers used by route handlers
HttpResponse json_response(int status_code, const json &body);

// {"detail": message}
HttpResponse error_response(int status_code, const std::string &message);

// Serialize status line, headers and body for the wire
std::string serialize_response(const HttpResponse &response);

}  // namespace qrapi::net
