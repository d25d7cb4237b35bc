#include "http_client.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <regex>
#include <sstream>

#include "core/types.hpp"

namespace qrapi::net {

// URL parsing
std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
  // Simple regex-based URL parser
  static const std::regex url_regex(R"(^(https?):\/\/([^:\/\s\?#]+)(?::(\d+))?(\/[^\?#\s]*)?(\?[^#\s]*)?(#\S*)?$)", std::regex::icase);
  std::smatch match;

  if (!std::regex_match(url, match, url_regex)) {
    return std::nullopt;
  }

  ParsedUrl result;
  result.scheme = to_lower(match[1].str());
  result.host = match[2].str();
  result.port = match[3].str();
  result.path = match[4].str().empty() ? "/" : match[4].str();
  result.query = match[5].str();

  return result;
}

std::string ParsedUrl::port_or_default() const {
  if (!port.empty()) return port;
  return is_https() ? "443" : "80";
}

std::string ParsedUrl::host_header() const {
  return port.empty() ? host : host + ":" + port;
}

std::string ParsedUrl::resolve(const std::string& location) const {
  auto lower = to_lower(location);
  if (lower.starts_with("http://") || lower.starts_with("https://")) {
    return location;
  }
  if (location.starts_with("//")) {
    return scheme + ":" + location;
  }

  std::string origin = scheme + "://" + host + (port.empty() ? "" : ":" + port);
  if (location.starts_with("/")) {
    return origin + location;
  }

  // Relative to the directory of the current path
  auto dir = path.substr(0, path.rfind('/') + 1);
  return origin + dir + location;
}

std::optional<std::string> decode_chunked_body(const std::string& body) {
  std::string decoded;
  size_t pos = 0;

  while (pos < body.size()) {
    auto line_end = body.find("\r\n", pos);
    if (line_end == std::string::npos) return std::nullopt;

    // Chunk extensions after ';' are ignored
    auto size_str = body.substr(pos, line_end - pos);
    auto semicolon = size_str.find(';');
    if (semicolon != std::string::npos) size_str.resize(semicolon);
    size_str = trim(size_str);
    if (size_str.empty()) return std::nullopt;

    size_t chunk_size = 0;
    try {
      size_t consumed = 0;
      chunk_size = std::stoull(size_str, &consumed, 16);
      if (consumed != size_str.size()) return std::nullopt;
    } catch (const std::exception&) {
      return std::nullopt;
    }

    pos = line_end + 2;
    if (chunk_size == 0) {
      return decoded;
    }

    if (pos + chunk_size > body.size()) return std::nullopt;
    decoded.append(body, pos, chunk_size);
    pos += chunk_size;

    if (body.compare(pos, 2, "\r\n") != 0) return std::nullopt;
    pos += 2;
  }

  // Missing terminating zero-size chunk
  return std::nullopt;
}

// HTTP Client implementation
class HttpClient::Impl {
 public:
  explicit Impl(asio::io_context& io_ctx) : io_ctx_(io_ctx), ssl_ctx_(asio::ssl::context::tlsv12_client) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(asio::ssl::verify_peer);
  }

  void request(const std::string& url, const HttpOptions& options, std::function<void(HttpResponse)> callback) {
    auto parsed = ParsedUrl::parse(url);
    if (!parsed) {
      callback(HttpResponse{0, {}, "", "Invalid URL"});
      return;
    }

    if (parsed->is_https()) {
      auto socket = std::make_shared<asio::ssl::stream<asio::ip::tcp::socket>>(io_ctx_, ssl_ctx_);

      // Set SNI hostname
      SSL_set_tlsext_host_name(socket->native_handle(), parsed->host.c_str());
      start(socket, *parsed, options, std::move(callback));
    } else {
      start(std::make_shared<asio::ip::tcp::socket>(io_ctx_), *parsed, options, std::move(callback));
    }
  }

 private:
  using Callback = std::function<void(HttpResponse)>;

  // Helper: close the lowest-layer socket, ignoring errors
  template <typename Socket>
  static void close_socket(std::shared_ptr<Socket> socket) {
    asio::error_code ignored;
    socket->lowest_layer().close(ignored);
  }

  static void close_socket(std::shared_ptr<asio::ip::tcp::socket> socket) {
    asio::error_code ignored;
    socket->close(ignored);
  }

  // Start a timeout timer. When it fires, set the timed_out flag and close the socket.
  template <typename Socket>
  static std::shared_ptr<asio::steady_timer> start_timeout(asio::io_context& io_ctx, std::chrono::milliseconds timeout, std::shared_ptr<Socket> socket,
                                                           std::shared_ptr<bool> timed_out) {
    auto timer = std::make_shared<asio::steady_timer>(io_ctx);
    timer->expires_after(timeout);
    timer->async_wait([socket, timed_out, timer](const asio::error_code& ec) {
      if (!ec) {
        // Timer fired (not cancelled), mark as timed out and close socket
        *timed_out = true;
        close_socket(socket);
      }
    });
    return timer;
  }

  static std::string build_request(const ParsedUrl& url, const HttpOptions& options) {
    std::ostringstream req;
    req << options.method << " " << url.path << url.query << " HTTP/1.1\r\n";
    req << "Host: " << url.host_header() << "\r\n";
    req << "Connection: close\r\n";

    for (const auto& [key, value] : options.headers) {
      req << key << ": " << value << "\r\n";
    }

    if (!options.body.empty()) {
      req << "Content-Length: " << options.body.size() << "\r\n";
    }

    req << "\r\n";
    req << options.body;
    return req.str();
  }

  // TLS streams need a handshake between connect and write; plain sockets go straight on
  static void handshake(std::shared_ptr<asio::ip::tcp::socket>, std::function<void(const asio::error_code&)> next) {
    next(asio::error_code{});
  }

  static void handshake(std::shared_ptr<asio::ssl::stream<asio::ip::tcp::socket>> socket, std::function<void(const asio::error_code&)> next) {
    socket->async_handshake(asio::ssl::stream_base::client, [socket, next](const asio::error_code& ec) {
      next(ec);
    });
  }

  template <typename Socket>
  void start(std::shared_ptr<Socket> socket, const ParsedUrl& url, const HttpOptions& options, Callback callback) {
    auto response = std::make_shared<HttpResponse>();
    auto request_str = std::make_shared<std::string>(build_request(url, options));
    auto buffer = std::make_shared<asio::streambuf>();
    auto timed_out = std::make_shared<bool>(false);
    auto resolver = std::make_shared<asio::ip::tcp::resolver>(io_ctx_);

    // Start timeout timer
    auto timer = start_timeout(io_ctx_, options.timeout, socket, timed_out);

    // Wrap callback to cancel timer and check timeout
    auto guarded_callback = [timer, timed_out, callback](HttpResponse resp) {
      timer->cancel();
      if (*timed_out) {
        resp.error = "Request timed out";
        resp.status_code = 0;
      }
      callback(std::move(resp));
    };

    resolver->async_resolve(
        url.host, url.port_or_default(),
        [this, resolver, socket, request_str, response, buffer, guarded_callback](const asio::error_code& ec,
                                                                                   asio::ip::tcp::resolver::results_type results) {
          if (ec) {
            response->error = "DNS resolution failed: " + ec.message();
            guarded_callback(*response);
            return;
          }

          asio::async_connect(
              socket->lowest_layer(), results,
              [this, socket, request_str, response, buffer, guarded_callback](const asio::error_code& ec, const asio::ip::tcp::endpoint&) {
                if (ec) {
                  response->error = "Connection failed: " + ec.message();
                  guarded_callback(*response);
                  return;
                }

                handshake(socket, [this, socket, request_str, response, buffer, guarded_callback](const asio::error_code& ec) {
                  if (ec) {
                    response->error = "SSL handshake failed: " + ec.message();
                    guarded_callback(*response);
                    return;
                  }

                  asio::async_write(*socket, asio::buffer(*request_str),
                                    [this, socket, response, buffer, guarded_callback](const asio::error_code& ec, size_t) {
                                      if (ec) {
                                        response->error = "Write failed: " + ec.message();
                                        guarded_callback(*response);
                                        return;
                                      }

                                      read_response(socket, response, buffer, guarded_callback);
                                    });
                });
              });
        });
  }

  template <typename Socket>
  void read_response(std::shared_ptr<Socket> socket, std::shared_ptr<HttpResponse> response, std::shared_ptr<asio::streambuf> buffer,
                     Callback callback) {
    asio::async_read_until(*socket, *buffer, "\r\n\r\n", [this, socket, response, buffer, callback](const asio::error_code& ec, size_t) {
      if (ec && ec != asio::error::eof) {
        response->error = "Read headers failed: " + ec.message();
        callback(*response);
        return;
      }

      // Parse status line and headers
      std::istream stream(buffer.get());
      std::string status_line;
      std::getline(stream, status_line);

      static const std::regex status_regex(R"(HTTP/[\d.]+ (\d+))");
      std::smatch match;
      if (std::regex_search(status_line, match, status_regex)) {
        try {
          response->status_code = std::stoi(match[1].str());
        } catch (const std::exception&) {
          response->error = "Invalid HTTP response: cannot parse status code";
          callback(*response);
          return;
        }
      }

      std::string header_line;
      while (std::getline(stream, header_line) && header_line != "\r") {
        auto colon = header_line.find(':');
        if (colon != std::string::npos) {
          std::string key = header_line.substr(0, colon);
          std::string value = header_line.substr(colon + 1);
          // Trim whitespace
          value.erase(0, value.find_first_not_of(" \t"));
          value.erase(value.find_last_not_of(" \t\r\n") + 1);
          response->headers[key] = value;
        }
      }

      read_body(socket, response, buffer, callback);
    });
  }

  // Hand the response over once the body is complete, undoing chunked framing
  static void finish(std::shared_ptr<HttpResponse> response, const Callback& callback) {
    auto encoding = response->header("Transfer-Encoding");
    if (encoding && to_lower(*encoding).find("chunked") != std::string::npos) {
      auto decoded = decode_chunked_body(response->body);
      if (!decoded) {
        response->error = "Malformed chunked body";
      } else {
        response->body = std::move(*decoded);
      }
    }
    callback(*response);
  }

  static bool has_full_body(const HttpResponse& response) {
    auto length = response.header("Content-Length");
    if (!length) return false;
    try {
      return response.body.size() >= std::stoull(*length);
    } catch (const std::exception&) {
      // Invalid Content-Length, keep reading until EOF
      return false;
    }
  }

  template <typename Socket>
  void read_body(std::shared_ptr<Socket> socket, std::shared_ptr<HttpResponse> response, std::shared_ptr<asio::streambuf> buffer,
                 Callback callback) {
    // First, add any remaining data in buffer to body
    if (buffer->size() > 0) {
      std::istream stream(buffer.get());
      std::ostringstream body;
      body << stream.rdbuf();
      response->body += body.str();
    }

    if (has_full_body(*response)) {
      finish(response, callback);
      return;
    }

    // Continue reading until EOF or we have all data
    asio::async_read(*socket, *buffer, asio::transfer_at_least(1), [this, socket, response, buffer, callback](const asio::error_code& ec, size_t) {
      // SSL connections may return various errors on close
      // Treat any SSL category error as potential EOF
      bool is_eof = (ec == asio::error::eof) || (ec.category() == asio::error::get_ssl_category()) || ec == asio::ssl::error::stream_truncated;

      if (ec && !is_eof) {
        response->error = "Read body failed: " + ec.message();
        callback(*response);
        return;
      }

      if (is_eof) {
        // Drain what arrived together with EOF
        if (buffer->size() > 0) {
          std::istream stream(buffer.get());
          std::ostringstream more;
          more << stream.rdbuf();
          response->body += more.str();
        }
        finish(response, callback);
      } else {
        read_body(socket, response, buffer, callback);
      }
    });
  }

  asio::io_context& io_ctx_;
  asio::ssl::context ssl_ctx_;
};

HttpClient::HttpClient(asio::io_context& io_ctx) : impl_(std::make_unique<Impl>(io_ctx)) {}

HttpClient::~HttpClient() = default;

void HttpClient::request(const std::string& url, const HttpOptions& options, std::function<void(HttpResponse)> callback) {
  impl_->request(url, options, std::move(callback));
}

std::future<HttpResponse> HttpClient::request(const std::string& url, const HttpOptions& options) {
  auto promise = std::make_shared<std::promise<HttpResponse>>();
  auto future = promise->get_future();

  impl_->request(url, options, [promise](HttpResponse response) {
    promise->set_value(std::move(response));
  });

  return future;
}

std::future<HttpResponse> HttpClient::get(const std::string& url, const std::map<std::string, std::string>& headers) {
  HttpOptions options;
  options.method = "GET";
  options.headers = headers;
  return request(url, options);
}

std::future<HttpResponse> HttpClient::post(const std::string& url, const std::string& body, const std::map<std::string, std::string>& headers) {
  HttpOptions options;
  options.method = "POST";
  options.body = body;
  options.headers = headers;
  return request(url, options);
}

}  // namespace qrapi::net
