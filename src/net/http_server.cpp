#include "http_server.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <sstream>
#include <thread>
#include <vector>

namespace qrapi::net {

HttpResponse json_response(int status_code, const json& body) {
  HttpResponse response;
  response.status_code = status_code;
  response.headers["Content-Type"] = "application/json";
  response.body = body.dump();
  return response;
}

HttpResponse error_response(int status_code, const std::string& message) {
  return json_response(status_code, json{{"detail", message}});
}

std::string serialize_response(const HttpResponse& response) {
  std::ostringstream out;
  out << "HTTP/1.1 " << response.status_code << " " << status_reason(response.status_code) << "\r\n";

  for (const auto& [key, value] : response.headers) {
    out << key << ": " << value << "\r\n";
  }

  out << "Content-Length: " << response.body.size() << "\r\n";
  out << "Connection: close\r\n";
  out << "\r\n";
  out << response.body;
  return out.str();
}

namespace {

// Parse request line + header block (everything before the blank line)
bool parse_head(const std::string& head, HttpRequest& request) {
  std::istringstream stream(head);
  std::string request_line;
  if (!std::getline(stream, request_line)) {
    return false;
  }
  if (!request_line.empty() && request_line.back() == '\r') {
    request_line.pop_back();
  }

  std::istringstream line(request_line);
  std::string version;
  if (!(line >> request.method >> request.target >> version) || !version.starts_with("HTTP/1.")) {
    return false;
  }

  auto question = request.target.find('?');
  request.path = url_decode(request.target.substr(0, question));
  if (question != std::string::npos) {
    request.query = parse_query(request.target.substr(question + 1));
  }

  std::string header_line;
  while (std::getline(stream, header_line) && header_line != "\r" && !header_line.empty()) {
    auto colon = header_line.find(':');
    if (colon == std::string::npos) {
      return false;
    }
    request.headers[to_lower(trim(header_line.substr(0, colon)))] = trim(header_line.substr(colon + 1));
  }

  return true;
}

}  // namespace

class HttpServer::Impl {
 public:
  explicit Impl(ServerOptions options) : options_(std::move(options)), acceptor_(io_ctx_), work_(asio::make_work_guard(io_ctx_)) {}

  ~Impl() {
    stop();
    join();
  }

  void route(const std::string& method, const std::string& path, RouteHandler handler) {
    routes_[path][method] = std::move(handler);
  }

  uint16_t start() {
    asio::ip::tcp::endpoint endpoint(asio::ip::make_address(options_.host), options_.port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();

    bound_port_ = acceptor_.local_endpoint().port();
    spdlog::info("Listening on {}:{} ({} threads)", options_.host, bound_port_, options_.threads);

    do_accept();

    int count = std::max(1, options_.threads);
    for (int i = 0; i < count; ++i) {
      workers_.emplace_back([this]() {
        io_ctx_.run();
      });
    }

    return bound_port_;
  }

  void stop() {
    asio::post(io_ctx_, [this]() {
      asio::error_code ignored;
      acceptor_.close(ignored);
    });
    work_.reset();
    io_ctx_.stop();
  }

  void join() {
    for (auto& worker : workers_) {
      if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
        worker.join();
      }
    }
    workers_.clear();
  }

  uint16_t port() const {
    return bound_port_;
  }

  const ServerOptions& options() const {
    return options_;
  }

  HttpResponse dispatch(const HttpRequest& request) const {
    HttpResponse response;
    try {
      response = route_request(request);
    } catch (const std::exception& e) {
      spdlog::error("Unhandled error in {} {}: {}", request.method, request.path, e.what());
      response = error_response(500, "Internal Server Error");
    }

    if (options_.cors) {
      response.headers["Access-Control-Allow-Origin"] = "*";
    }
    return response;
  }

 private:
  class Connection;

  HttpResponse route_request(const HttpRequest& request) const {
    auto it = routes_.find(request.path);

    // CORS preflight
    if (request.method == "OPTIONS" && options_.cors) {
      HttpResponse response;
      response.status_code = 204;
      response.headers["Access-Control-Allow-Methods"] = "GET, POST, OPTIONS";
      response.headers["Access-Control-Allow-Headers"] = request.header("Access-Control-Request-Headers").value_or("*");
      response.headers["Access-Control-Max-Age"] = "600";
      return response;
    }

    if (it == routes_.end()) {
      return error_response(404, "Not Found");
    }

    auto handler = it->second.find(request.method);
    if (handler == it->second.end()) {
      std::string allow;
      for (const auto& [method, _] : it->second) {
        allow += (allow.empty() ? "" : ", ") + method;
      }
      auto response = error_response(405, "Method Not Allowed");
      response.headers["Allow"] = allow;
      return response;
    }

    return handler->second(request);
  }

  void do_accept();

  ServerOptions options_;
  asio::io_context io_ctx_;
  asio::ip::tcp::acceptor acceptor_;
  asio::executor_work_guard<asio::io_context::executor_type> work_;
  std::vector<std::thread> workers_;
  std::map<std::string, std::map<std::string, RouteHandler>> routes_;
  uint16_t bound_port_ = 0;
};

// One accepted socket. All handlers run on the socket's strand.
class HttpServer::Impl::Connection : public std::enable_shared_from_this<Connection> {
 public:
  Connection(asio::ip::tcp::socket socket, const Impl& server)
      : socket_(std::move(socket)),
        server_(server),
        buffer_(server.options().max_body_bytes + kMaxHeaderBytes),
        timer_(socket_.get_executor()) {}

  void start() {
    asio::error_code ec;
    auto remote = socket_.remote_endpoint(ec);
    remote_ = ec ? "unknown" : remote.address().to_string();

    auto self = shared_from_this();
    timer_.expires_after(server_.options().read_timeout);
    timer_.async_wait([self](const asio::error_code& ec) {
      if (!ec) {
        spdlog::debug("Closing idle connection from {}", self->remote_);
        asio::error_code ignored;
        self->socket_.close(ignored);
      }
    });

    read_head();
  }

 private:
  static constexpr size_t kMaxHeaderBytes = 64 * 1024;

  void read_head() {
    auto self = shared_from_this();
    asio::async_read_until(socket_, buffer_, "\r\n\r\n", [self](const asio::error_code& ec, size_t head_bytes) {
      if (ec == asio::error::not_found) {
        self->reply(error_response(413, "Request header too large"));
        return;
      }
      if (ec) {
        // Peer went away or the idle timer closed the socket
        self->close();
        return;
      }

      std::string head(asio::buffers_begin(self->buffer_.data()), asio::buffers_begin(self->buffer_.data()) + head_bytes);
      self->buffer_.consume(head_bytes);

      if (!parse_head(head, self->request_)) {
        self->reply(error_response(400, "Malformed request"));
        return;
      }

      self->read_body();
    });
  }

  void read_body() {
    if (request_.header("Transfer-Encoding")) {
      reply(error_response(411, "Length Required"));
      return;
    }

    size_t content_length = 0;
    if (auto length = request_.header("Content-Length")) {
      try {
        size_t consumed = 0;
        content_length = std::stoull(*length, &consumed);
        if (consumed != length->size()) throw std::invalid_argument("trailing characters");
      } catch (const std::exception&) {
        reply(error_response(400, "Invalid Content-Length"));
        return;
      }
    }

    if (content_length > server_.options().max_body_bytes) {
      reply(error_response(413, "Request body too large"));
      return;
    }

    if (buffer_.size() >= content_length) {
      take_body(content_length);
      return;
    }

    auto self = shared_from_this();
    asio::async_read(socket_, buffer_, asio::transfer_exactly(content_length - buffer_.size()),
                     [self, content_length](const asio::error_code& ec, size_t) {
                       if (ec) {
                         self->close();
                         return;
                       }
                       self->take_body(content_length);
                     });
  }

  void take_body(size_t content_length) {
    request_.body.assign(asio::buffers_begin(buffer_.data()), asio::buffers_begin(buffer_.data()) + content_length);
    buffer_.consume(content_length);

    reply(server_.dispatch(request_));
  }

  void reply(HttpResponse response) {
    spdlog::info("{} {} {} -> {}", remote_, request_.method.empty() ? "-" : request_.method, request_.target.empty() ? "-" : request_.target,
                 response.status_code);

    // Early rejections never went through dispatch()
    if (server_.options().cors) {
      response.headers["Access-Control-Allow-Origin"] = "*";
    }

    wire_ = serialize_response(response);
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(wire_), [self](const asio::error_code& ec, size_t) {
      if (ec) {
        spdlog::debug("Write to {} failed: {}", self->remote_, ec.message());
      }
      self->close();
    });
  }

  void close() {
    timer_.cancel();
    asio::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
  }

  asio::ip::tcp::socket socket_;
  const Impl& server_;
  asio::streambuf buffer_;
  asio::steady_timer timer_;
  HttpRequest request_;
  std::string wire_;
  std::string remote_;
};

void HttpServer::Impl::do_accept() {
  acceptor_.async_accept(asio::make_strand(io_ctx_), [this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
    if (ec) {
      if (ec != asio::error::operation_aborted) {
        spdlog::warn("Accept failed: {}", ec.message());
      }
      if (!acceptor_.is_open()) return;
    } else {
      std::make_shared<Connection>(std::move(socket), *this)->start();
    }
    do_accept();
  });
}

HttpServer::HttpServer(ServerOptions options) : impl_(std::make_unique<Impl>(std::move(options))) {}

HttpServer::~HttpServer() = default;

void HttpServer::route(const std::string& method, const std::string& path, RouteHandler handler) {
  impl_->route(method, path, std::move(handler));
}

uint16_t HttpServer::start() {
  return impl_->start();
}

void HttpServer::wait() {
  impl_->join();
}

void HttpServer::stop() {
  impl_->stop();
}

uint16_t HttpServer::port() const {
  return impl_->port();
}

HttpResponse HttpServer::dispatch(const HttpRequest& request) const {
  return impl_->dispatch(request);
}

}  // namespace qrapi::net
