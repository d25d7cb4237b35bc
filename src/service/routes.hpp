#pragma once

#include <memory>

#include "net/http_server.hpp"
#include "service/qr_service.hpp"

namespace qrapi::service {

// GET /, GET /test, POST /api/qrcode.png, GET /api/history
void register_routes(net::HttpServer &server, std::shared_ptr<QrService> service);

// Individual handlers, exposed for tests
net::HttpResponse handle_root(const net::HttpRequest &request);
net::HttpResponse handle_status(QrService &service, const net::HttpRequest &request);
net::HttpResponse handle_generate(QrService &service, const net::HttpRequest &request);
net::HttpResponse handle_history(QrService &service, const net::HttpRequest &request);

}  // namespace qrapi::service
