#include "service/routes.hpp"

#include <spdlog/spdlog.h>

namespace qrapi::service {

namespace {

net::HttpResponse api_error(const ApiError &err) {
  return net::error_response(err.status, err.detail);
}

}  // namespace

net::HttpResponse handle_root(const net::HttpRequest &) {
  return net::json_response(200, json{{"message", "QR Code API ready"}});
}

net::HttpResponse handle_status(QrService &service, const net::HttpRequest &) {
  return net::json_response(200, service.status());
}

net::HttpResponse handle_generate(QrService &service, const net::HttpRequest &request) {
  json body = json::parse(request.body, nullptr, false);
  if (body.is_discarded()) {
    return net::error_response(422, "request body must be valid JSON");
  }

  GenerationRequest req;
  if (auto err = GenerationRequest::from_json(body, req)) {
    return api_error(*err);
  }

  GeneratedImage image;
  if (auto err = service.generate(req, image)) {
    return api_error(*err);
  }

  spdlog::info("Generated {}x{} QR ({} bytes, ecc {}, rounded {}, logo {})", image.width, image.height, image.png.size(), to_string(req.error_correction), req.rounded, image.logo_applied);

  net::HttpResponse response;
  response.status_code = 200;
  response.headers["Content-Type"] = "image/png";
  response.body = std::move(image.png);
  return response;
}

net::HttpResponse handle_history(QrService &service, const net::HttpRequest &request) {
  int limit = kDefaultHistoryLimit;
  if (auto err = parse_history_limit(request.query_param("limit"), limit)) {
    return api_error(*err);
  }

  json items = json::array();
  for (const auto &record : service.history(limit)) {
    items.push_back(record.to_json());
  }
  return net::json_response(200, items);
}

void register_routes(net::HttpServer &server, std::shared_ptr<QrService> service) {
  server.route("GET", "/", [](const net::HttpRequest &request) {
    return handle_root(request);
  });
  server.route("GET", "/test", [service](const net::HttpRequest &request) {
    return handle_status(*service, request);
  });
  server.route("POST", "/api/qrcode.png", [service](const net::HttpRequest &request) {
    return handle_generate(*service, request);
  });
  server.route("GET", "/api/history", [service](const net::HttpRequest &request) {
    return handle_history(*service, request);
  });
}

}  // namespace qrapi::service
