#include <gtest/gtest.h>

#include <asio.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

#include "image/codec.hpp"
#include "net/http_client.hpp"
#include "net/http_server.hpp"
#include "qr/logo_fetcher.hpp"
#include "service/routes.hpp"
#include "store/document_store.hpp"

using namespace qrapi;
using namespace qrapi::net;

namespace {

HttpRequest make_request(const std::string &method, const std::string &path) {
  HttpRequest request;
  request.method = method;
  request.target = path;
  request.path = path;
  return request;
}

}  // namespace

// --- Message helpers ---

TEST(HttpMessageTest, UrlDecode) {
  EXPECT_EQ(url_decode("a%20b"), "a b");
  EXPECT_EQ(url_decode("a+b"), "a+b");
  EXPECT_EQ(url_decode("a+b", true), "a b");
  EXPECT_EQ(url_decode("%E2%9C%85"), "✅");
  EXPECT_EQ(url_decode("bad%zz"), "bad%zz");
  EXPECT_EQ(url_decode("trailing%2"), "trailing%2");
}

TEST(HttpMessageTest, ParseQuery) {
  auto q = parse_query("limit=5&name=a%20b&flag&limit=9");
  EXPECT_EQ(q["limit"], "5");
  EXPECT_EQ(q["name"], "a b");
  EXPECT_EQ(q["flag"], "");
  EXPECT_TRUE(parse_query("").empty());
}

TEST(HttpMessageTest, HeaderLookupIsCaseInsensitive) {
  HttpResponse response;
  response.headers["Content-Type"] = "image/png";
  EXPECT_EQ(response.header("content-type").value_or(""), "image/png");
  EXPECT_FALSE(response.header("Location").has_value());

  HttpRequest request;
  request.headers["content-length"] = "10";
  EXPECT_EQ(request.header("Content-Length").value_or(""), "10");
}

TEST(HttpMessageTest, StatusReasons) {
  EXPECT_EQ(status_reason(200), "OK");
  EXPECT_EQ(status_reason(404), "Not Found");
  EXPECT_EQ(status_reason(422), "Unprocessable Entity");
}

TEST(HttpMessageTest, SerializeResponse) {
  auto wire = serialize_response(json_response(200, json{{"ok", true}}));
  EXPECT_EQ(wire.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
  EXPECT_NE(wire.find("Content-Type: application/json\r\n"), std::string::npos);
  EXPECT_NE(wire.find("Content-Length: 11\r\n"), std::string::npos);
  EXPECT_NE(wire.find("\r\n\r\n{\"ok\":true}"), std::string::npos);
}

// --- URL / chunked helpers ---

TEST(ParsedUrlTest, Parse) {
  auto url = ParsedUrl::parse("https://example.com:8443/a/logo.png?x=1#frag");
  ASSERT_TRUE(url.has_value());
  EXPECT_TRUE(url->is_https());
  EXPECT_EQ(url->host, "example.com");
  EXPECT_EQ(url->port_or_default(), "8443");
  EXPECT_EQ(url->path, "/a/logo.png");
  EXPECT_EQ(url->query, "?x=1");
  EXPECT_EQ(url->host_header(), "example.com:8443");

  auto plain = ParsedUrl::parse("HTTP://example.com");
  ASSERT_TRUE(plain.has_value());
  EXPECT_EQ(plain->scheme, "http");
  EXPECT_EQ(plain->path, "/");
  EXPECT_EQ(plain->port_or_default(), "80");
  EXPECT_EQ(plain->host_header(), "example.com");

  EXPECT_FALSE(ParsedUrl::parse("ftp://example.com/x").has_value());
  EXPECT_FALSE(ParsedUrl::parse("not a url").has_value());
}

TEST(ParsedUrlTest, ResolveLocation) {
  auto url = ParsedUrl::parse("http://example.com:8080/img/a.png");
  ASSERT_TRUE(url.has_value());
  EXPECT_EQ(url->resolve("https://cdn.example.com/b.png"), "https://cdn.example.com/b.png");
  EXPECT_EQ(url->resolve("//cdn.example.com/b.png"), "http://cdn.example.com/b.png");
  EXPECT_EQ(url->resolve("/b.png"), "http://example.com:8080/b.png");
  EXPECT_EQ(url->resolve("b.png"), "http://example.com:8080/img/b.png");
}

TEST(ChunkedBodyTest, Decode) {
  EXPECT_EQ(decode_chunked_body("4\r\nWiki\r\n5;ext=1\r\npedia\r\n0\r\n\r\n").value_or("?"), "Wikipedia");
  EXPECT_EQ(decode_chunked_body("0\r\n\r\n").value_or("?"), "");
  EXPECT_FALSE(decode_chunked_body("4\r\nWi").has_value());
  EXPECT_FALSE(decode_chunked_body("zz\r\nWiki\r\n0\r\n\r\n").has_value());
  EXPECT_FALSE(decode_chunked_body("4\r\nWiki\r\n").has_value());
}

// --- Routing without sockets ---

class DispatchTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ServerOptions options;
    options.host = "127.0.0.1";
    options.port = 0;
    server_ = std::make_unique<HttpServer>(options);

    server_->route("GET", "/hello", [](const HttpRequest &) {
      return json_response(200, json{{"hello", "world"}});
    });
    server_->route("POST", "/hello", [](const HttpRequest &request) {
      return json_response(201, json{{"echo", request.body}});
    });
    server_->route("GET", "/boom", [](const HttpRequest &) -> HttpResponse {
      throw std::runtime_error("kaboom");
    });
  }

  std::unique_ptr<HttpServer> server_;
};

TEST_F(DispatchTest, RoutesByMethodAndPath) {
  auto get = server_->dispatch(make_request("GET", "/hello"));
  EXPECT_EQ(get.status_code, 200);
  EXPECT_EQ(json::parse(get.body)["hello"], "world");

  auto post = make_request("POST", "/hello");
  post.body = "hi";
  EXPECT_EQ(server_->dispatch(post).status_code, 201);
}

TEST_F(DispatchTest, UnknownPathIs404) {
  auto response = server_->dispatch(make_request("GET", "/missing"));
  EXPECT_EQ(response.status_code, 404);
  EXPECT_EQ(json::parse(response.body)["detail"], "Not Found");
}

TEST_F(DispatchTest, WrongMethodIs405) {
  auto response = server_->dispatch(make_request("DELETE", "/hello"));
  EXPECT_EQ(response.status_code, 405);
  EXPECT_EQ(json::parse(response.body)["detail"], "Method Not Allowed");
  EXPECT_EQ(response.headers["Allow"], "GET, POST");
}

TEST_F(DispatchTest, HandlerExceptionIs500) {
  auto response = server_->dispatch(make_request("GET", "/boom"));
  EXPECT_EQ(response.status_code, 500);
  EXPECT_EQ(json::parse(response.body)["detail"], "Internal Server Error");
}

TEST_F(DispatchTest, CorsHeadersAndPreflight) {
  auto response = server_->dispatch(make_request("GET", "/hello"));
  EXPECT_EQ(response.headers["Access-Control-Allow-Origin"], "*");

  auto preflight = server_->dispatch(make_request("OPTIONS", "/hello"));
  EXPECT_EQ(preflight.status_code, 204);
  EXPECT_EQ(preflight.headers["Access-Control-Allow-Origin"], "*");
  EXPECT_FALSE(preflight.headers["Access-Control-Allow-Methods"].empty());
}

// --- Live server ---

class LiveServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ServerOptions options;
    options.host = "127.0.0.1";
    options.port = 0;
    options.threads = 2;
    options.max_body_bytes = 64 * 1024;
    server_ = std::make_unique<HttpServer>(options);

    service_ = std::make_shared<service::QrService>(std::make_shared<store::InMemoryDocumentStore>(), nullptr);
    service::register_routes(*server_, service_);

    logo_png_ = *image::encode_png(image::RgbaImage(30, 30, Rgba{255, 0, 0, 255})).value;
    server_->route("GET", "/logo.png", [this](const HttpRequest &) {
      HttpResponse response;
      response.status_code = 200;
      response.headers["Content-Type"] = "image/png";
      response.body = logo_png_;
      return response;
    });
    server_->route("GET", "/moved", [](const HttpRequest &) {
      HttpResponse response;
      response.status_code = 302;
      response.headers["Location"] = "/logo.png";
      return response;
    });
    server_->route("GET", "/loop", [](const HttpRequest &) {
      HttpResponse response;
      response.status_code = 301;
      response.headers["Location"] = "/loop";
      return response;
    });
    // Solid blue in OpenCV's BGR order
    std::vector<uchar> jpeg;
    cv::imencode(".jpg", cv::Mat(24, 32, CV_8UC3, cv::Scalar(255, 0, 0)), jpeg);
    logo_jpeg_.assign(jpeg.begin(), jpeg.end());
    server_->route("GET", "/logo.jpg", [this](const HttpRequest &) {
      HttpResponse response;
      response.status_code = 200;
      response.headers["Content-Type"] = "image/jpeg";
      response.body = logo_jpeg_;
      return response;
    });
    server_->route("GET", "/drip", [](const HttpRequest &) {
      std::this_thread::sleep_for(std::chrono::milliseconds(400));
      HttpResponse response;
      response.status_code = 302;
      response.headers["Location"] = "/drip";
      return response;
    });
    server_->route("GET", "/host", [](const HttpRequest &request) {
      HttpResponse response;
      response.status_code = 200;
      response.body = request.header("Host").value_or("");
      return response;
    });
    server_->route("GET", "/slow", [](const HttpRequest &) {
      std::this_thread::sleep_for(std::chrono::seconds(2));
      return json_response(200, json::object());
    });

    port_ = server_->start();

    io_thread_ = std::thread([this]() {
      auto work = asio::make_work_guard(io_ctx_);
      io_ctx_.run();
    });
    client_ = std::make_unique<HttpClient>(io_ctx_);
  }

  void TearDown() override {
    client_.reset();
    io_ctx_.stop();
    if (io_thread_.joinable()) io_thread_.join();
    server_->stop();
    server_->wait();
  }

  std::string url(const std::string &path) const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
  }

  // Send raw bytes and read until the server closes
  std::string raw_exchange(const std::string &payload) {
    asio::io_context ctx;
    asio::ip::tcp::socket socket(ctx);
    socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port_));
    asio::write(socket, asio::buffer(payload));

    std::string reply;
    asio::error_code ec;
    char buf[4096];
    while (true) {
      size_t n = socket.read_some(asio::buffer(buf), ec);
      reply.append(buf, n);
      if (ec) break;
    }
    return reply;
  }

  std::unique_ptr<HttpServer> server_;
  std::shared_ptr<service::QrService> service_;
  std::string logo_png_;
  std::string logo_jpeg_;
  uint16_t port_ = 0;
  asio::io_context io_ctx_;
  std::thread io_thread_;
  std::unique_ptr<HttpClient> client_;
};

TEST_F(LiveServerTest, BindsEphemeralPort) {
  EXPECT_NE(port_, 0);
  EXPECT_EQ(server_->port(), port_);
}

TEST_F(LiveServerTest, RootAndStatus) {
  auto root = client_->get(url("/")).get();
  ASSERT_TRUE(root.error.empty()) << root.error;
  EXPECT_EQ(root.status_code, 200);
  EXPECT_EQ(json::parse(root.body)["message"], "QR Code API ready");
  EXPECT_EQ(root.header("Access-Control-Allow-Origin").value_or(""), "*");

  auto status = client_->get(url("/test")).get();
  EXPECT_EQ(status.status_code, 200);
  EXPECT_EQ(json::parse(status.body)["database"], "✅ Connected");
}

TEST_F(LiveServerTest, GenerateAndHistory) {
  auto response = client_->post(url("/api/qrcode.png"), json{{"content", "over the wire"}}.dump(), {{"Content-Type", "application/json"}}).get();
  ASSERT_TRUE(response.error.empty()) << response.error;
  EXPECT_EQ(response.status_code, 200);
  EXPECT_EQ(response.header("Content-Type").value_or(""), "image/png");
  EXPECT_TRUE(image::decode_image(response.body).ok());

  auto blank = client_->post(url("/api/qrcode.png"), json{{"content", "  "}}.dump()).get();
  EXPECT_EQ(blank.status_code, 400);

  auto history = client_->get(url("/api/history?limit=5")).get();
  EXPECT_EQ(history.status_code, 200);
  auto items = json::parse(history.body);
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0]["content"], "over the wire");

  EXPECT_EQ(client_->get(url("/api/history?limit=0")).get().status_code, 422);
  EXPECT_EQ(client_->get(url("/api/history?limit=51")).get().status_code, 422);
}

TEST_F(LiveServerTest, NotFoundAndMethodNotAllowed) {
  EXPECT_EQ(client_->get(url("/nope")).get().status_code, 404);
  EXPECT_EQ(client_->get(url("/api/qrcode.png")).get().status_code, 405);
}

TEST_F(LiveServerTest, OversizedBodyIs413) {
  // Rejected from the declared length alone, before any body is read
  auto reply = raw_exchange("POST /api/qrcode.png HTTP/1.1\r\nHost: x\r\nContent-Length: 131072\r\n\r\n");
  EXPECT_EQ(reply.rfind("HTTP/1.1 413", 0), 0u);
}

TEST_F(LiveServerTest, MalformedRequests) {
  auto reply = raw_exchange("GARBAGE\r\n\r\n");
  EXPECT_EQ(reply.rfind("HTTP/1.1 400", 0), 0u);

  reply = raw_exchange("POST /api/qrcode.png HTTP/1.1\r\nHost: x\r\nTransfer-Encoding: chunked\r\n\r\n0\r\n\r\n");
  EXPECT_EQ(reply.rfind("HTTP/1.1 411", 0), 0u);

  reply = raw_exchange("POST /api/qrcode.png HTTP/1.1\r\nHost: x\r\nContent-Length: abc\r\n\r\n");
  EXPECT_EQ(reply.rfind("HTTP/1.1 400", 0), 0u);
}

// --- Logo fetching against the live server ---

TEST_F(LiveServerTest, LogoFetcherDecodesPng) {
  qr::HttpLogoFetcher fetcher;
  auto logo = fetcher.fetch(url("/logo.png"));
  ASSERT_TRUE(logo.ok()) << *logo.error;
  EXPECT_EQ(logo.value->width(), 30);
  EXPECT_EQ(logo.value->pixel(0, 0), (Rgba{255, 0, 0, 255}));
}

TEST_F(LiveServerTest, LogoFetcherDecodesJpeg) {
  qr::HttpLogoFetcher fetcher;
  auto logo = fetcher.fetch(url("/logo.jpg"));
  ASSERT_TRUE(logo.ok()) << *logo.error;
  EXPECT_EQ(logo.value->width(), 32);
  EXPECT_EQ(logo.value->height(), 24);

  auto p = logo.value->pixel(16, 12);
  EXPECT_NEAR(p.r, 0, 4);
  EXPECT_NEAR(p.b, 255, 4);
  EXPECT_EQ(p.a, 255);
}

TEST_F(LiveServerTest, ClientSendsPortInHostHeader) {
  auto response = client_->get(url("/host")).get();
  ASSERT_TRUE(response.error.empty()) << response.error;
  EXPECT_EQ(response.body, "127.0.0.1:" + std::to_string(port_));
}

TEST_F(LiveServerTest, LogoFetcherFollowsRedirects) {
  qr::HttpLogoFetcher fetcher;
  auto logo = fetcher.fetch(url("/moved"));
  ASSERT_TRUE(logo.ok()) << *logo.error;
  EXPECT_EQ(logo.value->height(), 30);

  auto looped = fetcher.fetch(url("/loop"));
  ASSERT_FALSE(looped.ok());
  EXPECT_EQ(*looped.error, "too many redirects");
}

TEST_F(LiveServerTest, LogoFetcherFailures) {
  qr::HttpLogoFetcher fetcher(std::chrono::seconds(1));

  auto not_found = fetcher.fetch(url("/missing.png"));
  ASSERT_FALSE(not_found.ok());
  EXPECT_EQ(*not_found.error, "HTTP 404");

  auto not_png = fetcher.fetch(url("/"));
  EXPECT_FALSE(not_png.ok());

  auto slow = fetcher.fetch(url("/slow"));
  ASSERT_FALSE(slow.ok());
  EXPECT_EQ(*slow.error, "Request timed out");

  EXPECT_FALSE(fetcher.fetch("not a url").ok());
  EXPECT_FALSE(fetcher.fetch("http://127.0.0.1:1/logo.png").ok());
}

TEST_F(LiveServerTest, RedirectChainSharesOneDeadline) {
  // Each hop takes 400ms, so the third hop runs out of the 1s budget
  qr::HttpLogoFetcher fetcher(std::chrono::seconds(1));

  auto start = std::chrono::steady_clock::now();
  auto logo = fetcher.fetch(url("/drip"));
  auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_FALSE(logo.ok());
  EXPECT_EQ(*logo.error, "Request timed out");
  EXPECT_LT(elapsed, std::chrono::milliseconds(1400));
}

TEST_F(LiveServerTest, GenerateWithUnreachableLogoMatchesPlain) {
  auto service = std::make_shared<service::QrService>(nullptr, std::make_shared<qr::HttpLogoFetcher>(std::chrono::seconds(2)));

  service::GenerationRequest with_logo;
  with_logo.content = "same";
  with_logo.logo_url = "http://127.0.0.1:1/logo.png";
  service::GenerationRequest plain;
  plain.content = "same";

  service::GeneratedImage a, b;
  ASSERT_FALSE(service->generate(with_logo, a).has_value());
  ASSERT_FALSE(service->generate(plain, b).has_value());
  EXPECT_EQ(a.png, b.png);

  service::GenerationRequest served = plain;
  served.logo_url = url("/logo.png");
  service::GeneratedImage c;
  ASSERT_FALSE(service->generate(served, c).has_value());
  EXPECT_TRUE(c.logo_applied);
  EXPECT_NE(c.png, b.png);
}
