#include <gtest/gtest.h>

#include <memory>

#include "image/codec.hpp"
#include "service/qr_service.hpp"
#include "service/routes.hpp"

using namespace qrapi;
using namespace qrapi::service;

namespace {

// Logo source with a canned outcome
class FakeLogoSource : public qr::LogoSource {
 public:
  explicit FakeLogoSource(std::optional<image::RgbaImage> logo = std::nullopt) : logo_(std::move(logo)) {}

  Result<image::RgbaImage> fetch(const std::string &url) override {
    ++calls;
    last_url = url;
    if (logo_) return Result<image::RgbaImage>::success(*logo_);
    return Result<image::RgbaImage>::failure("Connection failed: Connection refused");
  }

  int calls = 0;
  std::string last_url;

 private:
  std::optional<image::RgbaImage> logo_;
};

// Store whose every operation fails
class BrokenStore : public store::DocumentStore {
 public:
  Result<DocumentId> create_document(const std::string &, const json &) override {
    return Result<DocumentId>::failure("database down");
  }

  Result<std::vector<json>> get_documents(const std::string &, const json &, size_t) override {
    return Result<std::vector<json>>::failure("database down");
  }

  bool available() const override {
    return false;
  }

  std::string name() const override {
    return "broken";
  }
};

GenerationRequest make_request(const std::string &content) {
  GenerationRequest req;
  req.content = content;
  return req;
}

net::HttpRequest post_json(const json &body) {
  net::HttpRequest request;
  request.method = "POST";
  request.path = "/api/qrcode.png";
  request.target = request.path;
  request.body = body.dump();
  return request;
}

}  // namespace

class QrServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    store_ = std::make_shared<store::InMemoryDocumentStore>();
    logos_ = std::make_shared<FakeLogoSource>();
    service_ = std::make_shared<QrService>(store_, logos_);
  }

  std::shared_ptr<store::InMemoryDocumentStore> store_;
  std::shared_ptr<FakeLogoSource> logos_;
  std::shared_ptr<QrService> service_;
};

TEST_F(QrServiceTest, GenerateReturnsPngAndRecordsHistory) {
  GeneratedImage out;
  ASSERT_FALSE(service_->generate(make_request("hello"), out).has_value());

  EXPECT_TRUE(image::is_png(out.png));
  EXPECT_EQ(out.width, 290);
  EXPECT_FALSE(out.logo_applied);

  auto decoded = image::decode_image(out.png);
  ASSERT_TRUE(decoded.ok());
  EXPECT_EQ(decoded.value->width(), 290);

  auto history = service_->history(12);
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].content, "hello");
  EXPECT_EQ(history[0].error_correction, "M");
}

TEST_F(QrServiceTest, BlankContentIsRejected) {
  GeneratedImage out;
  auto err = service_->generate(make_request("   "), out);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->status, 400);
  EXPECT_EQ(err->detail, "content is required");
  EXPECT_TRUE(out.png.empty());
  EXPECT_TRUE(service_->history(12).empty());
}

TEST_F(QrServiceTest, UnknownLevelMatchesMedium) {
  GenerationRequest unknown;
  ASSERT_FALSE(GenerationRequest::from_json(json{{"content", "same"}, {"error_correction", "x"}}, unknown).has_value());
  GenerationRequest medium;
  ASSERT_FALSE(GenerationRequest::from_json(json{{"content", "same"}, {"error_correction", "M"}}, medium).has_value());

  GeneratedImage a, b;
  ASSERT_FALSE(service_->generate(unknown, a).has_value());
  ASSERT_FALSE(service_->generate(medium, b).has_value());
  EXPECT_EQ(a.png, b.png);
}

TEST_F(QrServiceTest, FailedLogoMatchesNoLogo) {
  auto with_logo = make_request("logo");
  with_logo.logo_url = "http://unreachable.invalid/logo.png";

  GeneratedImage a, b;
  ASSERT_FALSE(service_->generate(with_logo, a).has_value());
  ASSERT_FALSE(service_->generate(make_request("logo"), b).has_value());

  EXPECT_EQ(logos_->calls, 1);
  EXPECT_EQ(logos_->last_url, "http://unreachable.invalid/logo.png");
  EXPECT_FALSE(a.logo_applied);
  EXPECT_EQ(a.png, b.png);
}

TEST_F(QrServiceTest, FetchedLogoIsApplied) {
  auto logos = std::make_shared<FakeLogoSource>(image::RgbaImage(40, 40, Rgba{255, 0, 0, 255}));
  QrService service(store_, logos);

  auto req = make_request("logo");
  req.logo_url = "https://example.com/logo.png";

  GeneratedImage out;
  ASSERT_FALSE(service.generate(req, out).has_value());
  EXPECT_TRUE(out.logo_applied);

  auto decoded = image::decode_image(out.png);
  ASSERT_TRUE(decoded.ok());
  EXPECT_EQ(decoded.value->pixel(145, 145), (Rgba{255, 0, 0, 255}));

  auto history = service.history(1);
  ASSERT_EQ(history.size(), 1u);
  ASSERT_TRUE(history[0].logo_url.has_value());
  EXPECT_EQ(*history[0].logo_url, "https://example.com/logo.png");
}

TEST_F(QrServiceTest, HistoryNewestFirstWithLimit) {
  for (int i = 0; i < 7; ++i) {
    GeneratedImage out;
    ASSERT_FALSE(service_->generate(make_request("item " + std::to_string(i)), out).has_value());
  }

  auto history = service_->history(5);
  ASSERT_EQ(history.size(), 5u);
  EXPECT_EQ(history[0].content, "item 6");
  EXPECT_EQ(history[4].content, "item 2");
}

TEST_F(QrServiceTest, ContentTooLongIs400) {
  GeneratedImage out;
  auto err = service_->generate(make_request(std::string(3000, 'x')), out);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->status, 400);
  EXPECT_EQ(err->detail, "content too long");
}

TEST_F(QrServiceTest, ContentTooLongSkipsLogoFetch) {
  auto req = make_request(std::string(3000, 'x'));
  req.logo_url = "https://example.com/logo.png";

  GeneratedImage out;
  auto err = service_->generate(req, out);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->status, 400);
  EXPECT_EQ(logos_->calls, 0);
}

TEST_F(QrServiceTest, NamedAndFunctionalColors) {
  auto req = make_request("colors");
  req.fill_color = "hsl(0, 100%, 50%)";
  req.back_color = "navy";

  GeneratedImage out;
  ASSERT_FALSE(service_->generate(req, out).has_value());
  auto decoded = image::decode_image(out.png);
  ASSERT_TRUE(decoded.ok());
  // Top-left corner lies in the quiet zone
  EXPECT_EQ(decoded.value->pixel(0, 0), (Rgba{0, 0, 128, 255}));
  // First module of the finder pattern
  EXPECT_EQ(decoded.value->pixel(45, 45), (Rgba{255, 0, 0, 255}));
}

TEST_F(QrServiceTest, UnresolvableColorIs400) {
  auto req = make_request("colors");
  req.fill_color = "nope";

  GeneratedImage out;
  auto err = service_->generate(req, out);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->status, 400);
  EXPECT_EQ(err->detail, "invalid fill_color");

  req.fill_color = "black";
  req.back_color = "#12345";
  err = service_->generate(req, out);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->detail, "invalid back_color");
  EXPECT_TRUE(service_->history(12).empty());
}

TEST_F(QrServiceTest, StatusReportsConnectedStore) {
  auto status = service_->status();
  EXPECT_EQ(status["backend"], "✅ Running");
  EXPECT_EQ(status["database"], "✅ Connected");
}

TEST(QrServiceNoStoreTest, GenerationStillWorks) {
  QrService service(nullptr, nullptr);

  auto req = make_request("no store");
  req.logo_url = "https://example.com/logo.png";

  GeneratedImage out;
  ASSERT_FALSE(service.generate(req, out).has_value());
  EXPECT_TRUE(image::is_png(out.png));
  EXPECT_TRUE(service.history(12).empty());
  EXPECT_EQ(service.status()["database"], "❌ Not Available");
}

TEST(QrServiceBrokenStoreTest, FailuresAreSwallowed) {
  QrService service(std::make_shared<BrokenStore>(), std::make_shared<FakeLogoSource>());

  GeneratedImage out;
  ASSERT_FALSE(service.generate(make_request("still works"), out).has_value());
  EXPECT_TRUE(image::is_png(out.png));
  EXPECT_TRUE(service.history(12).empty());
  EXPECT_EQ(service.status()["database"], "❌ Not Available");
}

// --- Route handlers ---

TEST_F(QrServiceTest, GenerateHandler) {
  auto response = handle_generate(*service_, post_json(json{{"content", "route"}}));
  EXPECT_EQ(response.status_code, 200);
  EXPECT_EQ(response.headers["Content-Type"], "image/png");
  EXPECT_TRUE(image::is_png(response.body));
}

TEST_F(QrServiceTest, GenerateHandlerErrors) {
  auto blank = handle_generate(*service_, post_json(json{{"content", ""}}));
  EXPECT_EQ(blank.status_code, 400);
  EXPECT_EQ(json::parse(blank.body)["detail"], "content is required");

  auto missing = handle_generate(*service_, post_json(json::object()));
  EXPECT_EQ(missing.status_code, 422);

  net::HttpRequest garbage = post_json(json::object());
  garbage.body = "{not json";
  EXPECT_EQ(handle_generate(*service_, garbage).status_code, 422);

  auto bad_color = handle_generate(*service_, post_json(json{{"content", "x"}, {"fill_color", "nope"}}));
  EXPECT_EQ(bad_color.status_code, 400);
}

TEST_F(QrServiceTest, HistoryHandler) {
  GeneratedImage out;
  service_->generate(make_request("one"), out);
  service_->generate(make_request("two"), out);

  net::HttpRequest request;
  request.method = "GET";
  request.path = "/api/history";
  request.query["limit"] = "1";

  auto response = handle_history(*service_, request);
  EXPECT_EQ(response.status_code, 200);
  auto items = json::parse(response.body);
  ASSERT_TRUE(items.is_array());
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0]["content"], "two");
  EXPECT_EQ(items[0]["box_size"], 10);

  request.query["limit"] = "0";
  EXPECT_EQ(handle_history(*service_, request).status_code, 422);
  request.query["limit"] = "51";
  EXPECT_EQ(handle_history(*service_, request).status_code, 422);
}

TEST(RootHandlerTest, Message) {
  auto response = handle_root(net::HttpRequest{});
  EXPECT_EQ(response.status_code, 200);
  EXPECT_EQ(json::parse(response.body)["message"], "QR Code API ready");
}
