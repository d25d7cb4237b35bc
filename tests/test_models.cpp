#include <gtest/gtest.h>

#include "service/models.hpp"

using namespace qrapi;
using namespace qrapi::service;

namespace {

std::optional<ApiError> parse(const json &body, GenerationRequest &req) {
  return GenerationRequest::from_json(body, req);
}

}  // namespace

// --- GenerationRequest::from_json ---

TEST(GenerationRequestTest, Defaults) {
  GenerationRequest req;
  ASSERT_FALSE(parse(json{{"content", "hello"}}, req).has_value());

  EXPECT_EQ(req.content, "hello");
  EXPECT_EQ(req.fill_color, "#111827");
  EXPECT_EQ(req.back_color, "#ffffff");
  EXPECT_EQ(req.box_size, 10);
  EXPECT_EQ(req.border, 4);
  EXPECT_EQ(req.error_correction, ErrorCorrection::Medium);
  EXPECT_TRUE(req.rounded);
  EXPECT_FALSE(req.logo_url.has_value());
}

TEST(GenerationRequestTest, AllFields) {
  json body = {{"content", "x"},    {"fill_color", "red"},      {"back_color", "transparent"}, {"box_size", 5},
               {"border", 0},       {"error_correction", "h"},  {"rounded", false},            {"logo_url", "https://example.com/a.png"}};

  GenerationRequest req;
  ASSERT_FALSE(parse(body, req).has_value());
  EXPECT_EQ(req.fill_color, "red");
  EXPECT_EQ(req.back_color, "transparent");
  EXPECT_EQ(req.box_size, 5);
  EXPECT_EQ(req.border, 0);
  EXPECT_EQ(req.error_correction, ErrorCorrection::High);
  EXPECT_FALSE(req.rounded);
  ASSERT_TRUE(req.logo_url.has_value());
  EXPECT_EQ(*req.logo_url, "https://example.com/a.png");
}

TEST(GenerationRequestTest, MissingContentIs422) {
  GenerationRequest req;
  auto err = parse(json{{"box_size", 10}}, req);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->status, 422);

  err = parse(json{{"content", nullptr}}, req);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->status, 422);
}

TEST(GenerationRequestTest, WrongTypesAre422) {
  GenerationRequest req;
  EXPECT_EQ(parse(json{{"content", 5}}, req)->status, 422);
  EXPECT_EQ(parse(json{{"content", "x"}, {"fill_color", 1}}, req)->status, 422);
  EXPECT_EQ(parse(json{{"content", "x"}, {"box_size", true}}, req)->status, 422);
  EXPECT_EQ(parse(json{{"content", "x"}, {"box_size", 10.5}}, req)->status, 422);
  EXPECT_EQ(parse(json{{"content", "x"}, {"rounded", "maybe"}}, req)->status, 422);
  EXPECT_EQ(parse(json{{"content", "x"}, {"logo_url", 3}}, req)->status, 422);
  EXPECT_EQ(parse(json::array(), req)->status, 422);
}

TEST(GenerationRequestTest, RangeChecks) {
  GenerationRequest req;
  EXPECT_EQ(parse(json{{"content", "x"}, {"box_size", 0}}, req)->status, 422);
  EXPECT_EQ(parse(json{{"content", "x"}, {"box_size", 51}}, req)->status, 422);
  EXPECT_EQ(parse(json{{"content", "x"}, {"border", -1}}, req)->status, 422);
  EXPECT_EQ(parse(json{{"content", "x"}, {"border", 21}}, req)->status, 422);

  EXPECT_FALSE(parse(json{{"content", "x"}, {"box_size", 50}, {"border", 20}}, req).has_value());
  EXPECT_FALSE(parse(json{{"content", "x"}, {"box_size", 1}, {"border", 0}}, req).has_value());
}

TEST(GenerationRequestTest, LaxCoercion) {
  GenerationRequest req;
  ASSERT_FALSE(parse(json{{"content", "x"}, {"box_size", "12"}, {"border", 2.0}, {"rounded", "false"}}, req).has_value());
  EXPECT_EQ(req.box_size, 12);
  EXPECT_EQ(req.border, 2);
  EXPECT_FALSE(req.rounded);
}

TEST(GenerationRequestTest, UnknownErrorCorrectionIsMedium) {
  GenerationRequest req;
  ASSERT_FALSE(parse(json{{"content", "x"}, {"error_correction", "x"}}, req).has_value());
  EXPECT_EQ(req.error_correction, ErrorCorrection::Medium);
}

TEST(GenerationRequestTest, NullOrBlankLogoIsAbsent) {
  GenerationRequest req;
  ASSERT_FALSE(parse(json{{"content", "x"}, {"logo_url", nullptr}}, req).has_value());
  EXPECT_FALSE(req.logo_url.has_value());

  ASSERT_FALSE(parse(json{{"content", "x"}, {"logo_url", "  "}}, req).has_value());
  EXPECT_FALSE(req.logo_url.has_value());
}

// --- GenerationRequest::validate ---

TEST(GenerationRequestTest, BlankContentIs400) {
  GenerationRequest req;
  req.content = "";
  auto err = req.validate();
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->status, 400);
  EXPECT_EQ(err->detail, "content is required");

  req.content = "   ";
  ASSERT_TRUE(req.validate().has_value());
  EXPECT_EQ(req.validate()->status, 400);
}

TEST(GenerationRequestTest, ColorsAreNotValidated) {
  GenerationRequest req;
  req.content = "x";
  req.fill_color = "nope";
  req.back_color = "#12345";
  EXPECT_FALSE(req.validate().has_value());

  req.fill_color = "hsl(120, 100%, 25%)";
  req.back_color = "rebeccapurple";
  EXPECT_FALSE(req.validate().has_value());
}

// --- HistoryRecord ---

TEST(HistoryRecordTest, FromRequestNormalizesLevel) {
  GenerationRequest req;
  req.content = "abc";
  req.error_correction = ErrorCorrection::Quartile;
  req.logo_url = "https://example.com/logo.png";

  auto rec = HistoryRecord::from_request(req);
  auto j = rec.to_json();
  EXPECT_EQ(j["content"], "abc");
  EXPECT_EQ(j["error_correction"], "Q");
  EXPECT_EQ(j["logo_url"], "https://example.com/logo.png");
  EXPECT_FALSE(j.contains("rounded"));
}

TEST(HistoryRecordTest, EmptyDocumentGetsDefaults) {
  auto rec = HistoryRecord::from_document(json::object());
  EXPECT_EQ(rec.content, "");
  EXPECT_EQ(rec.fill_color, "#111827");
  EXPECT_EQ(rec.back_color, "#ffffff");
  EXPECT_EQ(rec.box_size, 10);
  EXPECT_EQ(rec.border, 4);
  EXPECT_EQ(rec.error_correction, "M");
  EXPECT_FALSE(rec.logo_url.has_value());
  EXPECT_TRUE(rec.to_json()["logo_url"].is_null());
}

TEST(HistoryRecordTest, CoercesStoredValues) {
  json doc = {{"_id", "abc"}, {"content", "hi"}, {"box_size", "15"}, {"border", 3.0}, {"error_correction", "h"}, {"logo_url", nullptr}};
  auto rec = HistoryRecord::from_document(doc);
  EXPECT_EQ(rec.content, "hi");
  EXPECT_EQ(rec.box_size, 15);
  EXPECT_EQ(rec.border, 3);
  EXPECT_EQ(rec.error_correction, "h");
  EXPECT_FALSE(rec.logo_url.has_value());

  // Store bookkeeping is not part of the record
  EXPECT_FALSE(rec.to_json().contains("_id"));
}

// --- parse_history_limit ---

TEST(HistoryLimitTest, DefaultAndRange) {
  int limit = 0;
  EXPECT_FALSE(parse_history_limit(std::nullopt, limit).has_value());
  EXPECT_EQ(limit, 12);

  EXPECT_FALSE(parse_history_limit(std::string("5"), limit).has_value());
  EXPECT_EQ(limit, 5);

  EXPECT_FALSE(parse_history_limit(std::string("50"), limit).has_value());
  EXPECT_EQ(limit, 50);
}

TEST(HistoryLimitTest, RejectsOutOfRange) {
  int limit = 0;
  EXPECT_EQ(parse_history_limit(std::string("0"), limit)->status, 422);
  EXPECT_EQ(parse_history_limit(std::string("51"), limit)->status, 422);
  EXPECT_EQ(parse_history_limit(std::string("abc"), limit)->status, 422);
  EXPECT_EQ(parse_history_limit(std::string(""), limit)->status, 422);
  EXPECT_EQ(parse_history_limit(std::string("5x"), limit)->status, 422);
}
