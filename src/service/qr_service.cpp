#include "service/qr_service.hpp"

#include <spdlog/spdlog.h>

#include "core/color.hpp"
#include "image/codec.hpp"
#include "qr/composer.hpp"

namespace qrapi::service {

QrService::QrService(std::shared_ptr<store::DocumentStore> store, std::shared_ptr<qr::LogoSource> logos)
    : store_(std::move(store)), logos_(std::move(logos)) {}

std::optional<ApiError> QrService::generate(const GenerationRequest &req, GeneratedImage &out) {
  if (auto err = req.validate()) {
    return err;
  }

  auto fill = parse_color(req.fill_color);
  if (!fill) {
    return ApiError{400, "invalid fill_color"};
  }
  auto back = parse_color(req.back_color);
  if (!back) {
    return ApiError{400, "invalid back_color"};
  }

  auto matrix = qr::QrEncoder::encode(req.content, req.error_correction);
  if (!matrix.ok()) {
    return ApiError{400, matrix.error.value_or("QR code generation failed")};
  }

  qr::ComposeOptions options;
  options.box_size = req.box_size;
  options.border = req.border;
  options.fill = *fill;
  options.back = *back;
  options.ecc = req.error_correction;
  options.rounded = req.rounded;

  // Only fetched once the content is known to fit
  std::optional<image::RgbaImage> logo;
  if (req.logo_url && logos_) {
    auto fetched = logos_->fetch(*req.logo_url);
    if (fetched.ok()) {
      logo = std::move(*fetched.value);
    } else {
      spdlog::warn("Logo skipped for {}: {}", *req.logo_url, fetched.error.value_or("unknown error"));
    }
  }

  image::RgbaImage composed = qr::compose(*matrix.value, options, logo);

  if (store_) {
    auto saved = store_->create_document(kHistoryCollection, HistoryRecord::from_request(req).to_json());
    if (!saved.ok()) {
      spdlog::warn("History not saved: {}", saved.error.value_or("unknown error"));
    }
  }

  auto png = image::encode_png(composed);
  if (!png.ok()) {
    spdlog::error("{}", png.error.value_or("PNG encode failed"));
    return ApiError{500, "Internal Server Error"};
  }

  out.png = std::move(*png.value);
  out.width = composed.width();
  out.height = composed.height();
  out.logo_applied = logo.has_value();
  return std::nullopt;
}

std::vector<HistoryRecord> QrService::history(int limit) {
  std::vector<HistoryRecord> records;
  if (!store_) {
    return records;
  }

  auto docs = store_->get_documents(kHistoryCollection, json::object(), static_cast<size_t>(limit));
  if (!docs.ok()) {
    spdlog::warn("History unavailable: {}", docs.error.value_or("unknown error"));
    return records;
  }

  records.reserve(docs.value->size());
  for (const auto &doc : *docs.value) {
    records.push_back(HistoryRecord::from_document(doc));
  }
  return records;
}

json QrService::status() const {
  json j;
  j["backend"] = "✅ Running";
  j["database"] = (store_ && store_->available()) ? "✅ Connected" : "❌ Not Available";
  return j;
}

}  // namespace qrapi::service
