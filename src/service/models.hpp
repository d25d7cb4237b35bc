#pragma once

#include <optional>
#include <string>

#include "core/types.hpp"

namespace qrapi::service {

inline constexpr const char *kDefaultFillColor = "#111827";
inline constexpr const char *kDefaultBackColor = "#ffffff";
inline constexpr int kDefaultBoxSize = 10;
inline constexpr int kDefaultBorder = 4;

inline constexpr int kMinBoxSize = 1;
inline constexpr int kMaxBoxSize = 50;
inline constexpr int kMinBorder = 0;
inline constexpr int kMaxBorder = 20;

inline constexpr int kDefaultHistoryLimit = 12;
inline constexpr int kMaxHistoryLimit = 50;

// Collection holding generation history
inline constexpr const char *kHistoryCollection = "qr";

// A request rejected before any work is done
struct ApiError {
  int status = 422;
  std::string detail;
};

// Body of POST /api/qrcode.png
struct GenerationRequest {
  std::string content;
  std::string fill_color = kDefaultFillColor;
  std::string back_color = kDefaultBackColor;
  int box_size = kDefaultBoxSize;
  int border = kDefaultBorder;
  ErrorCorrection error_correction = ErrorCorrection::Medium;
  bool rounded = true;
  std::optional<std::string> logo_url;

  // Type and range checks only (422). Blank content is left to validate().
  static std::optional<ApiError> from_json(const json &j, GenerationRequest &out);

  // Blank content (400). Color strings are resolved when drawing, not here.
  std::optional<ApiError> validate() const;

  json to_json() const;
};

// One generation as persisted and returned by GET /api/history
struct HistoryRecord {
  std::string content;
  std::string fill_color = kDefaultFillColor;
  std::string back_color = kDefaultBackColor;
  int box_size = kDefaultBoxSize;
  int border = kDefaultBorder;
  std::string error_correction = "M";
  std::optional<std::string> logo_url;

  static HistoryRecord from_request(const GenerationRequest &req);

  // Lenient: missing or mistyped fields fall back to defaults
  static HistoryRecord from_document(const json &doc);

  json to_json() const;
};

// Parse the history "limit" query value; nullopt means the default
std::optional<ApiError> parse_history_limit(const std::optional<std::string> &raw, int &limit);

}  // namespace qrapi::service
