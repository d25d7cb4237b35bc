#include "service/models.hpp"

#include <charconv>
#include <cstdint>
#include <cmath>

namespace qrapi::service {

namespace {

std::optional<int> parse_int(const std::string &raw) {
  auto text = trim(raw);
  if (!text.empty() && text.front() == '+') text.erase(0, 1);
  int value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

// Integers, integral floats and numeric strings; booleans are rejected
std::optional<int> coerce_int(const json &v) {
  if (v.is_number_integer()) {
    auto n = v.get<int64_t>();
    if (n < INT32_MIN || n > INT32_MAX) return std::nullopt;
    return static_cast<int>(n);
  }
  if (v.is_number_float()) {
    double d = v.get<double>();
    if (!std::isfinite(d) || std::floor(d) != d || std::fabs(d) > INT32_MAX) return std::nullopt;
    return static_cast<int>(d);
  }
  if (v.is_string()) {
    return parse_int(v.get<std::string>());
  }
  return std::nullopt;
}

std::optional<bool> coerce_bool(const json &v) {
  if (v.is_boolean()) return v.get<bool>();
  if (v.is_number_integer()) {
    auto n = v.get<int64_t>();
    if (n == 0 || n == 1) return n == 1;
    return std::nullopt;
  }
  if (v.is_string()) {
    auto s = to_lower(trim(v.get<std::string>()));
    if (s == "true" || s == "1" || s == "yes" || s == "on") return true;
    if (s == "false" || s == "0" || s == "no" || s == "off") return false;
  }
  return std::nullopt;
}

ApiError invalid(const std::string &detail) {
  return ApiError{422, detail};
}

std::optional<ApiError> read_string(const json &j, const char *key, std::string &out) {
  auto it = j.find(key);
  if (it == j.end()) return std::nullopt;
  if (!it->is_string()) return invalid(std::string(key) + ": must be a string");
  out = it->get<std::string>();
  return std::nullopt;
}

std::optional<ApiError> read_int(const json &j, const char *key, int min, int max, int &out) {
  auto it = j.find(key);
  if (it == j.end()) return std::nullopt;
  auto value = coerce_int(*it);
  if (!value || *value < min || *value > max) {
    return invalid(std::string(key) + ": must be an integer between " + std::to_string(min) + " and " + std::to_string(max));
  }
  out = *value;
  return std::nullopt;
}

}  // namespace

// --- GenerationRequest ---

std::optional<ApiError> GenerationRequest::from_json(const json &j, GenerationRequest &out) {
  if (!j.is_object()) {
    return invalid("request body must be a JSON object");
  }

  GenerationRequest req;

  auto content = j.find("content");
  if (content == j.end() || content->is_null()) {
    return invalid("content: field required");
  }
  if (!content->is_string()) {
    return invalid("content: must be a string");
  }
  req.content = content->get<std::string>();

  if (auto err = read_string(j, "fill_color", req.fill_color)) return err;
  if (auto err = read_string(j, "back_color", req.back_color)) return err;
  if (auto err = read_int(j, "box_size", kMinBoxSize, kMaxBoxSize, req.box_size)) return err;
  if (auto err = read_int(j, "border", kMinBorder, kMaxBorder, req.border)) return err;

  std::string level = "M";
  if (auto err = read_string(j, "error_correction", level)) return err;
  req.error_correction = error_correction_from_string(level);

  if (auto it = j.find("rounded"); it != j.end()) {
    auto rounded = coerce_bool(*it);
    if (!rounded) return invalid("rounded: must be a boolean");
    req.rounded = *rounded;
  }

  if (auto it = j.find("logo_url"); it != j.end() && !it->is_null()) {
    if (!it->is_string()) return invalid("logo_url: must be a string");
    auto url = trim(it->get<std::string>());
    if (!url.empty()) req.logo_url = url;
  }

  out = std::move(req);
  return std::nullopt;
}

std::optional<ApiError> GenerationRequest::validate() const {
  if (trim(content).empty()) {
    return ApiError{400, "content is required"};
  }
  return std::nullopt;
}

json GenerationRequest::to_json() const {
  json j;
  j["content"] = content;
  j["fill_color"] = fill_color;
  j["back_color"] = back_color;
  j["box_size"] = box_size;
  j["border"] = border;
  j["error_correction"] = to_string(error_correction);
  j["rounded"] = rounded;
  j["logo_url"] = logo_url ? json(*logo_url) : json(nullptr);
  return j;
}

// --- HistoryRecord ---

HistoryRecord HistoryRecord::from_request(const GenerationRequest &req) {
  HistoryRecord rec;
  rec.content = req.content;
  rec.fill_color = req.fill_color;
  rec.back_color = req.back_color;
  rec.box_size = req.box_size;
  rec.border = req.border;
  rec.error_correction = to_string(req.error_correction);
  rec.logo_url = req.logo_url;
  return rec;
}

HistoryRecord HistoryRecord::from_document(const json &doc) {
  HistoryRecord rec;
  if (!doc.is_object()) return rec;

  auto text = [&doc](const char *key, const std::string &fallback) -> std::string {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) return fallback;
    return it->is_string() ? it->get<std::string>() : it->dump();
  };

  auto number = [&doc](const char *key, int fallback) {
    auto it = doc.find(key);
    if (it == doc.end()) return fallback;
    return coerce_int(*it).value_or(fallback);
  };

  rec.content = text("content", "");
  rec.fill_color = text("fill_color", kDefaultFillColor);
  rec.back_color = text("back_color", kDefaultBackColor);
  rec.box_size = number("box_size", kDefaultBoxSize);
  rec.border = number("border", kDefaultBorder);
  rec.error_correction = text("error_correction", "M");

  if (auto it = doc.find("logo_url"); it != doc.end() && it->is_string()) {
    rec.logo_url = it->get<std::string>();
  }
  return rec;
}

json HistoryRecord::to_json() const {
  json j;
  j["content"] = content;
  j["fill_color"] = fill_color;
  j["back_color"] = back_color;
  j["box_size"] = box_size;
  j["border"] = border;
  j["error_correction"] = error_correction;
  j["logo_url"] = logo_url ? json(*logo_url) : json(nullptr);
  return j;
}

// --- Query parsing ---

std::optional<ApiError> parse_history_limit(const std::optional<std::string> &raw, int &limit) {
  if (!raw) {
    limit = kDefaultHistoryLimit;
    return std::nullopt;
  }

  auto value = parse_int(*raw);
  if (!value || *value < 1 || *value > kMaxHistoryLimit) {
    return invalid("limit: must be an integer between 1 and " + std::to_string(kMaxHistoryLimit));
  }
  limit = *value;
  return std::nullopt;
}

}  // namespace qrapi::service
