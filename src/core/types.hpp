#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace qrapi {

using json = nlohmann::json;

using DocumentId = std::string;

// Result type for operations that can fail
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<std::string> error;

  bool ok() const {
    return value.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  static Result success(T val) {
    return Result{std::move(val), std::nullopt};
  }

  static Result failure(std::string err) {
    return Result{std::nullopt, std::move(err)};
  }
};

// QR redundancy tiers, lowest to highest
enum class ErrorCorrection {
  Low,       // L, ~7% recovery
  Medium,    // M, ~15% recovery
  Quartile,  // Q, ~25% recovery
  High       // H, ~30% recovery
};

// Single-letter form: "L", "M", "Q", "H"
std::string to_string(ErrorCorrection level);

// Case-insensitive; anything other than L/M/Q/H yields Medium
ErrorCorrection error_correction_from_string(const std::string &str);

// 8-bit straight (non-premultiplied) RGBA color
struct Rgba {
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;
  uint8_t a = 255;

  bool operator==(const Rgba &other) const = default;
};

// Strip leading/trailing ASCII whitespace
std::string trim(const std::string &str);

std::string to_lower(std::string str);

}  // namespace qrapi
