#pragma once

#include <optional>
#include <string>

#include "core/types.hpp"
#include "image/image.hpp"
#include "qr/qr_encoder.hpp"

namespace qrapi::qr {

// Minimum softening radius in pixels
inline constexpr int kMinSoftenRadius = 4;

// Logo bounding box relative to the shorter image edge
inline constexpr double kLogoScale = 0.2;

// Extra pixels around the logo covered by the contrast backing
inline constexpr int kLogoPadding = 16;

inline constexpr Rgba kLogoBacking{255, 255, 255, 220};

struct ComposeOptions {
  int box_size = 10;
  int border = 4;
  Rgba fill{0x11, 0x18, 0x27, 255};
  Rgba back{255, 255, 255, 255};
  ErrorCorrection ecc = ErrorCorrection::Medium;
  bool rounded = true;
};

// Blur the alpha channel with sigma = max(4, box_size) / 3 and write it back
void soften_corners(image::RgbaImage &img, int box_size);

// Fit the logo into 20% of the shorter edge and composite it, over a
// translucent white backing square, at the image center
void overlay_logo(image::RgbaImage &img, const image::RgbaImage &logo);

// Render an encoded matrix, then optional softening and optional logo
image::RgbaImage compose(const QrMatrix &matrix, const ComposeOptions &options, const std::optional<image::RgbaImage> &logo = std::nullopt);

// Full pipeline: encode, then compose the matrix
Result<image::RgbaImage> compose(const std::string &content, const ComposeOptions &options, const std::optional<image::RgbaImage> &logo = std::nullopt);

}  // namespace qrapi::qr
