#include "qr/composer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace qrapi::qr {

void soften_corners(image::RgbaImage &img, int box_size) {
  if (img.empty()) return;

  const int radius = std::max(kMinSoftenRadius, box_size);
  img.put_alpha(image::gaussian_blur(img.alpha(), radius / 3.0));
}

void overlay_logo(image::RgbaImage &img, const image::RgbaImage &logo) {
  if (img.empty() || logo.empty()) return;

  const int target = static_cast<int>(std::min(img.width(), img.height()) * kLogoScale);
  if (target <= 0) return;

  image::RgbaImage fitted = image::contain(logo, target, target);
  if (fitted.empty()) return;

  const int lw = fitted.width();
  const int lh = fitted.height();

  image::RgbaImage backing(lw + kLogoPadding, lh + kLogoPadding, kLogoBacking);
  img.alpha_composite(backing, (img.width() - backing.width()) / 2, (img.height() - backing.height()) / 2);
  img.alpha_composite(fitted, (img.width() - lw) / 2, (img.height() - lh) / 2);
}

image::RgbaImage compose(const QrMatrix &matrix, const ComposeOptions &options, const std::optional<image::RgbaImage> &logo) {
  auto img = QrEncoder::render(matrix, options.box_size, options.border, options.fill, options.back);
  spdlog::debug("Rendered QR v{} ({} modules) at {}x{}", matrix.version, matrix.size, img.width(), img.height());

  if (options.rounded) {
    soften_corners(img, options.box_size);
  }

  if (logo) {
    overlay_logo(img, *logo);
  }

  return img;
}

Result<image::RgbaImage> compose(const std::string &content, const ComposeOptions &options, const std::optional<image::RgbaImage> &logo) {
  auto matrix = QrEncoder::encode(content, options.ecc);
  if (!matrix.ok()) {
    return Result<image::RgbaImage>::failure(*matrix.error);
  }
  return Result<image::RgbaImage>::success(compose(*matrix.value, options, logo));
}

}  // namespace qrapi::qr
