#include "image/image.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace qrapi::image {

namespace {

uint8_t clamp_byte(double v) {
  return static_cast<uint8_t>(std::clamp(std::lround(v), 0L, 255L));
}

// Views over our buffers; no copies
cv::Mat as_mat(const Channel& channel) {
  return cv::Mat(channel.height, channel.width, CV_8UC1, const_cast<uint8_t*>(channel.data.data()));
}

cv::Mat as_mat(const RgbaImage& image) {
  return cv::Mat(image.height(), image.width(), CV_8UC4, const_cast<uint8_t*>(image.bytes().data()));
}

}  // namespace

Channel::Channel(int w, int h, uint8_t fill) : width(w), height(h), data(static_cast<size_t>(w) * h, fill) {}

RgbaImage::RgbaImage(int width, int height, Rgba fill) : width_(width), height_(height) {
  if (width < 0 || height < 0) {
    throw std::invalid_argument("negative image dimensions");
  }
  pixels_.resize(static_cast<size_t>(width) * height * 4);
  for (size_t i = 0; i < pixels_.size(); i += 4) {
    pixels_[i] = fill.r;
    pixels_[i + 1] = fill.g;
    pixels_[i + 2] = fill.b;
    pixels_[i + 3] = fill.a;
  }
}

Rgba RgbaImage::pixel(int x, int y) const {
  const uint8_t* p = &pixels_[(static_cast<size_t>(y) * width_ + x) * 4];
  return Rgba{p[0], p[1], p[2], p[3]};
}

void RgbaImage::set_pixel(int x, int y, Rgba color) {
  uint8_t* p = &pixels_[(static_cast<size_t>(y) * width_ + x) * 4];
  p[0] = color.r;
  p[1] = color.g;
  p[2] = color.b;
  p[3] = color.a;
}

void RgbaImage::fill_rect(int x, int y, int w, int h, Rgba color) {
  int x0 = std::max(0, x);
  int y0 = std::max(0, y);
  int x1 = std::min(width_, x + w);
  int y1 = std::min(height_, y + h);
  for (int yy = y0; yy < y1; ++yy) {
    for (int xx = x0; xx < x1; ++xx) {
      set_pixel(xx, yy, color);
    }
  }
}

Channel RgbaImage::alpha() const {
  Channel channel(width_, height_);
  for (size_t i = 0; i < channel.data.size(); ++i) {
    channel.data[i] = pixels_[i * 4 + 3];
  }
  return channel;
}

void RgbaImage::put_alpha(const Channel& alpha) {
  if (alpha.width != width_ || alpha.height != height_) {
    throw std::invalid_argument("alpha channel size does not match image");
  }
  for (size_t i = 0; i < alpha.data.size(); ++i) {
    pixels_[i * 4 + 3] = alpha.data[i];
  }
}

void RgbaImage::alpha_composite(const RgbaImage& src, int x, int y) {
  int x0 = std::max(0, x);
  int y0 = std::max(0, y);
  int x1 = std::min(width_, x + src.width());
  int y1 = std::min(height_, y + src.height());

  for (int dy = y0; dy < y1; ++dy) {
    for (int dx = x0; dx < x1; ++dx) {
      Rgba s = src.pixel(dx - x, dy - y);
      if (s.a == 0) continue;
      if (s.a == 255) {
        set_pixel(dx, dy, s);
        continue;
      }

      Rgba d = pixel(dx, dy);
      double sa = s.a / 255.0;
      double da = d.a / 255.0;
      double out_a = sa + da * (1.0 - sa);
      if (out_a <= 0.0) {
        set_pixel(dx, dy, Rgba{0, 0, 0, 0});
        continue;
      }

      auto blend = [&](uint8_t sc, uint8_t dc) {
        return clamp_byte((sc * sa + dc * da * (1.0 - sa)) / out_a);
      };
      set_pixel(dx, dy, Rgba{blend(s.r, d.r), blend(s.g, d.g), blend(s.b, d.b), clamp_byte(out_a * 255.0)});
    }
  }
}

Channel gaussian_blur(const Channel& channel, double sigma) {
  if (sigma <= 0.0 || channel.data.empty()) {
    return channel;
  }

  // A flat channel blurs to itself
  double lo = 0.0;
  double hi = 0.0;
  cv::minMaxLoc(as_mat(channel), &lo, &hi);
  if (lo == hi) {
    return channel;
  }

  // Kernel covers +/- 3 sigma, edges clamped
  const int radius = static_cast<int>(std::ceil(sigma * 3.0));
  Channel out(channel.width, channel.height);
  cv::Mat dst = as_mat(out);
  cv::GaussianBlur(as_mat(channel), dst, cv::Size(radius * 2 + 1, radius * 2 + 1), sigma, sigma, cv::BORDER_REPLICATE);
  return out;
}

RgbaImage resize(const RgbaImage& src, int w, int h) {
  if (w <= 0 || h <= 0 || src.empty()) {
    return RgbaImage();
  }
  if (w == src.width() && h == src.height()) {
    return src;
  }

  // Area-average in premultiplied space so transparent pixels do not bleed color
  cv::Mat premultiplied;
  as_mat(src).convertTo(premultiplied, CV_32FC4, 1.0 / 255.0);
  std::vector<cv::Mat> channels;
  cv::split(premultiplied, channels);
  for (int c = 0; c < 3; ++c) {
    cv::multiply(channels[c], channels[3], channels[c]);
  }
  cv::merge(channels, premultiplied);

  cv::Mat scaled;
  cv::resize(premultiplied, scaled, cv::Size(w, h), 0, 0, cv::INTER_AREA);

  cv::split(scaled, channels);
  cv::Mat transparent = channels[3] <= 0.0f;
  for (int c = 0; c < 3; ++c) {
    cv::divide(channels[c], channels[3], channels[c]);
    channels[c].setTo(0.0f, transparent);
  }
  cv::merge(channels, scaled);

  RgbaImage out(w, h);
  cv::Mat dst = as_mat(out);
  scaled.convertTo(dst, CV_8UC4, 255.0);
  return out;
}

RgbaImage contain(const RgbaImage& src, int max_w, int max_h) {
  if (max_w <= 0 || max_h <= 0 || src.empty()) {
    return RgbaImage();
  }
  if (src.width() <= max_w && src.height() <= max_h) {
    return src;
  }

  double src_ratio = static_cast<double>(src.width()) / src.height();
  double box_ratio = static_cast<double>(max_w) / max_h;

  int w = max_w;
  int h = max_h;
  if (src_ratio > box_ratio) {
    h = std::max(1, static_cast<int>(std::lround(static_cast<double>(src.height()) * max_w / src.width())));
  } else if (src_ratio < box_ratio) {
    w = std::max(1, static_cast<int>(std::lround(static_cast<double>(src.width()) * max_h / src.height())));
  }

  return resize(src, w, h);
}

}  // namespace qrapi::image
