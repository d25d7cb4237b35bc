#pragma once

#include <cstdint>
#include <vector>

#include "core/types.hpp"

namespace qrapi::image {

// Single 8-bit channel, row-major
struct Channel {
  int width = 0;
  int height = 0;
  std::vector<uint8_t> data;

  Channel() = default;
  Channel(int w, int h, uint8_t fill = 0);

  uint8_t at(int x, int y) const {
    return data[static_cast<size_t>(y) * width + x];
  }
};

// 8-bit straight-alpha RGBA bitmap, row-major, 4 bytes per pixel
class RgbaImage {
 public:
  RgbaImage() = default;
  RgbaImage(int width, int height, Rgba fill = {0, 0, 0, 0});

  int width() const {
    return width_;
  }

  int height() const {
    return height_;
  }

  bool empty() const {
    return width_ == 0 || height_ == 0;
  }

  Rgba pixel(int x, int y) const;

  void set_pixel(int x, int y, Rgba color);

  // Fill the axis-aligned rectangle, clipped to the image
  void fill_rect(int x, int y, int w, int h, Rgba color);

  // Raw RGBA bytes (width * height * 4)
  const std::vector<uint8_t>& bytes() const {
    return pixels_;
  }

  std::vector<uint8_t>& bytes() {
    return pixels_;
  }

  Channel alpha() const;

  // Replace the alpha channel; sizes must match
  void put_alpha(const Channel& alpha);

  // Porter-Duff "over" of src onto this image with src's top-left at (x, y)
  void alpha_composite(const RgbaImage& src, int x, int y);

  bool operator==(const RgbaImage& other) const = default;

 private:
  int width_ = 0;
  int height_ = 0;
  std::vector<uint8_t> pixels_;
};

// Separable Gaussian blur with the given standard deviation. Edge pixels are
// clamped, so a uniform channel stays uniform.
Channel gaussian_blur(const Channel& channel, double sigma);

// Resize to exactly w x h with area averaging
RgbaImage resize(const RgbaImage& src, int w, int h);

// Shrink to fit inside max_w x max_h keeping the aspect ratio. Never enlarges.
RgbaImage contain(const RgbaImage& src, int max_w, int max_h);

}  // namespace qrapi::image
