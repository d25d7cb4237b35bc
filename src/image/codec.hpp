#pragma once

#include <string>

#include "core/types.hpp"
#include "image/image.hpp"

namespace qrapi::image {

// Largest width/height accepted when decoding
inline constexpr int kMaxDecodeDimension = 8192;

// Encode as 8-bit RGBA, non-interlaced PNG (libpng)
Result<std::string> encode_png(const RgbaImage& image);

// Decode PNG, JPEG, WebP, BMP, TIFF, ... into 8-bit RGBA
Result<RgbaImage> decode_image(const std::string& bytes);

// True if bytes start with the 8-byte PNG signature
bool is_png(const std::string& bytes);

}  // namespace qrapi::image
