#pragma once

#include <string>
#include <vector>

#include "core/types.hpp"
#include "image/image.hpp"

namespace qrapi::qr {

// Square module matrix, true = dark module
struct QrMatrix {
  int version = 0;
  int size = 0;
  ErrorCorrection ecc = ErrorCorrection::Medium;
  std::vector<bool> modules;

  bool dark(int x, int y) const {
    return x >= 0 && y >= 0 && x < size && y < size && modules[static_cast<size_t>(y) * size + x];
  }
};

// QR 码编码器包装类
// 使用 QRCode C 库 (qrcode.h) 生成模块矩阵，再栅格化为 RGBA 位图
class QrEncoder {
 public:
  static constexpr int kMaxVersion = 40;

  // Byte-mode capacity of a version at an ECC level
  static int capacity(int version, ErrorCorrection ecc);

  // 能容纳 length 字节的最小版本 (1..40)，超出版本 40 容量返回 0
  static int fit_version(size_t length, ErrorCorrection ecc);

  // Encode content using the smallest fitting version
  static Result<QrMatrix> encode(const std::string &content, ErrorCorrection ecc);

  // Rasterize: each module becomes box_size x box_size pixels, with `border`
  // blank modules on every side
  static image::RgbaImage render(const QrMatrix &matrix, int box_size, int border, Rgba fill, Rgba back);
};

}  // namespace qrapi::qr
