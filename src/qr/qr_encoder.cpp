#include "qr/qr_encoder.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>

extern "C" {
#include "qrcode.h"
}

namespace qrapi::qr {

namespace {

// Byte-mode data capacity per version (index 0 unused), from ISO/IEC 18004 tables
constexpr int CAPACITY_L[] = {0,    17,   32,   53,   78,   106,  134,  154,  192,  230,  271,  321,  367,  425,
                              458,  520,  586,  644,  718,  792,  858,  929,  1003, 1091, 1171, 1273, 1367, 1465,
                              1528, 1628, 1732, 1840, 1952, 2068, 2188, 2303, 2431, 2563, 2699, 2809, 2953};
constexpr int CAPACITY_M[] = {0,    14,   26,   42,   62,   84,   106,  122,  152,  180,  213,  251,  287,  331,
                              362,  412,  450,  504,  560,  624,  666,  711,  779,  857,  911,  997,  1059, 1125,
                              1190, 1264, 1370, 1452, 1538, 1628, 1722, 1809, 1911, 1989, 2099, 2213, 2331};
constexpr int CAPACITY_Q[] = {0,   11,  20,  32,  46,  60,  74,  86,   108,  130,  151,  177,  203,  241,
                              258, 292, 322, 364, 394, 442, 482, 509,  565,  611,  661,  715,  751,  805,
                              868, 908, 982, 1030, 1112, 1168, 1228, 1283, 1351, 1423, 1499, 1579, 1663};
constexpr int CAPACITY_H[] = {0,   7,   14,  24,  34,  44,  58,  64,  84,  98,  119, 137, 155, 177,
                              194, 220, 250, 280, 310, 338, 382, 403, 439, 461, 511, 535, 593, 625,
                              658, 698, 742, 790, 842, 898, 958, 983, 1051, 1093, 1139, 1219, 1273};

uint8_t to_library_ecc(ErrorCorrection ecc) {
  switch (ecc) {
    case ErrorCorrection::Low:
      return ECC_LOW;
    case ErrorCorrection::Medium:
      return ECC_MEDIUM;
    case ErrorCorrection::Quartile:
      return ECC_QUARTILE;
    case ErrorCorrection::High:
      return ECC_HIGH;
  }
  return ECC_MEDIUM;
}

}  // namespace

int QrEncoder::capacity(int version, ErrorCorrection ecc) {
  if (version < 1 || version > kMaxVersion) return 0;
  switch (ecc) {
    case ErrorCorrection::Low:
      return CAPACITY_L[version];
    case ErrorCorrection::Medium:
      return CAPACITY_M[version];
    case ErrorCorrection::Quartile:
      return CAPACITY_Q[version];
    case ErrorCorrection::High:
      return CAPACITY_H[version];
  }
  return 0;
}

int QrEncoder::fit_version(size_t length, ErrorCorrection ecc) {
  for (int version = 1; version <= kMaxVersion; ++version) {
    if (length <= static_cast<size_t>(capacity(version, ecc))) {
      return version;
    }
  }
  return 0;
}

Result<QrMatrix> QrEncoder::encode(const std::string &content, ErrorCorrection ecc) {
  int version = fit_version(content.size(), ecc);
  if (version == 0) {
    return Result<QrMatrix>::failure("content too long");
  }

  // 字节模式，保留任意 UTF-8 内容
  std::vector<uint8_t> data(content.begin(), content.end());
  std::vector<uint8_t> buffer(qrcode_getBufferSize(static_cast<uint8_t>(version)));
  ::QRCode qrcode;

  if (qrcode_initBytes(&qrcode, buffer.data(), static_cast<uint8_t>(version), to_library_ecc(ecc), data.data(), static_cast<uint16_t>(data.size())) != 0) {
    spdlog::error("QR encoding failed (version {}, ecc {}, {} bytes)", version, to_string(ecc), data.size());
    return Result<QrMatrix>::failure("QR code generation failed");
  }

  QrMatrix matrix;
  matrix.version = version;
  matrix.size = qrcode.size;
  matrix.ecc = ecc;
  matrix.modules.resize(static_cast<size_t>(matrix.size) * matrix.size);
  for (int y = 0; y < matrix.size; ++y) {
    for (int x = 0; x < matrix.size; ++x) {
      matrix.modules[static_cast<size_t>(y) * matrix.size + x] = qrcode_getModule(&qrcode, static_cast<uint8_t>(x), static_cast<uint8_t>(y));
    }
  }

  return Result<QrMatrix>::success(std::move(matrix));
}

image::RgbaImage QrEncoder::render(const QrMatrix &matrix, int box_size, int border, Rgba fill, Rgba back) {
  const int modules = matrix.size + 2 * border;
  const int pixels = modules * box_size;

  image::RgbaImage img(pixels, pixels, back);
  for (int y = 0; y < matrix.size; ++y) {
    for (int x = 0; x < matrix.size; ++x) {
      if (matrix.dark(x, y)) {
        img.fill_rect((x + border) * box_size, (y + border) * box_size, box_size, box_size, fill);
      }
    }
  }
  return img;
}

}  // namespace qrapi::qr
