#include "image/codec.hpp"

#include <png.h>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <csetjmp>
#include <cstring>
#include <vector>

namespace qrapi::image {

namespace {

// libpng reports errors through this; the handler copies the message and longjmps
struct PngErrorContext {
  char message[256] = "unknown libpng error";
};

void on_png_error(png_structp png_ptr, png_const_charp msg) {
  auto* ctx = static_cast<PngErrorContext*>(png_get_error_ptr(png_ptr));
  if (ctx && msg) {
    std::strncpy(ctx->message, msg, sizeof(ctx->message) - 1);
    ctx->message[sizeof(ctx->message) - 1] = '\0';
  }
  png_longjmp(png_ptr, 1);
}

void on_png_warning(png_structp, png_const_charp) {
  // Warnings (e.g. bad sRGB chunks) are not fatal
}

void write_to_string(png_structp png_ptr, png_bytep data, png_size_t length) {
  auto* out = static_cast<std::string*>(png_get_io_ptr(png_ptr));
  out->append(reinterpret_cast<const char*>(data), length);
}

void flush_noop(png_structp) {}

// All C++ objects live in the caller's frame; this frame only holds PODs so a
// longjmp out of libpng never skips a destructor.
bool write_rgba(const RgbaImage& image, std::string& out, std::vector<png_bytep>& rows, PngErrorContext& err) {
  png_structp png_ptr = png_create_write_struct(PNG_LIBPNG_VER_STRING, &err, on_png_error, on_png_warning);
  if (png_ptr == nullptr) {
    std::strcpy(err.message, "failed to initialize PNG writer");
    return false;
  }

  png_infop info_ptr = png_create_info_struct(png_ptr);
  if (info_ptr == nullptr) {
    png_destroy_write_struct(&png_ptr, nullptr);
    std::strcpy(err.message, "failed to initialize PNG info");
    return false;
  }

  if (setjmp(png_jmpbuf(png_ptr))) {
    png_destroy_write_struct(&png_ptr, &info_ptr);
    return false;
  }

  png_set_write_fn(png_ptr, &out, write_to_string, flush_noop);
  png_set_IHDR(png_ptr, info_ptr, static_cast<png_uint_32>(image.width()), static_cast<png_uint_32>(image.height()), 8, PNG_COLOR_TYPE_RGBA,
               PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
  png_write_info(png_ptr, info_ptr);
  png_write_image(png_ptr, rows.data());
  png_write_end(png_ptr, nullptr);

  png_destroy_write_struct(&png_ptr, &info_ptr);
  return true;
}

}  // namespace

bool is_png(const std::string& bytes) {
  return bytes.size() >= 8 && png_sig_cmp(reinterpret_cast<png_const_bytep>(bytes.data()), 0, 8) == 0;
}

Result<std::string> encode_png(const RgbaImage& image) {
  if (image.empty()) {
    return Result<std::string>::failure("cannot encode an empty image");
  }

  std::string out;
  PngErrorContext err;

  // libpng only reads through these pointers
  std::vector<png_bytep> rows(static_cast<size_t>(image.height()));
  auto* base = const_cast<png_bytep>(image.bytes().data());
  for (int y = 0; y < image.height(); ++y) {
    rows[y] = base + static_cast<size_t>(y) * image.width() * 4;
  }

  if (!write_rgba(image, out, rows, err)) {
    return Result<std::string>::failure(std::string("PNG encode failed: ") + err.message);
  }
  return Result<std::string>::success(std::move(out));
}

Result<RgbaImage> decode_image(const std::string& bytes) {
  if (bytes.empty()) {
    return Result<RgbaImage>::failure("empty image data");
  }

  cv::Mat decoded;
  try {
    cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1, const_cast<char*>(bytes.data()));
    decoded = cv::imdecode(raw, cv::IMREAD_UNCHANGED);
  } catch (const cv::Exception& e) {
    return Result<RgbaImage>::failure(std::string("image decode failed: ") + e.what());
  }

  if (decoded.empty()) {
    return Result<RgbaImage>::failure("unsupported or corrupt image data");
  }
  if (decoded.cols > kMaxDecodeDimension || decoded.rows > kMaxDecodeDimension) {
    return Result<RgbaImage>::failure("image too large");
  }

  // 16-bit and float sources down to 8 bits per channel
  if (decoded.depth() == CV_16U) {
    decoded.convertTo(decoded, CV_8U, 1.0 / 257.0);
  } else if (decoded.depth() == CV_32F || decoded.depth() == CV_64F) {
    decoded.convertTo(decoded, CV_8U, 255.0);
  } else if (decoded.depth() != CV_8U) {
    decoded.convertTo(decoded, CV_8U);
  }

  // OpenCV hands back BGR(A) or gray
  cv::Mat rgba;
  switch (decoded.channels()) {
    case 1:
      cv::cvtColor(decoded, rgba, cv::COLOR_GRAY2RGBA);
      break;
    case 3:
      cv::cvtColor(decoded, rgba, cv::COLOR_BGR2RGBA);
      break;
    case 4:
      cv::cvtColor(decoded, rgba, cv::COLOR_BGRA2RGBA);
      break;
    default:
      return Result<RgbaImage>::failure("unsupported channel count " + std::to_string(decoded.channels()));
  }

  RgbaImage image(rgba.cols, rgba.rows);
  const size_t row_bytes = static_cast<size_t>(rgba.cols) * 4;
  for (int y = 0; y < rgba.rows; ++y) {
    std::memcpy(image.bytes().data() + static_cast<size_t>(y) * row_bytes, rgba.ptr<uint8_t>(y), row_bytes);
  }
  return Result<RgbaImage>::success(std::move(image));
}

}  // namespace qrapi::image
