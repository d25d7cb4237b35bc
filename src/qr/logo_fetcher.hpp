#pragma once

#include <asio.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <thread>

#include "core/types.hpp"
#include "image/image.hpp"
#include "net/http_client.hpp"

namespace qrapi::qr {

// Source of logo images for the overlay step
class LogoSource {
 public:
  virtual ~LogoSource() = default;

  // Download and decode the image at url. Any failure is a Result failure,
  // never an exception.
  virtual Result<image::RgbaImage> fetch(const std::string &url) = 0;
};

// Fetches PNG logos over HTTP(S)
//
// Owns a private io_context driven by its own thread, so callers may block on
// fetch() from inside another io_context's handler.
class HttpLogoFetcher : public LogoSource {
 public:
  static constexpr int kMaxRedirects = 5;

  explicit HttpLogoFetcher(std::chrono::seconds timeout = std::chrono::seconds(6));

  ~HttpLogoFetcher() override;

  HttpLogoFetcher(const HttpLogoFetcher &) = delete;
  HttpLogoFetcher &operator=(const HttpLogoFetcher &) = delete;

  Result<image::RgbaImage> fetch(const std::string &url) override;

  // Raw download following redirects; the whole chain shares one deadline
  Result<std::string> download(const std::string &url);

 private:
  std::chrono::seconds timeout_;
  asio::io_context io_ctx_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  net::HttpClient client_;
  std::thread io_thread_;
};

}  // namespace qrapi::qr
