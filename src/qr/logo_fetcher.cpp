#include "qr/logo_fetcher.hpp"

#include <spdlog/spdlog.h>

#include "image/codec.hpp"

namespace qrapi::qr {

namespace {
constexpr const char *USER_AGENT = "qrapi-logo-fetcher/1.0";
}

HttpLogoFetcher::HttpLogoFetcher(std::chrono::seconds timeout)
    : timeout_(timeout), work_(asio::make_work_guard(io_ctx_)), client_(io_ctx_) {
  io_thread_ = std::thread([this]() {
    io_ctx_.run();
  });
}

HttpLogoFetcher::~HttpLogoFetcher() {
  work_.reset();
  io_ctx_.stop();
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
}

Result<std::string> HttpLogoFetcher::download(const std::string &url) {
  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + timeout_;

  std::string current = url;
  for (int hop = 0; hop <= kMaxRedirects; ++hop) {
    auto parsed = net::ParsedUrl::parse(current);
    if (!parsed) {
      return Result<std::string>::failure("invalid URL: " + current);
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
    if (remaining <= std::chrono::milliseconds::zero()) {
      return Result<std::string>::failure("Request timed out");
    }

    net::HttpOptions options;
    options.method = "GET";
    options.timeout = remaining;
    options.headers["User-Agent"] = USER_AGENT;
    options.headers["Accept"] = "image/png,image/*;q=0.8,*/*;q=0.5";

    auto future = client_.request(current, options);
    // Never wait past the shared deadline, whatever the client's timer does
    if (future.wait_for(remaining) != std::future_status::ready) {
      return Result<std::string>::failure("Request timed out");
    }

    auto response = future.get();
    if (!response.error.empty()) {
      return Result<std::string>::failure(response.error);
    }

    if (response.is_redirect()) {
      auto location = response.header("Location");
      if (!location || location->empty()) {
        return Result<std::string>::failure("redirect without Location header");
      }
      current = parsed->resolve(*location);
      spdlog::debug("Logo redirect {} -> {}", response.status_code, current);
      continue;
    }

    if (!response.ok()) {
      return Result<std::string>::failure("HTTP " + std::to_string(response.status_code));
    }

    return Result<std::string>::success(std::move(response.body));
  }

  return Result<std::string>::failure("too many redirects");
}

Result<image::RgbaImage> HttpLogoFetcher::fetch(const std::string &url) {
  auto body = download(url);
  if (!body.ok()) {
    return Result<image::RgbaImage>::failure(*body.error);
  }
  return image::decode_image(*body.value);
}

}  // namespace qrapi::qr
