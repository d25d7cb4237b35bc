// Render a QR code PNG from the command line, using the same pipeline as the service
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "qrapi/qrapi.hpp"

using namespace qrapi;

static void print_usage(const char* prog) {
  std::cout << "Usage: " << prog << " [options] <content>\n"
            << "\n"
            << "Options:\n"
            << "  -o, --output <file>    output PNG (default qrcode.png)\n"
            << "  --fill <color>         module color (default #111827)\n"
            << "  --back <color>         background color (default #ffffff)\n"
            << "  --box-size <n>         pixels per module, 1..50 (default 10)\n"
            << "  --border <n>           quiet zone in modules, 0..20 (default 4)\n"
            << "  --ecc <L|M|Q|H>        error correction level (default M)\n"
            << "  --no-rounded           keep hard module edges\n"
            << "  --logo <url|file>      logo image (PNG, JPEG, ...) to place in the center\n";
}

static std::optional<std::string> read_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) return std::nullopt;
  return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

int main(int argc, char* argv[]) {
  service::GenerationRequest req;
  std::string output = "qrcode.png";
  std::optional<std::string> logo_arg;
  json body = json::object();

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    bool has_value = i + 1 < argc;

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    } else if ((arg == "-o" || arg == "--output") && has_value) {
      output = argv[++i];
    } else if (arg == "--fill" && has_value) {
      body["fill_color"] = argv[++i];
    } else if (arg == "--back" && has_value) {
      body["back_color"] = argv[++i];
    } else if (arg == "--box-size" && has_value) {
      body["box_size"] = argv[++i];
    } else if (arg == "--border" && has_value) {
      body["border"] = argv[++i];
    } else if (arg == "--ecc" && has_value) {
      body["error_correction"] = argv[++i];
    } else if (arg == "--no-rounded") {
      body["rounded"] = false;
    } else if (arg == "--logo" && has_value) {
      logo_arg = argv[++i];
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << "\n";
      print_usage(argv[0]);
      return 1;
    } else {
      body["content"] = arg;
    }
  }

  if (!body.contains("content")) {
    print_usage(argv[0]);
    return 1;
  }

  // Same validation as the HTTP body
  if (auto err = service::GenerationRequest::from_json(body, req)) {
    std::cerr << "Error: " << err->detail << "\n";
    return 1;
  }
  if (auto err = req.validate()) {
    std::cerr << "Error: " << err->detail << "\n";
    return 1;
  }

  std::optional<image::RgbaImage> logo;
  if (logo_arg) {
    Result<image::RgbaImage> fetched = Result<image::RgbaImage>::failure("no logo");
    if (net::ParsedUrl::parse(*logo_arg)) {
      qr::HttpLogoFetcher fetcher;
      fetched = fetcher.fetch(*logo_arg);
    } else if (auto bytes = read_file(*logo_arg)) {
      fetched = image::decode_image(*bytes);
    } else {
      fetched = Result<image::RgbaImage>::failure("cannot read " + *logo_arg);
    }

    if (fetched.ok()) {
      logo = std::move(*fetched.value);
    } else {
      spdlog::warn("Logo skipped: {}", fetched.error.value_or("unknown error"));
    }
  }

  auto fill = parse_color(req.fill_color);
  auto back = parse_color(req.back_color);
  if (!fill || !back) {
    std::cerr << "Error: invalid " << (fill ? "back_color" : "fill_color") << "\n";
    return 1;
  }

  qr::ComposeOptions options;
  options.box_size = req.box_size;
  options.border = req.border;
  options.fill = *fill;
  options.back = *back;
  options.ecc = req.error_correction;
  options.rounded = req.rounded;

  auto img = qr::compose(req.content, options, logo);
  if (!img.ok()) {
    std::cerr << "Error: " << *img.error << "\n";
    return 1;
  }

  auto png = image::encode_png(*img.value);
  if (!png.ok()) {
    std::cerr << "Error: " << *png.error << "\n";
    return 1;
  }

  std::ofstream file(output, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    std::cerr << "Error: cannot write " << output << "\n";
    return 1;
  }
  file.write(png.value->data(), static_cast<std::streamsize>(png.value->size()));
  file.close();
  if (file.fail()) {
    std::cerr << "Error: failed writing " << output << "\n";
    return 1;
  }

  std::cout << output << ": " << img.value->width() << "x" << img.value->height() << ", " << png.value->size() << " bytes\n";
  return 0;
}
