// QR code HTTP service
#include <asio.hpp>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

#include "qrapi/qrapi.hpp"

using namespace qrapi;

static void print_usage(const char* prog) {
  std::cout << "Usage: " << prog << " [--config <file>] [--version]\n"
            << "\n"
            << "Environment:\n"
            << "  HOST, PORT               listen address (default 0.0.0.0:8000)\n"
            << "  QRAPI_THREADS            server worker threads\n"
            << "  QRAPI_DATA_DIR           history directory, empty disables persistence\n"
            << "  QRAPI_LOG_LEVEL          trace|debug|info|warn|error\n"
            << "  QRAPI_LOG_FILE           log file path\n";
}

int main(int argc, char* argv[]) {
  // ----- 加载配置 -----
  Config config = Config::from_env();

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      print_usage(argv[0]);
      return 0;
    } else if (std::strcmp(argv[i], "--version") == 0) {
      std::cout << "qrapi " << version() << "\n";
      return 0;
    } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      auto file_config = Config::load(argv[++i]);
      // Environment still wins over an explicit file for the listener
      if (!std::getenv("HOST")) config.host = file_config.host;
      if (!std::getenv("PORT")) config.port = file_config.port;
      if (!std::getenv("QRAPI_THREADS")) config.threads = file_config.threads;
      if (!std::getenv("QRAPI_DATA_DIR")) config.data_dir = file_config.data_dir;
      if (!std::getenv("QRAPI_LOG_LEVEL")) config.log_level = file_config.log_level;
      if (!std::getenv("QRAPI_LOG_FILE")) config.log_file = file_config.log_file;
      config.max_body_bytes = file_config.max_body_bytes;
      config.logo_timeout = file_config.logo_timeout;
    } else {
      std::cerr << "Unknown argument: " << argv[i] << "\n";
      print_usage(argv[0]);
      return 1;
    }
  }

  // ----- 初始化 -----
  qrapi::init(config);

  std::shared_ptr<store::DocumentStore> store;
  if (config.data_dir.empty()) {
    spdlog::info("Persistence disabled (empty data_dir)");
  } else {
    store = std::make_shared<store::JsonDocumentStore>(config.data_dir);
    if (store->available()) {
      spdlog::info("History stored under {}", config.data_dir.string());
    } else {
      spdlog::warn("History store at {} is not available", config.data_dir.string());
    }
  }

  auto logos = std::make_shared<qr::HttpLogoFetcher>(config.logo_timeout);
  auto service = std::make_shared<service::QrService>(store, logos);

  net::ServerOptions options;
  options.host = config.host;
  options.port = config.port;
  options.threads = config.threads;
  options.max_body_bytes = config.max_body_bytes;

  net::HttpServer server(options);
  service::register_routes(server, service);

  try {
    server.start();
  } catch (const std::exception& e) {
    spdlog::critical("Failed to listen on {}:{}: {}", config.host, config.port, e.what());
    qrapi::shutdown();
    return 1;
  }

  // ----- 信号处理 -----
  asio::io_context signal_ctx;
  asio::signal_set signals(signal_ctx, SIGINT, SIGTERM);
  signals.async_wait([&server](const asio::error_code& ec, int signo) {
    if (ec) return;
    spdlog::info("Received signal {}, stopping", signo);
    server.stop();
  });
  std::thread signal_thread([&signal_ctx]() {
    signal_ctx.run();
  });

  server.wait();

  signal_ctx.stop();
  if (signal_thread.joinable()) signal_thread.join();

  qrapi::shutdown();
  return 0;
}
