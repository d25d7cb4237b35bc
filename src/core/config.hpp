#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "types.hpp"

namespace qrapi {

// Service configuration
struct Config {
  // Listener
  std::string host = "0.0.0.0";
  uint16_t port = 8000;

  // Worker threads running the server io_context
  int threads = 4;

  // Requests with a larger body are answered with 413
  size_t max_body_bytes = 1024 * 1024;

  // Document store directory; empty disables persistence
  std::filesystem::path data_dir;

  // Logo download timeout
  std::chrono::seconds logo_timeout{6};

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  // Load from file
  static Config load(const std::filesystem::path& path);

  // Load default config from project/global config files
  static Config load_default();

  // Load config from environment variables, with file config as base
  // Reads: HOST, PORT, QRAPI_THREADS, QRAPI_DATA_DIR, QRAPI_LOG_LEVEL, QRAPI_LOG_FILE
  static Config from_env();
};

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();

std::filesystem::path config_dir();

std::filesystem::path default_config_file();

std::filesystem::path project_config_file();

std::filesystem::path default_data_dir();
}  // namespace config_paths

}  // namespace qrapi
