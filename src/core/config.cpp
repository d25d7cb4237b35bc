#include "config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace qrapi {

namespace fs = std::filesystem;

namespace {

std::optional<long> parse_long(const char* value) {
  if (!value || !*value) return std::nullopt;
  try {
    size_t consumed = 0;
    long parsed = std::stol(value, &consumed);
    if (consumed != std::string(value).size()) return std::nullopt;
    return parsed;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

}  // namespace

Config Config::load(const fs::path& path) {
  Config config;
  config.data_dir = config_paths::default_data_dir();

  if (!fs::exists(path)) {
    return config;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return config;
  }

  try {
    json j = json::parse(file);

    config.host = j.value("host", config.host);
    config.port = j.value("port", config.port);
    config.threads = j.value("threads", config.threads);
    config.max_body_bytes = j.value("max_body_bytes", config.max_body_bytes);

    if (j.contains("data_dir")) {
      config.data_dir = j["data_dir"].get<std::string>();
    }

    config.logo_timeout = std::chrono::seconds(j.value("logo_timeout_seconds", int64_t(6)));

    config.log_level = j.value("log_level", "info");
    if (j.contains("log_file")) {
      config.log_file = j["log_file"].get<std::string>();
    }

  } catch (const std::exception& e) {
    spdlog::warn("Failed to parse config {}: {}", path.string(), e.what());
  }

  return config;
}

Config Config::load_default() {
  // Try to load from project config first, then global
  auto project_config = config_paths::project_config_file();
  if (fs::exists(project_config)) {
    return load(project_config);
  }

  auto global_config = config_paths::default_config_file();
  if (fs::exists(global_config)) {
    return load(global_config);
  }

  Config config;
  config.data_dir = config_paths::default_data_dir();
  return config;
}

Config Config::from_env() {
  Config config = load_default();

  if (const char* host = std::getenv("HOST"); host && *host) {
    config.host = host;
  }

  if (const char* port = std::getenv("PORT")) {
    auto parsed = parse_long(port);
    if (parsed && *parsed > 0 && *parsed <= 65535) {
      config.port = static_cast<uint16_t>(*parsed);
    } else {
      spdlog::warn("Ignoring invalid PORT value '{}', using {}", port, config.port);
    }
  }

  if (auto threads = parse_long(std::getenv("QRAPI_THREADS")); threads && *threads > 0) {
    config.threads = static_cast<int>(*threads);
  }

  if (const char* data_dir = std::getenv("QRAPI_DATA_DIR")) {
    // An empty value turns persistence off
    config.data_dir = data_dir;
  }

  if (const char* level = std::getenv("QRAPI_LOG_LEVEL"); level && *level) {
    config.log_level = level;
  }

  if (const char* log_file = std::getenv("QRAPI_LOG_FILE"); log_file && *log_file) {
    config.log_file = fs::path(log_file);
  }

  return config;
}

namespace config_paths {

fs::path home_dir() {
  const char* home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
#ifdef _WIN32
  const char* userprofile = std::getenv("USERPROFILE");
  if (userprofile) {
    return fs::path(userprofile);
  }
#endif
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "qrapi";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

fs::path project_config_file() {
  return fs::current_path() / ".qrapi" / "config.json";
}

fs::path default_data_dir() {
  return config_dir() / "data";
}

}  // namespace config_paths

}  // namespace qrapi
