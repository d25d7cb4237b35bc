#include "log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <vector>

#include "core/config.hpp"

namespace qrapi {

namespace {

// 每次启动时轮转日志文件
// 策略：qrapi.log -> qrapi.0.log -> ... -> qrapi.9.log（最旧的被删除）
void rotate_logs_on_startup(const std::filesystem::path& current_log, size_t max_files) {
  namespace fs = std::filesystem;

  auto log_dir = current_log.parent_path();
  auto stem = current_log.stem().string();
  auto ext = current_log.extension().string();

  // 确保日志目录存在
  std::error_code ec;
  fs::create_directories(log_dir, ec);
  if (ec) {
    std::cerr << "Failed to create log directory: " << ec.message() << "\n";
    return;
  }

  // 如果当前日志文件不存在，无需轮转
  if (!fs::exists(current_log) || max_files == 0) {
    return;
  }

  auto backup = [&](size_t index) {
    return log_dir / (stem + "." + std::to_string(index) + ext);
  };

  // 删除最旧的日志文件
  fs::path oldest = backup(max_files - 1);
  if (fs::exists(oldest)) {
    fs::remove(oldest, ec);
  }

  // 从后往前依次重命名：qrapi.8.log -> qrapi.9.log, ...
  for (int i = static_cast<int>(max_files) - 2; i >= 0; --i) {
    fs::path old_name = backup(static_cast<size_t>(i));
    if (fs::exists(old_name)) {
      fs::rename(old_name, backup(static_cast<size_t>(i + 1)), ec);
    }
  }

  // 把当前日志文件重命名为 qrapi.0.log
  fs::rename(current_log, backup(0), ec);
}

spdlog::level::level_enum parse_level(const std::string& level) {
  if (level == "trace") return spdlog::level::trace;
  if (level == "debug") return spdlog::level::debug;
  if (level == "info") return spdlog::level::info;
  if (level == "warn") return spdlog::level::warn;
  if (level == "err" || level == "error") return spdlog::level::err;
  if (level == "critical") return spdlog::level::critical;
  if (level == "off") return spdlog::level::off;
  return spdlog::level::info;
}

}  // namespace

void init_log(const std::string& log_path, size_t max_files, const std::string& level, bool console) {
  try {
    namespace fs = std::filesystem;

    // 确定日志文件路径
    fs::path actual_path = log_path.empty() ? config_paths::config_dir() / "log" / "qrapi.log" : fs::path(log_path);

    // 每次启动时轮转日志
    rotate_logs_on_startup(actual_path, max_files);

    std::vector<spdlog::sink_ptr> sinks;

    // 创建 basic file sink（每次启动都是新的干净文件）
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true));
    if (console) {
      sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>("qrapi", sinks.begin(), sinks.end());

    logger->set_level(parse_level(level));

    // 设置日志格式：[时间] [级别] [线程 ID] 消息
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

    // warn 及以上立即刷新，其余由 spdlog 周期刷新
    logger->flush_on(spdlog::level::warn);
    spdlog::flush_every(std::chrono::seconds(2));

    // 注册并设为默认 logger
    spdlog::drop("qrapi");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::info("=== qrapi started (log: {}) ===", actual_path.string());
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

}  // namespace qrapi
