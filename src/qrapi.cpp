#include "qrapi/qrapi.hpp"

#include <spdlog/spdlog.h>

#include "core/version.hpp"
#include "log/log.h"

namespace qrapi {

void init(const Config &config) {
  // 初始化日志系统
  init_log(config.log_file ? config.log_file->string() : "", 10, config.log_level);
  spdlog::info("qrapi {} starting", version());
}

void shutdown() {
  spdlog::info("qrapi shutting down");
  spdlog::shutdown();
}

std::string version() {
  return QRAPI_VERSION_STRING;
}

}  // namespace qrapi
