#ifndef QRAPI_LOG_H
#define QRAPI_LOG_H

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace qrapi {

/**
 * 初始化日志系统
 *
 * 日志轮转策略（按启动次数轮转）：
 * - 每次启动服务时，当前的 qrapi.log 会被清空
 * - 上次的日志重命名为 qrapi.0.log
 * - 历史日志依次向后移动：qrapi.0.log -> qrapi.1.log -> ... -> qrapi.9.log
 * - 最旧的日志（qrapi.9.log）被删除
 *
 * 除文件外，日志同时输出到标准输出，便于容器环境采集。
 *
 * @param log_path 日志文件路径（可选，默认 ~/.config/qrapi/log/qrapi.log）
 * @param max_files 保留的历史日志文件数量，默认 10 个（qrapi.0.log ~ qrapi.9.log）
 * @param level 日志级别，默认 info
 * @param console 是否同时输出到标准输出
 */
void init_log(const std::string& log_path = "", size_t max_files = 10, const std::string& level = "info", bool console = true);

}  // namespace qrapi

#endif  // QRAPI_LOG_H
