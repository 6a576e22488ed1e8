#ifndef TERMCTL_LOG_H
#define TERMCTL_LOG_H

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace termctl {

/**
 * 初始化日志系统
 *
 * 日志始终输出到 stderr（stdout 用于 MCP 协议通信，不能写入日志）。
 * 指定 log_path 时额外写入文件，并按启动次数轮转：
 * - 上次的 termctl.log 重命名为 termctl.0.log
 * - 历史日志依次向后移动：termctl.0.log -> termctl.1.log -> ...
 * - 超出 max_files 的最旧日志被删除
 *
 * @param log_path 日志文件路径（可选，为空时只输出到 stderr）
 * @param max_files 保留的历史日志文件数量
 * @param level 日志级别：trace/debug/info/warn/err/critical/off
 */
void init_log(const std::string& log_path = "", size_t max_files = 5, const std::string& level = "info");

/**
 * 获取默认 logger
 */
std::shared_ptr<spdlog::logger> get_logger();

}  // namespace termctl

#endif  // TERMCTL_LOG_H
