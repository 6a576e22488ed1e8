#include "log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <vector>

namespace termctl {

namespace {

// 每次启动时轮转日志文件
// 策略：termctl.log -> termctl.0.log -> ... -> termctl.{max_files-1}.log（最旧的被删除）
void rotate_logs_on_startup(const std::filesystem::path& current_log, size_t max_files) {
  namespace fs = std::filesystem;

  if (max_files == 0 || !fs::exists(current_log)) {
    return;
  }

  auto log_dir = current_log.parent_path();
  auto stem = current_log.stem().string();
  auto ext = current_log.extension().string();
  auto backup = [&](size_t i) {
    return log_dir / (stem + "." + std::to_string(i) + ext);
  };

  std::error_code ec;
  fs::remove(backup(max_files - 1), ec);

  // 从后往前依次重命名
  for (int i = static_cast<int>(max_files) - 2; i >= 0; --i) {
    auto old_name = backup(static_cast<size_t>(i));
    if (fs::exists(old_name)) {
      fs::rename(old_name, backup(static_cast<size_t>(i) + 1), ec);
    }
  }

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

void init_log(const std::string& log_path, size_t max_files, const std::string& level) {
  try {
    namespace fs = std::filesystem;

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!log_path.empty()) {
      fs::path actual_path = log_path;

      // 确保日志目录存在
      std::error_code ec;
      if (actual_path.has_parent_path()) {
        fs::create_directories(actual_path.parent_path(), ec);
      }

      rotate_logs_on_startup(actual_path, max_files);

      // 每次启动都是新的干净文件
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true));
    }

    auto logger = std::make_shared<spdlog::logger>("termctl", sinks.begin(), sinks.end());
    logger->set_level(parse_level(level));

    // 日志格式：[时间] [级别] [线程 ID] 消息
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
    logger->flush_on(spdlog::level::info);

    spdlog::drop("termctl");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::debug("=== termctl logging started (file: {}) ===", log_path.empty() ? "<none>" : log_path);
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

std::shared_ptr<spdlog::logger> get_logger() {
  return spdlog::default_logger();
}

}  // namespace termctl
