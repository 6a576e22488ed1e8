#include "termctl/termctl.hpp"

#include <spdlog/spdlog.h>

#include "log/log.h"

namespace termctl {

void init(const Config& config) {
  // 初始化日志系统（stdout 保留给协议）
  init_log(config.log_file ? config.log_file->string() : "", 5, config.log_level);

  ToolRegistry::instance().init_builtins();
  spdlog::info("termctl {} initialized", version());
}

void shutdown() {
  spdlog::shutdown();
}

std::string version() {
  return TERMCTL_VERSION_STRING;
}

}  // namespace termctl
