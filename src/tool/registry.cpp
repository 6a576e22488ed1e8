// Tool registry initialization - delegates to tools::register_builtins() in tool/builtin/
#include <spdlog/spdlog.h>

#include "builtin/builtins.hpp"
#include "tool.hpp"

namespace termctl {

void ToolRegistry::init_builtins() {
  spdlog::debug("[ToolRegistry] Initializing built-in tools");
  tools::register_builtins(*this);
}

}  // namespace termctl
