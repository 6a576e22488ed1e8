// MCP tool server on stdio
#include <cstring>
#include <iostream>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "termctl/termctl.hpp"

#ifndef _WIN32
#include <csignal>
#endif

using namespace termctl;

namespace {

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " [options]\n"
            << "\n"
            << "Serves the termctl tools as an MCP server over stdin/stdout.\n"
            << "\n"
            << "Options:\n"
            << "  --config <file>       Load configuration from <file>\n"
            << "  --workspace <dir>     Workspace root (skips project marker detection)\n"
            << "  --shell <path>        Shell executable (skips shell detection)\n"
            << "  --log-level <level>   trace, debug, info, warn, err, critical or off\n"
            << "  --log-file <file>     Also write logs to <file>\n"
            << "  --version             Print the version and exit\n"
            << "  --help                Show this help\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  // ===== 解析命令行 =====
  std::optional<std::string> config_file;
  std::optional<std::string> workspace;
  std::optional<std::string> shell;
  std::optional<std::string> log_level;
  std::optional<std::string> log_file;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto take_value = [&](std::optional<std::string>& target) {
      if (i + 1 >= argc) {
        std::cerr << "Error: " << arg << " requires a value\n";
        return false;
      }
      target = argv[++i];
      return true;
    };

    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      return 0;
    } else if (arg == "--version") {
      std::cout << "termctl " << termctl::version() << "\n";
      return 0;
    } else if (arg == "--config") {
      if (!take_value(config_file)) return 2;
    } else if (arg == "--workspace") {
      if (!take_value(workspace)) return 2;
    } else if (arg == "--shell") {
      if (!take_value(shell)) return 2;
    } else if (arg == "--log-level") {
      if (!take_value(log_level)) return 2;
    } else if (arg == "--log-file") {
      if (!take_value(log_file)) return 2;
    } else {
      std::cerr << "Error: unknown option " << arg << "\n";
      print_usage(argv[0]);
      return 2;
    }
  }

  // ===== 加载配置：文件 < 环境变量 < 命令行 =====
  Config config = config_file ? Config::load(*config_file) : Config::load_default();
  config.apply_env();
  if (workspace) config.workspace_dir = std::filesystem::path(*workspace);
  if (shell) config.shell = *shell;
  if (log_level) config.log_level = *log_level;
  if (log_file) config.log_file = std::filesystem::path(*log_file);

  // ===== 初始化框架 =====
  termctl::init(config);

#ifndef _WIN32
  // A client that goes away must not kill the server mid-write
  std::signal(SIGPIPE, SIG_IGN);
#endif

  int code = 0;
  {
    auto session = Session::create(config);
    Dispatcher dispatcher(session);

    std::ios::sync_with_stdio(false);
    mcp::McpServer server(dispatcher, std::cin, std::cout, mcp::ServerInfo{"termctl", termctl::version()});
    code = server.run();
  }

  termctl::shutdown();
  return code;
}
