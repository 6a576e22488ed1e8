#include "session/session.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "workspace/workspace.hpp"

namespace termctl {

namespace fs = std::filesystem;

namespace {

ExecutorOptions executor_options(const Config& config) {
  ExecutorOptions options;
  // Clamped before converting so the millisecond count cannot overflow
  auto seconds = std::clamp<int64_t>(config.execution.default_timeout_seconds, 1, Config::kMaxTimeoutSeconds);
  options.default_timeout = std::chrono::seconds(seconds);
  options.max_output_bytes = config.execution.max_output_bytes;
  options.kill_grace = Duration(config.execution.kill_grace_ms);
  return options;
}

}  // namespace

Session::Session(const Config& config, fs::path workspace_root, Result<ShellConfig> shell)
    : config_(config),
      workspace_root_(std::move(workspace_root)),
      shell_(std::move(shell)),
      history_(config.history_size),
      executor_(executor_options(config)),
      files_(workspace_root_) {}

std::shared_ptr<Session> Session::create(const Config& config, const fs::path& start_path) {
  return create(config, start_path, ShellEnvironment::from_process(config.shell));
}

std::shared_ptr<Session> Session::create(const Config& config, const fs::path& start_path, const ShellEnvironment& shell_env) {
  auto root = workspace::resolve_root(config.workspace_dir, start_path);
  auto shell = select_shell(current_platform(), shell_env);
  if (shell.failed()) {
    // Not fatal: file tools keep working, execute_command reports the error
    spdlog::error("[Session] {}", shell.error->message);
  }

  auto session = std::shared_ptr<Session>(new Session(config, root, std::move(shell)));
  spdlog::info("[Session] Created: root={}, history_size={}", session->workspace_root_.string(), session->history_.capacity());
  return session;
}

fs::path Session::current_directory() const {
  std::lock_guard lock(cwd_mutex_);
  return cwd_override_.value_or(workspace_root_);
}

Result<fs::path> Session::resolve_directory(const std::string& path) const {
  auto target = files_.resolve(path);

  std::error_code ec;
  auto status = fs::status(target, ec);
  if (status.type() == fs::file_type::not_found) {
    if (fs::is_directory(target.parent_path(), ec)) {
      return Result<fs::path>::failure(ErrorCode::NotFound, "Directory '" + path + "' does not exist");
    }
    return Result<fs::path>::failure(ErrorCode::NotADirectory, "'" + path + "' is not a directory");
  }
  if (ec) {
    return Result<fs::path>::failure(filesystem_error(ec, "Cannot access directory '" + path + "'"));
  }
  if (!fs::is_directory(status)) {
    return Result<fs::path>::failure(ErrorCode::NotADirectory, "'" + path + "' is not a directory");
  }

  auto canonical = fs::weakly_canonical(target, ec);
  return Result<fs::path>::success(ec ? target : canonical);
}

Result<fs::path> Session::change_directory(const std::string& path) {
  auto dir = resolve_directory(path);
  if (dir.failed()) {
    spdlog::debug("[Session] change_directory({}) failed: {}", path, dir.error->message);
    return dir;
  }

  {
    std::lock_guard lock(cwd_mutex_);
    cwd_override_ = *dir.value;
  }
  spdlog::info("[Session] Switched to directory: {}", dir.value->string());
  return dir;
}

Result<CommandResult> Session::run_command(const CommandRequest& request, const ProcessExecutor::StateObserver& observer) const {
  if (shell_.failed()) {
    return Result<CommandResult>::failure(*shell_.error);
  }
  return Result<CommandResult>::success(executor_.execute(request, *shell_.value, current_directory(), observer));
}

}  // namespace termctl
