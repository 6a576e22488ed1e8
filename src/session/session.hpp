#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "core/config.hpp"
#include "core/types.hpp"
#include "file/file_ops.hpp"
#include "history/history.hpp"
#include "process/executor.hpp"
#include "shell/shell.hpp"

namespace termctl {

// Session-scoped state shared by every tool call: the workspace root and shell
// chosen at startup, the working-directory override, the history log, the
// executor and the file operations. Tests build a fresh one per case.
class Session {
 public:
  // Factory method. start_path seeds workspace detection when the config has
  // no workspace override.
  static std::shared_ptr<Session> create(const Config& config, const std::filesystem::path& start_path = std::filesystem::current_path());

  // Same, with the shell selection inputs supplied by the caller
  static std::shared_ptr<Session> create(const Config& config, const std::filesystem::path& start_path, const ShellEnvironment& shell_env);

  const Config& config() const {
    return config_;
  }

  // Always an existing directory; fixed for the session
  const std::filesystem::path& workspace_root() const {
    return workspace_root_;
  }

  // The selected shell, or why none could be selected
  const Result<ShellConfig>& shell() const {
    return shell_;
  }

  // Working directory for commands: the override if one was set, else the root
  std::filesystem::path current_directory() const;

  // An existing directory named by path, relative ones resolved against the
  // workspace root. NotFound for a missing leaf under an existing directory,
  // NotADirectory when the path or one of its ancestors is not a directory.
  Result<std::filesystem::path> resolve_directory(const std::string& path) const;

  // On error the current directory is left unchanged
  Result<std::filesystem::path> change_directory(const std::string& path);

  // Runs one command in the request's working directory or the current one.
  // ShellUnavailable when no shell was found at startup.
  Result<CommandResult> run_command(const CommandRequest& request, const ProcessExecutor::StateObserver& observer = nullptr) const;

  HistoryLog& history() {
    return history_;
  }

  const HistoryLog& history() const {
    return history_;
  }

  const ProcessExecutor& executor() const {
    return executor_;
  }

  const FileOperations& files() const {
    return files_;
  }

 private:
  Session(const Config& config, std::filesystem::path workspace_root, Result<ShellConfig> shell);

  Config config_;
  std::filesystem::path workspace_root_;
  Result<ShellConfig> shell_;

  mutable std::mutex cwd_mutex_;
  std::optional<std::filesystem::path> cwd_override_;

  HistoryLog history_;
  ProcessExecutor executor_;
  FileOperations files_;
};

}  // namespace termctl
