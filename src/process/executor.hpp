#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "core/types.hpp"
#include "shell/shell.hpp"

namespace termctl {

// Terminal status of one command invocation
enum class CommandStatus {
  Completed,  // Exited on its own; exit_code holds the code, zero or not
  TimedOut,   // Killed at the deadline; exit_code is absent
  Failed      // Could not be spawned at all
};

std::string to_string(CommandStatus status);

// Lifecycle of a single invocation:
// Created -> Spawning -> Running -> {Completed, TimedOut, SpawnFailed} -> Reaped
enum class ProcessState { Created, Spawning, Running, Completed, TimedOut, SpawnFailed, Reaped };

std::string to_string(ProcessState state);

struct CommandRequest {
  std::string command;
  std::optional<std::filesystem::path> working_dir;
  std::optional<Duration> timeout;

  json to_json() const;
};

struct CommandResult {
  std::string stdout_text;
  std::string stderr_text;
  std::optional<int> exit_code;
  Duration elapsed{0};
  CommandStatus status = CommandStatus::Failed;
  bool truncated = false;
  std::optional<std::string> error;  // Why spawning failed, or a reap problem

  bool success() const {
    return status == CommandStatus::Completed && exit_code == 0;
  }

  json to_json() const;
};

// Longest timeout honoured; longer ones are clamped to it
inline constexpr Duration kMaxTimeout = std::chrono::hours(24);

struct ExecutorOptions {
  Duration default_timeout = std::chrono::seconds(30);
  size_t max_output_bytes = 1024 * 1024;  // Per stream
  Duration kill_grace = std::chrono::milliseconds(500);
  Duration poll_interval = std::chrono::milliseconds(50);
};

// Bounded capture of one output stream. Bytes past the limit are counted and
// dropped so the pipe keeps draining.
class OutputCapture {
 public:
  explicit OutputCapture(size_t limit) : limit_(limit) {}

  void append(const char* data, size_t size);

  bool truncated() const {
    return dropped_ > 0;
  }

  size_t dropped() const {
    return dropped_;
  }

  // Captured text, with a truncation marker when bytes were dropped
  std::string finish() const;

 private:
  size_t limit_;
  size_t dropped_ = 0;
  std::string data_;
};

// Spawns, supervises, times out and reaps one shell invocation per call.
// execute() is safe to call from several threads at once.
class ProcessExecutor {
 public:
  using StateObserver = std::function<void(ProcessState)>;

  explicit ProcessExecutor(ExecutorOptions options = {});

  CommandResult execute(const CommandRequest& request, const ShellConfig& shell, const std::filesystem::path& cwd,
                        const StateObserver& observer = nullptr) const;

  const ExecutorOptions& options() const {
    return options_;
  }

 private:
  CommandResult run(const std::string& command, const ShellConfig& shell, const std::filesystem::path& cwd, Duration timeout,
                    const StateObserver& notify) const;

  ExecutorOptions options_;
};

}  // namespace termctl
