#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace termctl {

enum class Platform { Posix, Windows };

std::string to_string(Platform platform);

// Platform this binary was built for
Platform current_platform();

// Closed set of shell strategies, chosen once per session
enum class ShellKind {
  Posix,     // /bin/bash or /bin/sh on POSIX systems
  GitBash,   // POSIX-compatible bash found at a known Windows install path
  Cmd,       // Windows native command interpreter
  Override,  // Explicitly configured executable
};

std::string to_string(ShellKind kind);

struct ShellConfig {
  std::string executable;
  std::string flag;  // "run a string as a command", e.g. "-c" or "/C"
  Platform platform = Platform::Posix;
  ShellKind kind = ShellKind::Posix;

  // Full argument vector for running command; the command is never split
  std::vector<std::string> argv(const std::string& command) const;

  json to_json() const;
};

// Inputs to shell selection besides the platform. Collected from the process
// environment by ShellEnvironment::from_process(); tests fill it by hand.
struct ShellEnvironment {
  std::optional<std::string> override_shell;
  std::optional<std::string> home;          // USERPROFILE / HOME
  std::optional<std::string> local_appdata;  // LOCALAPPDATA
  std::optional<std::string> comspec;        // COMSPEC

  using ExistsFn = std::function<bool(const std::filesystem::path&)>;
  ExistsFn exists;  // Defaults to std::filesystem::exists

  static ShellEnvironment from_process(std::optional<std::string> override_shell);
};

// Invocation flag conventionally understood by the named executable
std::string shell_flag_for(const std::string& executable);

// POSIX shells tried in order on Posix platforms
const std::vector<std::string>& posix_shell_candidates();

// Git Bash locations tried in order on Windows
std::vector<std::filesystem::path> git_bash_candidates(const ShellEnvironment& env);

// Deterministic selection: override, then the platform's candidates, then the
// native interpreter. ShellUnavailable when nothing usable exists.
Result<ShellConfig> select_shell(Platform platform, const ShellEnvironment& env);

}  // namespace termctl
