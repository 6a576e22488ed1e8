#include "shell/shell.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace termctl {

namespace fs = std::filesystem;

namespace {

std::optional<std::string> env_value(const char* name) {
  const char* value = std::getenv(name);
  if (value && *value) {
    return std::string(value);
  }
  return std::nullopt;
}

std::string lower_stem(const std::string& executable) {
  // Handle both separators regardless of the host platform
  auto pos = executable.find_last_of("/\\");
  std::string name = pos == std::string::npos ? executable : executable.substr(pos + 1);
  std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (name.size() > 4 && name.compare(name.size() - 4, 4, ".exe") == 0) {
    name.resize(name.size() - 4);
  }
  return name;
}

}  // namespace

std::string to_string(Platform platform) {
  switch (platform) {
    case Platform::Posix:
      return "posix";
    case Platform::Windows:
      return "windows";
  }
  return "posix";
}

Platform current_platform() {
#ifdef _WIN32
  return Platform::Windows;
#else
  return Platform::Posix;
#endif
}

std::string to_string(ShellKind kind) {
  switch (kind) {
    case ShellKind::Posix:
      return "posix";
    case ShellKind::GitBash:
      return "git-bash";
    case ShellKind::Cmd:
      return "cmd";
    case ShellKind::Override:
      return "override";
  }
  return "posix";
}

std::vector<std::string> ShellConfig::argv(const std::string& command) const {
  return {executable, flag, command};
}

json ShellConfig::to_json() const {
  return {{"executable", executable}, {"flag", flag}, {"platform", to_string(platform)}, {"kind", to_string(kind)}};
}

ShellEnvironment ShellEnvironment::from_process(std::optional<std::string> override_shell) {
  ShellEnvironment env;
  env.override_shell = std::move(override_shell);
  env.home = env_value("USERPROFILE");
  if (!env.home) {
    env.home = env_value("HOME");
  }
  env.local_appdata = env_value("LOCALAPPDATA");
  env.comspec = env_value("COMSPEC");
  return env;
}

std::string shell_flag_for(const std::string& executable) {
  auto name = lower_stem(executable);
  if (name == "cmd") return "/C";
  if (name == "powershell" || name == "pwsh") return "-Command";
  return "-c";
}

const std::vector<std::string>& posix_shell_candidates() {
  static const std::vector<std::string> candidates = {"/bin/bash", "/usr/bin/bash", "/bin/sh", "/usr/bin/sh"};
  return candidates;
}

std::vector<fs::path> git_bash_candidates(const ShellEnvironment& env) {
  std::vector<fs::path> candidates = {
      "C:/Program Files/Git/bin/bash.exe",
      "C:/Program Files (x86)/Git/bin/bash.exe",
  };
  if (env.local_appdata) {
    candidates.push_back(fs::path(*env.local_appdata) / "Programs" / "Git" / "bin" / "bash.exe");
  } else if (env.home) {
    candidates.push_back(fs::path(*env.home) / "AppData" / "Local" / "Programs" / "Git" / "bin" / "bash.exe");
  }
  return candidates;
}

Result<ShellConfig> select_shell(Platform platform, const ShellEnvironment& env) {
  auto exists = env.exists;
  if (!exists) {
    exists = [](const fs::path& p) {
      std::error_code ec;
      return fs::exists(p, ec);
    };
  }

  // An explicit override always wins, even if it cannot be found here: it may be
  // a bare name resolved through PATH at spawn time.
  if (env.override_shell && !env.override_shell->empty()) {
    ShellConfig config{*env.override_shell, shell_flag_for(*env.override_shell), platform, ShellKind::Override};
    spdlog::info("[Shell] Using configured shell: {} {}", config.executable, config.flag);
    return Result<ShellConfig>::success(config);
  }

  if (platform == Platform::Posix) {
    for (const auto& candidate : posix_shell_candidates()) {
      if (exists(candidate)) {
        spdlog::debug("[Shell] Selected POSIX shell: {}", candidate);
        return Result<ShellConfig>::success(ShellConfig{candidate, "-c", platform, ShellKind::Posix});
      }
    }
    return Result<ShellConfig>::failure(ErrorCode::ShellUnavailable, "No POSIX shell found (tried /bin/bash, /usr/bin/bash, /bin/sh, /usr/bin/sh)");
  }

  for (const auto& candidate : git_bash_candidates(env)) {
    if (exists(candidate)) {
      spdlog::info("[Shell] Git Bash detected: {}", candidate.string());
      return Result<ShellConfig>::success(ShellConfig{candidate.string(), "-c", platform, ShellKind::GitBash});
    }
  }

  std::string cmd = env.comspec ? *env.comspec : "C:\\Windows\\System32\\cmd.exe";
  if (exists(cmd)) {
    spdlog::info("[Shell] Git Bash not found, using native interpreter: {}", cmd);
    return Result<ShellConfig>::success(ShellConfig{cmd, "/C", platform, ShellKind::Cmd});
  }

  return Result<ShellConfig>::failure(ErrorCode::ShellUnavailable, "Neither Git Bash nor the command interpreter was found (" + cmd + ")");
}

}  // namespace termctl
