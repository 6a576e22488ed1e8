#include "config.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>

namespace termctl {

namespace fs = std::filesystem;

namespace {

int64_t clamp_timeout_seconds(int64_t seconds) {
  if (seconds > Config::kMaxTimeoutSeconds) {
    spdlog::warn("[Config] default timeout {}s exceeds {}s, clamping", seconds, Config::kMaxTimeoutSeconds);
    return Config::kMaxTimeoutSeconds;
  }
  return seconds;
}

size_t clamp_history_size(int64_t size) {
  if (size < static_cast<int64_t>(Config::kMinHistorySize)) return Config::kMinHistorySize;
  if (size > static_cast<int64_t>(Config::kMaxHistorySize)) return Config::kMaxHistorySize;
  return static_cast<size_t>(size);
}

std::optional<int64_t> parse_int(const char* text) {
  try {
    size_t consumed = 0;
    long long value = std::stoll(text, &consumed);
    if (consumed != std::string(text).size()) {
      return std::nullopt;
    }
    return static_cast<int64_t>(value);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

const char* non_empty_env(const char* name) {
  const char* value = std::getenv(name);
  if (value && *value) {
    return value;
  }
  return nullptr;
}

}  // namespace

Config Config::load(const fs::path& path) {
  Config config;

  if (!fs::exists(path)) {
    return config;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("[Config] Cannot open config file: {}", path.string());
    return config;
  }

  try {
    json j = json::parse(file);

    if (j.contains("workspace_dir") && j["workspace_dir"].is_string()) {
      config.workspace_dir = j["workspace_dir"].get<std::string>();
    }
    if (j.contains("shell") && j["shell"].is_string()) {
      config.shell = j["shell"].get<std::string>();
    }

    config.history_size = clamp_history_size(j.value("history_size", int64_t(100)));

    // Execution settings
    config.execution.default_timeout_seconds = j.value("default_timeout_seconds", int64_t(30));
    if (config.execution.default_timeout_seconds <= 0) {
      config.execution.default_timeout_seconds = 30;
    }
    config.execution.default_timeout_seconds = clamp_timeout_seconds(config.execution.default_timeout_seconds);
    config.execution.max_output_bytes = j.value("max_output_bytes", size_t(1024 * 1024));
    config.execution.kill_grace_ms = j.value("kill_grace_ms", int64_t(500));
    config.execution.worker_threads = std::max<size_t>(1, j.value("worker_threads", size_t(4)));

    config.log_level = j.value("log_level", "info");
    if (j.contains("log_file") && j["log_file"].is_string()) {
      config.log_file = j["log_file"].get<std::string>();
    }

  } catch (const std::exception& e) {
    spdlog::warn("[Config] Failed to parse {}: {}", path.string(), e.what());
    return Config{};
  }

  return config;
}

Config Config::load_default() {
  // Try to load from project config first, then global
  auto project_config = config_paths::project_config_file();
  if (fs::exists(project_config)) {
    return load(project_config);
  }

  auto global_config = config_paths::default_config_file();
  if (fs::exists(global_config)) {
    return load(global_config);
  }

  return Config{};
}

Config Config::from_env() {
  Config config = load_default();
  config.apply_env();
  return config;
}

void Config::apply_env() {
  if (const char* value = non_empty_env("TERMCTL_SHELL")) {
    shell = value;
  }

  // MCP_WORKSPACE_DIR is what earlier launch scripts export
  const char* workspace = non_empty_env("TERMCTL_WORKSPACE_DIR");
  if (!workspace) {
    workspace = non_empty_env("MCP_WORKSPACE_DIR");
  }
  if (workspace) {
    workspace_dir = fs::path(workspace);
  }

  if (const char* value = non_empty_env("TERMCTL_HISTORY_SIZE")) {
    if (auto size = parse_int(value)) {
      history_size = clamp_history_size(*size);
    } else {
      spdlog::warn("[Config] Ignoring non-numeric TERMCTL_HISTORY_SIZE: {}", value);
    }
  }

  if (const char* value = non_empty_env("TERMCTL_TIMEOUT")) {
    auto seconds = parse_int(value);
    if (seconds && *seconds > 0) {
      execution.default_timeout_seconds = clamp_timeout_seconds(*seconds);
    } else {
      spdlog::warn("[Config] Ignoring invalid TERMCTL_TIMEOUT: {}", value);
    }
  }

  if (const char* value = non_empty_env("TERMCTL_LOG_LEVEL")) {
    log_level = value;
  }
  if (const char* value = non_empty_env("TERMCTL_LOG_FILE")) {
    log_file = fs::path(value);
  }
}

json Config::to_json() const {
  json j;
  if (workspace_dir) {
    j["workspace_dir"] = workspace_dir->string();
  }
  if (shell) {
    j["shell"] = *shell;
  }
  j["history_size"] = history_size;
  j["default_timeout_seconds"] = execution.default_timeout_seconds;
  j["max_output_bytes"] = execution.max_output_bytes;
  j["kill_grace_ms"] = execution.kill_grace_ms;
  j["worker_threads"] = execution.worker_threads;
  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }
  return j;
}

void Config::save(const fs::path& path) const {
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
  }

  std::ofstream file(path);
  if (!file.is_open()) {
    spdlog::warn("[Config] Cannot write config file: {}", path.string());
    return;
  }
  file << to_json().dump(2);
}

namespace config_paths {

fs::path home_dir() {
  const char* home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
#ifdef _WIN32
  const char* userprofile = std::getenv("USERPROFILE");
  if (userprofile) {
    return fs::path(userprofile);
  }
#endif
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "termctl";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

fs::path project_config_file() {
  return fs::current_path() / ".termctl" / "config.json";
}

}  // namespace config_paths

}  // namespace termctl
