#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include "types.hpp"

namespace termctl {

// Application configuration
struct Config {
  // Workspace root override (skips marker detection when set)
  std::optional<std::filesystem::path> workspace_dir;

  // Shell executable override (skips shell auto-detection when set)
  std::optional<std::string> shell;

  // Command history capacity
  size_t history_size = 100;

  // Execution settings
  struct ExecutionSettings {
    int64_t default_timeout_seconds = 30;
    size_t max_output_bytes = 1024 * 1024;  // Per stream
    int64_t kill_grace_ms = 500;
    size_t worker_threads = 4;
  } execution;

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  static constexpr size_t kMinHistorySize = 1;
  static constexpr size_t kMaxHistorySize = 10000;
  static constexpr int64_t kMaxTimeoutSeconds = 24 * 60 * 60;

  // Load from file
  static Config load(const std::filesystem::path& path);

  // Load default config from project/global config files
  static Config load_default();

  // Load config from environment variables, with file config as base
  // Reads: TERMCTL_SHELL, TERMCTL_WORKSPACE_DIR (or legacy MCP_WORKSPACE_DIR),
  //        TERMCTL_HISTORY_SIZE, TERMCTL_TIMEOUT, TERMCTL_LOG_LEVEL, TERMCTL_LOG_FILE
  static Config from_env();

  // Apply environment overrides on top of this config
  void apply_env();

  // Save to file
  void save(const std::filesystem::path& path) const;

  json to_json() const;
};

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();

std::filesystem::path config_dir();

std::filesystem::path default_config_file();

std::filesystem::path project_config_file();
}  // namespace config_paths

}  // namespace termctl
