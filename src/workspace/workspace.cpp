#include "workspace/workspace.hpp"

#include <spdlog/spdlog.h>

namespace termctl::workspace {

namespace fs = std::filesystem;

namespace {

// Absolute, normalized form without requiring the path to exist
fs::path absolute_normal(const fs::path& path) {
  std::error_code ec;
  auto result = fs::weakly_canonical(fs::absolute(path, ec), ec);
  if (ec) {
    return fs::absolute(path).lexically_normal();
  }
  return result;
}

bool exists_as_directory(const fs::path& path) {
  std::error_code ec;
  return fs::is_directory(path, ec);
}

}  // namespace

const std::vector<std::string>& project_markers() {
  static const std::vector<std::string> markers = {
      ".git",              // Git repository
      "package.json",      // Node.js
      "pyproject.toml",    // Modern Python
      "setup.py",          // Python
      "Cargo.toml",        // Rust
      "go.mod",            // Go
      "pom.xml",           // Maven
      "build.gradle",      // Gradle
      "composer.json",     // PHP
      "Gemfile",           // Ruby
      "Rakefile",          // Ruby
      "Makefile",          // Make
      "CMakeLists.txt",    // CMake
      "requirements.txt",  // Python requirements
      "environment.yml",   // Conda
      ".vscode",           // VS Code workspace
      ".idea",             // IntelliJ workspace
  };
  return markers;
}

std::optional<std::string> find_marker(const fs::path& dir) {
  for (const auto& marker : project_markers()) {
    std::error_code ec;
    if (fs::exists(dir / marker, ec)) {
      return marker;
    }
  }
  return std::nullopt;
}

fs::path resolve(const fs::path& start_path) {
  fs::path start = absolute_normal(start_path);

  std::error_code ec;
  if (fs::exists(start, ec) && !fs::is_directory(start, ec)) {
    start = start.parent_path();
  }

  fs::path current = start;
  while (true) {
    if (auto marker = find_marker(current)) {
      spdlog::debug("[Workspace] Found marker '{}' in {}", *marker, current.string());
      return current;
    }
    auto parent = current.parent_path();
    if (parent == current || parent.empty()) break;  // Filesystem root
    current = parent;
  }

  spdlog::debug("[Workspace] No project marker above {}, using it as root", start.string());
  return start;
}

fs::path resolve_root(const std::optional<fs::path>& override_dir, const fs::path& start_path) {
  if (override_dir) {
    auto dir = absolute_normal(*override_dir);
    if (exists_as_directory(dir)) {
      spdlog::info("[Workspace] Using configured workspace: {}", dir.string());
      return dir;
    }
    spdlog::warn("[Workspace] Configured workspace is not a directory: {}, detecting instead", dir.string());
  }

  auto root = resolve(start_path);
  if (!exists_as_directory(root)) {
    // start_path did not exist at all
    root = fs::current_path();
  }
  spdlog::info("[Workspace] Workspace root: {}", root.string());
  return root;
}

}  // namespace termctl::workspace
