#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace termctl::workspace {

// Project root indicators in order of preference
const std::vector<std::string>& project_markers();

// First marker found directly inside dir, if any
std::optional<std::string> find_marker(const std::filesystem::path& dir);

// Walk upward from start_path and return the closest directory containing a
// project marker. Falls back to start_path (made absolute) when none is found.
// A start_path naming a file is treated as its parent directory.
std::filesystem::path resolve(const std::filesystem::path& start_path);

// Session workspace root: the override when it names an existing directory,
// otherwise resolve(start_path). Always returns an existing directory.
std::filesystem::path resolve_root(const std::optional<std::filesystem::path>& override_dir, const std::filesystem::path& start_path);

}  // namespace termctl::workspace
