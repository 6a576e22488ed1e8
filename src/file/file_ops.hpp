#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace termctl {

enum class EntryKind { File, Directory };

std::string to_string(EntryKind kind);

struct DirectoryEntry {
  std::string name;
  EntryKind kind = EntryKind::File;

  json to_json() const {
    return {{"name", name}, {"kind", to_string(kind)}};
  }
};

// Text split on '\n'. A final newline does not start another line; an empty
// file has no lines.
struct LineBuffer {
  std::vector<std::string> lines;
  bool trailing_newline = false;

  static LineBuffer parse(const std::string& text);
  std::string join() const;
};

// File reads and writes against workspace-relative paths. Absolute paths are
// used as given; relative ones are joined to the root. Every write goes
// through a sibling temp file and a rename.
class FileOperations {
 public:
  explicit FileOperations(std::filesystem::path root);

  const std::filesystem::path& root() const {
    return root_;
  }

  std::filesystem::path resolve(const std::string& path) const;

  Result<std::string> read(const std::string& path) const;

  // Creates missing parent directories. Returns the number of bytes written.
  Result<size_t> write(const std::string& path, const std::string& content) const;

  // Regular files only; directories are NotAFile
  Result<std::filesystem::path> remove(const std::string& path) const;

  // Inserts before the 1-based line; line count + 1 (or no line) appends.
  // Returns the line the content now starts at.
  Result<size_t> insert_at(const std::string& path, std::optional<int64_t> line, const std::string& content) const;

  // Replaces lines start..end inclusive. Empty content deletes the range.
  // With substring set, only its occurrences inside the range are replaced.
  // Returns the number of replacements made (lines, or substring hits).
  Result<size_t> update_range(const std::string& path, int64_t start, int64_t end, const std::string& content,
                              const std::optional<std::string>& substring = std::nullopt) const;

  // Directories first, then files, each sorted by name
  Result<std::vector<DirectoryEntry>> list_directory(const std::string& path) const;

 private:
  Result<LineBuffer> load_lines(const std::filesystem::path& target, const std::string& display) const;

  std::filesystem::path root_;
};

// Maps a filesystem error onto the shared taxonomy
Error filesystem_error(const std::error_code& ec, const std::string& what);

}  // namespace termctl
