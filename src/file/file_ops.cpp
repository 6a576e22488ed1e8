#include "file/file_ops.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

#ifdef _WIN32
#include <process.h>
#else
#include <unistd.h>
#endif

namespace termctl {

namespace fs = std::filesystem;

namespace {

std::atomic<uint64_t> g_temp_counter{0};

int process_id() {
#ifdef _WIN32
  return _getpid();
#else
  return static_cast<int>(::getpid());
#endif
}

// Unique per process and per call, so concurrent writers never share a temp file
fs::path temp_sibling(const fs::path& target) {
  auto name = "." + target.filename().string() + ".tmp." + std::to_string(process_id()) + "." + std::to_string(g_temp_counter.fetch_add(1));
  return target.parent_path() / name;
}

std::error_code last_errno() {
  int err = errno;
  return std::error_code(err != 0 ? err : EIO, std::generic_category());
}

std::optional<Error> atomic_write(const fs::path& target, const std::string& content) {
  auto tmp_path = temp_sibling(target);
  {
    std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      return filesystem_error(last_errno(), "Cannot write '" + target.string() + "'");
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.flush();
    if (!file) {
      auto ec = last_errno();
      file.close();
      std::error_code ignored;
      fs::remove(tmp_path, ignored);
      return filesystem_error(ec, "Failed to write temp file " + tmp_path.string());
    }
  }

  std::error_code ec;
  auto existing = fs::status(target, ec);
  if (!ec && fs::is_regular_file(existing)) {
    fs::permissions(tmp_path, existing.permissions(), ec);
  }

  fs::rename(tmp_path, target, ec);
  if (ec) {
    spdlog::warn("[FileOps] Failed to rename temp file {} -> {}: {}", tmp_path.string(), target.string(), ec.message());
    std::error_code ignored;
    fs::remove(tmp_path, ignored);
    return filesystem_error(ec, "Cannot replace '" + target.string() + "'");
  }
  return std::nullopt;
}

Result<std::string> read_all(const fs::path& target, const std::string& display) {
  std::ifstream file(target, std::ios::binary);
  if (!file.is_open()) {
    return Result<std::string>::failure(filesystem_error(last_errno(), "Cannot read file '" + display + "'"));
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return Result<std::string>::failure(ErrorCode::IoError, "Error reading file '" + display + "'");
  }
  return Result<std::string>::success(buffer.str());
}

// Status of an existing regular file, or the error describing why it is not one
std::optional<Error> require_file(const fs::path& target, const std::string& display) {
  std::error_code ec;
  auto status = fs::status(target, ec);
  if (status.type() == fs::file_type::not_found) {
    return Error{ErrorCode::NotFound, "File '" + display + "' does not exist"};
  }
  if (ec) {
    return filesystem_error(ec, "Cannot access '" + display + "'");
  }
  if (fs::is_directory(status)) {
    return Error{ErrorCode::NotAFile, "'" + display + "' is not a file"};
  }
  return std::nullopt;
}

std::string out_of_range(const std::string& what, size_t line_count) {
  return what + " is out of range (file has " + std::to_string(line_count) + " lines)";
}

}  // namespace

std::string to_string(EntryKind kind) {
  return kind == EntryKind::Directory ? "directory" : "file";
}

Error filesystem_error(const std::error_code& ec, const std::string& what) {
  ErrorCode code = ErrorCode::IoError;
  if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
    code = ErrorCode::PermissionDenied;
  } else if (ec == std::errc::no_such_file_or_directory) {
    code = ErrorCode::NotFound;
  } else if (ec == std::errc::is_a_directory) {
    code = ErrorCode::NotAFile;
  } else if (ec == std::errc::not_a_directory) {
    code = ErrorCode::NotADirectory;
  }
  return Error{code, what + ": " + ec.message()};
}

LineBuffer LineBuffer::parse(const std::string& text) {
  LineBuffer buffer;
  if (text.empty()) {
    return buffer;
  }
  size_t begin = 0;
  while (begin < text.size()) {
    size_t end = text.find('\n', begin);
    if (end == std::string::npos) {
      buffer.lines.push_back(text.substr(begin));
      return buffer;
    }
    buffer.lines.push_back(text.substr(begin, end - begin));
    begin = end + 1;
  }
  buffer.trailing_newline = true;
  return buffer;
}

std::string LineBuffer::join() const {
  std::string text;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) text += '\n';
    text += lines[i];
  }
  if (trailing_newline && !lines.empty()) {
    text += '\n';
  }
  return text;
}

FileOperations::FileOperations(fs::path root) : root_(std::move(root)) {}

fs::path FileOperations::resolve(const std::string& path) const {
  fs::path p(path);
  if (p.is_absolute()) {
    return p.lexically_normal();
  }
  return (root_ / p).lexically_normal();
}

Result<std::string> FileOperations::read(const std::string& path) const {
  auto target = resolve(path);
  if (auto err = require_file(target, path)) {
    return Result<std::string>::failure(*err);
  }
  return read_all(target, path);
}

Result<size_t> FileOperations::write(const std::string& path, const std::string& content) const {
  auto target = resolve(path);

  std::error_code ec;
  if (fs::is_directory(target, ec)) {
    return Result<size_t>::failure(ErrorCode::NotAFile, "'" + path + "' is a directory");
  }

#ifndef _WIN32
  // Renaming over a read-only file would succeed; refuse it like an in-place write would
  if (fs::exists(target, ec) && ::access(target.c_str(), W_OK) != 0) {
    return Result<size_t>::failure(filesystem_error(last_errno(), "No permission to write to file '" + path + "'"));
  }
#endif

  auto parent = target.parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent, ec);
    if (ec) {
      return Result<size_t>::failure(filesystem_error(ec, "Cannot create directory '" + parent.string() + "'"));
    }
  }

  if (auto err = atomic_write(target, content)) {
    return Result<size_t>::failure(*err);
  }
  spdlog::debug("[FileOps] Wrote {} bytes to {}", content.size(), target.string());
  return Result<size_t>::success(content.size());
}

Result<fs::path> FileOperations::remove(const std::string& path) const {
  auto target = resolve(path);
  if (auto err = require_file(target, path)) {
    return Result<fs::path>::failure(*err);
  }

  std::error_code ec;
  if (!fs::remove(target, ec) || ec) {
    if (!ec) {
      return Result<fs::path>::failure(ErrorCode::NotFound, "File '" + path + "' does not exist");
    }
    return Result<fs::path>::failure(filesystem_error(ec, "Cannot delete file '" + path + "'"));
  }
  spdlog::debug("[FileOps] Deleted {}", target.string());
  return Result<fs::path>::success(target);
}

Result<LineBuffer> FileOperations::load_lines(const fs::path& target, const std::string& display) const {
  if (auto err = require_file(target, display)) {
    return Result<LineBuffer>::failure(*err);
  }
  auto content = read_all(target, display);
  if (content.failed()) {
    return Result<LineBuffer>::failure(*content.error);
  }
  return Result<LineBuffer>::success(LineBuffer::parse(*content.value));
}

Result<size_t> FileOperations::insert_at(const std::string& path, std::optional<int64_t> line, const std::string& content) const {
  auto target = resolve(path);
  auto loaded = load_lines(target, path);
  if (loaded.failed()) {
    return Result<size_t>::failure(*loaded.error);
  }

  LineBuffer buffer = std::move(*loaded.value);
  const size_t count = buffer.lines.size();
  int64_t at = line.value_or(static_cast<int64_t>(count) + 1);
  if (at < 1 || at > static_cast<int64_t>(count) + 1) {
    return Result<size_t>::failure(ErrorCode::OutOfRange, out_of_range("Line " + std::to_string(at), count));
  }

  auto inserted = LineBuffer::parse(content).lines;
  if (inserted.empty()) {
    inserted.emplace_back();
  }
  buffer.lines.insert(buffer.lines.begin() + (at - 1), inserted.begin(), inserted.end());
  if (count == 0) {
    buffer.trailing_newline = true;
  }

  if (auto err = atomic_write(target, buffer.join())) {
    return Result<size_t>::failure(*err);
  }
  return Result<size_t>::success(static_cast<size_t>(at));
}

Result<size_t> FileOperations::update_range(const std::string& path, int64_t start, int64_t end, const std::string& content,
                                            const std::optional<std::string>& substring) const {
  auto target = resolve(path);
  auto loaded = load_lines(target, path);
  if (loaded.failed()) {
    return Result<size_t>::failure(*loaded.error);
  }

  LineBuffer buffer = std::move(*loaded.value);
  const size_t count = buffer.lines.size();
  if (start < 1 || start > static_cast<int64_t>(count)) {
    return Result<size_t>::failure(ErrorCode::OutOfRange, out_of_range("Start line " + std::to_string(start), count));
  }
  if (end < start || end > static_cast<int64_t>(count)) {
    return Result<size_t>::failure(ErrorCode::OutOfRange,
                                   out_of_range("Line range " + std::to_string(start) + "-" + std::to_string(end), count));
  }

  auto first = buffer.lines.begin() + (start - 1);
  auto last = buffer.lines.begin() + end;
  size_t replaced = 0;

  if (substring) {
    if (substring->empty()) {
      return Result<size_t>::failure(ErrorCode::InvalidArgument, "substring must not be empty");
    }
    for (auto it = first; it != last; ++it) {
      size_t pos = 0;
      while ((pos = it->find(*substring, pos)) != std::string::npos) {
        it->replace(pos, substring->size(), content);
        pos += content.size();
        ++replaced;
      }
    }
    if (replaced == 0) {
      return Result<size_t>::failure(ErrorCode::NotFound, "Substring '" + *substring + "' not found in lines " + std::to_string(start) +
                                                              "-" + std::to_string(end));
    }
  } else {
    replaced = static_cast<size_t>(end - start + 1);
    auto replacement = content.empty() ? std::vector<std::string>{} : LineBuffer::parse(content).lines;
    auto pos = buffer.lines.erase(first, last);
    buffer.lines.insert(pos, replacement.begin(), replacement.end());
  }

  if (auto err = atomic_write(target, buffer.join())) {
    return Result<size_t>::failure(*err);
  }
  return Result<size_t>::success(replaced);
}

Result<std::vector<DirectoryEntry>> FileOperations::list_directory(const std::string& path) const {
  using ListResult = Result<std::vector<DirectoryEntry>>;
  auto target = resolve(path);

  std::error_code ec;
  auto status = fs::status(target, ec);
  if (status.type() == fs::file_type::not_found) {
    return ListResult::failure(ErrorCode::NotFound, "Directory '" + path + "' does not exist");
  }
  if (ec) {
    return ListResult::failure(filesystem_error(ec, "Cannot access '" + path + "'"));
  }
  if (!fs::is_directory(status)) {
    return ListResult::failure(ErrorCode::NotADirectory, "'" + path + "' is not a directory");
  }

  std::vector<DirectoryEntry> entries;
  fs::directory_iterator it(target, ec);
  if (ec) {
    return ListResult::failure(filesystem_error(ec, "Cannot list directory '" + path + "'"));
  }
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      return ListResult::failure(filesystem_error(ec, "Error listing directory '" + path + "'"));
    }
    std::error_code kind_ec;
    auto kind = it->is_directory(kind_ec) ? EntryKind::Directory : EntryKind::File;
    entries.push_back({it->path().filename().string(), kind});
  }
  if (ec) {
    return ListResult::failure(filesystem_error(ec, "Error listing directory '" + path + "'"));
  }

  std::sort(entries.begin(), entries.end(), [](const DirectoryEntry& a, const DirectoryEntry& b) {
    if (a.kind != b.kind) return a.kind == EntryKind::Directory;
    return a.name < b.name;
  });
  return ListResult::success(std::move(entries));
}

}  // namespace termctl
