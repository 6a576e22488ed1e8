#include <spdlog/spdlog.h>

#include "builtins.hpp"
#include "session/session.hpp"

namespace termctl::tools {

namespace {

std::optional<std::string> optional_string(const json& args, const char* key) {
  auto it = args.find(key);
  if (it == args.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

}  // namespace

// ============================================================================
// ListDirectoryTool
// ============================================================================

ListDirectoryTool::ListDirectoryTool()
    : SimpleTool("list_directory", "List files and subdirectories of a directory (the current directory when no path is given).") {}

std::vector<ParameterSchema> ListDirectoryTool::parameters() const {
  return {{"path", "string", "Directory to list; relative paths resolve against the workspace root", false, std::nullopt, std::nullopt}};
}

std::future<ToolResult> ListDirectoryTool::execute(const json& args, const ToolContext& ctx) {
  return std::async(std::launch::async, [args, ctx]() -> ToolResult {
    auto& session = *ctx.session;
    auto path = optional_string(args, "path").value_or(session.current_directory().string());
    auto display = session.files().resolve(path).string();

    auto listed = session.files().list_directory(path);
    if (listed.failed()) {
      return ToolResult::error(*listed.error);
    }
    const auto& entries = *listed.value;

    json items = json::array();
    for (const auto& entry : entries) {
      items.push_back(entry.to_json());
    }
    json metadata = {{"path", display}, {"entries", items}};

    if (entries.empty()) {
      return ToolResult::success("Directory '" + display + "' is empty", std::move(metadata));
    }

    std::string dirs;
    std::string files;
    for (const auto& entry : entries) {
      if (entry.kind == EntryKind::Directory) {
        dirs += (dirs.empty() ? "" : "\n") + std::string("📁 ") + entry.name + "/";
      } else {
        files += (files.empty() ? "" : "\n") + std::string("📄 ") + entry.name;
      }
    }

    std::string output = "Contents of directory '" + display + "':\n\n";
    if (!dirs.empty()) {
      output += "Directories:\n" + dirs + "\n\n";
    }
    if (!files.empty()) {
      output += "Files:\n" + files;
    }
    return ToolResult::success(output, std::move(metadata));
  });
}

// ============================================================================
// ReadFileTool
// ============================================================================

ReadFileTool::ReadFileTool() : SimpleTool("read_file", "Read the content of a file.") {}

std::vector<ParameterSchema> ReadFileTool::parameters() const {
  return {{"path", "string", "File to read; relative paths resolve against the workspace root", true, std::nullopt, std::nullopt}};
}

std::future<ToolResult> ReadFileTool::execute(const json& args, const ToolContext& ctx) {
  return std::async(std::launch::async, [args, ctx]() -> ToolResult {
    const auto& files = ctx.session->files();
    auto path = args.at("path").get<std::string>();

    auto content = files.read(path);
    if (content.failed()) {
      return ToolResult::error(*content.error);
    }
    auto lines = LineBuffer::parse(*content.value).lines.size();
    return ToolResult::success(*content.value, {{"path", files.resolve(path).string()}, {"bytes", content.value->size()}, {"lines", lines}});
  });
}

// ============================================================================
// WriteFileTool
// ============================================================================

WriteFileTool::WriteFileTool() : SimpleTool("write_file", "Write content to a file, creating it and missing parent directories, or overwriting it.") {}

std::vector<ParameterSchema> WriteFileTool::parameters() const {
  return {{"path", "string", "File to write", true, std::nullopt, std::nullopt},
          {"content", "string", "Complete new content of the file", true, std::nullopt, std::nullopt}};
}

std::future<ToolResult> WriteFileTool::execute(const json& args, const ToolContext& ctx) {
  return std::async(std::launch::async, [args, ctx]() -> ToolResult {
    const auto& files = ctx.session->files();
    auto path = args.at("path").get<std::string>();

    auto written = files.write(path, args.at("content").get<std::string>());
    if (written.failed()) {
      return ToolResult::error(*written.error);
    }
    return ToolResult::success("Successfully wrote " + std::to_string(*written.value) + " bytes to '" + path + "'.",
                               {{"path", files.resolve(path).string()}, {"bytes", *written.value}});
  });
}

// ============================================================================
// DeleteFileTool
// ============================================================================

DeleteFileTool::DeleteFileTool() : SimpleTool("delete_file", "Delete a file. Directories are refused.") {}

std::vector<ParameterSchema> DeleteFileTool::parameters() const {
  return {{"path", "string", "File to delete", true, std::nullopt, std::nullopt}};
}

std::future<ToolResult> DeleteFileTool::execute(const json& args, const ToolContext& ctx) {
  return std::async(std::launch::async, [args, ctx]() -> ToolResult {
    auto path = args.at("path").get<std::string>();

    auto removed = ctx.session->files().remove(path);
    if (removed.failed()) {
      return ToolResult::error(*removed.error);
    }
    return ToolResult::success("Successfully deleted file '" + path + "'.", {{"path", removed.value->string()}});
  });
}

// ============================================================================
// InsertFileContentTool
// ============================================================================

InsertFileContentTool::InsertFileContentTool()
    : SimpleTool("insert_file_content", "Insert content before a 1-based line of a file; appends when no line is given.") {}

std::vector<ParameterSchema> InsertFileContentTool::parameters() const {
  return {{"path", "string", "File to modify", true, std::nullopt, std::nullopt},
          {"content", "string", "Content to insert; may span several lines", true, std::nullopt, std::nullopt},
          {"line", "integer", "1-based line to insert before; line count + 1 appends", false, std::nullopt, std::nullopt}};
}

std::future<ToolResult> InsertFileContentTool::execute(const json& args, const ToolContext& ctx) {
  return std::async(std::launch::async, [args, ctx]() -> ToolResult {
    const auto& files = ctx.session->files();
    auto path = args.at("path").get<std::string>();
    std::optional<int64_t> line;
    if (args.contains("line") && !args["line"].is_null()) {
      line = args["line"].get<int64_t>();
    }

    auto inserted = files.insert_at(path, line, args.at("content").get<std::string>());
    if (inserted.failed()) {
      return ToolResult::error(*inserted.error);
    }
    return ToolResult::success("Successfully inserted content at line " + std::to_string(*inserted.value) + " in '" + path + "'.",
                               {{"path", files.resolve(path).string()}, {"line", *inserted.value}});
  });
}

// ============================================================================
// UpdateFileContentTool
// ============================================================================

UpdateFileContentTool::UpdateFileContentTool()
    : SimpleTool("update_file_content",
                 "Replace an inclusive 1-based line range of a file. Empty content deletes the range; with substring set, only "
                 "occurrences of it inside the range are replaced.") {}

std::vector<ParameterSchema> UpdateFileContentTool::parameters() const {
  return {{"path", "string", "File to modify", true, std::nullopt, std::nullopt},
          {"start_line", "integer", "First line of the range (1-based)", true, std::nullopt, std::nullopt},
          {"end_line", "integer", "Last line of the range, inclusive", true, std::nullopt, std::nullopt},
          {"content", "string", "Replacement text", true, std::nullopt, std::nullopt},
          {"substring", "string", "Only replace this text within the range", false, std::nullopt, std::nullopt}};
}

std::future<ToolResult> UpdateFileContentTool::execute(const json& args, const ToolContext& ctx) {
  return std::async(std::launch::async, [args, ctx]() -> ToolResult {
    const auto& files = ctx.session->files();
    auto path = args.at("path").get<std::string>();
    auto substring = optional_string(args, "substring");

    auto updated = files.update_range(path, args.at("start_line").get<int64_t>(), args.at("end_line").get<int64_t>(),
                                      args.at("content").get<std::string>(), substring);
    if (updated.failed()) {
      return ToolResult::error(*updated.error);
    }

    json metadata = {{"path", files.resolve(path).string()}, {"replacements", *updated.value}};
    if (substring) {
      return ToolResult::success(
          "Successfully updated substring in '" + path + "' (" + std::to_string(*updated.value) + " replacements).", std::move(metadata));
    }
    return ToolResult::success("Successfully updated content in '" + path + "'.", std::move(metadata));
  });
}

}  // namespace termctl::tools
