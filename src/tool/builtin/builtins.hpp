#pragma once

#include "tool/tool.hpp"

namespace termctl::tools {

// execute_command - run a shell command in the session's working directory
class ExecuteCommandTool : public SimpleTool {
 public:
  ExecuteCommandTool();

  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json& args, const ToolContext& ctx) override;
};

// get_command_history - recent executions, most recent first
class CommandHistoryTool : public SimpleTool {
 public:
  CommandHistoryTool();

  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json& args, const ToolContext& ctx) override;
};

// get_current_directory
class CurrentDirectoryTool : public SimpleTool {
 public:
  CurrentDirectoryTool();

  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json& args, const ToolContext& ctx) override;
};

// change_directory - set the working directory used by later commands
class ChangeDirectoryTool : public SimpleTool {
 public:
  ChangeDirectoryTool();

  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json& args, const ToolContext& ctx) override;
};

// list_directory
class ListDirectoryTool : public SimpleTool {
 public:
  ListDirectoryTool();

  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json& args, const ToolContext& ctx) override;
};

// read_file
class ReadFileTool : public SimpleTool {
 public:
  ReadFileTool();

  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json& args, const ToolContext& ctx) override;
};

// write_file - create or overwrite
class WriteFileTool : public SimpleTool {
 public:
  WriteFileTool();

  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json& args, const ToolContext& ctx) override;
};

// delete_file
class DeleteFileTool : public SimpleTool {
 public:
  DeleteFileTool();

  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json& args, const ToolContext& ctx) override;
};

// insert_file_content - insert before a 1-based line
class InsertFileContentTool : public SimpleTool {
 public:
  InsertFileContentTool();

  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json& args, const ToolContext& ctx) override;
};

// update_file_content - replace an inclusive line range
class UpdateFileContentTool : public SimpleTool {
 public:
  UpdateFileContentTool();

  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json& args, const ToolContext& ctx) override;
};

// Register all builtin tools
void register_builtins(ToolRegistry& registry = ToolRegistry::instance());

}  // namespace termctl::tools
