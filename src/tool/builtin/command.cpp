#include <spdlog/spdlog.h>

#include <cmath>
#include <iomanip>
#include <sstream>

#include "builtins.hpp"
#include "session/session.hpp"

namespace termctl::tools {

namespace {

std::string format_duration(Duration elapsed) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << static_cast<double>(elapsed.count()) / 1000.0 << "s";
  return out.str();
}

// Text layout of a finished command
std::string describe(const CommandResult& result, Duration timeout) {
  std::string output;
  auto duration = format_duration(result.elapsed);

  if (result.status == CommandStatus::TimedOut) {
    output = "Command timed out after " + format_duration(timeout) + " and was terminated (duration: " + duration + ")\n";
    if (!result.stdout_text.empty()) {
      output += "\nPartial output:\n" + result.stdout_text + "\n";
    }
    if (!result.stderr_text.empty()) {
      output += "\nError:\n" + result.stderr_text;
    }
    return output;
  }

  if (result.success()) {
    output = "Command executed successfully (duration: " + duration + ")\n\n";
    if (!result.stdout_text.empty()) {
      output += "Output:\n" + result.stdout_text + "\n";
    } else {
      output += "Command had no output.\n";
    }
    if (!result.stderr_text.empty()) {
      output += "\nWarnings/Info:\n" + result.stderr_text;
    }
    return output;
  }

  output = "Command execution failed (duration: " + duration + ")\n";
  if (!result.stdout_text.empty()) {
    output += "\nOutput:\n" + result.stdout_text + "\n";
  }
  if (!result.stderr_text.empty()) {
    output += "\nError:\n" + result.stderr_text;
  }
  output += "\nReturn code: " + (result.exit_code ? std::to_string(*result.exit_code) : std::string("unknown"));
  return output;
}

}  // namespace

// ============================================================================
// ExecuteCommandTool
// ============================================================================

ExecuteCommandTool::ExecuteCommandTool()
    : SimpleTool("execute_command",
                 "Execute a shell command in the current working directory and return its output, exit code and duration. "
                 "stdin is empty; the command is killed when the timeout elapses.") {}

std::vector<ParameterSchema> ExecuteCommandTool::parameters() const {
  return {{"command", "string", "Command line to execute, passed unchanged to the shell", true, std::nullopt, std::nullopt},
          {"timeout", "number", "Timeout in seconds, at most 86400", false, std::nullopt, std::nullopt},
          {"workdir", "string", "Directory to run the command in instead of the current directory", false, std::nullopt, std::nullopt}};
}

std::future<ToolResult> ExecuteCommandTool::execute(const json& args, const ToolContext& ctx) {
  return std::async(std::launch::async, [args, ctx]() -> ToolResult {
    auto& session = *ctx.session;

    CommandRequest request;
    request.command = args.at("command").get<std::string>();
    if (request.command.empty()) {
      return ToolResult::error(ErrorCode::InvalidArgument, "Command is required");
    }

    if (args.contains("timeout") && !args["timeout"].is_null()) {
      double seconds = args["timeout"].get<double>();
      if (!(seconds > 0) || !std::isfinite(seconds)) {
        return ToolResult::error(ErrorCode::InvalidArgument, "timeout must be a positive number of seconds");
      }
      const auto max_seconds = std::chrono::duration_cast<std::chrono::seconds>(kMaxTimeout).count();
      if (seconds > static_cast<double>(max_seconds)) {
        return ToolResult::error(ErrorCode::InvalidArgument, "timeout must not exceed " + std::to_string(max_seconds) + " seconds");
      }
      request.timeout = std::max<Duration>(Duration(1), Duration(static_cast<int64_t>(std::llround(seconds * 1000.0))));
    }

    if (args.contains("workdir") && !args["workdir"].is_null()) {
      auto dir = session.resolve_directory(args["workdir"].get<std::string>());
      if (dir.failed()) {
        return ToolResult::error(*dir.error);
      }
      request.working_dir = *dir.value;
    } else {
      // Pinned now so history records where the command actually ran
      request.working_dir = session.current_directory();
    }

    auto run = session.run_command(request);
    if (run.failed()) {
      return ToolResult::error(*run.error);
    }

    const CommandResult& result = *run.value;
    if (result.status == CommandStatus::Failed) {
      return ToolResult::error(ErrorCode::SpawnFailed, result.error.value_or("Process could not be spawned"));
    }

    auto metadata = result.to_json();
    metadata["command"] = request.command;
    metadata["working_dir"] = request.working_dir->string();

    auto tool_result = ToolResult::success(describe(result, request.timeout.value_or(session.executor().options().default_timeout)),
                                           std::move(metadata));
    tool_result.title = "Executed: " + request.command.substr(0, 50);
    tool_result.execution = CommandExecution{request, result};
    return tool_result;
  });
}

// ============================================================================
// CommandHistoryTool
// ============================================================================

CommandHistoryTool::CommandHistoryTool() : SimpleTool("get_command_history", "Get recent command execution history, most recent first.") {}

std::vector<ParameterSchema> CommandHistoryTool::parameters() const {
  return {{"limit", "integer", "Maximum number of entries to return (all retained entries when omitted)", false, std::nullopt, std::nullopt}};
}

std::future<ToolResult> CommandHistoryTool::execute(const json& args, const ToolContext& ctx) {
  return std::async(std::launch::async, [args, ctx]() -> ToolResult {
    std::optional<size_t> limit;
    if (args.contains("limit") && !args["limit"].is_null()) {
      auto value = args["limit"].get<int64_t>();
      if (value < 1) {
        return ToolResult::error(ErrorCode::InvalidArgument, "limit must be at least 1");
      }
      limit = static_cast<size_t>(value);
    }

    const auto& history = ctx.session->history();
    auto entries = history.query(limit);

    json items = json::array();
    for (const auto& entry : entries) {
      items.push_back(entry.to_json());
    }
    json metadata = {{"entries", items}, {"count", entries.size()}, {"capacity", history.capacity()}};

    if (entries.empty()) {
      return ToolResult::success("No command execution history.", std::move(metadata));
    }

    std::string output = "Recent " + std::to_string(entries.size()) + " command history:\n\n";
    for (size_t i = 0; i < entries.size(); ++i) {
      const auto& entry = entries[i];
      std::string mark = entry.success() ? "✓" : "✗";
      output += std::to_string(i + 1) + ". [" + mark + "] " + format_timestamp(entry.timestamp) + ": " + entry.request.command + "\n";
    }
    return ToolResult::success(output, std::move(metadata));
  });
}

// ============================================================================
// CurrentDirectoryTool
// ============================================================================

CurrentDirectoryTool::CurrentDirectoryTool() : SimpleTool("get_current_directory", "Get the current working directory used for commands.") {}

std::vector<ParameterSchema> CurrentDirectoryTool::parameters() const {
  return {};
}

std::future<ToolResult> CurrentDirectoryTool::execute(const json& args, const ToolContext& ctx) {
  (void)args;
  return std::async(std::launch::async, [ctx]() -> ToolResult {
    auto cwd = ctx.session->current_directory().string();
    return ToolResult::success(cwd, {{"path", cwd}, {"workspace_root", ctx.session->workspace_root().string()}});
  });
}

// ============================================================================
// ChangeDirectoryTool
// ============================================================================

ChangeDirectoryTool::ChangeDirectoryTool()
    : SimpleTool("change_directory", "Change the working directory used by subsequent commands. Relative paths resolve against the workspace root.") {}

std::vector<ParameterSchema> ChangeDirectoryTool::parameters() const {
  return {{"path", "string", "Directory to switch to", true, std::nullopt, std::nullopt}};
}

std::future<ToolResult> ChangeDirectoryTool::execute(const json& args, const ToolContext& ctx) {
  return std::async(std::launch::async, [args, ctx]() -> ToolResult {
    auto dir = ctx.session->change_directory(args.at("path").get<std::string>());
    if (dir.failed()) {
      return ToolResult::error(*dir.error);
    }
    return ToolResult::success("Switched to directory: " + dir.value->string(), {{"path", dir.value->string()}});
  });
}

// ============================================================================
// Registration
// ============================================================================

void register_builtins(ToolRegistry& registry) {
  registry.register_tool(std::make_shared<ExecuteCommandTool>());
  registry.register_tool(std::make_shared<CommandHistoryTool>());
  registry.register_tool(std::make_shared<CurrentDirectoryTool>());
  registry.register_tool(std::make_shared<ChangeDirectoryTool>());
  registry.register_tool(std::make_shared<ListDirectoryTool>());
  registry.register_tool(std::make_shared<ReadFileTool>());
  registry.register_tool(std::make_shared<WriteFileTool>());
  registry.register_tool(std::make_shared<DeleteFileTool>());
  registry.register_tool(std::make_shared<InsertFileContentTool>());
  registry.register_tool(std::make_shared<UpdateFileContentTool>());

  spdlog::debug("[Tools] Registered {} builtin tools", registry.size());
}

}  // namespace termctl::tools
