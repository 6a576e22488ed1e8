#pragma once

// Core types
#include "core/config.hpp"
#include "core/types.hpp"

// Workspace and shell detection
#include "shell/shell.hpp"
#include "workspace/workspace.hpp"

// Execution and history
#include "history/history.hpp"
#include "process/executor.hpp"

// File operations
#include "file/file_ops.hpp"

// Tool system
#include "tool/builtin/builtins.hpp"
#include "tool/tool.hpp"

// Session and dispatch
#include "dispatch/dispatcher.hpp"
#include "session/session.hpp"

// MCP server
#include "mcp/protocol.hpp"
#include "mcp/server.hpp"

namespace termctl {

// Initialize logging and register the builtin tools
void init(const Config& config = Config{});

// Flush and drop the loggers
void shutdown();

// Get version string
std::string version();

}  // namespace termctl
