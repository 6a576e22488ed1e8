#pragma once

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "process/executor.hpp"

namespace termctl {

// Forward declaration
class Session;

// Tool execution context
struct ToolContext {
  std::shared_ptr<Session> session;
};

// A command run by a tool, handed back so the dispatcher can record it
struct CommandExecution {
  CommandRequest request;
  CommandResult result;
};

// Tool execution result
struct ToolResult {
  std::string output;
  std::optional<std::string> title;
  json metadata = json::object();
  bool is_error = false;
  std::optional<ErrorCode> error_code;
  std::optional<CommandExecution> execution;

  // Factory methods
  static ToolResult success(const std::string& output, json metadata = json::object()) {
    return ToolResult{output, std::nullopt, std::move(metadata), false, std::nullopt, std::nullopt};
  }

  static ToolResult error(const Error& err) {
    return ToolResult{"Error: " + err.message, std::nullopt, json{{"error", err.to_json()}}, true, err.code, std::nullopt};
  }

  static ToolResult error(ErrorCode code, const std::string& message) {
    return error(Error{code, message});
  }

  json to_json() const;
};

// Parameter schema (simplified JSON Schema)
struct ParameterSchema {
  std::string name;
  std::string type;  // "string", "number", "integer", "boolean", "object", "array"
  std::string description;
  bool required = true;
  std::optional<json> default_value;
  std::optional<std::vector<std::string>> enum_values;

  json to_json_schema() const;

  // True when value has this parameter's JSON type
  bool accepts(const json& value) const;
};

// Tool definition
class Tool {
 public:
  virtual ~Tool() = default;

  // Tool identification
  virtual std::string id() const = 0;

  virtual std::string description() const = 0;

  // Parameter schema
  virtual std::vector<ParameterSchema> parameters() const = 0;

  // Execution. args have passed validate_args().
  virtual std::future<ToolResult> execute(const json& args, const ToolContext& ctx) = 0;

  // JSON Schema of the argument object
  json input_schema() const;

  // {name, description, input_schema}
  json to_json_schema() const;

  // Argument object shape: required parameters present, every known one of the declared type
  Result<json> validate_args(const json& args) const;
};

// Base class for simpler tool implementation
class SimpleTool : public Tool {
 public:
  SimpleTool(std::string id, std::string description);

  std::string id() const override {
    return id_;
  }

  std::string description() const override {
    return description_;
  }

 protected:
  std::string id_;
  std::string description_;
};

// Tool registry
class ToolRegistry {
 public:
  ToolRegistry() = default;

  // Process-wide registry filled by init()
  static ToolRegistry& instance();

  // Register a tool
  void register_tool(std::shared_ptr<Tool> tool);

  // Unregister a tool
  void unregister_tool(const std::string& id);

  // Get a tool by ID
  std::shared_ptr<Tool> get(const std::string& id) const;

  // Get all tools, ordered by ID
  std::vector<std::shared_ptr<Tool>> all() const;

  size_t size() const;

  // Initialize builtin tools
  void init_builtins();

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Tool>> tools_;
};

}  // namespace termctl
