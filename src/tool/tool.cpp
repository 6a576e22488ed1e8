#include "tool/tool.hpp"

#include <algorithm>

namespace termctl {

json ToolResult::to_json() const {
  json j;
  j["output"] = sanitize_utf8(output);
  if (title) {
    j["title"] = sanitize_utf8(*title);
  }
  j["metadata"] = metadata;
  j["is_error"] = is_error;
  if (error_code) {
    j["error_code"] = to_string(*error_code);
  }
  return j;
}

// Parameter schema to JSON
json ParameterSchema::to_json_schema() const {
  json schema;
  schema["type"] = type;
  schema["description"] = description;

  if (default_value) {
    schema["default"] = *default_value;
  }

  if (enum_values && !enum_values->empty()) {
    schema["enum"] = *enum_values;
  }

  return schema;
}

bool ParameterSchema::accepts(const json& value) const {
  if (type == "string") return value.is_string();
  if (type == "integer") return value.is_number_integer();
  if (type == "number") return value.is_number();
  if (type == "boolean") return value.is_boolean();
  if (type == "object") return value.is_object();
  if (type == "array") return value.is_array();
  return true;
}

json Tool::input_schema() const {
  json properties = json::object();
  json required_props = json::array();

  for (const auto& param : parameters()) {
    properties[param.name] = param.to_json_schema();
    if (param.required) {
      required_props.push_back(param.name);
    }
  }

  return {{"type", "object"}, {"properties", properties}, {"required", required_props}};
}

// Tool to JSON schema
json Tool::to_json_schema() const {
  json schema;
  schema["name"] = id();
  schema["description"] = description();
  schema["input_schema"] = input_schema();
  return schema;
}

Result<json> Tool::validate_args(const json& args) const {
  if (!args.is_object()) {
    return Result<json>::failure(ErrorCode::InvalidArgument, "Arguments must be an object");
  }

  for (const auto& param : parameters()) {
    auto it = args.find(param.name);
    if (it == args.end() || it->is_null()) {
      if (param.required) {
        return Result<json>::failure(ErrorCode::InvalidArgument, "Missing required parameter: " + param.name);
      }
      continue;
    }
    if (!param.accepts(*it)) {
      return Result<json>::failure(ErrorCode::InvalidArgument,
                                   "Parameter '" + param.name + "' must be of type " + param.type + ", got " + it->type_name());
    }
    if (param.enum_values && it->is_string() &&
        std::find(param.enum_values->begin(), param.enum_values->end(), it->get<std::string>()) == param.enum_values->end()) {
      return Result<json>::failure(ErrorCode::InvalidArgument, "Parameter '" + param.name + "' has an unsupported value");
    }
  }

  return Result<json>::success(args);
}

// SimpleTool implementation
SimpleTool::SimpleTool(std::string id, std::string description) : id_(std::move(id)), description_(std::move(description)) {}

// Tool Registry
ToolRegistry& ToolRegistry::instance() {
  static ToolRegistry instance;
  return instance;
}

void ToolRegistry::register_tool(std::shared_ptr<Tool> tool) {
  std::lock_guard lock(mutex_);
  tools_[tool->id()] = std::move(tool);
}

void ToolRegistry::unregister_tool(const std::string& id) {
  std::lock_guard lock(mutex_);
  tools_.erase(id);
}

std::shared_ptr<Tool> ToolRegistry::get(const std::string& id) const {
  std::lock_guard lock(mutex_);
  auto it = tools_.find(id);
  if (it != tools_.end()) {
    return it->second;
  }
  return nullptr;
}

std::vector<std::shared_ptr<Tool>> ToolRegistry::all() const {
  std::lock_guard lock(mutex_);
  std::vector<std::shared_ptr<Tool>> result;
  result.reserve(tools_.size());
  for (const auto& [id, tool] : tools_) {
    result.push_back(tool);
  }
  return result;
}

size_t ToolRegistry::size() const {
  std::lock_guard lock(mutex_);
  return tools_.size();
}

}  // namespace termctl
