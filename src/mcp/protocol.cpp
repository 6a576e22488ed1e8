#include "mcp/protocol.hpp"

namespace termctl::mcp {

json JsonRpcRequest::to_json() const {
  json j = {{"jsonrpc", "2.0"}, {"method", method}};
  if (!id.is_null()) {
    j["id"] = id;
  }
  if (!params.empty()) {
    j["params"] = params;
  }
  return j;
}

Result<JsonRpcRequest> JsonRpcRequest::from_json(const json& j) {
  if (!j.is_object()) {
    return Result<JsonRpcRequest>::failure(ErrorCode::InvalidArgument, "Request must be a JSON object");
  }
  auto version = j.find("jsonrpc");
  if (version == j.end() || *version != "2.0") {
    return Result<JsonRpcRequest>::failure(ErrorCode::InvalidArgument, "jsonrpc must be \"2.0\"");
  }
  auto method = j.find("method");
  if (method == j.end() || !method->is_string()) {
    return Result<JsonRpcRequest>::failure(ErrorCode::InvalidArgument, "method must be a string");
  }

  JsonRpcRequest req;
  req.method = method->get<std::string>();
  if (auto id = j.find("id"); id != j.end()) {
    if (!id->is_null() && !id->is_number_integer() && !id->is_string()) {
      return Result<JsonRpcRequest>::failure(ErrorCode::InvalidArgument, "id must be a string or an integer");
    }
    req.id = *id;
  }
  if (auto params = j.find("params"); params != j.end() && !params->is_null()) {
    if (!params->is_object() && !params->is_array()) {
      return Result<JsonRpcRequest>::failure(ErrorCode::InvalidArgument, "params must be structured");
    }
    req.params = *params;
  }
  return Result<JsonRpcRequest>::success(std::move(req));
}

std::string JsonRpcResponse::error_message() const {
  if (!error) {
    return "";
  }
  if (error->is_object() && error->contains("message") && (*error)["message"].is_string()) {
    return (*error)["message"].get<std::string>();
  }
  return error->dump();
}

json JsonRpcResponse::to_json() const {
  json j = {{"jsonrpc", "2.0"}, {"id", id}};
  if (error) {
    j["error"] = *error;
  } else {
    j["result"] = result.value_or(json::object());
  }
  return j;
}

JsonRpcResponse JsonRpcResponse::from_json(const json& j) {
  JsonRpcResponse resp;
  resp.id = j.value("id", json());
  if (j.contains("result")) {
    resp.result = j["result"];
  }
  if (j.contains("error")) {
    resp.error = j["error"];
  }
  return resp;
}

JsonRpcResponse JsonRpcResponse::success(json id, json result) {
  JsonRpcResponse resp;
  resp.id = std::move(id);
  resp.result = std::move(result);
  return resp;
}

JsonRpcResponse JsonRpcResponse::failure(json id, int code, const std::string& message) {
  JsonRpcResponse resp;
  resp.id = std::move(id);
  resp.error = json{{"code", code}, {"message", message}};
  return resp;
}

json JsonRpcNotification::to_json() const {
  json j = {{"jsonrpc", "2.0"}, {"method", method}};
  if (!params.empty()) {
    j["params"] = params;
  }
  return j;
}

}  // namespace termctl::mcp
