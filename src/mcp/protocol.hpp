#pragma once

#include <optional>
#include <string>

#include "core/types.hpp"

namespace termctl::mcp {

// Protocol revision answered when the client does not name one
inline constexpr const char* kDefaultProtocolVersion = "2024-11-05";

// JSON-RPC 2.0 error codes
namespace rpc_error {
inline constexpr int ParseError = -32700;
inline constexpr int InvalidRequest = -32600;
inline constexpr int MethodNotFound = -32601;
inline constexpr int InvalidParams = -32602;
inline constexpr int InternalError = -32603;
}  // namespace rpc_error

struct JsonRpcRequest {
  json id;  // Number or string; null for notifications
  std::string method;
  json params = json::object();

  bool is_notification() const {
    return id.is_null();
  }

  json to_json() const;

  // InvalidArgument when j is not a JSON-RPC 2.0 request or notification
  static Result<JsonRpcRequest> from_json(const json& j);
};

struct JsonRpcResponse {
  json id;
  std::optional<json> result;
  std::optional<json> error;

  bool ok() const {
    return !error.has_value();
  }

  // error.message, or the whole error object when it has none
  std::string error_message() const;

  json to_json() const;

  static JsonRpcResponse from_json(const json& j);

  static JsonRpcResponse success(json id, json result);

  static JsonRpcResponse failure(json id, int code, const std::string& message);
};

struct JsonRpcNotification {
  std::string method;
  json params = json::object();

  json to_json() const;
};

}  // namespace termctl::mcp
