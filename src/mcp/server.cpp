#include "mcp/server.hpp"

#include <spdlog/spdlog.h>

#include <istream>
#include <ostream>

namespace termctl::mcp {

json to_call_result(const ToolResult& result) {
  json structured = result.metadata.is_object() ? result.metadata : json{{"value", result.metadata}};
  return {
      {"content", json::array({{{"type", "text"}, {"text", sanitize_utf8(result.output)}}})},
      {"structuredContent", structured},
      {"isError", result.is_error},
  };
}

McpServer::McpServer(Dispatcher& dispatcher, std::istream& in, std::ostream& out, ServerInfo info)
    : dispatcher_(dispatcher), in_(in), out_(out), info_(std::move(info)) {}

int McpServer::run() {
  spdlog::info("[McpServer] Serving {} tools on stdio", dispatcher_.list_tools().size());

  std::string line;
  while (std::getline(in_, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.find_first_not_of(" \t") == std::string::npos) {
      continue;
    }
    handle_line(line);
  }

  spdlog::info("[McpServer] Input closed, waiting for in-flight calls");
  wait_idle();
  return 0;
}

void McpServer::handle_line(const std::string& line) {
  json message;
  try {
    message = json::parse(line);
  } catch (const json::parse_error& e) {
    spdlog::warn("[McpServer] Parse error: {}", e.what());
    send(JsonRpcResponse::failure(nullptr, rpc_error::ParseError, std::string("Parse error: ") + e.what()));
    return;
  }

  if (message.is_array()) {
    send(JsonRpcResponse::failure(nullptr, rpc_error::InvalidRequest, "Batch requests are not supported"));
    return;
  }

  auto req = JsonRpcRequest::from_json(message);
  if (req.failed()) {
    json id = message.is_object() ? message.value("id", json()) : json();
    send(JsonRpcResponse::failure(id, rpc_error::InvalidRequest, "Invalid request: " + req.error->message));
    return;
  }

  handle_request(*req.value);
}

void McpServer::handle_request(const JsonRpcRequest& req) {
  if (req.is_notification()) {
    // notifications/initialized, notifications/cancelled, ...: nothing to answer
    spdlog::debug("[McpServer] Notification: {}", req.method);
    return;
  }

  spdlog::debug("[McpServer] Request {}: {}", req.id.dump(), req.method);

  if (req.method == "initialize") {
    send(JsonRpcResponse::success(req.id, initialize_result(req.params)));
  } else if (req.method == "ping") {
    send(JsonRpcResponse::success(req.id, json::object()));
  } else if (req.method == "tools/list") {
    send(JsonRpcResponse::success(req.id, tools_list_result()));
  } else if (req.method == "tools/call") {
    handle_tools_call(req);
  } else {
    send(JsonRpcResponse::failure(req.id, rpc_error::MethodNotFound, "Method not found: " + req.method));
  }
}

void McpServer::handle_tools_call(const JsonRpcRequest& req) {
  const auto& params = req.params;
  if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
    send(JsonRpcResponse::failure(req.id, rpc_error::InvalidParams, "tools/call requires a string 'name'"));
    return;
  }
  json args = params.value("arguments", json::object());
  if (args.is_null()) {
    args = json::object();
  }
  if (!args.is_object()) {
    send(JsonRpcResponse::failure(req.id, rpc_error::InvalidParams, "tools/call 'arguments' must be an object"));
    return;
  }

  {
    std::lock_guard lock(pending_mutex_);
    ++pending_;
  }

  auto id = req.id;
  dispatcher_.dispatch_async(params["name"].get<std::string>(), std::move(args), [this, id](ToolResult result) {
    send(JsonRpcResponse::success(id, to_call_result(result)));

    std::lock_guard lock(pending_mutex_);
    --pending_;
    pending_cv_.notify_all();
  });
}

void McpServer::wait_idle() {
  std::unique_lock lock(pending_mutex_);
  pending_cv_.wait(lock, [this] { return pending_ == 0; });
}

json McpServer::initialize_result(const json& params) const {
  std::string protocol = kDefaultProtocolVersion;
  if (params.is_object() && params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
    protocol = params["protocolVersion"].get<std::string>();
  }
  return {
      {"protocolVersion", protocol},
      {"capabilities", {{"tools", {{"listChanged", false}}}}},
      {"serverInfo", {{"name", info_.name}, {"version", info_.version}}},
  };
}

json McpServer::tools_list_result() const {
  json tools = json::array();
  for (const auto& tool : dispatcher_.list_tools()) {
    tools.push_back({{"name", tool->id()}, {"description", tool->description()}, {"inputSchema", tool->input_schema()}});
  }
  return {{"tools", tools}};
}

void McpServer::send(const JsonRpcResponse& resp) {
  // Invalid UTF-8 in paths or output must not abort the dump
  auto text = resp.to_json().dump(-1, ' ', false, json::error_handler_t::replace);

  std::lock_guard lock(write_mutex_);
  out_ << text << '\n';
  out_.flush();
}

}  // namespace termctl::mcp
