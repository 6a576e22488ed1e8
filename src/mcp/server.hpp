#pragma once

#include <condition_variable>
#include <iosfwd>
#include <mutex>
#include <string>

#include "dispatch/dispatcher.hpp"
#include "mcp/protocol.hpp"

namespace termctl::mcp {

struct ServerInfo {
  std::string name = "termctl";
  std::string version;
};

// MCP tool server over newline-delimited JSON-RPC 2.0. Reads requests from
// `in` and writes one response per line to `out`. tools/call runs on the
// dispatcher's worker pool, so responses may come back out of order.
class McpServer {
 public:
  McpServer(Dispatcher& dispatcher, std::istream& in, std::ostream& out, ServerInfo info = {});

  // Serves until the input ends, then waits for in-flight calls. Returns the
  // process exit code.
  int run();

  // Handles one input line; used by run() and by tests
  void handle_line(const std::string& line);

  // Blocks until every accepted tools/call has been answered
  void wait_idle();

 private:
  void handle_request(const JsonRpcRequest& req);
  void handle_tools_call(const JsonRpcRequest& req);

  json initialize_result(const json& params) const;
  json tools_list_result() const;

  void send(const JsonRpcResponse& resp);

  Dispatcher& dispatcher_;
  std::istream& in_;
  std::ostream& out_;
  ServerInfo info_;

  std::mutex write_mutex_;

  std::mutex pending_mutex_;
  std::condition_variable pending_cv_;
  size_t pending_ = 0;
};

// Shape of a tools/call result: text content, structured metadata, isError
json to_call_result(const ToolResult& result);

}  // namespace termctl::mcp
