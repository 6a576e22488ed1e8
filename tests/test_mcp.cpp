#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include "mcp/protocol.hpp"
#include "mcp/server.hpp"
#include "tool/builtin/builtins.hpp"

using namespace termctl;
using namespace termctl::mcp;

namespace fs = std::filesystem;

// ============================================================
// JsonRpcTest — JSON-RPC 消息序列化
// ============================================================

TEST(JsonRpcTest, RequestSerialization) {
  JsonRpcRequest req;
  req.method = "initialize";
  req.id = 42;
  req.params = json{{"protocolVersion", "2024-11-05"}};

  auto j = req.to_json();

  EXPECT_EQ(j["jsonrpc"], "2.0");
  EXPECT_EQ(j["method"], "initialize");
  EXPECT_EQ(j["id"], 42);
  EXPECT_EQ(j["params"]["protocolVersion"], "2024-11-05");
}

TEST(JsonRpcTest, RequestSerializationEmptyParams) {
  JsonRpcRequest req;
  req.method = "tools/list";
  req.id = 1;

  auto j = req.to_json();

  // 空 params 不应被序列化
  EXPECT_FALSE(j.contains("params"));
}

TEST(JsonRpcTest, RequestFromJson) {
  auto req = JsonRpcRequest::from_json({{"jsonrpc", "2.0"}, {"id", "abc"}, {"method", "tools/call"}, {"params", {{"name", "x"}}}});

  ASSERT_TRUE(req.ok());
  EXPECT_EQ(req.value->id, "abc");
  EXPECT_EQ(req.value->method, "tools/call");
  EXPECT_EQ(req.value->params["name"], "x");
  EXPECT_FALSE(req.value->is_notification());
}

TEST(JsonRpcTest, RequestFromJsonNotification) {
  auto req = JsonRpcRequest::from_json({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});

  ASSERT_TRUE(req.ok());
  EXPECT_TRUE(req.value->is_notification());
  EXPECT_TRUE(req.value->params.is_object());
}

TEST(JsonRpcTest, RequestFromJsonRejectsMalformed) {
  // 缺少 jsonrpc 版本
  EXPECT_TRUE(JsonRpcRequest::from_json({{"id", 1}, {"method", "ping"}}).failed());
  // jsonrpc 不是字符串
  EXPECT_TRUE(JsonRpcRequest::from_json({{"jsonrpc", 2}, {"id", 1}, {"method", "ping"}}).failed());
  // method 不是字符串
  EXPECT_TRUE(JsonRpcRequest::from_json({{"jsonrpc", "2.0"}, {"id", 1}, {"method", 5}}).failed());
  // id 为对象
  EXPECT_TRUE(JsonRpcRequest::from_json({{"jsonrpc", "2.0"}, {"id", {{"a", 1}}}, {"method", "ping"}}).failed());
  // params 为标量
  EXPECT_TRUE(JsonRpcRequest::from_json({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}, {"params", 3}}).failed());
  EXPECT_TRUE(JsonRpcRequest::from_json(json::array()).failed());
}

TEST(JsonRpcTest, ResponseFromJson) {
  json j = {
      {"jsonrpc", "2.0"},
      {"id", 10},
      {"result", {{"capabilities", {{"tools", json::object()}}}}},
  };

  auto resp = JsonRpcResponse::from_json(j);

  EXPECT_EQ(resp.id, 10);
  EXPECT_TRUE(resp.ok());
  EXPECT_TRUE(resp.result->contains("capabilities"));
}

TEST(JsonRpcTest, ResponseErrorMessage) {
  auto resp = JsonRpcResponse::failure(5, rpc_error::MethodNotFound, "Method not found");

  EXPECT_FALSE(resp.ok());
  EXPECT_EQ(resp.error_message(), "Method not found");

  auto j = resp.to_json();
  EXPECT_EQ(j["error"]["code"], -32601);
  EXPECT_FALSE(j.contains("result"));
}

TEST(JsonRpcTest, ResponseErrorMessageWithoutMessageField) {
  // 没有 message 字段的错误 — 应 dump 整个 error 对象
  auto resp = JsonRpcResponse::from_json({{"jsonrpc", "2.0"}, {"id", 6}, {"error", {{"code", -32000}}}});

  EXPECT_FALSE(resp.ok());
  EXPECT_NE(resp.error_message().find("-32000"), std::string::npos);
}

TEST(JsonRpcTest, NotificationSerialization) {
  JsonRpcNotification notif;
  notif.method = "notifications/initialized";

  auto j = notif.to_json();

  EXPECT_EQ(j["jsonrpc"], "2.0");
  // 通知消息不应包含 id 字段
  EXPECT_FALSE(j.contains("id"));
  EXPECT_FALSE(j.contains("params"));
}

// ============================================================
// CallResultTest — tools/call 结果格式
// ============================================================

TEST(CallResultTest, SuccessShape) {
  auto j = to_call_result(ToolResult::success("hello", {{"bytes", 5}}));

  ASSERT_EQ(j["content"].size(), 1u);
  EXPECT_EQ(j["content"][0]["type"], "text");
  EXPECT_EQ(j["content"][0]["text"], "hello");
  EXPECT_EQ(j["structuredContent"]["bytes"], 5);
  EXPECT_EQ(j["isError"], false);
}

TEST(CallResultTest, ErrorShape) {
  auto j = to_call_result(ToolResult::error(ErrorCode::NotFound, "File 'x' does not exist"));

  EXPECT_EQ(j["isError"], true);
  EXPECT_EQ(j["content"][0]["text"], "Error: File 'x' does not exist");
  EXPECT_EQ(j["structuredContent"]["error"]["code"], "NotFound");
}

TEST(CallResultTest, InvalidUtf8IsReplaced) {
  auto j = to_call_result(ToolResult::success(std::string("ok\xff"), json::object()));

  // 输出可以被序列化
  EXPECT_NO_THROW(j.dump());
}

// ============================================================
// McpServerTest — 通过内存流驱动服务
// ============================================================

class McpServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    root_ = fs::temp_directory_path() / ("termctl_mcp_" + std::to_string(std::random_device{}()));
    fs::create_directories(root_);
    root_ = fs::canonical(root_);

    Config config;
    config.workspace_dir = root_;
    tools::register_builtins(registry_);
    dispatcher_ = std::make_unique<Dispatcher>(Session::create(config, root_), registry_, 2);
  }

  void TearDown() override {
    dispatcher_.reset();
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  // Feeds the lines through run() and returns the parsed responses
  std::vector<json> serve(const std::vector<std::string>& lines) {
    std::stringstream in;
    for (const auto& line : lines) {
      in << line << "\n";
    }
    std::stringstream out;
    McpServer server(*dispatcher_, in, out, ServerInfo{"termctl", "test"});
    EXPECT_EQ(server.run(), 0);

    std::vector<json> responses;
    std::string line;
    while (std::getline(out, line)) {
      responses.push_back(json::parse(line));
    }
    return responses;
  }

  json serve_one(const json& request) {
    auto responses = serve({request.dump()});
    EXPECT_EQ(responses.size(), 1u);
    return responses.empty() ? json() : responses.front();
  }

  static json call(int id, const std::string& name, const json& arguments) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"method", "tools/call"}, {"params", {{"name", name}, {"arguments", arguments}}}};
  }

  fs::path root_;
  ToolRegistry registry_;
  std::unique_ptr<Dispatcher> dispatcher_;
};

TEST_F(McpServerTest, Initialize) {
  auto resp = serve_one({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}, {"params", {{"protocolVersion", "2025-03-26"}}}});

  EXPECT_EQ(resp["id"], 1);
  EXPECT_EQ(resp["result"]["protocolVersion"], "2025-03-26");
  EXPECT_EQ(resp["result"]["serverInfo"]["name"], "termctl");
  EXPECT_EQ(resp["result"]["capabilities"]["tools"]["listChanged"], false);
}

TEST_F(McpServerTest, InitializeDefaultsProtocolVersion) {
  auto resp = serve_one({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}});
  EXPECT_EQ(resp["result"]["protocolVersion"], kDefaultProtocolVersion);
}

TEST_F(McpServerTest, Ping) {
  auto resp = serve_one({{"jsonrpc", "2.0"}, {"id", "p"}, {"method", "ping"}});
  EXPECT_EQ(resp["id"], "p");
  EXPECT_TRUE(resp["result"].is_object());
}

TEST_F(McpServerTest, ToolsList) {
  auto resp = serve_one({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}});

  const auto& tools = resp["result"]["tools"];
  ASSERT_EQ(tools.size(), 10u);
  std::vector<std::string> names;
  for (const auto& tool : tools) {
    names.push_back(tool["name"].get<std::string>());
    EXPECT_EQ(tool["inputSchema"]["type"], "object");
  }
  EXPECT_NE(std::find(names.begin(), names.end(), "execute_command"), names.end());
  EXPECT_NE(std::find(names.begin(), names.end(), "update_file_content"), names.end());
}

TEST_F(McpServerTest, ToolsCall) {
  auto resp = serve_one(call(3, "write_file", {{"path", "a.txt"}, {"content", "hi\n"}}));

  EXPECT_EQ(resp["id"], 3);
  EXPECT_EQ(resp["result"]["isError"], false);
  EXPECT_EQ(resp["result"]["structuredContent"]["bytes"], 3);
  EXPECT_TRUE(fs::exists(root_ / "a.txt"));
}

TEST_F(McpServerTest, ToolsCallUnknownToolIsToolError) {
  auto resp = serve_one(call(4, "rm_rf", json::object()));

  // 工具级错误放在 result 里，而不是 JSON-RPC error
  EXPECT_FALSE(resp.contains("error"));
  EXPECT_EQ(resp["result"]["isError"], true);
  EXPECT_EQ(resp["result"]["structuredContent"]["error"]["code"], "UnknownTool");
}

TEST_F(McpServerTest, ToolsCallMissingName) {
  auto resp = serve_one({{"jsonrpc", "2.0"}, {"id", 5}, {"method", "tools/call"}, {"params", json::object()}});
  EXPECT_EQ(resp["error"]["code"], rpc_error::InvalidParams);
}

TEST_F(McpServerTest, ToolsCallArgumentsMustBeObject) {
  auto resp = serve_one({{"jsonrpc", "2.0"}, {"id", 6}, {"method", "tools/call"}, {"params", {{"name", "read_file"}, {"arguments", "x"}}}});
  EXPECT_EQ(resp["error"]["code"], rpc_error::InvalidParams);
}

TEST_F(McpServerTest, ParseError) {
  auto responses = serve({"{not json"});

  ASSERT_EQ(responses.size(), 1u);
  EXPECT_TRUE(responses[0]["id"].is_null());
  EXPECT_EQ(responses[0]["error"]["code"], rpc_error::ParseError);
}

TEST_F(McpServerTest, InvalidRequest) {
  auto resp = serve_one({{"id", 7}, {"method", "ping"}});
  EXPECT_EQ(resp["id"], 7);
  EXPECT_EQ(resp["error"]["code"], rpc_error::InvalidRequest);

  json batch_request = json::array();
  batch_request.push_back({{"jsonrpc", "2.0"}, {"id", 8}, {"method", "ping"}});
  auto batch = serve_one(batch_request);
  EXPECT_EQ(batch["error"]["code"], rpc_error::InvalidRequest);
}

TEST_F(McpServerTest, MethodNotFound) {
  auto resp = serve_one({{"jsonrpc", "2.0"}, {"id", 9}, {"method", "resources/list"}});
  EXPECT_EQ(resp["error"]["code"], rpc_error::MethodNotFound);
}

TEST_F(McpServerTest, NotificationsAreNotAnswered) {
  auto responses = serve({
      json({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}).dump(),
      "",
      json({{"jsonrpc", "2.0"}, {"id", 10}, {"method", "ping"}}).dump(),
  });

  ASSERT_EQ(responses.size(), 1u);
  EXPECT_EQ(responses[0]["id"], 10);
}

#ifndef _WIN32

// run() 在输入结束后等待所有进行中的调用完成
TEST_F(McpServerTest, RunWaitsForInFlightCalls) {
  auto responses = serve({
      call(11, "execute_command", {{"command", "sleep 0.3; echo late"}}).dump(),
      call(12, "get_current_directory", json::object()).dump(),
  });

  ASSERT_EQ(responses.size(), 2u);
  json late;
  for (const auto& resp : responses) {
    if (resp["id"] == 11) late = resp;
  }
  ASSERT_FALSE(late.is_null());
  EXPECT_EQ(late["result"]["structuredContent"]["stdout"], "late\n");
  EXPECT_EQ(late["result"]["structuredContent"]["sequence"], 1);
}

#endif  // _WIN32
