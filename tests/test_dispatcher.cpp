#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <random>
#include <sstream>

#include "dispatch/dispatcher.hpp"
#include "tool/builtin/builtins.hpp"

using namespace termctl;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

namespace {

// A tool whose handler throws, to check the dispatcher boundary
class ThrowingTool : public SimpleTool {
 public:
  ThrowingTool() : SimpleTool("explode", "Always throws") {}

  std::vector<ParameterSchema> parameters() const override {
    return {};
  }

  std::future<ToolResult> execute(const json&, const ToolContext&) override {
    throw std::runtime_error("boom");
  }
};

}  // namespace

class DispatcherTest : public ::testing::Test {
 protected:
  void SetUp() override {
    root_ = fs::temp_directory_path() / ("termctl_dispatch_" + std::to_string(std::random_device{}()));
    fs::create_directories(root_ / "sub");
    root_ = fs::canonical(root_);

    config_.workspace_dir = root_;
    config_.history_size = 3;
    config_.execution.worker_threads = 4;
    tools::register_builtins(registry_);
    make_dispatcher(config_);
  }

  void TearDown() override {
    dispatcher_.reset();
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  void make_dispatcher(const Config& config) {
    dispatcher_.reset();
    session_ = Session::create(config, root_);
    dispatcher_ = std::make_unique<Dispatcher>(session_, registry_);
  }

  std::string get(const std::string& name) {
    std::ifstream file(root_ / name);
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
  }

  fs::path root_;
  Config config_;
  ToolRegistry registry_;
  std::shared_ptr<Session> session_;
  std::unique_ptr<Dispatcher> dispatcher_;
};

TEST_F(DispatcherTest, UnknownTool) {
  auto result = dispatcher_->dispatch("format_disk", json::object());

  EXPECT_TRUE(result.is_error);
  ASSERT_TRUE(result.error_code.has_value());
  EXPECT_EQ(*result.error_code, ErrorCode::UnknownTool);
  EXPECT_EQ(result.metadata["error"]["code"], "UnknownTool");
}

TEST_F(DispatcherTest, InvalidArguments) {
  auto missing = dispatcher_->dispatch("read_file", json::object());
  ASSERT_TRUE(missing.error_code.has_value());
  EXPECT_EQ(*missing.error_code, ErrorCode::InvalidArgument);

  auto wrong_type = dispatcher_->dispatch("execute_command", {{"command", 123}});
  ASSERT_TRUE(wrong_type.error_code.has_value());
  EXPECT_EQ(*wrong_type.error_code, ErrorCode::InvalidArgument);
}

TEST_F(DispatcherTest, HandlerExceptionBecomesInternal) {
  registry_.register_tool(std::make_shared<ThrowingTool>());

  auto result = dispatcher_->dispatch("explode", json::object());
  EXPECT_TRUE(result.is_error);
  ASSERT_TRUE(result.error_code.has_value());
  EXPECT_EQ(*result.error_code, ErrorCode::Internal);
  EXPECT_NE(result.output.find("boom"), std::string::npos);
}

TEST_F(DispatcherTest, ListTools) {
  EXPECT_EQ(dispatcher_->list_tools().size(), 10u);
}

// --- execute_command ---

#ifndef _WIN32

TEST_F(DispatcherTest, EchoHello) {
  auto result = dispatcher_->dispatch("execute_command", {{"command", "echo hello"}});

  EXPECT_FALSE(result.is_error);
  EXPECT_EQ(result.metadata["stdout"], "hello\n");
  EXPECT_EQ(result.metadata["exit_code"], 0);
  EXPECT_EQ(result.metadata["status"], "completed");
  EXPECT_NE(result.output.find("Command executed successfully"), std::string::npos);
  EXPECT_NE(result.output.find("hello"), std::string::npos);
  EXPECT_EQ(session_->history().size(), 1u);
  EXPECT_EQ(result.metadata["sequence"], 1);
  ASSERT_TRUE(result.title.has_value());
  EXPECT_EQ(*result.title, "Executed: echo hello");
}

TEST_F(DispatcherTest, NonzeroExitIsNotAnError) {
  auto result = dispatcher_->dispatch("execute_command", {{"command", "echo oops 1>&2; exit 2"}});

  EXPECT_FALSE(result.is_error);
  EXPECT_EQ(result.metadata["exit_code"], 2);
  EXPECT_EQ(result.metadata["status"], "completed");
  EXPECT_NE(result.output.find("Return code: 2"), std::string::npos);
  EXPECT_NE(result.output.find("oops"), std::string::npos);
}

TEST_F(DispatcherTest, TimeoutInSeconds) {
  auto start = std::chrono::steady_clock::now();
  auto result = dispatcher_->dispatch("execute_command", {{"command", "sleep 5"}, {"timeout", 1}});
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_FALSE(result.is_error);
  EXPECT_EQ(result.metadata["status"], "timed_out");
  EXPECT_TRUE(result.metadata["exit_code"].is_null());
  EXPECT_LT(elapsed, 4s);
  EXPECT_EQ(session_->history().size(), 1u);
}

TEST_F(DispatcherTest, InvalidTimeout) {
  for (double timeout : {0.0, -1.0}) {
    auto result = dispatcher_->dispatch("execute_command", {{"command", "true"}, {"timeout", timeout}});
    ASSERT_TRUE(result.error_code.has_value());
    EXPECT_EQ(*result.error_code, ErrorCode::InvalidArgument);
  }
  EXPECT_EQ(session_->history().size(), 0u);
}

TEST_F(DispatcherTest, WorkdirArgument) {
  auto result = dispatcher_->dispatch("execute_command", {{"command", "pwd -P"}, {"workdir", "sub"}});
  EXPECT_EQ(result.metadata["stdout"], (root_ / "sub").string() + "\n");

  auto bad = dispatcher_->dispatch("execute_command", {{"command", "pwd"}, {"workdir", "nope"}});
  ASSERT_TRUE(bad.error_code.has_value());
  EXPECT_EQ(*bad.error_code, ErrorCode::NotFound);
}

TEST_F(DispatcherTest, ChangeDirectoryAffectsCommands) {
  ASSERT_FALSE(dispatcher_->dispatch("change_directory", {{"path", "sub"}}).is_error);

  auto cwd = dispatcher_->dispatch("get_current_directory", json::object());
  EXPECT_EQ(cwd.output, (root_ / "sub").string());

  auto result = dispatcher_->dispatch("execute_command", {{"command", "pwd -P"}});
  EXPECT_EQ(result.metadata["stdout"], (root_ / "sub").string() + "\n");
}

// 历史记录超出容量后只保留最新的 N 条
TEST_F(DispatcherTest, HistoryKeepsNewestN) {
  for (int i = 0; i < 4; ++i) {
    dispatcher_->dispatch("execute_command", {{"command", "echo " + std::to_string(i)}});
  }

  auto history = dispatcher_->dispatch("get_command_history", json::object());
  EXPECT_FALSE(history.is_error);
  ASSERT_EQ(history.metadata["count"], 3);
  const auto& entries = history.metadata["entries"];
  EXPECT_EQ(entries[0]["command"], "echo 3");
  EXPECT_EQ(entries[2]["command"], "echo 1");
  EXPECT_EQ(history.output.find("echo 0"), std::string::npos);
  EXPECT_NE(history.output.find("[✓]"), std::string::npos);

  auto limited = dispatcher_->dispatch("get_command_history", {{"limit", 1}});
  EXPECT_EQ(limited.metadata["count"], 1);
}

TEST_F(DispatcherTest, SpawnFailureIsNotRecorded) {
  Config config = config_;
  config.shell = "/nonexistent/termctl-shell";
  make_dispatcher(config);

  auto result = dispatcher_->dispatch("execute_command", {{"command", "echo hi"}});
  EXPECT_TRUE(result.is_error);
  ASSERT_TRUE(result.error_code.has_value());
  EXPECT_EQ(*result.error_code, ErrorCode::SpawnFailed);
  EXPECT_EQ(session_->history().size(), 0u);
}

// 慢命令数量超过工作线程数时，其他调用仍能立即得到响应
TEST_F(DispatcherTest, SlowCommandsDoNotStarveOtherCalls) {
  std::vector<std::promise<ToolResult>> slow(5);
  std::promise<ToolResult> quick;
  auto quick_future = quick.get_future();

  // Two pool threads for five commands
  Dispatcher dispatcher(session_, registry_, 2);

  auto start = std::chrono::steady_clock::now();
  for (auto& p : slow) {
    dispatcher.dispatch_async("execute_command", {{"command", "sleep 2"}}, [&p](ToolResult result) {
      p.set_value(std::move(result));
    });
  }
  dispatcher.dispatch_async("get_current_directory", json::object(), [&quick](ToolResult result) {
    quick.set_value(std::move(result));
  });

  ASSERT_EQ(quick_future.wait_for(1s), std::future_status::ready);
  EXPECT_FALSE(quick_future.get().is_error);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 1500ms);

  for (auto& p : slow) {
    auto result = p.get_future().get();
    EXPECT_EQ(result.metadata["status"], "completed");
  }
  // All five ran side by side
  EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
  EXPECT_EQ(session_->history().size(), 3u);
}

TEST_F(DispatcherTest, AsyncRejectionsAreAnswered) {
  std::promise<ToolResult> unknown;
  dispatcher_->dispatch_async("format_disk", json::object(), [&unknown](ToolResult result) {
    unknown.set_value(std::move(result));
  });

  auto result = unknown.get_future().get();
  ASSERT_TRUE(result.error_code.has_value());
  EXPECT_EQ(*result.error_code, ErrorCode::UnknownTool);
}

TEST_F(DispatcherTest, HugeTimeoutIsRejected) {
  auto result = dispatcher_->dispatch("execute_command", {{"command", "echo hi"}, {"timeout", 1e10}});
  ASSERT_TRUE(result.error_code.has_value());
  EXPECT_EQ(*result.error_code, ErrorCode::InvalidArgument);

  auto longest = dispatcher_->dispatch("execute_command", {{"command", "echo hi"}, {"timeout", 86400}});
  EXPECT_FALSE(longest.is_error);
  EXPECT_EQ(longest.metadata["status"], "completed");
  EXPECT_EQ(longest.metadata["stdout"], "hi\n");
}

TEST_F(DispatcherTest, HistoryRecordsCurrentDirectory) {
  ASSERT_FALSE(dispatcher_->dispatch("change_directory", {{"path", "sub"}}).is_error);
  auto run = dispatcher_->dispatch("execute_command", {{"command", "true"}});
  EXPECT_EQ(run.metadata["working_dir"], (root_ / "sub").string());

  auto history = dispatcher_->dispatch("get_command_history", json::object());
  ASSERT_EQ(history.metadata["count"], 1);
  EXPECT_EQ(history.metadata["entries"][0]["working_dir"], (root_ / "sub").string());
}

#endif  // _WIN32

TEST_F(DispatcherTest, HistoryLimitMustBePositive) {
  auto result = dispatcher_->dispatch("get_command_history", {{"limit", 0}});
  ASSERT_TRUE(result.error_code.has_value());
  EXPECT_EQ(*result.error_code, ErrorCode::InvalidArgument);
}

TEST_F(DispatcherTest, EmptyHistory) {
  auto result = dispatcher_->dispatch("get_command_history", json::object());
  EXPECT_FALSE(result.is_error);
  EXPECT_EQ(result.output, "No command execution history.");
}

// --- 文件工具 ---

TEST_F(DispatcherTest, ReadNonexistent) {
  auto result = dispatcher_->dispatch("read_file", {{"path", "/nonexistent"}});
  ASSERT_TRUE(result.error_code.has_value());
  EXPECT_EQ(*result.error_code, ErrorCode::NotFound);
}

TEST_F(DispatcherTest, ChangeDirectoryNotADirectory) {
  auto result = dispatcher_->dispatch("change_directory", {{"path", "/not/a/dir"}});
  ASSERT_TRUE(result.error_code.has_value());
  EXPECT_EQ(*result.error_code, ErrorCode::NotADirectory);

  auto cwd = dispatcher_->dispatch("get_current_directory", json::object());
  EXPECT_EQ(cwd.output, root_.string());
}

TEST_F(DispatcherTest, FileToolsRoundTrip) {
  auto written = dispatcher_->dispatch("write_file", {{"path", "notes/a.txt"}, {"content", "one\ntwo\nthree\n"}});
  EXPECT_FALSE(written.is_error);
  EXPECT_EQ(written.metadata["bytes"], 14);

  auto inserted = dispatcher_->dispatch("insert_file_content", {{"path", "notes/a.txt"}, {"line", 1}, {"content", "zero"}});
  EXPECT_FALSE(inserted.is_error);

  auto updated = dispatcher_->dispatch("update_file_content",
                                       {{"path", "notes/a.txt"}, {"start_line", 3}, {"end_line", 3}, {"content", "TWO"}});
  EXPECT_FALSE(updated.is_error);

  auto read = dispatcher_->dispatch("read_file", {{"path", "notes/a.txt"}});
  EXPECT_EQ(read.output, "zero\none\nTWO\nthree\n");
  EXPECT_EQ(read.metadata["lines"], 4);

  auto out_of_range = dispatcher_->dispatch("insert_file_content", {{"path", "notes/a.txt"}, {"line", 9}, {"content", "x"}});
  ASSERT_TRUE(out_of_range.error_code.has_value());
  EXPECT_EQ(*out_of_range.error_code, ErrorCode::OutOfRange);

  auto listed = dispatcher_->dispatch("list_directory", {{"path", "notes"}});
  EXPECT_NE(listed.output.find("a.txt"), std::string::npos);

  auto deleted = dispatcher_->dispatch("delete_file", {{"path", "notes/a.txt"}});
  EXPECT_FALSE(deleted.is_error);
  EXPECT_FALSE(fs::exists(root_ / "notes" / "a.txt"));

  // 文件操作不写入命令历史
  EXPECT_EQ(session_->history().size(), 0u);
}

TEST_F(DispatcherTest, ListDirectoryDefaultsToCurrent) {
  std::ofstream(root_ / "sub" / "inside.txt") << "x";
  ASSERT_FALSE(dispatcher_->dispatch("change_directory", {{"path", "sub"}}).is_error);

  auto listed = dispatcher_->dispatch("list_directory", json::object());
  EXPECT_FALSE(listed.is_error);
  ASSERT_EQ(listed.metadata["entries"].size(), 1u);
  EXPECT_EQ(listed.metadata["entries"][0]["name"], "inside.txt");
  EXPECT_EQ(listed.metadata["entries"][0]["kind"], "file");
}

TEST_F(DispatcherTest, NullArgumentsTreatedAsEmpty) {
  auto result = dispatcher_->dispatch("get_current_directory", json());
  EXPECT_FALSE(result.is_error);
}
