#pragma once

#include <asio.hpp>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "session/session.hpp"
#include "tool/tool.hpp"

namespace termctl {

// Routes named tool calls onto the session. Every outcome comes back as a
// ToolResult: unknown tools, malformed arguments and handler exceptions are
// shaped into errors here. Completed and timed-out commands are recorded in
// the session history.
//
// The worker pool only looks up, validates and starts calls. Waiting for a
// running tool happens on a thread of its own, so a slow command never holds
// a pool thread.
class Dispatcher {
 public:
  using Callback = std::function<void(ToolResult)>;

  // worker_threads == 0 takes the count from the session config
  Dispatcher(std::shared_ptr<Session> session, ToolRegistry& registry = ToolRegistry::instance(), size_t worker_threads = 0);

  ~Dispatcher();

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  // Runs the call on the calling thread
  ToolResult dispatch(const std::string& name, const json& args);

  // Starts the call on the worker pool. callback runs on the pool for calls
  // rejected before they start, else on the thread that waited for the tool.
  void dispatch_async(const std::string& name, json args, Callback callback);

  // Tools offered to callers, ordered by name
  std::vector<std::shared_ptr<Tool>> list_tools() const;

  const std::shared_ptr<Session>& session() const {
    return session_;
  }

 private:
  // A call either settled before the tool ran, or running
  struct Started {
    std::optional<ToolResult> settled;
    std::future<ToolResult> running;
  };

  Started start(const std::string& name, const json& args);
  ToolResult finish(const std::string& name, std::future<ToolResult> running);

  // Keeps the waiter until it is collected; drops finished ones
  void track(std::future<void> waiter);

  std::shared_ptr<Session> session_;
  ToolRegistry& registry_;
  asio::thread_pool pool_;

  std::mutex waiters_mutex_;
  std::vector<std::future<void>> waiters_;
};

}  // namespace termctl
