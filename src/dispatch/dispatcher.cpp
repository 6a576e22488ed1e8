#include "dispatch/dispatcher.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

namespace termctl {

namespace {

size_t pool_size(const Session& session, size_t requested) {
  size_t threads = requested != 0 ? requested : session.config().execution.worker_threads;
  return std::max<size_t>(threads, 1);
}

}  // namespace

Dispatcher::Dispatcher(std::shared_ptr<Session> session, ToolRegistry& registry, size_t worker_threads)
    : session_(std::move(session)), registry_(registry), pool_(pool_size(*session_, worker_threads)) {}

Dispatcher::~Dispatcher() {
  // No new waiters once the pool has drained
  pool_.join();

  std::vector<std::future<void>> waiters;
  {
    std::lock_guard lock(waiters_mutex_);
    waiters.swap(waiters_);
  }
  for (auto& waiter : waiters) {
    try {
      waiter.get();
    } catch (const std::exception& e) {
      spdlog::error("[Dispatcher] Callback threw: {}", e.what());
    }
  }
}

Dispatcher::Started Dispatcher::start(const std::string& name, const json& args) {
  Started started;

  auto tool = registry_.get(name);
  if (!tool) {
    spdlog::warn("[Dispatcher] Unknown tool: {}", name);
    started.settled = ToolResult::error(ErrorCode::UnknownTool, "Unknown tool: " + name);
    return started;
  }

  auto validated = tool->validate_args(args.is_null() ? json::object() : args);
  if (validated.failed()) {
    spdlog::debug("[Dispatcher] {} rejected arguments: {}", name, validated.error->message);
    started.settled = ToolResult::error(*validated.error);
    return started;
  }

  spdlog::debug("[Dispatcher] Calling {} with {}", name, validated.value->dump());

  try {
    ToolContext ctx{session_};
    started.running = tool->execute(*validated.value, ctx);
  } catch (const std::exception& e) {
    spdlog::error("[Dispatcher] {} threw: {}", name, e.what());
    started.settled = ToolResult::error(ErrorCode::Internal, std::string("Tool '") + name + "' failed: " + e.what());
  }
  return started;
}

ToolResult Dispatcher::finish(const std::string& name, std::future<ToolResult> running) {
  ToolResult result;
  try {
    result = running.get();
  } catch (const std::exception& e) {
    spdlog::error("[Dispatcher] {} threw: {}", name, e.what());
    return ToolResult::error(ErrorCode::Internal, std::string("Tool '") + name + "' failed: " + e.what());
  }

  if (result.execution && result.execution->result.status != CommandStatus::Failed) {
    auto entry = session_->history().record(result.execution->request, result.execution->result);
    result.metadata["sequence"] = entry.sequence;
  }

  if (result.is_error) {
    spdlog::info("[Dispatcher] {} failed: {}", name, result.error_code ? to_string(*result.error_code) : "error");
  } else {
    spdlog::debug("[Dispatcher] {} completed", name);
  }
  return result;
}

ToolResult Dispatcher::dispatch(const std::string& name, const json& args) {
  auto started = start(name, args);
  if (started.settled) {
    return std::move(*started.settled);
  }
  return finish(name, std::move(started.running));
}

void Dispatcher::dispatch_async(const std::string& name, json args, Callback callback) {
  asio::post(pool_, [this, name, args = std::move(args), callback = std::move(callback)]() mutable {
    auto started = start(name, args);
    if (started.settled) {
      if (callback) {
        callback(std::move(*started.settled));
      }
      return;
    }

    track(std::async(std::launch::async, [this, name, running = std::move(started.running), callback = std::move(callback)]() mutable {
      auto result = finish(name, std::move(running));
      if (callback) {
        callback(std::move(result));
      }
    }));
  });
}

void Dispatcher::track(std::future<void> waiter) {
  std::lock_guard lock(waiters_mutex_);
  for (auto it = waiters_.begin(); it != waiters_.end();) {
    if (it->wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
      ++it;
      continue;
    }
    try {
      it->get();
    } catch (const std::exception& e) {
      spdlog::error("[Dispatcher] Callback threw: {}", e.what());
    }
    it = waiters_.erase(it);
  }
  waiters_.push_back(std::move(waiter));
}

std::vector<std::shared_ptr<Tool>> Dispatcher::list_tools() const {
  return registry_.all();
}

}  // namespace termctl
