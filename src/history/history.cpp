#include "history/history.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace termctl {

json HistoryEntry::to_json() const {
  json j;
  j["sequence"] = sequence;
  j["command"] = request.command;
  j["working_dir"] = request.working_dir ? json(request.working_dir->string()) : json(nullptr);
  j["status"] = to_string(result.status);
  j["exit_code"] = result.exit_code ? json(*result.exit_code) : json(nullptr);
  j["success"] = success();
  j["elapsed_ms"] = result.elapsed.count();
  j["timestamp"] = format_timestamp(timestamp);
  return j;
}

HistoryLog::HistoryLog(size_t capacity) : capacity_(std::max<size_t>(capacity, 1)) {}

HistoryEntry HistoryLog::record(CommandRequest request, CommandResult result) {
  std::lock_guard lock(mutex_);

  HistoryEntry entry{next_sequence_++, std::move(request), std::move(result), std::chrono::system_clock::now()};
  entries_.push_back(entry);
  while (entries_.size() > capacity_) {
    spdlog::debug("[History] Evicting entry #{}", entries_.front().sequence);
    entries_.pop_front();
  }
  return entry;
}

std::vector<HistoryEntry> HistoryLog::query(std::optional<size_t> limit) const {
  std::lock_guard lock(mutex_);

  size_t count = limit ? std::min(*limit, entries_.size()) : entries_.size();
  return std::vector<HistoryEntry>(entries_.rbegin(), entries_.rbegin() + static_cast<std::ptrdiff_t>(count));
}

size_t HistoryLog::size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

void HistoryLog::clear() {
  std::lock_guard lock(mutex_);
  entries_.clear();
}

}  // namespace termctl
