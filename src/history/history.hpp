#pragma once

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "core/types.hpp"
#include "process/executor.hpp"

namespace termctl {

// One retained command execution
struct HistoryEntry {
  uint64_t sequence = 0;
  CommandRequest request;
  CommandResult result;
  Timestamp timestamp;

  bool success() const {
    return result.success();
  }

  json to_json() const;
};

// Bounded, append-only record of executions. The oldest entry is evicted
// when a record would exceed the capacity.
class HistoryLog {
 public:
  explicit HistoryLog(size_t capacity = 100);

  // Appends under the lock; sequence numbers follow completion order
  HistoryEntry record(CommandRequest request, CommandResult result);

  // Most recent first. No limit returns every retained entry.
  std::vector<HistoryEntry> query(std::optional<size_t> limit = std::nullopt) const;

  size_t size() const;

  size_t capacity() const {
    return capacity_;
  }

  void clear();

 private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<HistoryEntry> entries_;
  uint64_t next_sequence_ = 1;
};

}  // namespace termctl
