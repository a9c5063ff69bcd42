#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/model/execution.hpp"

namespace edgerun::dispatch {

struct ExecutionCounts {
  uint64_t total{0};
  uint64_t pending{0};
  uint64_t succeeded{0};
  uint64_t failed{0};
};

/*
  In-memory, process-lifetime table of execution records.

  Records are only ever added and moved Pending -> terminal exactly once.
  Reads return copies so callers never observe a half-written record.
*/
class ExecutionStore {
 public:
  // Throws util::AlreadyExists for a duplicate id.
  void Create(const model::ExecutionRecord& record);

  // Throws util::NotFound for an unknown id, util::InvalidState if already terminal.
  model::ExecutionRecord Complete(const std::string& execution_id, const model::ExecutionOutcome& outcome, util::TimePoint completed_at);

  std::optional<model::ExecutionRecord> Get(const std::string& execution_id) const;

  ExecutionCounts Counts() const;
  size_t          Size() const;

 private:
  mutable std::mutex mutex_;

  std::unordered_map<std::string, model::ExecutionRecord> records_;
  ExecutionCounts                                         counts_;
};

} // namespace edgerun::dispatch
