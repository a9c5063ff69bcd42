#include "execution_store.hpp"

#include "internal/util/errors.hpp"

namespace edgerun::dispatch {

void ExecutionStore::Create(const model::ExecutionRecord& record) {
  if (record.execution_id.empty()) {
    throw util::ValidationError("execution_id required");
  }
  if (record.status != model::ExecutionStatus::kPending) {
    throw util::InvalidState("new execution must be pending: " + record.execution_id);
  }

  std::lock_guard lock(mutex_);
  auto [it, inserted] = records_.emplace(record.execution_id, record);
  if (!inserted) {
    throw util::AlreadyExists("execution already exists: " + record.execution_id);
  }
  ++counts_.total;
  ++counts_.pending;
}

model::ExecutionRecord ExecutionStore::Complete(const std::string& execution_id, const model::ExecutionOutcome& outcome, util::TimePoint completed_at) {
  if (!model::IsTerminal(outcome.status)) {
    throw util::InvalidState("outcome must be terminal: " + execution_id);
  }

  std::lock_guard lock(mutex_);
  auto            it = records_.find(execution_id);
  if (it == records_.end()) {
    throw util::NotFound("execution not found: " + execution_id);
  }

  auto& record = it->second;
  if (!model::CanTransition(record.status, outcome.status)) {
    throw util::InvalidState("execution " + execution_id + " already " + model::ToString(record.status));
  }

  record.status       = outcome.status;
  record.output       = outcome.output;
  record.error        = outcome.error;
  record.transport    = outcome.transport;
  record.error_kind   = outcome.error_kind;
  record.completed_at = completed_at;

  --counts_.pending;
  if (outcome.status == model::ExecutionStatus::kSuccess) {
    ++counts_.succeeded;
  } else {
    ++counts_.failed;
  }
  return record;
}

std::optional<model::ExecutionRecord> ExecutionStore::Get(const std::string& execution_id) const {
  std::lock_guard lock(mutex_);
  auto            it = records_.find(execution_id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

ExecutionCounts ExecutionStore::Counts() const {
  std::lock_guard lock(mutex_);
  return counts_;
}

size_t ExecutionStore::Size() const {
  std::lock_guard lock(mutex_);
  return records_.size();
}

} // namespace edgerun::dispatch
