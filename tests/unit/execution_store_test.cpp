#include "internal/dispatch/execution_store.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using edgerun::dispatch::ExecutionStore;
using edgerun::model::ErrorKind;
using edgerun::model::ExecutionOutcome;
using edgerun::model::ExecutionRecord;
using edgerun::model::ExecutionStatus;
using edgerun::model::Transport;

ExecutionRecord Pending(const std::string& id) {
  ExecutionRecord record;
  record.execution_id = id;
  record.device_id    = "device-a";
  record.command_line = "uptime";
  record.created_at   = edgerun::util::Now();
  return record;
}

ExecutionOutcome Success(const std::string& output) {
  ExecutionOutcome outcome;
  outcome.status    = ExecutionStatus::kSuccess;
  outcome.output    = output;
  outcome.transport = Transport::kPrimary;
  return outcome;
}

void TestCreateThenGetReturnsPendingCopy() {
  ExecutionStore store;
  store.Create(Pending("exec-1"));

  auto record = store.Get("exec-1");
  assert(record.has_value());
  assert(record->status == ExecutionStatus::kPending);
  assert(!record->completed_at.has_value());

  record->output = "mutated";
  assert(store.Get("exec-1")->output.empty());
}

void TestDuplicateCreateIsRejected() {
  ExecutionStore store;
  store.Create(Pending("exec-dup"));

  bool threw = false;
  try {
    store.Create(Pending("exec-dup"));
  } catch (const edgerun::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);
  assert(store.Size() == 1);
}

void TestCompleteMovesToTerminalOnce() {
  ExecutionStore store;
  store.Create(Pending("exec-2"));

  const auto done = store.Complete("exec-2", Success("up 3 days\n"), edgerun::util::Now());
  assert(done.status == ExecutionStatus::kSuccess);
  assert(done.output == "up 3 days\n");
  assert(done.transport == Transport::kPrimary);
  assert(done.completed_at.has_value());

  ExecutionOutcome failure;
  failure.status     = ExecutionStatus::kError;
  failure.error      = "late";
  failure.error_kind = ErrorKind::kExecutionFailure;

  bool threw = false;
  try {
    store.Complete("exec-2", failure, edgerun::util::Now());
  } catch (const edgerun::util::InvalidState&) {
    threw = true;
  }
  assert(threw && "a record completes exactly once");
  assert(store.Get("exec-2")->status == ExecutionStatus::kSuccess);
}

void TestCompleteUnknownIdIsNotFound() {
  ExecutionStore store;

  bool threw = false;
  try {
    store.Complete("exec-missing", Success(""), edgerun::util::Now());
  } catch (const edgerun::util::NotFound&) {
    threw = true;
  }
  assert(threw);
  assert(!store.Get("exec-missing").has_value());
}

void TestCountsTrackEveryStatus() {
  ExecutionStore store;
  store.Create(Pending("a"));
  store.Create(Pending("b"));
  store.Create(Pending("c"));

  store.Complete("a", Success("ok"), edgerun::util::Now());

  ExecutionOutcome failure;
  failure.status = ExecutionStatus::kError;
  store.Complete("b", failure, edgerun::util::Now());

  const auto counts = store.Counts();
  assert(counts.total == 3);
  assert(counts.pending == 1);
  assert(counts.succeeded == 1);
  assert(counts.failed == 1);
}

} // namespace

int main() {
  TestCreateThenGetReturnsPendingCopy();
  TestDuplicateCreateIsRejected();
  TestCompleteMovesToTerminalOnce();
  TestCompleteUnknownIdIsNotFound();
  TestCountsTrackEveryStatus();

  std::cout << "edgerun_unit_execution_store: pass\n";
  return 0;
}
