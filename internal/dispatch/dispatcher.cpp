#include "dispatcher.hpp"

#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"
#include "internal/remote/executor_chain.hpp"
#include "internal/util/errors.hpp"

namespace edgerun::dispatch {

using observability::DurationField;
using observability::StringField;

Dispatcher::Dispatcher(std::shared_ptr<ExecutionStore> store, std::shared_ptr<remote::ExecutorChain> chain, DispatcherOptions options)
    : store_(std::move(store)), chain_(std::move(chain)), options_(std::move(options)) {
  if (!store_ || !chain_) {
    throw std::invalid_argument("Dispatcher: store and executor chain are required");
  }
}

Dispatcher::~Dispatcher() {
  Shutdown();
}

void Dispatcher::Validate(const model::ExecutionRequest& request) {
  if (request.device_id.empty()) {
    throw util::ValidationError("device_id required");
  }

  const bool has_command    = !request.command.empty();
  const bool has_deployment = request.deployment.has_value();
  if (has_command && has_deployment) {
    throw util::ValidationError("command and deployment are mutually exclusive");
  }
  if (has_deployment && !request.deployment->Complete()) {
    throw util::ValidationError("deployment requires app_type and app_reference");
  }
  if (!has_command && !has_deployment) {
    throw util::ValidationError("command or deployment required");
  }
}

std::string Dispatcher::Dispatch(const model::ExecutionRequest& request) {
  Validate(request);
  if (!accepting_.load()) {
    throw util::Unavailable("dispatcher is shutting down");
  }

  model::ExecutionRecord record;
  record.execution_id = ids_.Next(request.device_id);
  record.device_id    = request.device_id;
  record.command_line = remote::BuildCommandLine(request, options_.builder);
  record.status       = model::ExecutionStatus::kPending;
  record.created_at   = util::Now();
  store_->Create(record);

  try {
    tasks_.Spawn([this, id = record.execution_id, device = record.device_id, line = record.command_line] { RunExecution(id, device, line); });
  } catch (const std::exception& e) {
    model::ExecutionOutcome outcome;
    outcome.error      = std::string("execution not started: ") + e.what();
    outcome.error_kind = model::ErrorKind::kExecutionFailure;
    store_->Complete(record.execution_id, outcome, util::Now());
    PublishCounts();
    throw util::Unavailable(outcome.error);
  }

  EDGERUN_LOG_INFO("Execution dispatched", {StringField("execution_id", record.execution_id), StringField("device_id", record.device_id)});
  PublishCounts();
  return record.execution_id;
}

void Dispatcher::RunExecution(const std::string& execution_id, const std::string& device_id, const std::string& command_line) {
  observability::SpanScope span("Dispatcher.Execute");
  span.SetAttribute("execution.id", execution_id);
  span.SetAttribute("device.id", device_id);

  const auto started_at = std::chrono::steady_clock::now();

  model::ExecutionOutcome outcome;
  try {
    outcome = chain_->Run(device_id, command_line, util::Deadline::After(options_.execution_deadline));
  } catch (const std::exception& e) {
    outcome.status     = model::ExecutionStatus::kError;
    outcome.error      = e.what();
    outcome.error_kind = model::ErrorKind::kExecutionFailure;
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at);
  const bool success = outcome.status == model::ExecutionStatus::kSuccess;

  span.SetAttribute("execution.transport", model::ToString(outcome.transport));
  span.SetAttribute("execution.status", model::ToString(outcome.status));
  if (!success) {
    span.MarkFailed(outcome.error);
  }
  observability::Metrics::Instance().ObserveExecutionDurationMs(model::ToString(outcome.transport), success, static_cast<double>(elapsed.count()));

  try {
    store_->Complete(execution_id, outcome, util::Now());
  } catch (const std::exception& e) {
    EDGERUN_LOG_ERROR("Failed to record execution result", {StringField("execution_id", execution_id), StringField("error", e.what())});
    return;
  }
  PublishCounts();

  if (success) {
    EDGERUN_LOG_INFO("Execution succeeded", {StringField("execution_id", execution_id), StringField("transport", model::ToString(outcome.transport)),
                                             DurationField("elapsed", elapsed)});
  } else {
    EDGERUN_LOG_WARN("Execution failed", {StringField("execution_id", execution_id), StringField("error_kind", model::ToString(outcome.error_kind)),
                                          StringField("error", outcome.error), DurationField("elapsed", elapsed)});
  }
}

model::ExecutionRecord Dispatcher::GetStatus(const std::string& execution_id) const {
  auto record = store_->Get(execution_id);
  if (!record) {
    throw util::NotFound("execution not found: " + execution_id);
  }
  return *record;
}

ExecutionCounts Dispatcher::Stats() const {
  return store_->Counts();
}

size_t Dispatcher::Outstanding() const {
  return tasks_.Outstanding();
}

void Dispatcher::PublishCounts() const {
  const auto counts = store_->Counts();
  auto&      metrics = observability::Metrics::Instance();
  metrics.SetExecutionRecords("pending", counts.pending);
  metrics.SetExecutionRecords("success", counts.succeeded);
  metrics.SetExecutionRecords("error", counts.failed);
}

void Dispatcher::Shutdown() {
  if (accepting_.exchange(false)) {
    EDGERUN_LOG_INFO("Dispatcher draining", {observability::IntField("outstanding", static_cast<int64_t>(tasks_.Outstanding()))});
  }
  tasks_.Close();
  tasks_.Wait();
}

} // namespace edgerun::dispatch
