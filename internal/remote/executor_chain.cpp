#include "executor_chain.hpp"

#include <functional>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/overlay/overlay_network.hpp"
#include "internal/remote/prober.hpp"
#include "internal/util/errors.hpp"

namespace edgerun::remote {

using observability::IntField;
using observability::StringField;

namespace {

model::ExecutionOutcome Failure(std::string error, model::ErrorKind kind, model::Transport transport = model::Transport::kNone, std::string output = {}) {
  model::ExecutionOutcome outcome;
  outcome.status     = model::ExecutionStatus::kError;
  outcome.output     = std::move(output);
  outcome.error      = std::move(error);
  outcome.transport  = transport;
  outcome.error_kind = kind;
  return outcome;
}

model::ExecutionOutcome FromResult(exec::CommandResult result, model::Transport transport) {
  if (result.Succeeded()) {
    model::ExecutionOutcome outcome;
    outcome.status    = model::ExecutionStatus::kSuccess;
    outcome.output    = std::move(result.output);
    outcome.transport = transport;
    return outcome;
  }

  auto error = result.error.empty() ? "exit status " + std::to_string(result.exit_code) : result.error;
  auto kind  = result.timed_out ? model::ErrorKind::kDeadlineExceeded : model::ErrorKind::kExecutionFailure;
  return Failure(std::move(error), kind, transport, std::move(result.output));
}

// Transports signal launch problems with ExecutionFailure; fold them into a result.
exec::CommandResult Attempt(const std::function<exec::CommandResult()>& run) {
  try {
    return run();
  } catch (const util::ExecutionFailure& e) {
    exec::CommandResult result;
    result.error = e.what();
    return result;
  }
}

} // namespace

const char* ToString(ChainState state) {
  switch (state) {
    case ChainState::kNotStarted:
      return "not_started";
    case ChainState::kProbeAttempted:
      return "probe_attempted";
    case ChainState::kPrimaryAttempted:
      return "primary_attempted";
    case ChainState::kFallbackAttempted:
      return "fallback_attempted";
    case ChainState::kSucceeded:
      return "succeeded";
    case ChainState::kFailed:
      return "failed";
  }
  return "unknown";
}

ExecutorChain::ExecutorChain(std::shared_ptr<overlay::OverlayNetwork> overlay,
                             std::shared_ptr<Prober>                  prober,
                             std::shared_ptr<RemoteShell>             primary,
                             DenialClassifier                         classifier,
                             ExecutorChainOptions                     options)
    : overlay_(std::move(overlay)),
      prober_(std::move(prober)),
      primary_(std::move(primary)),
      classifier_(std::move(classifier)),
      options_(std::move(options)) {
  if (!overlay_ || !primary_) {
    throw std::invalid_argument("ExecutorChain: overlay and primary transport are required");
  }
}

bool ExecutorChain::EnsureOverlayReady(const util::Deadline& deadline, std::string* reason) const {
  if (overlay_->IsReady()) {
    return true;
  }

  if (options_.overlay_credential.empty()) {
    *reason = "overlay network not initialized";
    return false;
  }

  try {
    overlay_->Initialize(options_.overlay_credential, deadline);
  } catch (const util::NetworkUninitialized& e) {
    *reason = std::string("overlay network not initialized: ") + e.what();
    return false;
  }

  if (!overlay_->IsReady()) {
    *reason = "overlay network not initialized";
    return false;
  }
  return true;
}

model::ExecutionOutcome ExecutorChain::Run(const std::string& device_id, const std::string& command_line, util::Deadline deadline) const {
  auto state   = ChainState::kNotStarted;
  auto advance = [&](ChainState next) {
    EDGERUN_LOG_DEBUG("Executor chain transition", {StringField("device_id", device_id), StringField("from", ToString(state)), StringField("to", ToString(next))});
    state = next;
  };
  auto finish = [&](model::ExecutionOutcome outcome) {
    advance(outcome.status == model::ExecutionStatus::kSuccess ? ChainState::kSucceeded : ChainState::kFailed);
    return outcome;
  };

  try {
    std::string reason;
    if (!EnsureOverlayReady(deadline, &reason)) {
      EDGERUN_LOG_ERROR("Overlay not ready, execution aborted", {StringField("device_id", device_id), StringField("error", reason)});
      return finish(Failure(reason, model::ErrorKind::kNetworkUninitialized));
    }

    if (prober_) {
      prober_->Probe(device_id, deadline);
    }
    advance(ChainState::kProbeAttempted);

    if (deadline.Expired()) {
      return finish(Failure("deadline exceeded before remote execution", model::ErrorKind::kDeadlineExceeded));
    }

    const RemoteTarget target{options_.remote_user, device_id};
    auto primary = Attempt([&] { return primary_->Run(target, command_line, deadline); });
    advance(ChainState::kPrimaryAttempted);

    if (primary.Succeeded()) {
      EDGERUN_LOG_INFO("Primary transport succeeded", {StringField("device_id", device_id)});
      return finish(FromResult(std::move(primary), model::Transport::kPrimary));
    }

    const bool denied = !primary.timed_out && classifier_ && classifier_(primary.output);
    if (!denied) {
      EDGERUN_LOG_WARN("Primary transport failed",
                       {StringField("device_id", device_id), IntField("exit_code", primary.exit_code), StringField("error", primary.error)});
      return finish(FromResult(std::move(primary), model::Transport::kPrimary));
    }

    if (deadline.Expired()) {
      EDGERUN_LOG_WARN("Primary transport denied by policy but deadline passed", {StringField("device_id", device_id)});
      auto outcome       = FromResult(std::move(primary), model::Transport::kPrimary);
      outcome.error_kind = model::ErrorKind::kDeadlineExceeded;
      return finish(std::move(outcome));
    }

    EDGERUN_LOG_WARN("Primary transport denied by overlay policy, falling back", {StringField("device_id", device_id)});
    advance(ChainState::kFallbackAttempted);
    auto secondary = Attempt([&] { return overlay_->RunRemoteShell(target, command_line, deadline); });
    if (!secondary.Succeeded()) {
      EDGERUN_LOG_WARN("Secondary transport failed",
                       {StringField("device_id", device_id), IntField("exit_code", secondary.exit_code), StringField("error", secondary.error)});
    }
    return finish(FromResult(std::move(secondary), model::Transport::kSecondary));
  } catch (const std::exception& e) {
    EDGERUN_LOG_ERROR("Executor chain failed", {StringField("device_id", device_id), StringField("error", e.what())});
    return finish(Failure(e.what(), model::ErrorKind::kExecutionFailure));
  }
}

} // namespace edgerun::remote
