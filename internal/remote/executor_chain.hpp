#pragma once

#include <memory>
#include <string>

#include "internal/model/execution.hpp"
#include "internal/remote/denial_classifier.hpp"
#include "internal/remote/remote_shell.hpp"
#include "internal/util/deadline.hpp"

namespace edgerun::overlay {
class OverlayNetwork;
}

namespace edgerun::remote {

class Prober;

/*
  Per-execution progress through the chain. Only used for logging.

    NotStarted -> ProbeAttempted -> PrimaryAttempted -> Succeeded | Failed
                                                     -> FallbackAttempted -> Succeeded | Failed
*/
enum class ChainState {
  kNotStarted,
  kProbeAttempted,
  kPrimaryAttempted,
  kFallbackAttempted,
  kSucceeded,
  kFailed,
};

const char* ToString(ChainState state);

struct ExecutorChainOptions {
  std::string remote_user{"root"};
  // Handed to OverlayNetwork::Initialize when the overlay is not yet ready.
  std::string overlay_credential;
};

/*
  Runs one command line on one device:

    1. overlay readiness (one lazy Initialize attempt, bounded by the deadline)
    2. probe, result is advisory only
    3. primary transport
    4. at most one secondary attempt, only when the classifier says the
       primary was rejected by policy and the deadline has not passed

  Run never throws; every failure becomes an ExecutionOutcome.
*/
class ExecutorChain {
 public:
  ExecutorChain(std::shared_ptr<overlay::OverlayNetwork> overlay,
                std::shared_ptr<Prober>                  prober,
                std::shared_ptr<RemoteShell>             primary,
                DenialClassifier                         classifier,
                ExecutorChainOptions                     options);

  model::ExecutionOutcome Run(const std::string& device_id, const std::string& command_line, util::Deadline deadline) const;

 private:
  bool EnsureOverlayReady(const util::Deadline& deadline, std::string* reason) const;

  std::shared_ptr<overlay::OverlayNetwork> overlay_;
  std::shared_ptr<Prober>                  prober_;
  std::shared_ptr<RemoteShell>             primary_;
  DenialClassifier                         classifier_;
  ExecutorChainOptions                     options_;
};

} // namespace edgerun::remote
