#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "internal/exec/command_result.hpp"
#include "internal/remote/remote_shell.hpp"
#include "internal/util/deadline.hpp"

namespace edgerun::overlay {

// An open transport-level connection to a peer.
class OverlayConnection {
 public:
  virtual ~OverlayConnection() = default;

  virtual std::string RemoteAddress() const = 0;
  virtual void        Close()               = 0;
};

/*
  Process-wide identity/transport provider of the private overlay network.

  Created once in the composition root and shared by every execution.

  Initialize  throws util::NetworkUninitialized on failure, including when
              bring-up cannot finish before `deadline`.
  Dial        throws util::ConnectivityFailure on failure.
  RunRemoteShell is the overlay's own remote shell (the secondary transport);
  it takes no connection-tuning options.
*/
class OverlayNetwork {
 public:
  virtual ~OverlayNetwork() = default;

  virtual void Initialize(const std::string& credential, util::Deadline deadline) = 0;
  virtual bool IsReady() const                                                    = 0;

  virtual std::unique_ptr<OverlayConnection> Dial(const std::string& target, uint16_t port, std::chrono::milliseconds timeout) = 0;

  virtual exec::CommandResult RunRemoteShell(const remote::RemoteTarget& target, const std::string& command, util::Deadline deadline) = 0;
};

} // namespace edgerun::overlay
