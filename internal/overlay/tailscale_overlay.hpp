#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/exec/process_runner.hpp"
#include "internal/overlay/overlay_network.hpp"
#include "internal/overlay/tcp_dialer.hpp"

namespace edgerun::overlay {

struct TailscaleOptions {
  std::string               binary{"tailscale"};
  std::string               hostname{"ts-sidecar"};
  std::string               socket_path;
  std::chrono::milliseconds init_timeout{30'000};
};

/*
  Overlay capability backed by a local tailscaled, driven through the
  `tailscale` CLI.

  Initialize brings the node up with an auth key; raw dials go through the
  host network stack, which tailscaled routes into the tailnet.

  Only one `tailscale up` runs at a time. A caller waits for it no longer
  than its own deadline, and the run itself is cut to the caller's
  remaining time.
*/
class TailscaleOverlay final : public OverlayNetwork {
 public:
  TailscaleOverlay(TailscaleOptions options, std::shared_ptr<exec::ProcessRunner> runner);

  void Initialize(const std::string& credential, util::Deadline deadline) override;
  bool IsReady() const override;

  std::unique_ptr<OverlayConnection> Dial(const std::string& target, uint16_t port, std::chrono::milliseconds timeout) override;

  exec::CommandResult RunRemoteShell(const remote::RemoteTarget& target, const std::string& command, util::Deadline deadline) override;

  std::vector<std::string> UpArguments(const std::string& credential) const;
  std::vector<std::string> SshArguments(const remote::RemoteTarget& target, const std::string& command) const;

 private:
  std::vector<std::string> BaseArguments() const;

  TailscaleOptions                     options_;
  std::shared_ptr<exec::ProcessRunner> runner_;

  TcpDialer dialer_;

  std::timed_mutex  init_mutex_;
  std::atomic<bool> ready_{false};
};

} // namespace edgerun::overlay
