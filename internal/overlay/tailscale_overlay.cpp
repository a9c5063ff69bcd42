#include "tailscale_overlay.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace edgerun::overlay {

namespace {

constexpr size_t kMaxDiagnosticBytes = 512;

std::string Truncate(const std::string& text) {
  if (text.size() <= kMaxDiagnosticBytes) {
    return text;
  }
  return text.substr(0, kMaxDiagnosticBytes) + "...";
}

} // namespace

TailscaleOverlay::TailscaleOverlay(TailscaleOptions options, std::shared_ptr<exec::ProcessRunner> runner)
    : options_(std::move(options)), runner_(std::move(runner)) {
}

std::vector<std::string> TailscaleOverlay::BaseArguments() const {
  std::vector<std::string> args{options_.binary};
  if (!options_.socket_path.empty()) {
    args.push_back("--socket=" + options_.socket_path);
  }
  return args;
}

std::vector<std::string> TailscaleOverlay::UpArguments(const std::string& credential) const {
  auto args = BaseArguments();
  args.push_back("up");
  args.push_back("--authkey=" + credential);
  if (!options_.hostname.empty()) {
    args.push_back("--hostname=" + options_.hostname);
  }
  return args;
}

std::vector<std::string> TailscaleOverlay::SshArguments(const remote::RemoteTarget& target, const std::string& command) const {
  auto args = BaseArguments();
  args.push_back("ssh");
  args.push_back(target.ToString());
  args.push_back(command);
  return args;
}

void TailscaleOverlay::Initialize(const std::string& credential, util::Deadline deadline) {
  std::unique_lock lock(init_mutex_, std::defer_lock);
  if (!lock.try_lock_until(deadline.At())) {
    throw util::NetworkUninitialized("overlay bring-up still in progress");
  }
  if (ready_) {
    return;
  }

  if (credential.empty()) {
    throw util::NetworkUninitialized("overlay auth key not set");
  }

  const auto budget = deadline.Clamp(options_.init_timeout);
  if (budget <= std::chrono::milliseconds::zero()) {
    throw util::NetworkUninitialized("no time left to bring the overlay up");
  }

  exec::CommandResult result;
  try {
    result = runner_->Run(UpArguments(credential), util::Deadline::After(budget));
  } catch (const util::ExecutionFailure& e) {
    throw util::NetworkUninitialized(std::string("tailscale up failed: ") + e.what());
  }

  if (!result.Succeeded()) {
    throw util::NetworkUninitialized("tailscale up failed: " + result.error + ": " + Truncate(result.output));
  }

  ready_ = true;
  EDGERUN_LOG_INFO("Overlay network initialized", {observability::StringField("hostname", options_.hostname)});
}

bool TailscaleOverlay::IsReady() const {
  return ready_;
}

std::unique_ptr<OverlayConnection> TailscaleOverlay::Dial(const std::string& target, uint16_t port, std::chrono::milliseconds timeout) {
  return dialer_.Dial(target, port, timeout);
}

exec::CommandResult TailscaleOverlay::RunRemoteShell(const remote::RemoteTarget& target, const std::string& command, util::Deadline deadline) {
  return runner_->Run(SshArguments(target, command), deadline);
}

} // namespace edgerun::overlay
