#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "internal/exec/process_runner.hpp"
#include "internal/overlay/overlay_network.hpp"
#include "internal/remote/remote_shell.hpp"
#include "internal/util/errors.hpp"

namespace edgerun::testing {

inline exec::CommandResult Result(int exit_code, std::string output, std::string error = {}) {
  exec::CommandResult result;
  result.exit_code = exit_code;
  result.output    = std::move(output);
  result.error     = std::move(error);
  return result;
}

// Overlay double: readiness, bring-up and the secondary shell are all scripted.
class FakeOverlay final : public overlay::OverlayNetwork {
 public:
  explicit FakeOverlay(bool ready = true) : ready_(ready) {
  }

  void Initialize(const std::string& credential, util::Deadline) override {
    ++init_calls;
    if (!init_succeeds || credential.empty()) {
      throw util::NetworkUninitialized("fake overlay refused credential");
    }
    ready_ = true;
  }

  bool IsReady() const override {
    return ready_;
  }

  std::unique_ptr<overlay::OverlayConnection> Dial(const std::string& target, uint16_t, std::chrono::milliseconds) override {
    ++dial_calls;
    throw util::ConnectivityFailure("fake dial to " + target + " refused");
  }

  exec::CommandResult RunRemoteShell(const remote::RemoteTarget& target, const std::string& command, util::Deadline) override {
    std::lock_guard lock(mutex_);
    ++secondary_calls;
    last_secondary_target  = target.ToString();
    last_secondary_command = command;
    return secondary_result;
  }

  std::atomic<bool> init_succeeds{true};
  std::atomic<int>  init_calls{0};
  std::atomic<int>  dial_calls{0};
  std::atomic<int>  secondary_calls{0};

  exec::CommandResult secondary_result = Result(0, "secondary ok\n");
  std::string         last_secondary_target;
  std::string         last_secondary_command;

 private:
  std::mutex        mutex_;
  std::atomic<bool> ready_;
};

// Primary transport double returning a fixed result.
class ScriptedShell final : public remote::RemoteShell {
 public:
  explicit ScriptedShell(exec::CommandResult result) : result_(std::move(result)) {
  }

  exec::CommandResult Run(const remote::RemoteTarget& target, const std::string& command, util::Deadline) override {
    std::lock_guard lock(mutex_);
    ++calls;
    last_target  = target.ToString();
    last_command = command;
    if (throw_on_run) {
      throw util::ExecutionFailure("fake spawn failure");
    }
    // Answers late without noticing the deadline, like a remote that ignores it.
    std::this_thread::sleep_for(delay);
    return result_;
  }

  std::atomic<int>          calls{0};
  std::atomic<bool>         throw_on_run{false};
  std::chrono::milliseconds delay{0};
  std::string       last_target;
  std::string       last_command;

 private:
  std::mutex          mutex_;
  exec::CommandResult result_;
};

// Primary transport double that holds every call until Release() or the deadline.
class GatedShell final : public remote::RemoteShell {
 public:
  exec::CommandResult Run(const remote::RemoteTarget&, const std::string&, util::Deadline deadline) override {
    std::unique_lock lock(mutex_);
    ++calls;
    const bool released = cv_.wait_until(lock, deadline.At(), [this] { return released_; });
    if (!released) {
      exec::CommandResult result;
      result.timed_out = true;
      result.error     = "deadline exceeded";
      return result;
    }
    return Result(0, "released\n");
  }

  void Release() {
    {
      std::lock_guard lock(mutex_);
      released_ = true;
    }
    cv_.notify_all();
  }

  int Calls() {
    std::lock_guard lock(mutex_);
    return calls;
  }

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    released_{false};
  int                     calls{0};
};

// Process runner double that records argv instead of spawning.
class RecordingRunner final : public exec::ProcessRunner {
 public:
  exec::CommandResult Run(const std::vector<std::string>& argv, util::Deadline) override {
    std::lock_guard lock(mutex_);
    invocations.push_back(argv);
    return next_result;
  }

  std::vector<std::vector<std::string>> invocations;
  exec::CommandResult                   next_result = Result(0, "");

 private:
  std::mutex mutex_;
};

// Process runner double for a `tailscale up` that never completes on its own.
class StallingRunner final : public exec::ProcessRunner {
 public:
  exec::CommandResult Run(const std::vector<std::string>&, util::Deadline deadline) override {
    ++calls;
    std::this_thread::sleep_until(deadline.At());
    exec::CommandResult result;
    result.timed_out = true;
    result.error     = "deadline exceeded";
    return result;
  }

  std::atomic<int> calls{0};
};

} // namespace edgerun::testing
