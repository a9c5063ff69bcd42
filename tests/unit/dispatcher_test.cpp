#include "internal/dispatch/dispatcher.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <set>
#include <thread>

#include "fakes/fake_transports.hpp"
#include "internal/remote/denial_classifier.hpp"
#include "internal/remote/executor_chain.hpp"
#include "internal/util/errors.hpp"

namespace {

using edgerun::dispatch::Dispatcher;
using edgerun::dispatch::DispatcherOptions;
using edgerun::dispatch::ExecutionStore;
using edgerun::model::DeploymentIntent;
using edgerun::model::ErrorKind;
using edgerun::model::ExecutionRecord;
using edgerun::model::ExecutionRequest;
using edgerun::model::ExecutionStatus;
using edgerun::remote::ExecutorChain;
using edgerun::remote::ExecutorChainOptions;
using edgerun::remote::RemoteShell;
using edgerun::testing::FakeOverlay;
using edgerun::testing::GatedShell;
using edgerun::testing::Result;
using edgerun::testing::ScriptedShell;

std::unique_ptr<Dispatcher> MakeDispatcher(std::shared_ptr<RemoteShell> primary, std::shared_ptr<ExecutionStore> store,
                                           std::chrono::milliseconds deadline = std::chrono::seconds(5)) {
  auto overlay = std::make_shared<FakeOverlay>();
  auto chain   = std::make_shared<ExecutorChain>(overlay, nullptr, std::move(primary), edgerun::remote::SubstringDenialClassifier(), ExecutorChainOptions{});

  DispatcherOptions options;
  options.execution_deadline = deadline;
  return std::make_unique<Dispatcher>(std::move(store), std::move(chain), options);
}

ExecutionRequest Command(const std::string& device, std::vector<std::string> args) {
  ExecutionRequest request;
  request.device_id = device;
  request.command   = std::move(args);
  return request;
}

ExecutionRecord WaitForTerminal(const Dispatcher& dispatcher, const std::string& id, std::chrono::milliseconds limit = std::chrono::seconds(5)) {
  const auto until = std::chrono::steady_clock::now() + limit;
  for (;;) {
    auto record = dispatcher.GetStatus(id);
    if (record.status != ExecutionStatus::kPending || std::chrono::steady_clock::now() >= until) {
      return record;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestDispatchReturnsImmediatelyWithPendingRecord() {
  auto primary    = std::make_shared<GatedShell>();
  auto dispatcher = MakeDispatcher(primary, std::make_shared<ExecutionStore>());

  const auto id = dispatcher->Dispatch(Command("edge-01", {"uptime"}));
  assert(id.rfind("exec-edge-01-", 0) == 0);

  const auto record = dispatcher->GetStatus(id);
  assert(record.status == ExecutionStatus::kPending);
  assert(record.device_id == "edge-01");
  assert(record.command_line == "uptime");

  primary->Release();
  const auto done = WaitForTerminal(*dispatcher, id);
  assert(done.status == ExecutionStatus::kSuccess);
  assert(done.output == "released\n");
  assert(done.completed_at.has_value());
}

void TestIdenticalRequestsGetDistinctRecords() {
  auto dispatcher = MakeDispatcher(std::make_shared<ScriptedShell>(Result(0, "ok")), std::make_shared<ExecutionStore>());

  std::set<std::string> ids;
  for (int i = 0; i < 50; ++i) {
    ids.insert(dispatcher->Dispatch(Command("edge-02", {"hostname"})));
  }
  assert(ids.size() == 50);

  dispatcher->Shutdown();
  const auto counts = dispatcher->Stats();
  assert(counts.total == 50);
  assert(counts.succeeded == 50);
  assert(counts.pending == 0);
}

void TestDeploymentIntentIsBuiltAndStored() {
  auto primary    = std::make_shared<ScriptedShell>(Result(0, "container-id\n"));
  auto dispatcher = MakeDispatcher(primary, std::make_shared<ExecutionStore>());

  ExecutionRequest request;
  request.device_id  = "edge-03";
  request.deployment = DeploymentIntent{"zed", "dummy-zed:latest"};

  const auto id = dispatcher->Dispatch(request);
  dispatcher->Shutdown();

  const auto record = dispatcher->GetStatus(id);
  assert(record.command_line == "docker pull dummy-zed:latest && docker run -d --name zed-instance --restart=unless-stopped dummy-zed:latest");
  assert(primary->last_command == record.command_line);
  assert(record.status == ExecutionStatus::kSuccess);
}

void TestInvalidRequestsCreateNoRecord() {
  auto store      = std::make_shared<ExecutionStore>();
  auto dispatcher = MakeDispatcher(std::make_shared<ScriptedShell>(Result(0, "")), store);

  using edgerun::util::ValidationError;
  assert(Throws<ValidationError>([&] { dispatcher->Dispatch(Command("", {"uptime"})); }));
  assert(Throws<ValidationError>([&] { dispatcher->Dispatch(Command("edge-04", {})); }));

  ExecutionRequest both = Command("edge-04", {"uptime"});
  both.deployment       = DeploymentIntent{"zed", "dummy-zed:latest"};
  assert(Throws<ValidationError>([&] { dispatcher->Dispatch(both); }));

  ExecutionRequest partial;
  partial.device_id  = "edge-04";
  partial.deployment = DeploymentIntent{"zed", ""};
  assert(Throws<ValidationError>([&] { dispatcher->Dispatch(partial); }));

  assert(store->Size() == 0);
}

void TestUnknownIdIsNotFound() {
  auto dispatcher = MakeDispatcher(std::make_shared<ScriptedShell>(Result(0, "")), std::make_shared<ExecutionStore>());
  assert(Throws<edgerun::util::NotFound>([&] { dispatcher->GetStatus("exec-nobody-1"); }));
}

void TestOverrunReachesErrorWithinDeadline() {
  auto primary    = std::make_shared<GatedShell>();
  auto dispatcher = MakeDispatcher(primary, std::make_shared<ExecutionStore>(), std::chrono::milliseconds(150));

  const auto started = std::chrono::steady_clock::now();
  const auto id      = dispatcher->Dispatch(Command("edge-05", {"sleep", "600"}));
  const auto record  = WaitForTerminal(*dispatcher, id, std::chrono::seconds(3));

  assert(record.status == ExecutionStatus::kError);
  assert(record.error_kind == ErrorKind::kDeadlineExceeded);
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(2));
}

void TestShutdownDrainsAndRejectsNewWork() {
  auto primary    = std::make_shared<GatedShell>();
  auto dispatcher = MakeDispatcher(primary, std::make_shared<ExecutionStore>());

  const auto id = dispatcher->Dispatch(Command("edge-06", {"uptime"}));
  std::thread releaser([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    primary->Release();
  });

  dispatcher->Shutdown();
  releaser.join();

  assert(dispatcher->Outstanding() == 0);
  assert(dispatcher->GetStatus(id).status == ExecutionStatus::kSuccess);
  assert(Throws<edgerun::util::Unavailable>([&] { dispatcher->Dispatch(Command("edge-06", {"uptime"})); }));
}

} // namespace

int main() {
  TestDispatchReturnsImmediatelyWithPendingRecord();
  TestIdenticalRequestsGetDistinctRecords();
  TestDeploymentIntentIsBuiltAndStored();
  TestInvalidRequestsCreateNoRecord();
  TestUnknownIdIsNotFound();
  TestOverrunReachesErrorWithinDeadline();
  TestShutdownDrainsAndRejectsNewWork();

  std::cout << "edgerun_unit_dispatcher: pass\n";
  return 0;
}
