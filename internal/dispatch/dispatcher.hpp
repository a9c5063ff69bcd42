#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include "internal/dispatch/execution_store.hpp"
#include "internal/dispatch/task_group.hpp"
#include "internal/model/execution.hpp"
#include "internal/remote/command_builder.hpp"
#include "internal/util/execution_id.hpp"

namespace edgerun::remote {
class ExecutorChain;
}

namespace edgerun::dispatch {

struct DispatcherOptions {
  std::chrono::milliseconds     execution_deadline{60'000};
  remote::CommandBuilderOptions builder;
};

/*
  Accepts execution requests and runs them in the background.

  Dispatch returns as soon as the Pending record exists; the result is
  observed later through GetStatus.
*/
class Dispatcher {
 public:
  Dispatcher(std::shared_ptr<ExecutionStore> store, std::shared_ptr<remote::ExecutorChain> chain, DispatcherOptions options = {});
  ~Dispatcher();

  Dispatcher(const Dispatcher&)            = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  // Throws util::ValidationError (no record created) or util::Unavailable.
  std::string Dispatch(const model::ExecutionRequest& request);

  // Throws util::NotFound.
  model::ExecutionRecord GetStatus(const std::string& execution_id) const;

  ExecutionCounts Stats() const;
  size_t          Outstanding() const;

  // Stops accepting and waits for every in-flight execution.
  void Shutdown();

  static void Validate(const model::ExecutionRequest& request);

 private:
  void RunExecution(const std::string& execution_id, const std::string& device_id, const std::string& command_line);
  void PublishCounts() const;

  std::shared_ptr<ExecutionStore>        store_;
  std::shared_ptr<remote::ExecutorChain> chain_;
  DispatcherOptions                      options_;

  util::ExecutionIdGenerator ids_;
  TaskGroup                  tasks_;
  std::atomic<bool>          accepting_{true};
};

} // namespace edgerun::dispatch
