#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace edgerun::dispatch {

/*
  Owns the detached-from-the-caller executions: one thread per task.

  Spawn never waits for the task. Finished threads are joined lazily on the
  next Spawn, and Wait joins everything that is left. After Close, Spawn
  throws util::Unavailable.
*/
class TaskGroup {
 public:
  TaskGroup() = default;
  ~TaskGroup();

  TaskGroup(const TaskGroup&)            = delete;
  TaskGroup& operator=(const TaskGroup&) = delete;

  void Spawn(std::function<void()> task);

  void   Close();
  void   Wait();
  size_t Outstanding() const;

 private:
  void ReapFinishedLocked();

  mutable std::mutex      mutex_;
  std::condition_variable idle_;

  std::unordered_map<uint64_t, std::thread> threads_;
  std::vector<uint64_t>                     finished_;

  uint64_t next_id_{0};
  size_t   running_{0};
  bool     closed_{false};
};

} // namespace edgerun::dispatch
