#include "task_group.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace edgerun::dispatch {

TaskGroup::~TaskGroup() {
  Close();
  Wait();
}

void TaskGroup::ReapFinishedLocked() {
  for (auto id : finished_) {
    auto it = threads_.find(id);
    if (it == threads_.end()) continue;
    if (it->second.joinable()) it->second.join();
    threads_.erase(it);
  }
  finished_.clear();
}

void TaskGroup::Spawn(std::function<void()> task) {
  std::lock_guard lock(mutex_);
  if (closed_) {
    throw util::Unavailable("task group closed");
  }
  ReapFinishedLocked();

  // Allocate everything before the thread starts; nothing after that may throw.
  const auto id   = next_id_++;
  auto       slot = threads_.try_emplace(id).first;
  finished_.reserve(threads_.size());
  ++running_;
  try {
    slot->second = std::thread([this, id, task = std::move(task)] {
      try {
        task();
      } catch (const std::exception& e) {
        EDGERUN_LOG_ERROR("Background task failed", {observability::StringField("error", e.what())});
      }

      std::lock_guard done_lock(mutex_);
      finished_.push_back(id);
      --running_;
      idle_.notify_all();
    });
  } catch (...) {
    --running_;
    threads_.erase(slot);
    throw;
  }
}

void TaskGroup::Close() {
  std::lock_guard lock(mutex_);
  closed_ = true;
}

void TaskGroup::Wait() {
  std::unordered_map<uint64_t, std::thread> threads;
  {
    std::unique_lock lock(mutex_);
    idle_.wait(lock, [this] { return running_ == 0; });
    threads.swap(threads_);
    finished_.clear();
  }

  for (auto& [id, thread] : threads) {
    if (thread.joinable()) thread.join();
  }
}

size_t TaskGroup::Outstanding() const {
  std::lock_guard lock(mutex_);
  return running_;
}

} // namespace edgerun::dispatch
