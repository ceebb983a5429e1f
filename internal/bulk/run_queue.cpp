#include "run_queue.hpp"

namespace framecomp::bulk {

bool RunQueue::Enqueue(const RunTask& task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push(task);
  }
  cv_.notify_one();
  return true;
}

std::optional<RunTask> RunQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_) return std::nullopt;

  RunTask task = queue_.front();
  queue_.pop();
  return task;
}

std::vector<RunTask> RunQueue::Drain() {
  std::lock_guard      lock(mutex_);
  std::vector<RunTask> tasks;
  tasks.reserve(queue_.size());
  while (!queue_.empty()) {
    tasks.push_back(queue_.front());
    queue_.pop();
  }
  return tasks;
}

void RunQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

bool RunQueue::IsAccepting() const {
  std::lock_guard lock(mutex_);
  return !shutdown_;
}

size_t RunQueue::Depth() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace framecomp::bulk
