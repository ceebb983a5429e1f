#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

#include "run_task.hpp"

namespace framecomp::bulk {

/*
  Thread-safe blocking queue for run workers.
*/
class RunQueue {
 public:
  // false once Shutdown() was called
  bool Enqueue(const RunTask& task);

  // blocking wait; nullopt once Shutdown() was called, even if tasks remain
  std::optional<RunTask> Dequeue();

  // Removes and returns every task that was never dequeued.
  std::vector<RunTask> Drain();

  void Shutdown();

  bool IsAccepting() const;
  size_t Depth() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<RunTask>     queue_;
  bool                    shutdown_ = false;
};

} // namespace framecomp::bulk
