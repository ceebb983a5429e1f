#pragma once

#include <atomic>
#include <memory>
#include <thread>

#include "run_queue.hpp"

namespace framecomp::bulk {

class BulkOrchestrator;

/*
  Background worker that drives queued bulk runs.

  Executes:
      RunQueue → BulkOrchestrator::Execute
*/
class RunWorker {
 public:
  RunWorker(std::shared_ptr<RunQueue> queue, std::shared_ptr<BulkOrchestrator> orchestrator);
  ~RunWorker();

  void Start();
  // Joins the thread, then cancels every run still waiting in the queue.
  void Stop();

  bool IsAlive() const {
    return alive_;
  }

 private:
  void Run();

  std::shared_ptr<RunQueue>         queue_;
  std::shared_ptr<BulkOrchestrator> orchestrator_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> alive_{false};
};

} // namespace framecomp::bulk
