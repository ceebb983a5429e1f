#include "run_worker.hpp"

#include "internal/observability/logging.hpp"
#include "orchestrator.hpp"

namespace framecomp::bulk {

RunWorker::RunWorker(std::shared_ptr<RunQueue> queue, std::shared_ptr<BulkOrchestrator> orchestrator)
    : queue_(std::move(queue)), orchestrator_(std::move(orchestrator)) {
}

RunWorker::~RunWorker() {
  Stop();
}

void RunWorker::Start() {
  running_ = true;
  alive_   = true;
  thread_  = std::thread(&RunWorker::Run, this);
}

void RunWorker::Stop() {
  queue_->Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();

  // runs that never started would otherwise stay queued forever
  for (const auto& task : queue_->Drain()) {
    orchestrator_->Abandon(task, "run cancelled by shutdown before it started");
  }
}

void RunWorker::Run() {
  while (running_) {
    auto task = queue_->Dequeue();
    if (!task) break;

    try {
      orchestrator_->Execute(*task);
    } catch (const std::exception& e) {
      FRAMECOMP_LOG_ERROR("bulk run aborted", {observability::StringField("project_id", task->project_id),
                                               observability::StringField("run_id", task->run_id),
                                               observability::StringField("error", e.what())});
    }
  }
  alive_ = false;
}

} // namespace framecomp::bulk
