#include "health_service.hpp"

#include "internal/bulk/run_queue.hpp"
#include "internal/bulk/run_worker.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/storage/blob_store.hpp"
#include "observe_rpc.hpp"
#include "framecomp/v1.hpp"

namespace framecomp::service {

using namespace framecomp::v1;

namespace {

HealthResponse Probe(const std::string& component, bool healthy, const std::string& detail) {
  HealthResponse resp;
  resp.set_component(component);
  resp.set_healthy(healthy);
  resp.set_detail(detail);
  return resp;
}

} // namespace

HealthService::HealthService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

HealthResponse HealthService::Liveness(const HealthRequest&) {
  return ObserveRpc("HealthService.Liveness", "", [&] { return Probe("liveness", true, "serving"); });
}

HealthResponse HealthService::Storage(const HealthRequest&) {
  return ObserveRpc("HealthService.Storage", "", [&] {
    auto ping = ctx_.repository->Ping();
    if (!ping) {
      return Probe("storage", false, "repository: " + ping.message);
    }
    try {
      ctx_.blobs->Probe();
    } catch (const std::exception& e) {
      return Probe("storage", false, ctx_.blobs->Name() + ": " + e.what());
    }
    return Probe("storage", true, "repository and " + ctx_.blobs->Name() + " reachable");
  });
}

HealthResponse HealthService::TaskQueue(const HealthRequest&) {
  return ObserveRpc("HealthService.TaskQueue", "", [&] {
    if (!ctx_.run_queue || !ctx_.run_queue->IsAccepting()) {
      return Probe("task_queue", false, "run queue is shut down");
    }
    size_t alive = 0;
    for (const auto& worker : ctx_.run_workers) {
      if (worker && worker->IsAlive()) ++alive;
    }
    if (ctx_.run_workers.empty() || alive != ctx_.run_workers.size()) {
      return Probe("task_queue", false,
                   std::to_string(alive) + "/" + std::to_string(ctx_.run_workers.size()) + " run workers alive");
    }
    return Probe("task_queue", true,
                 std::to_string(alive) + " run workers, " + std::to_string(ctx_.run_queue->Depth()) + " runs queued");
  });
}

} // namespace framecomp::service
