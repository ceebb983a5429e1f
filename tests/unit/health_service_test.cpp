#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/service/health_service.hpp"
#include "internal/storage/ram/ram_blob_store.hpp"
#include "support/harness.hpp"

namespace {

using framecomp::testing::Harness;
using framecomp::v1::HealthRequest;

class UnreachableBlobStore final : public framecomp::storage::BlobStore {
 public:
  std::shared_ptr<arrow::Buffer> Read(const std::string&) override {
    throw std::runtime_error("unreachable");
  }
  void Write(const std::string&, const std::shared_ptr<arrow::Buffer>&) override {
    throw std::runtime_error("unreachable");
  }
  bool Exists(const std::string&) override {
    return false;
  }
  void Remove(const std::string&) override {
  }
  void RemovePrefix(const std::string&) override {
  }
  std::vector<std::string> List(const std::string&) override {
    throw std::runtime_error("unreachable");
  }
  void Probe() override {
    throw std::runtime_error("bucket unreachable");
  }
  std::string Name() const override {
    return "object";
  }
};

void TestLiveness() {
  Harness                              h;
  framecomp::service::HealthService    health(h.Context());
  auto                                 resp = health.Liveness(HealthRequest{});
  assert(resp.component() == "liveness");
  assert(resp.healthy());
}

void TestStorage() {
  Harness h;
  {
    framecomp::service::HealthService health(h.Context());
    auto                              resp = health.Storage(HealthRequest{});
    assert(resp.component() == "storage");
    assert(resp.healthy());
  }
  {
    auto ctx  = h.Context();
    ctx.blobs = std::make_shared<UnreachableBlobStore>();
    framecomp::service::HealthService health(ctx);
    auto                              resp = health.Storage(HealthRequest{});
    assert(!resp.healthy());
    assert(resp.detail().find("bucket unreachable") != std::string::npos);
  }
}

void TestTaskQueue() {
  Harness                           h;
  framecomp::service::HealthService health(h.Context());

  auto up = health.TaskQueue(HealthRequest{});
  assert(up.component() == "task_queue");
  assert(up.healthy());

  h.worker->Stop();
  auto down = health.TaskQueue(HealthRequest{});
  assert(!down.healthy());
  assert(down.detail() == "run queue is shut down");

  auto no_workers = h.Context();
  no_workers.run_workers.clear();
  no_workers.run_queue = std::make_shared<framecomp::bulk::RunQueue>();
  framecomp::service::HealthService idle(no_workers);
  auto                              resp = idle.TaskQueue(HealthRequest{});
  assert(!resp.healthy());
  assert(resp.detail() == "0/0 run workers alive");
}

} // namespace

int main() {
  TestLiveness();
  TestStorage();
  TestTaskQueue();

  std::cout << "framecomp_unit_health_service: pass\n";
  return 0;
}
