#pragma once

#include <memory>
#include <vector>

namespace framecomp::core { class FrameProjectManager; }
namespace framecomp::db { class Repository; }
namespace framecomp::storage { class BlobStore; }
namespace framecomp::bulk { class RunQueue; class RunWorker; }

namespace framecomp::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<framecomp::core::FrameProjectManager> manager;
  std::shared_ptr<framecomp::db::Repository> repository;
  std::shared_ptr<framecomp::storage::BlobStore> blobs;
  std::shared_ptr<framecomp::bulk::RunQueue> run_queue;
  std::vector<std::shared_ptr<framecomp::bulk::RunWorker>> run_workers;
};

}
