#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace framecomp::bulk {
class ItemPool;
class RunQueue;
class RunWorker;
}

namespace framecomp::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::shared_ptr<bulk::RunQueue>               run_queue;
  std::vector<std::shared_ptr<bulk::RunWorker>> run_workers;
  std::shared_ptr<bulk::ItemPool>               item_pool;

  // Run workers first, then the item pool they feed.
  void StopWorkers();
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB, storage and network types.
*/
Application Build(const framecomp::runtime::config::RuntimeConfig& config);

} // namespace framecomp::factory
