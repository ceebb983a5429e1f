#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

namespace {

using framecomp::observability::IntField;
using framecomp::observability::StringField;
using framecomp::runtime::config::RuntimeConfig;

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

void Usage() {
  std::cerr << "Usage: frame-compositor [--config] <config.yaml>\n"
               "       frame-compositor --check-config <config.yaml>"
            << std::endl;
}

std::string DatabaseName(const RuntimeConfig& config) {
  if (config.database().has_sqlite()) return "sqlite";
  if (config.database().has_postgres()) return "postgres";
  return "memory";
}

std::string StorageName(const RuntimeConfig& config) {
  if (config.storage().has_ram()) return "ram";
  if (config.storage().has_object()) return "object";
  return "disk";
}

void ShutdownTelemetry() {
  framecomp::observability::ShutdownLogging();
  framecomp::observability::ShutdownMetrics();
  framecomp::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  bool        check_only = false;

  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else if (argc == 3 && std::string(argv[1]) == "--check-config") {
    config_path = argv[2];
    check_only  = true;
  } else {
    Usage();
    return 1;
  }

  if (check_only) {
    try {
      auto config = framecomp::config::ConfigLoader::LoadFromYaml(config_path);
      std::cout << config_path << ": ok (database=" << DatabaseName(config) << ", storage=" << StorageName(config)
                << ", max_in_flight=" << config.bulk().max_in_flight() << ")" << std::endl;
      return 0;
    } catch (const std::exception& e) {
      std::cerr << config_path << ": " << e.what() << std::endl;
      return 2;
    }
  }

  try {
    auto config = framecomp::config::ConfigLoader::LoadFromYaml(config_path);

    framecomp::observability::InitializeTracing(config);
    framecomp::observability::InitializeMetrics(config);
    framecomp::observability::InitializeLogging(config);

    auto app = framecomp::factory::Build(config);

    framecomp::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services),
                                      static_cast<int>(config.server().max_message_bytes()));

    // handlers go in before Start so an early signal is not lost
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    FRAMECOMP_LOG_INFO("frame-compositor started", {StringField("bind_address", config.server().bind_address()),
                                                    StringField("database", DatabaseName(config)),
                                                    StringField("storage", StorageName(config)),
                                                    IntField("max_in_flight", config.bulk().max_in_flight()),
                                                    IntField("run_workers", config.bulk().run_workers())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(250));

    FRAMECOMP_LOG_INFO("frame-compositor stopping");

    // workers first: in-flight runs still write through the repository
    app.StopWorkers();
    server.Stop();
    ShutdownTelemetry();
  } catch (const std::exception& e) {
    FRAMECOMP_LOG_ERROR("fatal startup error", {StringField("error", e.what())});
    ShutdownTelemetry();
    return 2;
  }

  return 0;
}
