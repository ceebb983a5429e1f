#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/util/errors.hpp"

namespace {

using framecomp::config::ConfigLoader;
using framecomp::runtime::config::DatabaseConfig;

bool Rejected(const std::string& yaml) {
  try {
    ConfigLoader::LoadFromString(yaml);
  } catch (const framecomp::util::ConfigurationError&) {
    return true;
  }
  return false;
}

void TestEmptyDocumentUsesDefaults() {
  auto config = ConfigLoader::LoadFromString("");

  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.server().max_message_bytes() == 64ull * 1024 * 1024);
  assert(config.fetch().timeout_ms() == 10000);
  assert(config.fetch().max_feed_bytes() == 50ull * 1024 * 1024);
  assert(config.fetch().max_image_bytes() == 10ull * 1024 * 1024);
  assert(config.fetch().allowed_ports_size() == 2);
  assert(config.fetch().allowed_ports(0) == 80 && config.fetch().allowed_ports(1) == 443);
  assert(config.fetch().max_redirects() == 3);
  assert(config.fetch().user_agent() == "frame-compositor/0.1");
  assert(config.compositor().output_quality() == 85);
  assert(config.compositor().min_source_dimension() == 10);
  assert(config.compositor().max_source_dimension() == 4000);
  assert(config.compositor().max_template_dimension() == 8000);
  assert(config.preview().max_width() == 800 && config.preview().max_height() == 600);
  assert(config.preview().quality() == 75);
  assert(config.bulk().max_in_flight() == 16);
  assert(config.bulk().run_workers() == 2);
  assert(config.bulk().progress_interval() == 10);
  assert(config.database().backend_case() == DatabaseConfig::kMemory);
}

void TestExplicitValuesSurvive() {
  auto config = ConfigLoader::LoadFromString(R"(
server:
  bind_address: 127.0.0.1:6000
fetch:
  timeout_ms: 2500
  allowed_ports: [443, 8443]
  user_agent: "4711"
bulk:
  max_in_flight: 3
database:
  postgres:
    connection_uri: postgresql://frames@db/frames
storage:
  disk:
    root_path: /var/lib/frames
    fsync: true
logging:
  level: debug
)");

  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.fetch().timeout_ms() == 2500);
  assert(config.fetch().allowed_ports_size() == 2 && config.fetch().allowed_ports(1) == 8443);
  // quoted scalars stay strings
  assert(config.fetch().user_agent() == "4711");
  assert(config.bulk().max_in_flight() == 3);
  assert(config.bulk().run_workers() == 2);
  assert(config.database().has_postgres());
  assert(config.database().postgres().pool_size() == 4);
  assert(config.storage().disk().root_path() == "/var/lib/frames");
  assert(config.storage().disk().fsync());
  assert(config.logging().level() == "debug");
}

void TestInvalidDocumentsRejected() {
  assert(Rejected("server:\n  bind_adress: 0.0.0.0:1\n"));
  assert(Rejected("- just\n- a list\n"));
  assert(Rejected("server: [unbalanced\n"));
  assert(Rejected("compositor:\n  output_quality: 101\n"));
  assert(Rejected("preview:\n  quality: 150\n"));
  assert(Rejected("compositor:\n  min_source_dimension: 500\n  max_source_dimension: 100\n"));
  assert(Rejected("fetch:\n  allowed_ports: [443, 70000]\n"));
  assert(Rejected("database:\n  sqlite: {}\n"));
  assert(Rejected("database:\n  postgres:\n    pool_size: 2\n"));
  assert(Rejected("storage:\n  object: {}\n"));
}

void TestLoadFromFile() {
  const std::string path = "/tmp/framecomp_config_loader_test.yaml";
  {
    std::ofstream out(path);
    out << "database:\n  sqlite:\n    path: /tmp/frames.db\n";
  }
  auto config = ConfigLoader::LoadFromYaml(path);
  assert(config.database().sqlite().path() == "/tmp/frames.db");
  std::remove(path.c_str());

  bool missing_rejected = false;
  try {
    ConfigLoader::LoadFromYaml("/nonexistent/framecomp.yaml");
  } catch (const framecomp::util::ConfigurationError&) {
    missing_rejected = true;
  }
  assert(missing_rejected);
}

} // namespace

int main() {
  TestEmptyDocumentUsesDefaults();
  TestExplicitValuesSurvive();
  TestInvalidDocumentsRejected();
  TestLoadFromFile();

  std::cout << "framecomp_unit_config_loader: pass\n";
  return 0;
}
