#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/bulk/item_pool.hpp"
#include "internal/bulk/orchestrator.hpp"
#include "internal/bulk/run_queue.hpp"
#include "internal/bulk/run_registry.hpp"
#include "internal/bulk/run_worker.hpp"
#include "internal/core/frame_project_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/feed/feed_fetcher.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/frame_server.hpp"
#include "internal/grpc/health_server.hpp"
#include "internal/image/compositor.hpp"
#include "internal/net/http_fetcher.hpp"
#include "internal/net/resolver.hpp"
#include "internal/net/url_validator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/preview/preview_engine.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/frame_service.hpp"
#include "internal/service/health_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/storage_factory.hpp"
#if FRAMECOMP_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if FRAMECOMP_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace framecomp::factory {

using namespace framecomp;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const framecomp::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if FRAMECOMP_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    sqlite_db->BootstrapSchema();
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if FRAMECOMP_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().pool_size());
    pool->BootstrapSchema();
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

net::FetchOptions ToFetchOptions(const framecomp::runtime::config::FetchConfig& fetch) {
  net::FetchOptions options;
  options.timeout         = std::chrono::milliseconds(fetch.timeout_ms());
  options.max_feed_bytes  = fetch.max_feed_bytes();
  options.max_image_bytes = fetch.max_image_bytes();
  options.max_redirects   = fetch.max_redirects();
  options.user_agent      = fetch.user_agent();
  return options;
}

image::CompositorOptions ToCompositorOptions(const framecomp::runtime::config::CompositorConfig& compositor) {
  image::CompositorOptions options;
  options.output_quality         = static_cast<int>(compositor.output_quality());
  options.min_source_dimension   = compositor.min_source_dimension();
  options.max_source_dimension   = compositor.max_source_dimension();
  options.max_template_bytes     = compositor.max_template_bytes();
  options.max_template_dimension = compositor.max_template_dimension();
  return options;
}

} // namespace

void Application::StopWorkers() {
  for (auto& worker : run_workers) {
    worker->Stop();
  }
  if (item_pool) item_pool->Stop();
}

/*
    Build full application dependency graph
*/
Application Build(const framecomp::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  auto blobs      = storage::StorageFactory::Build(config.storage());
  auto repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Outbound fetches (every one goes through the validator)
  // ------------------------------------------------------------------
  const auto&           fetch = config.fetch();
  std::vector<uint16_t> ports(fetch.allowed_ports().begin(), fetch.allowed_ports().end());

  auto validator = std::make_shared<net::UrlValidator>(std::make_shared<net::SystemResolver>(), std::move(ports));
  auto fetcher   = std::make_shared<net::HttpFetcher>(validator, ToFetchOptions(fetch));
  auto feeds     = std::make_shared<feed::FeedFetcher>(fetcher, std::chrono::milliseconds(fetch.feed_cache_ttl_ms()));

  // ------------------------------------------------------------------
  // Imaging
  // ------------------------------------------------------------------
  const auto compositor_options = ToCompositorOptions(config.compositor());
  auto       compositor         = std::make_shared<image::OpenCvCompositor>(compositor_options);

  preview::PreviewOptions preview_options;
  preview_options.max_width  = config.preview().max_width();
  preview_options.max_height = config.preview().max_height();
  preview_options.quality    = static_cast<int>(config.preview().quality());
  auto preview = std::make_shared<preview::PreviewEngine>(compositor, fetcher, feeds, preview_options);

  // ------------------------------------------------------------------
  // Bulk runs
  // ------------------------------------------------------------------
  const auto& bulk_config = config.bulk();

  app.item_pool = std::make_shared<bulk::ItemPool>(bulk_config.max_in_flight());
  app.run_queue = std::make_shared<bulk::RunQueue>();
  auto registry = std::make_shared<bulk::RunRegistry>();

  bulk::BulkOptions bulk_options;
  bulk_options.progress_interval = bulk_config.progress_interval();
  auto orchestrator = std::make_shared<bulk::BulkOrchestrator>(repository, blobs, feeds, fetcher, compositor, app.item_pool, registry,
                                                               bulk_options);

  auto manager = std::make_shared<core::FrameProjectManager>(repository, blobs, preview, app.run_queue, registry, compositor_options);
  // runs never survive a restart; nothing is queued yet
  manager->RecoverInterruptedRuns();

  for (uint32_t i = 0; i < bulk_config.run_workers(); ++i) {
    auto worker = std::make_shared<bulk::RunWorker>(app.run_queue, orchestrator);
    worker->Start();
    app.run_workers.push_back(std::move(worker));
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.manager     = manager;
  ctx.repository  = repository;
  ctx.blobs       = blobs;
  ctx.run_queue   = app.run_queue;
  ctx.run_workers = app.run_workers;

  auto frame_service  = std::make_shared<service::FrameService>(ctx);
  auto health_service = std::make_shared<service::HealthService>(ctx);
  auto admin_service  = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::FrameServer>(frame_service));
  app.grpc_services.push_back(std::make_unique<grpc::HealthServer>(health_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  FRAMECOMP_LOG_INFO("application built", {observability::StringField("storage", blobs->Name()),
                                           observability::IntField("run_workers", bulk_config.run_workers()),
                                           observability::IntField("max_in_flight", bulk_config.max_in_flight())});
  return app;
}

} // namespace framecomp::factory
