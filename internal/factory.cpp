#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/config/config_loader.hpp"
#include "internal/core/assignment_engine.hpp"
#include "internal/core/snapshot_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/discovery/discovery_poller.hpp"
#include "internal/discovery/discovery_reconciler.hpp"
#include "internal/discovery/session_directory_provider.hpp"
#include "internal/grpc/orchestrator_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/reconcile/reconciliation_loop.hpp"
#include "internal/registry/worker_registry.hpp"
#include "internal/service/orchestrator_service.hpp"
#include "internal/service/service_context.hpp"
#if ORCHESTRA_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if ORCHESTRA_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace orchestra::factory {

using orchestra::observability::BoolField;
using orchestra::observability::IntField;
using orchestra::observability::StringField;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const orchestra::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if ORCHESTRA_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::invalid_argument("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    sqlite_db->BootstrapSchema();
    ORCHESTRA_LOG_INFO("Using sqlite repository", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if ORCHESTRA_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri());
    pool->BootstrapSchema();
    ORCHESTRA_LOG_INFO("Using postgres repository");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  ORCHESTRA_LOG_INFO("Using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

void Application::Stop() {
  // Discovery first so no replace lands after the final save.
  if (poller) {
    poller->Stop();
  }
  if (loop) {
    loop->Stop();
  }
  if (engine) {
    engine->SaveSnapshot();
  }
}

/*
    Build full application dependency graph
*/
Application Build(const orchestra::runtime::config::RuntimeConfig& config) {
  Application app;

  const auto timing    = config::ResolveAssignmentTiming(config);
  const auto settings  = config::ResolveDiscoverySettings(config);

  // ------------------------------------------------------------------
  // State
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  auto registry = std::make_shared<registry::WorkerRegistry>();
  auto store    = std::make_shared<core::SnapshotStore>(app.repository);

  app.engine = std::make_shared<core::AssignmentEngine>(registry, store);
  app.engine->Hydrate();

  // ------------------------------------------------------------------
  // Background workers
  // ------------------------------------------------------------------
  reconcile::ReconciliationLoop::Options options;
  options.interval      = timing.reconcile_interval;
  options.error_backoff = timing.error_backoff;

  app.loop = std::make_shared<reconcile::ReconciliationLoop>(app.engine, options);
  app.loop->Start();

  std::shared_ptr<discovery::SessionDirectoryProvider> sessions;
  if (settings.enabled) {
    auto provider   = std::make_shared<discovery::SessionDirectoryProvider>(settings.sessions_root, settings.worker_kind);
    auto reconciler = std::make_shared<discovery::DiscoveryReconciler>(registry, settings.activity_window);

    std::weak_ptr<core::AssignmentEngine> engine = app.engine;
    app.poller = std::make_shared<discovery::DiscoveryPoller>(provider, reconciler, settings.refresh_interval,
                                                              [engine](const discovery::ReconcileStats&) {
                                                                if (auto locked = engine.lock()) {
                                                                  locked->SaveSnapshot();
                                                                }
                                                              });
    app.poller->Start();
    sessions = provider;
  }

  ORCHESTRA_LOG_INFO("Application built",
                     {IntField("reconcile_interval_ms", timing.reconcile_interval.count()),
                      IntField("error_backoff_ms", timing.error_backoff.count()), BoolField("discovery", settings.enabled)});

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.engine   = app.engine;
  ctx.registry = registry;
  ctx.poller   = app.poller;
  ctx.sessions = sessions;

  auto orchestrator = std::make_shared<service::OrchestratorService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::OrchestratorServer>(orchestrator));

  return app;
}

} // namespace orchestra::factory
