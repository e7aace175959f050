#include "factory.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/hive/projection_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/relay/collaborator_supervisor.hpp"
#include "internal/relay/grpc_relay_transport.hpp"
#include "internal/relay/resilient_client.hpp"
#include "internal/util/clock.hpp"

namespace swarm::factory {

using namespace swarm;

namespace {

void EnsureParentDirectory(const std::string& path) {
  const auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent);
  }
}

std::shared_ptr<db::Repository> BuildRepository(const runtime::config::RuntimeConfig& config) {
  const auto& sqlite = config.database().sqlite();

  db::sqlite::SqliteOptions options;
  options.path            = sqlite.path();
  options.busy_timeout_ms = sqlite.busy_timeout_ms();
  options.wal_mode        = sqlite.wal_mode();
  EnsureParentDirectory(options.path);

  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(std::move(options));
  const int applied = db::sqlite::BootstrapSchema(sqlite_db);
  if (applied > 0) {
    SWARM_LOG_INFO("schema migrated", {observability::StringField("path", sqlite.path()),
                                       observability::IntField("migrations", applied)});
  }
  return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
}

util::BackoffPolicy BuildBackoff(const runtime::config::RelayConfig& relay) {
  util::BackoffPolicy policy;
  policy.max_retries    = relay.max_retries();
  policy.base_delay     = std::chrono::milliseconds(relay.base_delay_ms());
  policy.max_delay      = std::chrono::milliseconds(relay.max_delay_ms());
  policy.jitter_percent = relay.jitter_percent();
  return policy;
}

std::shared_ptr<relay::ResilientClient> BuildRelay(const runtime::config::RelayConfig& relay,
                                                   const std::shared_ptr<util::Clock>& clock) {
  auto transport = std::make_shared<relay::GrpcRelayTransport>(relay.endpoint());

  std::shared_ptr<relay::CollaboratorSupervisor> supervisor;
  if (!relay.restart_command().empty()) {
    supervisor = std::make_shared<relay::ProcessSupervisor>(relay.restart_command(), transport,
                                                            std::chrono::milliseconds(relay.restart_wait_ms()));
  }

  relay::ResilientOptions options;
  options.backoff           = BuildBackoff(relay);
  options.call_timeout      = std::chrono::milliseconds(relay.timeout_ms());
  options.failure_threshold = relay.failure_threshold();
  options.restart_cooldown  = std::chrono::milliseconds(relay.restart_cooldown_ms());
  options.auto_restart      = relay.auto_restart();

  return std::make_shared<relay::ResilientClient>(std::move(transport), std::move(supervisor), clock,
                                                  std::move(options));
}

} // namespace

/*
    Build full application dependency graph
*/
RuntimeDependencies BuildRuntime(const runtime::config::RuntimeConfig& config) {
  RuntimeDependencies app;

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  auto clock     = std::make_shared<util::SystemClock>();
  app.repository = BuildRepository(config);

  service::ServiceContext ctx;
  ctx.repository  = app.repository;
  ctx.clock       = clock;
  ctx.project_key = config.hive().project_key();
  ctx.store_retry = BuildBackoff(config.relay());
  app.context     = ctx;

  // ------------------------------------------------------------------
  // Hive: log, projections, derived state
  // ------------------------------------------------------------------
  auto blocking    = std::make_shared<hive::BlockingIndex>(app.repository, clock);
  auto dirty       = std::make_shared<hive::DirtyTracker>(app.repository, clock);
  auto projections = std::make_shared<hive::ProjectionEngine>(app.repository, blocking, dirty);

  app.event_store = std::make_shared<hive::EventStore>(ctx, projections);
  app.hive        = std::make_shared<hive::HiveService>(ctx, app.event_store, config.hive().id_prefix());
  app.queries     = std::make_shared<hive::CellQueries>(ctx, blocking);
  app.importer    = std::make_shared<hive::JsonlImporter>(ctx, app.event_store);

  // ------------------------------------------------------------------
  // Export
  // ------------------------------------------------------------------
  EnsureParentDirectory(config.hive().export_path());
  app.flush = std::make_shared<hive::FlushManager>(ctx, dirty, config.hive().export_path());

  // Other agents write to the same store, so the scheduler also polls.
  const auto debounce = std::chrono::milliseconds(config.hive().flush_debounce_ms());
  app.flush_scheduler = std::make_shared<hive::FlushScheduler>(app.flush, debounce, debounce);

  // ------------------------------------------------------------------
  // Reservations
  // ------------------------------------------------------------------
  app.reservations = std::make_shared<reservation::ReservationManager>(
      ctx, app.event_store, config.reservations().default_ttl_seconds());

  // ------------------------------------------------------------------
  // Relay + sessions
  // ------------------------------------------------------------------
  app.relay_transport = BuildRelay(config.relay(), clock);
  app.relay           = std::make_shared<relay::RelayClient>(app.relay_transport, ctx.project_key);
  app.sessions        = std::make_shared<session::SessionStore>(config.session().state_dir(), clock);

  SWARM_LOG_INFO("runtime built", {observability::StringField("project", ctx.project_key),
                                   observability::StringField("store", config.database().sqlite().path()),
                                   observability::StringField("export", config.hive().export_path()),
                                   observability::StringField("relay", config.relay().endpoint())});
  return app;
}

} // namespace swarm::factory
