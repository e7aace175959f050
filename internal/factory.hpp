#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/hive/blocking_index.hpp"
#include "internal/hive/cell_queries.hpp"
#include "internal/hive/dirty_tracker.hpp"
#include "internal/hive/event_store.hpp"
#include "internal/hive/flush_manager.hpp"
#include "internal/hive/flush_scheduler.hpp"
#include "internal/hive/hive_service.hpp"
#include "internal/hive/jsonl_importer.hpp"
#include "internal/relay/relay_client.hpp"
#include "internal/reservation/reservation_manager.hpp"
#include "internal/service/service_context.hpp"
#include "internal/session/session_store.hpp"

namespace swarm::factory {

/*
  RuntimeDependencies

  Owns all long-lived components of one agent process.
  Everything here lives for the lifetime of the process.
*/
struct RuntimeDependencies {
  service::ServiceContext context;

  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<hive::EventStore>     event_store;
  std::shared_ptr<hive::HiveService>    hive;
  std::shared_ptr<hive::CellQueries>    queries;
  std::shared_ptr<hive::FlushManager>   flush;
  std::shared_ptr<hive::FlushScheduler> flush_scheduler;
  std::shared_ptr<hive::JsonlImporter>  importer;

  std::shared_ptr<reservation::ReservationManager> reservations;

  std::shared_ptr<relay::ResilientClient> relay_transport;
  std::shared_ptr<relay::RelayClient>     relay;

  std::shared_ptr<session::SessionStore> sessions;
};

/*
  BuildRuntime

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and transport types.
*/
RuntimeDependencies BuildRuntime(const swarm::runtime::config::RuntimeConfig& config);

} // namespace swarm::factory
