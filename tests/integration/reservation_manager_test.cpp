#include <unistd.h>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/hive/blocking_index.hpp"
#include "internal/hive/dirty_tracker.hpp"
#include "internal/hive/event_store.hpp"
#include "internal/hive/events.hpp"
#include "internal/hive/projection_engine.hpp"
#include "internal/reservation/reservation_manager.hpp"
#include "internal/util/clock.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
namespace v1 = swarm::hive::v1;
using swarm::reservation::ReservationRequest;

std::string FreshDbPath(const std::string& name) {
  const auto path = std::filesystem::temp_directory_path() /
                    ("swarm_hive_reservation_" + name + "_" + std::to_string(::getpid()) + ".db");
  for (const char* suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(path.string() + suffix);
  }
  return path.string();
}

struct Hive {
  explicit Hive(const std::string& name) {
    db = std::make_shared<swarm::db::sqlite::SqliteDB>(FreshDbPath(name));
    swarm::db::sqlite::BootstrapSchema(db);
    repo = std::make_shared<swarm::db::sqlite::SqliteRepository>(db);

    ctx.repository             = repo;
    ctx.clock                  = clock;
    ctx.project_key            = "alpha";
    ctx.store_retry.base_delay = 1ms;
    ctx.store_retry.max_delay  = 5ms;

    auto blocking    = std::make_shared<swarm::hive::BlockingIndex>(repo, clock);
    auto dirty       = std::make_shared<swarm::hive::DirtyTracker>(repo, clock);
    auto projections = std::make_shared<swarm::hive::ProjectionEngine>(repo, blocking, dirty);
    store            = std::make_shared<swarm::hive::EventStore>(ctx, projections);
    manager          = std::make_shared<swarm::reservation::ReservationManager>(ctx, store, 60);
  }

  std::vector<std::string> EventTypes() {
    std::vector<std::string> types;
    for (const auto& event : store->Read("alpha")) types.push_back(swarm::hive::EventType(event.payload));
    return types;
  }

  int64_t StoredReservationRows() {
    sqlite3_stmt* stmt = db->Prepare("SELECT COUNT(*) FROM file_reservations;");
    assert(sqlite3_step(stmt) == SQLITE_ROW);
    const int64_t rows = sqlite3_column_int64(stmt, 0);
    sqlite3_finalize(stmt);
    return rows;
  }

  std::shared_ptr<swarm::db::sqlite::SqliteDB>            db;
  std::shared_ptr<swarm::util::ManualClock>              clock = std::make_shared<swarm::util::ManualClock>();
  std::shared_ptr<swarm::db::sqlite::SqliteRepository>   repo;
  swarm::service::ServiceContext                         ctx;
  std::shared_ptr<swarm::hive::EventStore>               store;
  std::shared_ptr<swarm::reservation::ReservationManager> manager;
};

ReservationRequest Request(const std::string& agent, std::vector<std::string> paths, bool exclusive = true) {
  ReservationRequest req;
  req.agent     = agent;
  req.paths     = std::move(paths);
  req.exclusive = exclusive;
  req.reason    = "editing";
  return req;
}

void TestConflictThenRetryAfterRelease() {
  Hive hive("conflict");

  auto x = hive.manager->Reserve(Request("BlueLake", {"src/a.cpp"}));
  assert(x.granted.size() == 1);
  assert(x.conflicts.empty());
  assert(x.granted[0].id > 0);
  assert(x.granted[0].expires_at_ms == hive.clock->NowMillis() + 60 * 1000);

  auto y = hive.manager->Reserve(Request("GreenHill", {"src/a.cpp"}));
  assert(y.granted.empty());
  assert(y.conflicts.size() == 1);
  assert(y.conflicts[0].path == "src/a.cpp");
  assert(y.conflicts[0].holder == "BlueLake");
  assert(y.conflicts[0].holder_pattern == "src/a.cpp");
  assert(y.conflicts[0].holder_exclusive);

  swarm::reservation::ReleaseSelector selector;
  selector.paths = {"src/a.cpp"};
  assert(hive.manager->Release("BlueLake", selector) == 1);

  auto retry = hive.manager->Reserve(Request("GreenHill", {"src/a.cpp"}));
  assert(retry.granted.size() == 1);
  assert(retry.conflicts.empty());

  const auto types = hive.EventTypes();
  assert((types == std::vector<std::string>{"file_reserved", "file_conflict", "file_released", "file_reserved"}));
}

void TestGlobsOverlapConcretePaths() {
  Hive hive("globs");

  assert(hive.manager->Reserve(Request("BlueLake", {"src/relay/**"})).granted.size() == 1);

  auto nested = hive.manager->Reserve(Request("GreenHill", {"src/relay/client/retry.cpp"}));
  assert(nested.conflicts.size() == 1);
  assert(nested.conflicts[0].holder_pattern == "src/relay/**");

  // two globs conflict when one static prefix contains the other
  auto glob = hive.manager->Reserve(Request("GreenHill", {"src/relay/client/*.cpp"}));
  assert(glob.conflicts.size() == 1);

  auto star = hive.manager->Reserve(Request("GreenHill", {"tests/*"}));
  assert(star.granted.size() == 1);

  auto sibling = hive.manager->Reserve(Request("RedFox", {"src/hive/cell.cpp"}));
  assert(sibling.granted.size() == 1);
}

void TestPartialGrants() {
  Hive hive("partial");

  hive.manager->Reserve(Request("BlueLake", {"docs/a.md"}));

  auto mixed = hive.manager->Reserve(Request("GreenHill", {"docs/a.md", "docs/b.md"}));
  assert(mixed.granted.size() == 1);
  assert(mixed.granted[0].path_pattern == "docs/b.md");
  assert(mixed.conflicts.size() == 1);
  assert(mixed.conflicts[0].path == "docs/a.md");
}

void TestSharedReservationsCoexist() {
  Hive hive("shared");

  assert(hive.manager->Reserve(Request("BlueLake", {"README.md"}, false)).granted.size() == 1);
  assert(hive.manager->Reserve(Request("GreenHill", {"README.md"}, false)).granted.size() == 1);

  // exclusive against a shared holder still conflicts
  auto exclusive = hive.manager->Reserve(Request("RedFox", {"README.md"}));
  assert(exclusive.conflicts.size() == 2);

  auto shared_vs_exclusive = hive.manager->Reserve(Request("RedFox", {"LICENSE"}));
  assert(shared_vs_exclusive.granted.size() == 1);
  assert(hive.manager->Reserve(Request("BlueLake", {"LICENSE"}, false)).conflicts.size() == 1);
}

void TestExpiredReservationsStopBlocking() {
  Hive hive("expiry");

  auto short_lived = Request("BlueLake", {"src/a.cpp"});
  short_lived.ttl_seconds = 5;
  hive.manager->Reserve(short_lived);

  hive.clock->Advance(4s);
  assert(hive.manager->Reserve(Request("GreenHill", {"src/a.cpp"})).conflicts.size() == 1);

  hive.clock->Advance(1s);
  assert(hive.manager->ActiveReservations(std::string("BlueLake")).empty());
  auto after = hive.manager->Reserve(Request("GreenHill", {"src/a.cpp"}));
  assert(after.granted.size() == 1);

  // expired rows are not released again
  assert(hive.manager->ReleaseAll("BlueLake") == 0);
}

void TestInactiveRowsArePurgedOnReserve() {
  Hive hive("purge");

  auto short_lived        = Request("BlueLake", {"src/a.cpp", "src/b.cpp"});
  short_lived.ttl_seconds = 5;
  hive.manager->Reserve(short_lived);
  hive.manager->Reserve(Request("GreenHill", {"docs/x.md"}));
  hive.manager->ReleaseAll("GreenHill");
  assert(hive.StoredReservationRows() == 3);

  hive.clock->Advance(5s);
  auto fresh = hive.manager->Reserve(Request("RedFox", {"src/a.cpp"}));
  assert(fresh.granted.size() == 1);
  assert(hive.StoredReservationRows() == 1);

  // history stays in the event log
  const auto types = hive.EventTypes();
  assert((types == std::vector<std::string>{"file_reserved", "file_reserved", "file_released", "file_reserved"}));
}

void TestOwnPatternIsRefreshed() {
  Hive hive("refresh");

  hive.manager->Reserve(Request("BlueLake", {"src/a.cpp"}));
  hive.clock->Advance(30s);
  auto again = hive.manager->Reserve(Request("BlueLake", {"src/a.cpp"}));
  assert(again.granted.size() == 1);
  assert(again.granted[0].expires_at_ms == hive.clock->NowMillis() + 60 * 1000);

  const auto active = hive.manager->ActiveReservations();
  assert(active.size() == 1);
  assert(active[0].id == again.granted[0].id);
}

void TestReleaseSelectors() {
  Hive hive("release");

  auto granted = hive.manager->Reserve(Request("BlueLake", {"a", "b", "c"})).granted;
  hive.manager->Reserve(Request("GreenHill", {"d"}));
  assert(granted.size() == 3);

  // only one's own reservations
  swarm::reservation::ReleaseSelector foreign;
  foreign.paths = {"d"};
  assert(hive.manager->Release("BlueLake", foreign) == 0);

  swarm::reservation::ReleaseSelector by_id;
  by_id.reservation_ids = {granted[1].id};
  assert(hive.manager->Release("BlueLake", by_id) == 1);
  assert(hive.manager->ActiveReservations(std::string("BlueLake")).size() == 2);

  assert(hive.manager->ReleaseAll("BlueLake") == 2);
  assert(hive.manager->ActiveReservations().size() == 1);

  auto released = hive.store->Read("alpha").back();
  const auto& payload = std::get<v1::FileReleased>(released.payload);
  assert(payload.agent() == "BlueLake");
  assert(payload.paths_size() == 2);
}

void TestCancelledRequestChangesNothing() {
  Hive hive("cancel");

  auto req   = Request("BlueLake", {"src/a.cpp"});
  req.cancel = std::make_shared<swarm::reservation::CancellationToken>();
  req.cancel->Cancel();

  auto result = hive.manager->Reserve(req);
  assert(result.cancelled);
  assert(result.granted.empty() && result.conflicts.empty());
  assert(hive.manager->ActiveReservations().empty());
  assert(hive.store->LatestSequence("alpha") == 0);
}

void TestRequestValidation() {
  Hive hive("validation");

  auto field_of = [&](const ReservationRequest& req) {
    try {
      hive.manager->Reserve(req);
    } catch (const swarm::util::ValidationError& e) {
      return e.field();
    }
    return std::string();
  };

  assert(field_of(Request("", {"a"})) == "agent");
  assert(field_of(Request("BlueLake", {})) == "paths");
  assert(field_of(Request("BlueLake", {""})) == "paths");

  auto negative        = Request("BlueLake", {"a"});
  negative.ttl_seconds = -1;
  assert(field_of(negative) == "ttl_seconds");
}

} // namespace

int main() {
  TestConflictThenRetryAfterRelease();
  TestGlobsOverlapConcretePaths();
  TestPartialGrants();
  TestSharedReservationsCoexist();
  TestExpiredReservationsStopBlocking();
  TestInactiveRowsArePurgedOnReserve();
  TestOwnPatternIsRefreshed();
  TestReleaseSelectors();
  TestCancelledRequestChangesNothing();
  TestRequestValidation();

  std::cout << "swarm_hive_integration_reservation_manager: pass\n";
  return 0;
}
