#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/hive/blocking_index.hpp"
#include "internal/hive/dirty_tracker.hpp"
#include "internal/hive/event_store.hpp"
#include "internal/hive/hive_service.hpp"
#include "internal/hive/projection_engine.hpp"
#include "internal/reservation/reservation_manager.hpp"
#include "internal/util/clock.hpp"

namespace {

using namespace std::chrono_literals;

constexpr int kWriters        = 4;
constexpr int kCellsPerWriter = 25;
constexpr int kContenders     = 6;
constexpr int kExitGranted    = 0;
constexpr int kExitConflict   = 10;
constexpr int kExitUnexpected = 20;

std::string FreshDbPath(const std::string& name) {
  const auto path = std::filesystem::temp_directory_path() /
                    ("swarm_hive_multiprocess_" + name + "_" + std::to_string(::getpid()) + ".db");
  for (const char* suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(path.string() + suffix);
  }
  return path.string();
}

// Everything one agent process wires up on its own connection.
struct Agent {
  explicit Agent(const std::string& path) {
    swarm::db::sqlite::SqliteOptions options;
    options.path            = path;
    options.busy_timeout_ms = 10000;
    repo = std::make_shared<swarm::db::sqlite::SqliteRepository>(
        std::make_shared<swarm::db::sqlite::SqliteDB>(options));

    ctx.repository              = repo;
    ctx.clock                   = std::make_shared<swarm::util::SystemClock>();
    ctx.project_key             = "alpha";
    ctx.store_retry.max_retries = 20;
    ctx.store_retry.base_delay  = 5ms;
    ctx.store_retry.max_delay   = 100ms;

    blocking     = std::make_shared<swarm::hive::BlockingIndex>(repo, ctx.clock);
    dirty        = std::make_shared<swarm::hive::DirtyTracker>(repo, ctx.clock);
    projections  = std::make_shared<swarm::hive::ProjectionEngine>(repo, blocking, dirty);
    store        = std::make_shared<swarm::hive::EventStore>(ctx, projections);
    service      = std::make_shared<swarm::hive::HiveService>(ctx, store);
    reservations = std::make_shared<swarm::reservation::ReservationManager>(ctx, store, 60);
  }

  std::shared_ptr<swarm::db::sqlite::SqliteRepository>    repo;
  swarm::service::ServiceContext                          ctx;
  std::shared_ptr<swarm::hive::BlockingIndex>             blocking;
  std::shared_ptr<swarm::hive::DirtyTracker>              dirty;
  std::shared_ptr<swarm::hive::ProjectionEngine>          projections;
  std::shared_ptr<swarm::hive::EventStore>                store;
  std::shared_ptr<swarm::hive::HiveService>               service;
  std::shared_ptr<swarm::reservation::ReservationManager> reservations;
};

// The schema is created before any fork; no connection crosses a fork.
void Bootstrap(const std::string& path) {
  auto db = std::make_shared<swarm::db::sqlite::SqliteDB>(path);
  swarm::db::sqlite::BootstrapSchema(db);
}

// Children block on the pipe until the parent closes the write end.
struct StartGate {
  StartGate() {
    const int rc = ::pipe(fds);
    assert(rc == 0);
  }

  void Wait() {
    ::close(fds[1]);
    char byte = 0;
    while (::read(fds[0], &byte, 1) < 0) {
    }
    ::close(fds[0]);
  }

  void Open() {
    ::close(fds[0]);
    ::close(fds[1]);
  }

  int fds[2] = {-1, -1};
};

template <typename Fn>
std::vector<pid_t> Spawn(int count, StartGate& gate, Fn&& child) {
  std::vector<pid_t> pids;
  for (int i = 0; i < count; ++i) {
    const pid_t pid = ::fork();
    assert(pid >= 0);
    if (pid == 0) {
      gate.Wait();
      int code = kExitUnexpected;
      try {
        code = child(i);
      } catch (const std::exception& e) {
        std::cerr << "child " << i << ": " << e.what() << "\n";
      }
      std::cout.flush();
      ::_exit(code);
    }
    pids.push_back(pid);
  }
  return pids;
}

std::vector<int> Reap(const std::vector<pid_t>& pids) {
  std::vector<int> codes;
  for (const pid_t pid : pids) {
    int         status = 0;
    const pid_t reaped = ::waitpid(pid, &status, 0);
    assert(reaped == pid);
    assert(WIFEXITED(status));
    codes.push_back(WEXITSTATUS(status));
  }
  return codes;
}

void TestConcurrentWritersGetContiguousSequences() {
  const auto path = FreshDbPath("writers");
  Bootstrap(path);

  StartGate gate;
  const auto pids = Spawn(kWriters, gate, [&](int writer) {
    Agent agent(path);
    for (int i = 0; i < kCellsPerWriter; ++i) {
      swarm::hive::CreateCellRequest req;
      req.title      = "writer " + std::to_string(writer) + " cell " + std::to_string(i);
      req.created_by = "writer-" + std::to_string(writer);
      agent.service->CreateCell(req);
    }
    return 0;
  });
  gate.Open();

  for (const int code : Reap(pids)) assert(code == 0);

  Agent reader(path);
  const auto events = reader.store->Read("alpha");
  assert(events.size() == static_cast<std::size_t>(kWriters * kCellsPerWriter));

  std::set<std::string> cells;
  for (std::size_t i = 0; i < events.size(); ++i) {
    assert(events[i].sequence == static_cast<int64_t>(i + 1));
    cells.insert(events[i].cell_id);
  }
  assert(cells.size() == events.size());

  // every event made it into the projection
  swarm::db::CellFilter filter;
  filter.project_key = "alpha";
  auto tx            = reader.repo->Begin(swarm::db::TxMode::kRead);
  const auto rows    = reader.repo->QueryCells(*tx, filter);
  const auto dirty   = reader.dirty->GetDirty(*tx, "alpha");
  tx->Commit();
  assert(rows.size() == events.size());
  assert(dirty.size() == events.size());
}

void TestExclusiveReservationIsGrantedOnce() {
  const auto path = FreshDbPath("reserve");
  Bootstrap(path);

  StartGate gate;
  const auto pids = Spawn(kContenders, gate, [&](int contender) {
    Agent agent(path);

    swarm::reservation::ReservationRequest req;
    req.agent  = "agent-" + std::to_string(contender);
    req.paths  = {"src/relay/client.cpp"};
    req.reason = "race";

    const auto result = agent.reservations->Reserve(req);
    if (result.granted.size() == 1 && result.conflicts.empty()) return kExitGranted;
    if (result.granted.empty() && result.conflicts.size() == 1) return kExitConflict;
    return kExitUnexpected;
  });
  gate.Open();

  int granted   = 0;
  int conflicts = 0;
  for (const int code : Reap(pids)) {
    if (code == kExitGranted) ++granted;
    if (code == kExitConflict) ++conflicts;
  }
  assert(granted == 1);
  assert(conflicts == kContenders - 1);

  Agent reader(path);
  const auto active = reader.reservations->ActiveReservations();
  assert(active.size() == 1);

  // every loser was told who holds it
  int conflict_events = 0;
  for (const auto& event : reader.store->Read("alpha")) {
    if (const auto* conflict = std::get_if<swarm::hive::v1::FileConflict>(&event.payload)) {
      assert(conflict->holder() == active[0].agent_name);
      ++conflict_events;
    }
  }
  assert(conflict_events == kContenders - 1);
}

} // namespace

int main() {
  TestConcurrentWritersGetContiguousSequences();
  TestExclusiveReservationIsGrantedOnce();

  std::cout << "swarm_hive_integration_multiprocess: pass\n";
  return 0;
}
