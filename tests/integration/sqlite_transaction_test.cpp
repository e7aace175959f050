#include <unistd.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"

namespace {

using namespace std::chrono_literals;
using swarm::db::TxMode;

std::string FreshDbPath(const std::string& name) {
  const auto path = std::filesystem::temp_directory_path() /
                    ("swarm_hive_sqlite_tx_" + name + "_" + std::to_string(::getpid()) + ".db");
  for (const char* suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(path.string() + suffix);
  }
  return path.string();
}

std::shared_ptr<swarm::db::sqlite::SqliteRepository> OpenRepo(const std::string& name) {
  auto db = std::make_shared<swarm::db::sqlite::SqliteDB>(FreshDbPath(name));
  swarm::db::sqlite::BootstrapSchema(db);
  return std::make_shared<swarm::db::sqlite::SqliteRepository>(db);
}

swarm::db::model::ReservationRecord Reservation(const std::string& path) {
  swarm::db::model::ReservationRecord record;
  record.project_key   = "alpha";
  record.agent_name    = "BlueLake";
  record.path_pattern  = path;
  record.exclusive     = true;
  record.created_at_ms = 1000;
  record.expires_at_ms = 61000;
  return record;
}

void TestBeginAfterCommitWhileFirstIsAlive() {
  auto repo = OpenRepo("commit");

  auto first  = repo->Begin();
  auto record = Reservation("src/a.cpp");
  assert(repo->InsertReservation(*first, record));
  first->Commit();
  assert(first->IsCommitted());

  // first is still in scope
  auto second = repo->Begin(TxMode::kRead);
  assert(repo->ListActiveReservations(*second, "alpha", 2000).size() == 1);
  second->Commit();

  auto third = repo->Begin();
  third->Commit();
}

void TestBeginAfterRollbackWhileFirstIsAlive() {
  auto repo = OpenRepo("rollback");

  auto first  = repo->Begin();
  auto record = Reservation("src/a.cpp");
  assert(repo->InsertReservation(*first, record));
  first->Rollback();

  auto second = repo->Begin(TxMode::kRead);
  assert(repo->ListActiveReservations(*second, "alpha", 2000).empty());
  second->Commit();
}

void TestDestroyedTransactionRollsBack() {
  auto repo = OpenRepo("destroyed");

  {
    auto tx     = repo->Begin();
    auto record = Reservation("src/a.cpp");
    assert(repo->InsertReservation(*tx, record));
  }

  auto tx = repo->Begin(TxMode::kRead);
  assert(repo->ListActiveReservations(*tx, "alpha", 2000).empty());
  tx->Commit();

  // reassigning drops a committed transaction
  tx = repo->Begin();
  tx->Commit();
}

void TestOtherThreadProceedsAfterCommit() {
  auto repo = OpenRepo("threads");

  auto held = repo->Begin();
  std::atomic<bool> started{false};
  auto other = std::async(std::launch::async, [&] {
    started = true;
    auto tx     = repo->Begin();
    auto record = Reservation("src/b.cpp");
    const bool ok = static_cast<bool>(repo->InsertReservation(*tx, record));
    tx->Commit();
    return ok;
  });

  while (!started) std::this_thread::yield();
  // the other writer waits while this one is open
  assert(other.wait_for(50ms) == std::future_status::timeout);

  held->Commit();
  assert(other.wait_for(5s) == std::future_status::ready);
  assert(other.get());

  auto check = repo->Begin(TxMode::kRead);
  assert(repo->ListActiveReservations(*check, "alpha", 2000).size() == 1);
  check->Commit();
}

} // namespace

int main() {
  TestBeginAfterCommitWhileFirstIsAlive();
  TestBeginAfterRollbackWhileFirstIsAlive();
  TestDestroyedTransactionRollsBack();
  TestOtherThreadProceedsAfterCommit();

  std::cout << "swarm_hive_integration_sqlite_transaction: pass\n";
  return 0;
}
