#include <unistd.h>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/hive/blocking_index.hpp"
#include "internal/hive/dirty_tracker.hpp"
#include "internal/hive/event_store.hpp"
#include "internal/hive/hive_service.hpp"
#include "internal/hive/projection_engine.hpp"
#include "internal/util/clock.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;

std::string FreshDbPath(const std::string& name) {
  const auto path = std::filesystem::temp_directory_path() /
                    ("swarm_hive_service_" + name + "_" + std::to_string(::getpid()) + ".db");
  for (const char* suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(path.string() + suffix);
  }
  return path.string();
}

struct Hive {
  explicit Hive(const std::string& name) {
    auto db = std::make_shared<swarm::db::sqlite::SqliteDB>(FreshDbPath(name));
    swarm::db::sqlite::BootstrapSchema(db);
    repo = std::make_shared<swarm::db::sqlite::SqliteRepository>(db);

    ctx.repository             = repo;
    ctx.clock                  = clock;
    ctx.project_key            = "alpha";
    ctx.store_retry.base_delay = 1ms;
    ctx.store_retry.max_delay  = 5ms;

    blocking    = std::make_shared<swarm::hive::BlockingIndex>(repo, clock);
    dirty       = std::make_shared<swarm::hive::DirtyTracker>(repo, clock);
    projections = std::make_shared<swarm::hive::ProjectionEngine>(repo, blocking, dirty);
    store       = std::make_shared<swarm::hive::EventStore>(ctx, projections);
    service     = std::make_shared<swarm::hive::HiveService>(ctx, store);
  }

  swarm::db::model::CellRecord Create(const std::string& title, const std::string& type = "task",
                                      std::optional<std::string> parent = std::nullopt) {
    swarm::hive::CreateCellRequest req;
    req.title      = title;
    req.issue_type = type;
    req.parent_id  = std::move(parent);
    req.created_by = "BlueLake";
    clock->Advance(1ms);
    return service->CreateCell(req);
  }

  std::optional<swarm::db::model::CellRecord> Cell(const std::string& id) {
    auto tx   = repo->Begin(swarm::db::TxMode::kRead);
    auto cell = repo->GetCell(*tx, id);
    tx->Commit();
    return cell;
  }

  std::vector<swarm::db::model::DependencyRecord> Edges(const std::string& id) {
    auto tx    = repo->Begin(swarm::db::TxMode::kRead);
    auto edges = repo->GetDependencies(*tx, id);
    tx->Commit();
    return edges;
  }

  std::shared_ptr<swarm::util::ManualClock>            clock = std::make_shared<swarm::util::ManualClock>(1000);
  std::shared_ptr<swarm::db::sqlite::SqliteRepository> repo;
  swarm::service::ServiceContext                       ctx;
  std::shared_ptr<swarm::hive::BlockingIndex>          blocking;
  std::shared_ptr<swarm::hive::DirtyTracker>           dirty;
  std::shared_ptr<swarm::hive::ProjectionEngine>       projections;
  std::shared_ptr<swarm::hive::EventStore>             store;
  std::shared_ptr<swarm::hive::HiveService>            service;
};

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestCreateCell() {
  Hive hive("create");

  swarm::hive::CreateCellRequest req;
  req.title      = "Wire relay client";
  req.issue_type = "feature";
  req.priority   = 1;
  req.assignee   = std::string("GreenHill");
  req.created_by = "BlueLake";
  auto cell      = hive.service->CreateCell(req);

  assert(cell.id.rfind("cell-", 0) == 0);
  assert(cell.project_key == "alpha");
  assert(cell.status == "open");
  assert(cell.issue_type == "feature");
  assert(cell.priority == 1);
  assert(cell.assignee == std::string("GreenHill"));
  assert(cell.created_at_ms == 1000);
  assert(!cell.closed_at_ms);

  // created + assigned
  assert(hive.store->LatestSequence("alpha") == 2);
  assert(hive.dirty->GetDirty("alpha") == std::vector<std::string>{cell.id});

  swarm::hive::CreateCellRequest orphan;
  orphan.title     = "orphan";
  orphan.parent_id = std::string("cell-missing");
  assert(Throws<swarm::util::NotFound>([&] { hive.service->CreateCell(orphan); }));
  assert(hive.store->LatestSequence("alpha") == 2);
}

void TestEpicWithDependentSubtasks() {
  Hive hive("epic");

  auto epic = hive.Create("Relay hardening", "epic");
  auto a    = hive.Create("Backoff", "task", epic.id);
  auto b    = hive.Create("Auto restart", "task", epic.id);
  hive.service->AddDependency(b.id, a.id);

  assert(hive.blocking->IsBlocked(b.id));
  assert(!hive.blocking->IsBlocked(a.id));
  assert(hive.blocking->GetBlockers(b.id) == std::vector<std::string>{a.id});

  hive.service->CloseCell(a.id, "done", "BlueLake");
  assert(!hive.blocking->IsBlocked(b.id));

  hive.service->ReopenCell(a.id, "regressed", "BlueLake");
  assert(hive.blocking->IsBlocked(b.id));

  // the cache agrees with the edges after every step
  auto tx = hive.repo->Begin(swarm::db::TxMode::kRead);
  assert(hive.blocking->VerifyBlocked(*tx, b.id));
  assert(!hive.blocking->VerifyBlocked(*tx, a.id));
  tx->Commit();
}

void TestDependencyValidation() {
  Hive hive("cycles");

  auto a = hive.Create("a");
  auto b = hive.Create("b");
  auto c = hive.Create("c");
  hive.service->AddDependency(a.id, b.id);
  hive.service->AddDependency(b.id, c.id);

  const auto before = hive.store->LatestSequence("alpha");
  assert(Throws<swarm::util::CycleDetected>([&] { hive.service->AddDependency(c.id, a.id); }));
  assert(Throws<swarm::util::ValidationError>([&] { hive.service->AddDependency(a.id, a.id); }));
  assert(Throws<swarm::util::NotFound>([&] { hive.service->AddDependency(a.id, "cell-nowhere"); }));
  assert(hive.store->LatestSequence("alpha") == before);
  assert(hive.Edges(c.id).empty());

  // re-adding an edge keeps a single row
  hive.service->AddDependency(a.id, b.id);
  assert(hive.Edges(a.id).size() == 1);

  // relationships other than blocks are separate edges
  hive.service->AddDependency(a.id, b.id, "related");
  assert(hive.Edges(a.id).size() == 2);

  hive.service->RemoveDependency(a.id, b.id);
  hive.service->RemoveDependency(a.id, b.id, "related");
  assert(hive.Edges(a.id).empty());
  assert(!hive.blocking->IsBlocked(a.id));
  assert(hive.blocking->IsBlocked(b.id));
}

void TestDeletedCellsAreGone() {
  Hive hive("delete");

  auto blocker = hive.Create("blocker");
  auto waiting = hive.Create("waiting");
  hive.service->AddDependency(waiting.id, blocker.id);
  assert(hive.blocking->IsBlocked(waiting.id));

  hive.service->DeleteCell(blocker.id, "duplicate", "BlueLake");
  assert(!hive.blocking->IsBlocked(waiting.id));

  auto row = hive.Cell(blocker.id);
  assert(row && row->IsDeleted());
  assert(row->deleted_by == std::string("BlueLake"));
  assert(row->delete_reason == std::string("duplicate"));

  assert(Throws<swarm::util::NotFound>([&] { hive.service->CloseCell(blocker.id, "done"); }));
  assert(Throws<swarm::util::NotFound>([&] { hive.service->AddLabel(blocker.id, "x"); }));
  assert(Throws<swarm::util::NotFound>([&] { hive.service->DeleteCell(blocker.id, "again", "BlueLake"); }));
}

void TestStatusCommands() {
  Hive hive("status");

  auto cell = hive.Create("status");

  hive.clock->Advance(5ms);
  auto started = hive.service->StartWork(cell.id, "GreenHill");
  assert(started.status == "in_progress");
  assert(started.assignee == std::string("GreenHill"));
  assert(started.updated_at_ms == hive.clock->NowMillis());

  auto blocked = hive.service->ChangeStatus(cell.id, "blocked", "GreenHill", "waiting on review");
  assert(blocked.status == "blocked");

  const auto seq = hive.store->LatestSequence("alpha");
  hive.service->ChangeStatus(cell.id, "blocked", "GreenHill");
  assert(hive.store->LatestSequence("alpha") == seq);

  assert(Throws<swarm::util::ValidationError>([&] { hive.service->ChangeStatus(cell.id, "paused", "x"); }));

  auto closed = hive.service->ChangeStatus(cell.id, "closed", "GreenHill", "shipped");
  assert(closed.status == "closed");
  assert(closed.closed_at_ms.has_value());
  assert(closed.closed_reason == std::string("shipped"));
  assert(Throws<swarm::util::InvalidState>([&] { hive.service->CloseCell(cell.id, "twice"); }));

  auto reopened = hive.service->ReopenCell(cell.id, "not done");
  assert(reopened.status == "open");
  assert(!reopened.closed_at_ms && !reopened.closed_reason);
  assert(Throws<swarm::util::InvalidState>([&] { hive.service->ReopenCell(cell.id, "twice"); }));
}

void TestUpdateAppendsOnlyChanges() {
  Hive hive("update");

  auto cell = hive.Create("before");
  const auto seq = hive.store->LatestSequence("alpha");

  swarm::hive::UpdateCellRequest same;
  same.title    = std::string("before");
  same.priority = 2;
  hive.service->UpdateCell(cell.id, same);
  assert(hive.store->LatestSequence("alpha") == seq);

  swarm::hive::UpdateCellRequest change;
  change.title       = std::string("after");
  change.description = std::string("more detail");
  change.updated_by  = "BlueLake";
  auto updated       = hive.service->UpdateCell(cell.id, change);
  assert(updated.title == "after");
  assert(updated.description == "more detail");
  assert(updated.priority == 2);
  assert(hive.store->LatestSequence("alpha") == seq + 1);

  auto assigned = hive.service->Assign(cell.id, "GreenHill", "BlueLake");
  assert(assigned.assignee == std::string("GreenHill"));
}

void TestLabels() {
  Hive hive("labels");

  auto cell = hive.Create("labelled");
  hive.service->AddLabel(cell.id, "backend");
  hive.service->AddLabel(cell.id, "relay");
  hive.service->AddLabel(cell.id, "backend");

  auto tx = hive.repo->Begin(swarm::db::TxMode::kRead);
  assert(hive.repo->GetLabels(*tx, cell.id).size() == 2);
  tx->Commit();

  hive.service->RemoveLabel(cell.id, "backend");
  tx = hive.repo->Begin(swarm::db::TxMode::kRead);
  auto labels = hive.repo->GetLabels(*tx, cell.id);
  tx->Commit();
  assert(labels.size() == 1 && labels[0].label == "relay");
}

void TestCommentThreads() {
  Hive hive("comments");

  auto cell  = hive.Create("discussed");
  auto other = hive.Create("elsewhere");

  auto top = hive.service->AddComment(cell.id, "BlueLake", "first pass done");
  assert(top.id > 0);
  assert(top.cell_id == cell.id);
  assert(top.parent_id == 0);

  auto reply = hive.service->AddComment(cell.id, "GreenHill", "looks good", top.id);
  assert(reply.parent_id == top.id);
  assert(reply.id != top.id);

  // a parent on another cell is not a parent
  assert(Throws<swarm::util::NotFound>([&] { hive.service->AddComment(other.id, "x", "y", top.id); }));

  auto edited = hive.service->UpdateComment(top.id, "first pass done, tests added");
  assert(edited.body == "first pass done, tests added");

  hive.service->DeleteComment(reply.id);
  assert(Throws<swarm::util::NotFound>([&] { hive.service->UpdateComment(reply.id, "gone"); }));

  auto tx       = hive.repo->Begin(swarm::db::TxMode::kRead);
  auto comments = hive.repo->GetComments(*tx, cell.id);
  tx->Commit();
  assert(comments.size() == 1);
  assert(comments[0].body == "first pass done, tests added");
}

void TestEpicMembership() {
  Hive hive("membership");

  auto epic  = hive.Create("epic", "epic");
  auto task  = hive.Create("task");
  auto plain = hive.Create("plain");

  assert(Throws<swarm::util::InvalidState>([&] { hive.service->AddChildToEpic(plain.id, task.id); }));

  hive.service->AddChildToEpic(epic.id, task.id);
  assert(hive.Cell(task.id)->parent_id == epic.id);

  assert(Throws<swarm::util::InvalidState>([&] { hive.service->RemoveChildFromEpic(epic.id, plain.id); }));

  hive.service->RemoveChildFromEpic(epic.id, task.id);
  assert(!hive.Cell(task.id)->parent_id);
}

} // namespace

int main() {
  TestCreateCell();
  TestEpicWithDependentSubtasks();
  TestDependencyValidation();
  TestDeletedCellsAreGone();
  TestStatusCommands();
  TestUpdateAppendsOnlyChanges();
  TestLabels();
  TestCommentThreads();
  TestEpicMembership();

  std::cout << "swarm_hive_integration_hive_service: pass\n";
  return 0;
}
