#include "blocking_index.hpp"

#include <set>

#include "internal/model/cell.hpp"
#include "internal/util/clock.hpp"

namespace swarm::hive {

BlockingIndex::BlockingIndex(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

bool BlockingIndex::IsBlocked(db::Transaction& tx, const std::string& cell_id) {
  return repository_->GetBlocked(tx, cell_id).has_value();
}

std::vector<std::string> BlockingIndex::GetBlockers(db::Transaction& tx, const std::string& cell_id) {
  auto entry = repository_->GetBlocked(tx, cell_id);
  if (!entry) return {};
  return entry->blocker_ids;
}

std::vector<std::string> BlockingIndex::ComputeBlockers(db::Transaction& tx, const std::string& cell_id) {
  std::set<std::string> blockers;

  for (const auto& edge : repository_->GetDependencies(tx, cell_id)) {
    if (blockers.count(edge.depends_on_id)) continue;

    auto target = repository_->GetCell(tx, edge.depends_on_id);
    if (!target) continue;

    if (model::IsOpenBlocker(target->status, target->IsDeleted())) {
      blockers.insert(edge.depends_on_id);
    }
  }
  return {blockers.begin(), blockers.end()};
}

bool BlockingIndex::VerifyBlocked(db::Transaction& tx, const std::string& cell_id) {
  return !ComputeBlockers(tx, cell_id).empty();
}

void BlockingIndex::Recompute(db::Transaction& tx, const std::string& cell_id) {
  if (!repository_->GetCell(tx, cell_id)) return;

  auto blockers = ComputeBlockers(tx, cell_id);
  if (blockers.empty()) {
    db::ThrowIfError(repository_->DeleteBlocked(tx, cell_id), "clear blocked cache");
    return;
  }

  db::model::BlockedRecord record;
  record.cell_id       = cell_id;
  record.blocker_ids   = std::move(blockers);
  record.updated_at_ms = clock_->NowMillis();
  db::ThrowIfError(repository_->UpsertBlocked(tx, record), "update blocked cache");
}

void BlockingIndex::Invalidate(db::Transaction& tx, const std::string& project_key, const std::string& cell_id) {
  (void)project_key;

  Recompute(tx, cell_id);

  std::set<std::string> seen;
  for (const auto& edge : repository_->GetDependents(tx, cell_id)) {
    if (seen.insert(edge.cell_id).second) {
      Recompute(tx, edge.cell_id);
    }
  }
}

std::size_t BlockingIndex::Rebuild(db::Transaction& tx, const std::string& project_key) {
  db::CellFilter filter;
  filter.project_key     = project_key;
  filter.include_deleted = true;

  std::size_t blocked = 0;
  for (const auto& cell : repository_->QueryCells(tx, filter)) {
    Recompute(tx, cell.id);
    if (repository_->GetBlocked(tx, cell.id)) ++blocked;
  }
  return blocked;
}

bool BlockingIndex::IsBlocked(const std::string& cell_id) {
  auto tx = repository_->Begin(db::TxMode::kRead);
  return IsBlocked(*tx, cell_id);
}

std::vector<std::string> BlockingIndex::GetBlockers(const std::string& cell_id) {
  auto tx = repository_->Begin(db::TxMode::kRead);
  return GetBlockers(*tx, cell_id);
}

} // namespace swarm::hive
