#include "dirty_tracker.hpp"

#include "internal/util/clock.hpp"

namespace swarm::hive {

DirtyTracker::DirtyTracker(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

void DirtyTracker::MarkDirty(db::Transaction& tx, const std::string& project_key, const std::string& cell_id) {
  db::ThrowIfError(repository_->MarkDirty(tx, project_key, cell_id, clock_->NowMillis()), "mark dirty " + cell_id);
}

void DirtyTracker::MarkDirty(const std::string& project_key, const std::string& cell_id) {
  auto tx = repository_->Begin();
  MarkDirty(*tx, project_key, cell_id);
  tx->Commit();
}

std::vector<db::model::DirtyRecord> DirtyTracker::GetDirty(db::Transaction& tx, const std::string& project_key) {
  return repository_->ListDirty(tx, project_key);
}

std::vector<std::string> DirtyTracker::GetDirty(const std::string& project_key) {
  auto tx = repository_->Begin(db::TxMode::kRead);

  std::vector<std::string> ids;
  for (const auto& marker : repository_->ListDirty(*tx, project_key)) {
    ids.push_back(marker.cell_id);
  }
  return ids;
}

bool DirtyTracker::Clear(db::Transaction& tx, const db::model::DirtyRecord& marker) {
  return repository_->ClearDirty(tx, marker.cell_id, marker.mark_count);
}

} // namespace swarm::hive
