#include "cell_queries.hpp"

#include <algorithm>
#include <unordered_set>

#include "internal/hive/blocking_index.hpp"
#include "internal/model/cell.hpp"
#include "internal/util/clock.hpp"
#include "internal/util/errors.hpp"

namespace swarm::hive {

namespace {

constexpr int64_t kMillisPerHour = 60LL * 60 * 1000;
constexpr int64_t kMillisPerDay  = 24 * kMillisPerHour;
constexpr int64_t kHybridWindow  = 48 * kMillisPerHour;

bool ByPriority(const db::model::CellRecord& a, const db::model::CellRecord& b) {
  if (a.priority != b.priority) return a.priority < b.priority;
  if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
  return a.id < b.id;
}

bool ByAge(const db::model::CellRecord& a, const db::model::CellRecord& b) {
  if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
  return a.id < b.id;
}

void SortCells(std::vector<db::model::CellRecord>& cells, SortPolicy policy, int64_t now_ms) {
  switch (policy) {
    case SortPolicy::kPriority:
      std::sort(cells.begin(), cells.end(), ByPriority);
      return;
    case SortPolicy::kOldest:
      std::sort(cells.begin(), cells.end(), ByAge);
      return;
    case SortPolicy::kHybrid: {
      const int64_t cutoff = now_ms - kHybridWindow;
      auto          recent = std::stable_partition(cells.begin(), cells.end(),
                                                   [&](const auto& c) { return c.created_at_ms >= cutoff; });
      std::sort(cells.begin(), recent, ByPriority);
      std::sort(recent, cells.end(), ByAge);
      return;
    }
  }
}

// Second to last dash-separated segment of {prefix}-{hash}-{suffix}.
std::string HashSegment(const std::string& id) {
  const auto last = id.rfind('-');
  if (last == std::string::npos || last == 0) return {};
  const auto prev = id.rfind('-', last - 1);
  const auto from = prev == std::string::npos ? 0 : prev + 1;
  return id.substr(from, last - from);
}

} // namespace

CellQueries::CellQueries(service::ServiceContext ctx, std::shared_ptr<BlockingIndex> blocking)
    : ctx_(std::move(ctx)), blocking_(std::move(blocking)) {
}

std::optional<db::model::CellRecord> CellQueries::GetCell(const std::string& cell_id) {
  auto tx   = ctx_.repository->Begin(db::TxMode::kRead);
  auto cell = ctx_.repository->GetCell(*tx, cell_id);
  tx->Commit();

  if (cell && cell->project_key != ctx_.project_key) return std::nullopt;
  return cell;
}

std::vector<db::model::CellRecord> CellQueries::QueryCells(db::CellFilter filter) {
  if (filter.project_key.empty()) filter.project_key = ctx_.project_key;

  auto tx    = ctx_.repository->Begin(db::TxMode::kRead);
  auto cells = ctx_.repository->QueryCells(*tx, filter);
  tx->Commit();
  return cells;
}

std::vector<db::model::DependencyRecord> CellQueries::GetDependencies(const std::string& cell_id) {
  auto tx    = ctx_.repository->Begin(db::TxMode::kRead);
  auto edges = ctx_.repository->GetDependencies(*tx, cell_id);
  tx->Commit();
  return edges;
}

std::vector<db::model::DependencyRecord> CellQueries::GetDependents(const std::string& cell_id) {
  auto tx    = ctx_.repository->Begin(db::TxMode::kRead);
  auto edges = ctx_.repository->GetDependents(*tx, cell_id);
  tx->Commit();
  return edges;
}

std::vector<std::string> CellQueries::GetLabels(const std::string& cell_id) {
  auto tx = ctx_.repository->Begin(db::TxMode::kRead);

  std::vector<std::string> labels;
  for (const auto& label : ctx_.repository->GetLabels(*tx, cell_id)) {
    labels.push_back(label.label);
  }
  tx->Commit();
  return labels;
}

std::vector<std::string> CellQueries::GetCellsWithLabel(const std::string& label) {
  auto tx  = ctx_.repository->Begin(db::TxMode::kRead);
  auto ids = ctx_.repository->GetCellsWithLabel(*tx, ctx_.project_key, label);
  tx->Commit();
  return ids;
}

std::vector<db::model::CommentRecord> CellQueries::GetComments(const std::string& cell_id) {
  auto tx       = ctx_.repository->Begin(db::TxMode::kRead);
  auto comments = ctx_.repository->GetComments(*tx, cell_id);
  tx->Commit();
  return comments;
}

std::vector<db::model::CellRecord> CellQueries::GetEpicChildren(const std::string& epic_id) {
  db::CellFilter filter;
  filter.parent_id = epic_id;
  return QueryCells(std::move(filter));
}

std::optional<EpicStatus> CellQueries::EpicClosureStatus(db::Transaction& tx, const db::model::CellRecord& epic) {
  if (epic.issue_type != "epic" || epic.status == model::kStatusClosed || epic.IsDeleted()) return std::nullopt;

  db::CellFilter filter;
  filter.project_key = ctx_.project_key;
  filter.parent_id   = epic.id;

  EpicStatus status;
  status.epic_id = epic.id;
  status.title   = epic.title;
  for (const auto& child : ctx_.repository->QueryCells(tx, filter)) {
    ++status.total_children;
    if (child.status == model::kStatusClosed) ++status.closed_children;
  }

  if (status.total_children == 0 || status.closed_children != status.total_children) return std::nullopt;
  return status;
}

bool CellQueries::IsEpicClosureEligible(const std::string& epic_id) {
  auto tx   = ctx_.repository->Begin(db::TxMode::kRead);
  auto epic = ctx_.repository->GetCell(*tx, epic_id);
  if (!epic) throw util::NotFound("cell " + epic_id + " not found");

  const bool eligible = EpicClosureStatus(*tx, *epic).has_value();
  tx->Commit();
  return eligible;
}

std::vector<EpicStatus> CellQueries::GetEpicsEligibleForClosure() {
  db::CellFilter filter;
  filter.project_key = ctx_.project_key;
  filter.issue_type  = std::string("epic");

  auto tx = ctx_.repository->Begin(db::TxMode::kRead);

  std::vector<db::model::CellRecord> epics = ctx_.repository->QueryCells(*tx, filter);
  std::sort(epics.begin(), epics.end(), ByAge);

  std::vector<EpicStatus> out;
  for (const auto& epic : epics) {
    if (auto status = EpicClosureStatus(*tx, epic)) out.push_back(std::move(*status));
  }
  tx->Commit();
  return out;
}

std::optional<db::model::CellRecord> CellQueries::GetNextReadyCell() {
  db::CellFilter filter;
  filter.project_key = ctx_.project_key;
  filter.statuses    = {std::string(model::kStatusOpen)};

  auto tx = ctx_.repository->Begin(db::TxMode::kRead);
  for (const auto& cell : ctx_.repository->QueryCells(*tx, filter)) {
    if (!blocking_->VerifyBlocked(*tx, cell.id)) {
      tx->Commit();
      return cell;
    }
  }
  tx->Commit();
  return std::nullopt;
}

std::vector<db::model::CellRecord> CellQueries::GetReadyWork(const ReadyWorkOptions& options) {
  db::CellFilter filter;
  filter.project_key = ctx_.project_key;
  filter.statuses    = {std::string(model::kStatusOpen), std::string(model::kStatusInProgress)};
  filter.assignee    = options.assignee;
  filter.unassigned  = options.unassigned;
  if (options.unassigned) filter.assignee.reset();

  auto tx = ctx_.repository->Begin(db::TxMode::kRead);

  std::vector<std::unordered_set<std::string>> labelled;
  for (const auto& label : options.labels) {
    auto ids = ctx_.repository->GetCellsWithLabel(*tx, ctx_.project_key, label);
    labelled.emplace_back(ids.begin(), ids.end());
  }

  std::vector<db::model::CellRecord> ready;
  for (auto& cell : ctx_.repository->QueryCells(*tx, filter)) {
    if (blocking_->IsBlocked(*tx, cell.id)) continue;

    const bool has_labels = std::all_of(labelled.begin(), labelled.end(),
                                        [&](const auto& ids) { return ids.count(cell.id) > 0; });
    if (has_labels) ready.push_back(std::move(cell));
  }
  tx->Commit();

  SortCells(ready, options.sort, ctx_.clock->NowMillis());
  if (options.limit && static_cast<int64_t>(ready.size()) > *options.limit) {
    ready.resize(static_cast<std::size_t>(*options.limit));
  }
  return ready;
}

std::vector<db::model::CellRecord> CellQueries::GetInProgressCells() {
  db::CellFilter filter;
  filter.statuses = {std::string(model::kStatusInProgress)};
  return QueryCells(std::move(filter));
}

std::vector<BlockedCell> CellQueries::GetBlockedCells() {
  auto tx = ctx_.repository->Begin(db::TxMode::kRead);

  std::vector<BlockedCell> out;
  for (auto& entry : ctx_.repository->ListBlocked(*tx, ctx_.project_key)) {
    auto cell = ctx_.repository->GetCell(*tx, entry.cell_id);
    if (!cell || cell->IsDeleted()) continue;
    out.push_back({std::move(*cell), std::move(entry.blocker_ids)});
  }
  tx->Commit();

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return ByPriority(a.cell, b.cell); });
  return out;
}

std::vector<db::model::CellRecord> CellQueries::GetStaleCells(int days, const StaleOptions& options) {
  if (days < 0) throw util::ValidationError("days", "days must not be negative");

  db::CellFilter filter;
  filter.project_key       = ctx_.project_key;
  filter.updated_before_ms = ctx_.clock->NowMillis() - static_cast<int64_t>(days) * kMillisPerDay;
  if (options.status) {
    filter.statuses = {*options.status};
  } else {
    filter.statuses = {std::string(model::kStatusOpen), std::string(model::kStatusInProgress),
                       std::string(model::kStatusBlocked)};
  }

  auto cells = QueryCells(std::move(filter));

  std::stable_sort(cells.begin(), cells.end(),
                   [](const auto& a, const auto& b) { return a.updated_at_ms < b.updated_at_ms; });

  if (options.limit && static_cast<int64_t>(cells.size()) > *options.limit) {
    cells.resize(static_cast<std::size_t>(*options.limit));
  }
  return cells;
}

HiveStatistics CellQueries::GetStatistics() {
  db::CellFilter filter;
  filter.project_key = ctx_.project_key;

  HiveStatistics stats;

  auto tx = ctx_.repository->Begin(db::TxMode::kRead);
  for (const auto& cell : ctx_.repository->QueryCells(*tx, filter)) {
    ++stats.total_cells;
    ++stats.by_type[cell.issue_type];

    const bool blocked = blocking_->IsBlocked(*tx, cell.id);
    if (blocked) ++stats.blocked;

    if (cell.status == model::kStatusOpen) {
      ++stats.open;
      if (!blocked) ++stats.ready;
    } else if (cell.status == model::kStatusInProgress) {
      ++stats.in_progress;
    } else if (cell.status == model::kStatusClosed) {
      ++stats.closed;
    }
  }
  tx->Commit();
  return stats;
}

std::optional<std::string> CellQueries::ResolvePartialId(const std::string& partial) {
  if (partial.empty()) throw util::ValidationError("id", "partial id is required");

  db::CellFilter filter;
  filter.project_key = ctx_.project_key;
  filter.id_contains = partial;

  std::vector<std::string> matches;
  for (const auto& cell : QueryCells(std::move(filter))) {
    if (cell.id == partial) return cell.id;
    if (HashSegment(cell.id).rfind(partial, 0) == 0) matches.push_back(cell.id);
  }

  if (matches.empty()) return std::nullopt;
  if (matches.size() > 1) {
    throw util::InvalidState("ambiguous id '" + partial + "': " + std::to_string(matches.size()) + " cells match");
  }
  return matches.front();
}

} // namespace swarm::hive
