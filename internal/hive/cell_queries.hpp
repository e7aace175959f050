#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/service/service_context.hpp"

namespace swarm::hive {

class BlockingIndex;

enum class SortPolicy {
  kHybrid,    // younger than 48h by priority, older ones by age
  kPriority,
  kOldest
};

struct ReadyWorkOptions {
  std::optional<int64_t>     limit;
  std::optional<std::string> assignee;
  bool                       unassigned = false;
  std::vector<std::string>   labels;  // every label must be present
  SortPolicy                 sort = SortPolicy::kHybrid;
};

struct BlockedCell {
  db::model::CellRecord    cell;
  std::vector<std::string> blockers;
};

struct EpicStatus {
  std::string epic_id;
  std::string title;
  int64_t     total_children  = 0;
  int64_t     closed_children = 0;
};

struct StaleOptions {
  std::optional<std::string> status;
  std::optional<int64_t>     limit;
};

struct HiveStatistics {
  int64_t total_cells = 0;
  int64_t open        = 0;
  int64_t in_progress = 0;
  int64_t closed      = 0;
  int64_t blocked     = 0;
  int64_t ready       = 0;

  std::map<std::string, int64_t> by_type;
};

/*
  Read side of the hive. Every call runs in its own read transaction.

  Advisory listings trust the blocked cache; GetNextReadyCell re-derives
  blocking from the dependency edges.
*/
class CellQueries {
 public:
  CellQueries(service::ServiceContext ctx, std::shared_ptr<BlockingIndex> blocking);

  std::optional<db::model::CellRecord> GetCell(const std::string& cell_id);

  // An empty filter project key means the context project.
  std::vector<db::model::CellRecord> QueryCells(db::CellFilter filter);

  std::vector<db::model::DependencyRecord> GetDependencies(const std::string& cell_id);
  std::vector<db::model::DependencyRecord> GetDependents(const std::string& cell_id);

  std::vector<std::string> GetLabels(const std::string& cell_id);
  std::vector<std::string> GetCellsWithLabel(const std::string& label);

  std::vector<db::model::CommentRecord> GetComments(const std::string& cell_id);

  std::vector<db::model::CellRecord> GetEpicChildren(const std::string& epic_id);

  // Open epic with at least one live child, every live child closed.
  bool                    IsEpicClosureEligible(const std::string& epic_id);
  std::vector<EpicStatus> GetEpicsEligibleForClosure();

  std::optional<db::model::CellRecord> GetNextReadyCell();
  std::vector<db::model::CellRecord>   GetReadyWork(const ReadyWorkOptions& options = {});
  std::vector<db::model::CellRecord>   GetInProgressCells();
  std::vector<BlockedCell>             GetBlockedCells();

  // Not closed, not updated for `days`. Oldest update first.
  std::vector<db::model::CellRecord> GetStaleCells(int days, const StaleOptions& options = {});

  HiveStatistics GetStatistics();

  // Matches the hash segment of an id, or a full id. Throws
  // util::InvalidState when more than one cell matches.
  std::optional<std::string> ResolvePartialId(const std::string& partial);

 private:
  std::optional<EpicStatus> EpicClosureStatus(db::Transaction& tx, const db::model::CellRecord& epic);

  service::ServiceContext        ctx_;
  std::shared_ptr<BlockingIndex> blocking_;
};

} // namespace swarm::hive
