#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace swarm::util { class Clock; }

namespace swarm::hive {

/*
  Blocked-cell cache.

  Contract: the cache is always derivable from dependency edges + cell
  statuses and is never a source of truth. A cell is blocked iff it has at
  least one edge whose target exists, is not closed and is not deleted.

  Invalidation runs synchronously inside the projecting transaction.
  IsBlocked/GetBlockers read the cache (advisory callers); VerifyBlocked
  and ComputeBlockers derive from edges (critical paths).
*/
class BlockingIndex {
 public:
  BlockingIndex(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock);

  bool                     IsBlocked(db::Transaction& tx, const std::string& cell_id);
  std::vector<std::string> GetBlockers(db::Transaction& tx, const std::string& cell_id);

  std::vector<std::string> ComputeBlockers(db::Transaction& tx, const std::string& cell_id);
  bool                     VerifyBlocked(db::Transaction& tx, const std::string& cell_id);

  // Recomputes cell_id and every cell depending on it.
  void Invalidate(db::Transaction& tx, const std::string& project_key, const std::string& cell_id);

  void Recompute(db::Transaction& tx, const std::string& cell_id);

  // Recomputes every entry of the project. Returns the number of blocked cells.
  std::size_t Rebuild(db::Transaction& tx, const std::string& project_key);

  // Own read transaction.
  bool                     IsBlocked(const std::string& cell_id);
  std::vector<std::string> GetBlockers(const std::string& cell_id);

 private:
  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<util::Clock>    clock_;
};

} // namespace swarm::hive
