#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/hive/events.hpp"

namespace swarm::hive {

class BlockingIndex;
class DirtyTracker;

/*
  Applies one event to the read model inside the caller's transaction.

  Each handler performs a targeted row update. Status-affecting handlers
  and edge changes invalidate the blocking index. Every projected cell
  event ends by marking the affected cell(s) dirty. Unknown event types
  are logged and skipped; reservation audit events have no projection.
*/
class ProjectionEngine {
 public:
  ProjectionEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<BlockingIndex> blocking,
                   std::shared_ptr<DirtyTracker> dirty);

  void Apply(db::Transaction& tx, const Event& event);

  // Recomputes derived state (blocked cache) for the whole project.
  void RebuildDerived(db::Transaction& tx, const std::string& project_key);

  BlockingIndex& Blocking() {
    return *blocking_;
  }

 private:
  friend struct ProjectionHandlers;

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<BlockingIndex>  blocking_;
  std::shared_ptr<DirtyTracker>   dirty_;
};

} // namespace swarm::hive
