#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace swarm::db::model {

// Derived; always recomputable from dependency edges + cell statuses.
struct BlockedRecord {
  std::string              cell_id;
  std::vector<std::string> blocker_ids;
  int64_t                  updated_at_ms = 0;
};

/*
  Dirty marker. mark_count increases on every re-mark so a flush only
  clears markers it actually exported.
*/
struct DirtyRecord {
  std::string cell_id;
  std::string project_key;
  int64_t     marked_at_ms = 0;
  int64_t     mark_count   = 0;
};

} // namespace swarm::db::model
