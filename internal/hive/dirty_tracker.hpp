#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace swarm::util { class Clock; }

namespace swarm::hive {

/*
  Records cells whose state is not yet reflected in the export file.
  Re-marking an already dirty cell refreshes the timestamp and bumps the
  mark counter.
*/
class DirtyTracker {
 public:
  DirtyTracker(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock);

  void MarkDirty(db::Transaction& tx, const std::string& project_key, const std::string& cell_id);
  void MarkDirty(const std::string& project_key, const std::string& cell_id);

  std::vector<db::model::DirtyRecord> GetDirty(db::Transaction& tx, const std::string& project_key);
  std::vector<std::string>            GetDirty(const std::string& project_key);

  // False when the cell was re-marked after `marker` was read.
  bool Clear(db::Transaction& tx, const db::model::DirtyRecord& marker);

 private:
  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<util::Clock>    clock_;
};

} // namespace swarm::hive
