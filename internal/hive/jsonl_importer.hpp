#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "swarm/hive/v1.hpp"
#include "internal/hive/events.hpp"
#include "internal/service/service_context.hpp"

namespace swarm::db { class Transaction; }

namespace swarm::hive {

class EventStore;

struct ImportOptions {
  // Plan and validate every line, append nothing.
  bool dry_run = false;
  // Leave cells that already exist untouched.
  bool skip_existing = false;
};

struct ImportIssue {
  int64_t     line = 0;  // 1-based
  std::string cell_id;
  std::string message;
};

struct ImportResult {
  int64_t created = 0;
  int64_t updated = 0;
  int64_t skipped = 0;

  std::vector<ImportIssue> errors;
};

/*
  Loads a JSONL export back into the hive as events.

  A line whose canonical rendering equals the current export of that cell
  is skipped. Otherwise the difference is expressed as ordinary cell events
  so the log stays the source of truth. Dependencies are applied in a
  second pass once every cell of the file exists. A failing line is
  reported and does not stop the import.
*/
class JsonlImporter {
 public:
  JsonlImporter(service::ServiceContext ctx, std::shared_ptr<EventStore> store);

  ImportResult Import(const std::string& jsonl, const ImportOptions& options = {});
  ImportResult ImportFile(const std::string& path, const ImportOptions& options = {});

 private:
  std::vector<Event> PlanCell(db::Transaction& tx, const v1::CellExport& target, bool& is_new);
  std::vector<Event> PlanDependencies(db::Transaction& tx, const v1::CellExport& target);

  service::ServiceContext     ctx_;
  std::shared_ptr<EventStore> store_;
};

} // namespace swarm::hive
