#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/service/service_context.hpp"

namespace swarm::hive {

class DirtyTracker;

struct FlushResult {
  int64_t exported_count = 0;
  int64_t failed_count   = 0;
};

/*
  Merges dirty cells into the portable JSONL file.

      lock <path>.lock
      read existing lines keyed by id
      replace the lines of dirty cells
      write tmp -> rename
      clear exported markers (mark_count guarded)

  Lines whose id is not being re-exported are written back byte for byte,
  so entries flushed by another process are never lost. A flush with no
  dirty cells does not touch the file.
*/
class FlushManager {
 public:
  FlushManager(service::ServiceContext ctx, std::shared_ptr<DirtyTracker> dirty, std::string export_path);

  FlushResult Flush();
  FlushResult Flush(const std::string& project_key);

  // Full JSONL rendering of a project, sorted by id, trailing newline.
  std::string ExportAll(const std::string& project_key, bool include_deleted = true);

  const std::string& ExportPath() const {
    return export_path_;
  }

 private:
  service::ServiceContext       ctx_;
  std::shared_ptr<DirtyTracker> dirty_;
  std::string                   export_path_;
};

} // namespace swarm::hive
