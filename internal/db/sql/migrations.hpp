#pragma once

#include <string>
#include <vector>

namespace swarm::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL() and version bookkeeping. RunMigrations
  is expected to be called inside one write transaction so concurrent
  processes opening a fresh store do not race.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  // 0 when no migration has been applied.
  virtual int CurrentVersion() = 0;

  virtual void RecordVersion(int version) = 0;
};

struct Migration {
  int                      version = 0;
  std::vector<std::string> statements;
};

// Ordered schema history. Append only.
const std::vector<Migration>& SchemaMigrations();

// Applies every migration above CurrentVersion(). Returns how many ran.
int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered);

} // namespace swarm::db::sql
