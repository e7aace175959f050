#include "sqlite_schema.hpp"

#include <stdexcept>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace swarm::db::sqlite {

namespace {

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

  int CurrentVersion() override {
    db_.Exec(sql::CREATE_SCHEMA_VERSION);

    sqlite3_stmt* st = db_.Prepare(sql::SELECT_SCHEMA_VERSION);
    int           version = 0;
    if (sqlite3_step(st) == SQLITE_ROW) {
      version = sqlite3_column_int(st, 0);
    }
    sqlite3_finalize(st);
    return version;
  }

  void RecordVersion(int version) override {
    sqlite3_stmt* st = db_.Prepare(sql::INSERT_SCHEMA_VERSION);
    sqlite3_bind_int(st, 1, version);
    sqlite3_bind_int64(st, 2, util::ToUnixMillis(util::Now()));
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) {
      throw std::runtime_error("failed to record schema version " + std::to_string(version) + ": " +
                               sqlite3_errmsg(db_.Handle()));
    }
  }

 private:
  SqliteDB& db_;
};

} // namespace

int BootstrapSchema(const std::shared_ptr<SqliteDB>& db) {
  SqliteTransaction       tx(db, TxMode::kWrite);
  SqliteMigrationExecutor executor(*db);

  const int applied = sql::RunMigrations(executor, sql::SchemaMigrations());
  tx.Commit();

  if (applied > 0) {
    SWARM_LOG_INFO("schema migrated", {observability::StringField("path", db->Path()), observability::IntField("applied", applied)});
  }
  return applied;
}

} // namespace swarm::db::sqlite
