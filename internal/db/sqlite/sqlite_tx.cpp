#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace swarm::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode)
    : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec(mode == TxMode::kWrite ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      SWARM_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
  if (lock_.owns_lock()) lock_.unlock();
}

// The connection is free for the next transaction as soon as this one ends,
// even while the object is still alive.
void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  if (lock_.owns_lock()) lock_.unlock();
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  committed_ = true;
  if (lock_.owns_lock()) lock_.unlock();
}

} // namespace swarm::db::sqlite
