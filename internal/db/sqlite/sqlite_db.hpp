#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <mutex>
#include <string>

namespace swarm::db::sqlite {

struct SqliteOptions {
  std::string path;
  uint32_t    busy_timeout_ms = 5000;
  bool        wal_mode        = true;
};

/*
  Thin RAII wrapper around sqlite3*.

  One connection per process. Transactions on this connection are
  serialised through TxMutex(); cross-process exclusion is SQLite's own
  file locking.
*/
class SqliteDB {
 public:
  explicit SqliteDB(SqliteOptions options);
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return options_.path;
  }

  // Execute a SQL string (used for pragmas/migrations/transaction control).
  // Throws util::TransientError when the database is busy or locked.
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

 private:
  // Configure PRAGMAs (WAL, foreign keys, busy timeout)
  void Configure();

  sqlite3*      db_ = nullptr;
  SqliteOptions options_;
  std::mutex    tx_mutex_;
};

} // namespace swarm::db::sqlite
