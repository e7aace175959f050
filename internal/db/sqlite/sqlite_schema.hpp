#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace swarm::db::sqlite {

/*
  Brings the store up to the latest schema version inside one
  BEGIN IMMEDIATE transaction. Safe when several processes open a fresh
  file at the same time. Returns the number of migrations applied.
*/
int BootstrapSchema(const std::shared_ptr<SqliteDB>& db);

} // namespace swarm::db::sqlite
