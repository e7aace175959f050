#include "migrations.hpp"

namespace swarm::db::sql {

const std::vector<Migration>& SchemaMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       {
           "CREATE TABLE IF NOT EXISTS events ("
           " id INTEGER PRIMARY KEY AUTOINCREMENT,"
           " project_key TEXT NOT NULL,"
           " sequence INTEGER NOT NULL,"
           " type TEXT NOT NULL,"
           " cell_id TEXT,"
           " timestamp_ms INTEGER NOT NULL,"
           " payload TEXT NOT NULL,"
           " UNIQUE(project_key, sequence));",
           "CREATE INDEX IF NOT EXISTS idx_events_cell ON events(cell_id);",
           "CREATE INDEX IF NOT EXISTS idx_events_type ON events(project_key, type);",

           "CREATE TABLE IF NOT EXISTS event_cursors ("
           " project_key TEXT NOT NULL,"
           " consumer TEXT NOT NULL,"
           " sequence INTEGER NOT NULL,"
           " updated_at_ms INTEGER NOT NULL,"
           " PRIMARY KEY (project_key, consumer));",

           "CREATE TABLE IF NOT EXISTS cells ("
           " id TEXT PRIMARY KEY,"
           " project_key TEXT NOT NULL,"
           " issue_type TEXT NOT NULL CHECK (issue_type IN ('bug','feature','task','epic','chore')),"
           " status TEXT NOT NULL CHECK (status IN ('open','in_progress','blocked','closed')),"
           " title TEXT NOT NULL,"
           " description TEXT,"
           " priority INTEGER NOT NULL DEFAULT 2 CHECK (priority BETWEEN 0 AND 3),"
           " parent_id TEXT,"
           " assignee TEXT,"
           " created_by TEXT,"
           " created_at_ms INTEGER NOT NULL,"
           " updated_at_ms INTEGER NOT NULL,"
           " closed_at_ms INTEGER,"
           " closed_reason TEXT,"
           " deleted_at_ms INTEGER,"
           " deleted_by TEXT,"
           " delete_reason TEXT,"
           " CHECK ((status = 'closed') = (closed_at_ms IS NOT NULL)));",
           "CREATE INDEX IF NOT EXISTS idx_cells_project_status ON cells(project_key, status);",
           "CREATE INDEX IF NOT EXISTS idx_cells_parent ON cells(parent_id);",

           "CREATE TABLE IF NOT EXISTS cell_dependencies ("
           " cell_id TEXT NOT NULL REFERENCES cells(id) ON DELETE CASCADE,"
           " depends_on_id TEXT NOT NULL,"
           " relationship TEXT NOT NULL CHECK (relationship IN ('blocks','related','parent-child','discovered-from',"
           "'replies-to','relates-to','duplicates','supersedes')),"
           " created_at_ms INTEGER NOT NULL,"
           " created_by TEXT,"
           " PRIMARY KEY (cell_id, depends_on_id, relationship));",
           "CREATE INDEX IF NOT EXISTS idx_dependencies_target ON cell_dependencies(depends_on_id);",

           "CREATE TABLE IF NOT EXISTS cell_labels ("
           " cell_id TEXT NOT NULL REFERENCES cells(id) ON DELETE CASCADE,"
           " label TEXT NOT NULL,"
           " created_at_ms INTEGER NOT NULL,"
           " PRIMARY KEY (cell_id, label));",

           "CREATE TABLE IF NOT EXISTS cell_comments ("
           " id INTEGER PRIMARY KEY,"
           " cell_id TEXT NOT NULL REFERENCES cells(id) ON DELETE CASCADE,"
           " author TEXT NOT NULL,"
           " body TEXT NOT NULL,"
           " parent_id INTEGER,"
           " created_at_ms INTEGER NOT NULL,"
           " updated_at_ms INTEGER NOT NULL);",
           "CREATE INDEX IF NOT EXISTS idx_comments_cell ON cell_comments(cell_id);",

           "CREATE TABLE IF NOT EXISTS blocked_cells_cache ("
           " cell_id TEXT PRIMARY KEY REFERENCES cells(id) ON DELETE CASCADE,"
           " blocker_ids TEXT NOT NULL,"
           " updated_at_ms INTEGER NOT NULL);",

           "CREATE TABLE IF NOT EXISTS dirty_cells ("
           " cell_id TEXT PRIMARY KEY,"
           " project_key TEXT NOT NULL,"
           " marked_at_ms INTEGER NOT NULL,"
           " mark_count INTEGER NOT NULL DEFAULT 1);",
           "CREATE INDEX IF NOT EXISTS idx_dirty_project ON dirty_cells(project_key);",

           "CREATE TABLE IF NOT EXISTS file_reservations ("
           " id INTEGER PRIMARY KEY AUTOINCREMENT,"
           " project_key TEXT NOT NULL,"
           " agent_name TEXT NOT NULL,"
           " path_pattern TEXT NOT NULL,"
           " exclusive INTEGER NOT NULL DEFAULT 1,"
           " reason TEXT,"
           " created_at_ms INTEGER NOT NULL,"
           " expires_at_ms INTEGER NOT NULL,"
           " released_at_ms INTEGER);",
           "CREATE INDEX IF NOT EXISTS idx_reservations_active"
           " ON file_reservations(project_key, released_at_ms, expires_at_ms);",
       }},
  };
  return kMigrations;
}

int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered) {
  const int current = executor.CurrentVersion();
  int       applied = 0;

  for (const auto& migration : ordered) {
    if (migration.version <= current) continue;

    for (const auto& sql : migration.statements) {
      executor.ExecuteSQL(sql);
    }
    executor.RecordVersion(migration.version);
    ++applied;
  }
  return applied;
}

} // namespace swarm::db::sql
