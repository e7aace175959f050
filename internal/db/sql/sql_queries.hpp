#pragma once

namespace swarm::db::sql {

/*
  Canonical SQL for the SQLite backend.

  Filter queries (events, cells) are assembled at runtime from the
  *_SELECT prefixes below plus positional Params.
*/

// events

static constexpr const char* NEXT_EVENT_SEQUENCE =
    "SELECT COALESCE(MAX(sequence), 0) + 1 FROM events WHERE project_key=?;";

static constexpr const char* INSERT_EVENT =
    "INSERT INTO events(project_key,sequence,type,cell_id,timestamp_ms,payload)"
    " VALUES(?,?,?,?,?,?);";

static constexpr const char* EVENTS_SELECT =
    "SELECT id,project_key,sequence,type,cell_id,timestamp_ms,payload FROM events";

static constexpr const char* LATEST_SEQUENCE =
    "SELECT COALESCE(MAX(sequence), 0) FROM events WHERE project_key=?;";

static constexpr const char* UPSERT_CURSOR =
    "INSERT INTO event_cursors(project_key,consumer,sequence,updated_at_ms)"
    " VALUES(?,?,?,?)"
    " ON CONFLICT(project_key,consumer) DO UPDATE SET"
    " sequence=excluded.sequence,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SELECT_CURSOR =
    "SELECT project_key,consumer,sequence,updated_at_ms"
    " FROM event_cursors WHERE project_key=? AND consumer=?;";

// cells

static constexpr const char* CELL_COLUMNS =
    "id,project_key,issue_type,status,title,description,priority,parent_id,assignee,created_by,"
    "created_at_ms,updated_at_ms,closed_at_ms,closed_reason,deleted_at_ms,deleted_by,delete_reason";

static constexpr const char* INSERT_CELL =
    "INSERT INTO cells(id,project_key,issue_type,status,title,description,priority,parent_id,assignee,created_by,"
    "created_at_ms,updated_at_ms,closed_at_ms,closed_reason,deleted_at_ms,deleted_by,delete_reason)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* UPDATE_CELL =
    "UPDATE cells SET issue_type=?,status=?,title=?,description=?,priority=?,parent_id=?,assignee=?,"
    "updated_at_ms=?,closed_at_ms=?,closed_reason=?,deleted_at_ms=?,deleted_by=?,delete_reason=?"
    " WHERE id=?;";

static constexpr const char* DELETE_PROJECT_CELLS =
    "DELETE FROM cells WHERE project_key=?;";

static constexpr const char* DELETE_PROJECT_DIRTY =
    "DELETE FROM dirty_cells WHERE project_key=?;";

// dependencies

static constexpr const char* INSERT_DEPENDENCY =
    "INSERT OR IGNORE INTO cell_dependencies(cell_id,depends_on_id,relationship,created_at_ms,created_by)"
    " VALUES(?,?,?,?,?);";

static constexpr const char* DELETE_DEPENDENCY =
    "DELETE FROM cell_dependencies WHERE cell_id=? AND depends_on_id=? AND relationship=?;";

static constexpr const char* SELECT_DEPENDENCIES =
    "SELECT cell_id,depends_on_id,relationship,created_at_ms,created_by"
    " FROM cell_dependencies WHERE cell_id=? ORDER BY created_at_ms, depends_on_id;";

static constexpr const char* SELECT_DEPENDENTS =
    "SELECT cell_id,depends_on_id,relationship,created_at_ms,created_by"
    " FROM cell_dependencies WHERE depends_on_id=? ORDER BY created_at_ms, cell_id;";

// labels

static constexpr const char* INSERT_LABEL =
    "INSERT OR IGNORE INTO cell_labels(cell_id,label,created_at_ms) VALUES(?,?,?);";

static constexpr const char* DELETE_LABEL =
    "DELETE FROM cell_labels WHERE cell_id=? AND label=?;";

static constexpr const char* SELECT_LABELS =
    "SELECT cell_id,label,created_at_ms FROM cell_labels WHERE cell_id=? ORDER BY created_at_ms, label;";

static constexpr const char* SELECT_CELLS_WITH_LABEL =
    "SELECT l.cell_id FROM cell_labels l JOIN cells c ON c.id = l.cell_id"
    " WHERE c.project_key=? AND l.label=? ORDER BY l.cell_id;";

// comments

static constexpr const char* INSERT_COMMENT =
    "INSERT INTO cell_comments(id,cell_id,author,body,parent_id,created_at_ms,updated_at_ms)"
    " VALUES(?,?,?,?,?,?,?);";

static constexpr const char* UPDATE_COMMENT =
    "UPDATE cell_comments SET body=?,updated_at_ms=? WHERE id=?;";

static constexpr const char* DELETE_COMMENT =
    "DELETE FROM cell_comments WHERE id=?;";

static constexpr const char* SELECT_COMMENT =
    "SELECT id,cell_id,author,body,parent_id,created_at_ms,updated_at_ms FROM cell_comments WHERE id=?;";

static constexpr const char* SELECT_COMMENTS =
    "SELECT id,cell_id,author,body,parent_id,created_at_ms,updated_at_ms"
    " FROM cell_comments WHERE cell_id=? ORDER BY created_at_ms, id;";

// blocked cache

static constexpr const char* UPSERT_BLOCKED =
    "INSERT INTO blocked_cells_cache(cell_id,blocker_ids,updated_at_ms) VALUES(?,?,?)"
    " ON CONFLICT(cell_id) DO UPDATE SET"
    " blocker_ids=excluded.blocker_ids,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* DELETE_BLOCKED =
    "DELETE FROM blocked_cells_cache WHERE cell_id=?;";

static constexpr const char* SELECT_BLOCKED =
    "SELECT cell_id,blocker_ids,updated_at_ms FROM blocked_cells_cache WHERE cell_id=?;";

static constexpr const char* SELECT_PROJECT_BLOCKED =
    "SELECT b.cell_id,b.blocker_ids,b.updated_at_ms FROM blocked_cells_cache b"
    " JOIN cells c ON c.id = b.cell_id WHERE c.project_key=? ORDER BY b.cell_id;";

// dirty markers

static constexpr const char* UPSERT_DIRTY =
    "INSERT INTO dirty_cells(cell_id,project_key,marked_at_ms,mark_count) VALUES(?,?,?,1)"
    " ON CONFLICT(cell_id) DO UPDATE SET"
    " marked_at_ms=excluded.marked_at_ms,"
    " mark_count=dirty_cells.mark_count+1;";

static constexpr const char* SELECT_DIRTY =
    "SELECT cell_id,project_key,marked_at_ms,mark_count FROM dirty_cells"
    " WHERE project_key=? ORDER BY marked_at_ms, cell_id;";

static constexpr const char* CLEAR_DIRTY =
    "DELETE FROM dirty_cells WHERE cell_id=? AND mark_count=?;";

// reservations

static constexpr const char* INSERT_RESERVATION =
    "INSERT INTO file_reservations(project_key,agent_name,path_pattern,exclusive,reason,created_at_ms,expires_at_ms)"
    " VALUES(?,?,?,?,?,?,?);";

static constexpr const char* SELECT_ACTIVE_RESERVATIONS =
    "SELECT id,project_key,agent_name,path_pattern,exclusive,reason,created_at_ms,expires_at_ms,released_at_ms"
    " FROM file_reservations"
    " WHERE project_key=? AND released_at_ms IS NULL AND expires_at_ms > ?"
    " ORDER BY id;";

static constexpr const char* RELEASE_RESERVATION =
    "UPDATE file_reservations SET released_at_ms=? WHERE id=? AND released_at_ms IS NULL;";

static constexpr const char* DELETE_INACTIVE_RESERVATIONS =
    "DELETE FROM file_reservations"
    " WHERE project_key=? AND (released_at_ms IS NOT NULL OR expires_at_ms <= ?);";

// schema bookkeeping

static constexpr const char* CREATE_SCHEMA_VERSION =
    "CREATE TABLE IF NOT EXISTS schema_version (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);";

static constexpr const char* SELECT_SCHEMA_VERSION =
    "SELECT COALESCE(MAX(version), 0) FROM schema_version;";

static constexpr const char* INSERT_SCHEMA_VERSION =
    "INSERT INTO schema_version(version,applied_at_ms) VALUES(?,?);";

}
