#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <sstream>

#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_queries.hpp"

namespace swarm::db::sqlite {

using swarm::db::ErrorCode;
using swarm::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s) BindText(st, idx, *s);
    else sqlite3_bind_null(st, idx);
}

static void BindOptI64(sqlite3_stmt* st, int idx, const std::optional<int64_t>& v) {
    if (v) BindI64(st, idx, *v);
    else sqlite3_bind_null(st, idx);
}

// Empty strings are stored as NULL.
static void BindNullableText(sqlite3_stmt* st, int idx, const std::string& s) {
    if (s.empty()) sqlite3_bind_null(st, idx);
    else BindText(st, idx, s);
}

static void BindParams(sqlite3_stmt* st, const sql::Params& params) {
    int idx = 1;
    for (const auto& p : params) {
        if (std::holds_alternative<std::nullptr_t>(p)) {
            sqlite3_bind_null(st, idx);
        } else if (const auto* i = std::get_if<int64_t>(&p)) {
            BindI64(st, idx, *i);
        } else {
            BindText(st, idx, std::get<std::string>(p));
        }
        ++idx;
    }
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

static std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColText(st, col);
}

static std::optional<int64_t> ColOptI64(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColI64(st, col);
}

static std::string JoinIds(const std::vector<std::string>& ids) {
    std::string out;
    for (const auto& id : ids) {
        if (!out.empty()) out.push_back(',');
        out += id;
    }
    return out;
}

static std::vector<std::string> SplitIds(const std::string& joined) {
    std::vector<std::string> out;
    std::stringstream ss(joined);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

static model::CellRecord ReadCell(sqlite3_stmt* st) {
    model::CellRecord r;
    r.id = ColText(st, 0);
    r.project_key = ColText(st, 1);
    r.issue_type = ColText(st, 2);
    r.status = ColText(st, 3);
    r.title = ColText(st, 4);
    r.description = ColText(st, 5);
    r.priority = sqlite3_column_int(st, 6);
    r.parent_id = ColOptText(st, 7);
    r.assignee = ColOptText(st, 8);
    r.created_by = ColOptText(st, 9);
    r.created_at_ms = ColI64(st, 10);
    r.updated_at_ms = ColI64(st, 11);
    r.closed_at_ms = ColOptI64(st, 12);
    r.closed_reason = ColOptText(st, 13);
    r.deleted_at_ms = ColOptI64(st, 14);
    r.deleted_by = ColOptText(st, 15);
    r.delete_reason = ColOptText(st, 16);
    return r;
}

static model::EventRecord ReadEvent(sqlite3_stmt* st) {
    model::EventRecord r;
    r.id = ColI64(st, 0);
    r.project_key = ColText(st, 1);
    r.sequence = ColI64(st, 2);
    r.type = ColText(st, 3);
    r.cell_id = ColText(st, 4);
    r.timestamp_ms = ColI64(st, 5);
    r.payload_json = ColText(st, 6);
    return r;
}

static model::DependencyRecord ReadDependency(sqlite3_stmt* st) {
    model::DependencyRecord r;
    r.cell_id = ColText(st, 0);
    r.depends_on_id = ColText(st, 1);
    r.relationship = ColText(st, 2);
    r.created_at_ms = ColI64(st, 3);
    r.created_by = ColText(st, 4);
    return r;
}

static model::CommentRecord ReadComment(sqlite3_stmt* st) {
    model::CommentRecord r;
    r.id = ColI64(st, 0);
    r.cell_id = ColText(st, 1);
    r.author = ColText(st, 2);
    r.body = ColText(st, 3);
    r.parent_id = ColOptI64(st, 4).value_or(0);
    r.created_at_ms = ColI64(st, 5);
    r.updated_at_ms = ColI64(st, 6);
    return r;
}

static model::BlockedRecord ReadBlocked(sqlite3_stmt* st) {
    model::BlockedRecord r;
    r.cell_id = ColText(st, 0);
    r.blocker_ids = SplitIds(ColText(st, 1));
    r.updated_at_ms = ColI64(st, 2);
    return r;
}

static model::ReservationRecord ReadReservation(sqlite3_stmt* st) {
    model::ReservationRecord r;
    r.id = ColI64(st, 0);
    r.project_key = ColText(st, 1);
    r.agent_name = ColText(st, 2);
    r.path_pattern = ColText(st, 3);
    r.exclusive = sqlite3_column_int(st, 4) != 0;
    r.reason = ColText(st, 5);
    r.created_at_ms = ColI64(st, 6);
    r.expires_at_ms = ColI64(st, 7);
    r.released_at_ms = ColOptI64(st, 8);
    return r;
}

// Binds params and collects every row through reader.
template <typename Record, typename Reader>
static std::vector<Record> SelectMany(sqlite3* db, const char* sql, const sql::Params& params, Reader reader) {
    std::vector<Record> out;

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return out;

    BindParams(st, params);
    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(reader(st));
    }

    sqlite3_finalize(st);
    return out;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin(TxMode mode) {
    return std::make_unique<SqliteTransaction>(db_, mode);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// Prepares, binds, steps once and finalizes.
static Result ExecWrite(sqlite3* db, const char* sql, const sql::Params& params, int* changes = nullptr) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindParams(st, params);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (changes) *changes = sqlite3_changes(db);

    if (rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();
    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result SqliteRepository::AppendEvent(Transaction& t, model::EventRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* seq_st = nullptr;
    if (sqlite3_prepare_v2(db, sql::NEXT_EVENT_SEQUENCE, -1, &seq_st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(seq_st, 1, r.project_key);
    int rc = sqlite3_step(seq_st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(seq_st);
        return Translate(db, rc);
    }
    r.sequence = ColI64(seq_st, 0);
    sqlite3_finalize(seq_st);

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_EVENT, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.project_key);
    BindI64(st, 2, r.sequence);
    BindText(st, 3, r.type);
    BindNullableText(st, 4, r.cell_id);
    BindI64(st, 5, r.timestamp_ms);
    BindText(st, 6, r.payload_json);

    rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc != SQLITE_DONE) return Translate(db, rc);

    r.id = sqlite3_last_insert_rowid(db);
    return Result::Ok();
}

std::vector<model::EventRecord> SqliteRepository::ReadEvents(Transaction& t, const EventFilter& f) {
    std::string sql = sql::EVENTS_SELECT;
    sql::Params params;

    sql += " WHERE project_key=? AND sequence>?";
    params.emplace_back(f.project_key);
    params.emplace_back(f.after_sequence);

    if (f.cell_id) {
        sql += " AND cell_id=?";
        params.emplace_back(*f.cell_id);
    }
    if (!f.types.empty()) {
        sql += " AND type IN (";
        for (size_t i = 0; i < f.types.size(); ++i) {
            sql += i == 0 ? "?" : ",?";
            params.emplace_back(f.types[i]);
        }
        sql += ")";
    }
    if (f.since_ms) {
        sql += " AND timestamp_ms>=?";
        params.emplace_back(*f.since_ms);
    }
    if (f.until_ms) {
        sql += " AND timestamp_ms<=?";
        params.emplace_back(*f.until_ms);
    }

    sql += " ORDER BY sequence ASC LIMIT ? OFFSET ?;";
    params.emplace_back(f.limit.value_or(-1));
    params.emplace_back(f.offset);

    return SelectMany<model::EventRecord>(TX(t).Handle(), sql.c_str(), params, ReadEvent);
}

int64_t SqliteRepository::LatestSequence(Transaction& t, const std::string& project_key) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::LATEST_SEQUENCE, -1, &st, nullptr) != SQLITE_OK)
        return 0;

    BindText(st, 1, project_key);
    int64_t out = 0;
    if (sqlite3_step(st) == SQLITE_ROW) out = ColI64(st, 0);
    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::CommitCursor(Transaction& t, const model::EventCursorRecord& r) {
    return ExecWrite(TX(t).Handle(), sql::UPSERT_CURSOR, {r.project_key, r.consumer, r.sequence, r.updated_at_ms});
}

std::optional<model::EventCursorRecord> SqliteRepository::GetCursor(
    Transaction& t, const std::string& project_key, const std::string& consumer) {
    auto rows = SelectMany<model::EventCursorRecord>(
        TX(t).Handle(), sql::SELECT_CURSOR, {project_key, consumer}, [](sqlite3_stmt* st) {
            model::EventCursorRecord r;
            r.project_key = ColText(st, 0);
            r.consumer = ColText(st, 1);
            r.sequence = ColI64(st, 2);
            r.updated_at_ms = ColI64(st, 3);
            return r;
        });
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

// ------------------------------------------------------------------
// Cells
// ------------------------------------------------------------------

Result SqliteRepository::InsertCell(Transaction& t, const model::CellRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_CELL, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindText(st, 2, r.project_key);
    BindText(st, 3, r.issue_type);
    BindText(st, 4, r.status);
    BindText(st, 5, r.title);
    BindNullableText(st, 6, r.description);
    sqlite3_bind_int(st, 7, r.priority);
    BindOptText(st, 8, r.parent_id);
    BindOptText(st, 9, r.assignee);
    BindOptText(st, 10, r.created_by);
    BindI64(st, 11, r.created_at_ms);
    BindI64(st, 12, r.updated_at_ms);
    BindOptI64(st, 13, r.closed_at_ms);
    BindOptText(st, 14, r.closed_reason);
    BindOptI64(st, 15, r.deleted_at_ms);
    BindOptText(st, 16, r.deleted_by);
    BindOptText(st, 17, r.delete_reason);

    int rc = sqlite3_step(st);
    const bool duplicate = (rc & 0xff) == SQLITE_CONSTRAINT &&
                           sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY;
    sqlite3_finalize(st);

    if (duplicate)
        return Result::Err(ErrorCode::AlreadyExists, "cell " + r.id + " already exists");
    return Translate(db, rc);
}

Result SqliteRepository::UpdateCell(Transaction& t, const model::CellRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPDATE_CELL, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.issue_type);
    BindText(st, 2, r.status);
    BindText(st, 3, r.title);
    BindNullableText(st, 4, r.description);
    sqlite3_bind_int(st, 5, r.priority);
    BindOptText(st, 6, r.parent_id);
    BindOptText(st, 7, r.assignee);
    BindI64(st, 8, r.updated_at_ms);
    BindOptI64(st, 9, r.closed_at_ms);
    BindOptText(st, 10, r.closed_reason);
    BindOptI64(st, 11, r.deleted_at_ms);
    BindOptText(st, 12, r.deleted_by);
    BindOptText(st, 13, r.delete_reason);
    BindText(st, 14, r.id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "cell " + r.id + " not found");

    return Translate(db, rc);
}

std::optional<model::CellRecord> SqliteRepository::GetCell(Transaction& t, const std::string& id) {
    const std::string sql = std::string("SELECT ") + sql::CELL_COLUMNS + " FROM cells WHERE id=?;";
    auto rows = SelectMany<model::CellRecord>(TX(t).Handle(), sql.c_str(), {id}, ReadCell);
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

std::vector<model::CellRecord> SqliteRepository::QueryCells(Transaction& t, const CellFilter& f) {
    std::string sql = std::string("SELECT ") + sql::CELL_COLUMNS + " FROM cells WHERE project_key=?";
    sql::Params params{f.project_key};

    if (!f.statuses.empty()) {
        sql += " AND status IN (";
        for (size_t i = 0; i < f.statuses.size(); ++i) {
            sql += i == 0 ? "?" : ",?";
            params.emplace_back(f.statuses[i]);
        }
        sql += ")";
    }
    if (f.issue_type) {
        sql += " AND issue_type=?";
        params.emplace_back(*f.issue_type);
    }
    if (f.parent_id) {
        sql += " AND parent_id=?";
        params.emplace_back(*f.parent_id);
    }
    if (f.assignee) {
        sql += " AND assignee=?";
        params.emplace_back(*f.assignee);
    }
    if (f.unassigned) {
        sql += " AND (assignee IS NULL OR assignee='')";
    }
    if (!f.include_deleted) {
        sql += " AND deleted_at_ms IS NULL";
    }
    if (f.updated_before_ms) {
        sql += " AND updated_at_ms<?";
        params.emplace_back(*f.updated_before_ms);
    }
    if (f.id_contains) {
        sql += " AND id LIKE ?";
        params.emplace_back("%" + *f.id_contains + "%");
    }

    sql += " ORDER BY priority ASC, created_at_ms ASC, id ASC LIMIT ? OFFSET ?;";
    params.emplace_back(f.limit.value_or(-1));
    params.emplace_back(f.offset);

    return SelectMany<model::CellRecord>(TX(t).Handle(), sql.c_str(), params, ReadCell);
}

Result SqliteRepository::ClearProjections(Transaction& t, const std::string& project_key) {
    auto* db = TX(t).Handle();

    // edges, labels, comments and cache rows cascade from cells
    if (auto r = ExecWrite(db, sql::DELETE_PROJECT_DIRTY, {project_key}); !r) return r;
    return ExecWrite(db, sql::DELETE_PROJECT_CELLS, {project_key});
}

// ------------------------------------------------------------------
// Dependency edges
// ------------------------------------------------------------------

Result SqliteRepository::InsertDependency(Transaction& t, const model::DependencyRecord& r) {
    return ExecWrite(TX(t).Handle(), sql::INSERT_DEPENDENCY,
                     {r.cell_id, r.depends_on_id, r.relationship, r.created_at_ms,
                      r.created_by.empty() ? sql::Param{nullptr} : sql::Param{r.created_by}});
}

Result SqliteRepository::DeleteDependency(Transaction& t, const std::string& cell_id,
                                          const std::string& depends_on_id, const std::string& relationship) {
    return ExecWrite(TX(t).Handle(), sql::DELETE_DEPENDENCY, {cell_id, depends_on_id, relationship});
}

std::vector<model::DependencyRecord> SqliteRepository::GetDependencies(Transaction& t, const std::string& cell_id) {
    return SelectMany<model::DependencyRecord>(TX(t).Handle(), sql::SELECT_DEPENDENCIES, {cell_id}, ReadDependency);
}

std::vector<model::DependencyRecord> SqliteRepository::GetDependents(Transaction& t, const std::string& cell_id) {
    return SelectMany<model::DependencyRecord>(TX(t).Handle(), sql::SELECT_DEPENDENTS, {cell_id}, ReadDependency);
}

// ------------------------------------------------------------------
// Labels
// ------------------------------------------------------------------

Result SqliteRepository::InsertLabel(Transaction& t, const model::LabelRecord& r) {
    return ExecWrite(TX(t).Handle(), sql::INSERT_LABEL, {r.cell_id, r.label, r.created_at_ms});
}

Result SqliteRepository::DeleteLabel(Transaction& t, const std::string& cell_id, const std::string& label) {
    return ExecWrite(TX(t).Handle(), sql::DELETE_LABEL, {cell_id, label});
}

std::vector<model::LabelRecord> SqliteRepository::GetLabels(Transaction& t, const std::string& cell_id) {
    return SelectMany<model::LabelRecord>(TX(t).Handle(), sql::SELECT_LABELS, {cell_id}, [](sqlite3_stmt* st) {
        model::LabelRecord r;
        r.cell_id = ColText(st, 0);
        r.label = ColText(st, 1);
        r.created_at_ms = ColI64(st, 2);
        return r;
    });
}

std::vector<std::string> SqliteRepository::GetCellsWithLabel(Transaction& t, const std::string& project_key,
                                                             const std::string& label) {
    return SelectMany<std::string>(TX(t).Handle(), sql::SELECT_CELLS_WITH_LABEL, {project_key, label},
                                   [](sqlite3_stmt* st) { return ColText(st, 0); });
}

// ------------------------------------------------------------------
// Comments
// ------------------------------------------------------------------

Result SqliteRepository::InsertComment(Transaction& t, model::CommentRecord& r) {
    auto* db = TX(t).Handle();

    auto res = ExecWrite(db, sql::INSERT_COMMENT,
                         {r.id == 0 ? sql::Param{nullptr} : sql::Param{r.id}, r.cell_id, r.author, r.body,
                          r.parent_id == 0 ? sql::Param{nullptr} : sql::Param{r.parent_id}, r.created_at_ms,
                          r.updated_at_ms});
    if (!res) return res;

    r.id = sqlite3_last_insert_rowid(db);
    return Result::Ok();
}

Result SqliteRepository::UpdateComment(Transaction& t, int64_t comment_id, const std::string& body,
                                       int64_t updated_at_ms) {
    int changes = 0;
    auto res = ExecWrite(TX(t).Handle(), sql::UPDATE_COMMENT, {body, updated_at_ms, comment_id}, &changes);
    if (res && changes == 0)
        return Result::Err(ErrorCode::NotFound, "comment " + std::to_string(comment_id) + " not found");
    return res;
}

Result SqliteRepository::DeleteComment(Transaction& t, int64_t comment_id) {
    return ExecWrite(TX(t).Handle(), sql::DELETE_COMMENT, {comment_id});
}

std::optional<model::CommentRecord> SqliteRepository::GetComment(Transaction& t, int64_t comment_id) {
    auto rows = SelectMany<model::CommentRecord>(TX(t).Handle(), sql::SELECT_COMMENT, {comment_id}, ReadComment);
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

std::vector<model::CommentRecord> SqliteRepository::GetComments(Transaction& t, const std::string& cell_id) {
    return SelectMany<model::CommentRecord>(TX(t).Handle(), sql::SELECT_COMMENTS, {cell_id}, ReadComment);
}

// ------------------------------------------------------------------
// Blocked cache
// ------------------------------------------------------------------

Result SqliteRepository::UpsertBlocked(Transaction& t, const model::BlockedRecord& r) {
    return ExecWrite(TX(t).Handle(), sql::UPSERT_BLOCKED, {r.cell_id, JoinIds(r.blocker_ids), r.updated_at_ms});
}

Result SqliteRepository::DeleteBlocked(Transaction& t, const std::string& cell_id) {
    return ExecWrite(TX(t).Handle(), sql::DELETE_BLOCKED, {cell_id});
}

std::optional<model::BlockedRecord> SqliteRepository::GetBlocked(Transaction& t, const std::string& cell_id) {
    auto rows = SelectMany<model::BlockedRecord>(TX(t).Handle(), sql::SELECT_BLOCKED, {cell_id}, ReadBlocked);
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

std::vector<model::BlockedRecord> SqliteRepository::ListBlocked(Transaction& t, const std::string& project_key) {
    return SelectMany<model::BlockedRecord>(TX(t).Handle(), sql::SELECT_PROJECT_BLOCKED, {project_key}, ReadBlocked);
}

// ------------------------------------------------------------------
// Dirty markers
// ------------------------------------------------------------------

Result SqliteRepository::MarkDirty(Transaction& t, const std::string& project_key, const std::string& cell_id,
                                   int64_t marked_at_ms) {
    return ExecWrite(TX(t).Handle(), sql::UPSERT_DIRTY, {cell_id, project_key, marked_at_ms});
}

std::vector<model::DirtyRecord> SqliteRepository::ListDirty(Transaction& t, const std::string& project_key) {
    return SelectMany<model::DirtyRecord>(TX(t).Handle(), sql::SELECT_DIRTY, {project_key}, [](sqlite3_stmt* st) {
        model::DirtyRecord r;
        r.cell_id = ColText(st, 0);
        r.project_key = ColText(st, 1);
        r.marked_at_ms = ColI64(st, 2);
        r.mark_count = ColI64(st, 3);
        return r;
    });
}

bool SqliteRepository::ClearDirty(Transaction& t, const std::string& cell_id, int64_t mark_count) {
    int changes = 0;
    auto res = ExecWrite(TX(t).Handle(), sql::CLEAR_DIRTY, {cell_id, mark_count}, &changes);
    return res && changes > 0;
}

// ------------------------------------------------------------------
// File reservations
// ------------------------------------------------------------------

Result SqliteRepository::InsertReservation(Transaction& t, model::ReservationRecord& r) {
    auto* db = TX(t).Handle();

    auto res = ExecWrite(db, sql::INSERT_RESERVATION,
                         {r.project_key, r.agent_name, r.path_pattern, int64_t{r.exclusive ? 1 : 0},
                          r.reason.empty() ? sql::Param{nullptr} : sql::Param{r.reason}, r.created_at_ms,
                          r.expires_at_ms});
    if (!res) return res;

    r.id = sqlite3_last_insert_rowid(db);
    return Result::Ok();
}

std::vector<model::ReservationRecord> SqliteRepository::ListActiveReservations(Transaction& t,
                                                                               const std::string& project_key,
                                                                               int64_t now_ms) {
    return SelectMany<model::ReservationRecord>(TX(t).Handle(), sql::SELECT_ACTIVE_RESERVATIONS,
                                                {project_key, now_ms}, ReadReservation);
}

Result SqliteRepository::ReleaseReservation(Transaction& t, int64_t reservation_id, int64_t released_at_ms) {
    int changes = 0;
    auto res = ExecWrite(TX(t).Handle(), sql::RELEASE_RESERVATION, {released_at_ms, reservation_id}, &changes);
    if (res && changes == 0)
        return Result::Err(ErrorCode::NotFound, "reservation " + std::to_string(reservation_id) + " not active");
    return res;
}

Result SqliteRepository::PurgeInactiveReservations(Transaction& t, const std::string& project_key, int64_t now_ms) {
    return ExecWrite(TX(t).Handle(), sql::DELETE_INACTIVE_RESERVATIONS, {project_key, now_ms});
}

} // namespace swarm::db::sqlite
