#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace swarm::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<db::Transaction> Begin(TxMode mode = TxMode::kWrite) override;

  // events
  Result AppendEvent(Transaction&, model::EventRecord& record) override;
  std::vector<model::EventRecord> ReadEvents(Transaction&, const EventFilter& filter) override;
  int64_t LatestSequence(Transaction&, const std::string& project_key) override;
  Result CommitCursor(Transaction&, const model::EventCursorRecord& record) override;
  std::optional<model::EventCursorRecord> GetCursor(Transaction&, const std::string& project_key,
                                                    const std::string& consumer) override;

  // cells
  Result InsertCell(Transaction&, const model::CellRecord& record) override;
  Result UpdateCell(Transaction&, const model::CellRecord& record) override;
  std::optional<model::CellRecord> GetCell(Transaction&, const std::string& id) override;
  std::vector<model::CellRecord> QueryCells(Transaction&, const CellFilter& filter) override;
  Result ClearProjections(Transaction&, const std::string& project_key) override;

  // edges
  Result InsertDependency(Transaction&, const model::DependencyRecord& record) override;
  Result DeleteDependency(Transaction&, const std::string& cell_id, const std::string& depends_on_id,
                          const std::string& relationship) override;
  std::vector<model::DependencyRecord> GetDependencies(Transaction&, const std::string& cell_id) override;
  std::vector<model::DependencyRecord> GetDependents(Transaction&, const std::string& cell_id) override;

  // labels / comments
  Result InsertLabel(Transaction&, const model::LabelRecord& record) override;
  Result DeleteLabel(Transaction&, const std::string& cell_id, const std::string& label) override;
  std::vector<model::LabelRecord> GetLabels(Transaction&, const std::string& cell_id) override;
  std::vector<std::string> GetCellsWithLabel(Transaction&, const std::string& project_key,
                                             const std::string& label) override;
  Result InsertComment(Transaction&, model::CommentRecord& record) override;
  Result UpdateComment(Transaction&, int64_t comment_id, const std::string& body, int64_t updated_at_ms) override;
  Result DeleteComment(Transaction&, int64_t comment_id) override;
  std::optional<model::CommentRecord> GetComment(Transaction&, int64_t comment_id) override;
  std::vector<model::CommentRecord> GetComments(Transaction&, const std::string& cell_id) override;

  // blocked cache
  Result UpsertBlocked(Transaction&, const model::BlockedRecord& record) override;
  Result DeleteBlocked(Transaction&, const std::string& cell_id) override;
  std::optional<model::BlockedRecord> GetBlocked(Transaction&, const std::string& cell_id) override;
  std::vector<model::BlockedRecord> ListBlocked(Transaction&, const std::string& project_key) override;

  // dirty markers
  Result MarkDirty(Transaction&, const std::string& project_key, const std::string& cell_id,
                   int64_t marked_at_ms) override;
  std::vector<model::DirtyRecord> ListDirty(Transaction&, const std::string& project_key) override;
  bool ClearDirty(Transaction&, const std::string& cell_id, int64_t mark_count) override;

  // reservations
  Result InsertReservation(Transaction&, model::ReservationRecord& record) override;
  std::vector<model::ReservationRecord> ListActiveReservations(Transaction&, const std::string& project_key,
                                                               int64_t now_ms) override;
  Result ReleaseReservation(Transaction&, int64_t reservation_id, int64_t released_at_ms) override;
  Result PurgeInactiveReservations(Transaction&, const std::string& project_key, int64_t now_ms) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
