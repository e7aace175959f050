#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/cache_record.hpp"
#include "internal/db/model/cell_record.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/reservation_record.hpp"

namespace swarm::db {

struct EventFilter {
  std::string                project_key;
  std::optional<std::string> cell_id;
  std::vector<std::string>   types;
  std::optional<int64_t>     since_ms;
  std::optional<int64_t>     until_ms;
  int64_t                    after_sequence = 0;
  std::optional<int64_t>     limit;
  int64_t                    offset = 0;
};

struct CellFilter {
  std::string                project_key;
  std::vector<std::string>   statuses;
  std::optional<std::string> issue_type;
  std::optional<std::string> parent_id;
  std::optional<std::string> assignee;
  bool                       unassigned      = false;
  bool                       include_deleted = false;
  std::optional<int64_t>     updated_before_ms;
  std::optional<std::string> id_contains;
  std::optional<int64_t>     limit;
  int64_t                    offset = 0;
};

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All access goes through a Transaction
  - Reads inside a transaction see its writes
  - Event sequence assignment is atomic with the insert

  The event log is the source of truth. Every other table is a projection
  owned by the projection engine (cells, edges, labels, comments, blocked
  cache, dirty markers) or live lease state (reservations).
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin(TxMode mode = TxMode::kWrite) = 0;

  // ---------------------------------------------------------------------
  // Event log
  // ---------------------------------------------------------------------

  // Assigns id and the next per-project sequence.
  virtual Result AppendEvent(Transaction&, model::EventRecord& record) = 0;

  virtual std::vector<model::EventRecord> ReadEvents(Transaction&, const EventFilter& filter) = 0;

  virtual int64_t LatestSequence(Transaction&, const std::string& project_key) = 0;

  virtual Result CommitCursor(Transaction&, const model::EventCursorRecord& record) = 0;

  virtual std::optional<model::EventCursorRecord> GetCursor(Transaction&, const std::string& project_key,
                                                            const std::string& consumer) = 0;

  // ---------------------------------------------------------------------
  // Cells
  // ---------------------------------------------------------------------

  virtual Result InsertCell(Transaction&, const model::CellRecord& record) = 0;

  virtual Result UpdateCell(Transaction&, const model::CellRecord& record) = 0;

  virtual std::optional<model::CellRecord> GetCell(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::CellRecord> QueryCells(Transaction&, const CellFilter& filter) = 0;

  // Drops every projection row of a project. Used by replay.
  virtual Result ClearProjections(Transaction&, const std::string& project_key) = 0;

  // ---------------------------------------------------------------------
  // Dependency edges
  // ---------------------------------------------------------------------

  // Insert-or-ignore on (cell_id, depends_on_id, relationship).
  virtual Result InsertDependency(Transaction&, const model::DependencyRecord& record) = 0;

  virtual Result DeleteDependency(Transaction&, const std::string& cell_id, const std::string& depends_on_id,
                                  const std::string& relationship) = 0;

  // Edges leaving cell_id.
  virtual std::vector<model::DependencyRecord> GetDependencies(Transaction&, const std::string& cell_id) = 0;

  // Edges pointing at cell_id.
  virtual std::vector<model::DependencyRecord> GetDependents(Transaction&, const std::string& cell_id) = 0;

  // ---------------------------------------------------------------------
  // Labels / comments
  // ---------------------------------------------------------------------

  virtual Result InsertLabel(Transaction&, const model::LabelRecord& record) = 0;

  virtual Result DeleteLabel(Transaction&, const std::string& cell_id, const std::string& label) = 0;

  virtual std::vector<model::LabelRecord> GetLabels(Transaction&, const std::string& cell_id) = 0;

  virtual std::vector<std::string> GetCellsWithLabel(Transaction&, const std::string& project_key,
                                                     const std::string& label) = 0;

  // Uses record.id when set, otherwise assigns one.
  virtual Result InsertComment(Transaction&, model::CommentRecord& record) = 0;

  virtual Result UpdateComment(Transaction&, int64_t comment_id, const std::string& body, int64_t updated_at_ms) = 0;

  virtual Result DeleteComment(Transaction&, int64_t comment_id) = 0;

  virtual std::optional<model::CommentRecord> GetComment(Transaction&, int64_t comment_id) = 0;

  virtual std::vector<model::CommentRecord> GetComments(Transaction&, const std::string& cell_id) = 0;

  // ---------------------------------------------------------------------
  // Blocked cache
  // ---------------------------------------------------------------------

  virtual Result UpsertBlocked(Transaction&, const model::BlockedRecord& record) = 0;

  virtual Result DeleteBlocked(Transaction&, const std::string& cell_id) = 0;

  virtual std::optional<model::BlockedRecord> GetBlocked(Transaction&, const std::string& cell_id) = 0;

  virtual std::vector<model::BlockedRecord> ListBlocked(Transaction&, const std::string& project_key) = 0;

  // ---------------------------------------------------------------------
  // Dirty markers
  // ---------------------------------------------------------------------

  virtual Result MarkDirty(Transaction&, const std::string& project_key, const std::string& cell_id,
                           int64_t marked_at_ms) = 0;

  virtual std::vector<model::DirtyRecord> ListDirty(Transaction&, const std::string& project_key) = 0;

  // Removes the marker only if mark_count is unchanged. Returns true when removed.
  virtual bool ClearDirty(Transaction&, const std::string& cell_id, int64_t mark_count) = 0;

  // ---------------------------------------------------------------------
  // File reservations
  // ---------------------------------------------------------------------

  virtual Result InsertReservation(Transaction&, model::ReservationRecord& record) = 0;

  virtual std::vector<model::ReservationRecord> ListActiveReservations(Transaction&, const std::string& project_key,
                                                                       int64_t now_ms) = 0;

  virtual Result ReleaseReservation(Transaction&, int64_t reservation_id, int64_t released_at_ms) = 0;

  // Deletes released rows and rows expired at now_ms. The event log keeps
  // their history.
  virtual Result PurgeInactiveReservations(Transaction&, const std::string& project_key, int64_t now_ms) = 0;
};

} // namespace swarm::db
