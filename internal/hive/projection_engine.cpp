#include "projection_engine.hpp"

#include <algorithm>
#include <optional>

#include "internal/hive/blocking_index.hpp"
#include "internal/hive/dirty_tracker.hpp"
#include "internal/model/cell.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace swarm::hive {

namespace {

std::optional<std::string> NonEmpty(const std::string& value) {
  if (value.empty()) return std::nullopt;
  return value;
}

} // namespace

/*
  Handler set for std::visit. One overload per payload type; adding a new
  event type without a handler is a compile error.
*/
struct ProjectionHandlers {
  ProjectionEngine& engine;
  db::Transaction&  tx;
  const Event&      event;

  db::Repository& repo() const {
    return *engine.repository_;
  }

  int64_t ts() const {
    return event.timestamp_ms;
  }

  db::model::CellRecord Load(const std::string& id) const {
    auto cell = repo().GetCell(tx, id);
    if (!cell) throw util::NotFound("cell " + id + " not found");
    return *cell;
  }

  void Save(db::model::CellRecord& cell) const {
    cell.updated_at_ms = std::max(cell.updated_at_ms, ts());
    db::ThrowIfError(repo().UpdateCell(tx, cell), "update cell " + cell.id);
  }

  // For child-table changes: only the cell's updated_at moves.
  void Touch() const {
    auto cell = Load(event.cell_id);
    Save(cell);
  }

  void Invalidate(const std::string& cell_id) const {
    engine.blocking_->Invalidate(tx, event.project_key, cell_id);
  }

  static void ClearClosed(db::model::CellRecord& cell) {
    cell.closed_at_ms.reset();
    cell.closed_reason.reset();
  }

  void operator()(const v1::CellCreated& p) const {
    db::model::CellRecord cell;
    cell.id            = event.cell_id;
    cell.project_key   = event.project_key;
    cell.issue_type    = p.issue_type();
    cell.status        = std::string(model::kStatusOpen);
    cell.title         = p.title();
    cell.description   = p.description();
    cell.priority      = p.priority();
    cell.parent_id     = NonEmpty(p.parent_id());
    cell.created_by    = NonEmpty(p.created_by());
    cell.created_at_ms = ts();
    cell.updated_at_ms = ts();
    db::ThrowIfError(repo().InsertCell(tx, cell), "create cell " + cell.id);
  }

  void operator()(const v1::CellUpdated& p) const {
    auto cell = Load(event.cell_id);
    if (p.has_title()) cell.title = p.title();
    if (p.has_description()) cell.description = p.description();
    if (p.has_priority()) cell.priority = p.priority();
    if (p.has_assignee()) cell.assignee = NonEmpty(p.assignee());
    Save(cell);
  }

  void operator()(const v1::CellStatusChanged& p) const {
    auto cell = Load(event.cell_id);
    if (cell.status == model::kStatusClosed) ClearClosed(cell);
    cell.status = p.to_status();
    Save(cell);
    Invalidate(cell.id);
  }

  void operator()(const v1::CellClosed& p) const {
    auto cell          = Load(event.cell_id);
    cell.status        = std::string(model::kStatusClosed);
    cell.closed_at_ms  = ts();
    cell.closed_reason = NonEmpty(p.reason());
    Save(cell);
    Invalidate(cell.id);
  }

  void operator()(const v1::CellReopened&) const {
    auto cell   = Load(event.cell_id);
    cell.status = std::string(model::kStatusOpen);
    ClearClosed(cell);
    Save(cell);
    Invalidate(cell.id);
  }

  void operator()(const v1::CellDeleted& p) const {
    auto cell          = Load(event.cell_id);
    cell.deleted_at_ms = ts();
    cell.deleted_by    = NonEmpty(p.deleted_by());
    cell.delete_reason = NonEmpty(p.reason());
    Save(cell);
    Invalidate(cell.id);
  }

  void operator()(const v1::CellDependencyAdded& p) const {
    db::model::DependencyRecord edge;
    edge.cell_id       = event.cell_id;
    edge.depends_on_id = p.depends_on_id();
    edge.relationship  = p.relationship();
    edge.created_at_ms = ts();
    edge.created_by    = p.added_by();
    db::ThrowIfError(repo().InsertDependency(tx, edge), "add dependency " + event.cell_id + " -> " + p.depends_on_id());
    Touch();
    Invalidate(event.cell_id);
  }

  void operator()(const v1::CellDependencyRemoved& p) const {
    db::ThrowIfError(repo().DeleteDependency(tx, event.cell_id, p.depends_on_id(), p.relationship()),
                     "remove dependency " + event.cell_id + " -> " + p.depends_on_id());
    Touch();
    Invalidate(event.cell_id);
  }

  void operator()(const v1::CellLabelAdded& p) const {
    db::ThrowIfError(repo().InsertLabel(tx, {event.cell_id, p.label(), ts()}), "add label " + p.label());
    Touch();
  }

  void operator()(const v1::CellLabelRemoved& p) const {
    db::ThrowIfError(repo().DeleteLabel(tx, event.cell_id, p.label()), "remove label " + p.label());
    Touch();
  }

  void operator()(const v1::CellCommentAdded& p) const {
    db::model::CommentRecord comment;
    comment.id            = event.event_id;
    comment.cell_id       = event.cell_id;
    comment.author        = p.author();
    comment.body          = p.body();
    comment.parent_id     = p.parent_comment_id();
    comment.created_at_ms = ts();
    comment.updated_at_ms = ts();
    db::ThrowIfError(repo().InsertComment(tx, comment), "add comment");
    Touch();
  }

  void operator()(const v1::CellCommentUpdated& p) const {
    db::ThrowIfError(repo().UpdateComment(tx, p.comment_id(), p.body(), ts()), "update comment");
    Touch();
  }

  void operator()(const v1::CellCommentDeleted& p) const {
    db::ThrowIfError(repo().DeleteComment(tx, p.comment_id()), "delete comment");
    Touch();
  }

  void operator()(const v1::CellEpicChildAdded& p) const {
    auto child      = Load(p.child_id());
    child.parent_id = event.cell_id;
    Save(child);
    Touch();
    engine.dirty_->MarkDirty(tx, event.project_key, child.id);
  }

  void operator()(const v1::CellEpicChildRemoved& p) const {
    auto child = Load(p.child_id());
    if (child.parent_id == event.cell_id) {
      child.parent_id.reset();
      Save(child);
      engine.dirty_->MarkDirty(tx, event.project_key, child.id);
    }
    Touch();
  }

  void operator()(const v1::CellAssigned& p) const {
    auto cell     = Load(event.cell_id);
    cell.assignee = p.assignee();
    Save(cell);
  }

  void operator()(const v1::CellWorkStarted& p) const {
    auto       cell       = Load(event.cell_id);
    const bool was_closed = cell.status == model::kStatusClosed;
    if (was_closed) ClearClosed(cell);
    cell.status = std::string(model::kStatusInProgress);
    if (!cell.assignee && !p.agent().empty()) cell.assignee = p.agent();
    Save(cell);
    if (was_closed) Invalidate(cell.id);
  }

  void operator()(const v1::FileReserved&) const {}
  void operator()(const v1::FileReleased&) const {}
  void operator()(const v1::FileConflict&) const {}

  void operator()(const UnknownEvent& p) const {
    SWARM_LOG_WARN("skipping unknown event type", {observability::StringField("type", p.type),
                                                   observability::IntField("sequence", event.sequence),
                                                   observability::StringField("project_key", event.project_key)});
  }
};

ProjectionEngine::ProjectionEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<BlockingIndex> blocking,
                                   std::shared_ptr<DirtyTracker> dirty)
    : repository_(std::move(repository)), blocking_(std::move(blocking)), dirty_(std::move(dirty)) {
}

void ProjectionEngine::Apply(db::Transaction& tx, const Event& event) {
  std::visit(ProjectionHandlers{*this, tx, event}, event.payload);

  if (IsCellEvent(event.payload) && !std::holds_alternative<UnknownEvent>(event.payload)) {
    dirty_->MarkDirty(tx, event.project_key, event.cell_id);
  }
}

void ProjectionEngine::RebuildDerived(db::Transaction& tx, const std::string& project_key) {
  const auto blocked = blocking_->Rebuild(tx, project_key);
  SWARM_LOG_DEBUG("blocked cache rebuilt", {observability::StringField("project_key", project_key),
                                            observability::IntField("blocked", static_cast<int64_t>(blocked))});
}

} // namespace swarm::hive
