#include "hive_service.hpp"

#include <chrono>
#include <deque>
#include <type_traits>
#include <unordered_set>

#include "internal/db/api/repository.hpp"
#include "internal/hive/event_store.hpp"
#include "internal/model/cell.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/clock.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/id.hpp"

namespace swarm::hive {

HiveService::HiveService(service::ServiceContext ctx, std::shared_ptr<EventStore> store, std::string id_prefix)
    : ctx_(std::move(ctx)), store_(std::move(store)), id_prefix_(std::move(id_prefix)) {
  if (!ctx_.repository || !ctx_.clock || !store_) {
    throw std::invalid_argument("HiveService: repository, clock and event store are required");
  }
  if (ctx_.project_key.empty()) throw std::invalid_argument("HiveService: project key is required");
}

template <typename Fn>
auto HiveService::Execute(const char* operation, Fn&& fn) -> decltype(fn(std::declval<db::Transaction&>())) {
  observability::SpanScope span(operation);
  span.SetAttribute("hive.project", ctx_.project_key);

  const auto started_at = std::chrono::steady_clock::now();
  auto       observe    = [&](bool success) {
    observability::Metrics::Instance().RecordCommand(operation, success);
    observability::Metrics::Instance().ObserveCommandLatencyMs(
        operation, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<decltype(fn(std::declval<db::Transaction&>()))>) {
      util::RetryTransient(ctx_.store_retry, operation, [&] {
        auto tx = ctx_.repository->Begin();
        fn(*tx);
        tx->Commit();
      });
      observe(true);
    } else {
      auto out = util::RetryTransient(ctx_.store_retry, operation, [&] {
        auto tx     = ctx_.repository->Begin();
        auto result = fn(*tx);
        tx->Commit();
        return result;
      });
      observe(true);
      return out;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    observe(false);
    throw;
  }
}

template <typename Payload>
Event HiveService::MakeEvent(const std::string& cell_id, Payload payload) const {
  Event event;
  event.project_key  = ctx_.project_key;
  event.cell_id      = cell_id;
  event.timestamp_ms = ctx_.clock->NowMillis();
  event.payload      = std::move(payload);
  return event;
}

db::model::CellRecord HiveService::RequireLiveCell(db::Transaction& tx, const std::string& cell_id) const {
  auto cell = ctx_.repository->GetCell(tx, cell_id);
  if (!cell || cell->IsDeleted() || cell->project_key != ctx_.project_key) {
    throw util::NotFound("cell " + cell_id + " not found");
  }
  return *cell;
}

bool HiveService::Reaches(db::Transaction& tx, const std::string& from, const std::string& to) const {
  std::deque<std::string>         frontier{from};
  std::unordered_set<std::string> seen{from};

  while (!frontier.empty()) {
    auto current = std::move(frontier.front());
    frontier.pop_front();
    if (current == to) return true;

    for (const auto& edge : ctx_.repository->GetDependencies(tx, current)) {
      if (seen.insert(edge.depends_on_id).second) frontier.push_back(edge.depends_on_id);
    }
  }
  return false;
}

db::model::CellRecord HiveService::CreateCell(const CreateCellRequest& request) {
  // The random id suffix can collide between agents creating in the same millisecond.
  constexpr int kIdAttempts = 3;
  for (int attempt = 1;; ++attempt) {
    try {
      return CreateCellWithId(request, util::GenerateCellId(id_prefix_, ctx_.project_key, ctx_.clock->NowMillis()));
    } catch (const util::AlreadyExists&) {
      if (attempt == kIdAttempts) throw;
      SWARM_LOG_WARN("cell id collision, regenerating", {observability::IntField("attempt", attempt)});
    }
  }
}

db::model::CellRecord HiveService::CreateCellWithId(const CreateCellRequest& request, const std::string& cell_id) {
  auto cell = Execute("create cell", [&](db::Transaction& tx) {
    if (request.parent_id) RequireLiveCell(tx, *request.parent_id);

    v1::CellCreated created;
    created.set_title(request.title);
    created.set_description(request.description);
    created.set_issue_type(request.issue_type);
    created.set_priority(request.priority);
    if (request.parent_id) created.set_parent_id(*request.parent_id);
    created.set_created_by(request.created_by);

    auto event = MakeEvent(cell_id, std::move(created));
    store_->AppendInTransaction(tx, event);

    if (request.assignee && !request.assignee->empty()) {
      v1::CellAssigned assigned;
      assigned.set_assignee(*request.assignee);
      assigned.set_assigned_by(request.created_by);

      auto assign_event = MakeEvent(cell_id, std::move(assigned));
      store_->AppendInTransaction(tx, assign_event);
    }
    return RequireLiveCell(tx, cell_id);
  });

  SWARM_LOG_INFO("cell created", {observability::StringField("cell_id", cell.id),
                                  observability::StringField("issue_type", cell.issue_type),
                                  observability::IntField("priority", cell.priority)});
  return cell;
}

db::model::CellRecord HiveService::UpdateCell(const std::string& cell_id, const UpdateCellRequest& request) {
  return Execute("update cell", [&](db::Transaction& tx) {
    auto current = RequireLiveCell(tx, cell_id);

    v1::CellUpdated updated;
    if (request.title && *request.title != current.title) updated.set_title(*request.title);
    if (request.description && *request.description != current.description) {
      updated.set_description(*request.description);
    }
    if (request.priority && *request.priority != current.priority) updated.set_priority(*request.priority);
    if (request.assignee && *request.assignee != current.assignee.value_or("")) {
      updated.set_assignee(*request.assignee);
    }

    if (!updated.has_title() && !updated.has_description() && !updated.has_priority() && !updated.has_assignee()) {
      return current;
    }

    updated.set_updated_by(request.updated_by);
    auto event = MakeEvent(cell_id, std::move(updated));
    store_->AppendInTransaction(tx, event);
    return RequireLiveCell(tx, cell_id);
  });
}

db::model::CellRecord HiveService::ChangeStatus(const std::string& cell_id, const std::string& status,
                                                const std::string& changed_by, const std::string& reason) {
  if (status == model::kStatusClosed) return CloseCell(cell_id, reason, changed_by);
  if (!model::IsValidStatus(status)) throw util::ValidationError("status", "invalid status '" + status + "'");

  return Execute("change status", [&](db::Transaction& tx) {
    auto current = RequireLiveCell(tx, cell_id);
    if (current.status == status) return current;

    v1::CellStatusChanged changed;
    changed.set_from_status(current.status);
    changed.set_to_status(status);
    changed.set_changed_by(changed_by);
    changed.set_reason(reason);

    auto event = MakeEvent(cell_id, std::move(changed));
    store_->AppendInTransaction(tx, event);
    return RequireLiveCell(tx, cell_id);
  });
}

db::model::CellRecord HiveService::StartWork(const std::string& cell_id, const std::string& agent) {
  return Execute("start work", [&](db::Transaction& tx) {
    RequireLiveCell(tx, cell_id);

    v1::CellWorkStarted started;
    started.set_agent(agent);

    auto event = MakeEvent(cell_id, std::move(started));
    store_->AppendInTransaction(tx, event);
    return RequireLiveCell(tx, cell_id);
  });
}

db::model::CellRecord HiveService::CloseCell(const std::string& cell_id, const std::string& reason,
                                             const std::string& closed_by) {
  auto cell = Execute("close cell", [&](db::Transaction& tx) {
    auto current = RequireLiveCell(tx, cell_id);
    if (current.status == model::kStatusClosed) throw util::InvalidState("cell " + cell_id + " is already closed");

    v1::CellClosed closed;
    closed.set_reason(reason);
    closed.set_closed_by(closed_by);

    auto event = MakeEvent(cell_id, std::move(closed));
    store_->AppendInTransaction(tx, event);
    return RequireLiveCell(tx, cell_id);
  });

  SWARM_LOG_INFO("cell closed", {observability::StringField("cell_id", cell_id)});
  return cell;
}

db::model::CellRecord HiveService::ReopenCell(const std::string& cell_id, const std::string& reason,
                                              const std::string& reopened_by) {
  return Execute("reopen cell", [&](db::Transaction& tx) {
    auto current = RequireLiveCell(tx, cell_id);
    if (current.status != model::kStatusClosed) throw util::InvalidState("cell " + cell_id + " is not closed");

    v1::CellReopened reopened;
    reopened.set_reason(reason);
    reopened.set_reopened_by(reopened_by);

    auto event = MakeEvent(cell_id, std::move(reopened));
    store_->AppendInTransaction(tx, event);
    return RequireLiveCell(tx, cell_id);
  });
}

void HiveService::DeleteCell(const std::string& cell_id, const std::string& reason, const std::string& deleted_by) {
  Execute("delete cell", [&](db::Transaction& tx) {
    RequireLiveCell(tx, cell_id);

    v1::CellDeleted deleted;
    deleted.set_reason(reason);
    deleted.set_deleted_by(deleted_by);

    auto event = MakeEvent(cell_id, std::move(deleted));
    store_->AppendInTransaction(tx, event);
  });

  SWARM_LOG_INFO("cell deleted", {observability::StringField("cell_id", cell_id),
                                  observability::StringField("deleted_by", deleted_by)});
}

void HiveService::AddDependency(const std::string& cell_id, const std::string& depends_on_id,
                                const std::string& relationship, const std::string& added_by) {
  if (cell_id == depends_on_id) {
    throw util::ValidationError("depends_on_id", "a cell cannot depend on itself");
  }

  Execute("add dependency", [&](db::Transaction& tx) {
    RequireLiveCell(tx, cell_id);
    RequireLiveCell(tx, depends_on_id);

    if (Reaches(tx, depends_on_id, cell_id)) {
      throw util::CycleDetected("dependency " + cell_id + " -> " + depends_on_id + " would create a cycle");
    }

    v1::CellDependencyAdded added;
    added.set_depends_on_id(depends_on_id);
    added.set_relationship(relationship);
    added.set_added_by(added_by);

    auto event = MakeEvent(cell_id, std::move(added));
    store_->AppendInTransaction(tx, event);
  });
}

void HiveService::RemoveDependency(const std::string& cell_id, const std::string& depends_on_id,
                                   const std::string& relationship, const std::string& removed_by) {
  Execute("remove dependency", [&](db::Transaction& tx) {
    RequireLiveCell(tx, cell_id);

    v1::CellDependencyRemoved removed;
    removed.set_depends_on_id(depends_on_id);
    removed.set_relationship(relationship);
    removed.set_removed_by(removed_by);

    auto event = MakeEvent(cell_id, std::move(removed));
    store_->AppendInTransaction(tx, event);
  });
}

void HiveService::AddLabel(const std::string& cell_id, const std::string& label) {
  Execute("add label", [&](db::Transaction& tx) {
    RequireLiveCell(tx, cell_id);

    v1::CellLabelAdded added;
    added.set_label(label);

    auto event = MakeEvent(cell_id, std::move(added));
    store_->AppendInTransaction(tx, event);
  });
}

void HiveService::RemoveLabel(const std::string& cell_id, const std::string& label) {
  Execute("remove label", [&](db::Transaction& tx) {
    RequireLiveCell(tx, cell_id);

    v1::CellLabelRemoved removed;
    removed.set_label(label);

    auto event = MakeEvent(cell_id, std::move(removed));
    store_->AppendInTransaction(tx, event);
  });
}

db::model::CommentRecord HiveService::AddComment(const std::string& cell_id, const std::string& author,
                                                 const std::string& body, int64_t parent_comment_id) {
  return Execute("add comment", [&](db::Transaction& tx) {
    RequireLiveCell(tx, cell_id);

    if (parent_comment_id != 0) {
      auto parent = ctx_.repository->GetComment(tx, parent_comment_id);
      if (!parent || parent->cell_id != cell_id) {
        throw util::NotFound("comment " + std::to_string(parent_comment_id) + " not found on " + cell_id);
      }
    }

    v1::CellCommentAdded added;
    added.set_author(author);
    added.set_body(body);
    added.set_parent_comment_id(parent_comment_id);

    auto event = MakeEvent(cell_id, std::move(added));
    store_->AppendInTransaction(tx, event);

    auto comment = ctx_.repository->GetComment(tx, event.event_id);
    if (!comment) throw std::runtime_error("comment missing after append");
    return *comment;
  });
}

db::model::CommentRecord HiveService::UpdateComment(int64_t comment_id, const std::string& body) {
  return Execute("update comment", [&](db::Transaction& tx) {
    auto comment = ctx_.repository->GetComment(tx, comment_id);
    if (!comment) throw util::NotFound("comment " + std::to_string(comment_id) + " not found");
    RequireLiveCell(tx, comment->cell_id);

    v1::CellCommentUpdated updated;
    updated.set_comment_id(comment_id);
    updated.set_body(body);

    auto event = MakeEvent(comment->cell_id, std::move(updated));
    store_->AppendInTransaction(tx, event);
    return *ctx_.repository->GetComment(tx, comment_id);
  });
}

void HiveService::DeleteComment(int64_t comment_id) {
  Execute("delete comment", [&](db::Transaction& tx) {
    auto comment = ctx_.repository->GetComment(tx, comment_id);
    if (!comment) throw util::NotFound("comment " + std::to_string(comment_id) + " not found");

    v1::CellCommentDeleted deleted;
    deleted.set_comment_id(comment_id);

    auto event = MakeEvent(comment->cell_id, std::move(deleted));
    store_->AppendInTransaction(tx, event);
  });
}

void HiveService::AddChildToEpic(const std::string& epic_id, const std::string& child_id) {
  Execute("add epic child", [&](db::Transaction& tx) {
    auto epic = RequireLiveCell(tx, epic_id);
    if (epic.issue_type != "epic") throw util::InvalidState("cell " + epic_id + " is not an epic");
    RequireLiveCell(tx, child_id);

    v1::CellEpicChildAdded added;
    added.set_child_id(child_id);

    auto event = MakeEvent(epic_id, std::move(added));
    store_->AppendInTransaction(tx, event);
  });
}

void HiveService::RemoveChildFromEpic(const std::string& epic_id, const std::string& child_id) {
  Execute("remove epic child", [&](db::Transaction& tx) {
    RequireLiveCell(tx, epic_id);
    auto child = RequireLiveCell(tx, child_id);
    if (child.parent_id != epic_id) {
      throw util::InvalidState("cell " + child_id + " is not a child of " + epic_id);
    }

    v1::CellEpicChildRemoved removed;
    removed.set_child_id(child_id);

    auto event = MakeEvent(epic_id, std::move(removed));
    store_->AppendInTransaction(tx, event);
  });
}

db::model::CellRecord HiveService::Assign(const std::string& cell_id, const std::string& assignee,
                                          const std::string& assigned_by) {
  return Execute("assign cell", [&](db::Transaction& tx) {
    RequireLiveCell(tx, cell_id);

    v1::CellAssigned assigned;
    assigned.set_assignee(assignee);
    assigned.set_assigned_by(assigned_by);

    auto event = MakeEvent(cell_id, std::move(assigned));
    store_->AppendInTransaction(tx, event);
    return RequireLiveCell(tx, cell_id);
  });
}

} // namespace swarm::hive
