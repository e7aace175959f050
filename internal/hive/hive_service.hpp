#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "internal/db/model/cell_record.hpp"
#include "internal/hive/events.hpp"
#include "internal/service/service_context.hpp"

namespace swarm::db { class Transaction; }

namespace swarm::hive {

class EventStore;

struct CreateCellRequest {
  std::string                title;
  std::string                description;
  std::string                issue_type = "task";
  int                        priority   = 2;
  std::optional<std::string> parent_id;
  std::optional<std::string> assignee;
  std::string                created_by;
};

// Unset fields are left untouched.
struct UpdateCellRequest {
  std::optional<std::string> title;
  std::optional<std::string> description;
  std::optional<int>         priority;
  std::optional<std::string> assignee;
  std::string                updated_by;
};

/*
  Write side of the hive.

  Every command checks its preconditions and appends its events inside one
  write transaction, then returns the projection as seen by that
  transaction. Commands against a missing or soft-deleted cell throw
  util::NotFound.
*/
class HiveService {
 public:
  HiveService(service::ServiceContext ctx, std::shared_ptr<EventStore> store, std::string id_prefix = "cell");

  db::model::CellRecord CreateCell(const CreateCellRequest& request);

  // No event is appended when nothing differs from the current projection.
  db::model::CellRecord UpdateCell(const std::string& cell_id, const UpdateCellRequest& request);

  // "closed" is routed to CloseCell.
  db::model::CellRecord ChangeStatus(const std::string& cell_id, const std::string& status,
                                     const std::string& changed_by, const std::string& reason = "");

  db::model::CellRecord StartWork(const std::string& cell_id, const std::string& agent);

  db::model::CellRecord CloseCell(const std::string& cell_id, const std::string& reason,
                                  const std::string& closed_by = "");

  db::model::CellRecord ReopenCell(const std::string& cell_id, const std::string& reason,
                                   const std::string& reopened_by = "");

  void DeleteCell(const std::string& cell_id, const std::string& reason, const std::string& deleted_by);

  // Throws util::ValidationError for a self edge, util::CycleDetected when
  // depends_on_id already reaches cell_id.
  void AddDependency(const std::string& cell_id, const std::string& depends_on_id,
                     const std::string& relationship = "blocks", const std::string& added_by = "");

  void RemoveDependency(const std::string& cell_id, const std::string& depends_on_id,
                        const std::string& relationship = "blocks", const std::string& removed_by = "");

  void AddLabel(const std::string& cell_id, const std::string& label);
  void RemoveLabel(const std::string& cell_id, const std::string& label);

  db::model::CommentRecord AddComment(const std::string& cell_id, const std::string& author, const std::string& body,
                                      int64_t parent_comment_id = 0);
  db::model::CommentRecord UpdateComment(int64_t comment_id, const std::string& body);
  void                     DeleteComment(int64_t comment_id);

  void AddChildToEpic(const std::string& epic_id, const std::string& child_id);
  void RemoveChildFromEpic(const std::string& epic_id, const std::string& child_id);

  db::model::CellRecord Assign(const std::string& cell_id, const std::string& assignee,
                               const std::string& assigned_by = "");

  const std::string& ProjectKey() const {
    return ctx_.project_key;
  }

 private:
  template <typename Fn>
  auto Execute(const char* operation, Fn&& fn) -> decltype(fn(std::declval<db::Transaction&>()));

  template <typename Payload>
  Event MakeEvent(const std::string& cell_id, Payload payload) const;

  db::model::CellRecord CreateCellWithId(const CreateCellRequest& request, const std::string& cell_id);

  db::model::CellRecord RequireLiveCell(db::Transaction& tx, const std::string& cell_id) const;

  // True when `from` reaches `to` following dependency edges.
  bool Reaches(db::Transaction& tx, const std::string& from, const std::string& to) const;

  service::ServiceContext     ctx_;
  std::shared_ptr<EventStore> store_;
  std::string                 id_prefix_;
};

} // namespace swarm::hive
