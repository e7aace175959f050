#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace swarm::db::model {

/*
  Denormalized cell projection.

  status == "closed" iff closed_at_ms is set. A table CHECK enforces this
  so a buggy handler fails its transaction instead of persisting the skew.
*/
struct CellRecord {
  std::string id;
  std::string project_key;
  std::string issue_type = "task";
  std::string status     = "open";
  std::string title;
  std::string description;
  int         priority = 2;

  std::optional<std::string> parent_id;
  std::optional<std::string> assignee;
  std::optional<std::string> created_by;

  int64_t created_at_ms = 0;
  int64_t updated_at_ms = 0;

  std::optional<int64_t>     closed_at_ms;
  std::optional<std::string> closed_reason;

  std::optional<int64_t>     deleted_at_ms;
  std::optional<std::string> deleted_by;
  std::optional<std::string> delete_reason;

  bool IsDeleted() const {
    return deleted_at_ms.has_value();
  }
};

struct DependencyRecord {
  std::string cell_id;
  std::string depends_on_id;
  std::string relationship = "blocks";
  int64_t     created_at_ms = 0;
  std::string created_by;
};

struct LabelRecord {
  std::string cell_id;
  std::string label;
  int64_t     created_at_ms = 0;
};

struct CommentRecord {
  int64_t     id = 0;
  std::string cell_id;
  std::string author;
  std::string body;
  int64_t     parent_id     = 0;  // 0 = top level
  int64_t     created_at_ms = 0;
  int64_t     updated_at_ms = 0;
};

} // namespace swarm::db::model
