#include "jsonl_importer.hpp"

#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/hive/event_store.hpp"
#include "internal/hive/export_codec.hpp"
#include "internal/model/cell.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/clock.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace swarm::hive {

namespace {

struct ParsedLine {
  int64_t        line = 0;
  v1::CellExport cell;
  bool           is_new  = false;
  bool           changed = false;
  bool           failed  = false;
};

int64_t StampOr(const std::string& iso, int64_t fallback) {
  if (iso.empty()) return fallback;
  return util::ParseIso8601(iso);
}

// Dependencies are compared in the second pass.
v1::CellExport WithoutDependencies(v1::CellExport cell) {
  cell.clear_dependencies();
  return cell;
}

} // namespace

JsonlImporter::JsonlImporter(service::ServiceContext ctx, std::shared_ptr<EventStore> store)
    : ctx_(std::move(ctx)), store_(std::move(store)) {
}

std::vector<Event> JsonlImporter::PlanCell(db::Transaction& tx, const v1::CellExport& target, bool& is_new) {
  const auto now        = ctx_.clock->NowMillis();
  const auto updated_at = StampOr(target.updated_at(), now);

  auto make = [&](auto payload, int64_t ts) {
    Event event;
    event.project_key  = ctx_.project_key;
    event.cell_id      = target.id();
    event.timestamp_ms = ts;
    event.payload      = std::move(payload);
    return event;
  };

  std::vector<Event> events;

  auto current = ctx_.repository->GetCell(tx, target.id());
  if (current && current->project_key != ctx_.project_key) {
    throw util::AlreadyExists("cell " + target.id() + " belongs to another project");
  }
  is_new = !current;

  db::model::CellRecord state;
  if (current) {
    state = *current;

    v1::CellUpdated updated;
    if (target.title() != state.title) updated.set_title(target.title());
    if (target.description() != state.description) updated.set_description(target.description());
    if (target.has_priority() && target.priority() != state.priority) updated.set_priority(target.priority());
    if (target.assignee() != state.assignee.value_or("")) updated.set_assignee(target.assignee());
    if (updated.has_title() || updated.has_description() || updated.has_priority() || updated.has_assignee()) {
      events.push_back(make(std::move(updated), updated_at));
    }

    const auto old_parent = state.parent_id.value_or("");
    if (target.parent_id() != old_parent) {
      if (!old_parent.empty()) {
        v1::CellEpicChildRemoved removed;
        removed.set_child_id(target.id());
        auto event    = make(std::move(removed), updated_at);
        event.cell_id = old_parent;
        events.push_back(std::move(event));
      }
      if (!target.parent_id().empty()) {
        v1::CellEpicChildAdded added;
        added.set_child_id(target.id());
        auto event    = make(std::move(added), updated_at);
        event.cell_id = target.parent_id();
        events.push_back(std::move(event));
      }
    }
  } else {
    v1::CellCreated created;
    created.set_title(target.title());
    created.set_description(target.description());
    created.set_issue_type(target.issue_type());
    created.set_priority(target.has_priority() ? target.priority() : model::kDefaultPriority);
    created.set_parent_id(target.parent_id());
    events.push_back(make(std::move(created), StampOr(target.created_at(), now)));

    if (!target.assignee().empty()) {
      v1::CellAssigned assigned;
      assigned.set_assignee(target.assignee());
      events.push_back(make(std::move(assigned), updated_at));
    }
  }

  // labels
  std::set<std::string> have;
  if (current) {
    for (const auto& label : ctx_.repository->GetLabels(tx, target.id())) have.insert(label.label);
  }
  const std::set<std::string> want(target.labels().begin(), target.labels().end());
  for (const auto& label : want) {
    if (have.count(label)) continue;
    v1::CellLabelAdded added;
    added.set_label(label);
    events.push_back(make(std::move(added), updated_at));
  }
  for (const auto& label : have) {
    if (want.count(label)) continue;
    v1::CellLabelRemoved removed;
    removed.set_label(label);
    events.push_back(make(std::move(removed), updated_at));
  }

  // comments are append-only on import
  std::multiset<std::pair<std::string, std::string>> existing_comments;
  if (current) {
    for (const auto& comment : ctx_.repository->GetComments(tx, target.id())) {
      existing_comments.emplace(comment.author, comment.body);
    }
  }
  for (const auto& comment : target.comments()) {
    auto it = existing_comments.find({comment.author(), comment.text()});
    if (it != existing_comments.end()) {
      existing_comments.erase(it);
      continue;
    }
    v1::CellCommentAdded added;
    added.set_author(comment.author());
    added.set_body(comment.text());
    events.push_back(make(std::move(added), updated_at));
  }

  // status last, so a closed or deleted cell is closed with its final content
  const auto& status  = target.status();
  const bool  deleted = current && current->IsDeleted();
  if (status == model::kStatusTombstone) {
    if (!deleted) events.push_back(make(v1::CellDeleted{}, updated_at));
  } else if (status == model::kStatusClosed) {
    if (state.status != model::kStatusClosed) {
      v1::CellClosed closed;
      closed.set_reason(target.closed_reason());
      events.push_back(make(std::move(closed), StampOr(target.closed_at(), updated_at)));
    }
  } else if (model::IsValidStatus(status)) {
    std::string from = is_new ? std::string(model::kStatusOpen) : state.status;
    if (from == model::kStatusClosed) {
      events.push_back(make(v1::CellReopened{}, updated_at));
      from = std::string(model::kStatusOpen);
    }
    if (from != status) {
      v1::CellStatusChanged changed;
      changed.set_from_status(from);
      changed.set_to_status(status);
      events.push_back(make(std::move(changed), updated_at));
    }
  } else {
    throw util::ValidationError("status", "unknown status '" + status + "'");
  }

  return events;
}

std::vector<Event> JsonlImporter::PlanDependencies(db::Transaction& tx, const v1::CellExport& target) {
  const auto ts = StampOr(target.updated_at(), ctx_.clock->NowMillis());

  std::set<std::pair<std::string, std::string>> have;
  for (const auto& edge : ctx_.repository->GetDependencies(tx, target.id())) {
    have.emplace(edge.depends_on_id, edge.relationship);
  }

  std::set<std::pair<std::string, std::string>> want;
  for (const auto& dep : target.dependencies()) {
    want.emplace(dep.depends_on_id(), dep.type().empty() ? std::string("blocks") : dep.type());
  }

  std::vector<Event> events;
  auto               make = [&](auto payload) {
    Event event;
    event.project_key  = ctx_.project_key;
    event.cell_id      = target.id();
    event.timestamp_ms = ts;
    event.payload      = std::move(payload);
    return event;
  };

  for (const auto& [depends_on, relationship] : want) {
    if (have.count({depends_on, relationship})) continue;
    v1::CellDependencyAdded added;
    added.set_depends_on_id(depends_on);
    added.set_relationship(relationship);
    events.push_back(make(std::move(added)));
  }
  for (const auto& [depends_on, relationship] : have) {
    if (want.count({depends_on, relationship})) continue;
    v1::CellDependencyRemoved removed;
    removed.set_depends_on_id(depends_on);
    removed.set_relationship(relationship);
    events.push_back(make(std::move(removed)));
  }
  return events;
}

ImportResult JsonlImporter::Import(const std::string& jsonl, const ImportOptions& options) {
  ImportResult result;

  std::vector<ParsedLine> parsed;
  {
    std::istringstream in(jsonl);
    std::string        text;
    int64_t            number = 0;
    while (std::getline(in, text)) {
      ++number;
      if (text.find_first_not_of(" \t\r") == std::string::npos) continue;
      try {
        parsed.push_back({number, ParseLine(text)});
      } catch (const std::exception& e) {
        result.errors.push_back({number, "", e.what()});
      }
    }
  }

  // Pass 1: cell bodies, labels, comments, status.
  std::vector<ParsedLine*> pending;
  for (auto& line : parsed) {
    try {
      util::RetryTransient(ctx_.store_retry, "import cell", [&] {
        auto tx      = ctx_.repository->Begin();
        auto current = ctx_.repository->GetCell(*tx, line.cell.id());

        if (current) {
          const auto canonical = RenderLine(WithoutDependencies(BuildExport(*ctx_.repository, *tx, *current)));
          if (options.skip_existing || canonical == RenderLine(WithoutDependencies(line.cell))) {
            line.is_new  = false;
            line.changed = false;
            if (!options.skip_existing) pending.push_back(&line);
            tx->Rollback();
            return;
          }
        }

        auto events  = PlanCell(*tx, line.cell, line.is_new);
        line.changed = !events.empty();
        for (auto& event : events) store_->AppendInTransaction(*tx, event);

        if (options.dry_run) {
          tx->Rollback();
        } else {
          tx->Commit();
        }
        pending.push_back(&line);
      });
    } catch (const util::RetriesExhausted&) {
      throw;
    } catch (const std::exception& e) {
      result.errors.push_back({line.line, line.cell.id(), e.what()});
      line.failed = true;
    }
  }

  // Pass 2: dependency edges, now that every cell of the file exists.
  for (auto* line : pending) {
    try {
      util::RetryTransient(ctx_.store_retry, "import dependencies", [&] {
        auto tx = ctx_.repository->Begin();

        // A dry-run new cell does not exist; every edge of it is new.
        if (options.dry_run && line->is_new) {
          if (line->cell.dependencies_size() > 0) line->changed = true;
          tx->Rollback();
          return;
        }

        auto events = PlanDependencies(*tx, line->cell);
        if (!events.empty()) line->changed = true;

        if (options.dry_run) {
          tx->Rollback();
          return;
        }
        for (auto& event : events) store_->AppendInTransaction(*tx, event);
        tx->Commit();
      });
    } catch (const util::RetriesExhausted&) {
      throw;
    } catch (const std::exception& e) {
      result.errors.push_back({line->line, line->cell.id(), e.what()});
    }
  }

  for (const auto& line : parsed) {
    if (line.failed) continue;
    if (line.is_new) {
      ++result.created;
    } else if (line.changed) {
      ++result.updated;
    } else {
      ++result.skipped;
    }
  }

  SWARM_LOG_INFO("import complete", {observability::StringField("project_key", ctx_.project_key),
                                     observability::BoolField("dry_run", options.dry_run),
                                     observability::IntField("created", result.created),
                                     observability::IntField("updated", result.updated),
                                     observability::IntField("skipped", result.skipped),
                                     observability::IntField("errors", static_cast<int64_t>(result.errors.size()))});
  return result;
}

ImportResult JsonlImporter::ImportFile(const std::string& path, const ImportOptions& options) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw util::NotFound("cannot open " + path);

  std::ostringstream content;
  content << in.rdbuf();
  return Import(content.str(), options);
}

} // namespace swarm::hive
