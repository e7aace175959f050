#include "export_codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/model/cell.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace swarm::hive {

v1::CellExport BuildExport(db::Repository& repository, db::Transaction& tx, const db::model::CellRecord& cell) {
  v1::CellExport out;
  out.set_id(cell.id);
  out.set_title(cell.title);
  if (!cell.description.empty()) out.set_description(cell.description);
  out.set_status(cell.IsDeleted() ? std::string(model::kStatusTombstone) : cell.status);
  out.set_priority(cell.priority);
  out.set_issue_type(cell.issue_type);
  if (cell.assignee) out.set_assignee(*cell.assignee);
  if (cell.parent_id) out.set_parent_id(*cell.parent_id);
  out.set_created_at(util::FormatIso8601(cell.created_at_ms));
  out.set_updated_at(util::FormatIso8601(cell.updated_at_ms));
  if (cell.closed_at_ms) out.set_closed_at(util::FormatIso8601(*cell.closed_at_ms));
  if (cell.closed_reason) out.set_closed_reason(*cell.closed_reason);

  for (const auto& edge : repository.GetDependencies(tx, cell.id)) {
    auto* dep = out.add_dependencies();
    dep->set_depends_on_id(edge.depends_on_id);
    dep->set_type(edge.relationship);
  }

  for (const auto& label : repository.GetLabels(tx, cell.id)) {
    out.add_labels(label.label);
  }

  for (const auto& comment : repository.GetComments(tx, cell.id)) {
    auto* c = out.add_comments();
    c->set_author(comment.author);
    c->set_text(comment.body);
  }
  return out;
}

std::string RenderLine(const v1::CellExport& cell) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names   = true;
  options.always_print_primitive_fields = true;

  std::string line;
  auto        status = google::protobuf::util::MessageToJsonString(cell, &line, options);
  if (!status.ok()) {
    throw util::ExportError("failed to render cell " + cell.id() + ": " + std::string(status.message()));
  }
  return line;
}

v1::CellExport ParseLine(const std::string& line) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  v1::CellExport cell;
  auto           status = google::protobuf::util::JsonStringToMessage(line, &cell, options);
  if (!status.ok()) {
    throw util::ValidationError("line", "malformed export line: " + std::string(status.message()));
  }
  if (cell.id().empty()) {
    throw util::ValidationError("id", "export line has no id");
  }
  return cell;
}

std::optional<std::string> ExtractId(const std::string& line) {
  google::protobuf::Struct object;
  if (!google::protobuf::util::JsonStringToMessage(line, &object).ok()) {
    return std::nullopt;
  }

  auto it = object.fields().find("id");
  if (it == object.fields().end() || it->second.kind_case() != google::protobuf::Value::kStringValue ||
      it->second.string_value().empty()) {
    return std::nullopt;
  }
  return it->second.string_value();
}

} // namespace swarm::hive
