#include "events.hpp"

#include <google/protobuf/util/json_util.h>

#include <type_traits>
#include <unordered_map>
#include <utility>

#include "internal/model/cell.hpp"
#include "internal/util/errors.hpp"

namespace swarm::hive {

namespace {

template <typename T>
EventPayload ParseAs(const std::string& json) {
  T message;

  google::protobuf::util::JsonParseOptions options;
  // fields added by newer writers are tolerated
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json.empty() ? "{}" : json, &message, options);
  if (!status.ok()) {
    throw util::ValidationError("payload", std::string("malformed ") + EventTraits<T>::kType +
                                               " payload: " + std::string(status.message()));
  }
  return message;
}

using Decoder = EventPayload (*)(const std::string&);

// UnknownEvent is the last alternative and has no decoder.
template <std::size_t... I>
std::unordered_map<std::string, Decoder> BuildDecoders(std::index_sequence<I...>) {
  return {{EventTraits<std::variant_alternative_t<I, EventPayload>>::kType,
           &ParseAs<std::variant_alternative_t<I, EventPayload>>}...};
}

const std::unordered_map<std::string, Decoder>& Decoders() {
  static const auto kDecoders = BuildDecoders(std::make_index_sequence<std::variant_size_v<EventPayload> - 1>{});
  return kDecoders;
}

void Require(bool ok, const char* field, const std::string& message) {
  if (!ok) throw util::ValidationError(field, message);
}

void RequirePriority(int priority) {
  Require(model::IsValidPriority(priority), "priority",
          "priority must be between 0 and 3, got " + std::to_string(priority));
}

void RequireRelationship(const std::string& relationship) {
  Require(model::IsValidRelationship(relationship), "relationship", "unknown relationship '" + relationship + "'");
}

// One overload per payload type; a new alternative without one fails to compile.
struct PayloadValidator {
  const Event& event;

  void operator()(const v1::CellCreated& p) const {
    Require(!p.title().empty(), "title", "cell_created requires a title");
    Require(model::IsValidIssueType(p.issue_type()), "issue_type", "invalid issue_type '" + p.issue_type() + "'");
    RequirePriority(p.priority());
  }

  void operator()(const v1::CellUpdated& p) const {
    Require(p.has_title() || p.has_description() || p.has_priority() || p.has_assignee(), "payload",
            "cell_updated requires at least one changed field");
    if (p.has_title()) Require(!p.title().empty(), "title", "title cannot be empty");
    if (p.has_priority()) RequirePriority(p.priority());
  }

  void operator()(const v1::CellStatusChanged& p) const {
    Require(model::IsValidStatus(p.to_status()), "to_status", "invalid to_status '" + p.to_status() + "'");
    Require(p.to_status() != model::kStatusClosed, "to_status", "use cell_closed to close a cell");
  }

  void operator()(const v1::CellClosed&) const {}
  void operator()(const v1::CellReopened&) const {}
  void operator()(const v1::CellDeleted&) const {}

  void operator()(const v1::CellDependencyAdded& p) const {
    Require(!p.depends_on_id().empty(), "depends_on_id", "dependency target is required");
    Require(p.depends_on_id() != event.cell_id, "depends_on_id", "a cell cannot depend on itself");
    RequireRelationship(p.relationship());
  }

  void operator()(const v1::CellDependencyRemoved& p) const {
    Require(!p.depends_on_id().empty(), "depends_on_id", "dependency target is required");
    RequireRelationship(p.relationship());
  }

  void operator()(const v1::CellLabelAdded& p) const {
    Require(!p.label().empty(), "label", "label is required");
  }

  void operator()(const v1::CellLabelRemoved& p) const {
    Require(!p.label().empty(), "label", "label is required");
  }

  void operator()(const v1::CellCommentAdded& p) const {
    Require(!p.author().empty(), "author", "comment author is required");
    Require(!p.body().empty(), "body", "comment body is required");
  }

  void operator()(const v1::CellCommentUpdated& p) const {
    Require(p.comment_id() > 0, "comment_id", "comment_id is required");
    Require(!p.body().empty(), "body", "comment body is required");
  }

  void operator()(const v1::CellCommentDeleted& p) const {
    Require(p.comment_id() > 0, "comment_id", "comment_id is required");
  }

  void operator()(const v1::CellEpicChildAdded& p) const {
    Require(!p.child_id().empty(), "child_id", "child_id is required");
    Require(p.child_id() != event.cell_id, "child_id", "an epic cannot contain itself");
  }

  void operator()(const v1::CellEpicChildRemoved& p) const {
    Require(!p.child_id().empty(), "child_id", "child_id is required");
  }

  void operator()(const v1::CellAssigned& p) const {
    Require(!p.assignee().empty(), "assignee", "assignee is required");
  }

  void operator()(const v1::CellWorkStarted&) const {}

  void operator()(const v1::FileReserved& p) const {
    Require(!p.agent().empty(), "agent", "file_reserved requires an agent");
    Require(p.paths_size() > 0, "paths", "file_reserved requires at least one path");
  }

  void operator()(const v1::FileReleased& p) const {
    Require(!p.agent().empty(), "agent", "file_released requires an agent");
  }

  void operator()(const v1::FileConflict& p) const {
    Require(!p.agent().empty(), "agent", "file_conflict requires an agent");
    Require(!p.holder().empty(), "holder", "file_conflict requires a holder");
  }

  void operator()(const UnknownEvent& p) const {
    Require(!p.type.empty(), "type", "event type is required");
  }
};

} // namespace

std::string EventType(const EventPayload& payload) {
  return std::visit(
      [](const auto& p) -> std::string {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, UnknownEvent>) {
          return p.type;
        } else {
          return EventTraits<T>::kType;
        }
      },
      payload);
}

bool IsCellEvent(const EventPayload& payload) {
  return !std::holds_alternative<v1::FileReserved>(payload) && !std::holds_alternative<v1::FileReleased>(payload) &&
         !std::holds_alternative<v1::FileConflict>(payload);
}

std::string EncodePayload(const EventPayload& payload) {
  return std::visit(
      [](const auto& p) -> std::string {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, UnknownEvent>) {
          return p.payload_json;
        } else {
          google::protobuf::util::JsonPrintOptions options;
          options.preserve_proto_field_names = true;

          std::string out;
          auto        status = google::protobuf::util::MessageToJsonString(p, &out, options);
          if (!status.ok()) {
            throw std::runtime_error(std::string("failed to encode ") + EventTraits<T>::kType + ": " +
                                     std::string(status.message()));
          }
          return out;
        }
      },
      payload);
}

EventPayload DecodePayload(const std::string& type, const std::string& payload_json) {
  const auto& decoders = Decoders();
  auto        it       = decoders.find(type);
  if (it == decoders.end()) {
    return UnknownEvent{type, payload_json};
  }
  return it->second(payload_json);
}

void ValidateEvent(const Event& event) {
  Require(!event.project_key.empty(), "project_key", "project_key is required");

  if (IsCellEvent(event.payload) && !std::holds_alternative<UnknownEvent>(event.payload)) {
    Require(!event.cell_id.empty(), "cell_id", EventType(event.payload) + " requires cell_id");
  }

  std::visit(PayloadValidator{event}, event.payload);
}

Event FromRecord(const db::model::EventRecord& record) {
  Event event;
  event.event_id     = record.id;
  event.project_key  = record.project_key;
  event.cell_id      = record.cell_id;
  event.timestamp_ms = record.timestamp_ms;
  event.sequence     = record.sequence;
  event.payload      = DecodePayload(record.type, record.payload_json);
  return event;
}

db::model::EventRecord ToRecord(const Event& event) {
  db::model::EventRecord record;
  record.id           = event.event_id;
  record.project_key  = event.project_key;
  record.cell_id      = event.cell_id;
  record.timestamp_ms = event.timestamp_ms;
  record.sequence     = event.sequence;
  record.type         = EventType(event.payload);
  record.payload_json = EncodePayload(event.payload);
  return record;
}

} // namespace swarm::hive
