#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "swarm/hive/v1.hpp"
#include "internal/db/model/event_record.hpp"

namespace swarm::hive {

// Event written by a newer agent version. Stored verbatim, never projected.
struct UnknownEvent {
  std::string type;
  std::string payload_json;
};

using EventPayload = std::variant<
    v1::CellCreated,
    v1::CellUpdated,
    v1::CellStatusChanged,
    v1::CellClosed,
    v1::CellReopened,
    v1::CellDeleted,
    v1::CellDependencyAdded,
    v1::CellDependencyRemoved,
    v1::CellLabelAdded,
    v1::CellLabelRemoved,
    v1::CellCommentAdded,
    v1::CellCommentUpdated,
    v1::CellCommentDeleted,
    v1::CellEpicChildAdded,
    v1::CellEpicChildRemoved,
    v1::CellAssigned,
    v1::CellWorkStarted,
    v1::FileReserved,
    v1::FileReleased,
    v1::FileConflict,
    UnknownEvent>;

struct Event {
  int64_t     event_id = 0;  // store row id, assigned on append
  std::string project_key;
  std::string cell_id;
  int64_t     timestamp_ms = 0;  // 0 = stamped by the store clock on append
  int64_t     sequence     = 0;  // assigned on append
  EventPayload payload;
};

// Wire type string per payload message.
template <typename T>
struct EventTraits;

template <> struct EventTraits<v1::CellCreated> { static constexpr const char* kType = "cell_created"; };
template <> struct EventTraits<v1::CellUpdated> { static constexpr const char* kType = "cell_updated"; };
template <> struct EventTraits<v1::CellStatusChanged> { static constexpr const char* kType = "cell_status_changed"; };
template <> struct EventTraits<v1::CellClosed> { static constexpr const char* kType = "cell_closed"; };
template <> struct EventTraits<v1::CellReopened> { static constexpr const char* kType = "cell_reopened"; };
template <> struct EventTraits<v1::CellDeleted> { static constexpr const char* kType = "cell_deleted"; };
template <> struct EventTraits<v1::CellDependencyAdded> { static constexpr const char* kType = "cell_dependency_added"; };
template <> struct EventTraits<v1::CellDependencyRemoved> { static constexpr const char* kType = "cell_dependency_removed"; };
template <> struct EventTraits<v1::CellLabelAdded> { static constexpr const char* kType = "cell_label_added"; };
template <> struct EventTraits<v1::CellLabelRemoved> { static constexpr const char* kType = "cell_label_removed"; };
template <> struct EventTraits<v1::CellCommentAdded> { static constexpr const char* kType = "cell_comment_added"; };
template <> struct EventTraits<v1::CellCommentUpdated> { static constexpr const char* kType = "cell_comment_updated"; };
template <> struct EventTraits<v1::CellCommentDeleted> { static constexpr const char* kType = "cell_comment_deleted"; };
template <> struct EventTraits<v1::CellEpicChildAdded> { static constexpr const char* kType = "cell_epic_child_added"; };
template <> struct EventTraits<v1::CellEpicChildRemoved> { static constexpr const char* kType = "cell_epic_child_removed"; };
template <> struct EventTraits<v1::CellAssigned> { static constexpr const char* kType = "cell_assigned"; };
template <> struct EventTraits<v1::CellWorkStarted> { static constexpr const char* kType = "cell_work_started"; };
template <> struct EventTraits<v1::FileReserved> { static constexpr const char* kType = "file_reserved"; };
template <> struct EventTraits<v1::FileReleased> { static constexpr const char* kType = "file_released"; };
template <> struct EventTraits<v1::FileConflict> { static constexpr const char* kType = "file_conflict"; };

std::string EventType(const EventPayload& payload);

// False for reservation audit events, which carry no cell.
bool IsCellEvent(const EventPayload& payload);

// Protobuf JSON with proto field names. UnknownEvent returns its raw text.
std::string EncodePayload(const EventPayload& payload);

// Unknown type -> UnknownEvent. Malformed JSON for a known type throws
// util::ValidationError.
EventPayload DecodePayload(const std::string& type, const std::string& payload_json);

// Structural validation. Throws util::ValidationError naming the field.
void ValidateEvent(const Event& event);

Event FromRecord(const db::model::EventRecord& record);
db::model::EventRecord ToRecord(const Event& event);

} // namespace swarm::hive
