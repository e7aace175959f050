#include <cassert>
#include <iostream>
#include <string>
#include <variant>

#include "internal/hive/events.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace v1 = swarm::hive::v1;
using swarm::hive::Event;

Event MakeCellEvent(const std::string& cell_id, swarm::hive::EventPayload payload) {
  Event event;
  event.project_key = "alpha";
  event.cell_id     = cell_id;
  event.payload     = std::move(payload);
  return event;
}

// Runs ValidateEvent and returns the offending field, or "" when valid.
std::string RejectedField(const Event& event) {
  try {
    swarm::hive::ValidateEvent(event);
  } catch (const swarm::util::ValidationError& e) {
    return e.field();
  }
  return "";
}

void TestTypeStrings() {
  assert(swarm::hive::EventType(v1::CellCreated()) == "cell_created");
  assert(swarm::hive::EventType(v1::CellDependencyRemoved()) == "cell_dependency_removed");
  assert(swarm::hive::EventType(v1::FileConflict()) == "file_conflict");
  assert(swarm::hive::EventType(swarm::hive::UnknownEvent{"cell_archived", "{}"}) == "cell_archived");
}

void TestCellEventClassification() {
  assert(swarm::hive::IsCellEvent(v1::CellClosed()));
  assert(swarm::hive::IsCellEvent(v1::CellWorkStarted()));
  assert(!swarm::hive::IsCellEvent(v1::FileReserved()));
  assert(!swarm::hive::IsCellEvent(v1::FileReleased()));
  assert(!swarm::hive::IsCellEvent(v1::FileConflict()));
}

void TestEncodeDecodeUsesProtoFieldNames() {
  v1::CellDependencyAdded added;
  added.set_depends_on_id("cell-abc123-x1");
  added.set_relationship("blocks");

  const auto json = swarm::hive::EncodePayload(added);
  assert(json.find("\"depends_on_id\"") != std::string::npos);

  auto decoded = swarm::hive::DecodePayload("cell_dependency_added", json);
  const auto& back = std::get<v1::CellDependencyAdded>(decoded);
  assert(back.depends_on_id() == "cell-abc123-x1");
  assert(back.relationship() == "blocks");
}

void TestDecodeToleratesNewerFields() {
  auto decoded = swarm::hive::DecodePayload("cell_closed", R"({"reason":"done","resolution_note":"later field"})");
  assert(std::get<v1::CellClosed>(decoded).reason() == "done");
}

void TestUnknownTypeIsPreserved() {
  const std::string raw = R"({"archive_bucket":"cold"})";
  auto decoded = swarm::hive::DecodePayload("cell_archived", raw);

  const auto* unknown = std::get_if<swarm::hive::UnknownEvent>(&decoded);
  assert(unknown != nullptr);
  assert(unknown->type == "cell_archived");
  // re-encoded byte for byte
  assert(swarm::hive::EncodePayload(decoded) == raw);
}

void TestMalformedKnownPayloadIsRejected() {
  bool threw = false;
  try {
    (void)swarm::hive::DecodePayload("cell_created", "{\"title\": ");
  } catch (const swarm::util::ValidationError& e) {
    threw = e.field() == "payload";
  }
  assert(threw);
}

void TestStructuralValidation() {
  v1::CellCreated created;
  created.set_title("Write tests");
  created.set_issue_type("task");
  created.set_priority(2);
  assert(RejectedField(MakeCellEvent("c1", created)).empty());

  auto no_title = created;
  no_title.clear_title();
  assert(RejectedField(MakeCellEvent("c1", no_title)) == "title");

  auto bad_type = created;
  bad_type.set_issue_type("story");
  assert(RejectedField(MakeCellEvent("c1", bad_type)) == "issue_type");

  auto bad_priority = created;
  bad_priority.set_priority(4);
  assert(RejectedField(MakeCellEvent("c1", bad_priority)) == "priority");

  assert(RejectedField(MakeCellEvent("", created)) == "cell_id");

  auto no_project = MakeCellEvent("c1", created);
  no_project.project_key.clear();
  assert(RejectedField(no_project) == "project_key");

  // an update must change something
  assert(RejectedField(MakeCellEvent("c1", v1::CellUpdated())) == "payload");

  v1::CellStatusChanged to_closed;
  to_closed.set_to_status("closed");
  assert(RejectedField(MakeCellEvent("c1", to_closed)) == "to_status");

  v1::CellDependencyAdded self_edge;
  self_edge.set_depends_on_id("c1");
  self_edge.set_relationship("blocks");
  assert(RejectedField(MakeCellEvent("c1", self_edge)) == "depends_on_id");

  v1::CellDependencyAdded bad_rel;
  bad_rel.set_depends_on_id("c2");
  bad_rel.set_relationship("owns");
  assert(RejectedField(MakeCellEvent("c1", bad_rel)) == "relationship");

  v1::CellCommentAdded empty_comment;
  empty_comment.set_author("BlueLake");
  assert(RejectedField(MakeCellEvent("c1", empty_comment)) == "body");

  v1::CellEpicChildAdded own_child;
  own_child.set_child_id("c1");
  assert(RejectedField(MakeCellEvent("c1", own_child)) == "child_id");
}

void TestReservationEventsNeedNoCell() {
  v1::FileReserved reserved;
  reserved.set_agent("BlueLake");
  reserved.add_paths("src/**");
  assert(RejectedField(MakeCellEvent("", reserved)).empty());

  v1::FileReserved no_paths;
  no_paths.set_agent("BlueLake");
  assert(RejectedField(MakeCellEvent("", no_paths)) == "paths");
}

void TestRecordConversion() {
  v1::CellLabelAdded label;
  label.set_label("backend");

  auto event         = MakeCellEvent("c1", label);
  event.timestamp_ms = 1234;
  event.sequence     = 9;

  const auto record = swarm::hive::ToRecord(event);
  assert(record.type == "cell_label_added");
  assert(record.cell_id == "c1");
  assert(record.sequence == 9);

  const auto back = swarm::hive::FromRecord(record);
  assert(back.timestamp_ms == 1234);
  assert(std::get<v1::CellLabelAdded>(back.payload).label() == "backend");
}

} // namespace

int main() {
  TestTypeStrings();
  TestCellEventClassification();
  TestEncodeDecodeUsesProtoFieldNames();
  TestDecodeToleratesNewerFields();
  TestUnknownTypeIsPreserved();
  TestMalformedKnownPayloadIsRejected();
  TestStructuralValidation();
  TestReservationEventsNeedNoCell();
  TestRecordConversion();

  std::cout << "swarm_hive_unit_events: pass\n";
  return 0;
}
