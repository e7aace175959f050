#include <cassert>
#include <iostream>
#include <string>

#include "internal/hive/export_codec.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace v1 = swarm::hive::v1;

v1::CellExport SampleCell() {
  v1::CellExport cell;
  cell.set_id("cell-abc123-lq2x9k");
  cell.set_title("Add retry to relay client");
  cell.set_status("open");
  cell.set_priority(1);
  cell.set_issue_type("task");
  cell.set_created_at("2024-05-01T12:30:00.000Z");
  cell.set_updated_at("2024-05-01T12:30:00.000Z");
  return cell;
}

void TestRenderIsSingleLineWithProtoNames() {
  auto cell = SampleCell();
  auto* dep = cell.add_dependencies();
  dep->set_depends_on_id("cell-abc123-lq2x00");
  dep->set_type("blocks");
  cell.add_labels("relay");

  const auto line = swarm::hive::RenderLine(cell);
  assert(line.find('\n') == std::string::npos);
  assert(line.rfind("{\"id\":\"cell-abc123-lq2x9k\"", 0) == 0);
  assert(line.find("\"issue_type\":\"task\"") != std::string::npos);
  assert(line.find("\"depends_on_id\":\"cell-abc123-lq2x00\"") != std::string::npos);
  assert(line.find("\"created_at\":\"2024-05-01T12:30:00.000Z\"") != std::string::npos);
}

void TestListsArePrintedWhenEmpty() {
  const auto line = swarm::hive::RenderLine(SampleCell());
  assert(line.find("\"dependencies\":[]") != std::string::npos);
  assert(line.find("\"labels\":[]") != std::string::npos);
  assert(line.find("\"comments\":[]") != std::string::npos);
}

void TestParseRoundTrip() {
  auto cell = SampleCell();
  cell.set_closed_at("2024-05-02T08:00:00.000Z");
  cell.set_closed_reason("done");
  cell.set_status("closed");
  auto* comment = cell.add_comments();
  comment->set_author("BlueLake");
  comment->set_text("landed in main");

  const auto parsed = swarm::hive::ParseLine(swarm::hive::RenderLine(cell));
  assert(parsed.id() == cell.id());
  assert(parsed.status() == "closed");
  assert(parsed.closed_reason() == "done");
  assert(parsed.comments_size() == 1);
  assert(parsed.comments(0).text() == "landed in main");
  assert(swarm::hive::RenderLine(parsed) == swarm::hive::RenderLine(cell));
}

void TestParseToleratesUnknownFields() {
  const auto parsed = swarm::hive::ParseLine(
      R"({"id":"cell-1","title":"t","status":"open","issue_type":"task","content_hash":"abc","estimate":3})");
  assert(parsed.id() == "cell-1");
}

void TestParseRejectsGarbage() {
  bool threw = false;
  try {
    (void)swarm::hive::ParseLine("{\"id\": ");
  } catch (const swarm::util::ValidationError& e) {
    threw = e.field() == "line";
  }
  assert(threw);

  threw = false;
  try {
    (void)swarm::hive::ParseLine(R"({"title":"no id"})");
  } catch (const swarm::util::ValidationError& e) {
    threw = e.field() == "id";
  }
  assert(threw);
}

void TestRenderFailureNamesTheCell() {
  auto cell = SampleCell();
  cell.set_title(std::string("bad \xff\xfe bytes"));

  try {
    const auto line = swarm::hive::RenderLine(cell);
    assert(line.find("cell-abc123-lq2x9k") != std::string::npos);
  } catch (const swarm::util::ExportError& e) {
    assert(std::string(e.what()).find("cell-abc123-lq2x9k") != std::string::npos);
  }
}

void TestExtractId() {
  assert(swarm::hive::ExtractId(R"({"id":"cell-9","future_field":{"nested":true}})") == std::string("cell-9"));
  assert(!swarm::hive::ExtractId(R"({"title":"x"})").has_value());
  assert(!swarm::hive::ExtractId(R"({"id":42})").has_value());
  assert(!swarm::hive::ExtractId("not json").has_value());
}

} // namespace

int main() {
  TestRenderIsSingleLineWithProtoNames();
  TestListsArePrintedWhenEmpty();
  TestParseRoundTrip();
  TestParseToleratesUnknownFields();
  TestParseRejectsGarbage();
  TestRenderFailureNamesTheCell();
  TestExtractId();

  std::cout << "swarm_hive_unit_export_codec: pass\n";
  return 0;
}
