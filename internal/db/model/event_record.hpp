#pragma once

#include <cstdint>
#include <string>

namespace swarm::db::model {

/*
  Persistent event row. Immutable once inserted.

  sequence is assigned by the repository inside the appending transaction
  and is strictly increasing per project_key.
*/
struct EventRecord {
  int64_t     id = 0;
  std::string project_key;
  int64_t     sequence = 0;
  std::string type;
  std::string cell_id;  // empty for reservation audit events
  int64_t     timestamp_ms = 0;
  std::string payload_json;
};

struct EventCursorRecord {
  std::string project_key;
  std::string consumer;
  int64_t     sequence      = 0;
  int64_t     updated_at_ms = 0;
};

} // namespace swarm::db::model
