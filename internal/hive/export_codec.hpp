#pragma once

#include <optional>
#include <string>

#include "swarm/hive/v1.hpp"
#include "internal/db/api/repository.hpp"

namespace swarm::hive {

/*
  Portable export line codec.

  One CellExport per line, printed with the protobuf JSON printer using
  proto field names. Timestamps are ISO-8601 UTC. Soft-deleted cells are
  exported with status "tombstone".
*/

// Assembles the export view of one cell from the projection tables.
v1::CellExport BuildExport(db::Repository& repository, db::Transaction& tx, const db::model::CellRecord& cell);

// Single line, no trailing newline.
std::string RenderLine(const v1::CellExport& cell);

// Throws util::ValidationError on malformed JSON.
v1::CellExport ParseLine(const std::string& line);

// Reads only the "id" member. Tolerates fields this version does not know.
std::optional<std::string> ExtractId(const std::string& line);

} // namespace swarm::hive
