#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace swarm::db::model {

/*
  Live lease over a path pattern.

  Active means: released_at_ms unset AND expires_at_ms > now.
  Released and expired rows stop matching at once and are deleted by the
  next reserve call in the same project.
*/
struct ReservationRecord {
  int64_t     id = 0;
  std::string project_key;
  std::string agent_name;
  std::string path_pattern;
  bool        exclusive = true;
  std::string reason;
  int64_t     created_at_ms = 0;
  int64_t     expires_at_ms = 0;

  std::optional<int64_t> released_at_ms;
};

} // namespace swarm::db::model
