#pragma once

#include <cstdint>
#include <string>

namespace swarm::util {

/*
  Cell id helpers

  Format: {prefix}-{project hash}-{time base36}{random base36}
    prefix        configured, defaults to "cell"
    project hash  6 base36 chars of FNV-1a over the project key
    random        3 base36 chars
*/

std::string GenerateCellId(const std::string& prefix, const std::string& project_key, int64_t now_ms);

std::string ToBase36(uint64_t value);

uint64_t Fnv1a64(const std::string& text);

} // namespace swarm::util
