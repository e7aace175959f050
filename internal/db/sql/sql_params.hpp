#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace swarm::db::sql {

/*
  Positional parameter for dynamically assembled queries (filters).
  SQLite binds ? placeholders in order.
*/

using Param = std::variant<
    std::nullptr_t,
    int64_t,
    std::string
>;

using Params = std::vector<Param>;

}
