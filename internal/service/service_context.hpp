#pragma once

#include <memory>
#include <string>

#include "internal/util/backoff.hpp"

namespace swarm::db { class Repository; }
namespace swarm::util { class Clock; }

namespace swarm::service {

/*
  Dependency container handed to every hive component.
*/
struct ServiceContext {
  std::shared_ptr<swarm::db::Repository> repository;
  std::shared_ptr<swarm::util::Clock> clock;
  std::string project_key;

  // Applied when the store reports busy/locked on a write.
  swarm::util::BackoffPolicy store_retry;
};

}
