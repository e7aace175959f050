#pragma once

#include <string>

#include "config/config.pb.h"

namespace swarm::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Defaults are filled
  for absent fields, then SWARM_* environment overrides are applied.
*/
class ConfigLoader {
 public:
  static swarm::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills defaults and applies environment overrides in place.
  static void Finalize(swarm::runtime::config::RuntimeConfig& config);
};

} // namespace swarm::config
