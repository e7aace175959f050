#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace swarm::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static uint32_t EnvU32(const char* name, uint32_t fallback) {
  const char* raw = std::getenv(name);
  if (!raw || !*raw) return fallback;

  char*         end   = nullptr;
  unsigned long value = std::strtoul(raw, &end, 10);
  if (!end || *end != '\0') {
    throw std::runtime_error(std::string("Invalid value for ") + name + ": " + raw);
  }
  return static_cast<uint32_t>(value);
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

swarm::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  swarm::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  Finalize(config);
  return config;
}

void ConfigLoader::Finalize(swarm::runtime::config::RuntimeConfig& config) {
  auto* sqlite = config.mutable_database()->mutable_sqlite();
  if (sqlite->path().empty()) sqlite->set_path(".hive/hive.db");
  if (sqlite->busy_timeout_ms() == 0) sqlite->set_busy_timeout_ms(5000);
  if (!sqlite->has_wal_mode()) sqlite->set_wal_mode(true);

  auto* hive = config.mutable_hive();
  if (hive->flush_debounce_ms() == 0) hive->set_flush_debounce_ms(30000);
  if (hive->id_prefix().empty()) hive->set_id_prefix("cell");
  if (hive->export_path().empty()) hive->set_export_path(".hive/issues.jsonl");
  if (hive->project_key().empty()) hive->set_project_key("default");

  auto* session = config.mutable_session();
  if (session->state_dir().empty()) session->set_state_dir(".hive/sessions");

  auto* reservations = config.mutable_reservations();
  if (reservations->default_ttl_seconds() == 0) reservations->set_default_ttl_seconds(3600);

  auto* relay = config.mutable_relay();
  if (relay->endpoint().empty()) relay->set_endpoint("127.0.0.1:8765");
  if (relay->timeout_ms() == 0) relay->set_timeout_ms(10000);
  if (!relay->has_max_retries()) relay->set_max_retries(3);
  if (relay->base_delay_ms() == 0) relay->set_base_delay_ms(100);
  if (relay->max_delay_ms() == 0) relay->set_max_delay_ms(5000);
  if (!relay->has_jitter_percent()) relay->set_jitter_percent(20);
  if (relay->failure_threshold() == 0) relay->set_failure_threshold(1);
  if (relay->restart_cooldown_ms() == 0) relay->set_restart_cooldown_ms(10000);
  if (!relay->has_auto_restart()) relay->set_auto_restart(true);
  if (relay->restart_wait_ms() == 0) relay->set_restart_wait_ms(2000);

  if (const char* project = std::getenv("SWARM_PROJECT_KEY"); project && *project) {
    hive->set_project_key(project);
  }

  relay->set_max_retries(EnvU32("SWARM_RELAY_MAX_RETRIES", relay->max_retries()));
  relay->set_base_delay_ms(EnvU32("SWARM_RELAY_BASE_DELAY_MS", relay->base_delay_ms()));
  relay->set_max_delay_ms(EnvU32("SWARM_RELAY_MAX_DELAY_MS", relay->max_delay_ms()));
  relay->set_timeout_ms(EnvU32("SWARM_RELAY_TIMEOUT_MS", relay->timeout_ms()));
  if (const char* auto_restart = std::getenv("SWARM_RELAY_AUTO_RESTART")) {
    relay->set_auto_restart(std::string(auto_restart) != "false" && std::string(auto_restart) != "0");
  }
}

} // namespace swarm::config
