#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "swarm_hive_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\hive\\\"quoted\"\\db.sqlite"
    wal_mode: true
hive:
  project_key: "alpha"
)");

  auto config = swarm::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\hive\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().wal_mode());
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(hive:
  project_key: "line1\nline2☃"
  export_path: "/tmp/issues.jsonl"
)");

  auto config = swarm::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.hive().project_key() == std::string("line1\nline2☃"));
}

void TestQuotedNumbersStayStrings() {
  const auto yaml_path = WriteYaml("quoted_number",
                                   R"(hive:
  project_key: "12345"
  flush_debounce_ms: 250
)");

  auto config = swarm::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.hive().project_key() == "12345");
  assert(config.hive().flush_debounce_ms() == 250);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(hive:
  project_key: "alpha"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)swarm::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)swarm::config::ConfigLoader::LoadFromYaml("/nonexistent/swarm-hive.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config") != std::string::npos;
  }
  assert(threw);
}

void TestDefaultsAreFilled() {
  const auto yaml_path = WriteYaml("defaults", "hive:\n  project_key: \"alpha\"\n");

  auto config = swarm::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().busy_timeout_ms() == 5000);
  assert(config.database().sqlite().wal_mode());
  assert(config.reservations().default_ttl_seconds() == 3600);
  assert(config.hive().flush_debounce_ms() == 30000);
  assert(config.hive().id_prefix() == "cell");
  assert(config.relay().endpoint() == "127.0.0.1:8765");
  assert(config.relay().timeout_ms() == 10000);
  assert(config.relay().max_retries() == 3);
  assert(config.relay().base_delay_ms() == 100);
  assert(config.relay().max_delay_ms() == 5000);
  assert(config.relay().jitter_percent() == 20);
  assert(config.relay().failure_threshold() == 1);
  assert(config.relay().restart_cooldown_ms() == 10000);
  assert(config.relay().auto_restart());
  assert(config.database().sqlite().path() == ".hive/hive.db");
  assert(config.hive().export_path() == ".hive/issues.jsonl");
  assert(config.session().state_dir() == ".hive/sessions");
  assert(!config.observability().metrics_enabled());
  assert(!config.observability().tracing_enabled());
}

void TestObservabilitySection() {
  const auto yaml_path = WriteYaml("observability",
                                   R"(observability:
  metrics_enabled: true
  tracing_enabled: true
  otlp_endpoint: "http://collector:4318/v1/traces"
  transport: OTLP_TRANSPORT_HTTP
  collection_interval_ms: 500
)");

  auto config = swarm::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.observability().metrics_enabled());
  assert(config.observability().tracing_enabled());
  assert(config.observability().transport() == swarm::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(config.observability().collection_interval_ms() == 500);
}

void TestProjectKeyFromEnvironment() {
  const auto yaml_path = WriteYaml("project_env", "hive:\n  project_key: \"from-file\"\n");

  setenv("SWARM_PROJECT_KEY", "/work/beta", 1);
  auto config = swarm::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  unsetenv("SWARM_PROJECT_KEY");

  assert(config.hive().project_key() == "/work/beta");
}

void TestExplicitZeroRetriesAndJitterSurvive() {
  const auto yaml_path = WriteYaml("explicit_zero",
                                   R"(relay:
  max_retries: 0
  jitter_percent: 0
  auto_restart: false
)");

  auto config = swarm::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.relay().max_retries() == 0);
  assert(config.relay().jitter_percent() == 0);
  assert(!config.relay().auto_restart());
}

void TestEnvironmentOverrides() {
  const auto yaml_path = WriteYaml("env_override",
                                   R"(relay:
  max_retries: 7
  base_delay_ms: 10
)");

  setenv("SWARM_RELAY_MAX_RETRIES", "2", 1);
  setenv("SWARM_RELAY_AUTO_RESTART", "false", 1);
  auto config = swarm::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  unsetenv("SWARM_RELAY_MAX_RETRIES");
  unsetenv("SWARM_RELAY_AUTO_RESTART");

  assert(config.relay().max_retries() == 2);
  assert(config.relay().base_delay_ms() == 10);
  assert(!config.relay().auto_restart());

  setenv("SWARM_RELAY_TIMEOUT_MS", "abc", 1);
  bool threw = false;
  try {
    (void)swarm::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  unsetenv("SWARM_RELAY_TIMEOUT_MS");
  assert(threw && "non-numeric override must be rejected");
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestDefaultsAreFilled();
  TestObservabilitySection();
  TestProjectKeyFromEnvironment();
  TestExplicitZeroRetriesAndJitterSurvive();
  TestEnvironmentOverrides();

  std::cout << "swarm_hive_unit_config_loader: pass\n";
  return 0;
}
