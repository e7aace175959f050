#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

using swarm::factory::BuildRuntime;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: swarm-hive-flushd <config.yaml> OR swarm-hive-flushd --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = swarm::config::ConfigLoader::LoadFromYaml(config_path);

    swarm::observability::InitializeLogging(config);
    swarm::observability::InitializeTracing(config);
    swarm::observability::InitializeMetrics(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = BuildRuntime(config);

    // Register signal handlers before starting the worker to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.flush_scheduler->Start();
    app.flush_scheduler->ScheduleFlush();
    SWARM_LOG_INFO("hive flush daemon started",
                   {swarm::observability::StringField("project", config.hive().project_key()),
                    swarm::observability::StringField("export_path", config.hive().export_path()),
                    swarm::observability::IntField("interval_ms", config.hive().flush_debounce_ms())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    SWARM_LOG_INFO("Shutting down hive flush daemon");

    // Stop() flushes one last time.
    app.flush_scheduler->Stop();
    SWARM_LOG_INFO("hive flush daemon stopped",
                   {swarm::observability::IntField("flushes", static_cast<int64_t>(app.flush_scheduler->FlushCount()))});
    swarm::observability::ShutdownMetrics();
    swarm::observability::ShutdownTracing();
    swarm::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    SWARM_LOG_ERROR("Fatal error", {swarm::observability::StringField("error", e.what())});
    swarm::observability::ShutdownMetrics();
    swarm::observability::ShutdownTracing();
    swarm::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
