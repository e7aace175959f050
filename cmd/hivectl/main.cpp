#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

using swarm::factory::RuntimeDependencies;

static void Usage() {
  std::cout << "Usage:\n"
            << "  hivectl <config.yaml> create <title> [type=task|bug|feature|epic|chore] [priority=0..3]\n"
            << "  hivectl <config.yaml> show <id>\n"
            << "  hivectl <config.yaml> start <id> <agent>\n"
            << "  hivectl <config.yaml> close <id> [reason]\n"
            << "  hivectl <config.yaml> reopen <id> [reason]\n"
            << "  hivectl <config.yaml> dep <id> <depends_on_id> [relationship]\n"
            << "  hivectl <config.yaml> ready [limit]\n"
            << "  hivectl <config.yaml> blocked\n"
            << "  hivectl <config.yaml> stats\n"
            << "  hivectl <config.yaml> reserve <agent> <ttl_seconds> <path>...\n"
            << "  hivectl <config.yaml> release <agent>\n"
            << "  hivectl <config.yaml> flush\n"
            << "  hivectl <config.yaml> export\n"
            << "  hivectl <config.yaml> import <file.jsonl> [--dry-run]\n"
            << "  hivectl <config.yaml> replay\n";
}

static void PrintCell(const swarm::db::model::CellRecord& cell) {
  std::cout << cell.id << " [" << cell.status << "] p" << cell.priority << " " << cell.issue_type << " "
            << cell.title;
  if (cell.assignee) std::cout << " @" << *cell.assignee;
  std::cout << "\n";
}

// Accepts a full id or its hash segment.
static std::string ResolveId(RuntimeDependencies& app, const std::string& partial) {
  auto resolved = app.queries->ResolvePartialId(partial);
  if (!resolved.has_value()) {
    throw swarm::util::NotFound("cell not found: " + partial);
  }
  return *resolved;
}

static int Run(RuntimeDependencies& app, const std::string& cmd, int argc, char** argv) {
  // ------------------------------------------------------------

  if (cmd == "create") {
    if (argc < 4) return 1;

    swarm::hive::CreateCellRequest req;
    req.title = argv[3];
    if (argc >= 5) req.issue_type = argv[4];
    if (argc >= 6) req.priority = std::stoi(argv[5]);

    PrintCell(app.hive->CreateCell(req));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "show") {
    if (argc < 4) return 1;

    auto cell = app.queries->GetCell(ResolveId(app, argv[3]));
    if (!cell.has_value()) {
      std::cerr << "not found: " << argv[3] << "\n";
      return 2;
    }

    PrintCell(*cell);
    for (const auto& dep : app.queries->GetDependencies(cell->id)) {
      std::cout << "  " << dep.relationship << " <- " << dep.depends_on_id << "\n";
    }
    for (const auto& label : app.queries->GetLabels(cell->id)) {
      std::cout << "  label=" << label << "\n";
    }
    for (const auto& comment : app.queries->GetComments(cell->id)) {
      std::cout << "  #" << comment.id << " " << comment.author << ": " << comment.body << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "start") {
    if (argc < 5) return 1;

    PrintCell(app.hive->StartWork(ResolveId(app, argv[3]), argv[4]));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "close") {
    if (argc < 4) return 1;

    PrintCell(app.hive->CloseCell(ResolveId(app, argv[3]), argc >= 5 ? argv[4] : "done"));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "reopen") {
    if (argc < 4) return 1;

    PrintCell(app.hive->ReopenCell(ResolveId(app, argv[3]), argc >= 5 ? argv[4] : ""));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "dep") {
    if (argc < 5) return 1;

    const std::string relationship = argc >= 6 ? argv[5] : "blocks";
    app.hive->AddDependency(ResolveId(app, argv[3]), ResolveId(app, argv[4]), relationship);
    std::cout << "added\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "ready") {
    swarm::hive::ReadyWorkOptions options;
    if (argc >= 4) options.limit = std::stoll(argv[3]);

    for (const auto& cell : app.queries->GetReadyWork(options)) {
      PrintCell(cell);
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "blocked") {
    for (const auto& blocked : app.queries->GetBlockedCells()) {
      PrintCell(blocked.cell);
      for (const auto& blocker : blocked.blockers) {
        std::cout << "  blocked by " << blocker << "\n";
      }
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    auto stats = app.queries->GetStatistics();

    std::cout << "total=" << stats.total_cells << "\n";
    std::cout << "open=" << stats.open << "\n";
    std::cout << "in_progress=" << stats.in_progress << "\n";
    std::cout << "closed=" << stats.closed << "\n";
    std::cout << "blocked=" << stats.blocked << "\n";
    std::cout << "ready=" << stats.ready << "\n";
    for (const auto& [type, count] : stats.by_type) {
      std::cout << "type." << type << "=" << count << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "reserve") {
    if (argc < 6) return 1;

    swarm::reservation::ReservationRequest req;
    req.agent       = argv[3];
    req.ttl_seconds = std::stoll(argv[4]);
    for (int i = 5; i < argc; ++i) req.paths.emplace_back(argv[i]);

    auto result = app.reservations->Reserve(req);
    for (const auto& grant : result.granted) {
      std::cout << "granted " << grant.path_pattern << " id=" << grant.id << " expires=" << grant.expires_at_ms
                << "\n";
    }
    for (const auto& conflict : result.conflicts) {
      std::cout << "conflict " << conflict.path << " held by " << conflict.holder << " (" << conflict.holder_pattern
                << ")\n";
    }
    return result.conflicts.empty() ? 0 : 3;
  }

  // ------------------------------------------------------------

  if (cmd == "release") {
    if (argc < 4) return 1;

    std::cout << "released=" << app.reservations->ReleaseAll(argv[3]) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "flush") {
    auto result = app.flush->Flush();

    std::cout << "exported=" << result.exported_count << "\n";
    if (result.failed_count > 0) {
      std::cout << "failed=" << result.failed_count << "\n";
      return 2;
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "export") {
    std::cout << app.flush->ExportAll(app.context.project_key);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "import") {
    if (argc < 4) return 1;

    swarm::hive::ImportOptions options;
    options.dry_run = argc >= 5 && std::string(argv[4]) == "--dry-run";

    auto result = app.importer->ImportFile(argv[3], options);
    std::cout << "created=" << result.created << "\n";
    std::cout << "updated=" << result.updated << "\n";
    std::cout << "skipped=" << result.skipped << "\n";
    for (const auto& issue : result.errors) {
      std::cerr << "line " << issue.line << " " << issue.cell_id << ": " << issue.message << "\n";
    }
    return result.errors.empty() ? 0 : 2;
  }

  // ------------------------------------------------------------

  if (cmd == "replay") {
    auto result = app.event_store->Replay(app.context.project_key);

    std::cout << "events=" << result.events_replayed << "\n";
    std::cout << "duration_ms=" << result.duration_ms << "\n";
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string cmd         = argv[2];

  try {
    auto config = swarm::config::ConfigLoader::LoadFromYaml(config_path);
    swarm::observability::InitializeLogging(config);
    swarm::observability::InitializeTracing(config);
    swarm::observability::InitializeMetrics(config);

    auto app = swarm::factory::BuildRuntime(config);

    const int rc = Run(app, cmd, argc, argv);
    if (rc == 1) Usage();

    swarm::observability::ShutdownMetrics();
    swarm::observability::ShutdownTracing();
    swarm::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    swarm::observability::ShutdownMetrics();
    swarm::observability::ShutdownTracing();
    swarm::observability::ShutdownLogging();
    return 2;
  }
}
