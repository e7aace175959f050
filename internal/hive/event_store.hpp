#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "internal/hive/events.hpp"
#include "internal/service/service_context.hpp"

namespace swarm::db {
class Transaction;
struct EventFilter;
} // namespace swarm::db

namespace swarm::hive {

class ProjectionEngine;

struct ReplayOptions {
  // Events with sequence <= from_sequence are skipped.
  int64_t from_sequence = 0;
  // Drop every projection row before re-applying.
  bool clear_views = true;
};

struct ReplayResult {
  int64_t events_replayed = 0;
  int64_t duration_ms     = 0;
};

/*
  Append-only event log plus synchronous projection.

  Append validates, assigns the next per-project sequence and applies the
  projection inside one write transaction. A projection failure rolls back
  the event as well, so the log and the views never diverge. Busy/locked
  store errors are retried with the context's backoff policy.
*/
class EventStore {
 public:
  // Runs inside the append transaction, before the event is written.
  // Throwing aborts the append.
  using Precondition = std::function<void(db::Transaction&)>;

  EventStore(service::ServiceContext ctx, std::shared_ptr<ProjectionEngine> projections);

  // Returns the assigned sequence.
  int64_t Append(Event event, const Precondition& precondition = {});

  // All-or-nothing. Returns the assigned sequences in input order.
  std::vector<int64_t> AppendBatch(std::vector<Event> events, const Precondition& precondition = {});

  // Append from wire form. Unknown types are stored verbatim and never projected.
  int64_t AppendRaw(const std::string& type, const std::string& project_key, const std::string& cell_id,
                    int64_t timestamp_ms, const std::string& payload_json);

  // For callers that already hold a write transaction. Fills sequence,
  // event_id and timestamp_ms of `event`.
  int64_t AppendInTransaction(db::Transaction& tx, Event& event);

  std::vector<Event> Read(const db::EventFilter& filter);
  std::vector<Event> Read(const std::string& project_key, int64_t after_sequence = 0);

  int64_t LatestSequence(const std::string& project_key);

  void    CommitCursor(const std::string& project_key, const std::string& consumer, int64_t sequence);
  int64_t GetCursor(const std::string& project_key, const std::string& consumer);

  // Rebuilds the projections from the log in one transaction.
  ReplayResult Replay(const std::string& project_key, const ReplayOptions& options = {});

 private:
  service::ServiceContext           ctx_;
  std::shared_ptr<ProjectionEngine> projections_;
};

} // namespace swarm::hive
