#include "event_store.hpp"

#include <chrono>

#include "internal/db/api/repository.hpp"
#include "internal/hive/projection_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/clock.hpp"
#include "internal/util/errors.hpp"

namespace swarm::hive {

EventStore::EventStore(service::ServiceContext ctx, std::shared_ptr<ProjectionEngine> projections)
    : ctx_(std::move(ctx)), projections_(std::move(projections)) {
  if (!ctx_.repository) throw std::invalid_argument("EventStore: repository is required");
  if (!ctx_.clock) throw std::invalid_argument("EventStore: clock is required");
  if (!projections_) throw std::invalid_argument("EventStore: projection engine is required");
}

int64_t EventStore::AppendInTransaction(db::Transaction& tx, Event& event) {
  ValidateEvent(event);
  if (event.timestamp_ms == 0) event.timestamp_ms = ctx_.clock->NowMillis();

  auto record = ToRecord(event);
  db::ThrowIfError(ctx_.repository->AppendEvent(tx, record), "append " + record.type);

  event.event_id = record.id;
  event.sequence = record.sequence;

  projections_->Apply(tx, event);
  return event.sequence;
}

int64_t EventStore::Append(Event event, const Precondition& precondition) {
  // Validation errors are not retried; fail before touching the store.
  ValidateEvent(event);

  const auto sequence = util::RetryTransient(ctx_.store_retry, "event append", [&] {
    Event attempt = event;
    auto  tx      = ctx_.repository->Begin();
    if (precondition) precondition(*tx);
    const auto seq = AppendInTransaction(*tx, attempt);
    tx->Commit();
    return seq;
  });

  SWARM_LOG_DEBUG("event appended", {observability::StringField("project_key", event.project_key),
                                     observability::StringField("type", EventType(event.payload)),
                                     observability::StringField("cell_id", event.cell_id),
                                     observability::IntField("sequence", sequence)});
  return sequence;
}

std::vector<int64_t> EventStore::AppendBatch(std::vector<Event> events, const Precondition& precondition) {
  for (const auto& event : events) ValidateEvent(event);

  auto sequences = util::RetryTransient(ctx_.store_retry, "event batch append", [&] {
    std::vector<int64_t> out;
    out.reserve(events.size());

    auto tx = ctx_.repository->Begin();
    if (precondition) precondition(*tx);
    for (auto attempt : events) {
      out.push_back(AppendInTransaction(*tx, attempt));
    }
    tx->Commit();
    return out;
  });

  SWARM_LOG_DEBUG("event batch appended", {observability::IntField("count", static_cast<int64_t>(sequences.size()))});
  return sequences;
}

int64_t EventStore::AppendRaw(const std::string& type, const std::string& project_key, const std::string& cell_id,
                              int64_t timestamp_ms, const std::string& payload_json) {
  if (type.empty()) throw util::ValidationError("type", "event type is required");

  Event event;
  event.project_key  = project_key;
  event.cell_id      = cell_id;
  event.timestamp_ms = timestamp_ms;
  event.payload      = DecodePayload(type, payload_json);

  if (std::holds_alternative<UnknownEvent>(event.payload)) {
    SWARM_LOG_WARN("storing event of unknown type", {observability::StringField("type", type),
                                                     observability::StringField("project_key", project_key)});
  }
  return Append(std::move(event));
}

std::vector<Event> EventStore::Read(const db::EventFilter& filter) {
  auto tx      = ctx_.repository->Begin(db::TxMode::kRead);
  auto records = ctx_.repository->ReadEvents(*tx, filter);
  tx->Commit();

  std::vector<Event> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    out.push_back(FromRecord(record));
  }
  return out;
}

std::vector<Event> EventStore::Read(const std::string& project_key, int64_t after_sequence) {
  db::EventFilter filter;
  filter.project_key    = project_key;
  filter.after_sequence = after_sequence;
  return Read(filter);
}

int64_t EventStore::LatestSequence(const std::string& project_key) {
  auto tx       = ctx_.repository->Begin(db::TxMode::kRead);
  auto sequence = ctx_.repository->LatestSequence(*tx, project_key);
  tx->Commit();
  return sequence;
}

void EventStore::CommitCursor(const std::string& project_key, const std::string& consumer, int64_t sequence) {
  if (consumer.empty()) throw util::ValidationError("consumer", "cursor consumer is required");

  util::RetryTransient(ctx_.store_retry, "cursor commit", [&] {
    db::model::EventCursorRecord record;
    record.project_key   = project_key;
    record.consumer      = consumer;
    record.sequence      = sequence;
    record.updated_at_ms = ctx_.clock->NowMillis();

    auto tx = ctx_.repository->Begin();
    db::ThrowIfError(ctx_.repository->CommitCursor(*tx, record), "commit cursor " + consumer);
    tx->Commit();
  });
}

int64_t EventStore::GetCursor(const std::string& project_key, const std::string& consumer) {
  auto tx     = ctx_.repository->Begin(db::TxMode::kRead);
  auto cursor = ctx_.repository->GetCursor(*tx, project_key, consumer);
  tx->Commit();
  return cursor ? cursor->sequence : 0;
}

ReplayResult EventStore::Replay(const std::string& project_key, const ReplayOptions& options) {
  const auto started = std::chrono::steady_clock::now();

  SWARM_LOG_INFO("replay started", {observability::StringField("project_key", project_key),
                                    observability::IntField("from_sequence", options.from_sequence),
                                    observability::BoolField("clear_views", options.clear_views)});

  ReplayResult result;
  util::RetryTransient(ctx_.store_retry, "event replay", [&] {
    result.events_replayed = 0;

    auto tx = ctx_.repository->Begin();
    if (options.clear_views) {
      db::ThrowIfError(ctx_.repository->ClearProjections(*tx, project_key), "clear projections");
    }

    db::EventFilter filter;
    filter.project_key    = project_key;
    filter.after_sequence = options.from_sequence;

    for (const auto& record : ctx_.repository->ReadEvents(*tx, filter)) {
      projections_->Apply(*tx, FromRecord(record));
      ++result.events_replayed;
    }

    projections_->RebuildDerived(*tx, project_key);
    tx->Commit();
  });

  result.duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();

  SWARM_LOG_INFO("replay finished", {observability::StringField("project_key", project_key),
                                     observability::IntField("events_replayed", result.events_replayed),
                                     observability::IntField("duration_ms", result.duration_ms)});
  return result;
}

} // namespace swarm::hive
