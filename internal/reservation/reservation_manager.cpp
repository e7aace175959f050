#include "reservation_manager.hpp"

#include <algorithm>
#include <unordered_set>

#include "internal/db/api/repository.hpp"
#include "internal/hive/event_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/reservation/path_pattern.hpp"
#include "internal/util/clock.hpp"
#include "internal/util/errors.hpp"

namespace swarm::reservation {

ReservationManager::ReservationManager(service::ServiceContext ctx, std::shared_ptr<hive::EventStore> events,
                                       int64_t default_ttl_seconds)
    : ctx_(std::move(ctx)), events_(std::move(events)), default_ttl_seconds_(default_ttl_seconds) {
  if (default_ttl_seconds_ <= 0) throw std::invalid_argument("ReservationManager: default ttl must be positive");
}

ReserveResult ReservationManager::Reserve(const ReservationRequest& request) {
  if (request.agent.empty()) throw util::ValidationError("agent", "agent name is required");
  if (request.paths.empty()) throw util::ValidationError("paths", "at least one path is required");
  if (request.ttl_seconds < 0) throw util::ValidationError("ttl_seconds", "ttl must not be negative");
  for (const auto& path : request.paths) {
    if (path.empty()) throw util::ValidationError("paths", "empty path");
  }

  if (request.cancel && request.cancel->IsCancelled()) {
    SWARM_LOG_INFO("reservation request cancelled", {observability::StringField("agent", request.agent)});
    ReserveResult cancelled;
    cancelled.cancelled = true;
    return cancelled;
  }

  const int64_t ttl_ms = (request.ttl_seconds > 0 ? request.ttl_seconds : default_ttl_seconds_) * 1000;

  auto result = util::RetryTransient(ctx_.store_retry, "file reserve", [&] {
    ReserveResult out;

    auto       tx  = ctx_.repository->Begin();
    const auto now = ctx_.clock->NowMillis();
    db::ThrowIfError(ctx_.repository->PurgeInactiveReservations(*tx, ctx_.project_key, now), "purge reservations");
    auto active = ctx_.repository->ListActiveReservations(*tx, ctx_.project_key, now);

    for (const auto& path : request.paths) {
      std::vector<Conflict> path_conflicts;
      for (const auto& held : active) {
        if (held.agent_name == request.agent) continue;
        if (!held.exclusive && !request.exclusive) continue;
        if (!PatternsOverlap(path, held.path_pattern)) continue;

        path_conflicts.push_back({path, held.agent_name, held.path_pattern, held.exclusive, held.expires_at_ms});
      }

      if (!path_conflicts.empty()) {
        for (const auto& conflict : path_conflicts) {
          hive::Event event;
          event.project_key  = ctx_.project_key;
          event.timestamp_ms = now;

          hive::v1::FileConflict payload;
          payload.set_agent(request.agent);
          payload.set_path(conflict.path);
          payload.set_holder(conflict.holder);
          payload.set_holder_pattern(conflict.holder_pattern);
          event.payload = std::move(payload);
          events_->AppendInTransaction(*tx, event);
        }
        out.conflicts.insert(out.conflicts.end(), path_conflicts.begin(), path_conflicts.end());
        continue;
      }

      // Re-reserving one's own pattern refreshes it.
      for (const auto& held : active) {
        if (held.agent_name == request.agent && held.path_pattern == path) {
          db::ThrowIfError(ctx_.repository->ReleaseReservation(*tx, held.id, now), "refresh reservation");
        }
      }

      db::model::ReservationRecord record;
      record.project_key   = ctx_.project_key;
      record.agent_name    = request.agent;
      record.path_pattern  = path;
      record.exclusive     = request.exclusive;
      record.reason        = request.reason;
      record.created_at_ms = now;
      record.expires_at_ms = now + ttl_ms;
      db::ThrowIfError(ctx_.repository->InsertReservation(*tx, record), "insert reservation");

      out.granted.push_back({record.id, path, request.exclusive, record.expires_at_ms});

      // later paths of this request see it as the agent's own
      active.push_back(record);
    }

    if (!out.granted.empty()) {
      hive::Event event;
      event.project_key  = ctx_.project_key;
      event.timestamp_ms = now;

      hive::v1::FileReserved payload;
      payload.set_agent(request.agent);
      payload.set_exclusive(request.exclusive);
      payload.set_reason(request.reason);
      payload.set_expires_at_ms(now + ttl_ms);
      for (const auto& grant : out.granted) {
        payload.add_paths(grant.path_pattern);
        payload.add_reservation_ids(grant.id);
      }
      event.payload = std::move(payload);
      events_->AppendInTransaction(*tx, event);
    }

    tx->Commit();
    return out;
  });

  observability::Metrics::Instance().RecordReservationConflicts(result.conflicts.size());
  for (const auto& conflict : result.conflicts) {
    SWARM_LOG_WARN("reservation conflict", {observability::StringField("agent", request.agent),
                                            observability::StringField("path", conflict.path),
                                            observability::StringField("holder", conflict.holder),
                                            observability::StringField("pattern", conflict.holder_pattern)});
  }
  if (!result.granted.empty()) {
    SWARM_LOG_INFO("files reserved", {observability::StringField("agent", request.agent),
                                      observability::IntField("granted", static_cast<int64_t>(result.granted.size())),
                                      observability::BoolField("exclusive", request.exclusive)});
  }
  return result;
}

int64_t ReservationManager::Release(const std::string& agent, const ReleaseSelector& selector) {
  if (agent.empty()) throw util::ValidationError("agent", "agent name is required");

  const std::unordered_set<std::string> paths(selector.paths.begin(), selector.paths.end());
  const std::unordered_set<int64_t>     ids(selector.reservation_ids.begin(), selector.reservation_ids.end());

  const auto released = util::RetryTransient(ctx_.store_retry, "file release", [&] {
    auto       tx  = ctx_.repository->Begin();
    const auto now = ctx_.clock->NowMillis();

    hive::v1::FileReleased payload;
    payload.set_agent(agent);

    int64_t count = 0;
    for (const auto& held : ctx_.repository->ListActiveReservations(*tx, ctx_.project_key, now)) {
      if (held.agent_name != agent) continue;

      const bool selected = selector.all || paths.count(held.path_pattern) > 0 || ids.count(held.id) > 0;
      if (!selected) continue;

      db::ThrowIfError(ctx_.repository->ReleaseReservation(*tx, held.id, now), "release reservation");
      payload.add_paths(held.path_pattern);
      payload.add_reservation_ids(held.id);
      ++count;
    }

    if (count > 0) {
      hive::Event event;
      event.project_key  = ctx_.project_key;
      event.timestamp_ms = now;
      event.payload      = std::move(payload);
      events_->AppendInTransaction(*tx, event);
    }

    tx->Commit();
    return count;
  });

  SWARM_LOG_INFO("files released", {observability::StringField("agent", agent),
                                    observability::IntField("released", released)});
  return released;
}

int64_t ReservationManager::ReleaseAll(const std::string& agent) {
  ReleaseSelector selector;
  selector.all = true;
  return Release(agent, selector);
}

std::vector<db::model::ReservationRecord>
ReservationManager::ActiveReservations(const std::optional<std::string>& agent) {
  auto tx   = ctx_.repository->Begin(db::TxMode::kRead);
  auto rows = ctx_.repository->ListActiveReservations(*tx, ctx_.project_key, ctx_.clock->NowMillis());
  tx->Commit();

  if (agent) {
    rows.erase(std::remove_if(rows.begin(), rows.end(), [&](const auto& r) { return r.agent_name != *agent; }),
               rows.end());
  }
  return rows;
}

} // namespace swarm::reservation
