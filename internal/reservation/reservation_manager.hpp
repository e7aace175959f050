#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/reservation_record.hpp"
#include "internal/reservation/reservation.hpp"
#include "internal/service/service_context.hpp"

namespace swarm::hive { class EventStore; }

namespace swarm::reservation {

/*
  File reservation manager.

  Grant evaluation is check-then-insert inside one write transaction, so two
  processes can never both pass the overlap check for the same paths. A
  path is refused when an active reservation of another agent overlaps it
  and either side is exclusive. Conflicts are returned, never thrown.

  Expiry is passive: rows past expires_at simply stop matching.
  Lifecycle events are appended to the event log in the same transaction.
*/
class ReservationManager {
 public:
  ReservationManager(service::ServiceContext ctx, std::shared_ptr<hive::EventStore> events,
                     int64_t default_ttl_seconds = 3600);

  ReserveResult Reserve(const ReservationRequest& request);

  // Only the agent's own active reservations are released. Returns the count.
  int64_t Release(const std::string& agent, const ReleaseSelector& selector);

  int64_t ReleaseAll(const std::string& agent);

  std::vector<db::model::ReservationRecord> ActiveReservations(const std::optional<std::string>& agent = std::nullopt);

 private:
  service::ServiceContext           ctx_;
  std::shared_ptr<hive::EventStore> events_;
  int64_t                           default_ttl_seconds_;
};

} // namespace swarm::reservation
