#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace swarm::reservation {

// Shared between a requester and whoever may abort it (session teardown).
class CancellationToken {
 public:
  void Cancel() {
    cancelled_.store(true);
  }

  bool IsCancelled() const {
    return cancelled_.load();
  }

 private:
  std::atomic<bool> cancelled_{false};
};

struct ReservationRequest {
  std::string              agent;
  std::vector<std::string> paths;
  // 0 = configured default
  int64_t     ttl_seconds = 0;
  bool        exclusive   = true;
  std::string reason;

  std::shared_ptr<CancellationToken> cancel;
};

struct Grant {
  int64_t     id = 0;
  std::string path_pattern;
  bool        exclusive     = true;
  int64_t     expires_at_ms = 0;
};

// One entry per (requested path, conflicting holder).
struct Conflict {
  std::string path;
  std::string holder;
  std::string holder_pattern;
  bool        holder_exclusive = true;
  int64_t     expires_at_ms    = 0;
};

struct ReserveResult {
  std::vector<Grant>    granted;
  std::vector<Conflict> conflicts;
  // Aborted through the cancellation token before any state changed.
  bool cancelled = false;
};

// Exactly one of the three is normally used; `all` wins.
struct ReleaseSelector {
  std::vector<std::string> paths;
  std::vector<int64_t>     reservation_ids;
  bool                     all = false;
};

} // namespace swarm::reservation
