#pragma once

#include <string_view>

namespace swarm::relay {

/*
  Collaborator recovery state machine.

      Healthy ---failures >= threshold---> Degraded
      Degraded --probe unhealthy-------->  Restarting
      Restarting --restart ok----------->  Healthy
      Restarting --restart failed------->  Degraded
      Degraded --call succeeded--------->  Healthy
*/
enum class RecoveryState { kHealthy, kDegraded, kRestarting };

constexpr bool CanTransition(RecoveryState from, RecoveryState to) {
  switch (from) {
    case RecoveryState::kHealthy:
      return to == RecoveryState::kDegraded;
    case RecoveryState::kDegraded:
      return to == RecoveryState::kRestarting || to == RecoveryState::kHealthy;
    case RecoveryState::kRestarting:
      return to == RecoveryState::kHealthy || to == RecoveryState::kDegraded;
  }
  return false;
}

constexpr std::string_view ToString(RecoveryState state) {
  switch (state) {
    case RecoveryState::kHealthy:
      return "healthy";
    case RecoveryState::kDegraded:
      return "degraded";
    case RecoveryState::kRestarting:
      return "restarting";
  }
  return "unknown";
}

} // namespace swarm::relay
