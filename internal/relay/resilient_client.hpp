#pragma once

#include <google/protobuf/message.h>
#include <grpcpp/support/status.h>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>

#include "internal/relay/recovery_state.hpp"
#include "internal/util/backoff.hpp"
#include "internal/util/errors.hpp"

namespace swarm::util { class Clock; }

namespace swarm::relay {

class RelayTransport;
class CollaboratorSupervisor;

struct ResilientOptions {
  util::BackoffPolicy backoff;

  std::chrono::milliseconds call_timeout   = std::chrono::milliseconds(10000);
  std::chrono::milliseconds health_timeout = std::chrono::milliseconds(2000);

  // consecutive retryable failures before the collaborator is probed
  uint32_t                  failure_threshold = 1;
  std::chrono::milliseconds restart_cooldown  = std::chrono::milliseconds(10000);
  bool                      auto_restart      = true;
};

/*
  Retry, backoff and auto-recovery around a RelayTransport.

  Retryable failures are retried with jittered exponential backoff. Once
  `failure_threshold` consecutive failures accumulate the collaborator is
  probed; an unhealthy probe triggers at most one restart per cooldown
  window through the supervisor. Fatal failures surface immediately as
  util::RelayError; exhausted retries as util::RetriesExhausted.
*/
class ResilientClient {
 public:
  using SleepFn = std::function<void(std::chrono::milliseconds)>;

  ResilientClient(std::shared_ptr<RelayTransport> transport, std::shared_ptr<CollaboratorSupervisor> supervisor,
                  std::shared_ptr<util::Clock> clock, ResilientOptions options, SleepFn sleep = {});

  std::string CallRaw(const std::string& method, const std::string& request);

  template <typename Response>
  Response Call(const std::string& method, const google::protobuf::Message& request) {
    Response response;
    if (!response.ParseFromString(CallRaw(method, request.SerializeAsString()))) {
      throw util::RelayError(static_cast<int>(grpc::StatusCode::INTERNAL), false,
                             "malformed response from " + method);
    }
    return response;
  }

  RecoveryState State() const;

  uint32_t ConsecutiveFailures() const;

  static bool IsRetryable(const grpc::Status& status);

 private:
  void OnSuccess();
  void OnFailure(const std::string& method, const grpc::Status& status);
  void MaybeRecover();
  void TransitionLocked(RecoveryState to);

  std::shared_ptr<RelayTransport>         transport_;
  std::shared_ptr<CollaboratorSupervisor> supervisor_;
  std::shared_ptr<util::Clock>            clock_;
  ResilientOptions                        options_;
  SleepFn                                 sleep_;

  mutable std::mutex     mutex_;
  RecoveryState          state_                = RecoveryState::kHealthy;
  uint32_t               consecutive_failures_ = 0;
  std::optional<int64_t> last_restart_ms_;
  std::mt19937_64        rng_{std::random_device{}()};
};

} // namespace swarm::relay
