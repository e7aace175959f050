#include "resilient_client.hpp"

#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/relay/collaborator_supervisor.hpp"
#include "internal/relay/relay_transport.hpp"
#include "internal/util/clock.hpp"

namespace swarm::relay {

ResilientClient::ResilientClient(std::shared_ptr<RelayTransport> transport,
                                 std::shared_ptr<CollaboratorSupervisor> supervisor, std::shared_ptr<util::Clock> clock,
                                 ResilientOptions options, SleepFn sleep)
    : transport_(std::move(transport)),
      supervisor_(std::move(supervisor)),
      clock_(std::move(clock)),
      options_(std::move(options)),
      sleep_(std::move(sleep)) {
  if (!transport_) throw std::invalid_argument("ResilientClient: transport is required");
  if (!clock_) throw std::invalid_argument("ResilientClient: clock is required");
  if (!sleep_) sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  if (options_.failure_threshold == 0) options_.failure_threshold = 1;
}

bool ResilientClient::IsRetryable(const grpc::Status& status) {
  switch (status.error_code()) {
    case grpc::StatusCode::UNAVAILABLE:
    case grpc::StatusCode::DEADLINE_EXCEEDED:
    case grpc::StatusCode::ABORTED:
    case grpc::StatusCode::RESOURCE_EXHAUSTED:
      return true;
    case grpc::StatusCode::UNKNOWN:
    case grpc::StatusCode::INTERNAL:
      return status.error_message().find("unexpected error") != std::string::npos;
    default:
      return false;
  }
}

std::string ResilientClient::CallRaw(const std::string& method, const std::string& request) {
  for (uint32_t attempt = 1;; ++attempt) {
    std::string response;
    const auto  status = transport_->Call(method, request, &response, options_.call_timeout);
    if (status.ok()) {
      OnSuccess();
      return response;
    }

    if (!IsRetryable(status)) {
      throw util::RelayError(static_cast<int>(status.error_code()), false,
                             method + " failed: " + status.error_message());
    }

    OnFailure(method, status);

    if (attempt > options_.backoff.max_retries) {
      SWARM_LOG_ERROR("relay retries exhausted", {observability::StringField("method", method),
                                                  observability::IntField("attempts", attempt),
                                                  observability::StringField("error", status.error_message())});
      throw util::RetriesExhausted(static_cast<int>(attempt), method + ": " + status.error_message());
    }

    std::chrono::milliseconds delay;
    {
      std::lock_guard lock(mutex_);
      delay = util::BackoffDelay(options_.backoff, attempt, rng_);
    }
    SWARM_LOG_WARN("relay call failed, retrying", {observability::StringField("method", method),
                                                   observability::IntField("attempt", attempt),
                                                   observability::IntField("delay_ms", delay.count()),
                                                   observability::IntField("code", status.error_code()),
                                                   observability::StringField("error", status.error_message())});
    sleep_(delay);
  }
}

void ResilientClient::OnSuccess() {
  std::lock_guard lock(mutex_);
  consecutive_failures_ = 0;
  if (state_ == RecoveryState::kDegraded) TransitionLocked(RecoveryState::kHealthy);
}

void ResilientClient::OnFailure(const std::string& method, const grpc::Status& status) {
  bool probe = false;
  {
    std::lock_guard lock(mutex_);
    ++consecutive_failures_;
    if (consecutive_failures_ >= options_.failure_threshold) {
      if (state_ == RecoveryState::kHealthy) TransitionLocked(RecoveryState::kDegraded);
      probe = state_ == RecoveryState::kDegraded;
    }
  }

  if (probe) {
    SWARM_LOG_DEBUG("probing relay health", {observability::StringField("method", method),
                                             observability::StringField("error", status.error_message())});
    MaybeRecover();
  }
}

void ResilientClient::MaybeRecover() {
  if (!options_.auto_restart || !supervisor_) return;
  if (transport_->Healthy(options_.health_timeout)) return;

  {
    std::lock_guard lock(mutex_);
    if (state_ != RecoveryState::kDegraded) return;

    const auto now = clock_->NowMillis();
    if (last_restart_ms_ && now - *last_restart_ms_ < options_.restart_cooldown.count()) {
      SWARM_LOG_WARN("relay restart suppressed by cooldown",
                     {observability::IntField("since_last_ms", now - *last_restart_ms_)});
      return;
    }
    last_restart_ms_ = now;
    TransitionLocked(RecoveryState::kRestarting);
  }

  const bool restarted = supervisor_->Restart();

  std::lock_guard lock(mutex_);
  if (restarted) {
    consecutive_failures_ = 0;
    TransitionLocked(RecoveryState::kHealthy);
  } else {
    TransitionLocked(RecoveryState::kDegraded);
  }
}

void ResilientClient::TransitionLocked(RecoveryState to) {
  if (state_ == to || !CanTransition(state_, to)) return;

  SWARM_LOG_WARN("relay state transition", {observability::StringField("from", ToString(state_)),
                                            observability::StringField("to", ToString(to))});
  state_ = to;
  observability::Metrics::Instance().RecordRelayTransition(ToString(to));
}

RecoveryState ResilientClient::State() const {
  std::lock_guard lock(mutex_);
  return state_;
}

uint32_t ResilientClient::ConsecutiveFailures() const {
  std::lock_guard lock(mutex_);
  return consecutive_failures_;
}

} // namespace swarm::relay
