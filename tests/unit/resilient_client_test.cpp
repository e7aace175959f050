#include <cassert>
#include <chrono>
#include <deque>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/relay/collaborator_supervisor.hpp"
#include "internal/relay/recovery_state.hpp"
#include "internal/relay/relay_transport.hpp"
#include "internal/relay/resilient_client.hpp"
#include "internal/util/clock.hpp"
#include "internal/util/errors.hpp"
#include "swarm/relay/v1.hpp"

namespace {

using namespace std::chrono_literals;
using swarm::relay::RecoveryState;

class ScriptedTransport final : public swarm::relay::RelayTransport {
 public:
  grpc::Status Call(const std::string& method, const std::string&, std::string* response,
                    std::chrono::milliseconds) override {
    methods.push_back(method);
    if (script.empty()) {
      *response = reply;
      return grpc::Status::OK;
    }
    auto status = script.front();
    script.pop_front();
    if (status.ok()) *response = reply;
    return status;
  }

  bool Healthy(std::chrono::milliseconds) override {
    ++probes;
    return healthy;
  }

  std::deque<grpc::Status> script;
  std::vector<std::string> methods;
  std::string              reply;
  bool                     healthy = true;
  int                      probes  = 0;
};

class CountingSupervisor final : public swarm::relay::CollaboratorSupervisor {
 public:
  explicit CountingSupervisor(bool succeed) : succeed_(succeed) {
  }

  bool Restart() override {
    ++restarts;
    return succeed_;
  }

  int restarts = 0;

 private:
  bool succeed_;
};

grpc::Status Unavailable() {
  return grpc::Status(grpc::StatusCode::UNAVAILABLE, "connection refused");
}

struct Harness {
  std::shared_ptr<ScriptedTransport>         transport = std::make_shared<ScriptedTransport>();
  std::shared_ptr<CountingSupervisor>        supervisor;
  std::shared_ptr<swarm::util::ManualClock>  clock = std::make_shared<swarm::util::ManualClock>();
  std::vector<std::chrono::milliseconds>     sleeps;
  std::unique_ptr<swarm::relay::ResilientClient> client;

  explicit Harness(bool restart_succeeds = true, uint32_t max_retries = 3, bool auto_restart = true) {
    supervisor = std::make_shared<CountingSupervisor>(restart_succeeds);

    swarm::relay::ResilientOptions options;
    options.backoff.max_retries    = max_retries;
    options.backoff.base_delay     = 100ms;
    options.backoff.max_delay      = 1000ms;
    options.backoff.jitter_percent = 0;
    options.restart_cooldown       = 10000ms;
    options.auto_restart           = auto_restart;

    client = std::make_unique<swarm::relay::ResilientClient>(
        transport, supervisor, clock, options, [this](std::chrono::milliseconds d) { sleeps.push_back(d); });
  }
};

void TestClassification() {
  using swarm::relay::ResilientClient;
  assert(ResilientClient::IsRetryable(grpc::Status(grpc::StatusCode::UNAVAILABLE, "")));
  assert(ResilientClient::IsRetryable(grpc::Status(grpc::StatusCode::DEADLINE_EXCEEDED, "")));
  assert(ResilientClient::IsRetryable(grpc::Status(grpc::StatusCode::ABORTED, "")));
  assert(ResilientClient::IsRetryable(grpc::Status(grpc::StatusCode::RESOURCE_EXHAUSTED, "")));
  assert(ResilientClient::IsRetryable(grpc::Status(grpc::StatusCode::INTERNAL, "an unexpected error occurred")));
  assert(!ResilientClient::IsRetryable(grpc::Status(grpc::StatusCode::INTERNAL, "bad schema")));
  assert(!ResilientClient::IsRetryable(grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "")));
  assert(!ResilientClient::IsRetryable(grpc::Status(grpc::StatusCode::NOT_FOUND, "")));
  assert(!ResilientClient::IsRetryable(grpc::Status(grpc::StatusCode::PERMISSION_DENIED, "")));
}

void TestStateMachineEdges() {
  using swarm::relay::CanTransition;
  assert(CanTransition(RecoveryState::kHealthy, RecoveryState::kDegraded));
  assert(!CanTransition(RecoveryState::kHealthy, RecoveryState::kRestarting));
  assert(CanTransition(RecoveryState::kDegraded, RecoveryState::kRestarting));
  assert(CanTransition(RecoveryState::kDegraded, RecoveryState::kHealthy));
  assert(CanTransition(RecoveryState::kRestarting, RecoveryState::kHealthy));
  assert(CanTransition(RecoveryState::kRestarting, RecoveryState::kDegraded));
}

void TestRetriesThenSucceeds() {
  Harness h;
  h.transport->script = {Unavailable(), Unavailable(), grpc::Status::OK};
  h.transport->reply  = "pong";

  assert(h.client->CallRaw("/m", "req") == "pong");
  assert(h.transport->methods.size() == 3);
  assert(h.sleeps.size() == 2);
  assert(h.sleeps[0] == 100ms);
  assert(h.sleeps[1] == 200ms);
  // collaborator answered its probe, so nothing was restarted
  assert(h.supervisor->restarts == 0);
  assert(h.client->State() == RecoveryState::kHealthy);
  assert(h.client->ConsecutiveFailures() == 0);
}

void TestFatalErrorIsNotRetried() {
  Harness h;
  h.transport->script = {grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "bad project")};

  bool threw = false;
  try {
    (void)h.client->CallRaw("/m", "req");
  } catch (const swarm::util::RelayError& e) {
    threw = true;
    assert(!e.retryable());
    assert(e.code() == static_cast<int>(grpc::StatusCode::INVALID_ARGUMENT));
  }
  assert(threw);
  assert(h.transport->methods.size() == 1);
  assert(h.sleeps.empty());
  assert(h.client->State() == RecoveryState::kHealthy);
}

void TestRetriesExhaust() {
  Harness h(true, 2);
  h.transport->script = {Unavailable(), Unavailable(), Unavailable(), Unavailable()};

  bool threw = false;
  try {
    (void)h.client->CallRaw("/m", "req");
  } catch (const swarm::util::RetriesExhausted& e) {
    threw = true;
    assert(e.attempts() == 3);
    assert(e.last_cause().find("connection refused") != std::string::npos);
  }
  assert(threw);
  assert(h.transport->methods.size() == 3);
  assert(h.sleeps.size() == 2);
  assert(h.client->State() == RecoveryState::kDegraded);
}

void TestUnhealthyCollaboratorIsRestarted() {
  Harness h;
  h.transport->healthy = false;
  h.transport->script  = {Unavailable(), grpc::Status::OK};
  h.transport->reply   = "ok";

  assert(h.client->CallRaw("/m", "req") == "ok");
  assert(h.supervisor->restarts == 1);
  assert(h.client->State() == RecoveryState::kHealthy);
}

void TestRestartsAreRateLimited() {
  Harness h(false, 3);
  h.transport->healthy = false;
  h.transport->script  = {Unavailable(), Unavailable(), Unavailable(), Unavailable()};

  bool threw = false;
  try {
    (void)h.client->CallRaw("/m", "req");
  } catch (const swarm::util::RetriesExhausted&) {
    threw = true;
  }
  assert(threw);
  // four failures, one restart inside the cooldown window
  assert(h.supervisor->restarts == 1);
  assert(h.client->State() == RecoveryState::kDegraded);

  h.clock->Advance(10001ms);
  h.transport->script = {Unavailable(), grpc::Status::OK};
  (void)h.client->CallRaw("/m", "req");
  assert(h.supervisor->restarts == 2);
  // the successful call recovers even though the restart itself failed
  assert(h.client->State() == RecoveryState::kHealthy);
}

void TestAutoRestartDisabled() {
  Harness h(true, 1, false);
  h.transport->healthy = false;
  h.transport->script  = {Unavailable(), Unavailable()};

  bool threw = false;
  try {
    (void)h.client->CallRaw("/m", "req");
  } catch (const swarm::util::RetriesExhausted&) {
    threw = true;
  }
  assert(threw);
  assert(h.supervisor->restarts == 0);
  assert(h.transport->probes == 0);
}

void TestMalformedResponseIsFatal() {
  Harness h;
  // field 1, length 5, two bytes present
  h.transport->reply = std::string("\x0a\x05" "ab", 4);

  bool threw = false;
  try {
    (void)h.client->Call<swarm::relay::v1::RegisterResponse>("/m", swarm::relay::v1::RegisterRequest());
  } catch (const swarm::util::RelayError& e) {
    threw = true;
    assert(!e.retryable());
  }
  assert(threw);
}

} // namespace

int main() {
  TestClassification();
  TestStateMachineEdges();
  TestRetriesThenSucceeds();
  TestFatalErrorIsNotRetried();
  TestRetriesExhaust();
  TestUnhealthyCollaboratorIsRestarted();
  TestRestartsAreRateLimited();
  TestAutoRestartDisabled();
  TestMalformedResponseIsFatal();

  std::cout << "swarm_hive_unit_resilient_client: pass\n";
  return 0;
}
