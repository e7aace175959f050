#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

#include "internal/relay/relay_client.hpp"
#include "internal/relay/relay_transport.hpp"
#include "internal/relay/resilient_client.hpp"
#include "internal/util/clock.hpp"

namespace {

using namespace std::chrono_literals;
namespace v1 = swarm::relay::v1;

// Answers every call through a handler keyed on the method name.
class FakeRelay final : public swarm::relay::RelayTransport {
 public:
  using Handler = std::function<grpc::Status(const std::string&, const std::string&, std::string*)>;

  explicit FakeRelay(Handler handler) : handler_(std::move(handler)) {
  }

  grpc::Status Call(const std::string& method, const std::string& request, std::string* response,
                    std::chrono::milliseconds) override {
    ++calls;
    return handler_(method, request, response);
  }

  bool Healthy(std::chrono::milliseconds) override {
    return true;
  }

  int calls = 0;

 private:
  Handler handler_;
};

swarm::relay::RelayClient MakeClient(const std::shared_ptr<FakeRelay>& relay) {
  swarm::relay::ResilientOptions options;
  options.backoff.max_retries = 1;
  options.backoff.base_delay  = 1ms;
  options.backoff.max_delay   = 1ms;

  auto resilient = std::make_shared<swarm::relay::ResilientClient>(
      relay, nullptr, std::make_shared<swarm::util::ManualClock>(), options, [](std::chrono::milliseconds) {});
  return swarm::relay::RelayClient(resilient, "/work/alpha");
}

void TestRegisterFillsProject() {
  auto relay = std::make_shared<FakeRelay>([](const std::string& method, const std::string& raw, std::string* out) {
    assert(method == v1::kRegisterMethod);
    v1::RegisterRequest req;
    assert(req.ParseFromString(raw));
    assert(req.project_key() == "/work/alpha");
    assert(req.program() == "agent-cli");

    v1::RegisterResponse resp;
    resp.set_agent_name("BlueLake");
    resp.set_agent_id(7);
    *out = resp.SerializeAsString();
    return grpc::Status::OK;
  });

  auto client = MakeClient(relay);

  v1::RegisterRequest req;
  req.set_program("agent-cli");
  auto resp = client.Register(req);
  assert(resp.agent_name() == "BlueLake");
  assert(resp.agent_id() == 7);
}

void TestExplicitProjectIsKept() {
  auto relay = std::make_shared<FakeRelay>([](const std::string&, const std::string& raw, std::string* out) {
    v1::SendMessageRequest req;
    assert(req.ParseFromString(raw));
    assert(req.project_key() == "/work/beta");
    assert(req.importance() == "normal");

    v1::SendMessageResponse resp;
    resp.set_message_id(11);
    *out = resp.SerializeAsString();
    return grpc::Status::OK;
  });

  auto client = MakeClient(relay);

  v1::SendMessageRequest req;
  req.set_project_key("/work/beta");
  req.set_sender("BlueLake");
  req.add_to("GreenHill");
  req.set_subject("hi");
  assert(client.SendMessage(req).message_id() == 11);
}

void TestInboxIsCapped() {
  auto relay = std::make_shared<FakeRelay>([](const std::string& method, const std::string& raw, std::string* out) {
    assert(method == v1::kFetchInboxMethod);
    v1::FetchInboxRequest req;
    assert(req.ParseFromString(raw));
    assert(req.limit() == swarm::relay::RelayClient::kMaxInboxMessages);

    // a relay that ignores the limit
    v1::FetchInboxResponse resp;
    for (int i = 0; i < 8; ++i) {
      auto* message = resp.add_messages();
      message->set_id(i + 1);
      message->set_subject("m" + std::to_string(i));
    }
    *out = resp.SerializeAsString();
    return grpc::Status::OK;
  });

  auto client = MakeClient(relay);

  v1::FetchInboxRequest req;
  req.set_agent_name("BlueLake");
  req.set_limit(50);
  auto messages = client.FetchInbox(req);
  assert(messages.size() == swarm::relay::RelayClient::kMaxInboxMessages);
  assert(messages.front().id() == 1);
}

void TestSmallerLimitIsHonoured() {
  auto relay = std::make_shared<FakeRelay>([](const std::string&, const std::string& raw, std::string* out) {
    v1::FetchInboxRequest req;
    assert(req.ParseFromString(raw));
    assert(req.limit() == 2);

    v1::FetchInboxResponse resp;
    resp.add_messages()->set_id(1);
    resp.add_messages()->set_id(2);
    *out = resp.SerializeAsString();
    return grpc::Status::OK;
  });

  auto client = MakeClient(relay);

  v1::FetchInboxRequest req;
  req.set_limit(2);
  assert(client.FetchInbox(req).size() == 2);
}

void TestReleaseAndAcknowledge() {
  auto relay = std::make_shared<FakeRelay>([](const std::string& method, const std::string&, std::string* out) {
    if (method == v1::kReleaseFilesMethod) {
      v1::ReleaseFilesResponse resp;
      resp.set_released(3);
      *out = resp.SerializeAsString();
    } else {
      assert(method == v1::kAcknowledgeMethod);
      v1::AcknowledgeResponse resp;
      resp.set_acknowledged(true);
      *out = resp.SerializeAsString();
    }
    return grpc::Status::OK;
  });

  auto client = MakeClient(relay);
  assert(client.ReleaseFiles(v1::ReleaseFilesRequest()) == 3);

  v1::AcknowledgeRequest ack;
  ack.set_message_id(9);
  assert(client.Acknowledge(ack));
}

void TestHealthReportsFalseInsteadOfThrowing() {
  auto relay = std::make_shared<FakeRelay>([](const std::string&, const std::string&, std::string*) {
    return grpc::Status(grpc::StatusCode::UNAVAILABLE, "down");
  });

  auto client = MakeClient(relay);
  assert(!client.Health());
  // one retry allowed
  assert(relay->calls == 2);

  auto healthy = std::make_shared<FakeRelay>([](const std::string& method, const std::string&, std::string* out) {
    assert(method == v1::kHealthMethod);
    v1::HealthResponse resp;
    resp.set_status("ok");
    *out = resp.SerializeAsString();
    return grpc::Status::OK;
  });
  assert(MakeClient(healthy).Health());
}

} // namespace

int main() {
  TestRegisterFillsProject();
  TestExplicitProjectIsKept();
  TestInboxIsCapped();
  TestSmallerLimitIsHonoured();
  TestReleaseAndAcknowledge();
  TestHealthReportsFalseInsteadOfThrowing();

  std::cout << "swarm_hive_unit_relay_client: pass\n";
  return 0;
}
