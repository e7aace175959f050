#include "relay_client.hpp"

#include "internal/observability/logging.hpp"
#include "internal/relay/resilient_client.hpp"

namespace swarm::relay {

namespace {

template <typename Request>
void FillProject(Request& request, const std::string& project_key) {
  if (request.project_key().empty()) request.set_project_key(project_key);
}

} // namespace

RelayClient::RelayClient(std::shared_ptr<ResilientClient> client, std::string project_key)
    : client_(std::move(client)), project_key_(std::move(project_key)) {
  if (!client_) throw std::invalid_argument("RelayClient: resilient client is required");
}

v1::RegisterResponse RelayClient::Register(v1::RegisterRequest request) {
  FillProject(request, project_key_);
  return client_->Call<v1::RegisterResponse>(v1::kRegisterMethod, request);
}

v1::SendMessageResponse RelayClient::SendMessage(v1::SendMessageRequest request) {
  FillProject(request, project_key_);
  if (request.importance().empty()) request.set_importance("normal");
  return client_->Call<v1::SendMessageResponse>(v1::kSendMessageMethod, request);
}

std::vector<v1::InboxMessage> RelayClient::FetchInbox(v1::FetchInboxRequest request) {
  FillProject(request, project_key_);
  if (request.limit() == 0 || request.limit() > kMaxInboxMessages) request.set_limit(kMaxInboxMessages);

  auto response = client_->Call<v1::FetchInboxResponse>(v1::kFetchInboxMethod, request);

  std::vector<v1::InboxMessage> messages(response.messages().begin(), response.messages().end());
  if (messages.size() > request.limit()) messages.resize(request.limit());
  return messages;
}

bool RelayClient::Acknowledge(v1::AcknowledgeRequest request) {
  FillProject(request, project_key_);
  return client_->Call<v1::AcknowledgeResponse>(v1::kAcknowledgeMethod, request).acknowledged();
}

v1::ReserveFilesResponse RelayClient::ReserveFiles(v1::ReserveFilesRequest request) {
  FillProject(request, project_key_);
  return client_->Call<v1::ReserveFilesResponse>(v1::kReserveFilesMethod, request);
}

uint32_t RelayClient::ReleaseFiles(v1::ReleaseFilesRequest request) {
  FillProject(request, project_key_);
  return client_->Call<v1::ReleaseFilesResponse>(v1::kReleaseFilesMethod, request).released();
}

v1::SummarizeThreadResponse RelayClient::SummarizeThread(v1::SummarizeThreadRequest request) {
  FillProject(request, project_key_);
  return client_->Call<v1::SummarizeThreadResponse>(v1::kSummarizeThreadMethod, request);
}

bool RelayClient::Health() {
  try {
    return client_->Call<v1::HealthResponse>(v1::kHealthMethod, v1::HealthRequest()).status() == "ok";
  } catch (const std::runtime_error& e) {
    SWARM_LOG_WARN("relay health check failed", {observability::StringField("error", e.what())});
    return false;
  }
}

} // namespace swarm::relay
