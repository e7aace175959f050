#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "swarm/relay/v1.hpp"

namespace swarm::relay {

class ResilientClient;

/*
  Typed operations of the message relay. Empty project keys in requests are
  filled from the client's project.
*/
class RelayClient {
 public:
  static constexpr uint32_t kMaxInboxMessages = 5;

  RelayClient(std::shared_ptr<ResilientClient> client, std::string project_key);

  v1::RegisterResponse    Register(v1::RegisterRequest request);
  v1::SendMessageResponse SendMessage(v1::SendMessageRequest request);

  // limit 0 or above kMaxInboxMessages is clamped to kMaxInboxMessages.
  std::vector<v1::InboxMessage> FetchInbox(v1::FetchInboxRequest request);

  bool Acknowledge(v1::AcknowledgeRequest request);

  v1::ReserveFilesResponse    ReserveFiles(v1::ReserveFilesRequest request);
  uint32_t                    ReleaseFiles(v1::ReleaseFilesRequest request);
  v1::SummarizeThreadResponse SummarizeThread(v1::SummarizeThreadRequest request);

  // Single probe through the retry layer; false instead of throwing.
  bool Health();

 private:
  std::shared_ptr<ResilientClient> client_;
  std::string                      project_key_;
};

} // namespace swarm::relay
