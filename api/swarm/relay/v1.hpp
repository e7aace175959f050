#pragma once

#include "swarm/relay/v1/relay.pb.h"

namespace swarm::relay::v1 {

// Fully qualified method names of the MessageRelay service.
inline constexpr const char* kRegisterMethod        = "/swarm.relay.v1.MessageRelay/Register";
inline constexpr const char* kSendMessageMethod     = "/swarm.relay.v1.MessageRelay/SendMessage";
inline constexpr const char* kFetchInboxMethod      = "/swarm.relay.v1.MessageRelay/FetchInbox";
inline constexpr const char* kAcknowledgeMethod     = "/swarm.relay.v1.MessageRelay/Acknowledge";
inline constexpr const char* kReserveFilesMethod    = "/swarm.relay.v1.MessageRelay/ReserveFiles";
inline constexpr const char* kReleaseFilesMethod    = "/swarm.relay.v1.MessageRelay/ReleaseFiles";
inline constexpr const char* kSummarizeThreadMethod = "/swarm.relay.v1.MessageRelay/SummarizeThread";
inline constexpr const char* kHealthMethod          = "/swarm.relay.v1.MessageRelay/Health";

} // namespace swarm::relay::v1
