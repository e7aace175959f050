#pragma once

#include <grpcpp/support/status.h>

#include <chrono>
#include <string>

namespace swarm::relay {

/*
  One unary call to the message relay, by fully qualified method name,
  over serialized protobuf bytes.
*/
class RelayTransport {
 public:
  virtual ~RelayTransport() = default;

  virtual grpc::Status Call(const std::string& method, const std::string& request, std::string* response,
                            std::chrono::milliseconds timeout) = 0;

  // Health RPC answered with status "ok" before the timeout.
  virtual bool Healthy(std::chrono::milliseconds timeout) = 0;
};

} // namespace swarm::relay
