#pragma once

#include <grpcpp/channel.h>
#include <grpcpp/generic/generic_stub.h>

#include <memory>
#include <string>

#include "internal/relay/relay_transport.hpp"

namespace swarm::relay {

class GrpcRelayTransport final : public RelayTransport {
 public:
  explicit GrpcRelayTransport(const std::string& endpoint);
  explicit GrpcRelayTransport(std::shared_ptr<grpc::Channel> channel);

  grpc::Status Call(const std::string& method, const std::string& request, std::string* response,
                    std::chrono::milliseconds timeout) override;

  bool Healthy(std::chrono::milliseconds timeout) override;

 private:
  std::shared_ptr<grpc::Channel>     channel_;
  std::unique_ptr<grpc::GenericStub> stub_;
};

} // namespace swarm::relay
