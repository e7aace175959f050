#include "grpc_relay_transport.hpp"

#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>
#include <grpcpp/support/byte_buffer.h>
#include <grpcpp/support/slice.h>

#include <future>
#include <vector>

#include "swarm/relay/v1.hpp"

namespace swarm::relay {

namespace {

std::string ToString(const grpc::ByteBuffer& buffer) {
  std::vector<grpc::Slice> slices;
  std::string              out;
  if (!buffer.Dump(&slices).ok()) return out;

  out.reserve(buffer.Length());
  for (const auto& slice : slices) {
    out.append(reinterpret_cast<const char*>(slice.begin()), slice.size());
  }
  return out;
}

} // namespace

GrpcRelayTransport::GrpcRelayTransport(const std::string& endpoint)
    : GrpcRelayTransport(grpc::CreateChannel(endpoint, grpc::InsecureChannelCredentials())) {
}

GrpcRelayTransport::GrpcRelayTransport(std::shared_ptr<grpc::Channel> channel)
    : channel_(std::move(channel)), stub_(std::make_unique<grpc::GenericStub>(channel_)) {
}

grpc::Status GrpcRelayTransport::Call(const std::string& method, const std::string& request, std::string* response,
                                      std::chrono::milliseconds timeout) {
  grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + timeout);

  grpc::Slice      slice(request);
  grpc::ByteBuffer request_buffer(&slice, 1);
  grpc::ByteBuffer response_buffer;

  std::promise<grpc::Status> done;
  auto                       result = done.get_future();

  stub_->UnaryCall(&context, method, grpc::StubOptions(), &request_buffer, &response_buffer,
                   [&done](grpc::Status status) { done.set_value(std::move(status)); });

  auto status = result.get();
  if (status.ok() && response != nullptr) {
    *response = ToString(response_buffer);
  }
  return status;
}

bool GrpcRelayTransport::Healthy(std::chrono::milliseconds timeout) {
  v1::HealthRequest request;
  std::string       raw;

  auto status = Call(v1::kHealthMethod, request.SerializeAsString(), &raw, timeout);
  if (!status.ok()) return false;

  v1::HealthResponse response;
  return response.ParseFromString(raw) && response.status() == "ok";
}

} // namespace swarm::relay
