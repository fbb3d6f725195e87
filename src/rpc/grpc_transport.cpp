#include <zone/rpc/convert.hpp>
#include <zone/rpc/grpc_transport.hpp>
#include <zone/v1/zone.grpc.pb.h>

#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>

using namespace zone::schema;
using zone::citation::fetch_result;
using zone::citation::fetch_status;

namespace zone::rpc {

std::shared_ptr<grpc::Channel> grpc_transport::channel_for(
    const std::string& endpoint) {
  auto lock = std::scoped_lock{mutex_};
  auto found = channels_.find(endpoint);
  if (found != channels_.end()) {
    return found->second;
  }
  auto channel =
      grpc::CreateChannel(endpoint, grpc::InsecureChannelCredentials());
  channels_.emplace(endpoint, channel);
  return channel;
}

fetch_result grpc_transport::fetch(const std::string& endpoint,
                                   const attestation_id_t& id,
                                   const std::chrono::milliseconds timeout) {
  auto stub = zone::v1::Zone::NewStub(channel_for(endpoint));
  auto context = grpc::ClientContext{};
  context.set_deadline(std::chrono::system_clock::now() + timeout);

  auto request = zone::v1::GetAttestationRequest{};
  request.set_attestation_id(to_hex(id));
  request.set_anchored(true);
  auto response = zone::v1::GetAttestationResponse{};
  auto status = stub->GetAttestation(&context, request, &response);

  auto fetched = fetch_result{};
  switch (status.error_code()) {
    case grpc::StatusCode::OK:
      break;
    case grpc::StatusCode::NOT_FOUND:
      fetched.status = fetch_status::not_found;
      fetched.log = status.error_message();
      return fetched;
    case grpc::StatusCode::DEADLINE_EXCEEDED:
    case grpc::StatusCode::UNAVAILABLE:
      fetched.status = fetch_status::unreachable;
      fetched.log = fmt::format("{} ({})", endpoint, status.error_message());
      return fetched;
    default:
      spdlog::debug("GetAttestation on {} returned {}: {}", endpoint,
                    static_cast<int>(status.error_code()),
                    status.error_message());
      fetched.status = fetch_status::malformed;
      fetched.log = status.error_message();
      return fetched;
  }

  auto record = from_proto(response);
  if (!record.ok()) {
    fetched.status = fetch_status::malformed;
    fetched.log = std::move(record.log);
    return fetched;
  }
  fetched.status = fetch_status::ok;
  fetched.record = std::move(record.value);
  return fetched;
}

}  // namespace zone::rpc
