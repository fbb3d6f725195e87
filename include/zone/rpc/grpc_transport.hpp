#pragma once

#include <zone/citation/transport.hpp>

#include <grpcpp/channel.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace zone::rpc {

/// Fetches served records from other zones over zone.v1.Zone/GetAttestation.
/// Channels are created once per endpoint and reused; every call carries its
/// own deadline.
class grpc_transport final : public zone::citation::transport {
 public:
  zone::citation::fetch_result fetch(const std::string& endpoint,
                                     const zone::schema::attestation_id_t& id,
                                     std::chrono::milliseconds timeout) override;

 private:
  std::shared_ptr<grpc::Channel> channel_for(const std::string& endpoint);

  std::mutex mutex_;
  std::map<std::string, std::shared_ptr<grpc::Channel>> channels_;
};

}  // namespace zone::rpc
