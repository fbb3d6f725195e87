#pragma once

#include <zone/execution/engine.hpp>
#include <zone/v1/zone.grpc.pb.h>

namespace zone::rpc {

/// zone.v1.Zone callback service. Each call decodes the boundary strings,
/// runs the matching engine operation and maps its error code to a gRPC
/// status.
///
/// Quick reference:
/// - Info: zone self-description.
/// - Submit: build, sign and append one attestation.
/// - GetAttestation: attestation, inclusion proof and anchor. `anchored`
///   selects the earliest anchored root instead of the current one.
/// - CurrentRoot: root, leaf count and latest anchor.
/// - VerifyCitation: cross-zone citation check; always OK with a verdict.
/// - RecordAnchor: bind an external timestamp to a root of this ledger.
struct service final : public zone::v1::Zone::CallbackService {
  explicit service(zone::execution::engine& engine);

  virtual grpc::ServerUnaryReactor* Info(
      grpc::CallbackServerContext* context,
      const zone::v1::InfoRequest* request,
      zone::v1::InfoResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Submit(
      grpc::CallbackServerContext* context,
      const zone::v1::SubmitRequest* request,
      zone::v1::SubmitResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetAttestation(
      grpc::CallbackServerContext* context,
      const zone::v1::GetAttestationRequest* request,
      zone::v1::GetAttestationResponse* response) override final;

  virtual grpc::ServerUnaryReactor* CurrentRoot(
      grpc::CallbackServerContext* context,
      const zone::v1::CurrentRootRequest* request,
      zone::v1::CurrentRootResponse* response) override final;

  virtual grpc::ServerUnaryReactor* VerifyCitation(
      grpc::CallbackServerContext* context,
      const zone::v1::VerifyCitationRequest* request,
      zone::v1::VerifyCitationResponse* response) override final;

  virtual grpc::ServerUnaryReactor* RecordAnchor(
      grpc::CallbackServerContext* context,
      const zone::v1::RecordAnchorRequest* request,
      zone::v1::RecordAnchorResponse* response) override final;

  zone::execution::engine& engine_;
};

}  // namespace zone::rpc
