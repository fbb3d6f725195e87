#include <zone/rpc/convert.hpp>
#include <zone/rpc/server.hpp>

#include <spdlog/spdlog.h>

#include <string>
#include <string_view>

using namespace zone::schema;

namespace zone::rpc {

namespace {

grpc::ServerUnaryReactor* finish(grpc::CallbackServerContext* context,
                                 const grpc::Status& status) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(status);
  return reactor;
}

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  return finish(context, grpc::Status::OK);
}

grpc::ServerUnaryReactor* finish_invalid(grpc::CallbackServerContext* context,
                                         const std::string_view field,
                                         const std::string& value) {
  return finish(context,
                grpc::Status{grpc::StatusCode::INVALID_ARGUMENT,
                             fmt::format("malformed {} '{}'", field, value)});
}

}  // namespace

service::service(zone::execution::engine& engine) : engine_{engine} {}

grpc::ServerUnaryReactor* service::Info(grpc::CallbackServerContext* context,
                                        const zone::v1::InfoRequest*,
                                        zone::v1::InfoResponse* response) {
  to_proto(engine_.info(), response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* service::Submit(
    grpc::CallbackServerContext* context,
    const zone::v1::SubmitRequest* request,
    zone::v1::SubmitResponse* response) {
  auto submission = from_proto(*request);
  if (!submission.ok()) {
    spdlog::debug("Submit rejected: {}", submission.log);
    return finish(context, to_status(submission));
  }
  auto recorded = engine_.submit(*submission.value);
  if (!recorded.ok()) {
    return finish(context, to_status(recorded));
  }
  to_proto(*recorded.value, response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* service::GetAttestation(
    grpc::CallbackServerContext* context,
    const zone::v1::GetAttestationRequest* request,
    zone::v1::GetAttestationResponse* response) {
  auto id = try_make_hash32(std::string_view{request->attestation_id()});
  if (!id) {
    return finish_invalid(context, "attestation_id", request->attestation_id());
  }
  auto record = request->anchored() ? engine_.serve_record(*id)
                                    : engine_.get_attestation(*id);
  if (!record.ok()) {
    return finish(context, to_status(record));
  }
  to_proto(*record.value, response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* service::CurrentRoot(
    grpc::CallbackServerContext* context,
    const zone::v1::CurrentRootRequest*,
    zone::v1::CurrentRootResponse* response) {
  to_proto(engine_.current_root(), response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* service::VerifyCitation(
    grpc::CallbackServerContext* context,
    const zone::v1::VerifyCitationRequest* request,
    zone::v1::VerifyCitationResponse* response) {
  auto citing_id = try_make_hash32(std::string_view{request->citing_id()});
  if (!citing_id) {
    return finish_invalid(context, "citing_id", request->citing_id());
  }
  auto cited_id = try_make_hash32(std::string_view{request->cited_id()});
  if (!cited_id) {
    return finish_invalid(context, "cited_id", request->cited_id());
  }
  if (request->cited_endpoint().empty()) {
    return finish_invalid(context, "cited_endpoint", request->cited_endpoint());
  }
  to_proto(engine_.verify_citation(*citing_id, *cited_id,
                                   request->cited_endpoint()),
           response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* service::RecordAnchor(
    grpc::CallbackServerContext* context,
    const zone::v1::RecordAnchorRequest* request,
    zone::v1::RecordAnchorResponse* response) {
  if (!request->has_anchor()) {
    return finish(context, grpc::Status{grpc::StatusCode::INVALID_ARGUMENT,
                                        "anchor is required"});
  }
  auto anchor = from_proto(request->anchor());
  if (!anchor.ok()) {
    return finish(context, to_status(anchor));
  }
  auto recorded = engine_.record_anchor(std::move(*anchor.value));
  if (!recorded.ok()) {
    return finish(context, to_status(recorded));
  }
  to_proto(*recorded.value, response->mutable_anchor());
  return finish_ok(context);
}

}  // namespace zone::rpc
