#pragma once

#include <zone/schema/anchor.hpp>
#include <zone/schema/attestation.hpp>
#include <zone/schema/citation_check.hpp>
#include <zone/schema/error_code.hpp>
#include <zone/schema/merkle_proof.hpp>
#include <zone/schema/result.hpp>
#include <zone/schema/root_info.hpp>
#include <zone/schema/served_record.hpp>
#include <zone/schema/submission.hpp>
#include <zone/schema/zone_info.hpp>
#include <zone/v1/zone.pb.h>

#include <grpcpp/support/status.h>

#include <string>

// Conversions between schema types and their zone.v1 wire messages. Decoding
// never trusts the peer: every hash, key and signature is length-checked.
namespace zone::rpc {

void to_proto(const zone::schema::attestation_t& source,
              zone::v1::Attestation* destination);
void to_proto(const zone::schema::merkle_proof_t& source,
              zone::v1::MerkleProof* destination);
void to_proto(const zone::schema::anchor_t& source,
              zone::v1::Anchor* destination);
void to_proto(const zone::schema::served_record_t& source,
              zone::v1::GetAttestationResponse* destination);
void to_proto(const zone::schema::served_record_t& source,
              zone::v1::SubmitResponse* destination);
void to_proto(const zone::schema::root_info_t& source,
              zone::v1::CurrentRootResponse* destination);
void to_proto(const zone::schema::citation_check_t& source,
              zone::v1::VerifyCitationResponse* destination);
void to_proto(const zone::schema::zone_info_t& source,
              zone::v1::InfoResponse* destination);

zone::schema::result<zone::schema::attestation_t> from_proto(
    const zone::v1::Attestation& source);
zone::schema::result<zone::schema::merkle_proof_t> from_proto(
    const zone::v1::MerkleProof& source);
zone::schema::result<zone::schema::anchor_t> from_proto(
    const zone::v1::Anchor& source);
zone::schema::result<zone::schema::served_record_t> from_proto(
    const zone::v1::GetAttestationResponse& source);
zone::schema::result<zone::schema::submission_t> from_proto(
    const zone::v1::SubmitRequest& source);

/// invalid_input -> INVALID_ARGUMENT, duplicate_attestation -> ALREADY_EXISTS,
/// not_found -> NOT_FOUND, unreachable_collaborator -> UNAVAILABLE,
/// identity -> FAILED_PRECONDITION, verification_failure -> INVALID_ARGUMENT.
grpc::Status to_status(zone::schema::error_code code, const std::string& log);

template <typename T>
grpc::Status to_status(const zone::schema::result<T>& result) {
  return to_status(result.code, result.log);
}

}  // namespace zone::rpc
