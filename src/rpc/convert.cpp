#include <zone/crypto/identity.hpp>
#include <zone/merkle/tree.hpp>
#include <zone/rpc/convert.hpp>

#include <fmt/format.h>

using namespace zone::schema;

namespace zone::rpc {

namespace {

template <typename T>
result<T> malformed(const std::string_view field, const std::string& value) {
  return make_error<T>(error_code::invalid_input,
                       fmt::format("malformed {} '{}'", field, value));
}

std::optional<std::vector<hash32_t>> try_make_hashes(
    const google::protobuf::RepeatedPtrField<std::string>& values) {
  auto hashes = std::vector<hash32_t>{};
  hashes.reserve(static_cast<std::size_t>(values.size()));
  for (const auto& value : values) {
    auto hash = try_make_hash32(std::string_view{value});
    if (!hash) {
      return std::nullopt;
    }
    hashes.push_back(*hash);
  }
  return hashes;
}

}  // namespace

void to_proto(const attestation_t& source, zone::v1::Attestation* destination) {
  destination->set_attestation_id(to_hex(source.attestation_id));
  destination->set_zone_id(to_hex(source.zone_id));
  destination->set_canon_id(to_hex(source.canon_id));
  destination->set_claim_hash(to_hex(source.claim_hash));
  destination->set_evidence_hash(to_hex(source.evidence_hash));
  if (source.evidence_location) {
    destination->set_evidence_location(*source.evidence_location);
  }
  for (const auto& citation : source.citations) {
    destination->add_citations(to_hex(citation));
  }
  destination->set_timestamp(source.timestamp);
  destination->set_key_type(std::string{zone::crypto::to_string(
      zone::crypto::algorithm_of(source.signer))});
  destination->set_public_key(to_hex(public_key_bytes(source.signer)));
  destination->set_signature(to_base64(signature_bytes(source.signature)));
}

void to_proto(const merkle_proof_t& source,
              zone::v1::MerkleProof* destination) {
  destination->set_leaf_hash(to_hex(source.leaf_hash));
  destination->set_leaf_index(source.leaf_index);
  for (const auto& step : source.siblings) {
    destination->add_siblings(zone::merkle::to_string(step));
  }
  destination->set_root(to_hex(source.root));
}

void to_proto(const anchor_t& source, zone::v1::Anchor* destination) {
  destination->set_merkle_root(to_hex(source.merkle_root));
  destination->set_anchor_type(std::string{to_string(source.type)});
  destination->set_external_timestamp(source.external_timestamp);
  destination->set_reference(source.reference);
}

void to_proto(const served_record_t& source,
              zone::v1::GetAttestationResponse* destination) {
  to_proto(source.attestation, destination->mutable_attestation());
  to_proto(source.proof, destination->mutable_proof());
  if (source.anchor) {
    to_proto(*source.anchor, destination->mutable_anchor());
  }
}

void to_proto(const served_record_t& source,
              zone::v1::SubmitResponse* destination) {
  to_proto(source.attestation, destination->mutable_attestation());
  to_proto(source.proof, destination->mutable_proof());
  if (source.anchor) {
    to_proto(*source.anchor, destination->mutable_anchor());
  }
}

void to_proto(const root_info_t& source,
              zone::v1::CurrentRootResponse* destination) {
  destination->set_root(to_hex(source.root));
  destination->set_leaf_count(source.leaf_count);
  if (source.last_anchor) {
    to_proto(*source.last_anchor, destination->mutable_last_anchor());
  }
}

void to_proto(const citation_check_t& source,
              zone::v1::VerifyCitationResponse* destination) {
  destination->set_valid(source.valid());
  destination->set_reason(std::string{to_string(source.reason)});
  if (source.cited_anchor) {
    to_proto(*source.cited_anchor, destination->mutable_cited_anchor());
  }
  if (source.citing_anchor) {
    to_proto(*source.citing_anchor, destination->mutable_citing_anchor());
  }
}

void to_proto(const zone_info_t& source, zone::v1::InfoResponse* destination) {
  destination->set_zone_id(to_hex(source.zone_id));
  destination->set_name(source.name);
  destination->set_description(source.description);
  destination->set_public_key(source.public_key_hex);
  destination->set_key_type(source.key_type);
  for (const auto& canon : source.canons) {
    destination->add_canons(canon);
  }
  destination->set_glsr(to_hex(source.glsr));
  destination->set_api_version(source.api_version);
}

result<attestation_t> from_proto(const zone::v1::Attestation& source) {
  auto attestation = attestation_t{};
  auto id = try_make_hash32(std::string_view{source.attestation_id()});
  if (!id) {
    return malformed<attestation_t>("attestation_id", source.attestation_id());
  }
  auto zone_id = try_make_hash32(std::string_view{source.zone_id()});
  if (!zone_id) {
    return malformed<attestation_t>("zone_id", source.zone_id());
  }
  auto canon_id = try_make_hash32(std::string_view{source.canon_id()});
  if (!canon_id) {
    return malformed<attestation_t>("canon_id", source.canon_id());
  }
  auto claim_hash = try_make_hash32(std::string_view{source.claim_hash()});
  if (!claim_hash) {
    return malformed<attestation_t>("claim_hash", source.claim_hash());
  }
  auto evidence_hash = try_make_hash32(std::string_view{source.evidence_hash()});
  if (!evidence_hash) {
    return malformed<attestation_t>("evidence_hash", source.evidence_hash());
  }
  auto citations = try_make_hashes(source.citations());
  if (!citations) {
    return make_error<attestation_t>(error_code::invalid_input,
                                     "malformed citation list");
  }
  auto public_key = try_from_hex(source.public_key());
  auto signer = public_key ? try_make_signer_id(source.key_type(),
                                                make_bytes_view(*public_key))
                           : std::nullopt;
  if (!signer) {
    return malformed<attestation_t>("public_key", source.public_key());
  }
  auto raw_signature = try_from_base64(source.signature());
  auto signature = raw_signature
                       ? try_make_signature(make_bytes_view(*raw_signature))
                       : std::nullopt;
  if (!signature) {
    return malformed<attestation_t>("signature", source.signature());
  }

  attestation.attestation_id = *id;
  attestation.zone_id = *zone_id;
  attestation.canon_id = *canon_id;
  attestation.claim_hash = *claim_hash;
  attestation.evidence_hash = *evidence_hash;
  if (source.has_evidence_location()) {
    attestation.evidence_location = source.evidence_location();
  }
  attestation.citations = std::move(*citations);
  attestation.timestamp = source.timestamp();
  attestation.signer = *signer;
  attestation.signature = *signature;
  return make_result(std::move(attestation));
}

result<merkle_proof_t> from_proto(const zone::v1::MerkleProof& source) {
  auto leaf_hash = try_make_hash32(std::string_view{source.leaf_hash()});
  if (!leaf_hash) {
    return malformed<merkle_proof_t>("leaf_hash", source.leaf_hash());
  }
  auto root = try_make_hash32(std::string_view{source.root()});
  if (!root) {
    return malformed<merkle_proof_t>("root", source.root());
  }
  auto proof = merkle_proof_t{};
  proof.leaf_hash = *leaf_hash;
  proof.leaf_index = source.leaf_index();
  proof.root = *root;
  for (const auto& token : source.siblings()) {
    auto step = zone::merkle::parse_step(token);
    if (!step.ok()) {
      return make_error<merkle_proof_t>(step.code, std::move(step.log));
    }
    proof.siblings.push_back(std::move(*step.value));
  }
  return make_result(std::move(proof));
}

result<anchor_t> from_proto(const zone::v1::Anchor& source) {
  auto root = try_make_hash32(std::string_view{source.merkle_root()});
  if (!root) {
    return malformed<anchor_t>("merkle_root", source.merkle_root());
  }
  auto type = try_make_anchor_type(source.anchor_type());
  if (!type) {
    return malformed<anchor_t>("anchor_type", source.anchor_type());
  }
  auto anchor = anchor_t{};
  anchor.merkle_root = *root;
  anchor.type = *type;
  anchor.external_timestamp = source.external_timestamp();
  anchor.reference = source.reference();
  return make_result(std::move(anchor));
}

result<served_record_t> from_proto(
    const zone::v1::GetAttestationResponse& source) {
  if (!source.has_attestation() || !source.has_proof()) {
    return make_error<served_record_t>(
        error_code::invalid_input, "response lacks the attestation or proof");
  }
  auto attestation = from_proto(source.attestation());
  if (!attestation.ok()) {
    return make_error<served_record_t>(attestation.code,
                                       std::move(attestation.log));
  }
  auto proof = from_proto(source.proof());
  if (!proof.ok()) {
    return make_error<served_record_t>(proof.code, std::move(proof.log));
  }
  auto record = served_record_t{};
  record.attestation = std::move(*attestation.value);
  record.proof = std::move(*proof.value);
  if (source.has_anchor()) {
    auto anchor = from_proto(source.anchor());
    if (!anchor.ok()) {
      return make_error<served_record_t>(anchor.code, std::move(anchor.log));
    }
    record.anchor = std::move(anchor.value);
  }
  return make_result(std::move(record));
}

result<submission_t> from_proto(const zone::v1::SubmitRequest& source) {
  auto canon_id = try_make_hash32(std::string_view{source.canon_id()});
  if (!canon_id) {
    return malformed<submission_t>("canon_id", source.canon_id());
  }
  auto claim_hash = try_make_hash32(std::string_view{source.claim_hash()});
  if (!claim_hash) {
    return malformed<submission_t>("claim_hash", source.claim_hash());
  }
  auto evidence_hash = try_make_hash32(std::string_view{source.evidence_hash()});
  if (!evidence_hash) {
    return malformed<submission_t>("evidence_hash", source.evidence_hash());
  }
  auto citations = try_make_hashes(source.citations());
  if (!citations) {
    return make_error<submission_t>(error_code::invalid_input,
                                    "malformed citation list");
  }
  auto submission = submission_t{};
  submission.canon_id = *canon_id;
  submission.claim_hash = *claim_hash;
  submission.evidence_hash = *evidence_hash;
  if (source.has_evidence_location()) {
    submission.evidence_location = source.evidence_location();
  }
  submission.citations = std::move(*citations);
  return make_result(std::move(submission));
}

grpc::Status to_status(const error_code code, const std::string& log) {
  switch (code) {
    case error_code::ok:
      return grpc::Status::OK;
    case error_code::invalid_input:
    case error_code::verification_failure:
      return grpc::Status{grpc::StatusCode::INVALID_ARGUMENT, log};
    case error_code::duplicate_attestation:
      return grpc::Status{grpc::StatusCode::ALREADY_EXISTS, log};
    case error_code::not_found:
      return grpc::Status{grpc::StatusCode::NOT_FOUND, log};
    case error_code::unreachable_collaborator:
      return grpc::Status{grpc::StatusCode::UNAVAILABLE, log};
    case error_code::identity:
      return grpc::Status{grpc::StatusCode::FAILED_PRECONDITION, log};
  }
  return grpc::Status{grpc::StatusCode::UNKNOWN, log};
}

}  // namespace zone::rpc
