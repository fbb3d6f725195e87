#include <zone/attestation/builder.hpp>
#include <zone/crypto/hash.hpp>
#include <zone/crypto/verify.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

using namespace zone::schema;

namespace zone::attestation {

attestation_id_t compute_attestation_id(const zone_id_t& zone_id,
                                        const canon_id_t& canon_id,
                                        const hash32_t& claim_hash,
                                        const timestamp_seconds_t timestamp) {
  auto preimage = bytes_t{};
  preimage.reserve(32 * 3 + 8);
  preimage.insert(std::end(preimage), std::begin(zone_id), std::end(zone_id));
  preimage.insert(std::end(preimage), std::begin(canon_id), std::end(canon_id));
  preimage.insert(std::end(preimage), std::begin(claim_hash),
                  std::end(claim_hash));
  auto ts = timestamp_bytes(timestamp);
  preimage.insert(std::end(preimage), std::begin(ts), std::end(ts));
  return zone::crypto::sha256(make_bytes_view(preimage));
}

std::vector<attestation_id_t> canonical_citations(
    std::vector<attestation_id_t> citations) {
  std::ranges::sort(citations);
  auto duplicates = std::ranges::unique(citations);
  citations.erase(duplicates.begin(), duplicates.end());
  return citations;
}

hash32_t compute_citations_hash(const std::vector<attestation_id_t>& citations) {
  if (citations.empty()) {
    return zone::crypto::glsr();
  }
  auto canonical = canonical_citations(citations);
  auto joined = std::string{};
  joined.reserve(canonical.size() * 64);
  for (const auto& citation : canonical) {
    joined += to_hex(citation);
  }
  return zone::crypto::sha256(std::string_view{joined});
}

bytes_t signing_preimage(const attestation_id_t& attestation_id,
                         const hash32_t& claim_hash,
                         const hash32_t& evidence_hash,
                         const timestamp_seconds_t timestamp,
                         const std::vector<attestation_id_t>& citations) {
  auto citations_hash = compute_citations_hash(citations);
  auto ts = timestamp_bytes(timestamp);
  auto preimage = bytes_t{};
  preimage.reserve(32 * 4 + 8);
  preimage.insert(std::end(preimage), std::begin(attestation_id),
                  std::end(attestation_id));
  preimage.insert(std::end(preimage), std::begin(claim_hash),
                  std::end(claim_hash));
  preimage.insert(std::end(preimage), std::begin(evidence_hash),
                  std::end(evidence_hash));
  preimage.insert(std::end(preimage), std::begin(ts), std::end(ts));
  preimage.insert(std::end(preimage), std::begin(citations_hash),
                  std::end(citations_hash));
  return preimage;
}

result<attestation_t> build(const zone::crypto::identity& identity,
                            const canon_id_t& canon_id,
                            const hash32_t& claim_hash,
                            const hash32_t& evidence_hash,
                            const std::optional<std::string>& evidence_location,
                            const std::vector<attestation_id_t>& citations,
                            const int64_t timestamp) {
  if (timestamp < 0) {
    return make_error<attestation_t>(error_code::invalid_input,
                                     "timestamp must be non-negative");
  }
  if (!identity.has_private_key()) {
    return make_error<attestation_t>(error_code::identity,
                                     "identity cannot sign");
  }

  auto attestation = attestation_t{};
  attestation.zone_id = identity.zone_id();
  attestation.canon_id = canon_id;
  attestation.claim_hash = claim_hash;
  attestation.evidence_hash = evidence_hash;
  attestation.evidence_location = evidence_location;
  attestation.citations = canonical_citations(citations);
  attestation.timestamp = static_cast<timestamp_seconds_t>(timestamp);
  attestation.signer = identity.signer();
  attestation.attestation_id =
      compute_attestation_id(attestation.zone_id, canon_id, claim_hash,
                             attestation.timestamp);

  auto preimage = signing_preimage(attestation.attestation_id, claim_hash,
                                   evidence_hash, attestation.timestamp,
                                   attestation.citations);
  auto signed_preimage = identity.sign(make_bytes_view(preimage));
  if (!signed_preimage.ok()) {
    return make_error<attestation_t>(signed_preimage.code,
                                     std::move(signed_preimage.log));
  }
  attestation.signature = std::move(*signed_preimage.value);
  return make_result(std::move(attestation));
}

result<attestation_t> build_from_hex(
    const zone::crypto::identity& identity,
    const std::string_view canon_id,
    const std::string_view claim_hash,
    const std::string_view evidence_hash,
    const std::optional<std::string>& evidence_location,
    const std::vector<std::string>& citations,
    const int64_t timestamp) {
  auto canon = try_make_hash32(canon_id);
  auto claim = try_make_hash32(claim_hash);
  auto evidence = try_make_hash32(evidence_hash);
  if (!canon || !claim || !evidence) {
    return make_error<attestation_t>(
        error_code::invalid_input,
        "canon_id, claim_hash and evidence_hash must be 64 hex characters");
  }
  auto parsed = std::vector<attestation_id_t>{};
  parsed.reserve(citations.size());
  for (const auto& citation : citations) {
    auto id = try_make_hash32(citation);
    if (!id) {
      return make_error<attestation_t>(
          error_code::invalid_input,
          fmt::format("malformed citation '{}'", citation));
    }
    parsed.push_back(*id);
  }
  return build(identity, *canon, *claim, *evidence, evidence_location, parsed,
               timestamp);
}

verification_outcome verify_attestation(const attestation_t& attestation) {
  if (zone::crypto::derive_zone_id(attestation.signer) != attestation.zone_id) {
    return verification_outcome::zone_mismatch;
  }
  auto expected_id =
      compute_attestation_id(attestation.zone_id, attestation.canon_id,
                             attestation.claim_hash, attestation.timestamp);
  if (expected_id != attestation.attestation_id) {
    return verification_outcome::id_mismatch;
  }
  auto preimage = signing_preimage(
      attestation.attestation_id, attestation.claim_hash,
      attestation.evidence_hash, attestation.timestamp, attestation.citations);
  if (!zone::crypto::verify_signature(make_bytes_view(preimage),
                                      attestation.signer,
                                      attestation.signature)) {
    return verification_outcome::bad_signature;
  }
  return verification_outcome::valid;
}

}  // namespace zone::attestation
