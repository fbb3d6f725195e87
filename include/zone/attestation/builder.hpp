#pragma once

#include <zone/crypto/identity.hpp>
#include <zone/schema/attestation.hpp>
#include <zone/schema/primitives.hpp>
#include <zone/schema/result.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace zone::attestation {

/// H(zone_id || canon_id || claim_hash || timestamp as 8 bytes big-endian).
zone::schema::attestation_id_t compute_attestation_id(
    const zone::schema::zone_id_t& zone_id,
    const zone::schema::canon_id_t& canon_id,
    const zone::schema::hash32_t& claim_hash,
    zone::schema::timestamp_seconds_t timestamp);

/// Citations sorted ascending with duplicates removed. Every hash-valued
/// citation list is normalized through here before it is hashed or stored.
std::vector<zone::schema::attestation_id_t> canonical_citations(
    std::vector<zone::schema::attestation_id_t> citations);

/// H("") for no citations, otherwise H of the concatenated lowercase hex of
/// the canonical list.
zone::schema::hash32_t compute_citations_hash(
    const std::vector<zone::schema::attestation_id_t>& citations);

/// attestation_id || claim_hash || evidence_hash || timestamp_bytes ||
/// citations_hash.
zone::schema::bytes_t signing_preimage(
    const zone::schema::attestation_id_t& attestation_id,
    const zone::schema::hash32_t& claim_hash,
    const zone::schema::hash32_t& evidence_hash,
    zone::schema::timestamp_seconds_t timestamp,
    const std::vector<zone::schema::attestation_id_t>& citations);

/// Build and sign an attestation. Pure: nothing is appended anywhere.
zone::schema::result<zone::schema::attestation_t> build(
    const zone::crypto::identity& identity,
    const zone::schema::canon_id_t& canon_id,
    const zone::schema::hash32_t& claim_hash,
    const zone::schema::hash32_t& evidence_hash,
    const std::optional<std::string>& evidence_location,
    const std::vector<zone::schema::attestation_id_t>& citations,
    int64_t timestamp);

/// Boundary form of `build`: every hash is 64 hex characters.
zone::schema::result<zone::schema::attestation_t> build_from_hex(
    const zone::crypto::identity& identity,
    std::string_view canon_id,
    std::string_view claim_hash,
    std::string_view evidence_hash,
    const std::optional<std::string>& evidence_location,
    const std::vector<std::string>& citations,
    int64_t timestamp);

enum class verification_outcome : uint8_t {
  valid = 0,
  zone_mismatch = 1,
  id_mismatch = 2,
  bad_signature = 3
};

/// Recheck everything an attestation claims about itself: the zone id is
/// derived from the attached key, the id re-derives, and the signature covers
/// the preimage.
verification_outcome verify_attestation(
    const zone::schema::attestation_t& attestation);

}  // namespace zone::attestation
