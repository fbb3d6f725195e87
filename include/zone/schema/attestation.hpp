#pragma once

#include <zone/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: attestation.
// A signed, immutable statement that a zone recorded `claim_hash` under
// `canon_id` at `timestamp`. Citations are kept in canonical (sorted, unique)
// order.
namespace zone::schema {

template <uint16_t Version>
struct attestation;

template <>
struct attestation<1> final {
  uint16_t version{1};
  attestation_id_t attestation_id{};
  zone_id_t zone_id{};
  canon_id_t canon_id{};
  hash32_t claim_hash{};
  hash32_t evidence_hash{};
  std::optional<std::string> evidence_location;
  std::vector<attestation_id_t> citations;
  timestamp_seconds_t timestamp{};
  signer_id_t signer;
  signature_t signature;
};

using attestation_t = attestation<1>;

}  // namespace zone::schema
