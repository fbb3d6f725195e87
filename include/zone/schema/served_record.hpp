#pragma once

#include <zone/schema/anchor.hpp>
#include <zone/schema/attestation.hpp>
#include <zone/schema/merkle_proof.hpp>
#include <cstdint>
#include <optional>

// Schema type: served record.
// What a zone hands to a remote verifier: the attestation, its inclusion
// proof and the anchor over the proof's root, if any.
namespace zone::schema {

template <uint16_t Version>
struct served_record;

template <>
struct served_record<1> final {
  uint16_t version{1};
  attestation_t attestation;
  merkle_proof_t proof;
  std::optional<anchor_t> anchor;
};

using served_record_t = served_record<1>;

}  // namespace zone::schema
