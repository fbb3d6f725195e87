#pragma once

#include <zone/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: submission.
// A client's request to record a claim. The zone supplies identity and time.
namespace zone::schema {

template <uint16_t Version>
struct submission;

template <>
struct submission<1> final {
  uint16_t version{1};
  canon_id_t canon_id{};
  hash32_t claim_hash{};
  hash32_t evidence_hash{};
  std::optional<std::string> evidence_location;
  std::vector<attestation_id_t> citations;
};

using submission_t = submission<1>;

}  // namespace zone::schema
