#pragma once

#include <zone/schema/anchor.hpp>
#include <zone/schema/enum_string.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema type: citation check.
// Terminal state of one cross-zone citation check and the reason it ended
// there.
namespace zone::schema {

enum class citation_status : uint8_t { invalid = 0, valid = 1 };

enum class citation_reason : uint8_t {
  verified = 0,
  citing_unknown = 1,
  citation_not_listed = 2,
  cited_not_found = 3,
  cited_unreachable = 4,
  malformed_response = 5,
  leaf_mismatch = 6,
  proof_invalid = 7,
  attestation_invalid = 8,
  cited_unanchored = 9,
  anchor_root_mismatch = 10,
  citing_unanchored = 11,
  ordering_violation = 12
};

inline constexpr auto kCitationReasonNames =
    std::array<std::pair<std::string_view, citation_reason>, 13>{
        {{"verified", citation_reason::verified},
         {"citing_unknown", citation_reason::citing_unknown},
         {"citation_not_listed", citation_reason::citation_not_listed},
         {"cited_not_found", citation_reason::cited_not_found},
         {"cited_unreachable", citation_reason::cited_unreachable},
         {"malformed_response", citation_reason::malformed_response},
         {"leaf_mismatch", citation_reason::leaf_mismatch},
         {"proof_invalid", citation_reason::proof_invalid},
         {"attestation_invalid", citation_reason::attestation_invalid},
         {"cited_unanchored", citation_reason::cited_unanchored},
         {"anchor_root_mismatch", citation_reason::anchor_root_mismatch},
         {"citing_unanchored", citation_reason::citing_unanchored},
         {"ordering_violation", citation_reason::ordering_violation}}};

constexpr std::string_view to_string(const citation_reason reason) {
  return to_string(reason, kCitationReasonNames).value_or("unknown");
}

template <uint16_t Version>
struct citation_check;

template <>
struct citation_check<1> final {
  uint16_t version{1};
  citation_status status{citation_status::invalid};
  citation_reason reason{citation_reason::cited_not_found};
  std::optional<anchor_t> cited_anchor;
  std::optional<anchor_t> citing_anchor;

  bool valid() const { return status == citation_status::valid; }
};

using citation_check_t = citation_check<1>;

}  // namespace zone::schema
