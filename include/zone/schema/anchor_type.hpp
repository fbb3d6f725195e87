#pragma once

#include <zone/schema/enum_string.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema type: anchor type.
// External mechanism that timestamped a merkle root.
namespace zone::schema {

enum class anchor_type : uint8_t {
  bitcoin = 0,
  opentimestamps = 1,
  ipfs = 2,
  nist_beacon = 3,
  drand = 4,
  newspaper = 5,
  human_witness = 6,
  other = 7
};

inline constexpr auto kAnchorTypeNames =
    std::array<std::pair<std::string_view, anchor_type>, 8>{
        {{"bitcoin", anchor_type::bitcoin},
         {"opentimestamps", anchor_type::opentimestamps},
         {"ipfs", anchor_type::ipfs},
         {"nist_beacon", anchor_type::nist_beacon},
         {"drand", anchor_type::drand},
         {"newspaper", anchor_type::newspaper},
         {"human_witness", anchor_type::human_witness},
         {"other", anchor_type::other}}};

constexpr std::optional<anchor_type> try_make_anchor_type(
    const std::string_view name) {
  return from_string(name, kAnchorTypeNames);
}

constexpr std::string_view to_string(const anchor_type type) {
  return to_string(type, kAnchorTypeNames).value_or("other");
}

}  // namespace zone::schema
