#pragma once

#include <zone/schema/anchor.hpp>
#include <zone/schema/primitives.hpp>
#include <cstdint>
#include <optional>

// Schema type: root info.
// A ledger root together with the number of leaves it covers. The leaf count
// doubles as the root's version: version N is the root after N appends.
namespace zone::schema {

template <uint16_t Version>
struct root_info;

template <>
struct root_info<1> final {
  uint16_t version{1};
  hash32_t root{};
  uint64_t leaf_count{};
  std::optional<anchor_t> last_anchor;
};

using root_info_t = root_info<1>;

}  // namespace zone::schema
