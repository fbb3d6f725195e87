#pragma once

#include <zone/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

// Schema type: merkle proof.
// Inclusion proof of `leaf_hash` at `leaf_index` in the tree whose root is
// `root`. Siblings run from the leaf layer upwards.
namespace zone::schema {

/// Stands in for a sibling equal to the running hash (the `*` token).
struct duplicate_sibling final {
  bool operator==(const duplicate_sibling&) const = default;
};

using proof_step_t = std::variant<hash32_t, duplicate_sibling>;

inline constexpr auto kDuplicateSiblingToken = std::string_view{"*"};

template <uint16_t Version>
struct merkle_proof;

template <>
struct merkle_proof<1> final {
  uint16_t version{1};
  hash32_t leaf_hash{};
  uint64_t leaf_index{};
  std::vector<proof_step_t> siblings;
  hash32_t root{};
};

using merkle_proof_t = merkle_proof<1>;

}  // namespace zone::schema
