#pragma once

#include <zone/schema/primitives.hpp>
#include <string_view>

namespace zone::crypto {

/// The protocol hash `H`: SHA-256.
zone::schema::hash32_t sha256(const zone::schema::bytes_view_t& bytes);
zone::schema::hash32_t sha256(const std::string_view& text);

/// H(left || right).
zone::schema::hash32_t sha256_pair(const zone::schema::hash32_t& left,
                                   const zone::schema::hash32_t& right);

/// Genesis constant: H("").
const zone::schema::hash32_t& glsr();

/// H of the UTF-8 bytes of `text`. Used for claim and evidence hashes.
zone::schema::hash32_t compute_hash(const std::string_view& text);

inline constexpr auto kDefaultCanonName = std::string_view{"timestamp"};
inline constexpr auto kDefaultCanonVersion = std::string_view{"1.0"};

/// H("name:version").
zone::schema::canon_id_t compute_canon_id(const std::string_view& name,
                                          const std::string_view& version);

}  // namespace zone::crypto
