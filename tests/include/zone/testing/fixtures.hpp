#pragma once

#include <zone/attestation/builder.hpp>
#include <zone/crypto/hash.hpp>
#include <zone/crypto/identity.hpp>
#include <zone/schema/attestation.hpp>
#include <zone/testing/common.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace zone::testing {

inline constexpr auto kEd25519Secret = std::string_view{
    "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60"};
inline constexpr auto kOtherEd25519Secret = std::string_view{
    "4ccd089b28ff96da9db6c346ec114e0f5b8a319f35aba624da8cf6ed4fb8a6fb"};

inline zone::crypto::identity make_identity(
    const std::string_view secret = kEd25519Secret) {
  auto identity = zone::crypto::identity::from_private_hex(
      zone::crypto::key_algorithm::ed25519, secret);
  EXPECT_TRUE(identity.ok()) << identity.log;
  return std::move(*identity.value);
}

/// Signed attestation over claim `make_hash(seed)` in the default canon.
inline zone::schema::attestation_t make_attestation(
    const zone::crypto::identity& identity,
    const uint8_t seed,
    const int64_t timestamp = 1700000000,
    const std::vector<zone::schema::attestation_id_t>& citations = {}) {
  auto built = zone::attestation::build(
      identity,
      zone::crypto::compute_canon_id(zone::crypto::kDefaultCanonName,
                                     zone::crypto::kDefaultCanonVersion),
      make_hash(seed),
      make_hash(static_cast<uint8_t>(seed + 100)), std::nullopt, citations,
      timestamp);
  EXPECT_TRUE(built.ok()) << built.log;
  return std::move(*built.value);
}

}  // namespace zone::testing
