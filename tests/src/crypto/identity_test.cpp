#include <gtest/gtest.h>
#include <zone/crypto/hash.hpp>
#include <zone/crypto/identity.hpp>
#include <zone/crypto/verify.hpp>
#include <zone/testing/common.hpp>

#include <filesystem>
#include <string>

namespace {

constexpr auto kRfc8032Secret =
    "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60";
constexpr auto kRfc8032Public =
    "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a";
constexpr auto kSecp256k1One =
    "0000000000000000000000000000000000000000000000000000000000000001";
constexpr auto kSecp256k1Generator =
    "0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798";

}  // namespace

TEST(identity, ed25519_private_hex_derives_public_key_and_zone_id) {
  if (!zone::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto identity = zone::crypto::identity::from_private_hex(
      zone::crypto::key_algorithm::ed25519, kRfc8032Secret);
  ASSERT_TRUE(identity.ok()) << identity.log;
  EXPECT_EQ(identity.value->public_key_hex(), kRfc8032Public);
  EXPECT_EQ(identity.value->algorithm(), zone::crypto::key_algorithm::ed25519);
  EXPECT_EQ(identity.value->zone_id(),
            zone::crypto::sha256(
                zone::schema::public_key_bytes(identity.value->signer())));
  EXPECT_EQ(identity.value->zone_id(),
            zone::crypto::derive_zone_id(identity.value->signer()));

  auto empty = zone::schema::bytes_t{};
  auto signature = identity.value->sign(zone::schema::make_bytes_view(empty));
  ASSERT_TRUE(signature.ok());
  EXPECT_EQ(zone::schema::to_hex(zone::schema::signature_bytes(*signature.value)),
            "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e06522490155"
            "5fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b");
}

TEST(identity, secp256k1_private_hex_derives_compressed_public_key) {
  if (!zone::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto identity = zone::crypto::identity::from_private_hex(
      zone::crypto::key_algorithm::secp256k1, kSecp256k1One);
  ASSERT_TRUE(identity.ok()) << identity.log;
  EXPECT_EQ(identity.value->public_key_hex(), kSecp256k1Generator);
  EXPECT_EQ(identity.value->algorithm(),
            zone::crypto::key_algorithm::secp256k1);
}

TEST(identity, signatures_verify_for_both_algorithms) {
  if (!zone::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  for (auto algorithm : {zone::crypto::key_algorithm::ed25519,
                         zone::crypto::key_algorithm::secp256k1}) {
    auto identity = zone::crypto::identity::generate(algorithm);
    ASSERT_TRUE(identity.ok()) << identity.log;
    auto message = zone::schema::bytes_t{'c', 'l', 'a', 'i', 'm'};
    auto signature = identity.value->sign(zone::schema::make_bytes_view(message));
    ASSERT_TRUE(signature.ok()) << signature.log;
    EXPECT_TRUE(zone::crypto::verify_signature(
        zone::schema::make_bytes_view(message), identity.value->signer(),
        *signature.value));

    message.back() ^= 0x01;
    EXPECT_FALSE(zone::crypto::verify_signature(
        zone::schema::make_bytes_view(message), identity.value->signer(),
        *signature.value));
  }
}

TEST(identity, public_only_identity_cannot_sign) {
  if (!zone::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto generated =
      zone::crypto::identity::generate(zone::crypto::key_algorithm::ed25519);
  ASSERT_TRUE(generated.ok());
  auto verifier = zone::crypto::identity::from_public(generated.value->signer());
  EXPECT_FALSE(verifier.has_private_key());
  EXPECT_EQ(verifier.zone_id(), generated.value->zone_id());

  auto message = zone::schema::bytes_t{'x'};
  auto signature = verifier.sign(zone::schema::make_bytes_view(message));
  EXPECT_FALSE(signature.ok());
  EXPECT_EQ(signature.code, zone::schema::error_code::identity);
}

TEST(identity, rejects_malformed_private_hex) {
  auto short_key = zone::crypto::identity::from_private_hex(
      zone::crypto::key_algorithm::ed25519, "abcd");
  EXPECT_EQ(short_key.code, zone::schema::error_code::invalid_input);
  auto not_hex = zone::crypto::identity::from_private_hex(
      zone::crypto::key_algorithm::ed25519, std::string(64, 'z'));
  EXPECT_EQ(not_hex.code, zone::schema::error_code::invalid_input);
}

TEST(identity, pem_round_trip_preserves_zone_id) {
  if (!zone::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto directory = zone::testing::make_db_path("zone_identity_pem");
  for (auto algorithm : {zone::crypto::key_algorithm::ed25519,
                         zone::crypto::key_algorithm::secp256k1}) {
    auto identity = zone::crypto::identity::generate(algorithm);
    ASSERT_TRUE(identity.ok());
    auto path = directory + "/keys/" +
                std::string{zone::crypto::to_string(algorithm)} + ".pem";
    ASSERT_TRUE(identity.value->save_pem(path, path + ".pub"));
    EXPECT_TRUE(std::filesystem::exists(path + ".pub"));

    auto permissions = std::filesystem::status(path).permissions();
    EXPECT_EQ(permissions & std::filesystem::perms::group_read,
              std::filesystem::perms::none);
    EXPECT_EQ(permissions & std::filesystem::perms::others_read,
              std::filesystem::perms::none);

    auto loaded = zone::crypto::identity::load_pem(path);
    ASSERT_TRUE(loaded.ok()) << loaded.log;
    EXPECT_EQ(loaded.value->zone_id(), identity.value->zone_id());
    EXPECT_EQ(loaded.value->algorithm(), algorithm);
  }
  zone::testing::remove_path(directory);
}

TEST(identity, load_pem_reports_missing_file) {
  auto loaded = zone::crypto::identity::load_pem("/nonexistent/zone/key.pem");
  EXPECT_FALSE(loaded.ok());
  EXPECT_EQ(loaded.code, zone::schema::error_code::identity);
}
