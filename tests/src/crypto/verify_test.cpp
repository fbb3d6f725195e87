#include <zone/crypto/verify.hpp>
#include <gtest/gtest.h>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace {

using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;

zone::schema::bytes_t from_hex(const std::string_view hex) {
  return zone::schema::try_from_hex(hex).value_or(zone::schema::bytes_t{});
}

struct secp_fixture_t final {
  zone::schema::secp256k1_signer_id signer;
  // DER-derived r||s, without a recovery byte.
  std::array<uint8_t, 64> compact{};
  std::vector<uint8_t> message;
};

std::optional<secp_fixture_t> make_secp_fixture() {
  auto pkey = evp_pkey_ptr{EVP_PKEY_Q_keygen(nullptr, nullptr, "EC", "secp256k1"),
                           EVP_PKEY_free};
  if (!pkey) {
    return std::nullopt;
  }
  if (EVP_PKEY_set_utf8_string_param(
          pkey.get(), OSSL_PKEY_PARAM_EC_POINT_CONVERSION_FORMAT,
          "compressed") != 1) {
    return std::nullopt;
  }
  auto fixture = secp_fixture_t{};
  auto length = size_t{};
  if (EVP_PKEY_get_octet_string_param(pkey.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                      fixture.signer.public_key.data(),
                                      fixture.signer.public_key.size(),
                                      &length) != 1 ||
      length != fixture.signer.public_key.size()) {
    return std::nullopt;
  }

  fixture.message = std::vector<uint8_t>{'z', 'o', 'n', 'e', '-', 'm', 's', 'g'};
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                                 pkey.get()) != 1) {
    return std::nullopt;
  }
  auto der_size = size_t{};
  if (EVP_DigestSign(ctx.get(), nullptr, &der_size, fixture.message.data(),
                     fixture.message.size()) != 1) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(der_size);
  if (EVP_DigestSign(ctx.get(), der.data(), &der_size, fixture.message.data(),
                     fixture.message.size()) != 1) {
    return std::nullopt;
  }
  const auto* der_ptr = der.data();
  auto sig = ecdsa_sig_ptr{
      d2i_ECDSA_SIG(nullptr, &der_ptr, static_cast<long>(der_size)),
      ECDSA_SIG_free};
  if (!sig) {
    return std::nullopt;
  }
  if (BN_bn2binpad(ECDSA_SIG_get0_r(sig.get()), fixture.compact.data(), 32) !=
          32 ||
      BN_bn2binpad(ECDSA_SIG_get0_s(sig.get()), fixture.compact.data() + 32,
                   32) != 32) {
    return std::nullopt;
  }
  return fixture;
}

}  // namespace

TEST(crypto_verify, verifies_rfc8032_ed25519_vector) {
  if (!zone::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto public_key = from_hex(
      "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a");
  auto signature_bytes = from_hex(
      "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e06522490155"
      "5fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b");
  auto signer = zone::schema::try_make_signer_id(
      "ed25519", zone::schema::make_bytes_view(public_key));
  auto signature = zone::schema::try_make_signature(
      zone::schema::make_bytes_view(signature_bytes));
  ASSERT_TRUE(signer.has_value());
  ASSERT_TRUE(signature.has_value());

  auto empty = zone::schema::bytes_t{};
  EXPECT_TRUE(zone::crypto::verify_signature(
      zone::schema::make_bytes_view(empty), *signer, *signature));

  auto tampered = zone::schema::bytes_t{0x00};
  EXPECT_FALSE(zone::crypto::verify_signature(
      zone::schema::make_bytes_view(tampered), *signer, *signature));
}

TEST(crypto_verify, verifies_secp256k1_with_leading_recovery_byte) {
  if (!zone::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = make_secp_fixture();
  ASSERT_TRUE(fixture.has_value());
  auto signer = zone::schema::signer_id_t{fixture->signer};
  auto message = zone::schema::bytes_view_t{fixture->message.data(),
                                            fixture->message.size()};

  auto leading = zone::schema::secp256k1_signature_t{};
  leading[0] = 0;
  std::copy_n(fixture->compact.data(), 64, leading.data() + 1);
  EXPECT_TRUE(zone::crypto::verify_signature(
      message, signer, zone::schema::signature_t{leading}));

  auto out_of_range = leading;
  out_of_range[0] = 9;
  EXPECT_FALSE(zone::crypto::verify_signature(
      message, signer, zone::schema::signature_t{out_of_range}));

  fixture->message[0] ^= 0x01;
  EXPECT_FALSE(zone::crypto::verify_signature(
      zone::schema::bytes_view_t{fixture->message.data(),
                                 fixture->message.size()},
      signer, zone::schema::signature_t{leading}));
}

TEST(crypto_verify, rejects_malformed_keys_and_mismatched_algorithms) {
  if (!zone::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto message = zone::schema::bytes_t{'m'};
  auto bad_point = zone::schema::secp256k1_signer_id{};
  bad_point.public_key.fill(0xFF);
  EXPECT_FALSE(zone::crypto::verify_signature(
      zone::schema::make_bytes_view(message), zone::schema::signer_id_t{bad_point},
      zone::schema::signature_t{zone::schema::secp256k1_signature_t{}}));

  auto ed = zone::schema::ed25519_signer_id{};
  EXPECT_FALSE(zone::crypto::verify_signature(
      zone::schema::make_bytes_view(message), zone::schema::signer_id_t{ed},
      zone::schema::signature_t{zone::schema::secp256k1_signature_t{}}));

  auto fixture = make_secp_fixture();
  ASSERT_TRUE(fixture.has_value());
  EXPECT_FALSE(zone::crypto::verify_signature(
      zone::schema::make_bytes_view(message),
      zone::schema::signer_id_t{fixture->signer},
      zone::schema::signature_t{zone::schema::ed25519_signature_t{}}));
}
