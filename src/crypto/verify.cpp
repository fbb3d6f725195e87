#include <zone/crypto/verify.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <vector>

namespace zone::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

bool openssl_has_ed25519() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  return static_cast<bool>(ctx);
}

bool openssl_has_secp256k1() {
  auto ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  return static_cast<bool>(ctx);
}

evp_pkey_ptr make_secp256k1_public_key(
    const zone::schema::secp256k1_signer_id& signer) {
  auto none = evp_pkey_ptr{nullptr, EVP_PKEY_free};
  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!key_ctx || EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return none;
  }

  auto* group_name = const_cast<char*>("secp256k1");
  auto params =
      std::array{OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                                  group_name, 0),
                 OSSL_PARAM_construct_octet_string(
                     OSSL_PKEY_PARAM_PUB_KEY,
                     const_cast<unsigned char*>(signer.public_key.data()),
                     signer.public_key.size()),
                 OSSL_PARAM_construct_end()};

  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_PUBLIC_KEY,
                        params.data()) != 1) {
    return none;
  }
  return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
}

/// Zones emit [v || r || s]; [r || s || v] is accepted from older peers.
/// Recovery ids are 0..3 or legacy 27+, anything in 4..26 is rejected.
std::optional<std::array<uint8_t, 64>> compact_rs(
    const zone::schema::secp256k1_signature_t& signature) {
  auto out = std::array<uint8_t, 64>{};
  auto valid_recovery_id = [](const uint8_t v) { return v <= 3 || v >= 27; };
  if (valid_recovery_id(signature.front())) {
    std::copy_n(signature.data() + 1, out.size(), out.data());
    return out;
  }
  if (valid_recovery_id(signature.back())) {
    std::copy_n(signature.data(), out.size(), out.data());
    return out;
  }
  return std::nullopt;
}

std::optional<std::vector<uint8_t>> to_der(
    const std::array<uint8_t, 64>& compact) {
  auto ecdsa_sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  auto r = bignum_ptr{BN_bin2bn(compact.data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(compact.data() + 32, 32, nullptr), BN_free};
  if (!ecdsa_sig || !r || !s ||
      ECDSA_SIG_set0(ecdsa_sig.get(), r.get(), s.get()) != 1) {
    return std::nullopt;
  }
  // ECDSA_SIG owns r and s from here.
  static_cast<void>(r.release());
  static_cast<void>(s.release());

  auto length = i2d_ECDSA_SIG(ecdsa_sig.get(), nullptr);
  if (length <= 0) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(static_cast<size_t>(length));
  auto* cursor = der.data();
  if (i2d_ECDSA_SIG(ecdsa_sig.get(), &cursor) != length) {
    return std::nullopt;
  }
  return der;
}

bool digest_verify(EVP_PKEY* key,
                   const EVP_MD* md,
                   const zone::schema::bytes_view_t& message,
                   const zone::schema::bytes_view_t& signature) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx ||
      EVP_DigestVerifyInit(ctx.get(), nullptr, md, nullptr, key) != 1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
}

bool verify_ed25519(const zone::schema::bytes_view_t& message,
                    const zone::schema::ed25519_signer_id& signer,
                    const zone::schema::ed25519_signature_t& signature) {
  auto pkey =
      evp_pkey_ptr{EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                               signer.public_key.data(),
                                               signer.public_key.size()),
                   EVP_PKEY_free};
  return pkey && digest_verify(pkey.get(), nullptr, message,
                               zone::schema::bytes_view_t{signature});
}

bool verify_secp256k1(const zone::schema::bytes_view_t& message,
                      const zone::schema::secp256k1_signer_id& signer,
                      const zone::schema::secp256k1_signature_t& signature) {
  auto compact = compact_rs(signature);
  if (!compact) {
    return false;
  }
  auto der = to_der(*compact);
  if (!der) {
    return false;
  }
  auto pkey = make_secp256k1_public_key(signer);
  return pkey && digest_verify(pkey.get(), EVP_sha256(), message,
                               zone::schema::make_bytes_view(*der));
}

}  // namespace

bool available() {
  static const auto available_now =
      openssl_has_ed25519() && openssl_has_secp256k1();
  return available_now;
}

bool verify_signature(const zone::schema::bytes_view_t& message,
                      const zone::schema::signer_id_t& signer,
                      const zone::schema::signature_t& signature) {
  return std::visit(
      overloaded{
          [&](const zone::schema::ed25519_signer_id& value) {
            const auto* raw =
                std::get_if<zone::schema::ed25519_signature_t>(&signature);
            return raw != nullptr && verify_ed25519(message, value, *raw);
          },
          [&](const zone::schema::secp256k1_signer_id& value) {
            const auto* raw =
                std::get_if<zone::schema::secp256k1_signature_t>(&signature);
            return raw != nullptr && verify_secp256k1(message, value, *raw);
          }},
      signer);
}

}  // namespace zone::crypto
