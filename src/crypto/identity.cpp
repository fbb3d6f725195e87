#include <zone/crypto/hash.hpp>
#include <zone/crypto/identity.hpp>

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/param_build.h>
#include <openssl/pem.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <vector>

using namespace zone::schema;

namespace zone::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using bio_ptr = std::unique_ptr<BIO, decltype(&BIO_free)>;
using ec_group_ptr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using ec_point_ptr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;
using param_bld_ptr =
    std::unique_ptr<OSSL_PARAM_BLD, decltype(&OSSL_PARAM_BLD_free)>;
using param_ptr = std::unique_ptr<OSSL_PARAM, decltype(&OSSL_PARAM_free)>;

std::shared_ptr<EVP_PKEY> share(EVP_PKEY* key) {
  return std::shared_ptr<EVP_PKEY>{key, EVP_PKEY_free};
}

std::optional<signer_id_t> ed25519_signer_of(EVP_PKEY* key) {
  auto signer = ed25519_signer_id{};
  auto length = signer.public_key.size();
  if (EVP_PKEY_get_raw_public_key(key, signer.public_key.data(), &length) !=
          1 ||
      length != signer.public_key.size()) {
    return std::nullopt;
  }
  return signer_id_t{signer};
}

std::optional<signer_id_t> secp256k1_signer_of(EVP_PKEY* key) {
  auto encoded = std::array<uint8_t, 65>{};
  auto length = size_t{};
  if (EVP_PKEY_get_octet_string_param(key, OSSL_PKEY_PARAM_PUB_KEY,
                                      encoded.data(), encoded.size(),
                                      &length) != 1) {
    return std::nullopt;
  }
  auto signer = secp256k1_signer_id{};
  if (length == 33 && (encoded[0] == 0x02 || encoded[0] == 0x03)) {
    std::copy_n(encoded.data(), signer.public_key.size(),
                signer.public_key.data());
    return signer_id_t{signer};
  }
  if (length == 65 && encoded[0] == 0x04) {
    // Compress: parity of y selects the prefix, x follows.
    signer.public_key[0] = static_cast<uint8_t>(0x02 | (encoded[64] & 0x01));
    std::copy_n(encoded.data() + 1, 32, signer.public_key.data() + 1);
    return signer_id_t{signer};
  }
  return std::nullopt;
}

bool is_secp256k1(EVP_PKEY* key) {
  auto group = std::array<char, 64>{};
  auto length = size_t{};
  if (EVP_PKEY_get_utf8_string_param(key, OSSL_PKEY_PARAM_GROUP_NAME,
                                     group.data(), group.size(),
                                     &length) != 1) {
    return false;
  }
  return std::string_view{group.data(), length} == "secp256k1";
}

result<identity> make_error_identity(std::string log) {
  spdlog::error("{}", log);
  return make_error<identity>(error_code::identity, std::move(log));
}

std::optional<std::array<uint8_t, 33>> secp256k1_public_from_private(
    const BIGNUM* private_key) {
  auto group = ec_group_ptr{EC_GROUP_new_by_curve_name(NID_secp256k1),
                            EC_GROUP_free};
  if (!group) {
    return std::nullopt;
  }
  auto point = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  if (!point || EC_POINT_mul(group.get(), point.get(), private_key, nullptr,
                             nullptr, nullptr) != 1) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, 33>{};
  if (EC_POINT_point2oct(group.get(), point.get(), POINT_CONVERSION_COMPRESSED,
                         out.data(), out.size(), nullptr) != out.size()) {
    return std::nullopt;
  }
  return out;
}

std::optional<ed25519_signature_t> sign_ed25519(EVP_PKEY* key,
                                                const bytes_view_t& message) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key) != 1) {
    return std::nullopt;
  }
  auto signature = ed25519_signature_t{};
  auto length = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &length, message.data(),
                     message.size()) != 1 ||
      length != signature.size()) {
    return std::nullopt;
  }
  return signature;
}

std::optional<secp256k1_signature_t> sign_secp256k1(
    EVP_PKEY* key,
    const bytes_view_t& message) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key) != 1) {
    return std::nullopt;
  }
  auto length = size_t{};
  if (EVP_DigestSign(ctx.get(), nullptr, &length, message.data(),
                     message.size()) != 1) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(length);
  if (EVP_DigestSign(ctx.get(), der.data(), &length, message.data(),
                     message.size()) != 1) {
    return std::nullopt;
  }

  const auto* der_ptr = der.data();
  auto parsed = ecdsa_sig_ptr{
      d2i_ECDSA_SIG(nullptr, &der_ptr, static_cast<long>(length)),
      ECDSA_SIG_free};
  if (!parsed) {
    return std::nullopt;
  }
  const auto* r = ECDSA_SIG_get0_r(parsed.get());
  const auto* s = ECDSA_SIG_get0_s(parsed.get());

  // [v || r || s] with recovery id 0.
  auto signature = secp256k1_signature_t{};
  if (BN_bn2binpad(r, signature.data() + 1, 32) != 32 ||
      BN_bn2binpad(s, signature.data() + 33, 32) != 32) {
    return std::nullopt;
  }
  return signature;
}

}  // namespace

zone_id_t derive_zone_id(const signer_id_t& signer) {
  return sha256(public_key_bytes(signer));
}

key_algorithm algorithm_of(const signer_id_t& signer) {
  return std::holds_alternative<ed25519_signer_id>(signer)
             ? key_algorithm::ed25519
             : key_algorithm::secp256k1;
}

identity::identity(std::shared_ptr<EVP_PKEY> key, signer_id_t signer)
    : key_{std::move(key)},
      signer_{std::move(signer)},
      zone_id_{derive_zone_id(signer_)} {}

result<identity> identity::generate(const key_algorithm algorithm) {
  auto* raw = static_cast<EVP_PKEY*>(nullptr);
  switch (algorithm) {
    case key_algorithm::ed25519:
      raw = EVP_PKEY_Q_keygen(nullptr, nullptr, "ED25519");
      break;
    case key_algorithm::secp256k1:
      raw = EVP_PKEY_Q_keygen(nullptr, nullptr, "EC", "secp256k1");
      break;
  }
  if (raw == nullptr) {
    return make_error_identity(
        fmt::format("failed to generate {} key", to_string(algorithm)));
  }
  auto key = share(raw);
  auto signer = algorithm == key_algorithm::ed25519
                    ? ed25519_signer_of(key.get())
                    : secp256k1_signer_of(key.get());
  if (!signer) {
    return make_error_identity("failed to read generated public key");
  }
  return make_result(identity{std::move(key), std::move(*signer)});
}

result<identity> identity::from_private_hex(const key_algorithm algorithm,
                                            const std::string_view hex) {
  auto raw = try_from_hex(hex);
  if (!raw || raw->size() != 32) {
    return make_error<identity>(error_code::invalid_input,
                                "private key must be 32 bytes of hex");
  }

  if (algorithm == key_algorithm::ed25519) {
    auto* pkey = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                              raw->data(), raw->size());
    if (pkey == nullptr) {
      return make_error_identity("invalid Ed25519 private key");
    }
    auto key = share(pkey);
    auto signer = ed25519_signer_of(key.get());
    if (!signer) {
      return make_error_identity("failed to derive Ed25519 public key");
    }
    return make_result(identity{std::move(key), std::move(*signer)});
  }

  auto private_key = bignum_ptr{
      BN_bin2bn(raw->data(), static_cast<int>(raw->size()), nullptr), BN_free};
  if (!private_key || BN_is_zero(private_key.get())) {
    return make_error_identity("invalid secp256k1 private key");
  }
  auto public_key = secp256k1_public_from_private(private_key.get());
  if (!public_key) {
    return make_error_identity("failed to derive secp256k1 public key");
  }

  auto builder = param_bld_ptr{OSSL_PARAM_BLD_new(), OSSL_PARAM_BLD_free};
  if (!builder ||
      OSSL_PARAM_BLD_push_utf8_string(builder.get(), OSSL_PKEY_PARAM_GROUP_NAME,
                                      "secp256k1", 0) != 1 ||
      OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_PRIV_KEY,
                             private_key.get()) != 1 ||
      OSSL_PARAM_BLD_push_octet_string(builder.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                       public_key->data(),
                                       public_key->size()) != 1) {
    return make_error_identity("failed to build secp256k1 key parameters");
  }
  auto params = param_ptr{OSSL_PARAM_BLD_to_param(builder.get()),
                          OSSL_PARAM_free};
  auto ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  auto* pkey = static_cast<EVP_PKEY*>(nullptr);
  if (!params || !ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1 ||
      EVP_PKEY_fromdata(ctx.get(), &pkey, EVP_PKEY_KEYPAIR, params.get()) !=
          1) {
    return make_error_identity("failed to import secp256k1 private key");
  }
  auto signer = secp256k1_signer_id{};
  signer.public_key = *public_key;
  return make_result(identity{share(pkey), signer_id_t{signer}});
}

result<identity> identity::load_pem(const std::string_view path) {
  auto bio = bio_ptr{BIO_new_file(std::string{path}.c_str(), "r"), BIO_free};
  if (!bio) {
    return make_error_identity(fmt::format("cannot open key file {}", path));
  }
  auto* pkey = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
  if (pkey == nullptr) {
    return make_error_identity(
        fmt::format("key file {} does not hold a PEM private key", path));
  }
  auto key = share(pkey);

  if (EVP_PKEY_get_base_id(key.get()) == EVP_PKEY_ED25519) {
    auto signer = ed25519_signer_of(key.get());
    if (!signer) {
      return make_error_identity("failed to read Ed25519 public key");
    }
    return make_result(identity{std::move(key), std::move(*signer)});
  }
  if (EVP_PKEY_get_base_id(key.get()) == EVP_PKEY_EC &&
      is_secp256k1(key.get())) {
    auto signer = secp256k1_signer_of(key.get());
    if (!signer) {
      return make_error_identity("failed to read secp256k1 public key");
    }
    return make_result(identity{std::move(key), std::move(*signer)});
  }
  return make_error_identity(
      fmt::format("key file {} holds an unsupported key type", path));
}

identity identity::from_public(const signer_id_t& signer) {
  return identity{nullptr, signer};
}

bool identity::save_pem(const std::string_view private_path,
                        const std::optional<std::string_view> public_path) const {
  if (!key_) {
    spdlog::error("cannot save an identity without a private key");
    return false;
  }

  auto write_file = [&](const std::string_view path, const bool private_part) {
    auto target = std::filesystem::path{std::string{path}};
    auto ec = std::error_code{};
    if (target.has_parent_path()) {
      std::filesystem::create_directories(target.parent_path(), ec);
      if (ec) {
        spdlog::error("failed to create directory for {}: {}", path,
                      ec.message());
        return false;
      }
    }
    auto bio = bio_ptr{BIO_new_file(target.c_str(), "w"), BIO_free};
    if (!bio) {
      spdlog::error("failed to open {} for writing", path);
      return false;
    }
    auto written = private_part
                       ? PEM_write_bio_PrivateKey(bio.get(), key_.get(),
                                                  nullptr, nullptr, 0, nullptr,
                                                  nullptr)
                       : PEM_write_bio_PUBKEY(bio.get(), key_.get());
    if (written != 1) {
      spdlog::error("failed to write PEM to {}", path);
      return false;
    }
    if (private_part) {
      std::filesystem::permissions(target,
                                   std::filesystem::perms::owner_read |
                                       std::filesystem::perms::owner_write,
                                   std::filesystem::perm_options::replace, ec);
      if (ec) {
        spdlog::warn("failed to restrict permissions on {}: {}", path,
                     ec.message());
      }
    }
    return true;
  };

  if (!write_file(private_path, true)) {
    return false;
  }
  if (public_path.has_value()) {
    return write_file(*public_path, false);
  }
  return true;
}

result<signature_t> identity::sign(const bytes_view_t& message) const {
  if (!key_) {
    return make_error<signature_t>(error_code::identity,
                                   "identity has no private key");
  }
  auto signature = std::optional<signature_t>{};
  switch (algorithm()) {
    case key_algorithm::ed25519:
      if (auto signed_bytes = sign_ed25519(key_.get(), message)) {
        signature = *signed_bytes;
      }
      break;
    case key_algorithm::secp256k1:
      if (auto signed_bytes = sign_secp256k1(key_.get(), message)) {
        signature = *signed_bytes;
      }
      break;
  }
  if (!signature) {
    return make_error<signature_t>(
        error_code::identity,
        fmt::format("{} signing failed", to_string(algorithm())));
  }
  return make_result(std::move(*signature));
}

bool identity::has_private_key() const {
  return static_cast<bool>(key_);
}

key_algorithm identity::algorithm() const {
  return algorithm_of(signer_);
}

const signer_id_t& identity::signer() const {
  return signer_;
}

const zone_id_t& identity::zone_id() const {
  return zone_id_;
}

std::string identity::public_key_hex() const {
  return to_hex(public_key_bytes(signer_));
}

}  // namespace zone::crypto
