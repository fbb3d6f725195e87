#pragma once

#include <zone/schema/enum_string.hpp>
#include <zone/schema/primitives.hpp>
#include <zone/schema/result.hpp>

#include <openssl/types.h>

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace zone::crypto {

enum class key_algorithm : uint8_t { ed25519 = 0, secp256k1 = 1 };

inline constexpr auto kKeyAlgorithmNames =
    std::array<std::pair<std::string_view, key_algorithm>, 2>{
        {{"ed25519", key_algorithm::ed25519},
         {"secp256k1", key_algorithm::secp256k1}}};

constexpr std::optional<key_algorithm> try_make_key_algorithm(
    const std::string_view name) {
  return zone::schema::from_string(name, kKeyAlgorithmNames);
}

constexpr std::string_view to_string(const key_algorithm algorithm) {
  return zone::schema::to_string(algorithm, kKeyAlgorithmNames)
      .value_or("ed25519");
}

/// zone_id = H(public key bytes).
zone::schema::zone_id_t derive_zone_id(const zone::schema::signer_id_t& signer);

key_algorithm algorithm_of(const zone::schema::signer_id_t& signer);

/// A zone's signing identity. The zone id is never assigned, it is always
/// derived from the public key. Copies share the underlying key.
class identity final {
 public:
  static zone::schema::result<identity> generate(key_algorithm algorithm);

  /// `hex` is the 32-byte raw private key (Ed25519 seed or secp256k1 scalar).
  static zone::schema::result<identity> from_private_hex(
      key_algorithm algorithm,
      std::string_view hex);

  static zone::schema::result<identity> load_pem(std::string_view path);

  /// Verification-only identity; `sign` fails with `identity`.
  static identity from_public(const zone::schema::signer_id_t& signer);

  /// Write the private key (PKCS#8 PEM, mode 0600) and optionally the public
  /// key. Parent directories are created.
  bool save_pem(std::string_view private_path,
                std::optional<std::string_view> public_path = std::nullopt) const;

  zone::schema::result<zone::schema::signature_t> sign(
      const zone::schema::bytes_view_t& message) const;

  bool has_private_key() const;
  key_algorithm algorithm() const;
  const zone::schema::signer_id_t& signer() const;
  const zone::schema::zone_id_t& zone_id() const;
  std::string public_key_hex() const;

 private:
  identity(std::shared_ptr<EVP_PKEY> key, zone::schema::signer_id_t signer);

  std::shared_ptr<EVP_PKEY> key_;
  zone::schema::signer_id_t signer_;
  zone::schema::zone_id_t zone_id_{};
};

}  // namespace zone::crypto
