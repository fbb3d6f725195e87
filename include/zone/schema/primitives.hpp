#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace zone::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using zone_id_t = hash32_t;
using canon_id_t = hash32_t;
using attestation_id_t = hash32_t;
using timestamp_seconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const hash32_t& hash);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

/// Hashes cross every boundary as exactly 64 lower-case hex characters.
/// Upper-case digits and a 0x prefix are rejected.
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const bytes_view_t& raw);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
/// Arbitrary-length hex such as raw key material; tolerates 0x and
/// upper-case digits.
std::optional<bytes_t> try_from_hex(const std::string_view hex);

std::string to_base64(const bytes_view_t& bytes);
std::string to_base64(const bytes_t& bytes);
std::optional<bytes_t> try_from_base64(const std::string_view encoded);

/// Unix seconds as the 8 big-endian bytes hashed into identifiers.
std::array<uint8_t, 8> timestamp_bytes(timestamp_seconds_t timestamp);

struct ed25519_signer_id final {
  std::array<uint8_t, 32> public_key{};
};

struct secp256k1_signer_id final {
  std::array<uint8_t, 33> public_key{};
};

using signer_id_t = std::variant<ed25519_signer_id, secp256k1_signer_id>;

using ed25519_signature_t = std::array<uint8_t, 64>;
using secp256k1_signature_t = std::array<uint8_t, 65>;
using signature_t = std::variant<ed25519_signature_t, secp256k1_signature_t>;

/// Raw public key bytes of either signer kind.
bytes_view_t public_key_bytes(const signer_id_t& signer);
bytes_view_t signature_bytes(const signature_t& signature);

std::optional<signer_id_t> try_make_signer_id(const std::string_view key_type,
                                              const bytes_view_t& public_key);
std::optional<signature_t> try_make_signature(const bytes_view_t& raw);

}  // namespace zone::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
