#include <zone/schema/primitives.hpp>

#include <boost/endian/buffers.hpp>
#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string_view>

namespace zone::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<bytes_t> try_from_hex_internal(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const hash32_t& hash) {
  return bytes_view_t{hash.data(), hash.size()};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  auto lower_hex = [](const char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
  };
  if (hex.size() != 64 || !std::ranges::all_of(hex, lower_hex)) {
    return std::nullopt;
  }
  auto decoded = try_from_hex_internal(hex);
  if (!decoded) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::copy(decoded->begin(), decoded->end(), hash.begin());
  return hash;
}

std::optional<hash32_t> try_make_hash32(const bytes_view_t& raw) {
  if (raw.size() != 32) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::copy(std::begin(raw), std::end(raw), std::begin(hash));
  return hash;
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::string to_hex(const hash32_t& hash) {
  return to_hex(bytes_view_t{hash.data(), hash.size()});
}

std::optional<bytes_t> try_from_hex(const std::string_view hex) {
  return try_from_hex_internal(hex);
}

std::string to_base64(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.resize(((bytes.size() + 2) / 3) * 4 + 1);
  auto written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                 bytes.data(), static_cast<int>(bytes.size()));
  out.resize(static_cast<size_t>(written));
  return out;
}

std::string to_base64(const bytes_t& bytes) {
  return to_base64(bytes_view_t{bytes.data(), bytes.size()});
}

std::optional<bytes_t> try_from_base64(const std::string_view encoded) {
  if (encoded.empty()) {
    return bytes_t{};
  }
  if ((encoded.size() % 4) != 0) {
    return std::nullopt;
  }
  // EVP_DecodeBlock is lenient about padding placement.
  auto padding = size_t{0};
  for (size_t i = 0; i < encoded.size(); ++i) {
    auto ch = encoded[i];
    if (ch == '=') {
      ++padding;
      continue;
    }
    if (padding > 0 || !(std::isalnum(static_cast<unsigned char>(ch)) != 0 ||
                         ch == '+' || ch == '/')) {
      return std::nullopt;
    }
  }
  if (padding > 2) {
    return std::nullopt;
  }

  auto out = bytes_t((encoded.size() / 4) * 3);
  auto written = EVP_DecodeBlock(
      out.data(), reinterpret_cast<const unsigned char*>(encoded.data()),
      static_cast<int>(encoded.size()));
  if (written < 0 || static_cast<size_t>(written) < padding) {
    return std::nullopt;
  }
  out.resize(static_cast<size_t>(written) - padding);
  return out;
}

std::array<uint8_t, 8> timestamp_bytes(const timestamp_seconds_t timestamp) {
  auto buffer = boost::endian::big_uint64_buf_t{timestamp};
  auto out = std::array<uint8_t, 8>{};
  std::copy_n(buffer.data(), out.size(), out.data());
  return out;
}

bytes_view_t public_key_bytes(const signer_id_t& signer) {
  return std::visit(
      overloaded{[](const ed25519_signer_id& value) {
                   return bytes_view_t{value.public_key.data(),
                                       value.public_key.size()};
                 },
                 [](const secp256k1_signer_id& value) {
                   return bytes_view_t{value.public_key.data(),
                                       value.public_key.size()};
                 }},
      signer);
}

bytes_view_t signature_bytes(const signature_t& signature) {
  return std::visit(
      [](const auto& value) {
        return bytes_view_t{value.data(), value.size()};
      },
      signature);
}

std::optional<signer_id_t> try_make_signer_id(const std::string_view key_type,
                                              const bytes_view_t& public_key) {
  if (key_type == "ed25519" && public_key.size() == 32) {
    auto signer = ed25519_signer_id{};
    std::copy_n(public_key.data(), signer.public_key.size(),
                signer.public_key.data());
    return signer_id_t{signer};
  }
  if (key_type == "secp256k1" && public_key.size() == 33) {
    auto signer = secp256k1_signer_id{};
    std::copy_n(public_key.data(), signer.public_key.size(),
                signer.public_key.data());
    return signer_id_t{signer};
  }
  return std::nullopt;
}

std::optional<signature_t> try_make_signature(const bytes_view_t& raw) {
  if (raw.size() == 64) {
    auto signature = ed25519_signature_t{};
    std::copy_n(raw.data(), signature.size(), signature.data());
    return signature_t{signature};
  }
  if (raw.size() == 65) {
    auto signature = secp256k1_signature_t{};
    std::copy_n(raw.data(), signature.size(), signature.data());
    return signature_t{signature};
  }
  return std::nullopt;
}

}  // namespace zone::schema
