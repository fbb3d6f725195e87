#pragma once

#include <zone/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: zone info.
// Self-description a zone publishes to clients and peers.
namespace zone::schema {

inline constexpr auto kApiVersion = std::string_view{"0.1.0"};

template <uint16_t Version>
struct zone_info;

template <>
struct zone_info<1> final {
  uint16_t version{1};
  zone_id_t zone_id{};
  std::string name;
  std::string description;
  std::string public_key_hex;
  std::string key_type;
  std::vector<std::string> canons;
  hash32_t glsr{};
  std::string api_version{kApiVersion};
};

using zone_info_t = zone_info<1>;

}  // namespace zone::schema
