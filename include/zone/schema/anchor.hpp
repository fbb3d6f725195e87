#pragma once

#include <zone/schema/anchor_type.hpp>
#include <zone/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: anchor.
// Binds a merkle root to an externally verifiable point in time. Only the
// timestamp and the root linkage take part in verification; `reference` is an
// opaque locator (txid, CID, beacon pulse, ...).
namespace zone::schema {

template <uint16_t Version>
struct anchor;

template <>
struct anchor<1> final {
  uint16_t version{1};
  hash32_t merkle_root{};
  anchor_type type{anchor_type::other};
  timestamp_seconds_t external_timestamp{};
  std::string reference;
};

using anchor_t = anchor<1>;

}  // namespace zone::schema
