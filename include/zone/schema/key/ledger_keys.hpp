#pragma once

#include <zone/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema key type: ledger keys.
// Key prefixes and key codecs for attestations, the append-ordered leaf list,
// root history, anchors and the ledger head.
namespace zone::schema::key {

inline constexpr std::string_view kAttestationKeyPrefix{"ZONE|ATT|"};
inline constexpr std::string_view kLeafKeyPrefix{"ZONE|LEAF|"};
inline constexpr std::string_view kRootKeyPrefix{"ZONE|ROOT|"};
inline constexpr std::string_view kAnchorKeyPrefix{"ZONE|ANCHOR|"};
inline constexpr std::string_view kHeadKey{"ZONE|META|HEAD"};

inline constexpr std::array<std::string_view, 5> kLedgerKeyspaces{
    kAttestationKeyPrefix, kLeafKeyPrefix, kRootKeyPrefix, kAnchorKeyPrefix,
    kHeadKey};

zone::schema::bytes_t make_attestation_key(
    const zone::schema::attestation_id_t& id);

/// Leaf keys sort by append sequence.
zone::schema::bytes_t make_leaf_key(uint64_t sequence);

/// Root keys sort by leaf count.
zone::schema::bytes_t make_root_key(uint64_t leaf_count);

/// Anchor keys sort by the order anchors were recorded in.
zone::schema::bytes_t make_anchor_key(uint64_t sequence);

zone::schema::bytes_t make_head_key();

/// Trailing big-endian sequence of a leaf, root or anchor key.
std::optional<uint64_t> parse_sequence(const std::string_view& prefix,
                                       const zone::schema::bytes_view_t& key);

}  // namespace zone::schema::key
