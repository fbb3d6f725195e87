#include <zone/schema/key/builder.hpp>
#include <zone/schema/key/ledger_keys.hpp>

#include <algorithm>

namespace zone::schema::key {

zone::schema::bytes_t make_attestation_key(
    const zone::schema::attestation_id_t& id) {
  auto key = builder{};
  key.write(kAttestationKeyPrefix).write(id);
  return key.data;
}

zone::schema::bytes_t make_leaf_key(const uint64_t sequence) {
  auto key = builder{};
  key.write(kLeafKeyPrefix).write(sequence);
  return key.data;
}

zone::schema::bytes_t make_root_key(const uint64_t leaf_count) {
  auto key = builder{};
  key.write(kRootKeyPrefix).write(leaf_count);
  return key.data;
}

zone::schema::bytes_t make_anchor_key(const uint64_t sequence) {
  auto key = builder{};
  key.write(kAnchorKeyPrefix).write(sequence);
  return key.data;
}

zone::schema::bytes_t make_head_key() {
  auto key = builder{};
  key.write(kHeadKey);
  return key.data;
}

std::optional<uint64_t> parse_sequence(const std::string_view& prefix,
                                       const zone::schema::bytes_view_t& key) {
  if (key.size() != prefix.size() + sizeof(uint64_t)) {
    return std::nullopt;
  }
  if (!std::equal(prefix.begin(), prefix.end(), key.begin(),
                  [](const char lhs, const uint8_t rhs) {
                    return static_cast<uint8_t>(lhs) == rhs;
                  })) {
    return std::nullopt;
  }
  auto sequence = uint64_t{};
  for (auto i = prefix.size(); i < key.size(); ++i) {
    sequence = (sequence << 8u) | key[i];
  }
  return sequence;
}

}  // namespace zone::schema::key
