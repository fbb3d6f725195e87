#pragma once

#include <zone/schema/merkle_proof.hpp>
#include <zone/schema/primitives.hpp>
#include <zone/schema/result.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace zone::merkle {

/// Immutable binary SHA-256 tree over a sorted, de-duplicated leaf set.
///
/// Every layer pairs a trailing lone node with itself, so `root` is a pure
/// function of the leaf set. A single leaf is its own root; the empty tree's
/// root is the genesis constant H("").
class tree final {
 public:
  tree();

  static tree from_leaves(std::vector<zone::schema::hash32_t> leaves);

  /// New tree with `leaf` added. Nodes left of the insertion point are shared
  /// with this tree instead of being rehashed. Inserting a present leaf
  /// returns an identical tree.
  tree insert(const zone::schema::hash32_t& leaf) const;

  const zone::schema::hash32_t& root() const;
  std::size_t size() const;
  bool empty() const;
  const std::vector<zone::schema::hash32_t>& leaves() const;
  bool contains(const zone::schema::hash32_t& leaf) const;
  std::optional<uint64_t> index_of(const zone::schema::hash32_t& leaf) const;

  /// Sibling path from `leaf` up to `root()`. The `*` marker is only ever
  /// emitted for the leaf layer's trailing self-pair.
  std::optional<zone::schema::merkle_proof_t> proof(
      const zone::schema::hash32_t& leaf) const;

 private:
  explicit tree(std::vector<std::vector<zone::schema::hash32_t>> layers);

  void seal();

  // layers_[0] holds the sorted leaves, the last layer holds the root.
  std::vector<std::vector<zone::schema::hash32_t>> layers_;
  zone::schema::hash32_t root_{};
};

/// Root of `leaves` taken as a set (order and duplicates do not matter).
zone::schema::hash32_t build_root(std::vector<zone::schema::hash32_t> leaves);

/// Proof for `target` within `leaves`; `not_found` when it is not a member.
zone::schema::result<zone::schema::merkle_proof_t> build_proof(
    std::vector<zone::schema::hash32_t> leaves,
    const zone::schema::hash32_t& target);

/// Replays the positional algorithm: an even index puts the running hash on
/// the left, an odd one on the right, then the index is halved. Never throws.
bool verify_proof(const zone::schema::hash32_t& leaf_hash,
                  uint64_t leaf_index,
                  const std::vector<zone::schema::proof_step_t>& siblings,
                  const zone::schema::hash32_t& expected_root);

bool verify_proof(const zone::schema::merkle_proof_t& proof,
                  const zone::schema::hash32_t& expected_root);

/// `*` for a duplicate sibling, lowercase hex otherwise.
std::string to_string(const zone::schema::proof_step_t& step);

/// Parses `*` or exactly 64 hex characters; anything else is `invalid_input`.
zone::schema::result<zone::schema::proof_step_t> parse_step(
    std::string_view token);

zone::schema::result<std::vector<zone::schema::proof_step_t>> parse_steps(
    const std::vector<std::string>& tokens);

}  // namespace zone::merkle
