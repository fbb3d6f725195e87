#include <zone/crypto/hash.hpp>
#include <zone/merkle/tree.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

using namespace zone::schema;

namespace zone::merkle {

namespace {

void sort_unique(std::vector<hash32_t>& leaves) {
  std::ranges::sort(leaves);
  auto duplicates = std::ranges::unique(leaves);
  leaves.erase(duplicates.begin(), duplicates.end());
}

hash32_t parent_of(const std::vector<hash32_t>& layer, const std::size_t i) {
  const auto& left = layer[2 * i];
  const auto& right = (2 * i + 1) < layer.size() ? layer[2 * i + 1] : left;
  return zone::crypto::sha256_pair(left, right);
}

// Next layer up, reusing the first `reused` parents from `previous`.
std::vector<hash32_t> next_layer(const std::vector<hash32_t>& layer,
                                 const std::vector<hash32_t>* previous,
                                 const std::size_t reused) {
  auto parents = std::vector<hash32_t>{};
  parents.reserve((layer.size() + 1) / 2);
  if (previous != nullptr) {
    parents.insert(std::end(parents), std::begin(*previous),
                   std::begin(*previous) + static_cast<std::ptrdiff_t>(reused));
  }
  for (auto i = parents.size(); i < (layer.size() + 1) / 2; ++i) {
    parents.push_back(parent_of(layer, i));
  }
  return parents;
}

}  // namespace

tree::tree() : root_{zone::crypto::glsr()} {}

tree::tree(std::vector<std::vector<hash32_t>> layers)
    : layers_{std::move(layers)} {
  seal();
}

void tree::seal() {
  if (layers_.empty() || layers_.front().empty()) {
    layers_.clear();
    root_ = zone::crypto::glsr();
    return;
  }
  root_ = layers_.back().front();
}

tree tree::from_leaves(std::vector<hash32_t> leaves) {
  sort_unique(leaves);
  if (leaves.empty()) {
    return tree{};
  }
  auto layers = std::vector<std::vector<hash32_t>>{};
  layers.push_back(std::move(leaves));
  while (layers.back().size() > 1) {
    layers.push_back(next_layer(layers.back(), nullptr, 0));
  }
  return tree{std::move(layers)};
}

tree tree::insert(const hash32_t& leaf) const {
  if (layers_.empty()) {
    auto layers = std::vector<std::vector<hash32_t>>{};
    layers.push_back(std::vector<hash32_t>{leaf});
    return tree{std::move(layers)};
  }
  const auto& current = layers_.front();
  auto position = std::ranges::lower_bound(current, leaf);
  if (position != current.end() && *position == leaf) {
    return *this;
  }

  auto unchanged =
      static_cast<std::size_t>(std::distance(current.begin(), position));
  auto leaves = std::vector<hash32_t>{};
  leaves.reserve(current.size() + 1);
  leaves.insert(std::end(leaves), current.begin(), position);
  leaves.push_back(leaf);
  leaves.insert(std::end(leaves), position, current.end());

  auto layers = std::vector<std::vector<hash32_t>>{};
  layers.push_back(std::move(leaves));
  auto depth = std::size_t{0};
  while (layers.back().size() > 1) {
    unchanged /= 2;
    const auto* previous =
        (depth + 1) < layers_.size() ? &layers_[depth + 1] : nullptr;
    auto reused = previous != nullptr ? std::min(unchanged, previous->size())
                                      : std::size_t{0};
    layers.push_back(next_layer(layers.back(), previous, reused));
    ++depth;
  }
  return tree{std::move(layers)};
}

const hash32_t& tree::root() const {
  return root_;
}

std::size_t tree::size() const {
  return layers_.empty() ? 0 : layers_.front().size();
}

bool tree::empty() const {
  return layers_.empty();
}

const std::vector<hash32_t>& tree::leaves() const {
  static const auto kNoLeaves = std::vector<hash32_t>{};
  return layers_.empty() ? kNoLeaves : layers_.front();
}

bool tree::contains(const hash32_t& leaf) const {
  return index_of(leaf).has_value();
}

std::optional<uint64_t> tree::index_of(const hash32_t& leaf) const {
  const auto& sorted = leaves();
  auto position = std::ranges::lower_bound(sorted, leaf);
  if (position == sorted.end() || *position != leaf) {
    return std::nullopt;
  }
  return static_cast<uint64_t>(std::distance(sorted.begin(), position));
}

std::optional<merkle_proof_t> tree::proof(const hash32_t& leaf) const {
  auto index = index_of(leaf);
  if (!index) {
    return std::nullopt;
  }

  auto proof = merkle_proof_t{};
  proof.leaf_hash = leaf;
  proof.leaf_index = *index;
  proof.root = root_;

  auto position = static_cast<std::size_t>(*index);
  for (std::size_t depth = 0; (depth + 1) < layers_.size(); ++depth) {
    const auto& layer = layers_[depth];
    auto sibling = position ^ std::size_t{1};
    if (sibling < layer.size()) {
      proof.siblings.emplace_back(layer[sibling]);
    } else if (depth == 0) {
      proof.siblings.emplace_back(duplicate_sibling{});
    } else {
      proof.siblings.emplace_back(layer[position]);
    }
    position /= 2;
  }
  return proof;
}

hash32_t build_root(std::vector<hash32_t> leaves) {
  return tree::from_leaves(std::move(leaves)).root();
}

result<merkle_proof_t> build_proof(std::vector<hash32_t> leaves,
                                   const hash32_t& target) {
  auto built = tree::from_leaves(std::move(leaves));
  auto proof = built.proof(target);
  if (!proof) {
    return make_error<merkle_proof_t>(
        error_code::not_found,
        fmt::format("{} is not a leaf of the tree", to_hex(target)));
  }
  return make_result(std::move(*proof));
}

bool verify_proof(const hash32_t& leaf_hash,
                  const uint64_t leaf_index,
                  const std::vector<proof_step_t>& siblings,
                  const hash32_t& expected_root) {
  auto current = leaf_hash;
  auto index = leaf_index;
  for (const auto& step : siblings) {
    const auto sibling = std::visit(
        overloaded{[](const hash32_t& value) { return value; },
                   [&](const duplicate_sibling&) { return current; }},
        step);
    current = (index % 2 == 0) ? zone::crypto::sha256_pair(current, sibling)
                               : zone::crypto::sha256_pair(sibling, current);
    index /= 2;
  }
  return index == 0 && current == expected_root;
}

bool verify_proof(const merkle_proof_t& proof, const hash32_t& expected_root) {
  return verify_proof(proof.leaf_hash, proof.leaf_index, proof.siblings,
                      expected_root);
}

std::string to_string(const proof_step_t& step) {
  return std::visit(
      overloaded{[](const hash32_t& value) { return to_hex(value); },
                 [](const duplicate_sibling&) {
                   return std::string{kDuplicateSiblingToken};
                 }},
      step);
}

result<proof_step_t> parse_step(const std::string_view token) {
  if (token == kDuplicateSiblingToken) {
    return make_result(proof_step_t{duplicate_sibling{}});
  }
  auto hash = try_make_hash32(token);
  if (!hash) {
    return make_error<proof_step_t>(
        error_code::invalid_input,
        fmt::format("malformed proof token '{}'", token));
  }
  return make_result(proof_step_t{*hash});
}

result<std::vector<proof_step_t>> parse_steps(
    const std::vector<std::string>& tokens) {
  auto steps = std::vector<proof_step_t>{};
  steps.reserve(tokens.size());
  for (const auto& token : tokens) {
    auto step = parse_step(token);
    if (!step.ok()) {
      return make_error<std::vector<proof_step_t>>(step.code,
                                                   std::move(step.log));
    }
    steps.push_back(std::move(*step.value));
  }
  return make_result(std::move(steps));
}

}  // namespace zone::merkle
