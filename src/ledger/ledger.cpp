#include <zone/attestation/builder.hpp>
#include <zone/common/critical.hpp>
#include <zone/crypto/hash.hpp>
#include <zone/ledger/ledger.hpp>
#include <zone/schema/key/ledger_keys.hpp>
#include <zone/schema/root_info.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

using namespace zone::schema;

namespace zone::ledger {

ledger::ledger(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder},
      storage_{storage},
      tree_{std::make_shared<const zone::merkle::tree>()} {
  load();
}

void ledger::load() {
  auto leaf_prefix = make_bytes(key::kLeafKeyPrefix);
  auto tree = zone::merkle::tree{};
  auto order = std::vector<attestation_id_t>{};
  auto roots = std::vector<hash32_t>{zone::crypto::glsr()};

  for (const auto& [raw_key, raw_value] :
       storage_.list_by_prefix(make_bytes_view(leaf_prefix))) {
    auto sequence = key::parse_sequence(key::kLeafKeyPrefix,
                                        make_bytes_view(raw_key));
    if (!sequence || *sequence != order.size()) {
      zone::common::critical("ledger leaf sequence is not contiguous at {}",
                             order.size());
    }
    auto id = encoder_.try_decode<hash32_t>(make_bytes_view(raw_value));
    if (!id) {
      zone::common::critical("failed to decode ledger leaf {}", *sequence);
    }
    tree = tree.insert(*id);
    order.push_back(*id);
    roots.push_back(tree.root());
  }

  auto root_prefix = make_bytes(key::kRootKeyPrefix);
  auto stored_roots = storage_.list_by_prefix(make_bytes_view(root_prefix));
  if (stored_roots.size() != order.size()) {
    zone::common::critical("ledger root history holds {} roots for {} leaves",
                           stored_roots.size(), order.size());
  }
  for (const auto& [raw_key, raw_value] : stored_roots) {
    auto info = encoder_.try_decode<root_info_t>(make_bytes_view(raw_value));
    if (!info || info->leaf_count == 0 || info->leaf_count >= roots.size() ||
        roots[info->leaf_count] != info->root) {
      zone::common::critical("ledger root history does not match its leaves");
    }
  }

  auto head_key = key::make_head_key();
  auto head = storage_.get<uint64_t>(encoder_, make_bytes_view(head_key));
  if (head.value_or(0) != order.size()) {
    zone::common::critical("ledger head {} does not match {} stored leaves",
                           head.value_or(0), order.size());
  }

  auto lock = std::unique_lock{state_mutex_};
  tree_ = std::make_shared<const zone::merkle::tree>(std::move(tree));
  order_ = std::move(order);
  roots_ = std::move(roots);
  root_versions_.clear();
  appended_versions_.clear();
  for (auto version = uint64_t{0}; version < roots_.size(); ++version) {
    root_versions_.emplace(roots_[version], version);
  }
  for (auto i = uint64_t{0}; i < order_.size(); ++i) {
    appended_versions_.emplace(order_[i], i + 1);
  }
  spdlog::info("Ledger loaded: {} attestations, root {}", order_.size(),
               to_hex(tree_->root()));
}

result<appended> ledger::append(const attestation_t& attestation) {
  auto append_lock = std::scoped_lock{append_mutex_};

  switch (zone::attestation::verify_attestation(attestation)) {
    case zone::attestation::verification_outcome::valid:
      break;
    case zone::attestation::verification_outcome::zone_mismatch:
      return make_error<appended>(
          error_code::invalid_input,
          "zone_id does not match the attached public key");
    case zone::attestation::verification_outcome::id_mismatch:
      return make_error<appended>(
          error_code::invalid_input,
          "attestation_id does not re-derive from its fields");
    case zone::attestation::verification_outcome::bad_signature:
      return make_error<appended>(error_code::verification_failure,
                                  "attestation signature does not verify");
  }

  const auto& id = attestation.attestation_id;
  auto current = snapshot();
  auto attestation_key = key::make_attestation_key(id);
  if (current->contains(id) ||
      storage_.get<attestation_t>(encoder_, make_bytes_view(attestation_key))
          .has_value()) {
    return make_error<appended>(
        error_code::duplicate_attestation,
        fmt::format("attestation {} already recorded", to_hex(id)));
  }

  auto next = std::make_shared<const zone::merkle::tree>(current->insert(id));
  auto sequence = static_cast<uint64_t>(current->size());
  auto version = sequence + 1;

  auto info = root_info_t{};
  info.root = next->root();
  info.leaf_count = version;

  auto entries = std::vector<zone::storage::key_value_entry_t>{};
  entries.emplace_back(std::move(attestation_key), encoder_.encode(attestation));
  entries.emplace_back(key::make_leaf_key(sequence), encoder_.encode(id));
  entries.emplace_back(key::make_root_key(version), encoder_.encode(info));
  entries.emplace_back(key::make_head_key(), encoder_.encode(version));
  if (!storage_.commit(entries)) {
    return make_error<appended>(error_code::unreachable_collaborator,
                                "storage rejected the append");
  }

  auto index = next->index_of(id);
  if (!index) {
    zone::common::critical("appended leaf missing from the new tree");
  }
  {
    auto state_lock = std::unique_lock{state_mutex_};
    tree_ = next;
    order_.push_back(id);
    roots_.push_back(next->root());
    root_versions_.emplace(next->root(), version);
    appended_versions_.emplace(id, version);
  }
  spdlog::debug("Appended {} at version {}, root {}", to_hex(id), version,
                to_hex(next->root()));
  return make_result(
      appended{.root = next->root(), .index = *index, .version = version});
}

hash32_t ledger::root() const {
  return snapshot()->root();
}

uint64_t ledger::size() const {
  return snapshot()->size();
}

result<merkle_proof_t> ledger::proof_for(const attestation_id_t& id) const {
  auto proof = snapshot()->proof(id);
  if (!proof) {
    return make_error<merkle_proof_t>(
        error_code::not_found,
        fmt::format("attestation {} is not in the ledger", to_hex(id)));
  }
  return make_result(std::move(*proof));
}

result<merkle_proof_t> ledger::proof_for(const attestation_id_t& id,
                                         const hash32_t& root) const {
  auto leaves = std::vector<attestation_id_t>{};
  auto current = std::shared_ptr<const zone::merkle::tree>{};
  {
    auto lock = std::shared_lock{state_mutex_};
    auto version = root_versions_.find(root);
    if (version == root_versions_.end()) {
      return make_error<merkle_proof_t>(
          error_code::not_found,
          fmt::format("root {} was not produced by this ledger", to_hex(root)));
    }
    auto appended_at = appended_versions_.find(id);
    if (appended_at == appended_versions_.end() ||
        appended_at->second > version->second) {
      return make_error<merkle_proof_t>(
          error_code::not_found,
          fmt::format("attestation {} is not covered by root {}", to_hex(id),
                      to_hex(root)));
    }
    if (version->second == order_.size()) {
      current = tree_;
    } else {
      leaves.assign(
          order_.begin(),
          order_.begin() + static_cast<std::ptrdiff_t>(version->second));
    }
  }

  auto historical = current ? *current
                            : zone::merkle::tree::from_leaves(std::move(leaves));
  auto proof = historical.proof(id);
  if (!proof || historical.root() != root) {
    zone::common::critical("historical root {} cannot be rebuilt",
                           to_hex(root));
  }
  return make_result(std::move(*proof));
}

std::optional<attestation_t> ledger::get(const attestation_id_t& id) const {
  if (!contains(id)) {
    return std::nullopt;
  }
  return storage_.get<attestation_t>(
      encoder_, make_bytes_view(key::make_attestation_key(id)));
}

bool ledger::contains(const attestation_id_t& id) const {
  return snapshot()->contains(id);
}

std::optional<uint64_t> ledger::version_of(const hash32_t& root) const {
  auto lock = std::shared_lock{state_mutex_};
  auto found = root_versions_.find(root);
  if (found == root_versions_.end()) {
    return std::nullopt;
  }
  return found->second;
}

std::optional<uint64_t> ledger::appended_version(
    const attestation_id_t& id) const {
  auto lock = std::shared_lock{state_mutex_};
  auto found = appended_versions_.find(id);
  if (found == appended_versions_.end()) {
    return std::nullopt;
  }
  return found->second;
}

std::vector<hash32_t> ledger::roots() const {
  auto lock = std::shared_lock{state_mutex_};
  return roots_;
}

std::shared_ptr<const zone::merkle::tree> ledger::snapshot() const {
  auto lock = std::shared_lock{state_mutex_};
  return tree_;
}

}  // namespace zone::ledger
