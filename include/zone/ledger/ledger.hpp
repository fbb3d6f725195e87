#pragma once

#include <zone/merkle/tree.hpp>
#include <zone/schema/attestation.hpp>
#include <zone/schema/encoding/scale/encoder.hpp>
#include <zone/schema/merkle_proof.hpp>
#include <zone/schema/primitives.hpp>
#include <zone/schema/result.hpp>
#include <zone/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace zone::ledger {

using encoder_t = zone::schema::encoding::default_encoder_t;
using storage_t = zone::storage::storage<zone::storage::rocksdb_storage_tag>;

/// Outcome of a successful append.
struct appended final {
  zone::schema::hash32_t root{};
  /// Position of the new leaf in the sorted leaf order of `root`. Later
  /// appends may shift it.
  uint64_t index{};
  /// Leaf count after the append, which is also the version of `root`.
  uint64_t version{};
};

/// Append-only attestation ledger of one zone.
///
/// Appends are serialized. Readers work from an immutable tree snapshot that
/// is swapped in only after the append reached storage, so they never see a
/// partially updated tree. Every root the ledger has produced is kept with
/// its version so proofs can be issued against historical roots.
class ledger final {
 public:
  /// Loads leaves and root history from storage.
  ledger(encoder_t& encoder, storage_t& storage);

  /// Persist and include `attestation`. Rejects duplicates, attestations that
  /// do not verify, and storage failures (in which case nothing changes).
  zone::schema::result<appended> append(
      const zone::schema::attestation_t& attestation);

  zone::schema::hash32_t root() const;
  uint64_t size() const;

  /// Proof against the current root.
  zone::schema::result<zone::schema::merkle_proof_t> proof_for(
      const zone::schema::attestation_id_t& id) const;

  /// Proof against an earlier root of this ledger. `not_found` when the root
  /// is unknown or predates the attestation.
  zone::schema::result<zone::schema::merkle_proof_t> proof_for(
      const zone::schema::attestation_id_t& id,
      const zone::schema::hash32_t& root) const;

  std::optional<zone::schema::attestation_t> get(
      const zone::schema::attestation_id_t& id) const;
  bool contains(const zone::schema::attestation_id_t& id) const;

  /// Leaf count at which `root` was current.
  std::optional<uint64_t> version_of(const zone::schema::hash32_t& root) const;

  /// Version produced by the append of `id`.
  std::optional<uint64_t> appended_version(
      const zone::schema::attestation_id_t& id) const;

  /// roots()[v] is the root at version v; roots()[0] is H("").
  std::vector<zone::schema::hash32_t> roots() const;

  /// Consistent read view of the current tree.
  std::shared_ptr<const zone::merkle::tree> snapshot() const;

 private:
  void load();

  encoder_t& encoder_;
  storage_t& storage_;
  mutable std::mutex append_mutex_;
  mutable std::shared_mutex state_mutex_;
  std::shared_ptr<const zone::merkle::tree> tree_;
  std::vector<zone::schema::attestation_id_t> order_;
  std::vector<zone::schema::hash32_t> roots_;
  std::map<zone::schema::hash32_t, uint64_t> root_versions_;
  std::map<zone::schema::attestation_id_t, uint64_t> appended_versions_;
};

}  // namespace zone::ledger
