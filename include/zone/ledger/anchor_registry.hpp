#pragma once

#include <zone/ledger/ledger.hpp>
#include <zone/schema/anchor.hpp>
#include <zone/schema/primitives.hpp>
#include <zone/schema/result.hpp>

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace zone::ledger {

/// Anchors recorded against roots of one ledger, persisted next to it.
class anchor_registry final {
 public:
  anchor_registry(encoder_t& encoder, storage_t& storage, const ledger& ledger);

  /// Record an anchor. The root must be one this ledger produced.
  zone::schema::result<zone::schema::anchor_t> record(
      zone::schema::anchor_t anchor);

  /// Earliest anchor bound to exactly `root`.
  std::optional<zone::schema::anchor_t> anchor_for(
      const zone::schema::hash32_t& root) const;

  /// Most recently recorded anchor.
  std::optional<zone::schema::anchor_t> latest() const;

  /// Earliest anchor (by external timestamp) over any root whose version is
  /// at least `version`, i.e. the earliest anchored evidence that the ledger
  /// held its first `version` leaves.
  std::optional<zone::schema::anchor_t> earliest_covering(
      uint64_t version) const;

  std::vector<zone::schema::anchor_t> anchors() const;

 private:
  void load();

  encoder_t& encoder_;
  storage_t& storage_;
  const ledger& ledger_;
  mutable std::shared_mutex mutex_;
  std::vector<zone::schema::anchor_t> anchors_;
};

}  // namespace zone::ledger
