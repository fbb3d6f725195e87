#pragma once

#include <zone/citation/transport.hpp>
#include <zone/citation/verifier.hpp>
#include <zone/crypto/identity.hpp>
#include <zone/ledger/anchor_registry.hpp>
#include <zone/ledger/ledger.hpp>
#include <zone/schema/anchor.hpp>
#include <zone/schema/attestation.hpp>
#include <zone/schema/citation_check.hpp>
#include <zone/schema/primitives.hpp>
#include <zone/schema/result.hpp>
#include <zone/schema/root_info.hpp>
#include <zone/schema/served_record.hpp>
#include <zone/schema/submission.hpp>
#include <zone/schema/zone_info.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace zone::execution {

/// Decides whether this zone records claims under a canon.
using canon_policy_t = std::function<bool(const zone::schema::canon_id_t&)>;

/// Current time in Unix seconds.
using clock_source_t = std::function<int64_t()>;

struct engine_options final {
  std::string name;
  std::string description;
  /// Supported canons as "name:version". Empty accepts every canon.
  std::vector<std::string> canons;
  std::chrono::milliseconds citation_timeout{5000};
};

/// Policy accepting exactly the canon ids of `canons` ("name:version"), or
/// everything when the list is empty.
canon_policy_t make_canon_policy(const std::vector<std::string>& canons);

int64_t system_clock_seconds();

/// A zone: one identity, one ledger, its anchors, and the citation verifier.
///
/// This is the surface transports call. It builds and signs attestations,
/// appends them, serves records with proofs and anchors, and checks
/// citations against other zones.
class engine final {
 public:
  engine(zone::ledger::encoder_t& encoder,
         zone::ledger::storage_t& storage,
         zone::crypto::identity identity,
         engine_options options,
         std::shared_ptr<zone::citation::transport> transport);

  /// Build, sign and append. The timestamp comes from the engine's clock.
  /// The record carries the proof against the root this append produced,
  /// which has no anchor yet.
  zone::schema::result<zone::schema::served_record_t> submit(
      const zone::schema::submission_t& submission);

  /// Attestation with a proof against the current root, and that root's
  /// anchor when it has one.
  zone::schema::result<zone::schema::served_record_t> get_attestation(
      const zone::schema::attestation_id_t& id) const;

  /// Attestation with a proof against the root of the earliest anchor that
  /// covers it. Falls back to the current root when nothing covers it yet.
  zone::schema::result<zone::schema::served_record_t> serve_record(
      const zone::schema::attestation_id_t& id) const;

  zone::schema::root_info_t current_root() const;

  /// Check that `cited_id`, held by the zone at `cited_endpoint`, was anchored
  /// strictly before the local attestation `citing_id`.
  zone::schema::citation_check_t verify_citation(
      const zone::schema::attestation_id_t& citing_id,
      const zone::schema::attestation_id_t& cited_id,
      const std::string& cited_endpoint) const;

  std::vector<zone::schema::citation_check_t> verify_citations(
      const std::vector<zone::citation::citation_request>& requests) const;

  zone::schema::result<zone::schema::anchor_t> record_anchor(
      zone::schema::anchor_t anchor);

  zone::schema::zone_info_t info() const;

  const zone::crypto::identity& identity() const;

  void set_canon_policy(canon_policy_t policy);
  void set_clock(clock_source_t clock);

 private:
  zone::citation::citing_side lookup_citing(
      const zone::schema::attestation_id_t& id) const;

  zone::crypto::identity identity_;
  engine_options options_;
  zone::ledger::ledger ledger_;
  zone::ledger::anchor_registry anchors_;
  zone::citation::verifier verifier_;
  canon_policy_t canon_policy_;
  clock_source_t clock_;
};

}  // namespace zone::execution
