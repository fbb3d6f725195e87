#pragma once

#include <zone/citation/transport.hpp>
#include <zone/schema/anchor.hpp>
#include <zone/schema/attestation.hpp>
#include <zone/schema/citation_check.hpp>
#include <zone/schema/primitives.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace zone::citation {

struct citation_request final {
  zone::schema::attestation_id_t citing_id{};
  zone::schema::attestation_id_t cited_id{};
  std::string endpoint;
};

/// What the local zone knows about the citing attestation.
struct citing_side final {
  std::optional<zone::schema::attestation_t> attestation;
  /// Earliest anchor over a root that includes the citing attestation.
  std::optional<zone::schema::anchor_t> anchor;
};

using citing_lookup_t =
    std::function<citing_side(const zone::schema::attestation_id_t& id)>;

/// The citation state machine over already-fetched data. Only anchored root
/// timestamps order the two attestations; their own `timestamp` fields are
/// never consulted.
zone::schema::citation_check_t evaluate(
    const zone::schema::attestation_id_t& cited_id,
    const citing_side& citing,
    const fetch_result& fetched);

/// Runs citation checks against remote zones. Every failure, including
/// transport errors and timeouts, ends as INVALID for that check only.
class verifier final {
 public:
  verifier(std::shared_ptr<transport> transport,
           citing_lookup_t lookup,
           std::chrono::milliseconds timeout);

  zone::schema::citation_check_t check(const citation_request& request) const;

  /// Independent checks run concurrently, each with its own timeout. Results
  /// come back in request order.
  std::vector<zone::schema::citation_check_t> check_many(
      const std::vector<citation_request>& requests) const;

  std::chrono::milliseconds timeout() const;

 private:
  std::shared_ptr<transport> transport_;
  citing_lookup_t lookup_;
  std::chrono::milliseconds timeout_;
};

}  // namespace zone::citation
