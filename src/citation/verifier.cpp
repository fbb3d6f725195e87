#include <zone/attestation/builder.hpp>
#include <zone/citation/verifier.hpp>
#include <zone/merkle/tree.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <future>
#include <memory>
#include <thread>
#include <utility>

using namespace zone::schema;

namespace zone::citation {

namespace {

citation_check_t invalid(const citation_reason reason,
                         std::optional<anchor_t> cited_anchor = std::nullopt,
                         std::optional<anchor_t> citing_anchor = std::nullopt) {
  auto check = citation_check_t{};
  check.status = citation_status::invalid;
  check.reason = reason;
  check.cited_anchor = std::move(cited_anchor);
  check.citing_anchor = std::move(citing_anchor);
  return check;
}

// Citing-side preconditions that need no remote data.
std::optional<citation_check_t> check_citing(const attestation_id_t& cited_id,
                                             const citing_side& citing) {
  if (!citing.attestation) {
    return invalid(citation_reason::citing_unknown);
  }
  const auto& citations = citing.attestation->citations;
  if (std::ranges::find(citations, cited_id) == citations.end()) {
    return invalid(citation_reason::citation_not_listed);
  }
  return std::nullopt;
}

// The fetch runs on its own thread so a transport that ignores its deadline
// can only stall that thread. A late answer is dropped.
fetch_result fetch_within(std::shared_ptr<transport> transport,
                          const citation_request& request,
                          const std::chrono::milliseconds timeout) {
  auto answer = std::make_shared<std::promise<fetch_result>>();
  auto pending = answer->get_future();
  std::thread{[transport = std::move(transport), answer,
               endpoint = request.endpoint, id = request.cited_id, timeout] {
    auto fetched = fetch_result{};
    try {
      fetched = transport->fetch(endpoint, id, timeout);
    } catch (const std::exception& e) {
      fetched.status = fetch_status::unreachable;
      fetched.log = e.what();
    }
    answer->set_value(std::move(fetched));
  }}.detach();

  if (pending.wait_for(timeout) != std::future_status::ready) {
    auto expired = fetch_result{};
    expired.status = fetch_status::unreachable;
    expired.log = fmt::format("no answer within {}ms", timeout.count());
    return expired;
  }
  return pending.get();
}

}  // namespace

citation_check_t evaluate(const attestation_id_t& cited_id,
                          const citing_side& citing,
                          const fetch_result& fetched) {
  if (auto rejected = check_citing(cited_id, citing)) {
    return *rejected;
  }

  switch (fetched.status) {
    case fetch_status::ok:
      break;
    case fetch_status::not_found:
      return invalid(citation_reason::cited_not_found);
    case fetch_status::unreachable:
      return invalid(citation_reason::cited_unreachable);
    case fetch_status::malformed:
      return invalid(citation_reason::malformed_response);
  }
  if (!fetched.record) {
    return invalid(citation_reason::malformed_response);
  }

  const auto& record = *fetched.record;
  if (record.attestation.attestation_id != cited_id ||
      record.proof.leaf_hash != cited_id) {
    return invalid(citation_reason::leaf_mismatch);
  }
  if (!zone::merkle::verify_proof(record.proof, record.proof.root)) {
    return invalid(citation_reason::proof_invalid);
  }
  if (zone::attestation::verify_attestation(record.attestation) !=
      zone::attestation::verification_outcome::valid) {
    return invalid(citation_reason::attestation_invalid);
  }
  if (!record.anchor) {
    return invalid(citation_reason::cited_unanchored);
  }
  if (record.anchor->merkle_root != record.proof.root) {
    return invalid(citation_reason::anchor_root_mismatch, record.anchor);
  }
  if (!citing.anchor) {
    return invalid(citation_reason::citing_unanchored, record.anchor);
  }
  // Equal timestamps do not establish an order.
  if (record.anchor->external_timestamp >= citing.anchor->external_timestamp) {
    return invalid(citation_reason::ordering_violation, record.anchor,
                   citing.anchor);
  }

  auto check = citation_check_t{};
  check.status = citation_status::valid;
  check.reason = citation_reason::verified;
  check.cited_anchor = record.anchor;
  check.citing_anchor = citing.anchor;
  return check;
}

verifier::verifier(std::shared_ptr<transport> transport,
                   citing_lookup_t lookup,
                   const std::chrono::milliseconds timeout)
    : transport_{std::move(transport)},
      lookup_{std::move(lookup)},
      timeout_{timeout} {}

citation_check_t verifier::check(const citation_request& request) const {
  auto citing = lookup_(request.citing_id);
  if (auto rejected = check_citing(request.cited_id, citing)) {
    spdlog::info("Citation {} -> {} invalid: {}", to_hex(request.citing_id),
                 to_hex(request.cited_id), to_string(rejected->reason));
    return *rejected;
  }

  auto fetched = fetch_within(transport_, request, timeout_);
  if (fetched.status != fetch_status::ok) {
    spdlog::warn("Fetching {} from {} failed: {}", to_hex(request.cited_id),
                 request.endpoint, fetched.log);
  }
  auto check = evaluate(request.cited_id, citing, fetched);
  spdlog::info("Citation {} -> {} {}: {}", to_hex(request.citing_id),
               to_hex(request.cited_id), check.valid() ? "valid" : "invalid",
               to_string(check.reason));
  return check;
}

std::vector<citation_check_t> verifier::check_many(
    const std::vector<citation_request>& requests) const {
  auto pending = std::vector<std::future<citation_check_t>>{};
  pending.reserve(requests.size());
  for (const auto& request : requests) {
    pending.push_back(std::async(std::launch::async,
                                 [this, &request] { return check(request); }));
  }
  auto checks = std::vector<citation_check_t>{};
  checks.reserve(pending.size());
  for (auto& future : pending) {
    checks.push_back(future.get());
  }
  return checks;
}

std::chrono::milliseconds verifier::timeout() const {
  return timeout_;
}

}  // namespace zone::citation
