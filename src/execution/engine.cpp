#include <zone/attestation/builder.hpp>
#include <zone/crypto/hash.hpp>
#include <zone/execution/engine.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

using namespace zone::schema;

namespace zone::execution {

canon_policy_t make_canon_policy(const std::vector<std::string>& canons) {
  if (canons.empty()) {
    return [](const canon_id_t&) { return true; };
  }
  auto supported = std::set<canon_id_t>{};
  for (const auto& canon : canons) {
    auto separator = canon.rfind(':');
    if (separator == std::string::npos) {
      supported.insert(zone::crypto::compute_canon_id(
          canon, zone::crypto::kDefaultCanonVersion));
      continue;
    }
    supported.insert(zone::crypto::compute_canon_id(
        std::string_view{canon}.substr(0, separator),
        std::string_view{canon}.substr(separator + 1)));
  }
  return [supported = std::move(supported)](const canon_id_t& canon_id) {
    return supported.contains(canon_id);
  };
}

int64_t system_clock_seconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

engine::engine(zone::ledger::encoder_t& encoder,
               zone::ledger::storage_t& storage,
               zone::crypto::identity identity,
               engine_options options,
               std::shared_ptr<zone::citation::transport> transport)
    : identity_{std::move(identity)},
      options_{std::move(options)},
      ledger_{encoder, storage},
      anchors_{encoder, storage, ledger_},
      verifier_{std::move(transport),
                [this](const attestation_id_t& id) {
                  return lookup_citing(id);
                },
                options_.citation_timeout},
      canon_policy_{make_canon_policy(options_.canons)},
      clock_{system_clock_seconds} {
  spdlog::info("Zone {} ({}) ready with {} attestations",
               to_hex(identity_.zone_id()), options_.name, ledger_.size());
}

result<served_record_t> engine::submit(const submission_t& submission) {
  if (!canon_policy_(submission.canon_id)) {
    return make_error<served_record_t>(
        error_code::invalid_input,
        fmt::format("canon {} is not supported by this zone",
                    to_hex(submission.canon_id)));
  }

  auto built = zone::attestation::build(
      identity_, submission.canon_id, submission.claim_hash,
      submission.evidence_hash, submission.evidence_location,
      submission.citations, clock_());
  if (!built.ok()) {
    spdlog::warn("Rejected submission: {}", built.log);
    return make_error<served_record_t>(built.code, std::move(built.log));
  }

  const auto id = built.value->attestation_id;
  auto appended = ledger_.append(*built.value);
  if (!appended.ok()) {
    spdlog::warn("Append of {} failed ({}): {}", to_hex(id),
                 to_string(appended.code), appended.log);
    return make_error<served_record_t>(appended.code, std::move(appended.log));
  }
  spdlog::info("Recorded attestation {} (root {}, {} leaves)", to_hex(id),
               to_hex(appended.value->root), appended.value->version);

  auto proof = ledger_.proof_for(id, appended.value->root);
  if (!proof.ok()) {
    return make_error<served_record_t>(proof.code, std::move(proof.log));
  }
  auto record = served_record_t{};
  record.attestation = std::move(*built.value);
  record.proof = std::move(*proof.value);
  return make_result(std::move(record));
}

result<served_record_t> engine::get_attestation(
    const attestation_id_t& id) const {
  auto attestation = ledger_.get(id);
  if (!attestation) {
    return make_error<served_record_t>(
        error_code::not_found,
        fmt::format("attestation {} not found", to_hex(id)));
  }
  auto proof = ledger_.proof_for(id);
  if (!proof.ok()) {
    return make_error<served_record_t>(proof.code, std::move(proof.log));
  }
  auto record = served_record_t{};
  record.attestation = std::move(*attestation);
  record.anchor = anchors_.anchor_for(proof.value->root);
  record.proof = std::move(*proof.value);
  return make_result(std::move(record));
}

result<served_record_t> engine::serve_record(
    const attestation_id_t& id) const {
  auto version = ledger_.appended_version(id);
  if (!version) {
    return make_error<served_record_t>(
        error_code::not_found,
        fmt::format("attestation {} not found", to_hex(id)));
  }
  auto anchor = anchors_.earliest_covering(*version);
  if (!anchor) {
    return get_attestation(id);
  }

  auto attestation = ledger_.get(id);
  auto proof = ledger_.proof_for(id, anchor->merkle_root);
  if (!attestation || !proof.ok()) {
    return make_error<served_record_t>(
        error_code::not_found,
        fmt::format("attestation {} cannot be proven against {}", to_hex(id),
                    to_hex(anchor->merkle_root)));
  }
  auto record = served_record_t{};
  record.attestation = std::move(*attestation);
  record.proof = std::move(*proof.value);
  record.anchor = std::move(anchor);
  return make_result(std::move(record));
}

root_info_t engine::current_root() const {
  auto snapshot = ledger_.snapshot();
  auto info = root_info_t{};
  info.root = snapshot->root();
  info.leaf_count = snapshot->size();
  info.last_anchor = anchors_.latest();
  return info;
}

citation_check_t engine::verify_citation(const attestation_id_t& citing_id,
                                         const attestation_id_t& cited_id,
                                         const std::string& cited_endpoint) const {
  return verifier_.check(zone::citation::citation_request{
      .citing_id = citing_id, .cited_id = cited_id, .endpoint = cited_endpoint});
}

std::vector<citation_check_t> engine::verify_citations(
    const std::vector<zone::citation::citation_request>& requests) const {
  return verifier_.check_many(requests);
}

result<anchor_t> engine::record_anchor(anchor_t anchor) {
  return anchors_.record(std::move(anchor));
}

zone_info_t engine::info() const {
  auto info = zone_info_t{};
  info.zone_id = identity_.zone_id();
  info.name = options_.name;
  info.description = options_.description;
  info.public_key_hex = identity_.public_key_hex();
  info.key_type = std::string{zone::crypto::to_string(identity_.algorithm())};
  info.canons = options_.canons;
  info.glsr = zone::crypto::glsr();
  return info;
}

const zone::crypto::identity& engine::identity() const {
  return identity_;
}

void engine::set_canon_policy(canon_policy_t policy) {
  canon_policy_ = std::move(policy);
}

void engine::set_clock(clock_source_t clock) {
  clock_ = std::move(clock);
}

zone::citation::citing_side engine::lookup_citing(
    const attestation_id_t& id) const {
  auto side = zone::citation::citing_side{};
  side.attestation = ledger_.get(id);
  if (auto version = ledger_.appended_version(id)) {
    side.anchor = anchors_.earliest_covering(*version);
  }
  return side;
}

}  // namespace zone::execution
