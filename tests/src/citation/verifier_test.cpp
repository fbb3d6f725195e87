#include <gtest/gtest.h>
#include <zone/citation/verifier.hpp>
#include <zone/crypto/verify.hpp>
#include <zone/merkle/tree.hpp>
#include <zone/testing/fake_transport.hpp>
#include <zone/testing/fixtures.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace {

using namespace std::chrono_literals;
using zone::schema::citation_reason;
using zone::testing::make_attestation;
using zone::testing::make_identity;

zone::schema::anchor_t make_anchor(const zone::schema::hash32_t& root,
                                   const uint64_t timestamp) {
  auto anchor = zone::schema::anchor_t{};
  anchor.merkle_root = root;
  anchor.type = zone::schema::anchor_type::bitcoin;
  anchor.external_timestamp = timestamp;
  anchor.reference = "block";
  return anchor;
}

// A remote zone holding `cited` and a local zone holding `citing`, with the
// remote anchor strictly earlier than the local one.
class citation_verifier : public ::testing::Test {
 protected:
  void SetUp() override {
    if (!zone::crypto::available()) {
      GTEST_SKIP() << "crypto backend unavailable";
    }
    auto remote = make_identity(zone::testing::kOtherEd25519Secret);
    auto local = make_identity();

    cited = make_attestation(remote, 1, 1700000000);
    auto neighbour = make_attestation(remote, 2, 1700000001);
    auto proof = zone::merkle::build_proof(
        {cited.attestation_id, neighbour.attestation_id},
        cited.attestation_id);
    ASSERT_TRUE(proof.ok());

    record.attestation = cited;
    record.proof = *proof.value;
    record.anchor = make_anchor(record.proof.root, 1000);

    citing.attestation = make_attestation(local, 3, 1700000100,
                                           {cited.attestation_id});
    citing.anchor = make_anchor(zone::testing::make_hash(50), 2000);

    transport = std::make_shared<zone::testing::fake_transport>();
    transport->serve_record(kEndpoint, record);
  }

  zone::citation::verifier make_verifier() {
    return zone::citation::verifier{
        transport,
        [this](const zone::schema::attestation_id_t& id) {
          if (citing.attestation && citing.attestation->attestation_id == id) {
            return citing;
          }
          return zone::citation::citing_side{};
        },
        250ms};
  }

  zone::citation::citation_request request() const {
    return zone::citation::citation_request{
        .citing_id = citing.attestation->attestation_id,
        .cited_id = cited.attestation_id,
        .endpoint = kEndpoint};
  }

  citation_reason check_reason() {
    return make_verifier().check(request()).reason;
  }

  static constexpr auto kEndpoint = "remote.zone:7443";

  zone::schema::attestation_t cited;
  zone::schema::served_record_t record;
  zone::citation::citing_side citing;
  std::shared_ptr<zone::testing::fake_transport> transport;
};

}  // namespace

TEST_F(citation_verifier, earlier_anchored_citation_is_valid) {
  auto check = make_verifier().check(request());
  EXPECT_TRUE(check.valid());
  EXPECT_EQ(check.reason, citation_reason::verified);
  ASSERT_TRUE(check.cited_anchor.has_value());
  ASSERT_TRUE(check.citing_anchor.has_value());
  EXPECT_EQ(check.cited_anchor->external_timestamp, 1000u);
  EXPECT_EQ(check.citing_anchor->external_timestamp, 2000u);
  EXPECT_EQ(transport->last_timeout(), 250ms);
}

TEST_F(citation_verifier, unknown_citing_attestation_skips_the_fetch) {
  auto verifier = make_verifier();
  auto unknown = request();
  unknown.citing_id = zone::testing::make_hash(99);
  EXPECT_EQ(verifier.check(unknown).reason, citation_reason::citing_unknown);
  EXPECT_EQ(transport->calls(), 0);
}

TEST_F(citation_verifier, cited_id_must_be_listed_by_the_citing_attestation) {
  citing.attestation->citations.clear();
  EXPECT_EQ(check_reason(), citation_reason::citation_not_listed);
  EXPECT_EQ(transport->calls(), 0);
}

TEST_F(citation_verifier, transport_failures_are_invalid_not_errors) {
  auto not_found = zone::citation::fetch_result{};
  not_found.status = zone::citation::fetch_status::not_found;
  transport->serve(kEndpoint, not_found);
  EXPECT_EQ(check_reason(), citation_reason::cited_not_found);

  auto malformed = zone::citation::fetch_result{};
  malformed.status = zone::citation::fetch_status::malformed;
  transport->serve(kEndpoint, malformed);
  EXPECT_EQ(check_reason(), citation_reason::malformed_response);

  auto empty = zone::citation::fetch_result{};
  empty.status = zone::citation::fetch_status::ok;
  transport->serve(kEndpoint, empty);
  EXPECT_EQ(check_reason(), citation_reason::malformed_response);

  auto verifier = make_verifier();
  auto elsewhere = request();
  elsewhere.endpoint = "nowhere:1";
  EXPECT_EQ(verifier.check(elsewhere).reason,
            citation_reason::cited_unreachable);

  transport->throw_on(kEndpoint);
  EXPECT_EQ(check_reason(), citation_reason::cited_unreachable);
}

TEST_F(citation_verifier, served_record_must_match_the_cited_leaf) {
  auto swapped = record;
  swapped.proof.leaf_hash = zone::testing::make_hash(7);
  transport->serve_record(kEndpoint, swapped);
  EXPECT_EQ(check_reason(), citation_reason::leaf_mismatch);

  auto other = record;
  other.attestation.attestation_id = zone::testing::make_hash(8);
  transport->serve_record(kEndpoint, other);
  EXPECT_EQ(check_reason(), citation_reason::leaf_mismatch);
}

TEST_F(citation_verifier, broken_proof_is_rejected) {
  auto broken = record;
  broken.proof.root[0] ^= 0x01;
  broken.anchor->merkle_root = broken.proof.root;
  transport->serve_record(kEndpoint, broken);
  EXPECT_EQ(check_reason(), citation_reason::proof_invalid);
}

TEST_F(citation_verifier, forged_attestation_is_rejected) {
  auto forged = record;
  forged.attestation.evidence_hash[0] ^= 0x01;
  transport->serve_record(kEndpoint, forged);
  EXPECT_EQ(check_reason(), citation_reason::attestation_invalid);
}

TEST_F(citation_verifier, anchors_are_required_on_both_sides) {
  auto unanchored = record;
  unanchored.anchor.reset();
  transport->serve_record(kEndpoint, unanchored);
  EXPECT_EQ(check_reason(), citation_reason::cited_unanchored);

  auto misbound = record;
  misbound.anchor->merkle_root = zone::testing::make_hash(60);
  transport->serve_record(kEndpoint, misbound);
  EXPECT_EQ(check_reason(), citation_reason::anchor_root_mismatch);

  transport->serve_record(kEndpoint, record);
  citing.anchor.reset();
  EXPECT_EQ(check_reason(), citation_reason::citing_unanchored);
}

TEST_F(citation_verifier, cited_anchor_must_be_strictly_earlier) {
  citing.anchor->external_timestamp = 1000;
  auto tie = make_verifier().check(request());
  EXPECT_FALSE(tie.valid());
  EXPECT_EQ(tie.reason, citation_reason::ordering_violation);
  EXPECT_TRUE(tie.cited_anchor.has_value());
  EXPECT_TRUE(tie.citing_anchor.has_value());

  citing.anchor->external_timestamp = 999;
  EXPECT_EQ(check_reason(), citation_reason::ordering_violation);
}

TEST_F(citation_verifier, attestation_timestamps_do_not_order_citations) {
  // The cited attestation claims a later time than the citing one, but the
  // anchors still order them correctly.
  auto remote = make_identity(zone::testing::kOtherEd25519Secret);
  auto late_claim = make_attestation(remote, 4, 1800000000);
  auto proof = zone::merkle::build_proof({late_claim.attestation_id},
                                         late_claim.attestation_id);
  ASSERT_TRUE(proof.ok());
  auto late_record = zone::schema::served_record_t{};
  late_record.attestation = late_claim;
  late_record.proof = *proof.value;
  late_record.anchor = make_anchor(late_record.proof.root, 1000);
  transport->serve_record(kEndpoint, late_record);
  citing.attestation->citations = {late_claim.attestation_id};

  auto late_request = request();
  late_request.cited_id = late_claim.attestation_id;
  EXPECT_TRUE(make_verifier().check(late_request).valid());
}

TEST_F(citation_verifier, check_many_keeps_request_order) {
  transport->set_delay(5ms);
  auto verifier = make_verifier();
  auto requests = std::vector<zone::citation::citation_request>{};
  requests.push_back(request());
  auto unreachable = request();
  unreachable.endpoint = "nowhere:1";
  requests.push_back(unreachable);
  auto unknown = request();
  unknown.citing_id = zone::testing::make_hash(99);
  requests.push_back(unknown);
  requests.push_back(request());

  auto checks = verifier.check_many(requests);
  ASSERT_EQ(checks.size(), 4u);
  EXPECT_EQ(checks[0].reason, citation_reason::verified);
  EXPECT_EQ(checks[1].reason, citation_reason::cited_unreachable);
  EXPECT_EQ(checks[2].reason, citation_reason::citing_unknown);
  EXPECT_EQ(checks[3].reason, citation_reason::verified);
  EXPECT_EQ(transport->calls(), 3);
}

TEST_F(citation_verifier, stalled_zone_times_out_without_blocking_others) {
  constexpr auto kStalled = "stalled.zone:7443";
  transport->serve_record(kStalled, record);
  transport->stall(kStalled, 1500ms);
  auto verifier = make_verifier();
  auto stalled = request();
  stalled.endpoint = kStalled;

  auto started = std::chrono::steady_clock::now();
  auto single = verifier.check(stalled);
  auto elapsed = std::chrono::steady_clock::now() - started;
  EXPECT_FALSE(single.valid());
  EXPECT_EQ(single.reason, citation_reason::cited_unreachable);
  EXPECT_LT(elapsed, 1000ms);

  started = std::chrono::steady_clock::now();
  auto checks = verifier.check_many({stalled, request()});
  elapsed = std::chrono::steady_clock::now() - started;
  ASSERT_EQ(checks.size(), 2u);
  EXPECT_EQ(checks[0].reason, citation_reason::cited_unreachable);
  EXPECT_EQ(checks[1].reason, citation_reason::verified);
  EXPECT_LT(elapsed, 1000ms);
  EXPECT_EQ(transport->last_timeout(), 250ms);
}
