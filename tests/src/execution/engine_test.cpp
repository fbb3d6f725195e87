#include <gtest/gtest.h>
#include <zone/attestation/builder.hpp>
#include <zone/crypto/hash.hpp>
#include <zone/crypto/verify.hpp>
#include <zone/execution/engine.hpp>
#include <zone/merkle/tree.hpp>
#include <zone/testing/fake_transport.hpp>
#include <zone/testing/fixtures.hpp>

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace {

using zone::testing::make_db_path;
using zone::testing::make_hash;
using zone::testing::remove_path;

// Routes fetches straight into other in-process engines.
class engine_transport final : public zone::citation::transport {
 public:
  void add(const std::string& endpoint, const zone::execution::engine* engine) {
    engines_[endpoint] = engine;
  }

  zone::citation::fetch_result fetch(const std::string& endpoint,
                                     const zone::schema::attestation_id_t& id,
                                     std::chrono::milliseconds) override {
    auto result = zone::citation::fetch_result{};
    auto found = engines_.find(endpoint);
    if (found == engines_.end()) {
      result.status = zone::citation::fetch_status::unreachable;
      return result;
    }
    auto served = found->second->serve_record(id);
    if (!served.ok()) {
      result.status = zone::citation::fetch_status::not_found;
      result.log = served.log;
      return result;
    }
    result.status = zone::citation::fetch_status::ok;
    result.record = std::move(*served.value);
    return result;
  }

 private:
  std::map<std::string, const zone::execution::engine*> engines_;
};

// One zone with its own database.
struct zone_under_test final {
  zone_under_test(const std::string& prefix,
                  const std::string_view secret,
                  std::shared_ptr<zone::citation::transport> transport,
                  std::vector<std::string> canons = {})
      : path{make_db_path(prefix)},
        storage{zone::storage::make_storage<zone::storage::rocksdb_storage_tag>(
            path)} {
    auto options = zone::execution::engine_options{};
    options.name = prefix;
    options.description = "test zone";
    options.canons = std::move(canons);
    engine = std::make_unique<zone::execution::engine>(
        encoder, storage, zone::testing::make_identity(secret),
        std::move(options), std::move(transport));
  }

  ~zone_under_test() {
    engine.reset();
    storage.database.reset();
    remove_path(path);
  }

  std::string path;
  zone::ledger::encoder_t encoder;
  zone::ledger::storage_t storage;
  std::unique_ptr<zone::execution::engine> engine;
};

zone::schema::submission_t make_submission(const uint8_t seed) {
  auto submission = zone::schema::submission_t{};
  submission.canon_id = zone::crypto::compute_canon_id(
      zone::crypto::kDefaultCanonName, zone::crypto::kDefaultCanonVersion);
  submission.claim_hash = make_hash(seed);
  submission.evidence_hash = make_hash(static_cast<uint8_t>(seed + 1));
  return submission;
}

zone::schema::anchor_t make_anchor(const zone::schema::hash32_t& root,
                                   const uint64_t timestamp) {
  auto anchor = zone::schema::anchor_t{};
  anchor.merkle_root = root;
  anchor.type = zone::schema::anchor_type::drand;
  anchor.external_timestamp = timestamp;
  anchor.reference = "round";
  return anchor;
}

class engine_test : public ::testing::Test {
 protected:
  void SetUp() override {
    if (!zone::crypto::available()) {
      GTEST_SKIP() << "crypto backend unavailable";
    }
    transport = std::make_shared<engine_transport>();
    local = std::make_unique<zone_under_test>("zone_engine_a",
                                              zone::testing::kEd25519Secret,
                                              transport);
    local->engine->set_clock([this] { return now; });
  }

  zone::execution::engine& engine() { return *local->engine; }

  int64_t now{1700000000};
  std::shared_ptr<engine_transport> transport;
  std::unique_ptr<zone_under_test> local;
};

}  // namespace

TEST_F(engine_test, submit_signs_with_the_engine_clock_and_appends) {
  auto submitted = engine().submit(make_submission(1));
  ASSERT_TRUE(submitted.ok()) << submitted.log;
  const auto& attestation = submitted.value->attestation;

  EXPECT_EQ(attestation.timestamp, 1700000000u);
  EXPECT_EQ(attestation.zone_id, engine().identity().zone_id());
  EXPECT_EQ(attestation.attestation_id,
            zone::attestation::compute_attestation_id(
                attestation.zone_id, attestation.canon_id,
                attestation.claim_hash, attestation.timestamp));
  EXPECT_EQ(zone::attestation::verify_attestation(attestation),
            zone::attestation::verification_outcome::valid);

  auto root = engine().current_root();
  EXPECT_EQ(root.leaf_count, 1u);
  EXPECT_EQ(root.root, attestation.attestation_id);
  EXPECT_FALSE(root.last_anchor.has_value());
  EXPECT_EQ(submitted.value->proof.root, root.root);
  EXPECT_FALSE(submitted.value->anchor.has_value());
}

TEST_F(engine_test, submit_returns_a_proof_against_the_new_root) {
  ASSERT_TRUE(engine().submit(make_submission(1)).ok());
  ASSERT_TRUE(engine().submit(make_submission(2)).ok());
  ASSERT_TRUE(engine()
                  .record_anchor(make_anchor(engine().current_root().root, 500))
                  .ok());

  auto third = engine().submit(make_submission(3));
  ASSERT_TRUE(third.ok()) << third.log;
  const auto& proof = third.value->proof;
  EXPECT_EQ(proof.leaf_hash, third.value->attestation.attestation_id);
  EXPECT_EQ(proof.root, engine().current_root().root);
  EXPECT_EQ(engine().current_root().leaf_count, 3u);
  EXPECT_TRUE(zone::merkle::verify_proof(proof, proof.root));
  EXPECT_FALSE(third.value->anchor.has_value());
}

TEST_F(engine_test, resubmitting_in_the_same_second_is_a_duplicate) {
  ASSERT_TRUE(engine().submit(make_submission(1)).ok());
  auto again = engine().submit(make_submission(1));
  EXPECT_EQ(again.code, zone::schema::error_code::duplicate_attestation);

  ++now;
  EXPECT_TRUE(engine().submit(make_submission(1)).ok());
  EXPECT_EQ(engine().current_root().leaf_count, 2u);
}

TEST_F(engine_test, negative_clock_is_rejected) {
  now = -1;
  auto submitted = engine().submit(make_submission(1));
  EXPECT_EQ(submitted.code, zone::schema::error_code::invalid_input);
  EXPECT_EQ(engine().current_root().leaf_count, 0u);
}

TEST_F(engine_test, canon_policy_limits_submissions) {
  auto restricted = zone_under_test{"zone_engine_canons",
                                    zone::testing::kEd25519Secret, transport,
                                    {"timestamp:1.0"}};
  auto accepted = restricted.engine->submit(make_submission(1));
  EXPECT_TRUE(accepted.ok()) << accepted.log;

  auto other = make_submission(2);
  other.canon_id = zone::crypto::compute_canon_id("weather", "2.0");
  EXPECT_EQ(restricted.engine->submit(other).code,
            zone::schema::error_code::invalid_input);

  restricted.engine->set_canon_policy(
      [](const zone::schema::canon_id_t&) { return true; });
  EXPECT_TRUE(restricted.engine->submit(other).ok());

  auto policy = zone::execution::make_canon_policy({"weather:2.0", "timestamp"});
  EXPECT_TRUE(policy(other.canon_id));
  EXPECT_TRUE(policy(make_submission(3).canon_id));
  EXPECT_FALSE(policy(zone::crypto::compute_canon_id("weather", "1.0")));
  EXPECT_TRUE(zone::execution::make_canon_policy({})(make_hash(1)));
}

TEST_F(engine_test, get_attestation_serves_a_proof_for_the_current_root) {
  EXPECT_EQ(engine().get_attestation(make_hash(1)).code,
            zone::schema::error_code::not_found);

  auto first = engine().submit(make_submission(1));
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(engine().submit(make_submission(2)).ok());
  ASSERT_TRUE(engine().submit(make_submission(3)).ok());

  const auto first_id = first.value->attestation.attestation_id;
  auto served = engine().get_attestation(first_id);
  ASSERT_TRUE(served.ok()) << served.log;
  EXPECT_EQ(served.value->attestation.attestation_id, first_id);
  EXPECT_EQ(served.value->proof.root, engine().current_root().root);
  EXPECT_TRUE(zone::merkle::verify_proof(served.value->proof,
                                         served.value->proof.root));
  EXPECT_FALSE(served.value->anchor.has_value());

  auto anchored =
      engine().record_anchor(make_anchor(engine().current_root().root, 900));
  ASSERT_TRUE(anchored.ok());
  served = engine().get_attestation(first_id);
  ASSERT_TRUE(served.ok());
  ASSERT_TRUE(served.value->anchor.has_value());
  EXPECT_EQ(served.value->anchor->external_timestamp, 900u);
}

TEST_F(engine_test, serve_record_proves_against_the_earliest_covering_anchor) {
  auto first = engine().submit(make_submission(1));
  ASSERT_TRUE(first.ok());
  auto early_root = engine().current_root().root;
  ASSERT_TRUE(engine().record_anchor(make_anchor(early_root, 100)).ok());

  ++now;
  auto second = engine().submit(make_submission(2));
  ASSERT_TRUE(second.ok());
  auto late_root = engine().current_root().root;
  ASSERT_NE(early_root, late_root);

  const auto first_id = first.value->attestation.attestation_id;
  auto served = engine().serve_record(first_id);
  ASSERT_TRUE(served.ok()) << served.log;
  EXPECT_EQ(served.value->proof.root, early_root);
  ASSERT_TRUE(served.value->anchor.has_value());
  EXPECT_EQ(served.value->anchor->merkle_root, early_root);
  EXPECT_TRUE(zone::merkle::verify_proof(served.value->proof, early_root));

  auto unanchored =
      engine().serve_record(second.value->attestation.attestation_id);
  ASSERT_TRUE(unanchored.ok());
  EXPECT_EQ(unanchored.value->proof.root, late_root);
  EXPECT_FALSE(unanchored.value->anchor.has_value());

  ASSERT_TRUE(engine().record_anchor(make_anchor(late_root, 200)).ok());
  served = engine().serve_record(first_id);
  ASSERT_TRUE(served.ok());
  EXPECT_EQ(served.value->anchor->external_timestamp, 100u);
  EXPECT_EQ(engine().current_root().last_anchor->external_timestamp, 200u);

  EXPECT_EQ(engine().serve_record(make_hash(9)).code,
            zone::schema::error_code::not_found);
}

TEST_F(engine_test, record_anchor_rejects_foreign_roots) {
  EXPECT_EQ(engine().record_anchor(make_anchor(make_hash(4), 1)).code,
            zone::schema::error_code::invalid_input);
}

TEST_F(engine_test, info_describes_the_zone) {
  auto info = engine().info();
  EXPECT_EQ(info.zone_id, engine().identity().zone_id());
  EXPECT_EQ(info.name, "zone_engine_a");
  EXPECT_EQ(info.description, "test zone");
  EXPECT_EQ(info.key_type, "ed25519");
  EXPECT_EQ(info.public_key_hex, engine().identity().public_key_hex());
  EXPECT_EQ(info.glsr, zone::crypto::glsr());
  EXPECT_EQ(info.api_version, zone::schema::kApiVersion);
}

TEST_F(engine_test, citations_across_zones_follow_anchor_order) {
  auto remote = zone_under_test{"zone_engine_b",
                                zone::testing::kOtherEd25519Secret, transport};
  remote.engine->set_clock([] { return int64_t{1700000500}; });
  transport->add("zone-b:7443", remote.engine.get());

  auto cited = remote.engine->submit(make_submission(10));
  ASSERT_TRUE(cited.ok()) << cited.log;
  const auto cited_id = cited.value->attestation.attestation_id;

  auto citing_submission = make_submission(20);
  citing_submission.citations = {cited_id};
  auto citing = engine().submit(citing_submission);
  ASSERT_TRUE(citing.ok()) << citing.log;
  const auto citing_id = citing.value->attestation.attestation_id;

  // Nothing anchored yet.
  EXPECT_EQ(engine().verify_citation(citing_id, cited_id, "zone-b:7443").reason,
            zone::schema::citation_reason::cited_unanchored);

  ASSERT_TRUE(remote.engine
                  ->record_anchor(
                      make_anchor(remote.engine->current_root().root, 1000))
                  .ok());
  EXPECT_EQ(engine().verify_citation(citing_id, cited_id, "zone-b:7443").reason,
            zone::schema::citation_reason::citing_unanchored);

  ASSERT_TRUE(engine()
                  .record_anchor(make_anchor(engine().current_root().root, 2000))
                  .ok());
  auto check = engine().verify_citation(citing_id, cited_id, "zone-b:7443");
  EXPECT_TRUE(check.valid());
  EXPECT_EQ(check.reason, zone::schema::citation_reason::verified);

  EXPECT_EQ(engine().verify_citation(citing_id, cited_id, "zone-c:7443").reason,
            zone::schema::citation_reason::cited_unreachable);
  EXPECT_EQ(
      engine().verify_citation(citing_id, make_hash(1), "zone-b:7443").reason,
      zone::schema::citation_reason::citation_not_listed);
  EXPECT_EQ(engine().verify_citation(cited_id, citing_id, "zone-b:7443").reason,
            zone::schema::citation_reason::citing_unknown);

  auto checks = engine().verify_citations(
      {{.citing_id = citing_id, .cited_id = cited_id, .endpoint = "zone-b:7443"},
       {.citing_id = citing_id, .cited_id = cited_id, .endpoint = "zone-c:7443"}});
  ASSERT_EQ(checks.size(), 2u);
  EXPECT_TRUE(checks[0].valid());
  EXPECT_FALSE(checks[1].valid());

  // An earlier local anchor now orders the citing attestation first.
  ASSERT_TRUE(engine()
                  .record_anchor(make_anchor(engine().current_root().root, 1000))
                  .ok());
  EXPECT_EQ(engine().verify_citation(citing_id, cited_id, "zone-b:7443").reason,
            zone::schema::citation_reason::ordering_violation);
}
