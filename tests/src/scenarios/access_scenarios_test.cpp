#include <confide/testing/fixture.hpp>
#include <gtest/gtest.h>

#include <string>
#include <variant>
#include <vector>

namespace {

using confide::schema::access_error_code;
using confide::schema::knowledge_access_level_t;
using confide::schema::secrecy_tier_t;

}  // namespace

TEST(access_scenarios, confident_voice_opens_the_vault) {
  auto fixture = confide::testing::service_fixture{"confide_scenario_voice"};
  fixture.enroll("alice");
  auto record = fixture.vault().put("alice", secrecy_tier_t::secret, "bank",
                                    "iban DE89 3704");
  ASSERT_TRUE(record.ok());

  auto result = fixture.verify("alice", fixture.sample_at("alice", 0.92), "phone");
  ASSERT_TRUE(std::holds_alternative<confide::auth::authenticated_t>(result));
  const auto session = std::get<confide::auth::authenticated_t>(result).session;

  auto read = fixture.vault().get_with_session(record.value->record_id,
                                               session.session_id);
  ASSERT_TRUE(read.ok());
  EXPECT_EQ(*read.value, "iban DE89 3704");

  ASSERT_TRUE(fixture.authenticator().logout(session.session_id));
  EXPECT_EQ(fixture.vault()
                .get_with_session(record.value->record_id, session.session_id)
                .code,
            access_error_code::session_not_found);
}

TEST(access_scenarios, hesitant_voice_passes_through_a_challenge) {
  auto fixture = confide::testing::service_fixture{"confide_scenario_challenge"};
  fixture.authenticator().register_principal("alice", "Alice Moreau");
  fixture.enroll("alice");
  auto record = fixture.vault().put("alice", secrecy_tier_t::confidential,
                                    "plans", "move to Lisbon");
  ASSERT_TRUE(record.ok());

  auto result = fixture.verify("alice", fixture.sample_at("alice", 0.75), "phone");
  ASSERT_TRUE(std::holds_alternative<confide::auth::challenge_required_t>(result));
  const auto challenges =
      std::get<confide::auth::challenge_required_t>(result).challenges;
  ASSERT_FALSE(challenges.empty());

  auto wrong = std::vector<confide::schema::challenge_response_t>{};
  for (const auto& challenge : challenges) {
    wrong.push_back({.challenge_id = challenge.challenge_id, .answer = "nope"});
  }
  EXPECT_FALSE(fixture.challenges().verify("alice", "phone", wrong).ok());
  EXPECT_TRUE(fixture.challenges().has_pending("alice"));

  auto right = std::vector<confide::schema::challenge_response_t>{};
  for (const auto& challenge : challenges) {
    right.push_back(
        {.challenge_id = challenge.challenge_id, .answer = "alice moreau"});
  }
  auto session = fixture.challenges().verify("alice", "phone", right);
  ASSERT_TRUE(session.ok()) << session.log;
  EXPECT_TRUE(session.value->has_factor(confide::schema::session_factor_t::voice));
  EXPECT_TRUE(
      session.value->has_factor(confide::schema::session_factor_t::challenge));

  auto read = fixture.vault().get_with_session(record.value->record_id,
                                               session.value->session_id);
  ASSERT_TRUE(read.ok());
  EXPECT_EQ(*read.value, "move to Lisbon");
}

TEST(access_scenarios, trusted_contact_reads_by_knowledge_level) {
  auto fixture = confide::testing::service_fixture{"confide_scenario_contact"};
  auto personal = fixture.vault().put("alice", secrecy_tier_t::personal, "p",
                                      "allergic to cats");
  auto secret =
      fixture.vault().put("alice", secrecy_tier_t::secret, "s", "safe code 0420");
  ASSERT_TRUE(personal.ok());
  ASSERT_TRUE(secret.ok());

  fixture.contacts().upsert(confide::schema::contact_profile_t{
      .owner = "alice",
      .contact_id = "bob",
      .display_name = "Bob",
      .relationship = confide::schema::relationship_type_t::friend_,
      .knowledge_access = knowledge_access_level_t::personal});

  EXPECT_TRUE(fixture.vault().get(personal.value->record_id, "bob").ok());
  auto denied = fixture.vault().get(secret.value->record_id, "bob");
  EXPECT_EQ(denied.code, access_error_code::authorization_denied);

  ASSERT_TRUE(fixture.vault()
                  .authorize(secret.value->record_id, "alice", "bob")
                  .ok());
  auto granted = fixture.vault().get(secret.value->record_id, "bob");
  ASSERT_TRUE(granted.ok());
  EXPECT_EQ(*granted.value, "safe code 0420");

  auto log = fixture.vault().access_log(secret.value->record_id, "alice");
  ASSERT_TRUE(log.ok());
  ASSERT_EQ(log.value->size(), 2u);
  EXPECT_FALSE(log.value->at(0).success);
  EXPECT_TRUE(log.value->at(1).success);
}

TEST(access_scenarios, mutual_disclosure_unlocks_both_records) {
  auto fixture = confide::testing::service_fixture{"confide_scenario_mutual"};
  fixture.enroll("alice");
  fixture.enroll("bob");
  auto matched = std::vector<confide::schema::match_event_t>{};
  fixture.disclosures().set_match_listener(
      [&](const auto& event) { matched.push_back(event); });

  auto from_alice = fixture.disclosures().create(
      "alice", "about bob", "I have feelings for Bob", std::string{"bob"},
      std::string{"Bob"});
  ASSERT_TRUE(from_alice.ok());

  auto bob_login = fixture.verify("bob", "bob-enroll");
  ASSERT_TRUE(std::holds_alternative<confide::auth::authenticated_t>(bob_login));
  const auto bob_session =
      std::get<confide::auth::authenticated_t>(bob_login).session;
  EXPECT_EQ(fixture.disclosures()
                .read_with_session(from_alice.value->record_id,
                                   bob_session.session_id)
                .code,
            access_error_code::authorization_denied);

  auto from_bob = fixture.disclosures().create(
      "bob", "about alice", "I have a crush on Alice", std::string{"alice"},
      std::string{"Alice"});
  ASSERT_TRUE(from_bob.ok());
  EXPECT_TRUE(from_bob.value->matched);
  ASSERT_EQ(matched.size(), 1u);

  auto bob_reads = fixture.disclosures().read_with_session(
      from_alice.value->record_id, bob_session.session_id);
  ASSERT_TRUE(bob_reads.ok());
  EXPECT_EQ(*bob_reads.value, "I have feelings for Bob");

  auto alice_login = fixture.verify("alice", "alice-enroll");
  ASSERT_TRUE(std::holds_alternative<confide::auth::authenticated_t>(alice_login));
  auto alice_reads = fixture.disclosures().read_with_session(
      from_bob.value->record_id,
      std::get<confide::auth::authenticated_t>(alice_login).session.session_id);
  ASSERT_TRUE(alice_reads.ok());
  EXPECT_EQ(*alice_reads.value, "I have a crush on Alice");

  EXPECT_FALSE(fixture.disclosures().read(from_alice.value->record_id, "carol").ok());
}
