#include <confide/disclosure/disclosure_registry.hpp>
#include <confide/schema/key/keys.hpp>
#include <confide/testing/fixture.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

namespace {

using confide::schema::access_error_code;

confide::schema::record_id_t create(confide::testing::service_fixture& fixture,
                                    const std::string& owner,
                                    const std::string& content) {
  auto result = fixture.disclosures().create(owner, "note", content);
  EXPECT_TRUE(result.ok());
  return result.value->record_id;
}

}  // namespace

TEST(disclosure_registry, keyword_classifier_needs_target_and_intent) {
  auto classify = confide::disclosure::make_keyword_classifier();
  EXPECT_TRUE(classify("Confession", "I think I'm in love with him",
                       std::string{"Sam"}));
  EXPECT_TRUE(classify("My CRUSH", "", std::string{"Sam"}));
  EXPECT_FALSE(classify("Confession", "I think I'm in love", std::nullopt));
  EXPECT_FALSE(classify("Groceries", "milk and eggs", std::string{"Sam"}));
}

TEST(disclosure_registry, readers_are_owner_and_designated_reader) {
  auto fixture = confide::testing::service_fixture{"confide_disclosure_readers"};
  auto record = create(fixture, "alice", "I failed the exam");

  EXPECT_EQ(*fixture.disclosures().read(record, "alice").value,
            "I failed the exam");
  EXPECT_EQ(fixture.disclosures().read(record, "bob").code,
            access_error_code::authorization_denied);

  ASSERT_TRUE(
      fixture.disclosures().set_designated_reader(record, "alice", "bob").ok());
  EXPECT_TRUE(fixture.disclosures().read(record, "bob").ok());
  EXPECT_EQ(fixture.disclosures().readers(record),
            (std::vector<std::string>{"alice", "bob"}));
}

TEST(disclosure_registry, designated_reader_is_replaced_not_added) {
  auto fixture = confide::testing::service_fixture{"confide_disclosure_single"};
  auto record = create(fixture, "alice", "secret");

  ASSERT_TRUE(
      fixture.disclosures().set_designated_reader(record, "alice", "bob").ok());
  ASSERT_TRUE(
      fixture.disclosures().set_designated_reader(record, "alice", "bob").ok());
  auto replaced =
      fixture.disclosures().set_designated_reader(record, "alice", "carol");
  ASSERT_TRUE(replaced.ok());
  EXPECT_EQ(replaced.value->designated_reader,
            std::optional<std::string>{"carol"});

  EXPECT_FALSE(fixture.disclosures().read(record, "bob").ok());
  EXPECT_TRUE(fixture.disclosures().read(record, "carol").ok());
  EXPECT_EQ(fixture.disclosures().readers(record).size(), 2u);

  ASSERT_TRUE(fixture.disclosures().clear_designated_reader(record, "alice").ok());
  EXPECT_FALSE(fixture.disclosures().read(record, "carol").ok());
}

TEST(disclosure_registry, reader_changes_are_owner_only) {
  auto fixture = confide::testing::service_fixture{"confide_disclosure_owner"};
  auto record = create(fixture, "alice", "secret");

  EXPECT_EQ(fixture.disclosures().set_designated_reader(record, "bob", "bob").code,
            access_error_code::authorization_denied);
  EXPECT_EQ(
      fixture.disclosures().set_designated_reader(record, "alice", "alice").code,
      access_error_code::invalid_argument);
  EXPECT_EQ(fixture.disclosures().clear_designated_reader(record, "bob").log,
            "access denied");
}

TEST(disclosure_registry, missing_and_forbidden_records_look_identical) {
  auto fixture = confide::testing::service_fixture{"confide_disclosure_opaque"};
  auto record = create(fixture, "alice", "secret");

  auto forbidden = fixture.disclosures().read(record, "mallory");
  auto missing =
      fixture.disclosures().read(confide::testing::make_hash(8), "mallory");
  EXPECT_EQ(forbidden.code, missing.code);
  EXPECT_EQ(forbidden.log, missing.log);
  EXPECT_TRUE(fixture.disclosures().readers(confide::testing::make_hash(8)).empty());
}

TEST(disclosure_registry, create_rejects_self_target) {
  auto fixture = confide::testing::service_fixture{"confide_disclosure_self"};
  EXPECT_EQ(fixture.disclosures()
                .create("alice", "t", "c", std::string{"alice"})
                .code,
            access_error_code::invalid_argument);
  EXPECT_EQ(fixture.disclosures().create("", "t", "c").code,
            access_error_code::invalid_argument);
}

TEST(disclosure_registry, classifier_decides_romantic_flag) {
  auto fixture = confide::testing::service_fixture{
      "confide_disclosure_classifier", confide::config::options{},
      confide::disclosure::make_keyword_classifier()};

  auto romantic = fixture.disclosures().create(
      "alice", "about bob", "I have a crush on him", std::string{"bob"},
      std::string{"Bob"});
  ASSERT_TRUE(romantic.ok());
  EXPECT_TRUE(romantic.value->romantic);

  auto plain = fixture.disclosures().create(
      "alice", "about bob", "he owes me money", std::string{"bob"},
      std::string{"Bob"});
  ASSERT_TRUE(plain.ok());
  EXPECT_FALSE(plain.value->romantic);
}

TEST(disclosure_registry, read_with_session_uses_session_principal) {
  auto fixture = confide::testing::service_fixture{"confide_disclosure_session"};
  auto record = create(fixture, "alice", "secret");
  auto session = fixture.sessions().issue(
      "alice", "phone", 0.9, {confide::schema::session_factor_t::voice}, 60'000);
  auto other = fixture.sessions().issue(
      "bob", "phone", 0.9, {confide::schema::session_factor_t::voice}, 60'000);

  EXPECT_TRUE(
      fixture.disclosures().read_with_session(record, session.session_id).ok());
  EXPECT_EQ(fixture.disclosures().read_with_session(record, other.session_id).code,
            access_error_code::authorization_denied);

  fixture.clock().advance(60'000);
  EXPECT_EQ(
      fixture.disclosures().read_with_session(record, session.session_id).code,
      access_error_code::session_expired);
}

TEST(disclosure_registry, list_owned_in_creation_order) {
  auto fixture = confide::testing::service_fixture{"confide_disclosure_list"};
  create(fixture, "alice", "first");
  fixture.clock().advance(1'000);
  create(fixture, "alice", "second");
  create(fixture, "bob", "other");

  auto owned = fixture.disclosures().list_owned("alice");
  ASSERT_EQ(owned.size(), 2u);
  EXPECT_LT(owned[0].created_at, owned[1].created_at);
  EXPECT_EQ(*fixture.disclosures().read(owned[0].record_id, "alice").value,
            "first");
}

TEST(disclosure_registry, clear_target_withdraws_pending_intent) {
  auto fixture = confide::testing::service_fixture{"confide_disclosure_clear"};
  auto pending = fixture.disclosures().create("alice", "t", "I like bob",
                                              std::string{"bob"});
  ASSERT_TRUE(pending.ok());
  ASSERT_TRUE(
      fixture.disclosures().clear_target(pending.value->record_id, "alice").ok());

  auto reply = fixture.disclosures().create("bob", "t", "I like alice",
                                            std::string{"alice"});
  ASSERT_TRUE(reply.ok());
  EXPECT_FALSE(reply.value->matched);
  EXPECT_TRUE(fixture.disclosures().matches("alice").empty());
}

TEST(disclosure_registry, clear_target_never_undoes_a_match) {
  auto fixture = confide::testing::service_fixture{"confide_disclosure_keep"};
  auto first = fixture.disclosures().create("alice", "t", "I like bob",
                                            std::string{"bob"});
  auto second = fixture.disclosures().create("bob", "t", "I like alice",
                                             std::string{"alice"});
  ASSERT_TRUE(second.ok());
  ASSERT_TRUE(second.value->matched);

  EXPECT_EQ(
      fixture.disclosures().clear_target(first.value->record_id, "alice").code,
      access_error_code::invalid_argument);
  EXPECT_TRUE(fixture.disclosures().read(first.value->record_id, "bob").ok());
}

TEST(disclosure_registry, tampered_content_throws) {
  auto fixture = confide::testing::service_fixture{"confide_disclosure_tamper"};
  auto record = create(fixture, "alice", "secret");
  auto key = confide::schema::key::make_disclosure_key(fixture.encoder(), record);
  auto stored = fixture.storage().get<confide::schema::disclosure_record_t>(
      fixture.encoder(), key);
  ASSERT_TRUE(stored.has_value());
  stored->content.wrapped_key.front() ^= 0x01u;
  fixture.storage().put(fixture.encoder(), key, *stored);

  EXPECT_THROW(fixture.disclosures().read(record, "alice"),
               confide::crypto::decryption_error);
}
