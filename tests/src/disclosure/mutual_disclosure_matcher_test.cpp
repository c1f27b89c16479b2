#include <confide/disclosure/mutual_disclosure_matcher.hpp>
#include <confide/testing/fixture.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

confide::schema::disclosure_record_t make_record(
    const std::string& owner,
    const std::optional<std::string>& target,
    const bool romantic) {
  return confide::schema::disclosure_record_t{.record_id =
                                                  confide::crypto::random_id(),
                                              .owner = owner,
                                              .romantic = romantic,
                                              .target_id = target};
}

}  // namespace

TEST(mutual_disclosure_matcher, reciprocates_requires_both_directions) {
  auto alice = make_record("alice", std::string{"bob"}, true);
  auto bob = make_record("bob", std::string{"alice"}, true);
  auto carol = make_record("carol", std::string{"alice"}, true);
  auto plain = make_record("bob", std::string{"alice"}, false);

  EXPECT_TRUE(confide::disclosure::reciprocates(alice, bob));
  EXPECT_TRUE(confide::disclosure::reciprocates(bob, alice));
  EXPECT_FALSE(confide::disclosure::reciprocates(alice, carol));
  EXPECT_FALSE(confide::disclosure::reciprocates(alice, plain));
  EXPECT_FALSE(confide::disclosure::reciprocates(alice, alice));
}

TEST(mutual_disclosure_matcher, reciprocal_records_match_together) {
  auto fixture = confide::testing::service_fixture{"confide_match_pair"};
  auto events = std::vector<confide::schema::match_event_t>{};
  fixture.disclosures().set_match_listener(
      [&](const auto& event) { events.push_back(event); });

  auto first = fixture.disclosures().create("alice", "t", "I like bob",
                                            std::string{"bob"},
                                            std::string{"Bob"});
  ASSERT_TRUE(first.ok());
  EXPECT_FALSE(first.value->matched);
  EXPECT_FALSE(fixture.disclosures().read(first.value->record_id, "bob").ok());
  EXPECT_TRUE(events.empty());

  fixture.clock().advance(5'000);
  auto second = fixture.disclosures().create("bob", "t", "I like alice",
                                             std::string{"alice"},
                                             std::string{"Alice"});
  ASSERT_TRUE(second.ok());
  EXPECT_TRUE(second.value->matched);

  auto state = fixture.disclosures().matcher().match_state(
      first.value->record_id, second.value->record_id);
  ASSERT_TRUE(state.first.has_value());
  ASSERT_TRUE(state.second.has_value());
  EXPECT_TRUE(state.first->matched);
  EXPECT_TRUE(state.second->matched);
  EXPECT_EQ(state.first->matched_at, state.second->matched_at);
  EXPECT_EQ(state.first->matched_at,
            std::optional<uint64_t>{confide::testing::kStartTime + 5'000});

  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].first_principal, "alice");
  EXPECT_EQ(events[0].second_principal, "bob");
  EXPECT_EQ(events[0].first_record, first.value->record_id);
  EXPECT_EQ(events[0].second_record, second.value->record_id);

  EXPECT_TRUE(fixture.disclosures().read(first.value->record_id, "bob").ok());
  EXPECT_TRUE(fixture.disclosures().read(second.value->record_id, "alice").ok());
  EXPECT_EQ(fixture.disclosures().matches("alice").size(), 1u);
  EXPECT_EQ(fixture.disclosures().matches("bob").size(), 1u);
  EXPECT_TRUE(fixture.disclosures().matches("carol").empty());
  EXPECT_TRUE(
      fixture.disclosures().matcher().find_match("bob", "alice").has_value());
}

TEST(mutual_disclosure_matcher, later_records_join_without_renotifying) {
  auto fixture = confide::testing::service_fixture{"confide_match_once"};
  auto notifications = 0;
  fixture.disclosures().set_match_listener([&](const auto&) { ++notifications; });

  fixture.disclosures().create("alice", "t", "a", std::string{"bob"});
  fixture.disclosures().create("bob", "t", "b", std::string{"alice"});
  fixture.clock().advance(1'000);
  auto third = fixture.disclosures().create("alice", "t", "c", std::string{"bob"});

  ASSERT_TRUE(third.ok());
  EXPECT_TRUE(third.value->matched);
  EXPECT_EQ(third.value->matched_at,
            std::optional<uint64_t>{confide::testing::kStartTime});
  EXPECT_EQ(notifications, 1);
  EXPECT_EQ(fixture.disclosures().matches("alice").size(), 1u);
}

TEST(mutual_disclosure_matcher, match_listener_can_create_for_the_same_pair) {
  auto fixture = confide::testing::service_fixture{"confide_match_reentrant"};
  auto notifications = 0;
  auto follow_up = std::optional<confide::schema::disclosure_record_t>{};
  fixture.disclosures().set_match_listener([&](const auto& event) {
    ++notifications;
    auto reply = fixture.disclosures().create(event.first_principal, "t",
                                              "see you tonight",
                                              event.second_principal);
    if (reply.ok()) {
      follow_up = *reply.value;
    }
  });

  fixture.disclosures().create("alice", "t", "a", std::string{"bob"});
  auto second =
      fixture.disclosures().create("bob", "t", "b", std::string{"alice"});

  ASSERT_TRUE(second.ok());
  EXPECT_TRUE(second.value->matched);
  ASSERT_TRUE(follow_up.has_value());
  EXPECT_EQ(follow_up->owner, "alice");
  EXPECT_TRUE(follow_up->matched);
  EXPECT_EQ(notifications, 1);
  EXPECT_EQ(fixture.disclosures().matches("alice").size(), 1u);
}

TEST(mutual_disclosure_matcher, one_sided_or_misdirected_intent_stays_pending) {
  auto fixture = confide::testing::service_fixture{"confide_match_none"};
  auto notifications = 0;
  fixture.disclosures().set_match_listener([&](const auto&) { ++notifications; });

  auto alice = fixture.disclosures().create("alice", "t", "a", std::string{"bob"});
  auto bob = fixture.disclosures().create("bob", "t", "b", std::string{"carol"});
  auto carol = fixture.disclosures().create("carol", "t", "c");

  EXPECT_FALSE(bob.value->matched);
  EXPECT_FALSE(carol.value->matched);
  auto state = fixture.disclosures().matcher().match_state(
      alice.value->record_id, bob.value->record_id);
  EXPECT_FALSE(state.first->matched);
  EXPECT_FALSE(state.second->matched);
  EXPECT_EQ(notifications, 0);
}

TEST(mutual_disclosure_matcher, non_romantic_records_never_match) {
  auto fixture = confide::testing::service_fixture{
      "confide_match_plain", confide::config::options{},
      [](std::string_view, const std::string_view content,
         const std::optional<std::string>&) {
        return content.find("love") != std::string_view::npos;
      }};

  fixture.disclosures().create("alice", "t", "I love bob", std::string{"bob"});
  auto reply = fixture.disclosures().create("bob", "t", "alice owes me lunch",
                                            std::string{"alice"});
  ASSERT_TRUE(reply.ok());
  EXPECT_FALSE(reply.value->romantic);
  EXPECT_FALSE(reply.value->matched);
  EXPECT_TRUE(fixture.disclosures().matches("alice").empty());
}

TEST(mutual_disclosure_matcher, concurrent_reciprocal_creation_notifies_once) {
  for (auto round = 0; round < 10; ++round) {
    auto fixture = confide::testing::service_fixture{"confide_match_race"};
    auto notifications = std::atomic<int>{0};
    fixture.disclosures().set_match_listener(
        [&](const auto&) { ++notifications; });

    auto ids = std::vector<confide::schema::record_id_t>(2);
    auto start = std::atomic<bool>{false};
    auto left = std::thread{[&] {
      while (!start.load()) {
      }
      ids[0] = fixture.disclosures()
                   .create("alice", "t", "a", std::string{"bob"})
                   .value->record_id;
    }};
    auto right = std::thread{[&] {
      while (!start.load()) {
      }
      ids[1] = fixture.disclosures()
                   .create("bob", "t", "b", std::string{"alice"})
                   .value->record_id;
    }};
    start = true;
    left.join();
    right.join();

    EXPECT_EQ(notifications.load(), 1);
    auto state = fixture.disclosures().matcher().match_state(ids[0], ids[1]);
    ASSERT_TRUE(state.first.has_value());
    ASSERT_TRUE(state.second.has_value());
    EXPECT_TRUE(state.first->matched);
    EXPECT_TRUE(state.second->matched);
  }
}
