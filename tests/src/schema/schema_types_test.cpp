#include <confide/schema/access_result.hpp>
#include <confide/schema/auth_session.hpp>
#include <confide/schema/encoding/scale/encoder.hpp>
#include <confide/schema/key/keys.hpp>
#include <confide/schema/knowledge_access_level.hpp>
#include <confide/schema/relationship_type.hpp>
#include <confide/schema/secrecy_tier.hpp>
#include <confide/schema/secret_record.hpp>
#include <confide/testing/common.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

namespace {

using encoder_t = confide::schema::encoding::scale_encoder_t;

}  // namespace

TEST(schema_types, secrecy_tier_strings_round_trip) {
  for (const auto& [name, tier] : confide::schema::kSecrecyTierMappings) {
    EXPECT_EQ(confide::schema::to_string(tier), name);
    EXPECT_EQ(
        confide::schema::try_from_string<confide::schema::secrecy_tier_t>(name),
        tier);
  }
  EXPECT_FALSE(confide::schema::try_from_string<confide::schema::secrecy_tier_t>(
                   "top_secret")
                   .has_value());
}

TEST(schema_types, enum_names_accept_operator_spelling) {
  using confide::schema::secrecy_tier_t;
  EXPECT_EQ(confide::schema::try_from_string<secrecy_tier_t>("Ultra-Secret"),
            secrecy_tier_t::ultra_secret);
  EXPECT_EQ(confide::schema::try_from_string<secrecy_tier_t>("CONFIDENTIAL"),
            secrecy_tier_t::confidential);
  EXPECT_FALSE(confide::schema::try_from_string<secrecy_tier_t>("ultra secret")
                   .has_value());
  EXPECT_FALSE(
      confide::schema::try_from_string<secrecy_tier_t>("").has_value());
  EXPECT_EQ(confide::schema::to_string(static_cast<secrecy_tier_t>(9)),
            confide::schema::kUnknownEnumName);
}

TEST(schema_types, relationship_friend_uses_plain_name) {
  EXPECT_EQ(confide::schema::to_string(
                confide::schema::relationship_type_t::friend_),
            "friend");
  EXPECT_EQ(confide::schema::try_from_string<
                confide::schema::relationship_type_t>("friend"),
            confide::schema::relationship_type_t::friend_);
}

TEST(schema_types, required_knowledge_level_per_tier) {
  using confide::schema::knowledge_access_level_t;
  using confide::schema::secrecy_tier_t;
  EXPECT_EQ(confide::schema::required_knowledge_level(secrecy_tier_t::secret),
            knowledge_access_level_t::personal);
  EXPECT_EQ(
      confide::schema::required_knowledge_level(secrecy_tier_t::confidential),
      knowledge_access_level_t::secret);
  EXPECT_EQ(
      confide::schema::required_knowledge_level(secrecy_tier_t::ultra_secret),
      knowledge_access_level_t::secret);
  EXPECT_LT(knowledge_access_level_t::personal, knowledge_access_level_t::secret);
}

TEST(schema_types, access_denied_shape_is_fixed) {
  auto denied = confide::schema::make_access_denied<std::string>("confide.vault");
  EXPECT_FALSE(denied.ok());
  EXPECT_EQ(denied.code, confide::schema::access_error_code::authorization_denied);
  EXPECT_EQ(denied.log, "access denied");
  EXPECT_FALSE(denied.value.has_value());

  auto ok = confide::schema::make_ok(std::string{"x"}, "confide.vault");
  EXPECT_TRUE(ok.ok());
  EXPECT_EQ(*ok.value, "x");
}

TEST(schema_types, session_validity_is_exclusive_of_expiry) {
  auto session = confide::schema::auth_session_t{
      .expires_at = 1'000,
      .factors = {confide::schema::session_factor_t::voice}};
  EXPECT_TRUE(session.valid_at(999));
  EXPECT_FALSE(session.valid_at(1'000));
  EXPECT_TRUE(session.has_factor(confide::schema::session_factor_t::voice));
  EXPECT_FALSE(session.has_factor(confide::schema::session_factor_t::challenge));
}

TEST(schema_types, secret_record_scale_round_trips) {
  auto encoder = encoder_t{};
  auto record = confide::schema::secret_record_t{
      .record_id = confide::testing::make_hash(3),
      .owner = "alice",
      .title = "diary",
      .tier = confide::schema::secrecy_tier_t::confidential,
      .content = {.wrapped_key = {1, 2, 3}, .ciphertext = {4, 5}},
      .authorized = {"bob", "carol"},
      .access_count = 2,
      .log_sequence = 5,
      .last_accessed_at = 77,
      .created_at = 11};
  auto decoded =
      encoder.decode<confide::schema::secret_record_t>(encoder.encode(record));
  EXPECT_EQ(decoded.version, 1u);
  EXPECT_EQ(decoded.record_id, record.record_id);
  EXPECT_EQ(decoded.owner, "alice");
  EXPECT_EQ(decoded.tier, confide::schema::secrecy_tier_t::confidential);
  EXPECT_EQ(decoded.content.wrapped_key, record.content.wrapped_key);
  EXPECT_EQ(decoded.authorized, record.authorized);
  EXPECT_EQ(decoded.last_accessed_at, std::optional<uint64_t>{77});
  EXPECT_EQ(decoded.status, confide::schema::record_status_t::active);
  EXPECT_FALSE(decoded.superseded_by.has_value());
}

TEST(schema_types, match_key_ignores_argument_order) {
  auto encoder = encoder_t{};
  EXPECT_EQ(confide::schema::key::make_match_key(encoder, "alice", "bob"),
            confide::schema::key::make_match_key(encoder, "bob", "alice"));
  EXPECT_NE(confide::schema::key::make_match_key(encoder, "alice", "bob"),
            confide::schema::key::make_match_key(encoder, "alice", "carol"));
}

TEST(schema_types, access_log_keys_sort_by_sequence) {
  auto encoder = encoder_t{};
  auto record = confide::testing::make_hash(9);
  auto keys = std::vector<confide::schema::bytes_t>{
      confide::schema::key::make_access_log_key(encoder, record, 256),
      confide::schema::key::make_access_log_key(encoder, record, 2),
      confide::schema::key::make_access_log_key(encoder, record, 17)};
  std::ranges::sort(keys);
  EXPECT_EQ(keys[0],
            confide::schema::key::make_access_log_key(encoder, record, 2));
  EXPECT_EQ(keys[2],
            confide::schema::key::make_access_log_key(encoder, record, 256));

  auto prefix = confide::schema::key::make_access_log_prefix_key(encoder, record);
  for (const auto& key : keys) {
    EXPECT_TRUE(std::equal(std::begin(prefix), std::end(prefix), std::begin(key)));
  }
}
