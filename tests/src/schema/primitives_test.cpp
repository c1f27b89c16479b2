#include <gtest/gtest.h>
#include <confide/schema/primitives.hpp>

TEST(primitives, make_hash32_from_bytes_round_trips) {
  auto input = confide::schema::bytes_t(32, 0xAB);
  auto hash = confide::schema::make_hash32(input);
  EXPECT_EQ(hash.size(), 32u);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, try_make_hash32_accepts_prefixed_hex) {
  auto hash = confide::schema::try_make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ((*hash)[0], 0x01);
  EXPECT_EQ((*hash)[31], 0x20);
  EXPECT_EQ(confide::schema::to_hex(*hash),
            "0102030405060708090a0b0c0d0e0f10"
            "1112131415161718191a1b1c1d1e1f20");
}

TEST(primitives, try_make_hash32_rejects_wrong_length_and_bad_digits) {
  EXPECT_FALSE(confide::schema::try_make_hash32("0102").has_value());
  EXPECT_FALSE(confide::schema::try_make_hash32(std::string(64, 'z')).has_value());
  EXPECT_FALSE(confide::schema::try_from_hex("abc").has_value());
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = confide::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(primitives, string_and_bytes_views_share_content) {
  auto text = std::string{"voice"};
  auto view = confide::schema::make_bytes_view(text);
  ASSERT_EQ(view.size(), 5u);
  EXPECT_EQ(view[0], static_cast<uint8_t>('v'));
  EXPECT_EQ(confide::schema::make_string(view), text);
  EXPECT_EQ(confide::schema::make_string_view(confide::schema::make_bytes(text)),
            "voice");
}

TEST(primitives, to_utc_date_formats_calendar_day) {
  EXPECT_EQ(confide::schema::to_utc_date(0), "1970-01-01");
  // 2026-03-01T10:00:00Z
  EXPECT_EQ(confide::schema::to_utc_date(1'772'359'200'000), "2026-03-01");
  // One millisecond before midnight stays on the same day.
  EXPECT_EQ(confide::schema::to_utc_date(1'772'409'599'999), "2026-03-01");
  EXPECT_EQ(confide::schema::to_utc_date(1'772'409'600'000), "2026-03-02");
}
