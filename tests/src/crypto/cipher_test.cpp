#include <confide/crypto/cipher.hpp>
#include <confide/testing/common.hpp>
#include <gtest/gtest.h>

#include <string>

namespace {

confide::schema::bytes_view_t view(const std::string& text) {
  return confide::schema::make_bytes_view(text);
}

}  // namespace

TEST(cipher, seal_layout_carries_iv_and_tag) {
  auto key = confide::testing::make_key(1);
  auto plaintext = std::string{"remember the lake house"};
  auto sealed = confide::crypto::seal(key, view(plaintext), view("aad"));
  EXPECT_EQ(sealed.size(), confide::crypto::kIvSize + plaintext.size() +
                               confide::crypto::kTagSize);
  EXPECT_EQ(confide::schema::make_string(
                confide::crypto::open(key, sealed, view("aad"))),
            plaintext);
}

TEST(cipher, seal_uses_fresh_iv) {
  auto key = confide::testing::make_key(1);
  auto a = confide::crypto::seal(key, view("same"), view("aad"));
  auto b = confide::crypto::seal(key, view("same"), view("aad"));
  EXPECT_NE(a, b);
}

TEST(cipher, open_rejects_wrong_aad_key_and_tampering) {
  auto key = confide::testing::make_key(1);
  auto sealed = confide::crypto::seal(key, view("payload"), view("record-a"));

  EXPECT_THROW(confide::crypto::open(key, sealed, view("record-b")),
               confide::crypto::decryption_error);
  EXPECT_THROW(
      confide::crypto::open(confide::testing::make_key(2), sealed,
                            view("record-a")),
      confide::crypto::decryption_error);

  auto tampered = sealed;
  tampered[confide::crypto::kIvSize] ^= 0x01u;
  EXPECT_THROW(confide::crypto::open(key, tampered, view("record-a")),
               confide::crypto::decryption_error);

  auto truncated = confide::schema::bytes_t(sealed.begin(), sealed.begin() + 8);
  EXPECT_THROW(confide::crypto::open(key, truncated, view("record-a")),
               confide::crypto::decryption_error);
}

TEST(cipher, empty_plaintext_round_trips) {
  auto key = confide::testing::make_key(4);
  auto sealed = confide::crypto::seal(key, {}, view("aad"));
  EXPECT_TRUE(confide::crypto::open(key, sealed, view("aad")).empty());
}

TEST(cipher, try_make_key_requires_32_bytes_of_hex) {
  EXPECT_TRUE(confide::crypto::try_make_key(std::string(64, 'a')).has_value());
  EXPECT_FALSE(confide::crypto::try_make_key(std::string(62, 'a')).has_value());
  EXPECT_FALSE(confide::crypto::try_make_key("not hex").has_value());
}

TEST(envelope_cipher, wraps_a_distinct_data_key_per_payload) {
  auto cipher = confide::crypto::envelope_cipher{confide::testing::make_key(5)};
  auto id = confide::testing::make_hash(1);
  auto first = cipher.seal(view("content"), confide::schema::make_bytes_view(id));
  auto second =
      cipher.seal(view("content"), confide::schema::make_bytes_view(id));
  EXPECT_NE(first.wrapped_key, second.wrapped_key);
  EXPECT_EQ(confide::schema::make_string(
                cipher.open(first, confide::schema::make_bytes_view(id))),
            "content");
}

TEST(envelope_cipher, envelope_is_bound_to_its_record) {
  auto cipher = confide::crypto::envelope_cipher{confide::testing::make_key(5)};
  auto owner = confide::testing::make_hash(1);
  auto other = confide::testing::make_hash(2);
  auto envelope =
      cipher.seal(view("content"), confide::schema::make_bytes_view(owner));
  EXPECT_THROW(cipher.open(envelope, confide::schema::make_bytes_view(other)),
               confide::crypto::decryption_error);

  auto foreign = confide::crypto::envelope_cipher{confide::testing::make_key(6)};
  EXPECT_THROW(foreign.open(envelope, confide::schema::make_bytes_view(owner)),
               confide::crypto::decryption_error);
}
