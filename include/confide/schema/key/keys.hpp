#pragma once

#include <array>
#include <boost/endian/buffers.hpp>
#include <confide/schema/primitives.hpp>
#include <cstdint>
#include <iterator>
#include <string_view>
#include <tuple>
#include <utility>

// Canonical key prefixes and key builders for every persisted keyspace.
// Sequenced keyspaces append big-endian counters so that a prefix scan
// returns entries in sequence order.
namespace confide::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kPrincipalKeyPrefix{"SYS|STATE|PRINCIPAL|"};
inline constexpr std::string_view kVoiceprintKeyPrefix{
    "SYS|STATE|VOICEPRINT|"};
inline constexpr std::string_view kSecretKeyPrefix{"SYS|STATE|SECRET|"};
inline constexpr std::string_view kDisclosureKeyPrefix{
    "SYS|STATE|DISCLOSURE|"};
inline constexpr std::string_view kMatchKeyPrefix{"SYS|STATE|MATCH|"};
inline constexpr std::string_view kContactKeyPrefix{"SYS|STATE|CONTACT|"};
inline constexpr std::string_view kSecretOwnerIndexPrefix{
    "SYS|INDEX|SECRET_OWNER|"};
inline constexpr std::string_view kDisclosureOwnerIndexPrefix{
    "SYS|INDEX|DISCLOSURE_OWNER|"};
inline constexpr std::string_view kAuthAuditPrefix{"SYS|AUDIT|AUTH|"};
inline constexpr std::string_view kSecretAuditPrefix{"SYS|AUDIT|SECRET|"};

inline const std::array<std::string_view, 11> kKeyspaces{
    kStatePrefix,
    kPrincipalKeyPrefix,
    kVoiceprintKeyPrefix,
    kSecretKeyPrefix,
    kDisclosureKeyPrefix,
    kMatchKeyPrefix,
    kContactKeyPrefix,
    kSecretOwnerIndexPrefix,
    kDisclosureOwnerIndexPrefix,
    kAuthAuditPrefix,
    kSecretAuditPrefix};

inline void append_big_endian(confide::schema::bytes_t& key,
                              const uint64_t value) {
  auto buffer = boost::endian::big_uint64_buf_t{value};
  auto* data = buffer.data();
  key.insert(std::end(key), data, data + sizeof(uint64_t));
}

template <typename Encoder, typename T>
confide::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                           std::string_view prefix,
                                           const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
confide::schema::bytes_t make_prefix_key(Encoder& encoder,
                                         std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
confide::schema::bytes_t make_principal_key(
    Encoder& encoder,
    const confide::schema::principal_id_t& principal) {
  return make_prefixed_key(encoder, kPrincipalKeyPrefix, principal);
}

template <typename Encoder>
confide::schema::bytes_t make_voiceprint_prefix_key(
    Encoder& encoder,
    const confide::schema::principal_id_t& owner) {
  return make_prefixed_key(encoder, kVoiceprintKeyPrefix, owner);
}

template <typename Encoder>
confide::schema::bytes_t make_voiceprint_key(
    Encoder& encoder,
    const confide::schema::principal_id_t& owner,
    const confide::schema::record_id_t& voiceprint_id) {
  return make_prefixed_key(encoder, kVoiceprintKeyPrefix,
                           std::tuple{owner, voiceprint_id});
}

template <typename Encoder>
confide::schema::bytes_t make_auth_attempt_prefix_key(
    Encoder& encoder,
    const confide::schema::principal_id_t& principal) {
  return make_prefixed_key(encoder, kAuthAuditPrefix, principal);
}

template <typename Encoder>
confide::schema::bytes_t make_auth_attempt_key(
    Encoder& encoder,
    const confide::schema::principal_id_t& principal,
    const confide::schema::timestamp_milliseconds_t attempted_at,
    const uint64_t sequence) {
  auto key = make_auth_attempt_prefix_key(encoder, principal);
  append_big_endian(key, attempted_at);
  append_big_endian(key, sequence);
  return key;
}

template <typename Encoder>
confide::schema::bytes_t make_secret_key(
    Encoder& encoder,
    const confide::schema::record_id_t& record_id) {
  return make_prefixed_key(encoder, kSecretKeyPrefix, record_id);
}

template <typename Encoder>
confide::schema::bytes_t make_secret_owner_prefix_key(
    Encoder& encoder,
    const confide::schema::principal_id_t& owner) {
  return make_prefixed_key(encoder, kSecretOwnerIndexPrefix, owner);
}

template <typename Encoder>
confide::schema::bytes_t make_secret_owner_key(
    Encoder& encoder,
    const confide::schema::principal_id_t& owner,
    const confide::schema::record_id_t& record_id) {
  return make_prefixed_key(encoder, kSecretOwnerIndexPrefix,
                           std::tuple{owner, record_id});
}

template <typename Encoder>
confide::schema::bytes_t make_access_log_prefix_key(
    Encoder& encoder,
    const confide::schema::record_id_t& record_id) {
  return make_prefixed_key(encoder, kSecretAuditPrefix, record_id);
}

template <typename Encoder>
confide::schema::bytes_t make_access_log_key(
    Encoder& encoder,
    const confide::schema::record_id_t& record_id,
    const uint64_t sequence) {
  auto key = make_access_log_prefix_key(encoder, record_id);
  append_big_endian(key, sequence);
  return key;
}

template <typename Encoder>
confide::schema::bytes_t make_disclosure_key(
    Encoder& encoder,
    const confide::schema::record_id_t& record_id) {
  return make_prefixed_key(encoder, kDisclosureKeyPrefix, record_id);
}

template <typename Encoder>
confide::schema::bytes_t make_disclosure_owner_prefix_key(
    Encoder& encoder,
    const confide::schema::principal_id_t& owner) {
  return make_prefixed_key(encoder, kDisclosureOwnerIndexPrefix, owner);
}

template <typename Encoder>
confide::schema::bytes_t make_disclosure_owner_key(
    Encoder& encoder,
    const confide::schema::principal_id_t& owner,
    const confide::schema::record_id_t& record_id) {
  return make_prefixed_key(encoder, kDisclosureOwnerIndexPrefix,
                           std::tuple{owner, record_id});
}

/// Unordered principal pair in canonical (ascending) order.
inline std::pair<confide::schema::principal_id_t,
                 confide::schema::principal_id_t>
canonical_pair(const confide::schema::principal_id_t& a,
               const confide::schema::principal_id_t& b) {
  if (b < a) {
    return {b, a};
  }
  return {a, b};
}

template <typename Encoder>
confide::schema::bytes_t make_match_key(
    Encoder& encoder,
    const confide::schema::principal_id_t& a,
    const confide::schema::principal_id_t& b) {
  auto [first, second] = canonical_pair(a, b);
  return make_prefixed_key(encoder, kMatchKeyPrefix,
                           std::tuple{first, second});
}

template <typename Encoder>
confide::schema::bytes_t make_contact_prefix_key(
    Encoder& encoder,
    const confide::schema::principal_id_t& owner) {
  return make_prefixed_key(encoder, kContactKeyPrefix, owner);
}

template <typename Encoder>
confide::schema::bytes_t make_contact_key(
    Encoder& encoder,
    const confide::schema::principal_id_t& owner,
    const confide::schema::principal_id_t& contact) {
  return make_prefixed_key(encoder, kContactKeyPrefix,
                           std::tuple{owner, contact});
}

}  // namespace confide::schema::key
