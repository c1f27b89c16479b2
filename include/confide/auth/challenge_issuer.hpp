#pragma once

#include <confide/auth/capabilities.hpp>
#include <confide/auth/session_store.hpp>
#include <confide/common/clock.hpp>
#include <confide/config/options.hpp>
#include <confide/schema/access_result.hpp>
#include <confide/schema/auth_session.hpp>
#include <confide/schema/challenge.hpp>
#include <confide/schema/encoding/scale/encoder.hpp>
#include <confide/storage/rocksdb/storage.hpp>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace confide::auth {

/// Categories for which the relationship challenge is offered first.
bool is_family_category(std::string_view category);

/// Lower-cases, drops punctuation and collapses whitespace.
std::string normalize_answer(std::string_view answer);

/// Default answer policy. Content challenges accept a contiguous run of whole
/// words from the hidden remainder covering at least half of it (no fewer
/// than three words, no more than eight required). Every other kind requires
/// the normalized expected answer.
bool match_expected_answer(const confide::schema::challenge_t& challenge,
                           std::string_view expected,
                           std::string_view response);

answer_verifier_t make_expected_answer_verifier();

/// Fallback factor for medium-confidence voice matches.
///
/// Challenges are built from the principal's own recent records. A challenge
/// set only yields a session when voice evidence for the same principal and
/// channel was attached and every issued challenge is answered correctly.
class challenge_issuer final {
 public:
  challenge_issuer(
      confide::schema::encoding::scale_encoder_t& encoder,
      const confide::storage::rocksdb_storage_t& storage,
      session_store& sessions,
      memory_source_t memory_source,
      answer_verifier_t verifier = make_expected_answer_verifier(),
      confide::config::challenge_options options = {},
      confide::common::now_provider_t now = confide::common::system_now);

  /// Issue up to `max_challenges` challenges, replacing any pending set and
  /// any voice evidence previously attached for the principal.
  std::vector<confide::schema::challenge_t> issue(
      const confide::schema::principal_id_t& principal,
      const std::optional<std::string>& category = std::nullopt);

  /// Record the medium-confidence voice score that justified the challenge.
  void attach_voice_evidence(const confide::schema::principal_id_t& principal,
                             const confide::schema::channel_id_t& channel,
                             double score);

  /// Check responses and, on success, issue a voice+challenge session.
  confide::schema::access_result<confide::schema::auth_session_t> verify(
      const confide::schema::principal_id_t& principal,
      const confide::schema::channel_id_t& channel,
      const std::vector<confide::schema::challenge_response_t>& responses);

  bool has_pending(const confide::schema::principal_id_t& principal);

  /// Drop pending challenges and evidence for a principal.
  void forget(const confide::schema::principal_id_t& principal);

 private:
  struct pending_challenge final {
    confide::schema::challenge_t challenge;
    std::string expected;
  };

  struct pending_set final {
    std::vector<pending_challenge> challenges;
    std::optional<std::string> category;
    confide::schema::timestamp_milliseconds_t expires_at{};
    uint32_t failed_attempts{};
  };

  struct voice_evidence final {
    confide::schema::channel_id_t channel;
    double score{};
    confide::schema::timestamp_milliseconds_t recorded_at{};
  };

  std::vector<pending_challenge> build_challenges(
      const confide::schema::principal_id_t& principal,
      const std::optional<std::string>& category) const;

  std::vector<confide::schema::memory_record_t> recent_records(
      const confide::schema::principal_id_t& principal,
      const std::optional<std::string>& category) const;

  std::string identity_answer(
      const confide::schema::principal_id_t& principal) const;

  confide::schema::encoding::scale_encoder_t& encoder_;
  const confide::storage::rocksdb_storage_t& storage_;
  session_store& sessions_;
  memory_source_t memory_source_;
  answer_verifier_t verifier_;
  confide::config::challenge_options options_;
  confide::common::now_provider_t now_;

  std::mutex mutex_;
  std::map<confide::schema::principal_id_t, pending_set> pending_;
  std::map<confide::schema::principal_id_t, voice_evidence> evidence_;
};

}  // namespace confide::auth
