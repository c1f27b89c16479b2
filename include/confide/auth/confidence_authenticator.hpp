#pragma once

#include <confide/auth/capabilities.hpp>
#include <confide/auth/challenge_issuer.hpp>
#include <confide/auth/session_store.hpp>
#include <confide/common/clock.hpp>
#include <confide/common/lock_table.hpp>
#include <confide/config/options.hpp>
#include <confide/crypto/cipher.hpp>
#include <confide/schema/access_result.hpp>
#include <confide/schema/auth_attempt.hpp>
#include <confide/schema/auth_session.hpp>
#include <confide/schema/challenge.hpp>
#include <confide/schema/encoding/scale/encoder.hpp>
#include <confide/schema/principal_record.hpp>
#include <confide/schema/voiceprint.hpp>
#include <confide/storage/rocksdb/storage.hpp>
#include <atomic>
#include <cstddef>
#include <deque>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace confide::auth {

struct authenticated_t final {
  confide::schema::auth_session_t session;
};

struct challenge_required_t final {
  double score{};
  std::vector<confide::schema::challenge_t> challenges;
};

struct denied_t final {
  double score{};
  confide::schema::access_error_code code{
      confide::schema::access_error_code::authentication_denied};
  std::string reason;
};

using verify_result_t =
    std::variant<authenticated_t, challenge_required_t, denied_t>;

/// Voice-confidence gate in front of every protected read.
///
/// A sample is scored against all of the principal's voiceprints and the best
/// cosine similarity decides the outcome: at or above the high threshold a
/// session is issued, between the medium and high thresholds the principal
/// is sent to the challenge issuer, below it the attempt is denied. Unknown
/// and unenrolled principals are denied, never reported as errors.
class confidence_authenticator final {
 public:
  confidence_authenticator(
      confide::schema::encoding::scale_encoder_t& encoder,
      const confide::storage::rocksdb_storage_t& storage,
      const confide::crypto::envelope_cipher& cipher,
      session_store& sessions,
      challenge_issuer& challenges,
      embedding_extractor_t extractor,
      confide::config::authenticator_options options = {},
      confide::common::now_provider_t now = confide::common::system_now);

  /// Create or rename a principal. Status is left untouched for existing
  /// principals.
  confide::schema::principal_record_t register_principal(
      const confide::schema::principal_id_t& principal,
      const std::string& display_name);

  std::optional<confide::schema::principal_record_t> find_principal(
      const confide::schema::principal_id_t& principal) const;

  /// Average the samples into one new voiceprint and mark the principal
  /// enrolled. Every call appends a voiceprint.
  confide::schema::access_result<confide::schema::voiceprint_t> enroll(
      const confide::schema::principal_id_t& principal,
      const std::vector<confide::schema::bytes_t>& samples,
      const std::optional<std::string>& device_hint = std::nullopt);

  verify_result_t verify(
      const confide::schema::principal_id_t& principal,
      const confide::schema::bytes_view_t& sample,
      const confide::schema::channel_id_t& channel,
      const std::optional<std::string>& category = std::nullopt);

  /// verify() on a worker thread. The authenticator must outlive the future.
  std::future<verify_result_t> verify_async(
      confide::schema::principal_id_t principal,
      confide::schema::bytes_t sample,
      confide::schema::channel_id_t channel,
      std::optional<std::string> category = std::nullopt);

  std::vector<confide::schema::voiceprint_t> list_voiceprints(
      const confide::schema::principal_id_t& principal) const;

  /// Remove the principal and all voiceprints and end their sessions. The
  /// authentication audit trail is kept. Returns the voiceprints removed.
  std::size_t delete_account(const confide::schema::principal_id_t& principal);

  /// Most recent authentication attempts, newest first.
  std::vector<confide::schema::auth_attempt_t> attempts(
      const confide::schema::principal_id_t& principal,
      std::size_t limit = 20) const;

  bool logout(const confide::schema::session_id_t& session_id);

  /// Principals with attempts inside the current rate window. Idle entries
  /// are swept at most once per window.
  std::size_t rate_tracked_principals() const;

 private:
  bool admit_attempt(const confide::schema::principal_id_t& principal,
                     confide::schema::timestamp_milliseconds_t now);

  uint32_t best_score_ppm(
      const std::vector<confide::schema::voiceprint_t>& voiceprints,
      const confide::schema::embedding_t& sample) const;

  void record_attempt(const confide::schema::principal_id_t& principal,
                      const confide::schema::channel_id_t& channel,
                      confide::schema::timestamp_milliseconds_t now,
                      uint32_t score_ppm,
                      confide::schema::auth_outcome_t outcome,
                      const std::string& reason);

  confide::schema::encoding::scale_encoder_t& encoder_;
  const confide::storage::rocksdb_storage_t& storage_;
  const confide::crypto::envelope_cipher& cipher_;
  session_store& sessions_;
  challenge_issuer& challenges_;
  embedding_extractor_t extractor_;
  confide::config::authenticator_options options_;
  confide::common::now_provider_t now_;

  confide::common::lock_table principal_locks_;
  std::atomic<uint64_t> attempt_sequence_{0};
  mutable std::mutex rate_mutex_;
  std::map<confide::schema::principal_id_t,
           std::deque<confide::schema::timestamp_milliseconds_t>>
      recent_attempts_;
  confide::schema::timestamp_milliseconds_t last_rate_sweep_{};
};

}  // namespace confide::auth
