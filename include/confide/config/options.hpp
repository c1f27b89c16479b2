#pragma once

#include <confide/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace confide::config {

/// Voice verification policy.
struct authenticator_options final {
  /// Scores at or above this issue a session directly.
  double high_confidence_threshold{0.85};
  /// Scores at or above this (and below high) fall back to challenges.
  double medium_confidence_threshold{0.70};
  confide::schema::duration_milliseconds_t session_ttl{10 * 60 * 1000};
  uint32_t max_attempts_per_window{3};
  confide::schema::duration_milliseconds_t attempt_window{60 * 1000};
  std::string model_version{"blake3-placeholder-v1"};
};

struct challenge_options final {
  uint32_t max_challenges{2};
  uint32_t max_failed_attempts{3};
  confide::schema::duration_milliseconds_t challenge_ttl{5 * 60 * 1000};
  confide::schema::duration_milliseconds_t session_ttl{10 * 60 * 1000};
  double challenge_confidence{0.75};
  /// Characters of the second most recent record shown as a content hint.
  uint32_t content_hint_length{24};
  /// Most recent records consulted when building challenges.
  uint32_t record_window{10};
};

struct vault_options final {
  /// Require a session that passed a knowledge challenge before releasing
  /// ultra_secret content through get_with_session.
  bool ultra_secret_requires_challenge{false};
};

struct options final {
  std::string db_path{"confide.db"};
  std::string log_path{"confide.log"};
  std::string master_key_hex;
  authenticator_options authenticator;
  challenge_options challenge;
  vault_options vault;
};

}  // namespace confide::config
