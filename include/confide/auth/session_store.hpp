#pragma once

#include <confide/common/clock.hpp>
#include <confide/schema/access_result.hpp>
#include <confide/schema/auth_session.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

namespace confide::auth {

/// Table of live authenticated sessions.
///
/// Validity is decided on every read against the injected clock: a session
/// whose expiry has passed is reported once as `session_expired`, erased,
/// and is `session_not_found` from then on. The optional sweeper only
/// reclaims memory; it never changes what a read observes.
class session_store final {
 public:
  explicit session_store(
      confide::common::now_provider_t now = confide::common::system_now);
  ~session_store();

  session_store(const session_store&) = delete;
  session_store& operator=(const session_store&) = delete;

  /// Create a session valid for `ttl` milliseconds from now.
  confide::schema::auth_session_t issue(
      const confide::schema::principal_id_t& principal,
      const confide::schema::channel_id_t& channel,
      double confidence,
      std::vector<confide::schema::session_factor_t> factors,
      confide::schema::duration_milliseconds_t ttl,
      std::optional<std::string> bound_category = std::nullopt);

  /// Resolve a session if it is still valid.
  confide::schema::access_result<confide::schema::auth_session_t> find(
      const confide::schema::session_id_t& session_id);

  /// Resolve a session and check that it may be used for `category`. A
  /// session bound to a category is only usable for that category.
  confide::schema::access_result<confide::schema::auth_session_t>
  authorize_category(const confide::schema::session_id_t& session_id,
                     const std::string& category);

  bool revoke(const confide::schema::session_id_t& session_id);
  std::size_t revoke_principal(const confide::schema::principal_id_t& principal);

  /// Drop every expired session; returns how many were dropped.
  std::size_t prune_expired();

  std::size_t size() const;

  /// Run prune_expired every `interval` on a background thread.
  void start_sweeper(std::chrono::milliseconds interval);
  void stop_sweeper();

  confide::schema::timestamp_milliseconds_t now() const { return now_(); }

 private:
  confide::common::now_provider_t now_;
  mutable std::shared_mutex mutex_;
  std::map<confide::schema::session_id_t, confide::schema::auth_session_t>
      sessions_;

  std::mutex sweeper_mutex_;
  std::condition_variable sweeper_signal_;
  bool sweeper_stop_{false};
  std::thread sweeper_;
};

}  // namespace confide::auth
