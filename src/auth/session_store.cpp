#include <confide/auth/session_store.hpp>
#include <confide/crypto/cipher.hpp>

#include <spdlog/spdlog.h>

#include <iterator>
#include <utility>

namespace confide::auth {

namespace {

constexpr auto kCodespace = "confide.session";

}  // namespace

session_store::session_store(confide::common::now_provider_t now)
    : now_{std::move(now)} {}

session_store::~session_store() {
  stop_sweeper();
}

confide::schema::auth_session_t session_store::issue(
    const confide::schema::principal_id_t& principal,
    const confide::schema::channel_id_t& channel,
    const double confidence,
    std::vector<confide::schema::session_factor_t> factors,
    const confide::schema::duration_milliseconds_t ttl,
    std::optional<std::string> bound_category) {
  auto issued_at = now_();
  auto session = confide::schema::auth_session_t{
      .session_id = confide::crypto::random_id(),
      .principal_id = principal,
      .channel_id = channel,
      .issued_at = issued_at,
      .expires_at = issued_at + ttl,
      .confidence = confidence,
      .factors = std::move(factors),
      .bound_category = std::move(bound_category)};

  auto lock = std::unique_lock{mutex_};
  sessions_[session.session_id] = session;
  spdlog::debug("Issued session for '{}' on '{}' expiring at {}", principal,
                channel, session.expires_at);
  return session;
}

confide::schema::access_result<confide::schema::auth_session_t>
session_store::find(const confide::schema::session_id_t& session_id) {
  auto now = now_();
  {
    auto lock = std::shared_lock{mutex_};
    auto it = sessions_.find(session_id);
    if (it == std::end(sessions_)) {
      return confide::schema::make_error<confide::schema::auth_session_t>(
          confide::schema::access_error_code::session_not_found,
          "session not found", kCodespace);
    }
    if (it->second.valid_at(now)) {
      return confide::schema::make_ok(it->second, kCodespace);
    }
  }

  auto lock = std::unique_lock{mutex_};
  auto it = sessions_.find(session_id);
  if (it == std::end(sessions_)) {
    return confide::schema::make_error<confide::schema::auth_session_t>(
        confide::schema::access_error_code::session_not_found,
        "session not found", kCodespace);
  }
  if (it->second.valid_at(now)) {
    return confide::schema::make_ok(it->second, kCodespace);
  }
  sessions_.erase(it);
  return confide::schema::make_error<confide::schema::auth_session_t>(
      confide::schema::access_error_code::session_expired, "session expired",
      kCodespace);
}

confide::schema::access_result<confide::schema::auth_session_t>
session_store::authorize_category(
    const confide::schema::session_id_t& session_id,
    const std::string& category) {
  auto result = find(session_id);
  if (!result.ok()) {
    return result;
  }
  const auto& bound = result.value->bound_category;
  if (bound.has_value() && *bound != category) {
    spdlog::warn("Session for '{}' bound to '{}' used for '{}'",
                 result.value->principal_id, *bound, category);
    return confide::schema::make_error<confide::schema::auth_session_t>(
        confide::schema::access_error_code::authorization_denied,
        "session not valid for category", kCodespace);
  }
  return result;
}

bool session_store::revoke(const confide::schema::session_id_t& session_id) {
  auto lock = std::unique_lock{mutex_};
  return sessions_.erase(session_id) > 0;
}

std::size_t session_store::revoke_principal(
    const confide::schema::principal_id_t& principal) {
  auto lock = std::unique_lock{mutex_};
  return std::erase_if(sessions_, [&](const auto& entry) {
    return entry.second.principal_id == principal;
  });
}

std::size_t session_store::prune_expired() {
  auto now = now_();
  auto lock = std::unique_lock{mutex_};
  return std::erase_if(sessions_, [&](const auto& entry) {
    return !entry.second.valid_at(now);
  });
}

std::size_t session_store::size() const {
  auto lock = std::shared_lock{mutex_};
  return sessions_.size();
}

void session_store::start_sweeper(const std::chrono::milliseconds interval) {
  stop_sweeper();
  {
    auto lock = std::scoped_lock{sweeper_mutex_};
    sweeper_stop_ = false;
  }
  sweeper_ = std::thread{[this, interval] {
    auto lock = std::unique_lock{sweeper_mutex_};
    while (!sweeper_signal_.wait_for(lock, interval,
                                     [this] { return sweeper_stop_; })) {
      lock.unlock();
      auto pruned = prune_expired();
      if (pruned > 0) {
        spdlog::debug("Session sweeper pruned {} expired session(s)", pruned);
      }
      lock.lock();
    }
  }};
}

void session_store::stop_sweeper() {
  {
    auto lock = std::scoped_lock{sweeper_mutex_};
    sweeper_stop_ = true;
  }
  sweeper_signal_.notify_all();
  if (sweeper_.joinable()) {
    sweeper_.join();
  }
}

}  // namespace confide::auth
