#include <confide/schema/key/keys.hpp>
#include <confide/vault/secret_vault.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace confide::vault {

namespace {

constexpr auto kCodespace = "confide.vault";

using confide::schema::access_error_code;

std::vector<confide::schema::principal_id_t> normalize_authorized(
    std::vector<confide::schema::principal_id_t> authorized,
    const confide::schema::principal_id_t& owner) {
  std::erase_if(authorized, [&](const auto& principal) {
    return principal.empty() || principal == owner;
  });
  std::ranges::sort(authorized);
  auto duplicates = std::ranges::unique(authorized);
  authorized.erase(std::begin(duplicates), std::end(duplicates));
  return authorized;
}

}  // namespace

secret_vault::secret_vault(confide::schema::encoding::scale_encoder_t& encoder,
                           const confide::storage::rocksdb_storage_t& storage,
                           const confide::crypto::envelope_cipher& cipher,
                           confide::auth::session_store& sessions,
                           contact_lookup_t contacts,
                           confide::config::vault_options options,
                           confide::common::now_provider_t now)
    : encoder_{encoder},
      storage_{storage},
      cipher_{cipher},
      sessions_{sessions},
      contacts_{std::move(contacts)},
      options_{std::move(options)},
      now_{std::move(now)} {}

void secret_vault::set_access_listener(access_log_listener_t listener) {
  listener_ = std::move(listener);
}

std::optional<confide::schema::secret_record_t> secret_vault::load(
    const confide::schema::record_id_t& record_id) const {
  return storage_.get<confide::schema::secret_record_t>(
      encoder_, confide::schema::key::make_secret_key(encoder_, record_id));
}

confide::schema::access_result<confide::schema::secret_record_t>
secret_vault::load_owned(const confide::schema::record_id_t& record_id,
                         const confide::schema::principal_id_t& owner) const {
  auto record = load(record_id);
  if (!record.has_value() || record->owner != owner) {
    return confide::schema::make_access_denied<confide::schema::secret_record_t>(
        kCodespace);
  }
  return confide::schema::make_ok(std::move(*record), kCodespace);
}

grant_rule_t secret_vault::evaluate(
    const confide::schema::secret_record_t& record,
    const confide::schema::principal_id_t& requester) const {
  if (requester.empty()) {
    return grant_rule_t::none;
  }
  if (requester == record.owner) {
    return grant_rule_t::owner;
  }
  if (std::ranges::find(record.authorized, requester) !=
      std::end(record.authorized)) {
    return grant_rule_t::explicit_grant;
  }
  if (contacts_) {
    auto profile = contacts_(record.owner, requester);
    if (profile.has_value() &&
        profile->knowledge_access >=
            confide::schema::required_knowledge_level(record.tier)) {
      return grant_rule_t::contact_profile;
    }
  }
  return grant_rule_t::none;
}

confide::schema::access_result<confide::schema::secret_record_t>
secret_vault::put(const confide::schema::principal_id_t& owner,
                  const confide::schema::secrecy_tier_t tier,
                  const std::string& title,
                  const std::string& content,
                  const std::vector<confide::schema::principal_id_t>& authorized) {
  if (owner.empty()) {
    return confide::schema::make_error<confide::schema::secret_record_t>(
        access_error_code::invalid_argument, "owner is empty", kCodespace);
  }

  auto record = confide::schema::secret_record_t{};
  record.record_id = confide::crypto::random_id();
  record.owner = owner;
  record.title = title;
  record.tier = tier;
  record.content =
      cipher_.seal(confide::schema::make_bytes_view(content),
                   confide::schema::make_bytes_view(record.record_id));
  record.authorized = normalize_authorized(authorized, owner);
  record.created_at = now_();

  storage_.commit(
      {confide::storage::make_put(
           encoder_,
           confide::schema::key::make_secret_key(encoder_, record.record_id),
           record),
       confide::storage::make_put(
           encoder_,
           confide::schema::key::make_secret_owner_key(encoder_, owner,
                                                       record.record_id),
           record.record_id)});

  spdlog::info("Stored {} record {} for '{}'", to_string(tier),
               confide::schema::to_hex(record.record_id), owner);
  return confide::schema::make_ok(std::move(record), kCodespace);
}

confide::schema::access_result<std::string> secret_vault::read(
    const confide::schema::record_id_t& record_id,
    const confide::schema::principal_id_t& requester,
    const std::optional<confide::schema::auth_session_t>& session) {
  auto lock = record_locks_.lock(confide::schema::make_bytes_view(record_id));

  auto loaded = load(record_id);
  if (!loaded.has_value()) {
    spdlog::info("Denied '{}' read of unknown record {}", requester,
                 confide::schema::to_hex(record_id));
    return confide::schema::make_access_denied<std::string>(kCodespace);
  }
  auto record = std::move(*loaded);
  auto now = now_();

  auto reason = std::string{};
  auto granted = false;
  if (record.status == confide::schema::record_status_t::superseded) {
    reason = "record superseded";
  } else if (session.has_value() && options_.ultra_secret_requires_challenge &&
             record.tier == confide::schema::secrecy_tier_t::ultra_secret &&
             !session->has_factor(confide::schema::session_factor_t::challenge)) {
    reason = "challenge factor required";
  } else {
    switch (evaluate(record, requester)) {
      case grant_rule_t::owner:
        reason = "owner";
        granted = true;
        break;
      case grant_rule_t::explicit_grant:
        reason = "explicitly authorized";
        granted = true;
        break;
      case grant_rule_t::contact_profile:
        reason = "contact knowledge level";
        granted = true;
        break;
      case grant_rule_t::none:
        reason = "not authorized";
        break;
    }
  }

  auto plaintext = std::optional<std::string>{};
  auto integrity_failure = std::optional<std::string>{};
  if (granted) {
    try {
      plaintext = confide::schema::make_string(cipher_.open(
          record.content, confide::schema::make_bytes_view(record.record_id)));
    } catch (const confide::crypto::decryption_error& ex) {
      integrity_failure = ex.what();
      granted = false;
      reason = "decryption failed";
    }
  }

  auto entry = confide::schema::access_log_entry_t{
      .record_id = record.record_id,
      .sequence = record.log_sequence,
      .principal_id = requester,
      .accessed_at = now,
      .success = granted,
      .reason = reason};
  record.log_sequence += 1;
  if (granted) {
    record.access_count += 1;
    record.last_accessed_at = now;
  }

  storage_.commit(
      {confide::storage::make_put(
           encoder_,
           confide::schema::key::make_secret_key(encoder_, record.record_id),
           record),
       confide::storage::make_put(
           encoder_,
           confide::schema::key::make_access_log_key(encoder_, record.record_id,
                                                     entry.sequence),
           entry)});
  // Listeners may call back into the vault.
  lock.unlock();
  if (listener_) {
    listener_(entry);
  }

  if (integrity_failure.has_value()) {
    spdlog::critical("Secret {} failed integrity check: {}",
                     confide::schema::to_hex(record.record_id),
                     *integrity_failure);
    throw confide::crypto::decryption_error{*integrity_failure};
  }

  if (granted) {
    spdlog::info("Released {} record {} to '{}' ({})", to_string(record.tier),
                 confide::schema::to_hex(record.record_id), requester, reason);
    return confide::schema::make_ok(std::move(*plaintext), kCodespace);
  }

  spdlog::info("Denied '{}' read of record {} ({})", requester,
               confide::schema::to_hex(record.record_id), reason);
  if (requester == record.owner) {
    return confide::schema::make_error<std::string>(
        access_error_code::authorization_denied, reason, kCodespace);
  }
  return confide::schema::make_access_denied<std::string>(kCodespace);
}

confide::schema::access_result<std::string> secret_vault::get(
    const confide::schema::record_id_t& record_id,
    const confide::schema::principal_id_t& requester) {
  return read(record_id, requester, std::nullopt);
}

confide::schema::access_result<std::string> secret_vault::get_with_session(
    const confide::schema::record_id_t& record_id,
    const confide::schema::session_id_t& session_id) {
  auto session = sessions_.find(session_id);
  if (!session.ok()) {
    return confide::schema::make_error<std::string>(session.code, session.log,
                                                    kCodespace);
  }
  return read(record_id, session.value->principal_id, session.value);
}

std::future<confide::schema::access_result<std::string>>
secret_vault::get_async(confide::schema::record_id_t record_id,
                        confide::schema::principal_id_t requester) {
  return std::async(std::launch::async,
                    [this, record_id, requester = std::move(requester)] {
                      return get(record_id, requester);
                    });
}

confide::schema::access_result<confide::schema::secret_record_t>
secret_vault::authorize(const confide::schema::record_id_t& record_id,
                        const confide::schema::principal_id_t& owner,
                        const confide::schema::principal_id_t& principal) {
  auto lock = record_locks_.lock(confide::schema::make_bytes_view(record_id));
  auto result = load_owned(record_id, owner);
  if (!result.ok()) {
    return result;
  }
  auto& record = *result.value;
  if (record.status == confide::schema::record_status_t::superseded) {
    return confide::schema::make_error<confide::schema::secret_record_t>(
        access_error_code::authorization_denied, "record superseded",
        kCodespace);
  }
  if (principal.empty()) {
    return confide::schema::make_error<confide::schema::secret_record_t>(
        access_error_code::invalid_argument, "principal is empty", kCodespace);
  }

  auto authorized = record.authorized;
  authorized.push_back(principal);
  record.authorized = normalize_authorized(std::move(authorized), owner);
  storage_.put(encoder_,
               confide::schema::key::make_secret_key(encoder_, record_id),
               record);
  spdlog::info("Authorized '{}' on record {}", principal,
               confide::schema::to_hex(record_id));
  return result;
}

confide::schema::access_result<confide::schema::secret_record_t>
secret_vault::revoke(const confide::schema::record_id_t& record_id,
                     const confide::schema::principal_id_t& owner,
                     const confide::schema::principal_id_t& principal) {
  auto lock = record_locks_.lock(confide::schema::make_bytes_view(record_id));
  auto result = load_owned(record_id, owner);
  if (!result.ok()) {
    return result;
  }
  auto& record = *result.value;
  auto removed = std::erase(record.authorized, principal);
  if (removed > 0) {
    storage_.put(encoder_,
                 confide::schema::key::make_secret_key(encoder_, record_id),
                 record);
    spdlog::info("Revoked '{}' on record {}", principal,
                 confide::schema::to_hex(record_id));
  }
  return result;
}

confide::schema::access_result<confide::schema::secret_record_t>
secret_vault::reclassify(const confide::schema::record_id_t& record_id,
                         const confide::schema::principal_id_t& owner,
                         const confide::schema::secrecy_tier_t tier) {
  auto lock = record_locks_.lock(confide::schema::make_bytes_view(record_id));
  auto result = load_owned(record_id, owner);
  if (!result.ok()) {
    return result;
  }
  auto& previous = *result.value;
  if (previous.status == confide::schema::record_status_t::superseded) {
    return confide::schema::make_error<confide::schema::secret_record_t>(
        access_error_code::authorization_denied, "record superseded",
        kCodespace);
  }
  if (previous.tier == tier) {
    return confide::schema::make_error<confide::schema::secret_record_t>(
        access_error_code::invalid_argument, "record already at tier",
        kCodespace);
  }

  auto plaintext = confide::schema::bytes_t{};
  try {
    plaintext = cipher_.open(previous.content,
                             confide::schema::make_bytes_view(record_id));
  } catch (const confide::crypto::decryption_error& ex) {
    spdlog::critical("Secret {} failed integrity check during reclassify: {}",
                     confide::schema::to_hex(record_id), ex.what());
    throw;
  }

  auto next = confide::schema::secret_record_t{};
  next.record_id = confide::crypto::random_id();
  next.owner = owner;
  next.title = previous.title;
  next.tier = tier;
  next.content = cipher_.seal(plaintext,
                              confide::schema::make_bytes_view(next.record_id));
  next.authorized = previous.authorized;
  next.created_at = now_();

  previous.status = confide::schema::record_status_t::superseded;
  previous.superseded_by = next.record_id;

  storage_.commit(
      {confide::storage::make_put(
           encoder_, confide::schema::key::make_secret_key(encoder_, record_id),
           previous),
       confide::storage::make_put(
           encoder_,
           confide::schema::key::make_secret_key(encoder_, next.record_id),
           next),
       confide::storage::make_put(
           encoder_,
           confide::schema::key::make_secret_owner_key(encoder_, owner,
                                                       next.record_id),
           next.record_id)});

  spdlog::info("Reclassified record {} from {} to {} as {}",
               confide::schema::to_hex(record_id), to_string(previous.tier),
               to_string(tier), confide::schema::to_hex(next.record_id));
  return confide::schema::make_ok(std::move(next), kCodespace);
}

confide::schema::access_result<std::vector<confide::schema::access_log_entry_t>>
secret_vault::access_log(const confide::schema::record_id_t& record_id,
                         const confide::schema::principal_id_t& owner) const {
  using entries_t = std::vector<confide::schema::access_log_entry_t>;
  auto record = load_owned(record_id, owner);
  if (!record.ok()) {
    return confide::schema::make_access_denied<entries_t>(kCodespace);
  }
  auto entries = entries_t{};
  for (const auto& [key, value] : storage_.list_by_prefix(
           confide::schema::key::make_access_log_prefix_key(encoder_,
                                                            record_id))) {
    entries.push_back(
        encoder_.decode<confide::schema::access_log_entry_t>(value));
  }
  return confide::schema::make_ok(std::move(entries), kCodespace);
}

std::vector<confide::schema::secret_record_t> secret_vault::list_owned(
    const confide::schema::principal_id_t& owner) const {
  auto records = std::vector<confide::schema::secret_record_t>{};
  for (const auto& [key, value] : storage_.list_by_prefix(
           confide::schema::key::make_secret_owner_prefix_key(encoder_,
                                                              owner))) {
    auto record_id = encoder_.decode<confide::schema::record_id_t>(value);
    auto record = load(record_id);
    if (record.has_value()) {
      records.push_back(std::move(*record));
    }
  }
  std::ranges::sort(records, [](const auto& a, const auto& b) {
    return a.created_at < b.created_at;
  });
  return records;
}

}  // namespace confide::vault
