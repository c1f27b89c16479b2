#pragma once

#include <confide/auth/session_store.hpp>
#include <confide/common/clock.hpp>
#include <confide/common/lock_table.hpp>
#include <confide/config/options.hpp>
#include <confide/crypto/cipher.hpp>
#include <confide/schema/access_log_entry.hpp>
#include <confide/schema/access_result.hpp>
#include <confide/schema/encoding/scale/encoder.hpp>
#include <confide/schema/secret_record.hpp>
#include <confide/storage/rocksdb/storage.hpp>
#include <confide/vault/contact_directory.hpp>
#include <functional>
#include <future>
#include <optional>
#include <string>
#include <vector>

namespace confide::vault {

/// Observer for every access-log entry after it is durable.
using access_log_listener_t =
    std::function<void(const confide::schema::access_log_entry_t& entry)>;

/// Which rule released (or refused) a secret.
enum class grant_rule_t : uint8_t { owner, explicit_grant, contact_profile, none };

/// Tiered secret storage with per-record authorization.
///
/// Authorization is evaluated per record in a fixed order, first match wins:
/// the owner, then the record's explicit list, then the owner's contact
/// profile for the requester against the tier's minimum knowledge level.
/// Grants never carry over to other records, including a reclassified copy.
///
/// Every read attempt on an existing record appends exactly one access-log
/// entry, together with the record's counters, in one write batch under the
/// record lock.
class secret_vault final {
 public:
  secret_vault(confide::schema::encoding::scale_encoder_t& encoder,
               const confide::storage::rocksdb_storage_t& storage,
               const confide::crypto::envelope_cipher& cipher,
               confide::auth::session_store& sessions,
               contact_lookup_t contacts,
               confide::config::vault_options options = {},
               confide::common::now_provider_t now = confide::common::system_now);

  confide::schema::access_result<confide::schema::secret_record_t> put(
      const confide::schema::principal_id_t& owner,
      confide::schema::secrecy_tier_t tier,
      const std::string& title,
      const std::string& content,
      const std::vector<confide::schema::principal_id_t>& authorized = {});

  /// Release plaintext to `requester` if authorized. Throws
  /// crypto::decryption_error when stored content fails its integrity check.
  confide::schema::access_result<std::string> get(
      const confide::schema::record_id_t& record_id,
      const confide::schema::principal_id_t& requester);

  /// As get(), for the principal of a live session.
  confide::schema::access_result<std::string> get_with_session(
      const confide::schema::record_id_t& record_id,
      const confide::schema::session_id_t& session_id);

  std::future<confide::schema::access_result<std::string>> get_async(
      confide::schema::record_id_t record_id,
      confide::schema::principal_id_t requester);

  confide::schema::access_result<confide::schema::secret_record_t> authorize(
      const confide::schema::record_id_t& record_id,
      const confide::schema::principal_id_t& owner,
      const confide::schema::principal_id_t& principal);

  confide::schema::access_result<confide::schema::secret_record_t> revoke(
      const confide::schema::record_id_t& record_id,
      const confide::schema::principal_id_t& owner,
      const confide::schema::principal_id_t& principal);

  /// Move content to a new record at `tier`. The old record is superseded
  /// and denies every read from then on. The new record starts with the
  /// same explicit list and an empty access log.
  confide::schema::access_result<confide::schema::secret_record_t> reclassify(
      const confide::schema::record_id_t& record_id,
      const confide::schema::principal_id_t& owner,
      confide::schema::secrecy_tier_t tier);

  /// Owner-only view of the access log, in sequence order.
  confide::schema::access_result<std::vector<confide::schema::access_log_entry_t>>
  access_log(const confide::schema::record_id_t& record_id,
             const confide::schema::principal_id_t& owner) const;

  std::vector<confide::schema::secret_record_t> list_owned(
      const confide::schema::principal_id_t& owner) const;

  void set_access_listener(access_log_listener_t listener);

  /// Pure authorization decision, no logging and no decryption.
  grant_rule_t evaluate(const confide::schema::secret_record_t& record,
                        const confide::schema::principal_id_t& requester) const;

 private:
  std::optional<confide::schema::secret_record_t> load(
      const confide::schema::record_id_t& record_id) const;

  confide::schema::access_result<confide::schema::secret_record_t>
  load_owned(const confide::schema::record_id_t& record_id,
             const confide::schema::principal_id_t& owner) const;

  confide::schema::access_result<std::string> read(
      const confide::schema::record_id_t& record_id,
      const confide::schema::principal_id_t& requester,
      const std::optional<confide::schema::auth_session_t>& session);

  confide::schema::encoding::scale_encoder_t& encoder_;
  const confide::storage::rocksdb_storage_t& storage_;
  const confide::crypto::envelope_cipher& cipher_;
  confide::auth::session_store& sessions_;
  contact_lookup_t contacts_;
  confide::config::vault_options options_;
  confide::common::now_provider_t now_;
  confide::common::lock_table record_locks_;
  access_log_listener_t listener_;
};

}  // namespace confide::vault
