#pragma once

#include <confide/auth/session_store.hpp>
#include <confide/common/clock.hpp>
#include <confide/common/lock_table.hpp>
#include <confide/crypto/cipher.hpp>
#include <confide/disclosure/mutual_disclosure_matcher.hpp>
#include <confide/schema/access_result.hpp>
#include <confide/schema/disclosure_record.hpp>
#include <confide/schema/encoding/scale/encoder.hpp>
#include <confide/storage/rocksdb/storage.hpp>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace confide::disclosure {

/// Decides whether a disclosure expresses romantic intent toward its target.
using intent_classifier_t =
    std::function<bool(std::string_view title,
                       std::string_view content,
                       const std::optional<std::string>& target_name)>;

/// Keyword classifier used when no external classifier is configured.
intent_classifier_t make_keyword_classifier();

/// Private disclosures with a single designated reader.
///
/// Readers of a record are its owner, its designated reader if one is set,
/// and its target once the record is matched. Nobody else can read it.
class disclosure_registry final {
 public:
  disclosure_registry(
      confide::schema::encoding::scale_encoder_t& encoder,
      const confide::storage::rocksdb_storage_t& storage,
      const confide::crypto::envelope_cipher& cipher,
      confide::auth::session_store& sessions,
      intent_classifier_t classifier = make_keyword_classifier(),
      confide::common::now_provider_t now = confide::common::system_now);

  /// Persist a disclosure and run mutual matching for it. The returned
  /// record reflects a match made by this call.
  confide::schema::access_result<confide::schema::disclosure_record_t> create(
      const confide::schema::principal_id_t& owner,
      const std::string& title,
      const std::string& content,
      const std::optional<confide::schema::principal_id_t>& target_id =
          std::nullopt,
      const std::optional<std::string>& target_name = std::nullopt);

  /// Replace the designated reader. Setting the current reader again is a
  /// no-op.
  confide::schema::access_result<confide::schema::disclosure_record_t>
  set_designated_reader(const confide::schema::record_id_t& record_id,
                        const confide::schema::principal_id_t& owner,
                        const confide::schema::principal_id_t& reader);

  confide::schema::access_result<confide::schema::disclosure_record_t>
  clear_designated_reader(const confide::schema::record_id_t& record_id,
                          const confide::schema::principal_id_t& owner);

  /// Withdraw a pending romantic target. A matched record keeps its match.
  confide::schema::access_result<confide::schema::disclosure_record_t>
  clear_target(const confide::schema::record_id_t& record_id,
               const confide::schema::principal_id_t& owner);

  /// Throws crypto::decryption_error when stored content fails its
  /// integrity check.
  confide::schema::access_result<std::string> read(
      const confide::schema::record_id_t& record_id,
      const confide::schema::principal_id_t& requester) const;

  confide::schema::access_result<std::string> read_with_session(
      const confide::schema::record_id_t& record_id,
      const confide::schema::session_id_t& session_id) const;

  std::vector<confide::schema::principal_id_t> readers(
      const confide::schema::record_id_t& record_id) const;

  std::vector<confide::schema::disclosure_record_t> list_owned(
      const confide::schema::principal_id_t& owner) const;

  std::vector<confide::schema::match_event_t> matches(
      const confide::schema::principal_id_t& principal) const;

  void set_match_listener(match_listener_t listener);

  const mutual_disclosure_matcher& matcher() const { return matcher_; }

 private:
  std::optional<confide::schema::disclosure_record_t> load(
      const confide::schema::record_id_t& record_id) const;

  confide::schema::access_result<confide::schema::disclosure_record_t>
  load_owned(const confide::schema::record_id_t& record_id,
             const confide::schema::principal_id_t& owner) const;

  confide::schema::encoding::scale_encoder_t& encoder_;
  const confide::storage::rocksdb_storage_t& storage_;
  const confide::crypto::envelope_cipher& cipher_;
  confide::auth::session_store& sessions_;
  intent_classifier_t classifier_;
  confide::common::now_provider_t now_;
  confide::common::lock_table record_locks_;
  mutual_disclosure_matcher matcher_;
};

/// Principals allowed to read `record`.
std::vector<confide::schema::principal_id_t> readers_of(
    const confide::schema::disclosure_record_t& record);

}  // namespace confide::disclosure
