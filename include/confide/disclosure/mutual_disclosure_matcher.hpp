#pragma once

#include <confide/common/clock.hpp>
#include <confide/common/lock_table.hpp>
#include <confide/schema/disclosure_record.hpp>
#include <confide/schema/encoding/scale/encoder.hpp>
#include <confide/schema/match_event.hpp>
#include <confide/storage/rocksdb/storage.hpp>
#include <functional>
#include <optional>
#include <vector>

namespace confide::disclosure {

/// Called once per principal pair, after both records are durably matched.
using match_listener_t =
    std::function<void(const confide::schema::match_event_t& event)>;

/// Two disclosure records read from one consistent view.
struct match_state_t final {
  std::optional<confide::schema::disclosure_record_t> first;
  std::optional<confide::schema::disclosure_record_t> second;
};

/// Detects reciprocal romantic disclosures.
///
/// Work for a pair runs under a lock keyed on the unordered principal pair,
/// then under both record locks. Both records flip to matched, and the pair
/// marker is written, in a single write batch, so no reader can observe one
/// side matched without the other. The pair marker makes the notification
/// fire exactly once per pair regardless of how many records either side
/// later creates.
class mutual_disclosure_matcher final {
 public:
  mutual_disclosure_matcher(
      confide::schema::encoding::scale_encoder_t& encoder,
      const confide::storage::rocksdb_storage_t& storage,
      confide::common::lock_table& record_locks,
      confide::common::now_provider_t now = confide::common::system_now);

  /// Inspect a freshly persisted record. Returns the match event when this
  /// call created the pair's match.
  std::optional<confide::schema::match_event_t> on_created(
      const confide::schema::disclosure_record_t& record);

  void set_match_listener(match_listener_t listener);

  std::vector<confide::schema::match_event_t> matches(
      const confide::schema::principal_id_t& principal) const;

  std::optional<confide::schema::match_event_t> find_match(
      const confide::schema::principal_id_t& a,
      const confide::schema::principal_id_t& b) const;

  match_state_t match_state(const confide::schema::record_id_t& first,
                            const confide::schema::record_id_t& second) const;

 private:
  std::optional<confide::schema::disclosure_record_t> load(
      const confide::schema::record_id_t& record_id) const;

  std::optional<confide::schema::disclosure_record_t> find_reciprocal(
      const confide::schema::disclosure_record_t& record) const;

  confide::schema::encoding::scale_encoder_t& encoder_;
  const confide::storage::rocksdb_storage_t& storage_;
  confide::common::lock_table& record_locks_;
  confide::common::now_provider_t now_;
  confide::common::lock_table pair_locks_;
  match_listener_t listener_;
};

/// True when `candidate` is a romantic record naming `record`'s owner and
/// owned by `record`'s target.
bool reciprocates(const confide::schema::disclosure_record_t& record,
                  const confide::schema::disclosure_record_t& candidate);

}  // namespace confide::disclosure
