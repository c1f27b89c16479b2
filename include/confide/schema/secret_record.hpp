#pragma once

#include <confide/schema/primitives.hpp>
#include <confide/schema/record_status.hpp>
#include <confide/schema/sealed_envelope.hpp>
#include <confide/schema/secrecy_tier.hpp>
#include <optional>
#include <vector>

namespace confide::schema {

/// A classified secret. The tier is fixed for the life of the record;
/// reclassification produces a new record and supersedes this one.
///
/// `log_sequence` is the next access-log sequence number and advances on
/// every access attempt. `access_count` only counts granted reads.
template <uint16_t Version>
struct secret_record;

template <>
struct secret_record<1> final {
  uint16_t version{1};
  record_id_t record_id{};
  principal_id_t owner;
  std::string title;
  secrecy_tier_t tier{secrecy_tier_t::secret};
  sealed_envelope_t content;
  std::vector<principal_id_t> authorized;
  uint64_t access_count{};
  uint64_t log_sequence{};
  std::optional<timestamp_milliseconds_t> last_accessed_at;
  timestamp_milliseconds_t created_at{};
  record_status_t status{record_status_t::active};
  std::optional<record_id_t> superseded_by;
};

using secret_record_t = secret_record<1>;

}  // namespace confide::schema
