#pragma once

#include <confide/schema/primitives.hpp>

namespace confide::schema {

/// Persisted marker of a mutual match. Principals are stored in ascending
/// order so that one pair has exactly one marker.
template <uint16_t Version>
struct match_event;

template <>
struct match_event<1> final {
  uint16_t version{1};
  principal_id_t first_principal;
  principal_id_t second_principal;
  record_id_t first_record{};
  record_id_t second_record{};
  timestamp_milliseconds_t matched_at{};
};

using match_event_t = match_event<1>;

}  // namespace confide::schema
