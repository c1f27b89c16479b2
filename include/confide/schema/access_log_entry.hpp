#pragma once

#include <confide/schema/primitives.hpp>

namespace confide::schema {

template <uint16_t Version>
struct access_log_entry;

template <>
struct access_log_entry<1> final {
  uint16_t version{1};
  record_id_t record_id{};
  uint64_t sequence{};
  principal_id_t principal_id;
  timestamp_milliseconds_t accessed_at{};
  bool success{};
  std::string reason;
};

using access_log_entry_t = access_log_entry<1>;

}  // namespace confide::schema
