#pragma once

#include <confide/schema/primitives.hpp>
#include <confide/schema/principal_status.hpp>

namespace confide::schema {

template <uint16_t Version>
struct principal_record;

template <>
struct principal_record<1> final {
  uint16_t version{1};
  principal_id_t principal_id;
  std::string display_name;
  principal_status_t status{principal_status_t::pending_enrollment};
  timestamp_milliseconds_t created_at{};
};

using principal_record_t = principal_record<1>;

}  // namespace confide::schema
