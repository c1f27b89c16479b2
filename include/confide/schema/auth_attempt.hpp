#pragma once

#include <confide/schema/primitives.hpp>

namespace confide::schema {

enum class auth_outcome_t : uint8_t {
  authenticated = 0,
  challenge_required = 1,
  denied = 2
};

/// One entry of the authentication audit trail. Every verify call writes one.
template <uint16_t Version>
struct auth_attempt;

template <>
struct auth_attempt<1> final {
  uint16_t version{1};
  principal_id_t principal_id;
  channel_id_t channel_id;
  timestamp_milliseconds_t attempted_at{};
  uint32_t score_ppm{};
  auth_outcome_t outcome{auth_outcome_t::denied};
  std::string reason;
};

using auth_attempt_t = auth_attempt<1>;

}  // namespace confide::schema
