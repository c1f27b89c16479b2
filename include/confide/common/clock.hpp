#pragma once

#include <confide/schema/primitives.hpp>
#include <functional>

namespace confide::common {

/// Source of "now" in Unix milliseconds. Components take one of these so that
/// expiry and rate-limit windows can be driven deterministically.
using now_provider_t = std::function<confide::schema::timestamp_milliseconds_t()>;

confide::schema::timestamp_milliseconds_t system_now();

}  // namespace confide::common
