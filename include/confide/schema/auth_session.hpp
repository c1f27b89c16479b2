#pragma once

#include <confide/schema/primitives.hpp>
#include <confide/schema/session_factor.hpp>
#include <algorithm>
#include <optional>
#include <vector>

namespace confide::schema {

/// Live authenticated session. Memory only; never persisted.
struct auth_session_t final {
  session_id_t session_id{};
  principal_id_t principal_id;
  channel_id_t channel_id;
  timestamp_milliseconds_t issued_at{};
  timestamp_milliseconds_t expires_at{};
  double confidence{};
  std::vector<session_factor_t> factors;
  std::optional<std::string> bound_category;

  bool valid_at(const timestamp_milliseconds_t now) const {
    return now < expires_at;
  }

  bool has_factor(const session_factor_t factor) const {
    return std::ranges::find(factors, factor) != std::end(factors);
  }
};

}  // namespace confide::schema
