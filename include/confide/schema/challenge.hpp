#pragma once

#include <confide/schema/challenge_kind.hpp>
#include <confide/schema/primitives.hpp>

namespace confide::schema {

/// Knowledge challenge as shown to the caller. The expected answer stays with
/// the issuer.
struct challenge_t final {
  record_id_t challenge_id{};
  challenge_kind_t kind{challenge_kind_t::identity};
  std::string prompt;
};

struct challenge_response_t final {
  record_id_t challenge_id{};
  std::string answer;
};

}  // namespace confide::schema
