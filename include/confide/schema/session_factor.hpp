#pragma once

#include <confide/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Factors that contributed to an authenticated session, in the order they
// were satisfied.
namespace confide::schema {

enum class session_factor_t : uint8_t { voice = 0, challenge = 1 };

inline constexpr auto kSessionFactorMappings =
    std::array{std::pair<std::string_view, session_factor_t>{
                   "voice", session_factor_t::voice},
               std::pair<std::string_view, session_factor_t>{
                   "challenge", session_factor_t::challenge}};

template <>
inline std::optional<session_factor_t> try_from_string<session_factor_t>(
    const std::string_view value) {
  return from_string(value, kSessionFactorMappings);
}

inline constexpr std::string_view to_string(const session_factor_t value) {
  return name_of(value, kSessionFactorMappings);
}

}  // namespace confide::schema
