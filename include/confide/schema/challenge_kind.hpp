#pragma once

#include <confide/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace confide::schema {

enum class challenge_kind_t : uint8_t {
  temporal = 0,
  content = 1,
  relationship = 2,
  identity = 3
};

inline constexpr auto kChallengeKindMappings =
    std::array{std::pair<std::string_view, challenge_kind_t>{
                   "temporal", challenge_kind_t::temporal},
               std::pair<std::string_view, challenge_kind_t>{
                   "content", challenge_kind_t::content},
               std::pair<std::string_view, challenge_kind_t>{
                   "relationship", challenge_kind_t::relationship},
               std::pair<std::string_view, challenge_kind_t>{
                   "identity", challenge_kind_t::identity}};

template <>
inline std::optional<challenge_kind_t> try_from_string<challenge_kind_t>(
    const std::string_view value) {
  return from_string(value, kChallengeKindMappings);
}

inline constexpr std::string_view to_string(const challenge_kind_t value) {
  return name_of(value, kChallengeKindMappings);
}

}  // namespace confide::schema
