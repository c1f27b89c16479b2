#pragma once

#include <confide/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace confide::schema {

enum class relationship_type_t : uint8_t {
  unknown = 0,
  family = 1,
  partner = 2,
  friend_ = 3,
  colleague = 4,
  acquaintance = 5
};

inline constexpr auto kRelationshipTypeMappings =
    std::array{std::pair<std::string_view, relationship_type_t>{
                   "unknown", relationship_type_t::unknown},
               std::pair<std::string_view, relationship_type_t>{
                   "family", relationship_type_t::family},
               std::pair<std::string_view, relationship_type_t>{
                   "partner", relationship_type_t::partner},
               std::pair<std::string_view, relationship_type_t>{
                   "friend", relationship_type_t::friend_},
               std::pair<std::string_view, relationship_type_t>{
                   "colleague", relationship_type_t::colleague},
               std::pair<std::string_view, relationship_type_t>{
                   "acquaintance", relationship_type_t::acquaintance}};

template <>
inline std::optional<relationship_type_t>
try_from_string<relationship_type_t>(const std::string_view value) {
  return from_string(value, kRelationshipTypeMappings);
}

inline constexpr std::string_view to_string(const relationship_type_t value) {
  return name_of(value, kRelationshipTypeMappings);
}

}  // namespace confide::schema
