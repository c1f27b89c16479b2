#pragma once

#include <confide/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// How much of an owner's private knowledge a contact may see.
namespace confide::schema {

enum class knowledge_access_level_t : uint8_t {
  general = 1,
  personal = 2,
  secret = 3,
  ultra_secret = 4
};

inline constexpr auto kKnowledgeAccessLevelMappings =
    std::array{std::pair<std::string_view, knowledge_access_level_t>{
                   "general", knowledge_access_level_t::general},
               std::pair<std::string_view, knowledge_access_level_t>{
                   "personal", knowledge_access_level_t::personal},
               std::pair<std::string_view, knowledge_access_level_t>{
                   "secret", knowledge_access_level_t::secret},
               std::pair<std::string_view, knowledge_access_level_t>{
                   "ultra_secret", knowledge_access_level_t::ultra_secret}};

template <>
inline std::optional<knowledge_access_level_t>
try_from_string<knowledge_access_level_t>(const std::string_view value) {
  return from_string(value, kKnowledgeAccessLevelMappings);
}

inline constexpr std::string_view to_string(
    const knowledge_access_level_t value) {
  return name_of(value, kKnowledgeAccessLevelMappings);
}

}  // namespace confide::schema
