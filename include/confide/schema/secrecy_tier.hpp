#pragma once

#include <confide/schema/enum_string.hpp>
#include <confide/schema/knowledge_access_level.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Classification of a secret record. Ordered: secret < confidential <
// ultra_secret.
namespace confide::schema {

enum class secrecy_tier_t : uint8_t {
  secret = 1,
  confidential = 2,
  ultra_secret = 3
};

inline constexpr auto kSecrecyTierMappings =
    std::array{std::pair<std::string_view, secrecy_tier_t>{
                   "secret", secrecy_tier_t::secret},
               std::pair<std::string_view, secrecy_tier_t>{
                   "confidential", secrecy_tier_t::confidential},
               std::pair<std::string_view, secrecy_tier_t>{
                   "ultra_secret", secrecy_tier_t::ultra_secret}};

template <>
inline std::optional<secrecy_tier_t> try_from_string<secrecy_tier_t>(
    const std::string_view value) {
  return from_string(value, kSecrecyTierMappings);
}

inline constexpr std::string_view to_string(const secrecy_tier_t value) {
  return name_of(value, kSecrecyTierMappings);
}

/// Minimum contact knowledge level that unlocks a tier through the contact
/// profile rule. ultra_secret shares the secret level.
inline constexpr knowledge_access_level_t required_knowledge_level(
    const secrecy_tier_t tier) {
  switch (tier) {
    case secrecy_tier_t::secret:
      return knowledge_access_level_t::personal;
    case secrecy_tier_t::confidential:
      return knowledge_access_level_t::secret;
    case secrecy_tier_t::ultra_secret:
      return knowledge_access_level_t::secret;
  }
  return knowledge_access_level_t::ultra_secret;
}

}  // namespace confide::schema
