#pragma once

#include <confide/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace confide::schema {

enum class principal_status_t : uint8_t {
  pending_enrollment = 0,
  enrolled = 1,
  suspended = 2
};

inline constexpr auto kPrincipalStatusMappings =
    std::array{std::pair<std::string_view, principal_status_t>{
                   "pending_enrollment", principal_status_t::pending_enrollment},
               std::pair<std::string_view, principal_status_t>{
                   "enrolled", principal_status_t::enrolled},
               std::pair<std::string_view, principal_status_t>{
                   "suspended", principal_status_t::suspended}};

template <>
inline std::optional<principal_status_t> try_from_string<principal_status_t>(
    const std::string_view value) {
  return from_string(value, kPrincipalStatusMappings);
}

inline constexpr std::string_view to_string(const principal_status_t value) {
  return name_of(value, kPrincipalStatusMappings);
}

}  // namespace confide::schema
