#pragma once

#include <confide/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace confide::schema {

enum class record_status_t : uint8_t { active = 0, superseded = 1 };

inline constexpr auto kRecordStatusMappings =
    std::array{std::pair<std::string_view, record_status_t>{
                   "active", record_status_t::active},
               std::pair<std::string_view, record_status_t>{
                   "superseded", record_status_t::superseded}};

template <>
inline std::optional<record_status_t> try_from_string<record_status_t>(
    const std::string_view value) {
  return from_string(value, kRecordStatusMappings);
}

inline constexpr std::string_view to_string(const record_status_t value) {
  return name_of(value, kRecordStatusMappings);
}

}  // namespace confide::schema
