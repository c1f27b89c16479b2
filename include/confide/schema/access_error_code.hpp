#pragma once

#include <confide/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace confide::schema {

enum class access_error_code : uint32_t {
  ok = 0,
  not_enrolled = 1,
  authentication_denied = 2,
  challenge_required = 3,
  session_expired = 4,
  session_not_found = 5,
  authorization_denied = 6,
  record_not_found = 7,
  decryption_failed = 8,
  invalid_argument = 9,
  rate_limited = 10,
};

inline constexpr auto kAccessErrorCodeMappings = std::array{
    std::pair<std::string_view, access_error_code>{"ok", access_error_code::ok},
    std::pair<std::string_view, access_error_code>{
        "not_enrolled", access_error_code::not_enrolled},
    std::pair<std::string_view, access_error_code>{
        "authentication_denied", access_error_code::authentication_denied},
    std::pair<std::string_view, access_error_code>{
        "challenge_required", access_error_code::challenge_required},
    std::pair<std::string_view, access_error_code>{
        "session_expired", access_error_code::session_expired},
    std::pair<std::string_view, access_error_code>{
        "session_not_found", access_error_code::session_not_found},
    std::pair<std::string_view, access_error_code>{
        "authorization_denied", access_error_code::authorization_denied},
    std::pair<std::string_view, access_error_code>{
        "record_not_found", access_error_code::record_not_found},
    std::pair<std::string_view, access_error_code>{
        "decryption_failed", access_error_code::decryption_failed},
    std::pair<std::string_view, access_error_code>{
        "invalid_argument", access_error_code::invalid_argument},
    std::pair<std::string_view, access_error_code>{
        "rate_limited", access_error_code::rate_limited}};

inline constexpr std::string_view to_string(const access_error_code value) {
  return name_of(value, kAccessErrorCodeMappings);
}

}  // namespace confide::schema
