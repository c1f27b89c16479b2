#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

namespace confide::schema {

/// Name table of a closed enum. Names are the persisted and operator-facing
/// spelling, lower snake case.
template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

inline constexpr std::string_view kUnknownEnumName = "unknown";

/// ASCII case-insensitive comparison where '-' in the input stands for '_',
/// so "Ultra-Secret" matches "ultra_secret".
constexpr bool enum_name_matches(const std::string_view name,
                                 const std::string_view input) {
  if (name.size() != input.size()) {
    return false;
  }
  for (std::size_t i = 0; i < name.size(); ++i) {
    auto ch = input[i];
    if (ch >= 'A' && ch <= 'Z') {
      ch = static_cast<char>(ch - 'A' + 'a');
    } else if (ch == '-') {
      ch = '_';
    }
    if (ch != name[i]) {
      return false;
    }
  }
  return true;
}

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_name_matches(name, value)) {
      return enum_value;
    }
  }
  return std::nullopt;
}

/// Name of `value`, or "unknown" for values outside the table (for example
/// a newer enumerator decoded from storage).
template <typename Enum, std::size_t N>
constexpr std::string_view name_of(const Enum value,
                                   const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return kUnknownEnumName;
}

template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) {
  static_cast<void>(value);
  return std::nullopt;
}

}  // namespace confide::schema
