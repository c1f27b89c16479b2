#pragma once

#include <confide/schema/access_error_code.hpp>
#include <optional>
#include <string>
#include <utility>

namespace confide::schema {

/// Outcome of an access-controlled operation.
///
/// `log` is the caller-facing reason. Denials issued to anyone other than a
/// record's owner always carry the same code and log, whether the record is
/// missing or forbidden.
template <typename T>
struct access_result final {
  access_error_code code{access_error_code::ok};
  std::optional<T> value;
  std::string log;
  std::string codespace;

  bool ok() const { return code == access_error_code::ok; }
};

inline constexpr auto kAccessDeniedLog = std::string_view{"access denied"};

template <typename T>
access_result<T> make_ok(T value, std::string codespace) {
  return access_result<T>{.code = access_error_code::ok,
                          .value = std::move(value),
                          .log = {},
                          .codespace = std::move(codespace)};
}

template <typename T>
access_result<T> make_error(const access_error_code code,
                            std::string log,
                            std::string codespace) {
  return access_result<T>{.code = code,
                          .value = std::nullopt,
                          .log = std::move(log),
                          .codespace = std::move(codespace)};
}

/// The single denial shape shown to non-owners.
template <typename T>
access_result<T> make_access_denied(std::string codespace) {
  return make_error<T>(access_error_code::authorization_denied,
                       std::string{kAccessDeniedLog}, std::move(codespace));
}

}  // namespace confide::schema
