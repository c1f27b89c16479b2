#pragma once

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace confide::common {

/// Report an unrecoverable fault (storage corruption, entropy failure) and
/// bring the process down after flushing the log sinks.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

/// As above, with the backend's detail (a RocksDB status, an OpenSSL error)
/// formatted into the message.
template <typename Arg, typename... Args>
[[noreturn]] void critical(fmt::format_string<Arg, Args...> format,
                           Arg&& arg,
                           Args&&... args) {
  critical(std::string_view{fmt::format(format, std::forward<Arg>(arg),
                                        std::forward<Args>(args)...)});
}

}  // namespace confide::common
