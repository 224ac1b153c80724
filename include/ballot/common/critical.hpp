#pragma once

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace ballot::common {

namespace detail {

[[noreturn]] inline void halt() {
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace detail

/// Unrecoverable engine fault: the governance state can no longer be trusted,
/// so the process stops instead of answering with partial results.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  detail::halt();
}

template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  detail::halt();
}

}  // namespace ballot::common
