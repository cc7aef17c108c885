#pragma once

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace warden::common {

// Unrecoverable storage or codec failure. The process must not continue with
// a journal that may disagree with disk.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("fatal: {}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  critical(std::string_view{
      fmt::format(format, std::forward<Args>(args)...)});
}

}  // namespace warden::common
