#pragma once

#include <csignal>
#include <exception>
#include <utility>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace coffer::common {

/// Logs the formatted message and terminates the process. Only for states the
/// process cannot continue from, such as a storage handle that was never
/// opened.
template <typename... Args>
[[noreturn]] void critical(fmt::format_string<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace coffer::common
