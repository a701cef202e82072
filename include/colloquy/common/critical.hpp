#pragma once

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace colloquy::common {

/// Log an unrecoverable invariant violation and terminate the process.
/// Reserved for programming errors; anything a caller can recover from is
/// thrown instead.
template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  spdlog::default_logger_raw()->flush();
  spdlog::shutdown();
  std::terminate();
}

}  // namespace colloquy::common
