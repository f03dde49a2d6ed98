#pragma once

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace steward::common {

/// Report a broken internal invariant, flush every sink and terminate.
///
/// Only for conditions no caller can recover from; operational failures are
/// thrown as `common::error`.
template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  spdlog::shutdown();
  std::terminate();
}

}  // namespace steward::common
