#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

#include <steward/common/retry.hpp>

namespace steward::testing {

inline std::filesystem::path make_temp_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  return std::filesystem::temp_directory_path() /
         (std::string{prefix} + "_" +
          std::to_string(static_cast<unsigned long long>(now)));
}

inline void remove_path(const std::filesystem::path& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

inline std::string read_text(const std::filesystem::path& path) {
  auto stream = std::ifstream{path, std::ios::binary};
  return std::string{std::istreambuf_iterator<char>{stream},
                     std::istreambuf_iterator<char>{}};
}

inline void write_text(const std::filesystem::path& path,
                       const std::string_view text) {
  std::filesystem::create_directories(path.parent_path());
  auto stream = std::ofstream{path, std::ios::binary | std::ios::trunc};
  stream << text;
}

/// Sleeper that records requested delays instead of waiting.
inline common::sleeper_t no_sleep() {
  return [](std::chrono::milliseconds) {};
}

}  // namespace steward::testing
