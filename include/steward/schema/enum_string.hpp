#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace steward::schema {

template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

/// "a, b or c" over every name in `mappings`, for operator-facing messages.
template <typename Enum, std::size_t N>
std::string describe_names(const enum_mappings_t<Enum, N>& mappings) {
  auto text = std::string{};
  for (auto i = std::size_t{0}; i < N; ++i) {
    if (i > 0) {
      text += i + 1 == N ? " or " : ", ";
    }
    text += mappings[i].first;
  }
  return text;
}

/// Parse an enum from its external name; specialized next to each enum.
template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) {
  static_cast<void>(value);
  return std::nullopt;
}

}  // namespace steward::schema
