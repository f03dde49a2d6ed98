#pragma once

#include <steward/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace steward::schema {

enum class deploy_mode_t : uint8_t {
  production = 0,
  staging = 1,
};

inline constexpr auto kDeployModeMappings = std::array{
    std::pair<std::string_view, deploy_mode_t>{"production",
                                               deploy_mode_t::production},
    std::pair<std::string_view, deploy_mode_t>{"staging",
                                               deploy_mode_t::staging},
};

template <>
inline std::optional<deploy_mode_t> try_from_string<deploy_mode_t>(
    const std::string_view value) {
  return from_string(value, kDeployModeMappings);
}

inline constexpr std::string_view to_string(const deploy_mode_t value) {
  return to_string(value, kDeployModeMappings).value_or("unknown");
}

}  // namespace steward::schema
