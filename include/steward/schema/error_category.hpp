#pragma once

#include <steward/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace steward::schema {

enum class error_category_t : uint8_t {
  none = 0,
  validation = 1,
  resource_unavailable = 2,
  provisioning = 3,
  migration_ambiguity = 4,
  migration = 5,
  health_check_timeout = 6,
  runtime_command = 7,
  database = 8,
  snapshot = 9,
  internal = 10,
};

inline constexpr auto kErrorCategoryMappings = std::array{
    std::pair<std::string_view, error_category_t>{"none",
                                                  error_category_t::none},
    std::pair<std::string_view, error_category_t>{
        "validation", error_category_t::validation},
    std::pair<std::string_view, error_category_t>{
        "resource_unavailable", error_category_t::resource_unavailable},
    std::pair<std::string_view, error_category_t>{
        "provisioning", error_category_t::provisioning},
    std::pair<std::string_view, error_category_t>{
        "migration_ambiguity", error_category_t::migration_ambiguity},
    std::pair<std::string_view, error_category_t>{
        "migration", error_category_t::migration},
    std::pair<std::string_view, error_category_t>{
        "health_check_timeout", error_category_t::health_check_timeout},
    std::pair<std::string_view, error_category_t>{
        "runtime_command", error_category_t::runtime_command},
    std::pair<std::string_view, error_category_t>{"database",
                                                  error_category_t::database},
    std::pair<std::string_view, error_category_t>{"snapshot",
                                                  error_category_t::snapshot},
    std::pair<std::string_view, error_category_t>{"internal",
                                                  error_category_t::internal},
};

template <>
inline std::optional<error_category_t> try_from_string<error_category_t>(
    const std::string_view value) {
  return from_string(value, kErrorCategoryMappings);
}

inline constexpr std::string_view to_string(const error_category_t value) {
  return to_string(value, kErrorCategoryMappings).value_or("unknown");
}

}  // namespace steward::schema
