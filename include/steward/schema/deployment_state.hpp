#pragma once

#include <steward/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: deployment state.
// States of one deployment attempt, from validation to a terminal outcome.
namespace steward::schema {

enum class deployment_state_t : uint8_t {
  validating = 0,
  backing_up = 1,
  stopping_old = 2,
  provisioning = 3,
  migrating = 4,
  starting = 5,
  health_checking = 6,
  succeeded = 7,
  rolling_back = 8,
  rolled_back = 9,
  failed = 10,
};

inline constexpr auto kDeploymentStateMappings = std::array{
    std::pair<std::string_view, deployment_state_t>{
        "validating", deployment_state_t::validating},
    std::pair<std::string_view, deployment_state_t>{
        "backing_up", deployment_state_t::backing_up},
    std::pair<std::string_view, deployment_state_t>{
        "stopping_old", deployment_state_t::stopping_old},
    std::pair<std::string_view, deployment_state_t>{
        "provisioning", deployment_state_t::provisioning},
    std::pair<std::string_view, deployment_state_t>{
        "migrating", deployment_state_t::migrating},
    std::pair<std::string_view, deployment_state_t>{
        "starting", deployment_state_t::starting},
    std::pair<std::string_view, deployment_state_t>{
        "health_checking", deployment_state_t::health_checking},
    std::pair<std::string_view, deployment_state_t>{
        "succeeded", deployment_state_t::succeeded},
    std::pair<std::string_view, deployment_state_t>{
        "rolling_back", deployment_state_t::rolling_back},
    std::pair<std::string_view, deployment_state_t>{
        "rolled_back", deployment_state_t::rolled_back},
    std::pair<std::string_view, deployment_state_t>{
        "failed", deployment_state_t::failed},
};

template <>
inline std::optional<deployment_state_t> try_from_string<deployment_state_t>(
    const std::string_view value) {
  return from_string(value, kDeploymentStateMappings);
}

inline constexpr std::string_view to_string(const deployment_state_t value) {
  return to_string(value, kDeploymentStateMappings).value_or("unknown");
}

inline constexpr bool is_terminal(const deployment_state_t value) {
  return value == deployment_state_t::succeeded ||
         value == deployment_state_t::rolled_back ||
         value == deployment_state_t::failed;
}

}  // namespace steward::schema
