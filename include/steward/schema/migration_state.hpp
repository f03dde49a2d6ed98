#pragma once

#include <cstdint>

// Schema type: migration state.
// Physical schema presence versus tracked migration history for one tenant.
namespace steward::schema {

struct migration_state_t final {
  bool schema_objects_exist{};
  bool migration_history_tracked{};
  uint32_t expected_tables{};
  uint32_t present_tables{};
};

/// Some, but not all, expected tables exist.
inline constexpr bool is_partial_schema(const migration_state_t& state) {
  return state.present_tables > 0 &&
         state.present_tables < state.expected_tables;
}

}  // namespace steward::schema
