#pragma once

namespace steward::schema {

/// Process exit status reported to calling automation.
enum class exit_code_t : int {
  succeeded = 0,
  failed = 1,
  rolled_back = 2,
  operator_action_required = 3,
  usage = 64,
};

inline constexpr int to_int(const exit_code_t value) {
  return static_cast<int>(value);
}

}  // namespace steward::schema
