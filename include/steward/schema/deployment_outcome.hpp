#pragma once

#include <steward/schema/deployment_state.hpp>
#include <steward/schema/error_category.hpp>
#include <steward/schema/exit_code.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

// Schema type: deployment outcome.
// Result of one attempt: terminal state, the state that failed and why, and
// the ordered transition log.
namespace steward::schema {

struct state_record_t final {
  deployment_state_t state{deployment_state_t::validating};
  bool ok{};
  std::chrono::milliseconds duration{};
  std::string detail;
};

struct deployment_outcome_t final {
  deployment_state_t final_state{deployment_state_t::validating};
  std::optional<deployment_state_t> failed_state;
  error_category_t error_category{error_category_t::none};
  std::string error_message;
  std::vector<state_record_t> history;
};

/// Map a terminal outcome onto the process exit code.
inline exit_code_t exit_code_for(
    const deployment_outcome_t& outcome) {
  switch (outcome.final_state) {
    case deployment_state_t::succeeded:
      return exit_code_t::succeeded;
    case deployment_state_t::rolled_back:
      return outcome.error_category == error_category_t::migration_ambiguity
                 ? exit_code_t::operator_action_required
                 : exit_code_t::rolled_back;
    default:
      return exit_code_t::failed;
  }
}

}  // namespace steward::schema
