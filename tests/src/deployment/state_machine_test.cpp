#include <gtest/gtest.h>
#include <steward/deployment/state_machine.hpp>
#include <steward/schema/deployment_state.hpp>

#include <array>
#include <cstddef>
#include <initializer_list>

namespace {

using steward::deployment::next_state;
using enum steward::schema::deployment_state_t;

}  // namespace

TEST(state_machine, happy_path_visits_every_forward_state) {
  auto path = std::array{validating,   backing_up, stopping_old,
                         provisioning, migrating,  starting,
                         health_checking, succeeded};
  for (auto i = std::size_t{0}; i + 1 < path.size(); ++i) {
    EXPECT_EQ(next_state(path[i], true, true), path[i + 1])
        << steward::schema::to_string(path[i]);
    EXPECT_EQ(next_state(path[i], true, false), path[i + 1])
        << steward::schema::to_string(path[i]);
  }
}

TEST(state_machine, failures_before_touching_the_service_end_failed) {
  EXPECT_EQ(next_state(validating, false, true), failed);
  EXPECT_EQ(next_state(backing_up, false, true), failed);
  EXPECT_EQ(next_state(validating, false, false), failed);
  EXPECT_EQ(next_state(backing_up, false, false), failed);
}

TEST(state_machine, later_failures_roll_back_only_with_a_snapshot) {
  for (const auto state :
       {stopping_old, provisioning, migrating, starting, health_checking}) {
    EXPECT_EQ(next_state(state, false, true), rolling_back)
        << steward::schema::to_string(state);
    EXPECT_EQ(next_state(state, false, false), failed)
        << steward::schema::to_string(state);
    EXPECT_TRUE(steward::deployment::requires_rollback(state));
  }
  EXPECT_FALSE(steward::deployment::requires_rollback(validating));
  EXPECT_FALSE(steward::deployment::requires_rollback(rolling_back));
}

TEST(state_machine, rollback_resolves_to_rolled_back_or_failed) {
  EXPECT_EQ(next_state(rolling_back, true, true), rolled_back);
  EXPECT_EQ(next_state(rolling_back, false, true), failed);
}

TEST(state_machine, terminal_states_are_absorbing) {
  for (const auto state : {succeeded, rolled_back, failed}) {
    EXPECT_TRUE(steward::schema::is_terminal(state));
    EXPECT_EQ(next_state(state, true, true), state);
    EXPECT_EQ(next_state(state, false, false), state);
  }
  EXPECT_FALSE(steward::schema::is_terminal(rolling_back));
}
