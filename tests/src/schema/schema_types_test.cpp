#include <gtest/gtest.h>
#include <steward/schema/deploy_mode.hpp>
#include <steward/schema/deployment_outcome.hpp>
#include <steward/schema/deployment_state.hpp>
#include <steward/schema/error_category.hpp>
#include <steward/schema/exit_code.hpp>
#include <steward/schema/migration_state.hpp>
#include <steward/schema/release.hpp>

#include <string_view>

TEST(schema_types, deployment_state_names_round_trip) {
  for (const auto& [name, state] : steward::schema::kDeploymentStateMappings) {
    EXPECT_EQ(steward::schema::to_string(state), name);
    auto parsed =
        steward::schema::try_from_string<steward::schema::deployment_state_t>(
            name);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, state);
  }
  EXPECT_FALSE(
      steward::schema::try_from_string<steward::schema::deployment_state_t>(
          "paused")
          .has_value());
}

TEST(schema_types, deploy_mode_accepts_only_known_modes) {
  EXPECT_EQ(
      steward::schema::try_from_string<steward::schema::deploy_mode_t>(
          "staging"),
      steward::schema::deploy_mode_t::staging);
  EXPECT_EQ(
      steward::schema::try_from_string<steward::schema::deploy_mode_t>(
          "production"),
      steward::schema::deploy_mode_t::production);
  EXPECT_FALSE(
      steward::schema::try_from_string<steward::schema::deploy_mode_t>("prod")
          .has_value());
}

TEST(schema_types, describes_accepted_names) {
  EXPECT_EQ(steward::schema::describe_names(steward::schema::kDeployModeMappings),
            "production or staging");
  EXPECT_EQ(steward::schema::describe_names(
                steward::schema::kDeploymentStateMappings)
                .find("validating, backing_up, "),
            0u);
}

TEST(schema_types, error_category_has_stable_names) {
  EXPECT_EQ(steward::schema::to_string(
                steward::schema::error_category_t::migration_ambiguity),
            "migration_ambiguity");
  EXPECT_EQ(steward::schema::to_string(
                steward::schema::error_category_t::health_check_timeout),
            "health_check_timeout");
}

TEST(schema_types, exit_codes_follow_the_outcome) {
  using enum steward::schema::deployment_state_t;
  auto outcome = steward::schema::deployment_outcome_t{.final_state = succeeded};
  EXPECT_EQ(steward::schema::to_int(steward::schema::exit_code_for(outcome)),
            0);

  outcome.final_state = failed;
  EXPECT_EQ(steward::schema::to_int(steward::schema::exit_code_for(outcome)),
            1);

  outcome.final_state = rolled_back;
  outcome.error_category =
      steward::schema::error_category_t::health_check_timeout;
  EXPECT_EQ(steward::schema::to_int(steward::schema::exit_code_for(outcome)),
            2);

  outcome.error_category =
      steward::schema::error_category_t::migration_ambiguity;
  EXPECT_EQ(steward::schema::to_int(steward::schema::exit_code_for(outcome)),
            3);
}

TEST(schema_types, partial_schema_means_some_but_not_all_tables) {
  auto state = steward::schema::migration_state_t{.expected_tables = 3};
  EXPECT_FALSE(steward::schema::is_partial_schema(state));
  state.present_tables = 1;
  EXPECT_TRUE(steward::schema::is_partial_schema(state));
  state.present_tables = 3;
  EXPECT_FALSE(steward::schema::is_partial_schema(state));
}

TEST(schema_types, releases_compare_by_value) {
  auto a = steward::schema::release_t{.image = "acme:v1",
                                      .deployed_at = "2026-01-01T00:00:00Z"};
  auto b = a;
  EXPECT_EQ(a, b);
  b.image = "acme:v2";
  EXPECT_NE(a, b);
}
