#include <gtest/gtest.h>
#include <steward/common/errors.hpp>
#include <steward/config/options.hpp>
#include <steward/testing/common.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

namespace {

steward::config::command_line_t parse(std::vector<const char*> args) {
  args.insert(std::begin(args), "steward");
  return steward::config::parse_command_line(static_cast<int>(args.size()),
                                             args.data());
}

/// Sets an environment variable for the lifetime of the guard.
class scoped_environment final {
 public:
  scoped_environment(const char* name, const char* value) : name_{name} {
    ::setenv(name, value, 1);
  }
  scoped_environment(const scoped_environment&) = delete;
  scoped_environment& operator=(const scoped_environment&) = delete;
  ~scoped_environment() { ::unsetenv(name_); }

 private:
  const char* name_;
};

}  // namespace

TEST(options, parses_deploy_inputs) {
  auto cli = parse({"deploy", "--tenant", "acme", "--credential", "pw",
                    "--image", "registry.example.com/bot:1.2", "--mode",
                    "staging", "--feature", "PAYMENTS=on", "--feature",
                    "BETA=1"});
  EXPECT_EQ(cli.command, "deploy");
  EXPECT_FALSE(cli.help);
  EXPECT_EQ(cli.request.tenant.name, "acme");
  EXPECT_EQ(cli.request.tenant.credential_secret, "pw");
  EXPECT_EQ(cli.request.image, "registry.example.com/bot:1.2");
  EXPECT_EQ(cli.request.mode, "staging");
  ASSERT_EQ(cli.request.features.size(), 2u);
  EXPECT_EQ(cli.request.features.at("PAYMENTS"), "on");
  EXPECT_EQ(cli.request.features.at("BETA"), "1");
  EXPECT_FALSE(cli.request.bundle_directory.has_value());
}

TEST(options, applies_defaults) {
  auto cli = parse({"probe"});
  EXPECT_EQ(cli.settings.state_root, std::filesystem::path{"/var/lib/steward"});
  EXPECT_EQ(cli.settings.server.port, 5432);
  EXPECT_EQ(cli.settings.server.container, "steward_postgres_shared");
  EXPECT_EQ(cli.settings.health.required_key, "DB_PASSWORD");
  EXPECT_EQ(cli.settings.health.timeout, std::chrono::seconds{120});
  EXPECT_EQ(cli.settings.health.interval, std::chrono::milliseconds{3000});
  EXPECT_EQ(cli.settings.runtime.stop_timeout, std::chrono::seconds{30});
  EXPECT_EQ(cli.settings.runtime.pull_attempts, 3u);
  EXPECT_EQ(cli.settings.runtime.pull_interval,
            std::chrono::milliseconds{10000});
  EXPECT_EQ(cli.settings.migration.expected_tables,
            std::vector<std::string>{"users"});
  EXPECT_EQ(cli.settings.logging.level, "info");
}

TEST(options, converts_durations) {
  auto cli = parse({"deploy", "--health-timeout-seconds", "5",
                    "--health-interval-ms", "250", "--stop-timeout-seconds",
                    "7", "--server-ready-interval-ms", "100",
                    "--runtime-ready-interval-ms", "40", "--pull-interval-ms",
                    "900"});
  EXPECT_EQ(cli.settings.health.timeout, std::chrono::seconds{5});
  EXPECT_EQ(cli.settings.health.interval, std::chrono::milliseconds{250});
  EXPECT_EQ(cli.settings.runtime.stop_timeout, std::chrono::seconds{7});
  EXPECT_EQ(cli.settings.server.ready_interval,
            std::chrono::milliseconds{100});
  EXPECT_EQ(cli.settings.runtime.ready_interval,
            std::chrono::milliseconds{40});
  EXPECT_EQ(cli.settings.runtime.pull_interval,
            std::chrono::milliseconds{900});
}

TEST(options, expected_tables_compose) {
  auto cli = parse({"deploy", "--expected-table", "users", "--expected-table",
                    "guilds"});
  EXPECT_EQ(cli.settings.migration.expected_tables,
            (std::vector<std::string>{"users", "guilds"}));
}

TEST(options, rejects_missing_or_unknown_commands) {
  EXPECT_THROW(parse({}), steward::common::validation_error);
  EXPECT_THROW(parse({"destroy"}), steward::common::validation_error);
  EXPECT_THROW(parse({"deploy", "--no-such-option"}),
               steward::common::validation_error);
  EXPECT_THROW(parse({"deploy", "--server-port", "not-a-port"}),
               steward::common::validation_error);
  EXPECT_THROW(parse({"deploy", "--feature", "BROKEN"}),
               steward::common::validation_error);
  EXPECT_THROW(parse({"deploy", "--log-level", "loud"}),
               steward::common::validation_error);
}

TEST(options, help_needs_no_command) {
  auto cli = parse({"--help"});
  EXPECT_TRUE(cli.help);
  EXPECT_NE(cli.description.find("--tenant"), std::string::npos);
  EXPECT_NE(cli.description.find("--health-timeout-seconds"),
            std::string::npos);
}

TEST(options, config_file_fills_unset_options) {
  auto dir = steward::testing::make_temp_path("steward_options");
  auto file = dir / "steward.ini";
  steward::testing::write_text(file,
                               "tenant = from-file\n"
                               "image = acme:file\n"
                               "server-port = 6543\n");
  auto cli = parse({"deploy", "--config", file.c_str(), "--image",
                    "acme:cli"});
  EXPECT_EQ(cli.request.tenant.name, "from-file");
  EXPECT_EQ(cli.request.image, "acme:cli");
  EXPECT_EQ(cli.settings.server.port, 6543);
  steward::testing::remove_path(dir);
}

TEST(options, missing_config_file_is_rejected) {
  EXPECT_THROW(parse({"deploy", "--config", "/nonexistent/steward.ini"}),
               steward::common::validation_error);
}

TEST(options, environment_supplies_lowest_precedence_values) {
  auto root = scoped_environment{"STEWARD_STATE_ROOT", "/tmp/steward-env"};
  auto mode = scoped_environment{"STEWARD_MODE", "staging"};
  auto cli = parse({"deploy", "--mode", "production"});
  EXPECT_EQ(cli.settings.state_root, std::filesystem::path{"/tmp/steward-env"});
  EXPECT_EQ(cli.request.mode, "production");
}

TEST(options, maps_environment_variable_names) {
  EXPECT_EQ(steward::config::environment_to_option("STEWARD_STATE_ROOT"),
            "state-root");
  EXPECT_EQ(steward::config::environment_to_option("STEWARD_HEALTH_URL"),
            "health-url");
  EXPECT_EQ(steward::config::environment_to_option("STEWARD_"), "");
  EXPECT_EQ(steward::config::environment_to_option("HOME"), "");
}

TEST(options, parses_feature_toggles) {
  auto features = steward::config::parse_features({"A=1", "B=", "C=x=y"});
  EXPECT_EQ(features.at("A"), "1");
  EXPECT_EQ(features.at("B"), "");
  EXPECT_EQ(features.at("C"), "x=y");
  EXPECT_THROW(steward::config::parse_features({"=1"}),
               steward::common::validation_error);
}
