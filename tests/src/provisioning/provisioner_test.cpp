#include <gtest/gtest.h>
#include <steward/common/errors.hpp>
#include <steward/config/settings.hpp>
#include <steward/provisioning/provisioner.hpp>
#include <steward/testing/common.hpp>
#include <steward/testing/memory_database.hpp>
#include <steward/testing/memory_runtime.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

using provisioner_t =
    steward::provisioning::provisioner<steward::testing::memory_database_tag,
                                       steward::testing::memory_runtime_tag>;

struct provisioning_setup final {
  std::shared_ptr<steward::testing::memory_server_t> server{
      std::make_shared<steward::testing::memory_server_t>()};
  std::shared_ptr<steward::testing::memory_host_t> host{
      std::make_shared<steward::testing::memory_host_t>()};
  steward::database::database<steward::testing::memory_database_tag> admin{
      .server = server};
  steward::runtime::runtime<steward::testing::memory_runtime_tag> runtime{
      .host = host};
  steward::config::server_settings_t settings = [] {
    auto settings = steward::config::server_settings_t{};
    settings.admin_password = "admin-secret";
    settings.ready_attempts = 3;
    settings.ready_interval = std::chrono::milliseconds{1};
    return settings;
  }();

  provisioner_t make() {
    return provisioner_t{admin, runtime, settings, "public",
                         steward::testing::no_sleep()};
  }
};

steward::schema::tenant_identity_t acme(const std::string& secret = "s3cret") {
  return steward::schema::tenant_identity_t{.name = "acme-bots",
                                            .credential_secret = secret};
}

}  // namespace

TEST(provisioner, creates_database_principal_and_grants) {
  auto setup = provisioning_setup{};
  auto provisioner = setup.make();
  auto report = provisioner.ensure_tenant_database(acme());
  EXPECT_TRUE(report.database_created);
  EXPECT_TRUE(report.principal_created);
  EXPECT_TRUE(setup.server->databases.contains("acme_bots_db"));
  EXPECT_EQ(setup.server->roles.at("acme_bots_user"), "s3cret");
  EXPECT_TRUE(setup.server->database_grants.contains(
      {"acme_bots_db", "acme_bots_user"}));
  EXPECT_TRUE(setup.server->schema_grants.contains(
      {"acme_bots_db", "public", "acme_bots_user"}));
}

TEST(provisioner, second_run_is_a_no_op) {
  auto setup = provisioning_setup{};
  auto provisioner = setup.make();
  static_cast<void>(provisioner.ensure_tenant_database(acme()));
  auto databases = setup.server->databases;
  auto roles = setup.server->roles;

  auto report = provisioner.ensure_tenant_database(acme());
  EXPECT_FALSE(report.database_created);
  EXPECT_FALSE(report.principal_created);
  EXPECT_EQ(setup.server->databases, databases);
  EXPECT_EQ(setup.server->roles, roles);
}

TEST(provisioner, never_rewrites_an_existing_credential) {
  auto setup = provisioning_setup{};
  auto provisioner = setup.make();
  static_cast<void>(provisioner.ensure_tenant_database(acme("first")));
  try {
    static_cast<void>(provisioner.ensure_tenant_database(acme("second")));
    FAIL() << "a credential the principal rejects must not be accepted";
  } catch (const steward::common::provisioning_error& ex) {
    EXPECT_EQ(ex.category(), steward::schema::error_category_t::provisioning);
    EXPECT_NE(std::string{ex.what()}.find("acme_bots_user"), std::string::npos);
  }
  EXPECT_EQ(setup.server->roles.at("acme_bots_user"), "first");
  EXPECT_EQ(setup.server->roles.size(), 1u);
}

TEST(provisioner, concurrent_runs_converge) {
  auto setup = provisioning_setup{};
  auto failures = std::vector<std::string>(4);
  auto threads = std::vector<std::thread>{};
  for (auto i = std::size_t{0}; i < failures.size(); ++i) {
    threads.emplace_back([&setup, &failures, i] {
      try {
        auto provisioner = setup.make();
        static_cast<void>(provisioner.ensure_tenant_database(acme()));
      } catch (const std::exception& ex) {
        failures[i] = ex.what();
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  for (const auto& failure : failures) {
    EXPECT_TRUE(failure.empty()) << failure;
  }
  EXPECT_EQ(setup.server->databases.size(), 2u);
  EXPECT_EQ(setup.server->roles.size(), 1u);
}

TEST(provisioner, database_failures_surface_with_their_sqlstate) {
  auto setup = provisioning_setup{};
  setup.server->fail_create_role = "42501";
  auto provisioner = setup.make();
  try {
    static_cast<void>(provisioner.ensure_tenant_database(acme()));
    FAIL() << "provisioning should have failed";
  } catch (const steward::common::provisioning_error& ex) {
    EXPECT_EQ(ex.sqlstate(), "42501");
    EXPECT_EQ(ex.category(), steward::schema::error_category_t::provisioning);
  }
}

TEST(provisioner, rejects_invalid_identities_before_touching_the_server) {
  auto setup = provisioning_setup{};
  auto provisioner = setup.make();
  EXPECT_THROW(static_cast<void>(provisioner.ensure_tenant_database(
                   steward::schema::tenant_identity_t{
                       .name = "Bad Name", .credential_secret = "x"})),
               steward::common::validation_error);
  EXPECT_THROW(static_cast<void>(provisioner.ensure_tenant_database(acme(""))),
               steward::common::validation_error);
  EXPECT_EQ(setup.server->create_database_calls, 0u);
}

TEST(provisioner, creates_the_shared_server_when_absent) {
  auto setup = provisioning_setup{};
  setup.server->unreachable_pings = 2;
  auto provisioner = setup.make();
  provisioner.ensure_server_running();
  auto image = setup.host->running_image(setup.settings.container);
  ASSERT_TRUE(image.has_value());
  EXPECT_EQ(*image, "postgres:16-alpine");
  auto& environment =
      setup.host->containers.at(setup.settings.container).environment;
  EXPECT_EQ(environment.at("POSTGRES_PASSWORD"), "admin-secret");
  EXPECT_EQ(setup.server->ping_calls, 3u);
}

TEST(provisioner, restarts_a_stopped_server_and_leaves_a_running_one) {
  auto setup = provisioning_setup{};
  setup.host->containers[setup.settings.container] =
      steward::testing::memory_container_t{.image = "postgres:15",
                                           .running = false};
  auto provisioner = setup.make();
  provisioner.ensure_server_running();
  EXPECT_EQ(setup.host->running_image(setup.settings.container),
            "postgres:15");
  provisioner.ensure_server_running();
  EXPECT_EQ(setup.host->events,
            std::vector<std::string>{"start_existing:" +
                                     setup.settings.container});
}

TEST(provisioner, gives_up_when_the_server_never_answers) {
  auto setup = provisioning_setup{};
  setup.server->reachable = false;
  auto provisioner = setup.make();
  EXPECT_THROW(provisioner.ensure_server_running(),
               steward::common::resource_unavailable_error);
  EXPECT_EQ(setup.server->ping_calls, setup.settings.ready_attempts);
}

TEST(provisioner, creating_the_server_needs_an_admin_password) {
  auto setup = provisioning_setup{};
  setup.settings.admin_password.clear();
  auto provisioner = setup.make();
  EXPECT_THROW(provisioner.ensure_server_running(),
               steward::common::validation_error);
  EXPECT_TRUE(setup.host->containers.empty());
}

TEST(provisioner, attaches_the_server_to_the_tenant_network) {
  auto setup = provisioning_setup{};
  auto provisioner = setup.make();
  provisioner.ensure_server_running();
  provisioner.ensure_tenant_network(acme());
  provisioner.ensure_tenant_network(acme());
  EXPECT_TRUE(setup.host->networks.contains("steward_acme-bots"));
  EXPECT_TRUE(setup.host->containers.at(setup.settings.container)
                  .networks.contains("steward_acme-bots"));
}
