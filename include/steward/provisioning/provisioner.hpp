#pragma once

#include <spdlog/spdlog.h>
#include <steward/common/errors.hpp>
#include <steward/common/retry.hpp>
#include <steward/config/settings.hpp>
#include <steward/database/database.hpp>
#include <steward/probe/prober.hpp>
#include <steward/runtime/runtime.hpp>
#include <steward/schema/tenant_identity.hpp>

#include <string>
#include <utility>

namespace steward::provisioning {

/// What `ensure_tenant_database` had to create; all false on a re-run.
struct provisioning_report_t final {
  bool database_created{};
  bool principal_created{};
};

/// Guarantees that a tenant has an isolated database and login principal on
/// the shared server without ever destroying or rewriting existing tenant
/// state. Every statement is an "ensure exists" command, so concurrent or
/// repeated calls for the same tenant degrade to no-ops.
template <typename DatabaseLibrary, typename RuntimeLibrary>
class provisioner final {
 public:
  provisioner(const database::database<DatabaseLibrary>& admin,
              const runtime::runtime<RuntimeLibrary>& runtime,
              const config::server_settings_t& server,
              const std::string& schema,
              common::sleeper_t sleeper = common::thread_sleeper())
      : admin_{admin},
        runtime_{runtime},
        prober_{admin, runtime},
        server_{server},
        schema_{schema},
        sleeper_{std::move(sleeper)} {}

  /// Start the shared server container when it is not running and block
  /// until it accepts connections or the retry budget is spent.
  void ensure_server_running() {
    if (runtime_.is_running(server_.container)) {
      spdlog::info("Shared database server '{}' already running",
                   server_.container);
    } else if (runtime_.exists(server_.container)) {
      spdlog::info("Starting stopped shared database server '{}'",
                   server_.container);
      runtime_.start_existing(server_.container);
    } else {
      if (server_.admin_password.empty()) {
        throw common::validation_error{
            "server-admin-password is required to create the shared server"};
      }
      spdlog::info("Creating shared database server '{}' from '{}'",
                   server_.container, server_.image);
      runtime_.start(runtime::container_spec_t{
          .name = server_.container,
          .image = server_.image,
          .environment = {{"POSTGRES_PASSWORD", server_.admin_password},
                          {"POSTGRES_USER", server_.admin_user}},
          .volumes = {server_.volume + ":/var/lib/postgresql/data"},
          .ports = {server_.host + ":" + std::to_string(server_.port) +
                    ":5432"},
          .restart_policy = "unless-stopped"});
    }

    auto policy = common::retry_policy_t{.attempts = server_.ready_attempts,
                                         .interval = server_.ready_interval};
    auto ready = common::poll_until(
        "shared database server", policy,
        [this] { return prober_.is_database_server_ready(); }, sleeper_);
    if (!ready) {
      throw common::resource_unavailable_error{
          "shared database server '" + server_.container +
          "' not ready after " + std::to_string(policy.attempts) +
          " attempt(s)"};
    }
    spdlog::info("Shared database server ready");
  }

  /// Give the tenant its own network and attach the shared server to it.
  void ensure_tenant_network(const schema::tenant_identity_t& tenant) {
    auto network = schema::network_name(tenant);
    runtime_.ensure_network(network);
    runtime_.connect_network(network, server_.container);
  }

  /// Ensure database, principal and grants exist for `tenant`.
  ///
  /// An existing principal keeps its credential; a secret it does not accept
  /// raises `provisioning_error` rather than being applied. Failures are not
  /// retried here.
  provisioning_report_t ensure_tenant_database(
      const schema::tenant_identity_t& tenant) {
    if (!schema::is_valid_tenant_name(tenant.name)) {
      throw common::validation_error{"invalid tenant name '" + tenant.name +
                                     "'"};
    }
    if (tenant.credential_secret.empty()) {
      throw common::validation_error{"tenant '" + tenant.name +
                                     "' has an empty credential"};
    }

    auto database_name = schema::database_name(tenant);
    auto principal = schema::principal_name(tenant);
    auto report = provisioning_report_t{};
    try {
      report.database_created = admin_.create_database(database_name);
      spdlog::info("Database '{}' {}", database_name,
                   report.database_created ? "created" : "already exists");

      report.principal_created =
          admin_.create_role(principal, tenant.credential_secret);
      if (report.principal_created) {
        spdlog::info("Principal '{}' created", principal);
      } else if (!admin_.can_login(principal, tenant.credential_secret,
                                   database_name)) {
        throw common::provisioning_error{
            "principal '" + principal +
            "' already exists with a different credential; the stored "
            "credential is kept and the supplied one cannot log in"};
      } else {
        spdlog::info("Principal '{}' already exists", principal);
      }

      admin_.grant_database(database_name, principal);
      auto tenant_database = admin_.open(database_name);
      tenant_database.grant_schema(schema_, principal);
      spdlog::info("Granted '{}' full privileges on '{}' and schema '{}'",
                   principal, database_name, schema_);
    } catch (const common::database_error& ex) {
      throw common::provisioning_error{
          "provisioning tenant '" + tenant.name + "' failed: " + ex.what(),
          ex.sqlstate()};
    }
    return report;
  }

 private:
  const database::database<DatabaseLibrary>& admin_;
  const runtime::runtime<RuntimeLibrary>& runtime_;
  probe::prober<DatabaseLibrary, RuntimeLibrary> prober_;
  const config::server_settings_t& server_;
  std::string schema_;
  common::sleeper_t sleeper_;
};

}  // namespace steward::provisioning
