#pragma once

#include <spdlog/spdlog.h>
#include <steward/common/errors.hpp>
#include <steward/common/retry.hpp>
#include <steward/config/settings.hpp>
#include <steward/database/database.hpp>
#include <steward/deployment/environment_file.hpp>
#include <steward/deployment/state_machine.hpp>
#include <steward/deployment/workspace.hpp>
#include <steward/migration/reconciler.hpp>
#include <steward/probe/prober.hpp>
#include <steward/provisioning/provisioner.hpp>
#include <steward/runtime/runtime.hpp>
#include <steward/schema/deploy_mode.hpp>
#include <steward/schema/deployment_outcome.hpp>
#include <steward/schema/deployment_request.hpp>
#include <steward/schema/deployment_state.hpp>

#include <algorithm>
#include <chrono>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace steward::deployment {

/// Drives one tenant through a deploy-or-rollback cycle.
///
/// States run strictly in sequence; each entry action either completes or
/// throws, and `next_state` decides where the attempt goes from there. The
/// old instance is always stopped before the new one starts. Concurrent runs
/// for the same tenant are not supported and must be serialized by the caller.
template <typename DatabaseLibrary, typename RuntimeLibrary>
class pipeline final {
 public:
  pipeline(const database::database<DatabaseLibrary>& admin,
           const runtime::runtime<RuntimeLibrary>& runtime,
           const config::settings_t& settings,
           common::sleeper_t sleeper = common::thread_sleeper())
      : runtime_{runtime},
        settings_{settings},
        sleeper_{std::move(sleeper)},
        prober_{admin, runtime},
        provisioner_{admin, runtime, settings.server, settings.migration.schema,
                     sleeper_},
        reconciler_{admin, runtime, settings.migration} {}

  schema::deployment_outcome_t run(
      const schema::deployment_request_t& request) {
    using enum schema::deployment_state_t;
    auto attempt = attempt_t{.request = request};
    auto outcome = schema::deployment_outcome_t{};
    auto state = validating;
    auto started = std::chrono::steady_clock::now();
    spdlog::info("Deploying '{}' for tenant '{}'", request.image,
                 request.tenant.name);

    while (!schema::is_terminal(state)) {
      auto record = schema::state_record_t{.state = state};
      auto state_started = std::chrono::steady_clock::now();
      try {
        record.detail = enter(state, attempt);
        record.ok = true;
      } catch (const common::error& ex) {
        record.detail = ex.what();
        note_failure(outcome, state, ex.category(), ex.what());
      } catch (const std::exception& ex) {
        record.detail = ex.what();
        note_failure(outcome, state, schema::error_category_t::internal,
                     ex.what());
      }
      record.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - state_started);
      if (record.ok) {
        spdlog::info("[ok] {} ({} ms) {}", schema::to_string(state),
                     record.duration.count(), record.detail);
      } else {
        spdlog::error("[failed] {} ({} ms) {}", schema::to_string(state),
                      record.duration.count(), record.detail);
      }
      outcome.history.push_back(record);

      auto next = next_state(state, record.ok, attempt.snapshot_available);
      if (next == failed && !record.ok && requires_rollback(state)) {
        spdlog::error("No snapshot to roll back to; leaving tenant '{}' as is",
                      request.tenant.name);
      }
      state = next;
    }

    outcome.final_state = state;
    auto total = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started);
    if (state == succeeded) {
      spdlog::info("Deployment of '{}' for tenant '{}' succeeded in {}s",
                   request.image, request.tenant.name, total.count());
    } else {
      spdlog::error("Deployment for tenant '{}' ended {} after {}s; failing "
                    "state: {} ({}): {}",
                    request.tenant.name, schema::to_string(state),
                    total.count(),
                    schema::to_string(outcome.failed_state.value_or(state)),
                    schema::to_string(outcome.error_category),
                    outcome.error_message);
    }
    return outcome;
  }

 private:
  struct attempt_t final {
    schema::deployment_request_t request;
    schema::deploy_mode_t mode{schema::deploy_mode_t::production};
    std::optional<deployment::workspace> workspace;
    bool snapshot_available{};
  };

  static void note_failure(schema::deployment_outcome_t& outcome,
                           const schema::deployment_state_t state,
                           const schema::error_category_t category,
                           const std::string& message) {
    // The first failure names the attempt; a failing rollback is appended.
    if (!outcome.failed_state) {
      outcome.failed_state = state;
      outcome.error_category = category;
      outcome.error_message = message;
    } else {
      outcome.error_message += "; " + std::string{schema::to_string(state)} +
                               ": " + message;
    }
  }

  std::string enter(const schema::deployment_state_t state,
                    attempt_t& attempt) {
    using enum schema::deployment_state_t;
    switch (state) {
      case validating:
        return validate(attempt);
      case backing_up:
        return back_up(attempt);
      case stopping_old:
        return stop_old(attempt);
      case provisioning:
        return provision(attempt);
      case migrating:
        return migrate(attempt);
      case starting:
        return start(attempt);
      case health_checking:
        return check_health(attempt);
      case rolling_back:
        return roll_back(attempt);
      default:
        throw common::error{schema::error_category_t::internal,
                            "no entry action for terminal state"};
    }
  }

  std::string validate(attempt_t& attempt) {
    const auto& request = attempt.request;
    auto missing = std::vector<std::string>{};
    if (request.tenant.name.empty()) {
      missing.emplace_back("tenant");
    }
    if (request.tenant.credential_secret.empty()) {
      missing.emplace_back("credential");
    }
    if (request.image.empty()) {
      missing.emplace_back("image");
    }
    if (request.mode.empty()) {
      missing.emplace_back("mode");
    }
    if (!missing.empty()) {
      auto names = std::string{};
      for (const auto& name : missing) {
        names += names.empty() ? name : ", " + name;
      }
      throw common::validation_error{"missing required input(s): " + names};
    }
    if (!schema::is_valid_tenant_name(request.tenant.name)) {
      throw common::validation_error{
          "tenant name '" + request.tenant.name +
          "' must be lowercase letters, digits or '-' (at most " +
          std::to_string(schema::kMaxTenantNameLength) + " characters)"};
    }
    auto mode = schema::try_from_string<schema::deploy_mode_t>(request.mode);
    if (!mode) {
      throw common::validation_error{
          "mode '" + request.mode + "' must be " +
          schema::describe_names(schema::kDeployModeMappings)};
    }
    if (request.image.find_first_of(" \t\r\n") != std::string::npos) {
      throw common::validation_error{"image reference '" + request.image +
                                     "' contains whitespace"};
    }
    if (request.bundle_directory &&
        !std::filesystem::is_directory(*request.bundle_directory)) {
      throw common::validation_error{"bundle directory " +
                                     request.bundle_directory->string() +
                                     " does not exist"};
    }
    // Render once so malformed values fail here, before any side effect.
    static_cast<void>(make_environment(request, *mode, settings_.server));
    attempt.mode = *mode;
    return "inputs valid (" + std::string{schema::to_string(*mode)} + ")";
  }

  std::string back_up(attempt_t& attempt) {
    // Nothing below may mutate state until the runtime answers and the new
    // image is available locally.
    ensure_runtime_ready();
    pull_image(attempt.request.image);

    attempt.workspace.emplace(settings_.state_root, attempt.request.tenant.name);
    auto snapshot = attempt.workspace->create_snapshot();
    attempt.snapshot_available = snapshot.has_value();
    if (!snapshot) {
      return "no previous deployment; nothing to snapshot";
    }
    return "snapshot of '" + snapshot->release.image + "' taken " +
           snapshot->timestamp;
  }

  void ensure_runtime_ready() {
    auto policy =
        common::retry_policy_t{.attempts = settings_.runtime.ready_attempts,
                               .interval = settings_.runtime.ready_interval};
    auto ready = common::poll_until(
        "container runtime", policy,
        [this] { return prober_.is_runtime_ready(); }, sleeper_);
    if (!ready) {
      throw common::resource_unavailable_error{
          "container runtime '" + settings_.runtime.executable +
          "' not reachable after " + std::to_string(policy.attempts) +
          " attempt(s)"};
    }
  }

  void pull_image(const std::string& image) {
    if (settings_.runtime.pull_attempts == 0) {
      spdlog::info("Image pulls disabled; using local '{}'", image);
      return;
    }
    auto last_error = std::string{};
    auto pulled = common::poll_until(
        "pull of '" + image + "'",
        common::retry_policy_t{.attempts = settings_.runtime.pull_attempts,
                               .interval = settings_.runtime.pull_interval},
        [this, &image, &last_error] {
          try {
            runtime_.pull(image);
            return true;
          } catch (const common::runtime_command_error& ex) {
            spdlog::warn("Pulling '{}' failed: {}", image, ex.what());
            last_error = ex.what();
            return false;
          }
        },
        sleeper_);
    if (!pulled) {
      throw common::runtime_command_error{
          "image '" + image + "' could not be pulled after " +
              std::to_string(settings_.runtime.pull_attempts) +
              " attempt(s): " + last_error,
          1};
    }
  }

  std::string stop_old(attempt_t& attempt) {
    auto name = schema::service_name(attempt.request.tenant);
    if (runtime_.stop(name, settings_.runtime.stop_timeout)) {
      return "stopped '" + name + "'";
    }
    return "nothing running as '" + name + "'";
  }

  std::string provision(attempt_t& attempt) {
    provisioner_.ensure_server_running();
    provisioner_.ensure_tenant_network(attempt.request.tenant);
    auto report = provisioner_.ensure_tenant_database(attempt.request.tenant);
    return std::string{"database "} +
           (report.database_created ? "created" : "present") +
           ", principal " +
           (report.principal_created ? "created" : "present");
  }

  std::string migrate(attempt_t& attempt) {
    const auto& request = attempt.request;
    auto& workspace = *attempt.workspace;
    if (request.bundle_directory) {
      workspace.stage_bundle(*request.bundle_directory);
    }
    workspace.write_environment(render_environment(
        make_environment(request, attempt.mode, settings_.server)));
    workspace.write_release(schema::release_t{
        .image = request.image,
        .deployed_at = utc_timestamp(std::chrono::system_clock::now())});

    auto state = reconciler_.compute_migration_state(request.tenant);
    auto action = reconciler_.reconcile(
        migration::migration_context_t{
            .tenant = request.tenant,
            .image = request.image,
            .environment_file = workspace.environment_file()},
        state);
    return "migrations: " + std::string{migration::to_string(action)};
  }

  std::string start(attempt_t& attempt) {
    auto release = attempt.workspace->current_release();
    if (!release) {
      throw common::snapshot_error{"release manifest missing before start"};
    }
    launch(attempt.request.tenant, *attempt.workspace, *release);
    return "started '" + release->image + "'";
  }

  std::string check_health(attempt_t& attempt) {
    if (!wait_until_healthy(attempt.request.tenant)) {
      throw common::health_check_timeout_error{
          "service '" + schema::service_name(attempt.request.tenant) +
          "' not healthy within " +
          std::to_string(settings_.health.timeout.count()) + " ms"};
    }
    attempt.workspace->mark_release_verified();
    return "service healthy";
  }

  std::string roll_back(attempt_t& attempt) {
    const auto& tenant = attempt.request.tenant;
    auto& workspace = *attempt.workspace;
    if (!workspace.has_snapshot()) {
      throw common::snapshot_error{"no snapshot available for rollback"};
    }
    runtime_.stop(schema::service_name(tenant), settings_.runtime.stop_timeout);
    auto snapshot = workspace.restore_snapshot();
    launch(tenant, workspace, snapshot.release);
    if (!wait_until_healthy(tenant)) {
      throw common::health_check_timeout_error{
          "restored release '" + snapshot.release.image +
          "' did not become healthy"};
    }
    return "restored '" + snapshot.release.image + "'";
  }

  void launch(const schema::tenant_identity_t& tenant,
              const deployment::workspace& workspace,
              const schema::release_t& release) {
    runtime_.start(runtime::container_spec_t{
        .name = schema::service_name(tenant),
        .image = release.image,
        .environment_file = workspace.environment_file(),
        .network = schema::network_name(tenant),
        .labels = {{"steward.tenant", tenant.name},
                   {"steward.release", release.image}},
        .restart_policy = "unless-stopped"});
  }

  bool wait_until_healthy(const schema::tenant_identity_t& tenant) {
    auto endpoint = probe::service_endpoint_t{
        .container = schema::service_name(tenant),
        .required_key = settings_.health.required_key,
        .http_url = settings_.health.http_url};
    auto policy = common::policy_for_timeout(settings_.health.timeout,
                                             settings_.health.interval);
    auto round_limit = endpoint.http_timeout;
    return common::poll_until(
        "health of '" + endpoint.container + "'", policy,
        [this, &endpoint, &policy, round_limit] {
          // A round never outlives the overall health timeout.
          endpoint.http_timeout =
              std::clamp(common::remaining(policy, round_limit),
                         std::chrono::milliseconds{1}, round_limit);
          return prober_.is_service_healthy(endpoint);
        },
        sleeper_);
  }

  const runtime::runtime<RuntimeLibrary>& runtime_;
  const config::settings_t& settings_;
  common::sleeper_t sleeper_;
  probe::prober<DatabaseLibrary, RuntimeLibrary> prober_;
  provisioning::provisioner<DatabaseLibrary, RuntimeLibrary> provisioner_;
  migration::reconciler<DatabaseLibrary, RuntimeLibrary> reconciler_;
};

}  // namespace steward::deployment
