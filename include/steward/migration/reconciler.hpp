#pragma once

#include <spdlog/spdlog.h>
#include <steward/common/errors.hpp>
#include <steward/config/settings.hpp>
#include <steward/database/database.hpp>
#include <steward/runtime/runtime.hpp>
#include <steward/schema/migration_state.hpp>
#include <steward/schema/tenant_identity.hpp>

#include <cstdint>
#include <filesystem>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace steward::migration {

enum class migration_action_t : uint8_t {
  /// History is tracked; apply pending migrations.
  upgrade = 0,
  /// Schema exists without history; record head without migrating.
  stamp = 1,
  /// Nothing exists yet; migrate from scratch.
  initialize = 2,
};

inline constexpr std::string_view to_string(const migration_action_t action) {
  switch (action) {
    case migration_action_t::upgrade:
      return "upgrade";
    case migration_action_t::stamp:
      return "stamp";
    case migration_action_t::initialize:
      return "initialize";
  }
  return "unknown";
}

/// Decide what to do for `state`; a partial, untracked schema is ambiguous
/// and raises `migration_ambiguity_error`.
inline migration_action_t classify(const schema::migration_state_t& state) {
  if (state.migration_history_tracked) {
    return migration_action_t::upgrade;
  }
  if (schema::is_partial_schema(state)) {
    throw common::migration_ambiguity_error{
        "schema is partial (" + std::to_string(state.present_tables) + " of " +
        std::to_string(state.expected_tables) +
        " expected tables) and migration history is not tracked; "
        "operator intervention required"};
  }
  if (state.schema_objects_exist) {
    return migration_action_t::stamp;
  }
  return migration_action_t::initialize;
}

/// Split a migration tool command line on whitespace.
inline std::vector<std::string> split_command(const std::string& command) {
  auto stream = std::istringstream{command};
  auto parts = std::vector<std::string>{};
  for (auto part = std::string{}; stream >> part;) {
    parts.push_back(part);
  }
  return parts;
}

/// Where and as what the migration tool runs for one tenant.
struct migration_context_t final {
  schema::tenant_identity_t tenant;
  std::string image;
  std::filesystem::path environment_file;
};

/// Resolves the gap between physical schema objects and tracked migration
/// history. Executes nothing when the state is ambiguous; never modifies
/// data itself, the migration tool does.
template <typename DatabaseLibrary, typename RuntimeLibrary>
class reconciler final {
 public:
  reconciler(const database::database<DatabaseLibrary>& admin,
             const runtime::runtime<RuntimeLibrary>& runtime,
             const config::migration_settings_t& settings)
      : admin_{admin}, runtime_{runtime}, settings_{settings} {}

  /// Inspect the tenant database's catalog for the expected tables and the
  /// history table.
  schema::migration_state_t compute_migration_state(
      const schema::tenant_identity_t& tenant) const {
    if (settings_.expected_tables.empty()) {
      throw common::validation_error{
          "at least one expected table is required to classify the schema"};
    }
    auto tenant_database = admin_.open(schema::database_name(tenant));
    auto state = schema::migration_state_t{};
    state.expected_tables =
        static_cast<uint32_t>(settings_.expected_tables.size());
    for (const auto& table : settings_.expected_tables) {
      if (tenant_database.table_exists(settings_.schema, table)) {
        ++state.present_tables;
      }
    }
    state.schema_objects_exist = state.present_tables > 0;
    state.migration_history_tracked =
        tenant_database.table_exists(settings_.schema, settings_.history_table);
    spdlog::info(
        "Migration state of '{}': {}/{} expected table(s), history {}",
        tenant.name, state.present_tables, state.expected_tables,
        state.migration_history_tracked ? "tracked" : "untracked");
    return state;
  }

  /// Bring migration history in line with the schema, then verify that
  /// history is tracked.
  migration_action_t reconcile(const migration_context_t& context,
                               const schema::migration_state_t& state) const {
    auto action = classify(state);
    switch (action) {
      case migration_action_t::stamp:
        spdlog::warn(
            "Tenant '{}' has all {} expected table(s) but no migration "
            "history; stamping head without running migrations",
            context.tenant.name, state.expected_tables);
        run_tool(context, settings_.stamp_command);
        break;
      case migration_action_t::upgrade:
        spdlog::info("Applying pending migrations for '{}'",
                     context.tenant.name);
        run_tool(context, settings_.upgrade_command);
        break;
      case migration_action_t::initialize:
        spdlog::info("Creating schema for '{}' from scratch",
                     context.tenant.name);
        run_tool(context, settings_.upgrade_command);
        break;
    }

    auto after = compute_migration_state(context.tenant);
    if (!after.migration_history_tracked) {
      throw common::migration_error{"migration history for '" +
                                    context.tenant.name +
                                    "' is still untracked after " +
                                    std::string{to_string(action)}};
    }
    return action;
  }

 private:
  void run_tool(const migration_context_t& context,
                const std::string& command) const {
    auto arguments = split_command(command);
    if (arguments.empty()) {
      throw common::validation_error{"migration command is empty"};
    }
    auto result = runtime_.run_once(runtime::container_spec_t{
        .name = schema::service_name(context.tenant) + "_migration",
        .image = context.image,
        .environment_file = context.environment_file,
        .network = schema::network_name(context.tenant),
        .labels = {{"steward.tenant", context.tenant.name},
                   {"steward.role", "migration"}},
        .command = std::move(arguments)});
    if (!result.ok()) {
      throw common::migration_error{"'" + command + "' for '" +
                                    context.tenant.name + "' exited " +
                                    std::to_string(result.exit_code) + ": " +
                                    result.err};
    }
  }

  const database::database<DatabaseLibrary>& admin_;
  const runtime::runtime<RuntimeLibrary>& runtime_;
  const config::migration_settings_t& settings_;
};

}  // namespace steward::migration
