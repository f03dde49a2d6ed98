#pragma once

#include <steward/config/settings.hpp>
#include <steward/schema/deployment_request.hpp>

#include <boost/program_options.hpp>

#include <map>
#include <string>
#include <vector>

namespace steward::config {

inline constexpr auto kEnvironmentPrefix = "STEWARD_";

/// Fully parsed invocation: subcommand, settings and deploy inputs.
struct command_line_t final {
  std::string command;
  bool help{};
  settings_t settings;
  schema::deployment_request_t request;
  std::string description;
};

/// Parse argv, then the optional `--config` file, then `STEWARD_*`
/// environment variables, with earlier sources taking precedence.
///
/// Throws `common::validation_error` for unknown options, malformed values or
/// an unknown subcommand. Deploy inputs are not checked for presence here;
/// that belongs to the pipeline's validating state.
command_line_t parse_command_line(int argc, const char* const argv[]);

/// Map `STEWARD_STATE_ROOT` to `state-root`; empty for unrelated variables.
std::string environment_to_option(const std::string& variable);

/// Split `KEY=VALUE` toggles; throws `common::validation_error` when malformed.
std::map<std::string, std::string> parse_features(
    const std::vector<std::string>& toggles);

}  // namespace steward::config
