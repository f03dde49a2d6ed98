#include <steward/common/errors.hpp>
#include <steward/config/options.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace po = boost::program_options;

namespace {

inline constexpr auto kCommands = std::array<std::string_view, 5>{
    "deploy", "provision", "server", "probe", "status"};

inline constexpr auto kLogLevels = std::array<std::string_view, 7>{
    "trace", "debug", "info", "warn", "error", "critical", "off"};

struct raw_durations final {
  uint32_t server_connect_timeout_seconds{5};
  uint32_t server_ready_interval_ms{2000};
  uint32_t stop_timeout_seconds{30};
  uint32_t runtime_ready_interval_ms{2000};
  uint32_t pull_interval_ms{10000};
  uint32_t health_timeout_seconds{120};
  uint32_t health_interval_ms{3000};
};

po::options_description make_description(steward::config::command_line_t& cli,
                                         raw_durations& durations,
                                         std::string& config_file,
                                         std::vector<std::string>& features,
                                         std::string& bundle_directory,
                                         std::string& state_root) {
  auto& settings = cli.settings;
  auto& request = cli.request;

  auto general = po::options_description{"General"};
  general.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_file),
      "Read further options from this INI file")(
      "state-root",
      po::value<std::string>(&state_root)->default_value(state_root),
      "Directory holding per-tenant deploy and snapshot directories")(
      "log-file",
      po::value<std::string>(&settings.logging.file)
          ->default_value(settings.logging.file),
      "Log file path")("log-level",
                       po::value<std::string>(&settings.logging.level)
                           ->default_value(settings.logging.level),
                       "trace, debug, info, warn, error or critical");

  auto tenant = po::options_description{"Tenant"};
  tenant.add_options()("tenant,t",
                       po::value<std::string>(&request.tenant.name),
                       "Tenant name (lowercase slug)")(
      "credential", po::value<std::string>(&request.tenant.credential_secret),
      "Database credential for the tenant principal")(
      "image,i", po::value<std::string>(&request.image),
      "Service image reference")(
      "mode,m", po::value<std::string>(&request.mode),
      "Deployment mode: production or staging")(
      "service-token", po::value<std::string>(&request.service_token),
      "Token handed to the service as BOT_TOKEN")(
      "webhook-url", po::value<std::string>(&request.webhook_url),
      "Public webhook URL handed to the service")(
      "feature", po::value<std::vector<std::string>>(&features)->composing(),
      "Feature toggle KEY=VALUE written to the environment file")(
      "bundle-dir", po::value<std::string>(&bundle_directory),
      "Directory whose files are copied into the deploy directory");

  auto server = po::options_description{"Shared database server"};
  server.add_options()("server-host",
                       po::value<std::string>(&settings.server.host)
                           ->default_value(settings.server.host),
                       "Address steward uses to reach the server")(
      "server-port",
      po::value<uint16_t>(&settings.server.port)
          ->default_value(settings.server.port),
      "Port steward uses to reach the server")(
      "server-admin-user",
      po::value<std::string>(&settings.server.admin_user)
          ->default_value(settings.server.admin_user),
      "Administrative role")(
      "server-admin-password",
      po::value<std::string>(&settings.server.admin_password),
      "Administrative password")(
      "server-admin-database",
      po::value<std::string>(&settings.server.admin_database)
          ->default_value(settings.server.admin_database),
      "Database used for administrative connections")(
      "server-connect-timeout-seconds",
      po::value<uint32_t>(&durations.server_connect_timeout_seconds)
          ->default_value(durations.server_connect_timeout_seconds),
      "Connection timeout")(
      "server-service-host",
      po::value<std::string>(&settings.server.service_host)
          ->default_value(settings.server.service_host),
      "Server host written into tenant connection strings")(
      "server-service-port",
      po::value<uint16_t>(&settings.server.service_port)
          ->default_value(settings.server.service_port),
      "Server port written into tenant connection strings")(
      "server-container",
      po::value<std::string>(&settings.server.container)
          ->default_value(settings.server.container),
      "Name of the shared server container")(
      "server-image",
      po::value<std::string>(&settings.server.image)
          ->default_value(settings.server.image),
      "Image used when the shared server container must be created")(
      "server-volume",
      po::value<std::string>(&settings.server.volume)
          ->default_value(settings.server.volume),
      "Volume holding the shared server's data directory")(
      "server-ready-attempts",
      po::value<uint32_t>(&settings.server.ready_attempts)
          ->default_value(settings.server.ready_attempts),
      "Readiness polls before giving up")(
      "server-ready-interval-ms",
      po::value<uint32_t>(&durations.server_ready_interval_ms)
          ->default_value(durations.server_ready_interval_ms),
      "Delay between readiness polls");

  auto runtime = po::options_description{"Container runtime"};
  runtime.add_options()("runtime-executable",
                        po::value<std::string>(&settings.runtime.executable)
                            ->default_value(settings.runtime.executable),
                        "Container runtime CLI")(
      "stop-timeout-seconds",
      po::value<uint32_t>(&durations.stop_timeout_seconds)
          ->default_value(durations.stop_timeout_seconds),
      "Grace period before a stopping container is killed")(
      "runtime-ready-attempts",
      po::value<uint32_t>(&settings.runtime.ready_attempts)
          ->default_value(settings.runtime.ready_attempts),
      "Runtime availability polls before giving up")(
      "runtime-ready-interval-ms",
      po::value<uint32_t>(&durations.runtime_ready_interval_ms)
          ->default_value(durations.runtime_ready_interval_ms),
      "Delay between runtime availability polls")(
      "pull-attempts",
      po::value<uint32_t>(&settings.runtime.pull_attempts)
          ->default_value(settings.runtime.pull_attempts),
      "Image pull attempts before giving up")(
      "pull-interval-ms",
      po::value<uint32_t>(&durations.pull_interval_ms)
          ->default_value(durations.pull_interval_ms),
      "Delay between image pull attempts");

  auto health = po::options_description{"Health checks"};
  health.add_options()("health-required-key",
                       po::value<std::string>(&settings.health.required_key)
                           ->default_value(settings.health.required_key),
                       "Variable that must be non-empty inside the service")(
      "health-url", po::value<std::string>(&settings.health.http_url),
      "Optional HTTP endpoint that must answer 2xx")(
      "health-timeout-seconds",
      po::value<uint32_t>(&durations.health_timeout_seconds)
          ->default_value(durations.health_timeout_seconds),
      "Total time allowed for the new instance to become healthy")(
      "health-interval-ms",
      po::value<uint32_t>(&durations.health_interval_ms)
          ->default_value(durations.health_interval_ms),
      "Delay between health checks");

  auto migration = po::options_description{"Migrations"};
  migration.add_options()("migration-schema",
                          po::value<std::string>(&settings.migration.schema)
                              ->default_value(settings.migration.schema),
                          "Schema holding the tenant's tables")(
      "expected-table",
      po::value<std::vector<std::string>>(&settings.migration.expected_tables)
          ->composing()
          ->default_value(settings.migration.expected_tables, "users"),
      "Table the current schema head is expected to contain")(
      "history-table",
      po::value<std::string>(&settings.migration.history_table)
          ->default_value(settings.migration.history_table),
      "Migration history table")(
      "upgrade-command",
      po::value<std::string>(&settings.migration.upgrade_command)
          ->default_value(settings.migration.upgrade_command),
      "Migration tool command applying pending migrations")(
      "stamp-command",
      po::value<std::string>(&settings.migration.stamp_command)
          ->default_value(settings.migration.stamp_command),
      "Migration tool command recording head without migrating");

  auto description = po::options_description{
      "Usage: steward <deploy|provision|server|probe|status> [options]"};
  description.add(general).add(tenant).add(server).add(runtime).add(health).add(
      migration);
  return description;
}

}  // namespace

namespace steward::config {

std::string environment_to_option(const std::string& variable) {
  auto prefix = std::string_view{kEnvironmentPrefix};
  if (!std::string_view{variable}.starts_with(prefix) ||
      variable.size() == prefix.size()) {
    return {};
  }
  auto option = variable.substr(prefix.size());
  std::ranges::transform(option, std::begin(option), [](const char c) {
    if (c == '_') {
      return '-';
    }
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  return option;
}

std::map<std::string, std::string> parse_features(
    const std::vector<std::string>& toggles) {
  auto features = std::map<std::string, std::string>{};
  for (const auto& toggle : toggles) {
    auto separator = toggle.find('=');
    if (separator == std::string::npos || separator == 0) {
      throw common::validation_error{"feature toggle '" + toggle +
                                     "' is not KEY=VALUE"};
    }
    features[toggle.substr(0, separator)] = toggle.substr(separator + 1);
  }
  return features;
}

command_line_t parse_command_line(int argc, const char* const argv[]) {
  auto cli = command_line_t{};
  auto durations = raw_durations{};
  auto config_file = std::string{};
  auto features = std::vector<std::string>{};
  auto bundle_directory = std::string{};
  auto state_root = cli.settings.state_root.string();

  auto description = make_description(cli, durations, config_file, features,
                                      bundle_directory, state_root);
  auto hidden = po::options_description{};
  hidden.add_options()("command", po::value<std::string>(&cli.command));
  auto all = po::options_description{};
  all.add(description).add(hidden);

  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      if (!std::filesystem::exists(path)) {
        throw common::validation_error{"config file '" + path +
                                       "' does not exist"};
      }
      po::store(po::parse_config_file<char>(path.c_str(), description), vm);
    }
    po::store(po::parse_environment(
                  description,
                  [&description](const std::string& variable) {
                    auto option = environment_to_option(variable);
                    if (option.empty() ||
                        description.find_nothrow(option, false) == nullptr) {
                      return std::string{};
                    }
                    return option;
                  }),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    throw common::validation_error{ex.what()};
  }

  cli.help = vm.contains("help");
  auto stream = std::ostringstream{};
  stream << description;
  cli.description = stream.str();

  if (!cli.help) {
    if (cli.command.empty()) {
      throw common::validation_error{"missing command"};
    }
    if (std::ranges::find(kCommands, std::string_view{cli.command}) ==
        std::end(kCommands)) {
      throw common::validation_error{"unknown command '" + cli.command + "'"};
    }
  }

  if (std::ranges::find(kLogLevels,
                         std::string_view{cli.settings.logging.level}) ==
      std::end(kLogLevels)) {
    throw common::validation_error{"unknown log level '" +
                                   cli.settings.logging.level + "'"};
  }

  cli.settings.state_root = std::filesystem::path{state_root};
  cli.settings.server.connect_timeout =
      std::chrono::seconds{durations.server_connect_timeout_seconds};
  cli.settings.server.ready_interval =
      std::chrono::milliseconds{durations.server_ready_interval_ms};
  cli.settings.runtime.stop_timeout =
      std::chrono::seconds{durations.stop_timeout_seconds};
  cli.settings.runtime.ready_interval =
      std::chrono::milliseconds{durations.runtime_ready_interval_ms};
  cli.settings.runtime.pull_interval =
      std::chrono::milliseconds{durations.pull_interval_ms};
  cli.settings.health.timeout =
      std::chrono::seconds{durations.health_timeout_seconds};
  cli.settings.health.interval =
      std::chrono::milliseconds{durations.health_interval_ms};

  cli.request.features = parse_features(features);
  if (!bundle_directory.empty()) {
    cli.request.bundle_directory = std::filesystem::path{bundle_directory};
  }
  return cli;
}

}  // namespace steward::config
