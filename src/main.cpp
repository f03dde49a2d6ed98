#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <steward/common/errors.hpp>
#include <steward/config/options.hpp>
#include <steward/database/postgres/database.hpp>
#include <steward/deployment/pipeline.hpp>
#include <steward/deployment/workspace.hpp>
#include <steward/probe/prober.hpp>
#include <steward/provisioning/provisioner.hpp>
#include <steward/runtime/docker/runtime.hpp>
#include <steward/schema/exit_code.hpp>

#include <iostream>
#include <memory>
#include <string>

namespace {

using database_t =
    steward::database::database<steward::database::postgres_tag>;
using runtime_t = steward::runtime::runtime<steward::runtime::docker_tag>;
using steward::schema::exit_code_t;
using steward::schema::to_int;

void configure_logging(const steward::config::logging_settings_t& logging) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(logging.file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "steward", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  logger->set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::from_str(logging.level));
}

database_t make_admin_database(const steward::config::settings_t& settings) {
  const auto& server = settings.server;
  return steward::database::make_database<steward::database::postgres_tag>(
      steward::database::server_endpoint_t{
          .host = server.host,
          .port = server.port,
          .user = server.admin_user,
          .password = server.admin_password,
          .database = server.admin_database,
          .connect_timeout = server.connect_timeout});
}

int run_deploy(const steward::config::command_line_t& cli,
               const database_t& admin,
               const runtime_t& runtime) {
  auto pipeline =
      steward::deployment::pipeline<steward::database::postgres_tag,
                                    steward::runtime::docker_tag>{
          admin, runtime, cli.settings};
  auto outcome = pipeline.run(cli.request);
  return to_int(steward::schema::exit_code_for(outcome));
}

int run_provision(const steward::config::command_line_t& cli,
                  const database_t& admin,
                  const runtime_t& runtime) {
  if (cli.request.tenant.name.empty() ||
      cli.request.tenant.credential_secret.empty()) {
    throw steward::common::validation_error{
        "provision requires --tenant and --credential"};
  }
  auto provisioner =
      steward::provisioning::provisioner<steward::database::postgres_tag,
                                         steward::runtime::docker_tag>{
          admin, runtime, cli.settings.server, cli.settings.migration.schema};
  provisioner.ensure_server_running();
  provisioner.ensure_tenant_network(cli.request.tenant);
  auto report = provisioner.ensure_tenant_database(cli.request.tenant);
  spdlog::info("Tenant '{}' provisioned (database {}, principal {})",
               cli.request.tenant.name,
               report.database_created ? "created" : "present",
               report.principal_created ? "created" : "present");
  return to_int(exit_code_t::succeeded);
}

int run_server(const steward::config::command_line_t& cli,
               const database_t& admin,
               const runtime_t& runtime) {
  auto provisioner =
      steward::provisioning::provisioner<steward::database::postgres_tag,
                                         steward::runtime::docker_tag>{
          admin, runtime, cli.settings.server, cli.settings.migration.schema};
  provisioner.ensure_server_running();
  return to_int(exit_code_t::succeeded);
}

int run_probe(const steward::config::command_line_t& cli,
              const database_t& admin,
              const runtime_t& runtime) {
  auto prober = steward::probe::prober<steward::database::postgres_tag,
                                       steward::runtime::docker_tag>{admin,
                                                                     runtime};
  auto server_ready = prober.is_database_server_ready();
  auto runtime_ready = prober.is_runtime_ready();
  spdlog::info("Database server: {}", server_ready ? "ready" : "unreachable");
  spdlog::info("Container runtime: {}", runtime_ready ? "ready" : "unreachable");
  auto healthy = true;
  if (!cli.request.tenant.name.empty()) {
    auto endpoint = steward::probe::service_endpoint_t{
        .container = steward::schema::service_name(cli.request.tenant),
        .required_key = cli.settings.health.required_key,
        .http_url = cli.settings.health.http_url};
    healthy = prober.is_service_healthy(endpoint);
    spdlog::info("Service '{}': {}", endpoint.container,
                 healthy ? "healthy" : "unhealthy");
  }
  return to_int(server_ready && runtime_ready && healthy
                    ? exit_code_t::succeeded
                    : exit_code_t::failed);
}

int run_status(const steward::config::command_line_t& cli,
               const runtime_t& runtime) {
  const auto& tenant = cli.request.tenant;
  if (!steward::schema::is_valid_tenant_name(tenant.name)) {
    throw steward::common::validation_error{"status requires a valid --tenant"};
  }
  auto workspace =
      steward::deployment::workspace{cli.settings.state_root, tenant.name};
  auto release = workspace.current_release();
  auto snapshot = workspace.load_snapshot();
  auto container = steward::schema::service_name(tenant);

  std::cout << "tenant:     " << tenant.name << '\n'
            << "database:   " << steward::schema::database_name(tenant) << '\n'
            << "principal:  " << steward::schema::principal_name(tenant) << '\n'
            << "release:    "
            << (release ? release->image + " (" + release->deployed_at +
                              (release->verified ? ")" : ", unverified)")
                        : std::string{"none"})
            << '\n'
            << "snapshot:   "
            << (snapshot ? snapshot->release.image + " (" +
                               snapshot->timestamp + ")"
                         : std::string{"none"})
            << '\n'
            << "container:  " << container << ' ';
  try {
    std::cout << (runtime.is_running(container) ? "running" : "not running");
    if (auto image = runtime.image_of(container)) {
      std::cout << " [" << *image << ']';
    }
  } catch (const steward::common::runtime_command_error& ex) {
    spdlog::warn("Container state unavailable: {}", ex.what());
    std::cout << "unknown (container runtime unavailable)";
  }
  std::cout << std::endl;
  return to_int(exit_code_t::succeeded);
}

}  // namespace

int main(int argc, char* argv[]) {
  auto cli = steward::config::command_line_t{};
  try {
    cli = steward::config::parse_command_line(argc, argv);
  } catch (const steward::common::validation_error& ex) {
    std::cerr << "steward: " << ex.what() << "\n"
              << "Try 'steward --help'." << std::endl;
    return to_int(exit_code_t::usage);
  }

  if (cli.help) {
    std::cout << cli.description << std::endl;
    return to_int(exit_code_t::succeeded);
  }

  try {
    configure_logging(cli.settings.logging);
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "steward: cannot set up logging: " << ex.what() << std::endl;
    return to_int(exit_code_t::usage);
  }

  auto exit_code = to_int(exit_code_t::failed);
  try {
    auto admin = make_admin_database(cli.settings);
    auto runtime = steward::runtime::make_runtime<steward::runtime::docker_tag>(
        cli.settings.runtime);
    if (cli.command == "deploy") {
      exit_code = run_deploy(cli, admin, runtime);
    } else if (cli.command == "provision") {
      exit_code = run_provision(cli, admin, runtime);
    } else if (cli.command == "server") {
      exit_code = run_server(cli, admin, runtime);
    } else if (cli.command == "probe") {
      exit_code = run_probe(cli, admin, runtime);
    } else if (cli.command == "status") {
      exit_code = run_status(cli, runtime);
    }
  } catch (const steward::common::error& ex) {
    spdlog::error("{} ({})", ex.what(),
                  steward::schema::to_string(ex.category()));
  } catch (const std::exception& ex) {
    spdlog::error("Unexpected failure: {}", ex.what());
  }

  spdlog::shutdown();
  return exit_code;
}
