#include <spdlog/spdlog.h>
#include <steward/common/errors.hpp>
#include <steward/runtime/docker/runtime.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>

#include <future>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace bp = boost::process;

namespace {

std::string trim(std::string value) {
  while (!value.empty() && (value.back() == '\n' || value.back() == '\r' ||
                            value.back() == ' ')) {
    value.pop_back();
  }
  return value;
}

std::string describe(const std::vector<std::string>& args) {
  auto text = std::string{};
  for (const auto& arg : args) {
    if (!text.empty()) {
      text.push_back(' ');
    }
    text += arg;
  }
  return text;
}

[[noreturn]] void fail(const std::string& what,
                       const steward::runtime::command_result_t& result) {
  throw steward::common::runtime_command_error{
      what + " failed (exit " + std::to_string(result.exit_code) +
          "): " + trim(result.err),
      result.exit_code};
}

bool is_no_such_object(const steward::runtime::command_result_t& result) {
  return result.err.find("No such container") != std::string::npos ||
         result.err.find("No such object") != std::string::npos;
}

}  // namespace

namespace steward::runtime {

template <>
runtime<docker_tag> make_runtime<docker_tag>(
    const config::runtime_settings_t& settings) {
  auto docker = runtime<docker_tag>{};
  docker.executable = settings.executable;
  return docker;
}

std::vector<std::string> make_run_arguments(const container_spec_t& spec,
                                            const bool detach,
                                            const bool remove) {
  auto args = std::vector<std::string>{};
  if (detach) {
    args.emplace_back("--detach");
  }
  if (remove) {
    args.emplace_back("--rm");
  }
  if (!spec.name.empty()) {
    args.emplace_back("--name");
    args.push_back(spec.name);
  }
  if (!spec.network.empty()) {
    args.emplace_back("--network");
    args.push_back(spec.network);
  }
  if (spec.environment_file) {
    args.emplace_back("--env-file");
    args.push_back(spec.environment_file->string());
  }
  for (const auto& [key, value] : spec.environment) {
    args.emplace_back("--env");
    args.push_back(key + "=" + value);
  }
  for (const auto& [key, value] : spec.labels) {
    args.emplace_back("--label");
    args.push_back(key + "=" + value);
  }
  for (const auto& volume : spec.volumes) {
    args.emplace_back("--volume");
    args.push_back(volume);
  }
  for (const auto& port : spec.ports) {
    args.emplace_back("--publish");
    args.push_back(port);
  }
  if (!spec.restart_policy.empty()) {
    args.emplace_back("--restart");
    args.push_back(spec.restart_policy);
  }
  args.push_back(spec.image);
  args.insert(std::end(args), std::begin(spec.command), std::end(spec.command));
  return args;
}

command_result_t runtime<docker_tag>::invoke(
    const std::vector<std::string>& args) const {
  auto program = boost::filesystem::path{executable};
  if (executable.find('/') == std::string::npos) {
    program = bp::search_path(executable);
  }
  if (program.empty()) {
    throw common::runtime_command_error{
        "container runtime '" + executable + "' not found in PATH", -1};
  }

  spdlog::debug("{} {}", executable, describe(args));
  auto io = boost::asio::io_context{};
  auto out = std::future<std::string>{};
  auto err = std::future<std::string>{};
  try {
    auto child = bp::child{program, bp::args(args), bp::std_in.close(),
                           bp::std_out > out, bp::std_err > err, io};
    io.run();
    child.wait();
    return command_result_t{
        .exit_code = child.exit_code(), .out = out.get(), .err = err.get()};
  } catch (const std::system_error& ex) {
    throw common::runtime_command_error{
        "cannot run '" + executable + " " + describe(args) + "': " + ex.what(),
        -1};
  }
}

bool runtime<docker_tag>::ping() const {
  try {
    return invoke({"info", "--format", "{{.ServerVersion}}"}).ok();
  } catch (const common::runtime_command_error& ex) {
    spdlog::warn("Container runtime unavailable: {}", ex.what());
    return false;
  }
}

std::optional<std::string> runtime<docker_tag>::inspect(
    const std::string_view container,
    const std::string& format) const {
  auto name = std::string{container};
  auto result = invoke({"container", "inspect", "--format", format, name});
  if (result.ok()) {
    return trim(result.out);
  }
  if (is_no_such_object(result)) {
    return std::nullopt;
  }
  fail("inspecting container '" + name + "'", result);
}

bool runtime<docker_tag>::exists(const std::string_view container) const {
  return inspect(container, "{{.Id}}").has_value();
}

bool runtime<docker_tag>::is_running(const std::string_view container) const {
  return inspect(container, "{{.State.Running}}") == "true";
}

std::optional<std::string> runtime<docker_tag>::image_of(
    const std::string_view container) const {
  return inspect(container, "{{.Config.Image}}");
}

void runtime<docker_tag>::pull(const std::string_view image) const {
  auto reference = std::string{image};
  auto result = invoke({"pull", "--quiet", reference});
  if (!result.ok()) {
    fail("pulling image '" + reference + "'", result);
  }
  spdlog::info("Pulled image '{}'", reference);
}

void runtime<docker_tag>::start(const container_spec_t& spec) const {
  auto args = make_run_arguments(spec, true, false);
  args.insert(std::begin(args), "run");
  auto result = invoke(args);
  if (!result.ok()) {
    fail("starting container '" + spec.name + "'", result);
  }
  spdlog::info("Started container '{}' from '{}' ({})", spec.name, spec.image,
               trim(result.out).substr(0, 12));
}

void runtime<docker_tag>::start_existing(
    const std::string_view container) const {
  auto result = invoke({"start", std::string{container}});
  if (!result.ok()) {
    fail("starting existing container '" + std::string{container} + "'",
         result);
  }
}

bool runtime<docker_tag>::stop(const std::string_view container,
                               const std::chrono::seconds timeout) const {
  auto name = std::string{container};
  if (!exists(name)) {
    return false;
  }
  auto was_running = is_running(name);
  if (was_running) {
    auto result =
        invoke({"stop", "--time", std::to_string(timeout.count()), name});
    if (!result.ok()) {
      spdlog::warn("Graceful stop of '{}' failed, forcing: {}", name,
                   trim(result.err));
      auto killed = invoke({"kill", name});
      if (!killed.ok() && is_running(name)) {
        fail("killing container '" + name + "'", killed);
      }
    }
  }
  auto removed = invoke({"rm", "--force", name});
  if (!removed.ok() && exists(name)) {
    fail("removing container '" + name + "'", removed);
  }
  return was_running;
}

command_result_t runtime<docker_tag>::run_once(
    const container_spec_t& spec) const {
  auto args = make_run_arguments(spec, false, true);
  args.insert(std::begin(args), "run");
  return invoke(args);
}

command_result_t runtime<docker_tag>::exec(
    const std::string_view container,
    const std::vector<std::string>& command) const {
  auto args = std::vector<std::string>{"exec", std::string{container}};
  args.insert(std::end(args), std::begin(command), std::end(command));
  return invoke(args);
}

void runtime<docker_tag>::ensure_network(const std::string_view name) const {
  auto network = std::string{name};
  if (invoke({"network", "inspect", "--format", "{{.Id}}", network}).ok()) {
    return;
  }
  auto created = invoke({"network", "create", network});
  if (!created.ok() &&
      !invoke({"network", "inspect", "--format", "{{.Id}}", network}).ok()) {
    fail("creating network '" + network + "'", created);
  }
  spdlog::info("Network '{}' ready", network);
}

void runtime<docker_tag>::connect_network(
    const std::string_view network,
    const std::string_view container) const {
  auto result =
      invoke({"network", "connect", std::string{network}, std::string{container}});
  if (!result.ok() && result.err.find("already exists") == std::string::npos) {
    fail("connecting '" + std::string{container} + "' to network '" +
             std::string{network} + "'",
         result);
  }
}

}  // namespace steward::runtime
