#pragma once

#include <steward/runtime/runtime.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace steward::runtime {

struct docker_tag {};

/// Runtime backed by the docker CLI; each member spawns one CLI process.
template <>
struct runtime<docker_tag> final {
  std::string executable{"docker"};

  bool ping() const;
  bool exists(std::string_view container) const;
  bool is_running(std::string_view container) const;
  std::optional<std::string> image_of(std::string_view container) const;
  void pull(std::string_view image) const;
  void start(const container_spec_t& spec) const;
  void start_existing(std::string_view container) const;
  bool stop(std::string_view container, std::chrono::seconds timeout) const;
  command_result_t run_once(const container_spec_t& spec) const;
  command_result_t exec(std::string_view container,
                        const std::vector<std::string>& command) const;
  void ensure_network(std::string_view name) const;
  void connect_network(std::string_view network,
                       std::string_view container) const;

  /// Spawn the CLI with `args` and capture both output streams.
  ///
  /// Throws `common::runtime_command_error` when the CLI cannot be spawned.
  command_result_t invoke(const std::vector<std::string>& args) const;

 private:
  /// `container inspect` with `format`; std::nullopt when no such container.
  std::optional<std::string> inspect(std::string_view container,
                                     const std::string& format) const;
};

/// Translate a spec into `run` arguments (without the leading `run`).
std::vector<std::string> make_run_arguments(const container_spec_t& spec,
                                            bool detach,
                                            bool remove);

template <>
runtime<docker_tag> make_runtime<docker_tag>(
    const config::runtime_settings_t& settings);

}  // namespace steward::runtime
