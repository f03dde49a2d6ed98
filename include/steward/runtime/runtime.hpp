#pragma once

#include <steward/config/settings.hpp>

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace steward::runtime {

/// Exit status and captured output of one runtime command.
struct command_result_t final {
  int exit_code{};
  std::string out;
  std::string err;

  bool ok() const { return exit_code == 0; }
};

/// Everything needed to launch one container.
struct container_spec_t final {
  std::string name;
  std::string image;
  std::optional<std::filesystem::path> environment_file;
  std::map<std::string, std::string> environment;
  std::string network;
  std::map<std::string, std::string> labels;
  std::vector<std::string> volumes;
  std::vector<std::string> ports;
  std::string restart_policy;
  std::vector<std::string> command;
};

/// Container runtime driving the tenant service instances, specialized per
/// runtime implementation.
template <typename Library>
struct runtime {
  /// Whether the runtime daemon answers; never throws.
  bool ping() const;

  /// Container lookups. An absent container is not an error; a runtime that
  /// cannot answer throws `common::runtime_command_error`.
  bool exists(std::string_view container) const;
  bool is_running(std::string_view container) const;

  /// Image reference the container was created from.
  std::optional<std::string> image_of(std::string_view container) const;

  /// Fetch `image` from its registry so a later start cannot fail on it.
  void pull(std::string_view image) const;

  /// Create and start a detached container.
  void start(const container_spec_t& spec) const;

  /// Start an existing, stopped container.
  void start_existing(std::string_view container) const;

  /// Stop gracefully within `timeout`, force-kill when that fails, then
  /// remove. Returns whether a running container was stopped. Repeating the
  /// call is a no-op.
  bool stop(std::string_view container, std::chrono::seconds timeout) const;

  /// Run a container to completion and remove it.
  command_result_t run_once(const container_spec_t& spec) const;

  /// Run a command inside a running container.
  command_result_t exec(std::string_view container,
                        const std::vector<std::string>& command) const;

  void ensure_network(std::string_view name) const;

  /// Attach a container to a network; already attached is not an error.
  void connect_network(std::string_view network,
                       std::string_view container) const;
};

template <typename Library>
runtime<Library> make_runtime(const config::runtime_settings_t& settings);

}  // namespace steward::runtime
