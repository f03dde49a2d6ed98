#pragma once

#include <spdlog/spdlog.h>
#include <steward/common/errors.hpp>
#include <steward/database/database.hpp>
#include <steward/probe/http.hpp>
#include <steward/runtime/runtime.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace steward::probe {

/// What a health check round inspects on a running service.
struct service_endpoint_t final {
  std::string container;
  std::string required_key;
  std::string http_url;
  std::chrono::milliseconds http_timeout{2000};
};

/// Side-effect free readiness checks against the shared server, the
/// container runtime and a running service.
///
/// "Not ready" is always reported as `false`; only malformed input throws.
template <typename DatabaseLibrary, typename RuntimeLibrary>
class prober final {
 public:
  prober(const database::database<DatabaseLibrary>& admin,
         const runtime::runtime<RuntimeLibrary>& runtime)
      : admin_{admin}, runtime_{runtime} {}

  bool is_database_server_ready() const { return admin_.ping(); }

  bool is_runtime_ready() const { return runtime_.ping(); }

  /// One configuration-sanity round: the required key must be non-empty
  /// inside the container and, when configured, the HTTP endpoint must
  /// answer 2xx.
  bool is_service_healthy(const service_endpoint_t& endpoint) const {
    if (endpoint.container.empty()) {
      throw common::validation_error{"health check needs a container name"};
    }
    if (endpoint.required_key.empty()) {
      throw common::validation_error{"health check needs a required key"};
    }
    auto url = std::optional<http_url_t>{};
    if (!endpoint.http_url.empty()) {
      url = parse_http_url(endpoint.http_url);
    }

    try {
      if (!runtime_.is_running(endpoint.container)) {
        spdlog::debug("Service '{}' is not running", endpoint.container);
        return false;
      }
      auto result =
          runtime_.exec(endpoint.container, {"printenv", endpoint.required_key});
      if (!result.ok() || trimmed_empty(result.out)) {
        spdlog::debug("Service '{}' lacks a value for {}", endpoint.container,
                      endpoint.required_key);
        return false;
      }
    } catch (const common::runtime_command_error& ex) {
      spdlog::debug("Health check of '{}' could not run: {}",
                    endpoint.container, ex.what());
      return false;
    }

    if (url) {
      auto status = http_get_status(*url, endpoint.http_timeout);
      if (!status || *status < 200 || *status >= 300) {
        spdlog::debug("Health endpoint {} answered {}", endpoint.http_url,
                      status ? std::to_string(*status) : "nothing");
        return false;
      }
    }
    return true;
  }

 private:
  static bool trimmed_empty(const std::string& value) {
    return value.find_first_not_of(" \t\r\n") == std::string::npos;
  }

  const database::database<DatabaseLibrary>& admin_;
  const runtime::runtime<RuntimeLibrary>& runtime_;
};

}  // namespace steward::probe
