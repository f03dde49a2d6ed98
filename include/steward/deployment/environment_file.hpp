#pragma once

#include <steward/config/settings.hpp>
#include <steward/schema/deploy_mode.hpp>
#include <steward/schema/deployment_request.hpp>
#include <steward/schema/tenant_identity.hpp>

#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace steward::deployment {

using environment_entries_t = std::vector<std::pair<std::string, std::string>>;

/// Percent-encode everything outside RFC 3986 unreserved characters.
std::string percent_encode(std::string_view value);

/// Connection string the tenant's service uses to reach its database.
std::string connection_url(const schema::tenant_identity_t& tenant,
                           const config::server_settings_t& server);

/// Ordered key/value pairs of the tenant's environment file.
///
/// Throws `common::validation_error` when a value spans lines.
environment_entries_t make_environment(
    const schema::deployment_request_t& request,
    schema::deploy_mode_t mode,
    const config::server_settings_t& server);

std::string render_environment(const environment_entries_t& entries);

/// Parse `KEY=VALUE` lines, skipping blanks and `#` comments.
std::map<std::string, std::string> parse_environment(std::string_view text);

/// Whether `key` is usable as an environment variable name.
bool is_valid_environment_key(std::string_view key);

}  // namespace steward::deployment
