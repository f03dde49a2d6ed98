#pragma once

#include <cstddef>
#include <string>
#include <string_view>

// Schema type: tenant identity.
// One isolated service instance on the shared database server. The name is
// the idempotency key every derived resource name is computed from.
namespace steward::schema {

inline constexpr auto kMaxTenantNameLength = std::size_t{48};

struct tenant_identity_t final {
  std::string name;
  std::string credential_secret;
};

/// Whether `name` is a valid tenant slug: `[a-z0-9][a-z0-9-]*`, bounded.
///
/// Underscores are excluded so that `snake_name` stays injective.
bool is_valid_tenant_name(std::string_view name);

/// Name with hyphens folded to underscores, usable in SQL identifiers.
std::string snake_name(std::string_view name);

std::string database_name(const tenant_identity_t& tenant);
std::string principal_name(const tenant_identity_t& tenant);
std::string network_name(const tenant_identity_t& tenant);
std::string service_name(const tenant_identity_t& tenant);

}  // namespace steward::schema
