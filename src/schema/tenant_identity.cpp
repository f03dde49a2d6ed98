#include <steward/schema/tenant_identity.hpp>

#include <algorithm>

namespace steward::schema {

namespace {

bool is_slug_start(const char c) {
  return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

bool is_slug_char(const char c) {
  return is_slug_start(c) || c == '-';
}

}  // namespace

bool is_valid_tenant_name(const std::string_view name) {
  if (name.empty() || name.size() > kMaxTenantNameLength) {
    return false;
  }
  if (!is_slug_start(name.front())) {
    return false;
  }
  return std::ranges::all_of(name, is_slug_char);
}

std::string snake_name(const std::string_view name) {
  auto out = std::string{name};
  std::ranges::replace(out, '-', '_');
  return out;
}

std::string database_name(const tenant_identity_t& tenant) {
  return snake_name(tenant.name) + "_db";
}

std::string principal_name(const tenant_identity_t& tenant) {
  return snake_name(tenant.name) + "_user";
}

std::string network_name(const tenant_identity_t& tenant) {
  return "steward_" + tenant.name;
}

std::string service_name(const tenant_identity_t& tenant) {
  return "steward_" + tenant.name + "_service";
}

}  // namespace steward::schema
