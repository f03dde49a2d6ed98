#pragma once

#include <steward/schema/deploy_mode.hpp>
#include <steward/schema/tenant_identity.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>

// Schema type: deployment request.
// Operator inputs for one deployment attempt. `mode` is kept as text so the
// pipeline's validating state can reject unknown values itself.
namespace steward::schema {

struct deployment_request_t final {
  tenant_identity_t tenant;
  std::string image;
  std::string mode;
  std::string service_token;
  std::string webhook_url;
  std::map<std::string, std::string> features;
  std::optional<std::filesystem::path> bundle_directory;
};

}  // namespace steward::schema
