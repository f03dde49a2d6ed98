#pragma once

#include <string>

// Schema type: release manifest.
// Identifies the image a deploy directory was launched with.
namespace steward::schema {

struct release_t final {
  std::string image;
  std::string deployed_at;
  /// Set once the release has passed a health check; only verified releases
  /// become rollback targets.
  bool verified{};

  bool operator==(const release_t&) const = default;
};

}  // namespace steward::schema
