#pragma once

#include <steward/schema/release.hpp>

#include <filesystem>
#include <string>

// Schema type: deployment snapshot.
// Point-in-time copy of the previous working deployment; consumed only by
// rollback.
namespace steward::schema {

struct deployment_snapshot_t final {
  std::string timestamp;
  std::filesystem::path source_directory;
  std::filesystem::path environment_file;
  release_t release;
};

}  // namespace steward::schema
