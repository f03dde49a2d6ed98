#pragma once

#include <steward/schema/deployment_snapshot.hpp>
#include <steward/schema/release.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace steward::deployment {

inline constexpr auto kEnvironmentFileName = std::string_view{".env"};
inline constexpr auto kReleaseFileName = std::string_view{"RELEASE"};
inline constexpr auto kSnapshotFileName = std::string_view{"SNAPSHOT"};

/// ISO-8601 UTC rendering used in manifests.
std::string utc_timestamp(std::chrono::system_clock::time_point when);

/// On-disk state of one tenant under the state root:
///
///   <root>/<tenant>/deploy/     current deployment (.env, RELEASE, bundle)
///   <root>/<tenant>/snapshot/   the single rollback snapshot
///
/// Owned by one deployment at a time; callers serialize per tenant.
class workspace final {
 public:
  workspace(const std::filesystem::path& state_root, const std::string& tenant);

  const std::filesystem::path& tenant_root() const { return tenant_root_; }
  std::filesystem::path deploy_directory() const;
  std::filesystem::path environment_file() const;
  std::filesystem::path release_file() const;
  std::filesystem::path snapshot_directory() const;

  /// A deploy directory with a release manifest exists.
  bool has_deployment() const;
  std::optional<schema::release_t> current_release() const;

  /// Copy a deployment bundle into the deploy directory, replacing files of
  /// the same name.
  void stage_bundle(const std::filesystem::path& bundle) const;

  /// Atomically replace the environment file (owner read/write only).
  void write_environment(const std::string& contents) const;
  void write_release(const schema::release_t& release) const;

  /// Record that the current release passed its health check.
  ///
  /// Throws `common::snapshot_error` when there is no current release.
  void mark_release_verified() const;

  /// Capture the current deployment, replacing any previous snapshot.
  /// Returns std::nullopt, and drops any stale snapshot, when there is no
  /// deployment to capture. A release that never passed a health check is
  /// not captured; the existing snapshot, if any, stays the rollback target.
  std::optional<schema::deployment_snapshot_t> create_snapshot() const;
  std::optional<schema::deployment_snapshot_t> load_snapshot() const;
  bool has_snapshot() const;

  /// Replace the deploy directory with the snapshot and consume it.
  ///
  /// Throws `common::snapshot_error` when no snapshot exists.
  schema::deployment_snapshot_t restore_snapshot() const;

 private:
  std::filesystem::path tenant_root_;
};

/// Read a RELEASE/SNAPSHOT style `key=value` manifest.
std::optional<schema::release_t> read_release(const std::filesystem::path& file);

}  // namespace steward::deployment
