#include <spdlog/fmt/chrono.h>
#include <spdlog/spdlog.h>
#include <steward/common/errors.hpp>
#include <steward/deployment/environment_file.hpp>
#include <steward/deployment/workspace.hpp>

#include <ctime>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace {

inline constexpr auto kDeployDirectory = "deploy";
inline constexpr auto kSnapshotDirectory = "snapshot";
inline constexpr auto kStagingSuffix = ".partial";

std::string read_file(const fs::path& path) {
  auto stream = std::ifstream{path, std::ios::binary};
  return std::string{std::istreambuf_iterator<char>{stream},
                     std::istreambuf_iterator<char>{}};
}

void write_file_atomically(const fs::path& path,
                           const std::string& contents,
                           const fs::perms permissions) {
  auto staging = path;
  staging += kStagingSuffix;
  {
    auto stream = std::ofstream{staging, std::ios::binary | std::ios::trunc};
    stream << contents;
    stream.flush();
    if (!stream) {
      throw steward::common::snapshot_error{"cannot write " + staging.string()};
    }
  }
  fs::permissions(staging, permissions, fs::perm_options::replace);
  fs::rename(staging, path);
}

std::string manifest_text(const steward::schema::release_t& release) {
  return "image=" + release.image + "\ndeployed_at=" + release.deployed_at +
         "\nverified=" + (release.verified ? "true" : "false") + "\n";
}

void remove_tree(const fs::path& path) {
  auto ec = std::error_code{};
  fs::remove_all(path, ec);
  if (ec) {
    throw steward::common::snapshot_error{"cannot remove " + path.string() +
                                          ": " + ec.message()};
  }
}

}  // namespace

namespace steward::deployment {

std::string utc_timestamp(const std::chrono::system_clock::time_point when) {
  return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}",
                     fmt::gmtime(std::chrono::system_clock::to_time_t(when)));
}

std::optional<schema::release_t> read_release(const fs::path& file) {
  if (!fs::exists(file)) {
    return std::nullopt;
  }
  auto entries = parse_environment(read_file(file));
  auto image = entries.find("image");
  if (image == std::end(entries) || image->second.empty()) {
    return std::nullopt;
  }
  auto release = schema::release_t{.image = image->second};
  if (auto deployed = entries.find("deployed_at");
      deployed != std::end(entries)) {
    release.deployed_at = deployed->second;
  }
  if (auto verified = entries.find("verified"); verified != std::end(entries)) {
    release.verified = verified->second == "true";
  }
  return release;
}

workspace::workspace(const fs::path& state_root, const std::string& tenant)
    : tenant_root_{state_root / tenant} {}

fs::path workspace::deploy_directory() const {
  return tenant_root_ / kDeployDirectory;
}

fs::path workspace::environment_file() const {
  return deploy_directory() / kEnvironmentFileName;
}

fs::path workspace::release_file() const {
  return deploy_directory() / kReleaseFileName;
}

fs::path workspace::snapshot_directory() const {
  return tenant_root_ / kSnapshotDirectory;
}

bool workspace::has_deployment() const {
  return current_release().has_value();
}

std::optional<schema::release_t> workspace::current_release() const {
  return read_release(release_file());
}

void workspace::stage_bundle(const fs::path& bundle) const {
  if (!fs::is_directory(bundle)) {
    throw common::snapshot_error{"bundle directory " + bundle.string() +
                                 " does not exist"};
  }
  fs::create_directories(deploy_directory());
  fs::copy(bundle, deploy_directory(),
           fs::copy_options::recursive | fs::copy_options::overwrite_existing);
  spdlog::info("Copied bundle {} into {}", bundle.string(),
               deploy_directory().string());
}

void workspace::write_environment(const std::string& contents) const {
  fs::create_directories(deploy_directory());
  write_file_atomically(environment_file(), contents,
                        fs::perms::owner_read | fs::perms::owner_write);
}

void workspace::write_release(const schema::release_t& release) const {
  fs::create_directories(deploy_directory());
  write_file_atomically(release_file(), manifest_text(release),
                        fs::perms::owner_read | fs::perms::owner_write |
                            fs::perms::group_read | fs::perms::others_read);
}

void workspace::mark_release_verified() const {
  auto release = current_release();
  if (!release) {
    throw common::snapshot_error{"no release manifest at " +
                                 release_file().string()};
  }
  release->verified = true;
  write_release(*release);
}

std::optional<schema::deployment_snapshot_t> workspace::create_snapshot()
    const {
  auto release = current_release();
  if (release && !release->verified) {
    spdlog::warn("Release '{}' never passed a health check; keeping it out of "
                 "the snapshot",
                 release->image);
    return load_snapshot();
  }
  if (!release) {
    if (has_snapshot()) {
      spdlog::warn("Dropping stale snapshot without a deployment at {}",
                   snapshot_directory().string());
      remove_tree(snapshot_directory());
    }
    return std::nullopt;
  }

  auto staging = snapshot_directory();
  staging += kStagingSuffix;
  remove_tree(staging);
  fs::create_directories(staging);

  auto snapshot = schema::deployment_snapshot_t{
      .timestamp = utc_timestamp(std::chrono::system_clock::now()),
      .source_directory = snapshot_directory() / kDeployDirectory,
      .environment_file = snapshot_directory() / kEnvironmentFileName,
      .release = *release};
  try {
    fs::copy(deploy_directory(), staging / kDeployDirectory,
             fs::copy_options::recursive | fs::copy_options::copy_symlinks);
    if (fs::exists(environment_file())) {
      fs::copy_file(environment_file(), staging / kEnvironmentFileName);
    }
    write_file_atomically(
        staging / kSnapshotFileName,
        manifest_text(*release) + "timestamp=" + snapshot.timestamp + "\n",
        fs::perms::owner_read | fs::perms::owner_write);
  } catch (const fs::filesystem_error& ex) {
    throw common::snapshot_error{std::string{"snapshot failed: "} + ex.what()};
  }

  // Exactly one snapshot per tenant: the fresh copy replaces the old one.
  remove_tree(snapshot_directory());
  fs::rename(staging, snapshot_directory());
  spdlog::info("Snapshot of release '{}' written to {}", release->image,
               snapshot_directory().string());
  return snapshot;
}

bool workspace::has_snapshot() const {
  return fs::exists(snapshot_directory() / kSnapshotFileName);
}

std::optional<schema::deployment_snapshot_t> workspace::load_snapshot() const {
  auto meta = snapshot_directory() / kSnapshotFileName;
  auto release = read_release(meta);
  if (!release) {
    return std::nullopt;
  }
  auto entries = parse_environment(read_file(meta));
  return schema::deployment_snapshot_t{
      .timestamp = entries["timestamp"],
      .source_directory = snapshot_directory() / kDeployDirectory,
      .environment_file = snapshot_directory() / kEnvironmentFileName,
      .release = *release};
}

schema::deployment_snapshot_t workspace::restore_snapshot() const {
  auto snapshot = load_snapshot();
  if (!snapshot) {
    throw common::snapshot_error{"no snapshot to restore at " +
                                 snapshot_directory().string()};
  }
  try {
    remove_tree(deploy_directory());
    fs::rename(snapshot->source_directory, deploy_directory());
    if (fs::exists(snapshot->environment_file)) {
      fs::copy_file(snapshot->environment_file, environment_file(),
                    fs::copy_options::overwrite_existing);
    }
  } catch (const fs::filesystem_error& ex) {
    throw common::snapshot_error{std::string{"restore failed: "} + ex.what()};
  }
  remove_tree(snapshot_directory());
  spdlog::info("Restored release '{}' from snapshot taken {}",
               snapshot->release.image, snapshot->timestamp);
  return *snapshot;
}

}  // namespace steward::deployment
