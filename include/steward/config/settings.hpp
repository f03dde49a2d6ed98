#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace steward::config {

/// Shared PostgreSQL server: how steward reaches it as administrator, and how
/// tenant containers reach it.
struct server_settings_t final {
  std::string host{"127.0.0.1"};
  uint16_t port{5432};
  std::string admin_user{"postgres"};
  std::string admin_password;
  std::string admin_database{"postgres"};
  std::chrono::seconds connect_timeout{5};
  /// Host and port written into tenant connection strings.
  std::string service_host{"steward_postgres_shared"};
  uint16_t service_port{5432};
  std::string container{"steward_postgres_shared"};
  std::string image{"postgres:16-alpine"};
  std::string volume{"steward_postgres_data"};
  uint32_t ready_attempts{30};
  std::chrono::milliseconds ready_interval{2000};
};

struct runtime_settings_t final {
  std::string executable{"docker"};
  std::chrono::seconds stop_timeout{30};
  uint32_t ready_attempts{5};
  std::chrono::milliseconds ready_interval{2000};
  /// Image pulls before the old instance is touched.
  uint32_t pull_attempts{3};
  std::chrono::milliseconds pull_interval{10000};
};

struct health_settings_t final {
  std::string required_key{"DB_PASSWORD"};
  std::string http_url;
  std::chrono::milliseconds timeout{120000};
  std::chrono::milliseconds interval{3000};
};

struct migration_settings_t final {
  std::string schema{"public"};
  std::vector<std::string> expected_tables{"users"};
  std::string history_table{"alembic_version"};
  std::string upgrade_command{"alembic upgrade head"};
  std::string stamp_command{"alembic stamp head"};
};

struct logging_settings_t final {
  std::string file{"steward.log"};
  std::string level{"info"};
};

struct settings_t final {
  std::filesystem::path state_root{"/var/lib/steward"};
  server_settings_t server;
  runtime_settings_t runtime;
  health_settings_t health;
  migration_settings_t migration;
  logging_settings_t logging;
};

}  // namespace steward::config
