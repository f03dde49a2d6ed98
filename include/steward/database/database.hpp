#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace steward::database {

/// Connection parameters for one database on the shared server.
struct server_endpoint_t final {
  std::string host;
  uint16_t port{5432};
  std::string user;
  std::string password;
  std::string database;
  std::chrono::seconds connect_timeout{5};
};

/// Administrative view of the shared database server, specialized per client
/// library. Every mutating member is phrased as an idempotent command so that
/// independent processes may issue it concurrently.
template <typename Library>
struct database {
  /// Lightweight reachability probe; false when the server does not answer.
  bool ping() const;

  /// Administrative connection to another database on the same server.
  database<Library> open(std::string_view name) const;

  bool database_exists(std::string_view name) const;

  /// Create the database; false when it already existed, including when a
  /// concurrent caller created it first.
  bool create_database(std::string_view name) const;

  bool role_exists(std::string_view name) const;

  /// Create a login role with the given secret; false when it already
  /// existed. An existing role's secret is never touched.
  bool create_role(std::string_view name, std::string_view secret) const;

  /// Whether `role` can authenticate with `secret` against `database_name`.
  bool can_login(std::string_view role,
                 std::string_view secret,
                 std::string_view database_name) const;

  void grant_database(std::string_view database_name,
                      std::string_view role) const;

  /// Grant on a schema of the database this connection is open on.
  void grant_schema(std::string_view schema, std::string_view role) const;

  /// Catalog lookup in the database this connection is open on.
  bool table_exists(std::string_view schema, std::string_view table) const;
};

/// Construct a backend for the endpoint; connects lazily on first use.
template <typename Library>
database<Library> make_database(const server_endpoint_t& endpoint);

}  // namespace steward::database
