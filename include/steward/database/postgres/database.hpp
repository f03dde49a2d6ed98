#pragma once

#include <libpq-fe.h>
#include <steward/database/database.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace steward::database {

namespace detail {

inline constexpr auto kDuplicateDatabase = std::string_view{"42P04"};
inline constexpr auto kDuplicateObject = std::string_view{"42710"};
inline constexpr auto kUniqueViolation = std::string_view{"23505"};

struct connection_deleter final {
  void operator()(PGconn* connection) const noexcept { PQfinish(connection); }
};

struct result_deleter final {
  void operator()(PGresult* result) const noexcept { PQclear(result); }
};

using connection_ptr = std::unique_ptr<PGconn, connection_deleter>;
using result_ptr = std::unique_ptr<PGresult, result_deleter>;

/// "Already exists" outcomes of a racing CREATE DATABASE / CREATE ROLE.
inline bool is_duplicate(const std::string_view sqlstate) {
  return sqlstate == kDuplicateDatabase || sqlstate == kDuplicateObject ||
         sqlstate == kUniqueViolation;
}

}  // namespace detail

struct postgres_tag {};

template <>
struct database<postgres_tag> final {
  server_endpoint_t endpoint;
  mutable detail::connection_ptr connection;

  bool ping() const;
  database<postgres_tag> open(std::string_view name) const;
  bool database_exists(std::string_view name) const;
  bool create_database(std::string_view name) const;
  bool role_exists(std::string_view name) const;
  bool create_role(std::string_view name, std::string_view secret) const;
  bool can_login(std::string_view role,
                 std::string_view secret,
                 std::string_view database_name) const;
  void grant_database(std::string_view database_name,
                      std::string_view role) const;
  void grant_schema(std::string_view schema, std::string_view role) const;
  bool table_exists(std::string_view schema, std::string_view table) const;

 private:
  PGconn* handle() const;
  detail::result_ptr execute(const std::string& sql,
                             const std::vector<std::string>& params = {}) const;
  std::string quote_identifier(std::string_view identifier) const;
  std::string quote_literal(std::string_view literal) const;
};

template <>
database<postgres_tag> make_database<postgres_tag>(
    const server_endpoint_t& endpoint);

}  // namespace steward::database
