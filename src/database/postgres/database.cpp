#include <spdlog/spdlog.h>
#include <steward/common/critical.hpp>
#include <steward/common/errors.hpp>
#include <steward/database/postgres/database.hpp>

#include <array>
#include <string>
#include <vector>

namespace {

using steward::database::server_endpoint_t;

/// NUL-terminated keyword/value arrays for PQconnectdbParams and PQpingParams.
struct connection_parameters final {
  explicit connection_parameters(const server_endpoint_t& endpoint)
      : port{std::to_string(endpoint.port)},
        timeout{std::to_string(endpoint.connect_timeout.count())},
        values{endpoint.host.c_str(),
               port.c_str(),
               endpoint.user.c_str(),
               endpoint.password.c_str(),
               endpoint.database.c_str(),
               timeout.c_str(),
               "steward",
               nullptr} {}

  std::string port;
  std::string timeout;
  std::array<const char*, 8> keywords{
      "host",   "port",            "user",             "password",
      "dbname", "connect_timeout", "application_name", nullptr};
  std::array<const char*, 8> values;
};

std::string error_message(const PGconn* connection) {
  auto message = std::string{PQerrorMessage(connection)};
  while (!message.empty() &&
         (message.back() == '\n' || message.back() == ' ')) {
    message.pop_back();
  }
  return message;
}

steward::database::detail::connection_ptr connect(
    const server_endpoint_t& endpoint) {
  auto parameters = connection_parameters{endpoint};
  auto connection = steward::database::detail::connection_ptr{
      PQconnectdbParams(parameters.keywords.data(), parameters.values.data(),
                        0)};
  if (!connection) {
    steward::common::critical("libpq could not allocate a connection to {}:{}",
                              endpoint.host, endpoint.port);
  }
  if (PQstatus(connection.get()) != CONNECTION_OK) {
    throw steward::common::database_error{
        "connection to " + endpoint.host + ":" +
            std::to_string(endpoint.port) + "/" + endpoint.database +
            " failed: " + error_message(connection.get()),
        "08006"};
  }
  return connection;
}

}  // namespace

namespace steward::database {

template <>
database<postgres_tag> make_database<postgres_tag>(
    const server_endpoint_t& endpoint) {
  auto db = database<postgres_tag>{};
  db.endpoint = endpoint;
  return db;
}

PGconn* database<postgres_tag>::handle() const {
  if (!connection) {
    connection = connect(endpoint);
    spdlog::debug("Connected to {}:{}/{} as '{}'", endpoint.host,
                  endpoint.port, endpoint.database, endpoint.user);
  }
  return connection.get();
}

detail::result_ptr database<postgres_tag>::execute(
    const std::string& sql,
    const std::vector<std::string>& params) const {
  auto* conn = handle();
  auto values = std::vector<const char*>{};
  values.reserve(params.size());
  for (const auto& param : params) {
    values.push_back(param.c_str());
  }
  auto result = detail::result_ptr{
      PQexecParams(conn, sql.c_str(), static_cast<int>(values.size()), nullptr,
                   values.empty() ? nullptr : values.data(), nullptr, nullptr,
                   0)};
  if (!result) {
    throw common::database_error{"statement failed: " + error_message(conn)};
  }
  auto status = PQresultStatus(result.get());
  if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
    const auto* sqlstate = PQresultErrorField(result.get(), PG_DIAG_SQLSTATE);
    throw common::database_error{
        "statement failed: " + error_message(conn),
        sqlstate == nullptr ? std::string{} : std::string{sqlstate}};
  }
  return result;
}

std::string database<postgres_tag>::quote_identifier(
    const std::string_view identifier) const {
  auto* conn = handle();
  auto* escaped =
      PQescapeIdentifier(conn, identifier.data(), identifier.size());
  if (escaped == nullptr) {
    throw common::database_error{"cannot quote identifier: " +
                                 error_message(conn)};
  }
  auto quoted = std::string{escaped};
  PQfreemem(escaped);
  return quoted;
}

std::string database<postgres_tag>::quote_literal(
    const std::string_view literal) const {
  auto* conn = handle();
  auto* escaped = PQescapeLiteral(conn, literal.data(), literal.size());
  if (escaped == nullptr) {
    throw common::database_error{"cannot quote literal: " +
                                 error_message(conn)};
  }
  auto quoted = std::string{escaped};
  PQfreemem(escaped);
  return quoted;
}

bool database<postgres_tag>::ping() const {
  auto parameters = connection_parameters{endpoint};
  return PQpingParams(parameters.keywords.data(), parameters.values.data(),
                      0) == PQPING_OK;
}

database<postgres_tag> database<postgres_tag>::open(
    const std::string_view name) const {
  auto other = endpoint;
  other.database = std::string{name};
  return make_database<postgres_tag>(other);
}

bool database<postgres_tag>::database_exists(
    const std::string_view name) const {
  auto result = execute("SELECT 1 FROM pg_catalog.pg_database WHERE datname = $1",
                        {std::string{name}});
  return PQntuples(result.get()) > 0;
}

bool database<postgres_tag>::create_database(
    const std::string_view name) const {
  // CREATE DATABASE has no IF NOT EXISTS; a lost race surfaces as a
  // duplicate error instead.
  if (database_exists(name)) {
    return false;
  }
  try {
    execute("CREATE DATABASE " + quote_identifier(name));
  } catch (const common::database_error& ex) {
    if (detail::is_duplicate(ex.sqlstate())) {
      spdlog::info("Database '{}' was created concurrently", name);
      return false;
    }
    throw;
  }
  return true;
}

bool database<postgres_tag>::role_exists(const std::string_view name) const {
  auto result = execute("SELECT 1 FROM pg_catalog.pg_roles WHERE rolname = $1",
                        {std::string{name}});
  return PQntuples(result.get()) > 0;
}

bool database<postgres_tag>::create_role(const std::string_view name,
                                         const std::string_view secret) const {
  if (role_exists(name)) {
    return false;
  }
  try {
    execute("CREATE ROLE " + quote_identifier(name) +
            " WITH LOGIN ENCRYPTED PASSWORD " + quote_literal(secret));
  } catch (const common::database_error& ex) {
    if (detail::is_duplicate(ex.sqlstate())) {
      spdlog::info("Role '{}' was created concurrently", name);
      return false;
    }
    throw;
  }
  return true;
}

bool database<postgres_tag>::can_login(
    const std::string_view role,
    const std::string_view secret,
    const std::string_view database_name) const {
  auto candidate = endpoint;
  candidate.user = std::string{role};
  candidate.password = std::string{secret};
  candidate.database = std::string{database_name};
  auto parameters = connection_parameters{candidate};
  auto attempt = detail::connection_ptr{PQconnectdbParams(
      parameters.keywords.data(), parameters.values.data(), 0)};
  return attempt && PQstatus(attempt.get()) == CONNECTION_OK;
}

void database<postgres_tag>::grant_database(
    const std::string_view database_name,
    const std::string_view role) const {
  execute("GRANT ALL PRIVILEGES ON DATABASE " +
          quote_identifier(database_name) + " TO " + quote_identifier(role));
}

void database<postgres_tag>::grant_schema(const std::string_view schema,
                                          const std::string_view role) const {
  execute("GRANT ALL ON SCHEMA " + quote_identifier(schema) + " TO " +
          quote_identifier(role));
}

bool database<postgres_tag>::table_exists(const std::string_view schema,
                                          const std::string_view table) const {
  auto result = execute(
      "SELECT 1 FROM information_schema.tables "
      "WHERE table_schema = $1 AND table_name = $2",
      {std::string{schema}, std::string{table}});
  return PQntuples(result.get()) > 0;
}

}  // namespace steward::database
