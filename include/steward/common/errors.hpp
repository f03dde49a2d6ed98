#pragma once

#include <steward/schema/error_category.hpp>

#include <stdexcept>
#include <string>
#include <utility>

namespace steward::common {

/// Base of every failure that crosses a component boundary.
class error : public std::runtime_error {
 public:
  error(const schema::error_category_t category, const std::string& message)
      : std::runtime_error{message}, category_{category} {}

  schema::error_category_t category() const noexcept { return category_; }

 private:
  schema::error_category_t category_;
};

/// Missing or malformed input; raised before any side effect.
class validation_error final : public error {
 public:
  explicit validation_error(const std::string& message)
      : error{schema::error_category_t::validation, message} {}
};

/// Shared server or container runtime unreachable after bounded retries.
class resource_unavailable_error final : public error {
 public:
  explicit resource_unavailable_error(const std::string& message)
      : error{schema::error_category_t::resource_unavailable, message} {}
};

/// Database or principal creation failed for a reason other than "exists".
class provisioning_error final : public error {
 public:
  provisioning_error(const std::string& message, std::string sqlstate = {})
      : error{schema::error_category_t::provisioning, message},
        sqlstate_{std::move(sqlstate)} {}

  const std::string& sqlstate() const noexcept { return sqlstate_; }

 private:
  std::string sqlstate_;
};

/// Schema state cannot be classified; requires an operator.
class migration_ambiguity_error final : public error {
 public:
  explicit migration_ambiguity_error(const std::string& message)
      : error{schema::error_category_t::migration_ambiguity, message} {}
};

/// Migration tool failed or left history untracked.
class migration_error final : public error {
 public:
  explicit migration_error(const std::string& message)
      : error{schema::error_category_t::migration, message} {}
};

/// New instance never became healthy within the bound.
class health_check_timeout_error final : public error {
 public:
  explicit health_check_timeout_error(const std::string& message)
      : error{schema::error_category_t::health_check_timeout, message} {}
};

/// Container runtime command exited non-zero or could not be spawned.
class runtime_command_error final : public error {
 public:
  runtime_command_error(const std::string& message, const int exit_code)
      : error{schema::error_category_t::runtime_command, message},
        exit_code_{exit_code} {}

  int exit_code() const noexcept { return exit_code_; }

 private:
  int exit_code_;
};

/// Statement or connection failure reported by the database server.
class database_error final : public error {
 public:
  database_error(const std::string& message, std::string sqlstate = {})
      : error{schema::error_category_t::database, message},
        sqlstate_{std::move(sqlstate)} {}

  const std::string& sqlstate() const noexcept { return sqlstate_; }

 private:
  std::string sqlstate_;
};

/// Snapshot could not be written or restored.
class snapshot_error final : public error {
 public:
  explicit snapshot_error(const std::string& message)
      : error{schema::error_category_t::snapshot, message} {}
};

}  // namespace steward::common
