#include <steward/common/errors.hpp>
#include <steward/deployment/environment_file.hpp>

#include <algorithm>
#include <cctype>
#include <string>

namespace {

bool is_unreserved(const char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-' ||
         c == '.' || c == '_' || c == '~';
}

void append(steward::deployment::environment_entries_t& entries,
            const std::string& key,
            const std::string& value) {
  if (value.find_first_of("\r\n") != std::string::npos) {
    throw steward::common::validation_error{"value for " + key +
                                            " must be a single line"};
  }
  entries.emplace_back(key, value);
}

}  // namespace

namespace steward::deployment {

std::string percent_encode(const std::string_view value) {
  static constexpr auto kHex = "0123456789ABCDEF";
  auto out = std::string{};
  out.reserve(value.size());
  for (const auto c : value) {
    if (is_unreserved(c)) {
      out.push_back(c);
      continue;
    }
    const auto uc = static_cast<unsigned char>(c);
    out.push_back('%');
    out.push_back(kHex[(uc >> 4u) & 0x0Fu]);
    out.push_back(kHex[uc & 0x0Fu]);
  }
  return out;
}

std::string connection_url(const schema::tenant_identity_t& tenant,
                           const config::server_settings_t& server) {
  return "postgresql+asyncpg://" +
         percent_encode(schema::principal_name(tenant)) + ":" +
         percent_encode(tenant.credential_secret) + "@" + server.service_host +
         ":" + std::to_string(server.service_port) + "/" +
         schema::database_name(tenant);
}

bool is_valid_environment_key(const std::string_view key) {
  if (key.empty() || std::isdigit(static_cast<unsigned char>(key[0])) != 0) {
    return false;
  }
  for (const auto c : key) {
    if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '_') {
      return false;
    }
  }
  return true;
}

environment_entries_t make_environment(
    const schema::deployment_request_t& request,
    const schema::deploy_mode_t mode,
    const config::server_settings_t& server) {
  const auto production = mode == schema::deploy_mode_t::production;
  auto entries = environment_entries_t{};
  append(entries, "DATABASE_URL", connection_url(request.tenant, server));
  append(entries, "DB_PASSWORD", request.tenant.credential_secret);
  if (!request.service_token.empty()) {
    append(entries, "BOT_TOKEN", request.service_token);
  }
  append(entries, "ENVIRONMENT", std::string{schema::to_string(mode)});
  append(entries, "BOT_IMAGE", request.image);
  append(entries, "WEBHOOK_URL", request.webhook_url);
  append(entries, "DEBUG", production ? "false" : "true");
  append(entries, "LOG_LEVEL", production ? "INFO" : "DEBUG");
  append(entries, "DB_POOL_SIZE", "3");
  append(entries, "DB_MAX_OVERFLOW", "5");
  for (const auto& [key, value] : request.features) {
    if (!is_valid_environment_key(key)) {
      throw common::validation_error{"feature key '" + key +
                                     "' is not a valid variable name"};
    }
    if (std::ranges::any_of(entries, [&key](const auto& entry) {
          return entry.first == key;
        })) {
      throw common::validation_error{"feature key '" + key +
                                     "' would override a generated variable"};
    }
    append(entries, key, value);
  }
  return entries;
}

std::string render_environment(const environment_entries_t& entries) {
  auto text = std::string{"# Generated by steward; rewritten on every deploy\n"};
  for (const auto& [key, value] : entries) {
    text += key;
    text.push_back('=');
    text += value;
    text.push_back('\n');
  }
  return text;
}

std::map<std::string, std::string> parse_environment(
    const std::string_view text) {
  auto entries = std::map<std::string, std::string>{};
  auto rest = text;
  while (!rest.empty()) {
    auto end = rest.find('\n');
    auto line = rest.substr(0, end);
    rest = end == std::string_view::npos ? std::string_view{}
                                         : rest.substr(end + 1);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    if (line.empty() || line.front() == '#') {
      continue;
    }
    auto separator = line.find('=');
    if (separator == std::string_view::npos) {
      continue;
    }
    entries[std::string{line.substr(0, separator)}] =
        std::string{line.substr(separator + 1)};
  }
  return entries;
}

}  // namespace steward::deployment
