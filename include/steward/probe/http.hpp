#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace steward::probe {

struct http_url_t final {
  std::string host;
  std::string port{"80"};
  std::string target{"/"};
};

/// Split a plain `http://host[:port][/path]` URL.
///
/// Throws `common::validation_error` for any other scheme or a missing host.
http_url_t parse_http_url(std::string_view url);

/// Issue one GET and return the status code, or std::nullopt when the
/// endpoint could not be reached within `timeout`.
std::optional<unsigned> http_get_status(const http_url_t& url,
                                        std::chrono::milliseconds timeout);

}  // namespace steward::probe
