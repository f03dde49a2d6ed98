#include <spdlog/spdlog.h>
#include <steward/common/errors.hpp>
#include <steward/probe/http.hpp>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <algorithm>

namespace beast = boost::beast;
namespace http = boost::beast::http;

namespace steward::probe {

http_url_t parse_http_url(const std::string_view url) {
  constexpr auto kScheme = std::string_view{"http://"};
  if (!url.starts_with(kScheme)) {
    throw common::validation_error{"health URL '" + std::string{url} +
                                   "' must start with http://"};
  }
  auto rest = url.substr(kScheme.size());
  auto parsed = http_url_t{};
  auto slash = rest.find('/');
  auto authority = rest.substr(0, slash);
  if (slash != std::string_view::npos) {
    parsed.target = std::string{rest.substr(slash)};
  }
  auto colon = authority.rfind(':');
  if (colon != std::string_view::npos) {
    parsed.port = std::string{authority.substr(colon + 1)};
    authority = authority.substr(0, colon);
    if (parsed.port.empty() ||
        !std::ranges::all_of(parsed.port,
                             [](const char c) { return c >= '0' && c <= '9'; })) {
      throw common::validation_error{"health URL '" + std::string{url} +
                                     "' has an invalid port"};
    }
  }
  if (authority.empty()) {
    throw common::validation_error{"health URL '" + std::string{url} +
                                   "' has no host"};
  }
  parsed.host = std::string{authority};
  return parsed;
}

std::optional<unsigned> http_get_status(const http_url_t& url,
                                        const std::chrono::milliseconds timeout) {
  auto io = boost::asio::io_context{};
  auto resolver = boost::asio::ip::tcp::resolver{io};
  auto stream = beast::tcp_stream{io};
  auto buffer = beast::flat_buffer{};
  auto request =
      http::request<http::empty_body>{http::verb::get, url.target, 11};
  request.set(http::field::host, url.host);
  request.set(http::field::user_agent, "steward-health-probe");
  auto response = http::response<http::string_body>{};
  auto status = std::optional<unsigned>{};
  auto failure = beast::error_code{};

  // Synchronous beast calls ignore the stream deadline, so the exchange is
  // chained asynchronously and bounded by run_for.
  resolver.async_resolve(
      url.host, url.port,
      [&](const beast::error_code& ec,
          const boost::asio::ip::tcp::resolver::results_type& results) {
        if (ec) {
          failure = ec;
          return;
        }
        stream.expires_after(timeout);
        stream.async_connect(results, [&](const beast::error_code& ec,
                                          const auto&) {
          if (ec) {
            failure = ec;
            return;
          }
          http::async_write(
              stream, request, [&](const beast::error_code& ec, std::size_t) {
                if (ec) {
                  failure = ec;
                  return;
                }
                http::async_read(stream, buffer, response,
                                 [&](const beast::error_code& ec, std::size_t) {
                                   if (ec) {
                                     failure = ec;
                                     return;
                                   }
                                   status = response.result_int();
                                 });
              });
        });
      });
  io.run_for(timeout);

  if (!status) {
    spdlog::debug("GET http://{}:{}{} failed: {}", url.host, url.port,
                  url.target,
                  failure ? failure.message() : std::string{"timed out"});
    return std::nullopt;
  }
  auto ec = beast::error_code{};
  stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  return status;
}

}  // namespace steward::probe
