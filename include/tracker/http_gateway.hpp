#pragma once

#include "tracker/clock.hpp"
#include "tracker/config.hpp"
#include "tracker/tracker_service.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string_view>

namespace tracker {

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

// Receives one formatted log line (no trailing newline)
using LogFn = std::function<void(std::string_view)>;

// Endpoints served by the gateway
inline constexpr std::string_view kSubmitPath = "/server/api/player";
inline constexpr std::string_view kListPath = "/server/api/players";
inline constexpr std::string_view kDashboardPath = "/";

// ============================================================================
// HttpGateway
//
// Maps HTTP to TrackerService operations:
//
//   POST /server/api/player   -> submit   200 / 400 / 429
//   GET  /server/api/players  -> list     200 JSON array
//   GET  /                    -> dashboard page
//   OPTIONS *                 -> CORS preflight 204
//
// Any exception escaping the service is answered with a generic 500 and
// logged; the connection and the process keep running.
//
// Thread safety: handle() and serve_connection() may run on many threads;
// the service does its own locking.
// ============================================================================

class HttpGateway {
public:
    HttpGateway(TrackerService& service, HttpConfig config, LogFn log = {});

    // Produce the response for one request from `origin`.
    // Exceptions raised while handling become a 500 response.
    [[nodiscard]] HttpResponse handle(const HttpRequest& req, const OriginId& origin);

    // Read/handle/write loop for one accepted connection until the peer
    // closes, keep-alive ends, or a transport error occurs.
    void serve_connection(tcp::socket socket);

    // Metrics
    [[nodiscard]] std::uint64_t internal_errors() const noexcept { return internal_errors_.load(); }
    [[nodiscard]] std::uint64_t transport_errors() const noexcept { return transport_errors_.load(); }

private:
    HttpResponse route(const HttpRequest& req, const OriginId& origin);
    HttpResponse handle_submit(const HttpRequest& req, const OriginId& origin);
    HttpResponse handle_list(const HttpRequest& req);
    HttpResponse handle_dashboard(const HttpRequest& req);
    HttpResponse handle_preflight(const HttpRequest& req);

    void log(std::string_view line) const;

    TrackerService& service_;
    HttpConfig config_;
    LogFn log_;

    std::atomic<std::uint64_t> internal_errors_{0};
    std::atomic<std::uint64_t> transport_errors_{0};
};

// Build a JSON response with the CORS header set
HttpResponse make_json_response(http::status status, std::string body,
                                unsigned version, bool keep_alive);

// Apply SO_RCVTIMEO / SO_SNDTIMEO to a connected socket.
// Returns false if either setsockopt fails.
bool configure_socket(tcp::socket& socket, std::chrono::seconds io_timeout);

// Path part of a request target: query string and trailing slash removed
std::string_view request_path(std::string_view target) noexcept;

// Dashboard page served at "/"
std::string_view dashboard_html() noexcept;

}  // namespace tracker
