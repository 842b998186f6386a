#include "tracker/http_gateway.hpp"

#include "tracker/snapshot_json.hpp"

#include <boost/beast/core.hpp>

#include <cstdio>
#include <exception>
#include <string>

// Platform headers
#include <sys/socket.h>
#include <sys/time.h>

namespace tracker {

namespace beast = boost::beast;

namespace {

constexpr const char* kServerName = "player-tracker";
constexpr const char* kCorsMethods = "GET,HEAD,PUT,PATCH,POST,DELETE";

constexpr std::string_view kBodyAccepted = R"({"success":true})";
constexpr std::string_view kBodyRateLimited = R"({"error":"Rate limit exceeded"})";
constexpr std::string_view kBodyInvalid = R"({"error":"Invalid player data"})";
constexpr std::string_view kBodyInternal = R"({"error":"Internal server error"})";
constexpr std::string_view kBodyNotFound = R"({"error":"Not found"})";
constexpr std::string_view kBodyNotAllowed = R"({"error":"Method not allowed"})";
constexpr std::string_view kBodyTooLarge = R"({"error":"Payload too large"})";

std::string_view to_std(beast::string_view s) noexcept {
    return std::string_view(s.data(), s.size());
}

HttpResponse not_allowed(const HttpRequest& req, const char* allow) {
    auto res = make_json_response(http::status::method_not_allowed,
                                  std::string(kBodyNotAllowed),
                                  req.version(), req.keep_alive());
    res.set(http::field::allow, allow);
    return res;
}

}  // namespace

HttpGateway::HttpGateway(TrackerService& service, HttpConfig config, LogFn log)
    : service_(service)
    , config_(config)
    , log_(std::move(log)) {}

HttpResponse HttpGateway::handle(const HttpRequest& req, const OriginId& origin) {
    try {
        return route(req, origin);
    } catch (const std::exception& e) {
        ++internal_errors_;
        log(std::string("Error processing request: ") + e.what());
        return make_json_response(http::status::internal_server_error,
                                  std::string(kBodyInternal),
                                  req.version(), false);
    }
}

void HttpGateway::serve_connection(tcp::socket socket) {
    beast::error_code ec;

    auto peer = socket.remote_endpoint(ec);
    if (ec) {
        ++transport_errors_;
        log("Dropping connection without peer address: " + ec.message());
        return;
    }
    const OriginId origin = peer.address().to_string();

    if (!configure_socket(socket, config_.io_timeout)) {
        log("Failed to set socket timeouts for " + origin);
    }

    beast::flat_buffer buffer;
    while (true) {
        http::request_parser<http::string_body> parser;
        parser.body_limit(config_.max_body_bytes);

        http::read(socket, buffer, parser, ec);
        if (ec == http::error::end_of_stream) {
            break;
        }
        if (ec == http::error::body_limit) {
            auto res = make_json_response(http::status::payload_too_large,
                                          std::string(kBodyTooLarge), 11, false);
            http::write(socket, res, ec);
            if (ec) {
                ++transport_errors_;
            }
            break;
        }
        if (ec) {
            ++transport_errors_;
            log("Read error from " + origin + ": " + ec.message());
            break;
        }

        HttpResponse res = handle(parser.get(), origin);
        const bool keep_alive = res.keep_alive();

        http::write(socket, res, ec);
        if (ec) {
            ++transport_errors_;
            log("Write error to " + origin + ": " + ec.message());
            break;
        }
        if (!keep_alive) {
            break;
        }
    }

    // The peer may already be gone; nothing left to report in that case
    socket.shutdown(tcp::socket::shutdown_send, ec);
}

HttpResponse HttpGateway::route(const HttpRequest& req, const OriginId& origin) {
    if (req.method() == http::verb::options) {
        return handle_preflight(req);
    }

    std::string_view path = request_path(to_std(req.target()));

    if (path == kSubmitPath) {
        if (req.method() != http::verb::post) {
            return not_allowed(req, "POST");
        }
        return handle_submit(req, origin);
    }
    if (path == kListPath) {
        if (req.method() != http::verb::get) {
            return not_allowed(req, "GET");
        }
        return handle_list(req);
    }
    if (path == kDashboardPath) {
        if (req.method() != http::verb::get) {
            return not_allowed(req, "GET");
        }
        return handle_dashboard(req);
    }

    return make_json_response(http::status::not_found, std::string(kBodyNotFound),
                              req.version(), req.keep_alive());
}

HttpResponse HttpGateway::handle_submit(const HttpRequest& req, const OriginId& origin) {
    BodyFormat format = body_format_from_content_type(to_std(req[http::field::content_type]));
    SubmitResult result = service_.submit(origin, req.body(), format);

    switch (result.status) {
        case SubmitStatus::Accepted:
            if (config_.log_updates) {
                log("Updated player data for " + result.player_name +
                    " in " + result.game_name);
            }
            return make_json_response(http::status::ok, std::string(kBodyAccepted),
                                      req.version(), req.keep_alive());

        case SubmitStatus::RateLimited:
            return make_json_response(http::status::too_many_requests,
                                      std::string(kBodyRateLimited),
                                      req.version(), req.keep_alive());

        case SubmitStatus::Invalid:
            break;
    }

    return make_json_response(http::status::bad_request, std::string(kBodyInvalid),
                              req.version(), req.keep_alive());
}

HttpResponse HttpGateway::handle_list(const HttpRequest& req) {
    return make_json_response(http::status::ok, snapshot_to_json(service_.list()),
                              req.version(), req.keep_alive());
}

HttpResponse HttpGateway::handle_dashboard(const HttpRequest& req) {
    HttpResponse res{http::status::ok, req.version()};
    res.set(http::field::server, kServerName);
    res.set(http::field::content_type, "text/html; charset=utf-8");
    res.set(http::field::access_control_allow_origin, "*");
    res.keep_alive(req.keep_alive());
    res.body() = std::string(dashboard_html());
    res.prepare_payload();
    return res;
}

HttpResponse HttpGateway::handle_preflight(const HttpRequest& req) {
    HttpResponse res{http::status::no_content, req.version()};
    res.set(http::field::server, kServerName);
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, kCorsMethods);

    auto requested = req[http::field::access_control_request_headers];
    if (!requested.empty()) {
        res.set(http::field::access_control_allow_headers, requested);
        res.set(http::field::vary, "Access-Control-Request-Headers");
    }
    res.keep_alive(req.keep_alive());
    res.prepare_payload();
    return res;
}

void HttpGateway::log(std::string_view line) const {
    if (log_) {
        log_(line);
        return;
    }
    std::fprintf(stderr, "%.*s\n", static_cast<int>(line.size()), line.data());
}

HttpResponse make_json_response(http::status status, std::string body,
                                unsigned version, bool keep_alive) {
    HttpResponse res{status, version};
    res.set(http::field::server, kServerName);
    res.set(http::field::content_type, "application/json; charset=utf-8");
    res.set(http::field::access_control_allow_origin, "*");
    res.keep_alive(keep_alive);
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

bool configure_socket(tcp::socket& socket, std::chrono::seconds io_timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<decltype(tv.tv_sec)>(io_timeout.count());
    tv.tv_usec = 0;

    int fd = socket.native_handle();
    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        return false;
    }
    if (setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        return false;
    }
    return true;
}

std::string_view request_path(std::string_view target) noexcept {
    std::string_view path = target.substr(0, target.find('?'));
    if (path.size() > 1 && path.back() == '/') {
        path.remove_suffix(1);
    }
    return path;
}

}  // namespace tracker
