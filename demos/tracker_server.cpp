// Tracker Server Demo
//
// Full pipeline: HTTP accept -> rate limit -> parse -> validate -> registry
//
// Usage:
//   ./tracker_server [options]
//
// Options:
//   --port N            - TCP port to listen on (default: 8080)
//   --address A         - Address to bind (default: 0.0.0.0)
//   --window-ms N       - Rate limit window in milliseconds (default: 10000)
//   --max-requests N    - Requests admitted per window per origin (default: 20)
//   --max-origins N     - Rate limit table capacity (default: 4096)
//   --max-players N     - Registry capacity (default: 65536)
//   --ttl-sec N         - Drop players not updated for N seconds (default: 0, off)
//   --lenient-numbers   - Accept counters with trailing garbage ("12abc" -> 12)
//   --stats-sec N       - Seconds between stats reports (default: 10)
//   --quiet             - Do not log every accepted update

#include "tracker/config.hpp"
#include "tracker/http_gateway.hpp"
#include "tracker/tracker_service.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <memory>
#include <string>
#include <thread>

namespace {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

// Global flag for graceful shutdown
std::atomic<bool> g_running{true};

void signal_handler(int /*signum*/) {
    g_running = false;
}

void print_usage(const char* argv0) {
    std::fprintf(stderr,
                 "Usage: %s [--port N] [--address A] [--window-ms N] [--max-requests N]\n"
                 "          [--max-origins N] [--max-players N] [--ttl-sec N]\n"
                 "          [--lenient-numbers] [--stats-sec N] [--quiet]\n",
                 argv0);
}

void print_stats(const tracker::ServiceStats& stats, const tracker::HttpGateway& gateway) {
    std::fprintf(stderr, "\n--- Stats ---\n");
    std::fprintf(stderr, "Received:         %lu\n", stats.received);
    std::fprintf(stderr, "Accepted:         %lu\n", stats.accepted);
    std::fprintf(stderr, "Rate limited:     %lu\n", stats.rate_limited);
    std::fprintf(stderr, "Invalid:          %lu\n", stats.invalid);
    std::fprintf(stderr, "Internal errors:  %lu\n", gateway.internal_errors());
    std::fprintf(stderr, "Transport errors: %lu\n", gateway.transport_errors());
    std::fprintf(stderr, "Tracked origins:  %zu\n", stats.tracked_origins);
    std::fprintf(stderr, "Tracked players:  %zu\n", stats.tracked_players);
    std::fprintf(stderr, "-------------\n\n");
}

}  // namespace

int main(int argc, char* argv[]) {
    tracker::TrackerConfig config = tracker::kDefaultConfig;
    int stats_interval_sec = 10;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (std::strcmp(arg, "--lenient-numbers") == 0) {
            config.validation.numeric_mode = tracker::NumericMode::Lenient;
        } else if (std::strcmp(arg, "--quiet") == 0) {
            config.http.log_updates = false;
        } else if (std::strcmp(arg, "--port") == 0 && has_value) {
            config.http.port = static_cast<std::uint16_t>(std::atoi(argv[++i]));
        } else if (std::strcmp(arg, "--address") == 0 && has_value) {
            config.http.address = argv[++i];
        } else if (std::strcmp(arg, "--window-ms") == 0 && has_value) {
            config.rate_limiter.window = std::chrono::milliseconds(std::atoll(argv[++i]));
        } else if (std::strcmp(arg, "--max-requests") == 0 && has_value) {
            config.rate_limiter.max_requests = static_cast<std::uint32_t>(std::atol(argv[++i]));
        } else if (std::strcmp(arg, "--max-origins") == 0 && has_value) {
            config.rate_limiter.max_origins = static_cast<std::size_t>(std::atoll(argv[++i]));
        } else if (std::strcmp(arg, "--max-players") == 0 && has_value) {
            config.registry.max_entries = static_cast<std::size_t>(std::atoll(argv[++i]));
        } else if (std::strcmp(arg, "--ttl-sec") == 0 && has_value) {
            config.registry.record_ttl = std::chrono::seconds(std::atoll(argv[++i]));
        } else if (std::strcmp(arg, "--stats-sec") == 0 && has_value) {
            stats_interval_sec = std::atoi(argv[++i]);
        } else {
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    if (auto err = tracker::check_config(config); err != tracker::ConfigError::None) {
        auto msg = tracker::to_string(err);
        std::fprintf(stderr, "Invalid configuration: %.*s\n",
                     static_cast<int>(msg.size()), msg.data());
        return EXIT_FAILURE;
    }
    if (stats_interval_sec <= 0) {
        stats_interval_sec = 10;
    }

    // Set up signal handler
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Shared with connection threads, which may outlive the accept loop
    auto service = std::make_shared<tracker::TrackerService>(config);
    auto gateway = std::make_shared<tracker::HttpGateway>(*service, config.http);

    asio::io_context ioc;
    tcp::acceptor acceptor(ioc);
    try {
        auto address = asio::ip::make_address(std::string(config.http.address));
        tcp::endpoint endpoint(address, config.http.port);
        acceptor.open(endpoint.protocol());
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        acceptor.bind(endpoint);
        acceptor.listen();
        acceptor.non_blocking(true);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Failed to listen on %.*s:%u: %s\n",
                     static_cast<int>(config.http.address.size()),
                     config.http.address.data(), config.http.port, e.what());
        return EXIT_FAILURE;
    }

    std::fprintf(stderr, "Server running on http://%.*s:%u\n",
                 static_cast<int>(config.http.address.size()),
                 config.http.address.data(), config.http.port);
    std::fprintf(stderr, "Rate limit: %u requests per %lld ms per origin\n",
                 config.rate_limiter.max_requests,
                 static_cast<long long>(config.rate_limiter.window.count()));
    std::fprintf(stderr, "Press Ctrl+C to stop.\n\n");

    auto last_maintenance = std::chrono::steady_clock::now();
    auto last_stats_time = last_maintenance;

    // Main loop
    while (g_running) {
        tcp::socket socket(ioc);
        boost::system::error_code ec;
        acceptor.accept(socket, ec);

        if (ec == asio::error::would_block || ec == asio::error::try_again) {
            auto now = std::chrono::steady_clock::now();

            // Drop expired rate windows and stale players once a second
            if (now - last_maintenance >= std::chrono::seconds(1)) {
                auto swept = service->maintain();
                if (swept.players_expired > 0) {
                    std::fprintf(stderr, "Expired %zu stale players\n", swept.players_expired);
                }
                last_maintenance = now;
            }

            if (now - last_stats_time >= std::chrono::seconds(stats_interval_sec)) {
                print_stats(service->stats(), *gateway);
                last_stats_time = now;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }

        if (ec) {
            if (g_running) {
                std::fprintf(stderr, "Accept error: %s\n", ec.message().c_str());
            }
            continue;
        }

        // Connection threads use blocking reads bounded by SO_RCVTIMEO
        socket.non_blocking(false, ec);
        if (ec) {
            std::fprintf(stderr, "Failed to set blocking mode: %s\n", ec.message().c_str());
            continue;
        }

        std::thread([service, gateway, s = std::move(socket)]() mutable {
            gateway->serve_connection(std::move(s));
        }).detach();
    }

    std::fprintf(stderr, "\nShutting down...\n");
    print_stats(service->stats(), *gateway);

    acceptor.close();
    std::fprintf(stderr, "Goodbye.\n");
    return EXIT_SUCCESS;
}
