// Report Generator Demo
//
// Simulates several game clients reporting their status to the tracker.
//
// Usage:
//   ./report_generator [host] [port] [--burst]
//
// Options:
//   host    - Target host (default: 127.0.0.1)
//   port    - Target port (default: 8080)
//   --burst - Enable burst mode (rate limit bursts, malformed and
//             incomplete reports)

#include <utility>  // std::exchange, needed by boost/asio/awaitable.hpp

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <exception>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

std::atomic<bool> g_running{true};

void signal_handler(int /*signum*/) {
    g_running = false;
}

// Simple random number generator
class Random {
public:
    Random() : gen_(std::random_device{}()) {}

    int range(int min, int max) {
        std::uniform_int_distribution<int> dist(min, max);
        return dist(gen_);
    }

    double uniform() {
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return dist(gen_);
    }

    template<typename T>
    const T& pick(const std::vector<T>& vec) {
        return vec[range(0, static_cast<int>(vec.size()) - 1)];
    }

private:
    std::mt19937 gen_;
};

const std::vector<std::string> PLAYERS = {
    "builderman", "noob_slayer", "cookie_cutter", "PixelPanda",
    "ghost_walker", "tofu_knight", "LavaLamp", "sprint_queen",
};

const std::vector<std::string> GAMES = {
    "Tower Defense", "Obby Rush", "Pet Farm", "Racing Legends",
};

const std::vector<std::string> COUNTRIES = {
    "US", "DE", "BR", "JP", "PL", "FR",
};

const std::vector<std::string> EXECUTORS = {
    "alpha", "beta", "gamma",
};

struct Stats {
    std::uint64_t sent = 0;
    std::uint64_t accepted = 0;        // 200
    std::uint64_t rate_limited = 0;    // 429
    std::uint64_t rejected = 0;        // 400
    std::uint64_t other_status = 0;
    std::uint64_t errors = 0;          // transport failures
};

// Simulated client session: a fixed player on a fixed server
struct Reporter {
    std::string player_name;
    std::string game_name;
    std::string place_id;
    std::string job_id;
    std::string country;
    std::string executor;
    int server_players;
    int max_players;
};

std::string current_time_string() {
    std::time_t t = std::time(nullptr);
    std::tm local{};
    localtime_r(&t, &local);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &local);
    return buf;
}

std::string make_job_id(Random& rng) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string id;
    for (int i = 0; i < 32; ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20) id += '-';
        id += kHex[rng.range(0, 15)];
    }
    return id;
}

Reporter make_reporter(Random& rng, const std::string& name) {
    Reporter r;
    r.player_name = name;
    r.game_name = rng.pick(GAMES);
    r.place_id = std::to_string(rng.range(1000000, 9999999));
    r.job_id = make_job_id(rng);
    r.country = rng.pick(COUNTRIES);
    r.executor = rng.pick(EXECUTORS);
    r.max_players = rng.range(8, 50);
    r.server_players = rng.range(1, r.max_players);
    return r;
}

// Full, valid status report
std::string make_report_json(const Reporter& r) {
    std::string json = "{";
    json += "\"playerName\":\"" + r.player_name + "\",";
    json += "\"displayName\":\"" + r.player_name + "\",";
    json += "\"gameName\":\"" + r.game_name + "\",";
    json += "\"serverPlayers\":\"" + std::to_string(r.server_players) + "\",";
    json += "\"maxPlayers\":\"" + std::to_string(r.max_players) + "\",";
    json += "\"placeId\":\"" + r.place_id + "\",";
    json += "\"jobId\":\"" + r.job_id + "\",";
    json += "\"currentTime\":\"" + current_time_string() + "\",";
    json += "\"country\":\"" + r.country + "\",";
    json += "\"executor\":\"" + r.executor + "\",";
    json += "\"version\":\"1.0.0\"";
    json += "}";
    return json;
}

// ============================================================================
// Burst mode: problematic reports
// ============================================================================

// Missing jobId and version
std::string make_incomplete_report(const Reporter& r) {
    return "{\"playerName\":\"" + r.player_name + "\",\"gameName\":\"" + r.game_name + "\"}";
}

// Non-numeric population counter
std::string make_non_numeric_report(const Reporter& r) {
    std::string json = make_report_json(r);
    auto pos = json.find("\"serverPlayers\":\"");
    if (pos != std::string::npos) {
        json.replace(pos, std::strlen("\"serverPlayers\":\"") +
                              std::to_string(r.server_players).size() + 1,
                     "\"serverPlayers\":\"lots\"");
    }
    return json;
}

// Markup in a display name (exported escaped)
std::string make_markup_report(Reporter r) {
    r.player_name = "<b>" + r.player_name + "</b>";
    return make_report_json(r);
}

std::string make_bad_json() {
    return "{\"playerName\":\"broken\",";
}

// POST one body; returns the HTTP status or 0 on transport failure
unsigned post_report(asio::io_context& ioc, const tcp::resolver::results_type& endpoints,
                     const std::string& host, const std::string& body) {
    beast::tcp_stream stream(ioc);
    beast::error_code ec;

    stream.connect(endpoints, ec);
    if (ec) {
        return 0;
    }

    http::request<http::string_body> req{http::verb::post, "/server/api/player", 11};
    req.set(http::field::host, host);
    req.set(http::field::content_type, "application/json");
    req.body() = body;
    req.prepare_payload();

    http::write(stream, req, ec);
    if (ec) {
        return 0;
    }

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res, ec);
    if (ec) {
        return 0;
    }

    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    return static_cast<unsigned>(res.result_int());
}

void record_status(Stats& stats, unsigned status) {
    ++stats.sent;
    switch (status) {
        case 0:   ++stats.errors; break;
        case 200: ++stats.accepted; break;
        case 400: ++stats.rejected; break;
        case 429: ++stats.rate_limited; break;
        default:  ++stats.other_status; break;
    }
}

void print_stats(const Stats& stats) {
    std::fprintf(stderr, "Sent: %lu | 200: %lu | 429: %lu | 400: %lu | other: %lu | errors: %lu\n",
                 stats.sent, stats.accepted, stats.rate_limited, stats.rejected,
                 stats.other_status, stats.errors);
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string host = "127.0.0.1";
    std::string port = "8080";
    bool burst_mode = false;

    int positional = 0;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--burst") == 0) {
            burst_mode = true;
        } else if (positional == 0) {
            host = argv[i];
            ++positional;
        } else {
            port = argv[i];
            ++positional;
        }
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    asio::io_context ioc;
    tcp::resolver::results_type endpoints;
    try {
        tcp::resolver resolver(ioc);
        endpoints = resolver.resolve(host, port);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Failed to resolve %s:%s: %s\n", host.c_str(), port.c_str(), e.what());
        return EXIT_FAILURE;
    }

    std::fprintf(stderr, "Reporting to http://%s:%s%s\n", host.c_str(), port.c_str(),
                 burst_mode ? " (burst mode)" : "");

    Random rng;
    std::vector<Reporter> reporters;
    for (const auto& name : PLAYERS) {
        reporters.push_back(make_reporter(rng, name));
    }

    Stats stats;
    auto last_stats_time = std::chrono::steady_clock::now();

    while (g_running) {
        Reporter& reporter = reporters[rng.range(0, static_cast<int>(reporters.size()) - 1)];

        // Population drifts between reports
        reporter.server_players += rng.range(-1, 1);
        if (reporter.server_players < 1) reporter.server_players = 1;
        if (reporter.server_players > reporter.max_players) {
            reporter.server_players = reporter.max_players;
        }

        std::string body;
        if (burst_mode && rng.uniform() < 0.2) {
            switch (rng.range(0, 3)) {
                case 0: body = make_incomplete_report(reporter); break;
                case 1: body = make_non_numeric_report(reporter); break;
                case 2: body = make_markup_report(reporter); break;
                case 3: body = make_bad_json(); break;
            }
        } else {
            body = make_report_json(reporter);
        }

        record_status(stats, post_report(ioc, endpoints, host, body));

        // In burst mode, occasionally exceed the per-origin budget
        if (burst_mode && rng.uniform() < 0.05) {
            std::fprintf(stderr, "[BURST] Sending 30 reports for %s\n",
                         reporter.player_name.c_str());
            for (int i = 0; i < 30 && g_running; ++i) {
                record_status(stats, post_report(ioc, endpoints, host,
                                                 make_report_json(reporter)));
            }
        }

        auto now = std::chrono::steady_clock::now();
        if (now - last_stats_time >= std::chrono::seconds(1)) {
            print_stats(stats);
            last_stats_time = now;
        }

        // Roughly the tracker's default budget: 20 requests per 10 s
        int delay_ms = burst_mode ? rng.range(50, 200) : rng.range(400, 700);
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    }

    std::fprintf(stderr, "\nShutting down...\n");
    print_stats(stats);
    return EXIT_SUCCESS;
}
