#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace tracker {

// Per-origin rate limiter configuration
// Fixed window counter plus bounded origin table
struct RateLimiterConfig {
    std::chrono::milliseconds window{10'000};  // window duration
    std::uint32_t max_requests = 20;           // admitted per window
    std::size_t max_origins = 4096;            // LRU table capacity
};

// How serverPlayers / maxPlayers are parsed
enum class NumericMode : std::uint8_t {
    Strict,   // whole value must be an integer
    // Leading integer prefix, trailing garbage ignored ("12abc" -> 12).
    // A prefix that does not fit in int64 is rejected, not clamped.
    Lenient,
};

struct ValidationConfig {
    NumericMode numeric_mode = NumericMode::Strict;
};

// Registry bounds
// record_ttl of zero keeps records until capacity eviction
struct RegistryConfig {
    std::size_t max_entries = 65536;
    std::chrono::seconds record_ttl{0};
};

// HTTP gateway configuration
struct HttpConfig {
    std::string_view address = "0.0.0.0";
    std::uint16_t port = 8080;
    std::size_t max_body_bytes = 100 * 1024;  // matches body-parser default
    std::chrono::seconds io_timeout{30};      // per-socket read/write timeout
    bool log_updates = true;
};

// Top-level tracker configuration
struct TrackerConfig {
    RateLimiterConfig rate_limiter;
    ValidationConfig validation;
    RegistryConfig registry;
    HttpConfig http;
};

inline constexpr TrackerConfig kDefaultConfig = {};

// First invalid setting found by check_config
enum class ConfigError : std::uint8_t {
    None,
    ZeroWindow,
    ZeroMaxRequests,
    ZeroMaxOrigins,
    ZeroMaxEntries,
    NegativeRecordTtl,
    ZeroMaxBodyBytes,
};

[[nodiscard]] ConfigError check_config(const TrackerConfig& config) noexcept;

// Human-readable name for a config error (static storage)
std::string_view to_string(ConfigError error) noexcept;

}  // namespace tracker
