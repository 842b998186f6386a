#pragma once

#include "tracker/clock.hpp"
#include "tracker/config.hpp"

#include <cstdint>
#include <list>
#include <unordered_map>

namespace tracker {

// Result of admission check
enum class Admit : std::uint8_t {
    Allow,   // Origin within its window budget
    Drop     // Origin exceeded max_requests in the current window
};

// Per-origin fixed window rate limiter with LRU eviction.
//
// Window semantics:
// - First request from an origin opens a window with count = 1
// - A request arriving more than `window` after the window start resets it
// - Otherwise the count is incremented; admitted iff count <= max_requests
// Rejected requests still count toward the window.
//
// Invariants enforced:
// - count >= 1 for every tracked origin
// - Tracked origins bounded by max_origins (LRU eviction)
//
// Thread safety: NOT thread-safe. External synchronization required.
class RateLimiter {
public:
    explicit RateLimiter(RateLimiterConfig config = {});

    // Count a request from this origin and decide admission.
    Admit admit(const OriginId& origin, TimePoint now);

    // Remove every window whose duration has elapsed at `now`.
    // Returns number of origins removed.
    std::size_t sweep(TimePoint now);

    // Current number of tracked origins
    [[nodiscard]] std::size_t tracked_count() const noexcept;

    // Check if an origin is currently tracked (for testing)
    [[nodiscard]] bool is_tracked(const OriginId& origin) const;

    // Request count in the origin's current window, 0 if untracked
    [[nodiscard]] std::uint32_t window_count(const OriginId& origin) const;

    [[nodiscard]] const RateLimiterConfig& config() const noexcept { return config_; }

    // Metrics
    [[nodiscard]] std::uint64_t total_admits() const noexcept { return total_admits_; }
    [[nodiscard]] std::uint64_t total_drops() const noexcept { return total_drops_; }
    [[nodiscard]] std::uint64_t eviction_count() const noexcept { return eviction_count_; }

private:
    struct Window {
        std::uint32_t count;
        TimePoint start;
    };

    // LRU list stores origins in access order (most recent at front)
    using LruList = std::list<OriginId>;
    using LruIterator = LruList::iterator;

    struct Entry {
        Window window;
        LruIterator lru_pos;
    };
    using OriginMap = std::unordered_map<OriginId, Entry>;

    [[nodiscard]] bool expired(const Window& window, TimePoint now) const noexcept;

    void evict_lru();

    RateLimiterConfig config_;
    OriginMap origins_;
    LruList lru_list_;

    // Metrics
    std::uint64_t total_admits_ = 0;
    std::uint64_t total_drops_ = 0;
    std::uint64_t eviction_count_ = 0;
};

}  // namespace tracker
