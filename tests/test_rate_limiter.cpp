#include "tracker/rate_limiter.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace {

using namespace std::chrono_literals;

// Fixed starting point; the limiter only looks at differences
const tracker::TimePoint kStart = tracker::TimePoint{} + std::chrono::hours(24 * 365 * 50);

tracker::RateLimiterConfig make_config(std::size_t max_origins = 16) {
    return tracker::RateLimiterConfig{
        .window = 10'000ms,
        .max_requests = 20,
        .max_origins = max_origins
    };
}

bool test_twenty_first_request_dropped() {
    tracker::RateLimiter limiter(make_config());
    const tracker::OriginId origin = "203.0.113.7";

    for (int i = 0; i < 20; ++i) {
        if (limiter.admit(origin, kStart + std::chrono::milliseconds(i * 100)) !=
            tracker::Admit::Allow) {
            std::printf("Expected Allow at i=%d\n", i);
            return false;
        }
    }

    if (limiter.admit(origin, kStart + 2500ms) != tracker::Admit::Drop) {
        std::printf("Expected Drop for request 21\n");
        return false;
    }
    return true;
}

bool test_window_resets_after_duration() {
    tracker::RateLimiter limiter(make_config());
    const tracker::OriginId origin = "203.0.113.7";

    for (int i = 0; i < 25; ++i) {
        limiter.admit(origin, kStart);
    }
    if (limiter.admit(origin, kStart + 5s) != tracker::Admit::Drop) {
        std::printf("Expected Drop inside the window\n");
        return false;
    }

    // Exactly `window` after the start is still inside it
    if (limiter.admit(origin, kStart + 10'000ms) != tracker::Admit::Drop) {
        std::printf("Expected Drop at the window boundary\n");
        return false;
    }

    if (limiter.admit(origin, kStart + 10'001ms) != tracker::Admit::Allow) {
        std::printf("Expected Allow after the window elapsed\n");
        return false;
    }
    if (limiter.window_count(origin) != 1) {
        std::printf("Expected window count 1 after reset, got %u\n",
                    limiter.window_count(origin));
        return false;
    }
    return true;
}

bool test_rejected_requests_still_count() {
    tracker::RateLimiter limiter(make_config());
    const tracker::OriginId origin = "198.51.100.1";

    for (int i = 0; i < 30; ++i) {
        limiter.admit(origin, kStart + std::chrono::milliseconds(i));
    }
    if (limiter.window_count(origin) != 30) {
        std::printf("Expected count 30, got %u\n", limiter.window_count(origin));
        return false;
    }
    if (limiter.total_admits() != 20 || limiter.total_drops() != 10) {
        std::printf("Expected 20 admits / 10 drops, got %lu / %lu\n",
                    limiter.total_admits(), limiter.total_drops());
        return false;
    }
    return true;
}

bool test_origins_are_independent() {
    tracker::RateLimiter limiter(make_config());

    for (int i = 0; i < 20; ++i) {
        limiter.admit("10.0.0.1", kStart);
    }
    if (limiter.admit("10.0.0.1", kStart) != tracker::Admit::Drop) {
        return false;
    }
    if (limiter.admit("10.0.0.2", kStart) != tracker::Admit::Allow) {
        std::printf("Second origin must not share the first one's budget\n");
        return false;
    }
    return true;
}

bool test_lru_eviction() {
    tracker::RateLimiter limiter(make_config(3));

    limiter.admit("a", kStart);
    limiter.admit("b", kStart);
    limiter.admit("c", kStart);

    // Touch "a" so "b" becomes least recently used
    limiter.admit("a", kStart + 1ms);
    limiter.admit("d", kStart + 2ms);

    if (limiter.tracked_count() != 3) {
        std::printf("Expected 3 tracked origins, got %zu\n", limiter.tracked_count());
        return false;
    }
    if (limiter.is_tracked("b")) {
        std::printf("Expected b to be evicted\n");
        return false;
    }
    if (!limiter.is_tracked("a") || !limiter.is_tracked("c") || !limiter.is_tracked("d")) {
        return false;
    }
    if (limiter.eviction_count() != 1) {
        return false;
    }
    return true;
}

bool test_sweep_removes_expired_windows() {
    tracker::RateLimiter limiter(make_config());

    limiter.admit("old", kStart);
    limiter.admit("fresh", kStart + 9s);

    std::size_t removed = limiter.sweep(kStart + 11s);
    if (removed != 1) {
        std::printf("Expected 1 swept origin, got %zu\n", removed);
        return false;
    }
    if (limiter.is_tracked("old") || !limiter.is_tracked("fresh")) {
        return false;
    }

    // Swept origin starts over with a fresh window
    if (limiter.admit("old", kStart + 11s) != tracker::Admit::Allow ||
        limiter.window_count("old") != 1) {
        return false;
    }
    return true;
}

bool test_clock_regression() {
    tracker::RateLimiter limiter(make_config());
    const tracker::OriginId origin = "192.0.2.55";

    for (int i = 0; i < 20; ++i) {
        limiter.admit(origin, kStart);
    }

    // Clock jumps backwards: window must not reset
    if (limiter.admit(origin, kStart - 1h) != tracker::Admit::Drop) {
        std::printf("Clock regression must not reset the window\n");
        return false;
    }
    if (limiter.sweep(kStart - 1h) != 0) {
        return false;
    }
    return true;
}

bool test_bounded_state_growth() {
    tracker::RateLimiter limiter(make_config(100));

    for (int i = 0; i < 10'000; ++i) {
        limiter.admit("origin-" + std::to_string(i), kStart);
    }
    if (limiter.tracked_count() > 100) {
        std::printf("Tracked origins exceeded capacity: %zu\n", limiter.tracked_count());
        return false;
    }
    if (limiter.eviction_count() != 9'900) {
        return false;
    }
    return true;
}

}  // namespace

int main() {
    if (!test_twenty_first_request_dropped()) {
        std::printf("test_twenty_first_request_dropped failed\n");
        return EXIT_FAILURE;
    }

    if (!test_window_resets_after_duration()) {
        std::printf("test_window_resets_after_duration failed\n");
        return EXIT_FAILURE;
    }

    if (!test_rejected_requests_still_count()) {
        std::printf("test_rejected_requests_still_count failed\n");
        return EXIT_FAILURE;
    }

    if (!test_origins_are_independent()) {
        std::printf("test_origins_are_independent failed\n");
        return EXIT_FAILURE;
    }

    if (!test_lru_eviction()) {
        std::printf("test_lru_eviction failed\n");
        return EXIT_FAILURE;
    }

    if (!test_sweep_removes_expired_windows()) {
        std::printf("test_sweep_removes_expired_windows failed\n");
        return EXIT_FAILURE;
    }

    if (!test_clock_regression()) {
        std::printf("test_clock_regression failed\n");
        return EXIT_FAILURE;
    }

    if (!test_bounded_state_growth()) {
        std::printf("test_bounded_state_growth failed\n");
        return EXIT_FAILURE;
    }

    std::printf("All rate_limiter tests passed\n");
    return EXIT_SUCCESS;
}
