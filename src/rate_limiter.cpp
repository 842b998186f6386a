#include "tracker/rate_limiter.hpp"

#include <limits>

namespace tracker {

RateLimiter::RateLimiter(RateLimiterConfig config)
    : config_(config) {}

Admit RateLimiter::admit(const OriginId& origin, TimePoint now) {
    auto it = origins_.find(origin);
    if (it == origins_.end()) {
        // New origin: evict if at capacity
        if (origins_.size() >= config_.max_origins) {
            evict_lru();
        }

        lru_list_.push_front(origin);
        Entry entry{
            .window = Window{.count = 1, .start = now},
            .lru_pos = lru_list_.begin()
        };
        origins_.emplace(origin, entry);
        ++total_admits_;
        return Admit::Allow;
    }

    // Existing origin: move to front of LRU
    lru_list_.splice(lru_list_.begin(), lru_list_, it->second.lru_pos);

    Window& window = it->second.window;
    if (expired(window, now)) {
        window.count = 1;
        window.start = now;
        ++total_admits_;
        return Admit::Allow;
    }

    // Saturate so a flooding origin cannot wrap back under the limit
    if (window.count < std::numeric_limits<std::uint32_t>::max()) {
        ++window.count;
    }

    if (window.count <= config_.max_requests) {
        ++total_admits_;
        return Admit::Allow;
    }

    ++total_drops_;
    return Admit::Drop;
}

std::size_t RateLimiter::sweep(TimePoint now) {
    std::size_t removed = 0;
    for (auto it = origins_.begin(); it != origins_.end();) {
        if (expired(it->second.window, now)) {
            lru_list_.erase(it->second.lru_pos);
            it = origins_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

bool RateLimiter::expired(const Window& window, TimePoint now) const noexcept {
    // Strictly greater: a request exactly `window` after the start still counts.
    // A clock running backwards yields a negative elapsed time and never resets.
    return now - window.start > config_.window;
}

void RateLimiter::evict_lru() {
    if (lru_list_.empty()) {
        return;
    }
    // Remove least recently used (back of list)
    const OriginId& victim = lru_list_.back();
    origins_.erase(victim);
    lru_list_.pop_back();
    ++eviction_count_;
}

std::size_t RateLimiter::tracked_count() const noexcept {
    return origins_.size();
}

bool RateLimiter::is_tracked(const OriginId& origin) const {
    return origins_.find(origin) != origins_.end();
}

std::uint32_t RateLimiter::window_count(const OriginId& origin) const {
    auto it = origins_.find(origin);
    return it != origins_.end() ? it->second.window.count : 0;
}

}  // namespace tracker
