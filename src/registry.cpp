#include "tracker/registry.hpp"

#include "tracker/sanitize.hpp"

#include <iterator>

namespace tracker {

PlayerRegistry::PlayerRegistry(RegistryConfig config)
    : config_(config) {}

void PlayerRegistry::upsert(PlayerRecord record, const OriginId& origin, TimePoint now) {
    record.last_updated = now;
    PlayerKey key = key_of(record);

    auto it = index_.find(key);
    if (it != index_.end()) {
        // Existing key: overwrite and move to the back (most recent)
        Entry& entry = *it->second;
        entry.record = std::move(record);
        entry.origin = origin;
        entries_.splice(entries_.end(), entries_, it->second);
        ++total_updates_;
        return;
    }

    // New key: evict if at capacity
    if (entries_.size() >= config_.max_entries) {
        evict_oldest();
    }

    entries_.push_back(Entry{key, std::move(record), origin});
    index_.emplace(std::move(key), std::prev(entries_.end()));
    ++total_inserts_;
}

std::vector<PlayerRecord> PlayerRegistry::snapshot() const {
    std::vector<PlayerRecord> out;
    out.reserve(entries_.size());
    for (const Entry& entry : entries_) {
        out.push_back(sanitize(entry.record));
    }
    return out;
}

std::size_t PlayerRegistry::expire(TimePoint now, std::chrono::seconds ttl) {
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now - it->record.last_updated > ttl) {
            index_.erase(it->key);
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    expired_count_ += removed;
    return removed;
}

bool PlayerRegistry::contains(const PlayerKey& key) const {
    return index_.find(key) != index_.end();
}

const PlayerRecord* PlayerRegistry::find(const PlayerKey& key) const {
    auto it = index_.find(key);
    return it != index_.end() ? &it->second->record : nullptr;
}

const OriginId* PlayerRegistry::origin_of(const PlayerKey& key) const {
    auto it = index_.find(key);
    return it != index_.end() ? &it->second->origin : nullptr;
}

void PlayerRegistry::evict_oldest() {
    if (entries_.empty()) {
        return;
    }
    index_.erase(entries_.front().key);
    entries_.pop_front();
    ++eviction_count_;
}

}  // namespace tracker
