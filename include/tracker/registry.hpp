#pragma once

#include "tracker/clock.hpp"
#include "tracker/config.hpp"
#include "tracker/player_record.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <list>
#include <unordered_map>
#include <vector>

namespace tracker {

// ============================================================================
// PlayerRegistry
//
// Keyed upsert store: (playerName, jobId) -> latest record + origin.
//
// Invariants enforced:
// - At most one entry per PlayerKey; upsert replaces every field in place
// - last_updated is always set by the registry, never by the reporter
// - Stored records are raw; only snapshot() output is sanitized
// - Entry count bounded by max_entries (least recently updated evicted)
//
// Thread safety: NOT thread-safe. External synchronization required.
// ============================================================================

class PlayerRegistry {
public:
    explicit PlayerRegistry(RegistryConfig config = {});

    // Insert or overwrite the entry for key_of(record).
    // Sets last_updated = now and remembers origin.
    void upsert(PlayerRecord record, const OriginId& origin, TimePoint now);

    // Sanitized copy of every record, least recently updated first.
    // Origins are not part of PlayerRecord and never appear here.
    [[nodiscard]] std::vector<PlayerRecord> snapshot() const;

    // Remove entries not updated for longer than ttl.
    // Returns number of entries removed.
    std::size_t expire(TimePoint now, std::chrono::seconds ttl);

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] bool contains(const PlayerKey& key) const;

    // Raw stored record (unsanitized), nullptr if absent
    [[nodiscard]] const PlayerRecord* find(const PlayerKey& key) const;

    // Origin of the last submission for key, nullptr if absent
    [[nodiscard]] const OriginId* origin_of(const PlayerKey& key) const;

    // Metrics
    [[nodiscard]] std::uint64_t total_inserts() const noexcept { return total_inserts_; }
    [[nodiscard]] std::uint64_t total_updates() const noexcept { return total_updates_; }
    [[nodiscard]] std::uint64_t eviction_count() const noexcept { return eviction_count_; }
    [[nodiscard]] std::uint64_t expired_count() const noexcept { return expired_count_; }

private:
    struct Entry {
        PlayerKey key;
        PlayerRecord record;
        OriginId origin;
    };

    // Entries in update order (least recently updated at front)
    using EntryList = std::list<Entry>;
    using EntryMap = std::unordered_map<PlayerKey, EntryList::iterator>;

    void evict_oldest();

    RegistryConfig config_;
    EntryList entries_;
    EntryMap index_;

    // Metrics
    std::uint64_t total_inserts_ = 0;
    std::uint64_t total_updates_ = 0;
    std::uint64_t eviction_count_ = 0;
    std::uint64_t expired_count_ = 0;
};

}  // namespace tracker
