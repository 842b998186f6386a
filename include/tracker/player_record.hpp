#pragma once

#include "tracker/clock.hpp"
#include "tracker/submission.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace tracker {

// Identity of a tracked record: (playerName, jobId)
struct PlayerKey {
    std::string player_name;
    std::string job_id;

    bool operator==(const PlayerKey& other) const noexcept = default;
};

}  // namespace tracker

// Hash specialization for PlayerKey
template <>
struct std::hash<tracker::PlayerKey> {
    std::size_t operator()(const tracker::PlayerKey& k) const noexcept {
        std::size_t h = std::hash<std::string>{}(k.player_name);
        // boost::hash_combine mixing
        h ^= std::hash<std::string>{}(k.job_id) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

namespace tracker {

// One reporter's latest self-reported status.
//
// Reporter-supplied fields keep the JSON kind they were submitted with, so
// that export reproduces them; the two population counters are parsed.
// The submitting origin is kept by the registry entry, not here.
struct PlayerRecord {
    FieldValue player_name;
    FieldValue display_name;
    FieldValue game_name;
    std::int64_t server_players = 0;
    std::int64_t max_players = 0;
    FieldValue place_id;
    FieldValue job_id;
    FieldValue current_time;
    FieldValue country;
    FieldValue executor;
    FieldValue version;
    TimePoint last_updated{};  // set by the registry on upsert

    bool operator==(const PlayerRecord&) const = default;
};

// Identity uses each value's text: the decoded string for String kind,
// the literal JSON text otherwise. Non-string identities are not
// normalized, so {"a":1} and { "a":1 } are different players.
inline PlayerKey key_of(const PlayerRecord& record) {
    return PlayerKey{record.player_name.text, record.job_id.text};
}

}  // namespace tracker
