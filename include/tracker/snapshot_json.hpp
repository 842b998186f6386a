#pragma once

#include "tracker/clock.hpp"
#include "tracker/player_record.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace tracker {

// JSON rendering of exported records.
//
// Field order follows the submission schema, lastUpdated last:
//   {"playerName":..,"displayName":..,"gameName":..,"serverPlayers":5,
//    "maxPlayers":10,"placeId":..,"jobId":..,"currentTime":..,"country":..,
//    "executor":..,"version":..,"lastUpdated":"2024-01-19T18:40:00.000Z"}
//
// Records are written as given; callers pass an already sanitized snapshot.

// Append s as a JSON string literal (quotes included)
void append_json_string(std::string& out, std::string_view s);

// ISO-8601 UTC with millisecond precision
std::string format_iso8601(TimePoint tp);

std::string record_to_json(const PlayerRecord& record);

std::string snapshot_to_json(const std::vector<PlayerRecord>& records);

}  // namespace tracker
