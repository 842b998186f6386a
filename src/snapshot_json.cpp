#include "tracker/snapshot_json.hpp"

#include <cstdio>
#include <ctime>

namespace tracker {

namespace {

void append_value(std::string& out, const FieldValue& value) {
    if (value.kind == ValueKind::String) {
        append_json_string(out, value.text);
    } else {
        // Number, Bool, Null and Raw are stored as validated JSON text
        out += value.text;
    }
}

void append_member(std::string& out, std::string_view name, const FieldValue& value) {
    append_json_string(out, name);
    out += ':';
    append_value(out, value);
    out += ',';
}

void append_member(std::string& out, std::string_view name, std::int64_t value) {
    append_json_string(out, name);
    out += ':';
    out += std::to_string(value);
    out += ',';
}

}  // namespace

void append_json_string(std::string& out, std::string_view s) {
    static constexpr char kHex[] = "0123456789abcdef";

    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out += kHex[(c >> 4) & 0x0F];
                    out += kHex[c & 0x0F];
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

std::string format_iso8601(TimePoint tp) {
    auto since_epoch = tp.time_since_epoch();
    auto secs = std::chrono::floor<std::chrono::seconds>(since_epoch);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch - secs);

    std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm utc{};
    gmtime_r(&t, &utc);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec,
                  static_cast<int>(millis.count()));
    return buf;
}

std::string record_to_json(const PlayerRecord& record) {
    std::string json = "{";
    append_member(json, "playerName", record.player_name);
    append_member(json, "displayName", record.display_name);
    append_member(json, "gameName", record.game_name);
    append_member(json, "serverPlayers", record.server_players);
    append_member(json, "maxPlayers", record.max_players);
    append_member(json, "placeId", record.place_id);
    append_member(json, "jobId", record.job_id);
    append_member(json, "currentTime", record.current_time);
    append_member(json, "country", record.country);
    append_member(json, "executor", record.executor);
    append_member(json, "version", record.version);
    append_json_string(json, "lastUpdated");
    json += ':';
    append_json_string(json, format_iso8601(record.last_updated));
    json += '}';
    return json;
}

std::string snapshot_to_json(const std::vector<PlayerRecord>& records) {
    std::string json = "[";
    for (std::size_t i = 0; i < records.size(); ++i) {
        if (i > 0) {
            json += ',';
        }
        json += record_to_json(records[i]);
    }
    json += ']';
    return json;
}

}  // namespace tracker
