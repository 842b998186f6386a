#include "tracker/sanitize.hpp"

namespace tracker {

std::string escape_angle_brackets(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '<') {
            out += "&lt;";
        } else if (c == '>') {
            out += "&gt;";
        } else {
            out += c;
        }
    }
    return out;
}

FieldValue sanitize(const FieldValue& value) {
    if (value.kind != ValueKind::String) {
        return value;
    }
    return FieldValue{ValueKind::String, escape_angle_brackets(value.text)};
}

PlayerRecord sanitize(const PlayerRecord& record) {
    PlayerRecord out = record;
    out.player_name = sanitize(record.player_name);
    out.display_name = sanitize(record.display_name);
    out.game_name = sanitize(record.game_name);
    out.place_id = sanitize(record.place_id);
    out.job_id = sanitize(record.job_id);
    out.current_time = sanitize(record.current_time);
    out.country = sanitize(record.country);
    out.executor = sanitize(record.executor);
    out.version = sanitize(record.version);
    return out;
}

}  // namespace tracker
