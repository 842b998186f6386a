#pragma once

#include "tracker/player_record.hpp"

#include <string>
#include <string_view>

namespace tracker {

// Export-time HTML neutralization.
// Replaces '<' with "&lt;" and '>' with "&gt;". Nothing else is escaped.
std::string escape_angle_brackets(std::string_view text);

// String-kind values are escaped; other kinds pass through unchanged.
FieldValue sanitize(const FieldValue& value);

// Returns a sanitized copy; the input is never modified.
PlayerRecord sanitize(const PlayerRecord& record);

}  // namespace tracker
