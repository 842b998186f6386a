#pragma once

#include "tracker/config.hpp"
#include "tracker/player_record.hpp"
#include "tracker/submission.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

namespace tracker {

// ============================================================================
// Submission validation
//
// Invariants enforced:
// 1. Required fields: every key in kRequiredFields is present. Presence is
//    all that is checked; an empty string or null value is accepted.
// 2. Counters: serverPlayers and maxPlayers parse as integers under the
//    configured NumericMode. No range or consistency check.
// 3. The submission is never modified.
// ============================================================================

// Checked in this order; the first missing one is reported.
inline constexpr std::array<std::string_view, 11> kRequiredFields = {
    "playerName", "displayName", "gameName",
    "serverPlayers", "maxPlayers", "placeId",
    "jobId", "currentTime", "country", "executor", "version",
};

enum class ValidationDrop : std::uint8_t {
    MissingField,   // required key absent
    NotNumeric,     // serverPlayers / maxPlayers does not parse as integer
};

struct ValidationFailure {
    ValidationDrop reason;
    std::string_view field;  // points into kRequiredFields
};

// Validated submission: the original payload plus the parsed counters.
// Holds a pointer to the submission, which must outlive it.
struct ValidatedSubmission {
    const Submission* submission;
    std::int64_t server_players;
    std::int64_t max_players;
};

using ValidationResult = std::variant<ValidatedSubmission, ValidationFailure>;

// Contract:
// - CPU: O(required fields x submission fields), both bounded
// - Never allocates, never throws
ValidationResult validate_submission(
    const Submission& submission,
    const ValidationConfig& config = {}
) noexcept;

// Integer parse of a counter string.
//
// Lenient: optional leading whitespace, optional sign, then either a
// "0x"/"0X" prefixed hex run or a decimal run; parsing stops at the first
// character that does not belong to the run ("12abc" -> 12).
// Strict: the whole input must be an optional sign followed by decimal
// digits.
// Both modes fail when no digits are found or the value does not fit in
// std::int64_t.
std::optional<std::int64_t> parse_integer(std::string_view text, NumericMode mode) noexcept;

// Integer parse of a submitted value. Only String and Number kinds can
// parse. Strings go through parse_integer. Numbers are evaluated as JSON
// values ("1e3" -> 1000, "5.0" -> 5); a fractional value ("5.7") is
// truncated when lenient and rejected when strict. Non-finite or out of
// int64 range values fail.
std::optional<std::int64_t> parse_count(const FieldValue& value, NumericMode mode) noexcept;

// Build the record stored by the registry. last_updated is left unset.
PlayerRecord to_player_record(const ValidatedSubmission& validated);

std::string_view to_string(ValidationDrop reason) noexcept;

}  // namespace tracker
