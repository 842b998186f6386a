#include "tracker/validate_submission.hpp"

#include <charconv>
#include <cmath>
#include <limits>

namespace tracker {

namespace {

bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' ||
           c == '\v' || c == '\f';
}

bool is_decimal(char c) noexcept {
    return c >= '0' && c <= '9';
}

bool is_hex(char c) noexcept {
    return is_decimal(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

// Apply sign to a magnitude, failing when it does not fit in int64
std::optional<std::int64_t> signed_value(std::uint64_t magnitude, bool negative) noexcept {
    constexpr auto kMax = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    if (negative) {
        if (magnitude > kMax + 1) {
            return std::nullopt;
        }
        if (magnitude == kMax + 1) {
            return std::numeric_limits<std::int64_t>::min();
        }
        return -static_cast<std::int64_t>(magnitude);
    }
    if (magnitude > kMax) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(magnitude);
}

std::optional<std::uint64_t> parse_run(std::string_view digits, int base) noexcept {
    if (digits.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, base);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::int64_t> parse_lenient(std::string_view s) noexcept {
    std::size_t pos = 0;
    while (pos < s.size() && is_space(s[pos])) {
        ++pos;
    }

    bool negative = false;
    if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
        negative = s[pos] == '-';
        ++pos;
    }

    int base = 10;
    if (s.size() - pos >= 2 && s[pos] == '0' && (s[pos + 1] == 'x' || s[pos + 1] == 'X')) {
        base = 16;
        pos += 2;
    }

    std::size_t start = pos;
    while (pos < s.size() && (base == 16 ? is_hex(s[pos]) : is_decimal(s[pos]))) {
        ++pos;
    }

    auto magnitude = parse_run(s.substr(start, pos - start), base);
    if (!magnitude) {
        return std::nullopt;
    }
    return signed_value(*magnitude, negative);
}

std::optional<std::int64_t> parse_strict(std::string_view s) noexcept {
    bool negative = false;
    if (!s.empty() && (s.front() == '+' || s.front() == '-')) {
        negative = s.front() == '-';
        s.remove_prefix(1);
    }
    for (char c : s) {
        if (!is_decimal(c)) {
            return std::nullopt;
        }
    }
    auto magnitude = parse_run(s, 10);
    if (!magnitude) {
        return std::nullopt;
    }
    return signed_value(*magnitude, negative);
}

// JSON number literal evaluated as a value: "1e3" is 1000, "5.0" is 5.
// Strict requires an exact integer; lenient truncates toward zero.
std::optional<std::int64_t> parse_json_number(std::string_view literal, NumericMode mode) noexcept {
    // Plain integer literals stay exact beyond 2^53
    if (auto exact = parse_strict(literal)) {
        return exact;
    }

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(literal.data(), literal.data() + literal.size(), value);
    if (ec != std::errc{} || ptr != literal.data() + literal.size() || !std::isfinite(value)) {
        return std::nullopt;
    }

    double whole = std::trunc(value);
    if (mode == NumericMode::Strict && whole != value) {
        return std::nullopt;
    }

    // [-2^63, 2^63) is exactly representable as double bounds
    constexpr double kLow = -9223372036854775808.0;
    constexpr double kHigh = 9223372036854775808.0;
    if (whole < kLow || whole >= kHigh) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(whole);
}

constexpr std::string_view kServerPlayers = kRequiredFields[3];
constexpr std::string_view kMaxPlayers = kRequiredFields[4];

// Required fields are validated before this is called
const FieldValue& required(const Submission& submission, std::string_view key) {
    return *submission.find(key);
}

}  // namespace

std::optional<std::int64_t> parse_integer(std::string_view text, NumericMode mode) noexcept {
    return mode == NumericMode::Strict ? parse_strict(text) : parse_lenient(text);
}

std::optional<std::int64_t> parse_count(const FieldValue& value, NumericMode mode) noexcept {
    switch (value.kind) {
        case ValueKind::String:
            return parse_integer(value.text, mode);
        case ValueKind::Number:
            return parse_json_number(value.text, mode);
        case ValueKind::Bool:
        case ValueKind::Null:
        case ValueKind::Raw:
            break;
    }
    return std::nullopt;
}

ValidationResult validate_submission(
    const Submission& submission,
    const ValidationConfig& config
) noexcept {
    // =========================================================================
    // Required fields
    // =========================================================================

    for (std::string_view field : kRequiredFields) {
        if (!submission.contains(field)) {
            return ValidationFailure{ValidationDrop::MissingField, field};
        }
    }

    // =========================================================================
    // Counters
    // =========================================================================

    auto server_players = parse_count(*submission.find(kServerPlayers), config.numeric_mode);
    if (!server_players) {
        return ValidationFailure{ValidationDrop::NotNumeric, kServerPlayers};
    }

    auto max_players = parse_count(*submission.find(kMaxPlayers), config.numeric_mode);
    if (!max_players) {
        return ValidationFailure{ValidationDrop::NotNumeric, kMaxPlayers};
    }

    return ValidatedSubmission{
        .submission = &submission,
        .server_players = *server_players,
        .max_players = *max_players,
    };
}

PlayerRecord to_player_record(const ValidatedSubmission& validated) {
    const Submission& s = *validated.submission;

    PlayerRecord record;
    record.player_name = required(s, "playerName");
    record.display_name = required(s, "displayName");
    record.game_name = required(s, "gameName");
    record.server_players = validated.server_players;
    record.max_players = validated.max_players;
    record.place_id = required(s, "placeId");
    record.job_id = required(s, "jobId");
    record.current_time = required(s, "currentTime");
    record.country = required(s, "country");
    record.executor = required(s, "executor");
    record.version = required(s, "version");
    return record;
}

std::string_view to_string(ValidationDrop reason) noexcept {
    switch (reason) {
        case ValidationDrop::MissingField: return "missing field";
        case ValidationDrop::NotNumeric:   return "not numeric";
    }
    return "unknown";
}

}  // namespace tracker
