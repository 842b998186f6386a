#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tracker {

// ============================================================================
// Submission parsing: request body -> flat key/value mapping.
//
// Accepted bodies:
// - JSON object:  {"playerName":"A","serverPlayers":5,...}
// - Form encoded: playerName=A&serverPlayers=5&...
//
// Invariants enforced:
// 1. Memory: field count, key length and nesting depth bounded by
//    compile-time constants.
// 2. CPU: single pass over the input, no backtracking.
// ============================================================================

struct SubmissionLimits {
    static constexpr std::size_t kMaxInputBytes = 1024 * 1024;
    static constexpr std::size_t kMaxFields = 64;
    static constexpr std::size_t kMaxKeyLen = 256;
    static constexpr std::size_t kMaxNestingDepth = 16;
};

// JSON kind a value was submitted with.
// Form-encoded values are always String.
enum class ValueKind : std::uint8_t {
    String,
    Number,
    Bool,
    Null,
    Raw,     // nested object or array, kept as its JSON text
};

// A submitted value.
// For String, `text` is the decoded string; for every other kind it is the
// JSON literal exactly as submitted.
struct FieldValue {
    ValueKind kind = ValueKind::String;
    std::string text;

    bool operator==(const FieldValue&) const = default;
};

inline FieldValue string_value(std::string text) {
    return FieldValue{ValueKind::String, std::move(text)};
}

struct SubmissionField {
    std::string key;
    FieldValue value;
};

// Flat mapping of submitted fields in submission order.
// Setting an existing key replaces its value in place (last one wins).
class Submission {
public:
    void set(std::string key, FieldValue value);

    // Returns nullptr if the key is absent
    [[nodiscard]] const FieldValue* find(std::string_view key) const noexcept;

    [[nodiscard]] bool contains(std::string_view key) const noexcept {
        return find(key) != nullptr;
    }

    [[nodiscard]] std::size_t size() const noexcept { return fields_.size(); }
    [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }

    [[nodiscard]] const std::vector<SubmissionField>& fields() const noexcept {
        return fields_;
    }

private:
    std::vector<SubmissionField> fields_;
};

// Drop reasons for body parsing (explicit enum, not attacker-controlled)
enum class SubmissionDrop : std::uint8_t {
    InputTooLarge,    // Body exceeds kMaxInputBytes
    InvalidJson,      // Malformed JSON syntax
    NotAnObject,      // Top-level JSON value is not an object
    NestingTooDeep,   // Nested value exceeds kMaxNestingDepth
    TooManyFields,    // More than kMaxFields top-level keys
    KeyTooLong,       // Key exceeds kMaxKeyLen
};

using SubmissionResult = std::variant<Submission, SubmissionDrop>;

enum class BodyFormat : std::uint8_t {
    Json,
    Form,
    Unknown,  // parsed as an empty mapping
};

// Map a Content-Type header value to a body format.
// Media type comparison is case-insensitive; parameters are ignored.
BodyFormat body_format_from_content_type(std::string_view content_type) noexcept;

// Parse a JSON object body. Values keep their JSON kind.
SubmissionResult parse_json_submission(std::string_view body);

// Parse an application/x-www-form-urlencoded body.
// '+' decodes to space, %XX to the byte; malformed escapes stay literal.
SubmissionResult parse_form_submission(std::string_view body);

// Dispatch on format. Unknown yields an empty Submission.
SubmissionResult parse_submission(std::string_view body, BodyFormat format);

std::string_view to_string(SubmissionDrop reason) noexcept;

}  // namespace tracker
