#include "tracker/validate_submission.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>
#include <variant>

namespace {

tracker::Submission complete_submission() {
    tracker::Submission s;
    s.set("playerName", tracker::string_value("A"));
    s.set("displayName", tracker::string_value("Alpha"));
    s.set("gameName", tracker::string_value("G"));
    s.set("serverPlayers", tracker::string_value("5"));
    s.set("maxPlayers", tracker::string_value("10"));
    s.set("placeId", tracker::string_value("1"));
    s.set("jobId", tracker::string_value("J"));
    s.set("currentTime", tracker::string_value("12:00"));
    s.set("country", tracker::string_value("US"));
    s.set("executor", tracker::string_value("X"));
    s.set("version", tracker::string_value("1.0"));
    return s;
}

tracker::Submission without(std::string_view key) {
    tracker::Submission full = complete_submission();
    tracker::Submission s;
    for (const auto& field : full.fields()) {
        if (field.key != key) {
            s.set(field.key, field.value);
        }
    }
    return s;
}

bool is_failure(const tracker::ValidationResult& r, tracker::ValidationDrop reason,
                std::string_view field) {
    if (const auto* f = std::get_if<tracker::ValidationFailure>(&r)) {
        return f->reason == reason && f->field == field;
    }
    return false;
}

bool test_complete_submission_accepted() {
    tracker::Submission s = complete_submission();
    auto r = tracker::validate_submission(s);
    const auto* v = std::get_if<tracker::ValidatedSubmission>(&r);
    if (v == nullptr) {
        std::printf("Expected complete submission to validate\n");
        return false;
    }
    if (v->server_players != 5 || v->max_players != 10 || v->submission != &s) {
        std::printf("Wrong validated counters\n");
        return false;
    }
    return true;
}

bool test_each_required_field_enforced() {
    for (std::string_view field : tracker::kRequiredFields) {
        tracker::Submission s = without(field);
        if (!is_failure(tracker::validate_submission(s),
                        tracker::ValidationDrop::MissingField, field)) {
            std::printf("Missing %.*s not reported\n",
                        static_cast<int>(field.size()), field.data());
            return false;
        }
    }
    return true;
}

bool test_first_missing_field_reported() {
    tracker::Submission s;
    s.set("version", tracker::string_value("1.0"));
    if (!is_failure(tracker::validate_submission(s),
                    tracker::ValidationDrop::MissingField, "playerName")) {
        return false;
    }
    return true;
}

bool test_presence_only() {
    // Empty strings and null are present values
    tracker::Submission s = complete_submission();
    s.set("displayName", tracker::string_value(""));
    s.set("country", tracker::FieldValue{tracker::ValueKind::Null, "null"});
    if (!std::holds_alternative<tracker::ValidatedSubmission>(tracker::validate_submission(s))) {
        std::printf("Empty or null values must count as present\n");
        return false;
    }
    return true;
}

bool test_non_numeric_counters() {
    tracker::Submission s = complete_submission();
    s.set("serverPlayers", tracker::string_value("abc"));
    if (!is_failure(tracker::validate_submission(s),
                    tracker::ValidationDrop::NotNumeric, "serverPlayers")) {
        std::printf("Expected NotNumeric for serverPlayers=abc\n");
        return false;
    }

    s = complete_submission();
    s.set("maxPlayers", tracker::string_value(""));
    if (!is_failure(tracker::validate_submission(s),
                    tracker::ValidationDrop::NotNumeric, "maxPlayers")) {
        std::printf("Expected NotNumeric for empty maxPlayers\n");
        return false;
    }

    s = complete_submission();
    s.set("maxPlayers", tracker::FieldValue{tracker::ValueKind::Bool, "true"});
    if (!is_failure(tracker::validate_submission(s),
                    tracker::ValidationDrop::NotNumeric, "maxPlayers")) {
        std::printf("Expected NotNumeric for boolean maxPlayers\n");
        return false;
    }
    return true;
}

bool test_lenient_and_strict_modes() {
    tracker::Submission s = complete_submission();
    s.set("serverPlayers", tracker::string_value("12abc"));

    // Strict by default
    if (!is_failure(tracker::validate_submission(s),
                    tracker::ValidationDrop::NotNumeric, "serverPlayers")) {
        std::printf("Strict mode should reject 12abc\n");
        return false;
    }

    tracker::ValidationConfig lenient_config{.numeric_mode = tracker::NumericMode::Lenient};
    auto lenient = tracker::validate_submission(s, lenient_config);
    const auto* v = std::get_if<tracker::ValidatedSubmission>(&lenient);
    if (v == nullptr || v->server_players != 12) {
        std::printf("Lenient mode should accept 12abc as 12\n");
        return false;
    }
    return true;
}

bool test_parse_integer() {
    using tracker::NumericMode;
    using tracker::parse_integer;

    if (parse_integer("  42", NumericMode::Lenient) != 42) return false;
    if (parse_integer("-7", NumericMode::Lenient) != -7) return false;
    if (parse_integer("+3", NumericMode::Strict) != 3) return false;
    if (parse_integer("0x1F", NumericMode::Lenient) != 31) return false;
    if (parse_integer("5.7", NumericMode::Lenient) != 5) return false;
    if (parse_integer("5.7", NumericMode::Strict).has_value()) return false;
    if (parse_integer(" 42", NumericMode::Strict).has_value()) return false;
    if (parse_integer("-", NumericMode::Lenient).has_value()) return false;
    if (parse_integer("0x", NumericMode::Lenient).has_value()) return false;

    // Overflow fails in both modes
    if (parse_integer("9223372036854775807", NumericMode::Strict) != INT64_MAX) return false;
    if (parse_integer("-9223372036854775808", NumericMode::Strict) != INT64_MIN) return false;
    if (parse_integer("9223372036854775808", NumericMode::Strict).has_value()) return false;
    if (parse_integer("99999999999999999999", NumericMode::Lenient).has_value()) return false;
    return true;
}

bool test_json_number_counters() {
    auto parsed = tracker::parse_json_submission(
        R"({"playerName":"A","displayName":"A","gameName":"G","serverPlayers":5,)"
        R"("maxPlayers":10,"placeId":1,"jobId":"J","currentTime":"t","country":"US",)"
        R"("executor":"X","version":"1"})");
    const auto* s = std::get_if<tracker::Submission>(&parsed);
    if (s == nullptr) {
        return false;
    }
    auto r = tracker::validate_submission(*s);
    const auto* v = std::get_if<tracker::ValidatedSubmission>(&r);
    if (v == nullptr || v->server_players != 5 || v->max_players != 10) {
        std::printf("JSON number counters should validate\n");
        return false;
    }

    tracker::PlayerRecord record = tracker::to_player_record(*v);
    if (record.place_id.kind != tracker::ValueKind::Number || record.place_id.text != "1") {
        std::printf("placeId kind should be preserved\n");
        return false;
    }

    // Numbers are evaluated as values, not read as integer text
    struct Case {
        const char* literal;
        bool strict_ok;
        std::int64_t strict_value;
        bool lenient_ok;
        std::int64_t lenient_value;
    };
    const Case cases[] = {
        {"1e3", true, 1000, true, 1000},
        {"2E1", true, 20, true, 20},
        {"5.0", true, 5, true, 5},
        {"-4e0", true, -4, true, -4},
        {"5.7", false, 0, true, 5},
        {"-5.7", false, 0, true, -5},
        {"1e400", false, 0, false, 0},
        {"1e19", false, 0, false, 0},
        {"9007199254740993", true, 9007199254740993, true, 9007199254740993},
    };
    tracker::ValidationConfig lenient_config{.numeric_mode = tracker::NumericMode::Lenient};
    for (const Case& c : cases) {
        auto body = std::string(R"({"playerName":"A","displayName":"A","gameName":"G",)") +
                    R"("serverPlayers":)" + c.literal +
                    R"(,"maxPlayers":10,"placeId":1,"jobId":"J","currentTime":"t",)"
                    R"("country":"US","executor":"X","version":"1"})";
        auto parsed_case = tracker::parse_json_submission(body);
        const auto* sub = std::get_if<tracker::Submission>(&parsed_case);
        if (sub == nullptr) {
            std::printf("Failed to parse body with serverPlayers=%s\n", c.literal);
            return false;
        }

        auto strict = tracker::validate_submission(*sub);
        const auto* sv = std::get_if<tracker::ValidatedSubmission>(&strict);
        if (c.strict_ok ? (sv == nullptr || sv->server_players != c.strict_value)
                        : !is_failure(strict, tracker::ValidationDrop::NotNumeric,
                                      "serverPlayers")) {
            std::printf("Strict serverPlayers=%s: unexpected result\n", c.literal);
            return false;
        }

        auto lenient = tracker::validate_submission(*sub, lenient_config);
        const auto* lv = std::get_if<tracker::ValidatedSubmission>(&lenient);
        if (c.lenient_ok ? (lv == nullptr || lv->server_players != c.lenient_value)
                         : !is_failure(lenient, tracker::ValidationDrop::NotNumeric,
                                       "serverPlayers")) {
            std::printf("Lenient serverPlayers=%s: unexpected result\n", c.literal);
            return false;
        }
    }
    return true;
}

bool test_submission_not_modified() {
    tracker::Submission s = complete_submission();
    s.set("serverPlayers", tracker::string_value(" 8 players"));
    tracker::ValidationConfig lenient_config{.numeric_mode = tracker::NumericMode::Lenient};
    auto r = tracker::validate_submission(s, lenient_config);
    if (!std::holds_alternative<tracker::ValidatedSubmission>(r)) {
        return false;
    }
    if (s.find("serverPlayers")->text != " 8 players") {
        std::printf("Validation must not rewrite submitted values\n");
        return false;
    }
    return true;
}

}  // namespace

int main() {
    if (!test_complete_submission_accepted()) {
        std::printf("test_complete_submission_accepted failed\n");
        return EXIT_FAILURE;
    }

    if (!test_each_required_field_enforced()) {
        std::printf("test_each_required_field_enforced failed\n");
        return EXIT_FAILURE;
    }

    if (!test_first_missing_field_reported()) {
        std::printf("test_first_missing_field_reported failed\n");
        return EXIT_FAILURE;
    }

    if (!test_presence_only()) {
        std::printf("test_presence_only failed\n");
        return EXIT_FAILURE;
    }

    if (!test_non_numeric_counters()) {
        std::printf("test_non_numeric_counters failed\n");
        return EXIT_FAILURE;
    }

    if (!test_lenient_and_strict_modes()) {
        std::printf("test_lenient_and_strict_modes failed\n");
        return EXIT_FAILURE;
    }

    if (!test_parse_integer()) {
        std::printf("test_parse_integer failed\n");
        return EXIT_FAILURE;
    }

    if (!test_json_number_counters()) {
        std::printf("test_json_number_counters failed\n");
        return EXIT_FAILURE;
    }

    if (!test_submission_not_modified()) {
        std::printf("test_submission_not_modified failed\n");
        return EXIT_FAILURE;
    }

    std::printf("All validate_submission tests passed\n");
    return EXIT_SUCCESS;
}
