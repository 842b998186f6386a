#include "tracker/snapshot_json.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace {

tracker::PlayerRecord make_record() {
    tracker::PlayerRecord r;
    r.player_name = tracker::string_value("A");
    r.display_name = tracker::string_value("Alpha \"Q\"");
    r.game_name = tracker::string_value("G\\1");
    r.server_players = 5;
    r.max_players = 10;
    r.place_id = tracker::FieldValue{tracker::ValueKind::Number, "123"};
    r.job_id = tracker::string_value("J");
    r.current_time = tracker::string_value("12:00");
    r.country = tracker::FieldValue{tracker::ValueKind::Null, "null"};
    r.executor = tracker::string_value("X\n");
    r.version = tracker::string_value("1.0");
    // 2024-01-19T18:40:00.250Z
    r.last_updated = tracker::TimePoint{} + std::chrono::milliseconds(1705689600250);
    return r;
}

}  // namespace

int main() {
    // Test 1: String escaping
    {
        std::string out;
        tracker::append_json_string(out, std::string("a\"b\\c\n\x01", 7));
        if (out != "\"a\\\"b\\\\c\\n\\u0001\"") {
            std::printf("Test 1 failed: got %s\n", out.c_str());
            return EXIT_FAILURE;
        }
    }

    // Test 2: ISO-8601 timestamps
    {
        if (tracker::format_iso8601(tracker::TimePoint{}) != "1970-01-01T00:00:00.000Z") {
            std::printf("Test 2 failed: epoch\n");
            return EXIT_FAILURE;
        }
        auto tp = tracker::TimePoint{} + std::chrono::milliseconds(1705689600250);
        if (tracker::format_iso8601(tp) != "2024-01-19T18:40:00.250Z") {
            std::printf("Test 2 failed: got %s\n", tracker::format_iso8601(tp).c_str());
            return EXIT_FAILURE;
        }
    }

    // Test 3: Record layout
    {
        std::string json = tracker::record_to_json(make_record());
        std::string expected =
            R"({"playerName":"A","displayName":"Alpha \"Q\"","gameName":"G\\1",)"
            R"("serverPlayers":5,"maxPlayers":10,"placeId":123,"jobId":"J",)"
            R"("currentTime":"12:00","country":null,"executor":"X\n","version":"1.0",)"
            R"("lastUpdated":"2024-01-19T18:40:00.250Z"})";
        if (json != expected) {
            std::printf("Test 3 failed:\n  got      %s\n  expected %s\n",
                        json.c_str(), expected.c_str());
            return EXIT_FAILURE;
        }
        if (json.find("\"ip\"") != std::string::npos ||
            json.find("origin") != std::string::npos) {
            std::printf("Test 3 failed: origin leaked\n");
            return EXIT_FAILURE;
        }
    }

    // Test 4: Arrays
    {
        if (tracker::snapshot_to_json({}) != "[]") {
            std::printf("Test 4 failed: empty snapshot\n");
            return EXIT_FAILURE;
        }
        auto record = make_record();
        std::string one = tracker::record_to_json(record);
        if (tracker::snapshot_to_json({record, record}) != "[" + one + "," + one + "]") {
            std::printf("Test 4 failed: two records\n");
            return EXIT_FAILURE;
        }
    }

    std::printf("All snapshot_json tests passed\n");
    return EXIT_SUCCESS;
}
