#pragma once

#include "tracker/clock.hpp"
#include "tracker/config.hpp"
#include "tracker/player_record.hpp"
#include "tracker/rate_limiter.hpp"
#include "tracker/registry.hpp"
#include "tracker/submission.hpp"
#include "tracker/validate_submission.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace tracker {

// ============================================================================
// TrackerService
//
// Single owner of all mutable tracker state. Runs the submission pipeline:
//
//   RateLimiter.admit -> parse body -> validate -> Registry.upsert
//
// and serves sanitized snapshots.
//
// Thread safety: safe for concurrent use.
// - Every admit is serialized on the limiter mutex
// - upsert/expire hold the registry mutex exclusively, snapshots share it,
//   so a reader never observes a partially written record
// ============================================================================

enum class SubmitStatus : std::uint8_t {
    Accepted,
    RateLimited,
    Invalid,
};

enum class InvalidReason : std::uint8_t {
    None,
    MalformedBody,  // body failed to parse (see body_error)
    MissingField,   // see field
    NotNumeric,     // see field
};

struct SubmitResult {
    SubmitStatus status = SubmitStatus::Accepted;
    InvalidReason reason = InvalidReason::None;
    SubmissionDrop body_error{};     // valid when reason == MalformedBody
    std::string_view field;          // valid for MissingField / NotNumeric
    std::string player_name;         // set when Accepted
    std::string game_name;           // set when Accepted
};

struct ServiceStats {
    std::uint64_t received = 0;
    std::uint64_t accepted = 0;
    std::uint64_t rate_limited = 0;
    std::uint64_t invalid = 0;
    std::size_t tracked_origins = 0;
    std::size_t tracked_players = 0;
};

struct MaintenanceResult {
    std::size_t origins_swept = 0;
    std::size_t players_expired = 0;
};

class TrackerService {
public:
    explicit TrackerService(TrackerConfig config = {}, Clock clock = default_clock);

    TrackerService(const TrackerService&) = delete;
    TrackerService& operator=(const TrackerService&) = delete;

    // Full pipeline from a raw request body.
    // The origin is charged before the body is looked at.
    SubmitResult submit(const OriginId& origin, std::string_view body, BodyFormat format);

    // Sanitized snapshot of every record.
    [[nodiscard]] std::vector<PlayerRecord> list() const;

    // Drop expired rate windows, and records older than the configured TTL
    // when one is set. Call periodically.
    MaintenanceResult maintain();

    [[nodiscard]] ServiceStats stats() const;

    [[nodiscard]] const TrackerConfig& config() const noexcept { return config_; }

private:
    SubmitResult reject_rate_limited();
    SubmitResult accept(const OriginId& origin, const Submission& submission, TimePoint now);

    Admit admit(const OriginId& origin, TimePoint now);

    TrackerConfig config_;
    Clock clock_;

    mutable std::mutex limiter_mutex_;
    RateLimiter limiter_;

    mutable std::shared_mutex registry_mutex_;
    PlayerRegistry registry_;

    std::atomic<std::uint64_t> received_{0};
    std::atomic<std::uint64_t> accepted_{0};
    std::atomic<std::uint64_t> rate_limited_{0};
    std::atomic<std::uint64_t> invalid_{0};
};

std::string_view to_string(SubmitStatus status) noexcept;
std::string_view to_string(InvalidReason reason) noexcept;

}  // namespace tracker
