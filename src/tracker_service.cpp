#include "tracker/tracker_service.hpp"

#include <variant>

namespace tracker {

TrackerService::TrackerService(TrackerConfig config, Clock clock)
    : config_(config)
    , clock_(std::move(clock))
    , limiter_(config.rate_limiter)
    , registry_(config.registry) {}

SubmitResult TrackerService::submit(const OriginId& origin, std::string_view body,
                                    BodyFormat format) {
    ++received_;
    auto now = clock_();

    if (admit(origin, now) == Admit::Drop) {
        return reject_rate_limited();
    }

    auto parsed = parse_submission(body, format);
    if (const auto* drop = std::get_if<SubmissionDrop>(&parsed)) {
        ++invalid_;
        SubmitResult result;
        result.status = SubmitStatus::Invalid;
        result.reason = InvalidReason::MalformedBody;
        result.body_error = *drop;
        return result;
    }

    return accept(origin, std::get<Submission>(parsed), now);
}

std::vector<PlayerRecord> TrackerService::list() const {
    std::shared_lock lock(registry_mutex_);
    return registry_.snapshot();
}

MaintenanceResult TrackerService::maintain() {
    auto now = clock_();
    MaintenanceResult result;
    {
        std::lock_guard lock(limiter_mutex_);
        result.origins_swept = limiter_.sweep(now);
    }
    if (config_.registry.record_ttl.count() > 0) {
        std::unique_lock lock(registry_mutex_);
        result.players_expired = registry_.expire(now, config_.registry.record_ttl);
    }
    return result;
}

ServiceStats TrackerService::stats() const {
    ServiceStats s;
    s.received = received_.load();
    s.accepted = accepted_.load();
    s.rate_limited = rate_limited_.load();
    s.invalid = invalid_.load();
    {
        std::lock_guard lock(limiter_mutex_);
        s.tracked_origins = limiter_.tracked_count();
    }
    {
        std::shared_lock lock(registry_mutex_);
        s.tracked_players = registry_.size();
    }
    return s;
}

SubmitResult TrackerService::reject_rate_limited() {
    ++rate_limited_;
    SubmitResult result;
    result.status = SubmitStatus::RateLimited;
    return result;
}

SubmitResult TrackerService::accept(const OriginId& origin, const Submission& submission,
                                    TimePoint now) {
    auto validation = validate_submission(submission, config_.validation);
    if (const auto* failure = std::get_if<ValidationFailure>(&validation)) {
        ++invalid_;
        SubmitResult result;
        result.status = SubmitStatus::Invalid;
        result.reason = failure->reason == ValidationDrop::MissingField
                            ? InvalidReason::MissingField
                            : InvalidReason::NotNumeric;
        result.field = failure->field;
        return result;
    }

    // Build the record outside the lock; the critical section is the swap-in
    PlayerRecord record = to_player_record(std::get<ValidatedSubmission>(validation));

    SubmitResult result;
    result.status = SubmitStatus::Accepted;
    result.player_name = record.player_name.text;
    result.game_name = record.game_name.text;

    {
        std::unique_lock lock(registry_mutex_);
        registry_.upsert(std::move(record), origin, now);
    }

    ++accepted_;
    return result;
}

Admit TrackerService::admit(const OriginId& origin, TimePoint now) {
    std::lock_guard lock(limiter_mutex_);
    return limiter_.admit(origin, now);
}

std::string_view to_string(SubmitStatus status) noexcept {
    switch (status) {
        case SubmitStatus::Accepted:    return "accepted";
        case SubmitStatus::RateLimited: return "rate limited";
        case SubmitStatus::Invalid:     return "invalid";
    }
    return "unknown";
}

std::string_view to_string(InvalidReason reason) noexcept {
    switch (reason) {
        case InvalidReason::None:          return "none";
        case InvalidReason::MalformedBody: return "malformed body";
        case InvalidReason::MissingField:  return "missing field";
        case InvalidReason::NotNumeric:    return "not numeric";
    }
    return "unknown";
}

}  // namespace tracker
