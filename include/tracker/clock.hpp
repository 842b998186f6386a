#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace tracker {

// Wall clock: lastUpdated is exported, so it must be a calendar time
using TimePoint = std::chrono::system_clock::time_point;

// Clock abstraction for testing
// Default uses system_clock, tests can inject a fake clock
using Clock = std::function<TimePoint()>;

inline TimePoint default_clock() {
    return std::chrono::system_clock::now();
}

// Network identifier of a submitting client (peer IP address)
using OriginId = std::string;

}  // namespace tracker
