#include "tracker/config.hpp"

namespace tracker {

ConfigError check_config(const TrackerConfig& config) noexcept {
    if (config.rate_limiter.window.count() <= 0) {
        return ConfigError::ZeroWindow;
    }
    if (config.rate_limiter.max_requests == 0) {
        return ConfigError::ZeroMaxRequests;
    }
    if (config.rate_limiter.max_origins == 0) {
        return ConfigError::ZeroMaxOrigins;
    }
    if (config.registry.max_entries == 0) {
        return ConfigError::ZeroMaxEntries;
    }
    if (config.registry.record_ttl.count() < 0) {
        return ConfigError::NegativeRecordTtl;
    }
    if (config.http.max_body_bytes == 0) {
        return ConfigError::ZeroMaxBodyBytes;
    }
    return ConfigError::None;
}

std::string_view to_string(ConfigError error) noexcept {
    switch (error) {
        case ConfigError::None:              return "ok";
        case ConfigError::ZeroWindow:        return "rate limit window must be positive";
        case ConfigError::ZeroMaxRequests:   return "max requests per window must be positive";
        case ConfigError::ZeroMaxOrigins:    return "max tracked origins must be positive";
        case ConfigError::ZeroMaxEntries:    return "max tracked players must be positive";
        case ConfigError::NegativeRecordTtl: return "record ttl must not be negative";
        case ConfigError::ZeroMaxBodyBytes:  return "max body size must be positive";
    }
    return "unknown";
}

}  // namespace tracker
