#pragma once

#include <optional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace orderguard {
namespace safety {

enum class SafetyKind { KILL_SWITCH, CIRCUIT_BREAKER };
enum class SafetyStatus { SAFE, UNSAFE, TRANSITIONAL };

inline const char* safetyChannel(SafetyKind kind) {
    return (kind == SafetyKind::KILL_SWITCH) ? "kill_switch:state" : "circuit_breaker:state";
}

inline const char* safetyLabel(SafetyKind kind) {
    return (kind == SafetyKind::KILL_SWITCH) ? "kill switch" : "circuit breaker";
}

inline const char* safetyStatusToString(SafetyStatus status) {
    switch (status) {
        case SafetyStatus::SAFE: return "SAFE";
        case SafetyStatus::UNSAFE: return "UNSAFE";
        case SafetyStatus::TRANSITIONAL: return "TRANSITIONAL";
    }
    return "UNSAFE";
}

struct SafetyState {
    SafetyStatus status = SafetyStatus::UNSAFE;
    std::optional<Timestamp> changed_at;
    std::optional<Timestamp> prior_changed_at;
    std::optional<std::string> reason;
    // false when the state could not be established (malformed, timeout, missing).
    bool verified = false;

    bool isSafe() const { return status == SafetyStatus::SAFE; }

    static SafetyState unverified(std::string why) {
        SafetyState s;
        s.reason = std::move(why);
        return s;
    }
};

// Payload -> state. Never throws; every defect classifies as unverified UNSAFE.
//   kill switch:     {state: ACTIVE|ENGAGED, engaged_at, disengaged_at, engagement_reason}
//   circuit breaker: {state: OPEN|TRIPPED|QUIET_PERIOD, tripped_at, reset_at, trip_reason}
// SAFE needs a valid change timestamp not older than the prior one, or neither timestamp.
SafetyState parseSafetyState(SafetyKind kind, const nlohmann::json& payload);

} // namespace safety
} // namespace orderguard
