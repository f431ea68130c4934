#include "safety/SafetyState.h"

#include <algorithm>
#include <cctype>

#include "common/ParseUtils.h"

namespace orderguard {
namespace safety {

namespace {
struct FieldNames {
    const char* safe_state;
    const char* unsafe_state;
    const char* prior_key;
    const char* prior_camel;
    const char* changed_key;
    const char* changed_camel;
    const char* reason_key;
    const char* reason_camel;
};

const FieldNames& namesFor(SafetyKind kind) {
    static const FieldNames kKillSwitch{
        "ACTIVE", "ENGAGED",
        "engaged_at", "engagedAt",
        "disengaged_at", "disengagedAt",
        "engagement_reason", "engagementReason"
    };
    static const FieldNames kCircuitBreaker{
        "OPEN", "TRIPPED",
        "tripped_at", "trippedAt",
        "reset_at", "resetAt",
        "trip_reason", "tripReason"
    };
    return (kind == SafetyKind::KILL_SWITCH) ? kKillSwitch : kCircuitBreaker;
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return s;
}

std::string unableToVerify(SafetyKind kind, const std::string& detail) {
    return std::string("Unable to verify ") + safetyLabel(kind) + ": " + detail;
}

// Absent and JSON null are both "not present". Present values must parse.
struct TimestampField {
    bool present = false;
    std::optional<Timestamp> value;
};

TimestampField readTimestamp(const nlohmann::json& payload, const char* key, const char* camel) {
    TimestampField out;
    const auto* raw = utils::findField(payload, key, camel);
    if (raw == nullptr || raw->is_null()) {
        return out;
    }
    out.present = true;
    out.value = utils::parseIsoTimestamp(*raw);
    return out;
}

std::optional<std::string> readReason(const nlohmann::json& payload, const FieldNames& names) {
    const auto* raw = utils::findField(payload, names.reason_key, names.reason_camel);
    if (raw == nullptr) {
        raw = utils::findField(payload, "reason");
    }
    if (raw == nullptr || !raw->is_string() || raw->get<std::string>().empty()) {
        return std::nullopt;
    }
    return raw->get<std::string>();
}
}

SafetyState parseSafetyState(SafetyKind kind, const nlohmann::json& payload) {
    if (!payload.is_object()) {
        return SafetyState::unverified(unableToVerify(kind, "payload is not an object"));
    }

    const auto* raw_state = utils::findField(payload, "state");
    if (raw_state == nullptr || !raw_state->is_string()) {
        return SafetyState::unverified(unableToVerify(kind, "missing state"));
    }

    const FieldNames& names = namesFor(kind);
    const std::string state = upper(raw_state->get<std::string>());
    const bool is_safe_claim = (state == names.safe_state);
    const bool is_unsafe = (state == names.unsafe_state);
    const bool is_quiet = (kind == SafetyKind::CIRCUIT_BREAKER && state == "QUIET_PERIOD");
    if (!is_safe_claim && !is_unsafe && !is_quiet) {
        return SafetyState::unverified(unableToVerify(kind, "unknown state '" + state + "'"));
    }

    const TimestampField prior = readTimestamp(payload, names.prior_key, names.prior_camel);
    const TimestampField changed = readTimestamp(payload, names.changed_key, names.changed_camel);
    if (prior.present && !prior.value) {
        return SafetyState::unverified(unableToVerify(kind, std::string("invalid ") + names.prior_key));
    }
    if (changed.present && !changed.value) {
        return SafetyState::unverified(unableToVerify(kind, std::string("invalid ") + names.changed_key));
    }

    SafetyState result;
    result.verified = true;

    if (is_safe_claim) {
        if (!changed.present && prior.present) {
            return SafetyState::unverified(unableToVerify(
                kind, state + " with " + names.prior_key + " but no " + names.changed_key));
        }
        if (changed.value && prior.value && *changed.value < *prior.value) {
            return SafetyState::unverified(unableToVerify(
                kind, std::string(names.changed_key) + " precedes " + names.prior_key));
        }
        result.status = SafetyStatus::SAFE;
        result.changed_at = changed.value;
        result.prior_changed_at = prior.value;
        return result;
    }

    // Unsafe states: the engagement/trip time is the latest change.
    result.changed_at = prior.value;
    result.prior_changed_at = changed.value;

    if (is_quiet) {
        result.status = SafetyStatus::TRANSITIONAL;
        result.reason = "Circuit breaker in quiet period";
        return result;
    }

    result.status = SafetyStatus::UNSAFE;
    const std::string base = (kind == SafetyKind::KILL_SWITCH) ? "Kill switch engaged" : "Circuit breaker tripped";
    const auto detail = readReason(payload, names);
    result.reason = detail ? base + ": " + *detail : base;
    return result;
}

} // namespace safety
} // namespace orderguard
