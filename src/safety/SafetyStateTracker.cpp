#include "safety/SafetyStateTracker.h"

#include <chrono>

#include "common/Logger.h"

namespace orderguard {
namespace safety {

namespace {
std::string unableToVerify(SafetyKind kind, const std::string& detail) {
    return std::string("Unable to verify ") + safetyLabel(kind) + ": " + detail;
}

// SAFE < TRANSITIONAL < UNSAFE
int restrictiveness(const SafetyState& s) {
    switch (s.status) {
        case SafetyStatus::SAFE: return 0;
        case SafetyStatus::TRANSITIONAL: return 1;
        case SafetyStatus::UNSAFE: return 2;
    }
    return 2;
}

CheckResult gateOne(SafetyKind kind, const SafetyState& state) {
    if (state.isSafe()) {
        return CheckResult::pass();
    }
    std::string reason = state.reason.value_or(
        kind == SafetyKind::KILL_SWITCH ? "Kill switch engaged" : "Circuit breaker tripped");
    const ErrorKind error_kind = state.verified ? ErrorKind::SAFETY_BLOCKED : ErrorKind::TRANSIENT_IO;
    return CheckResult::block(error_kind, std::move(reason));
}
}

SafetyStateTracker::SafetyStateTracker(std::shared_ptr<core::ISafetyStateSource> source)
    : source_(std::move(source)) {
    kill_switch_.state = SafetyState::unverified("Kill switch state loading");
    circuit_breaker_.state = SafetyState::unverified("Circuit breaker state loading");
}

SafetyState SafetyStateTracker::applyPush(SafetyKind kind, const nlohmann::json& payload) {
    SafetyState parsed = parseSafetyState(kind, payload);
    if (!parsed.verified) {
        LOG_WARN("Invalid {} push: {}", safetyLabel(kind), parsed.reason.value_or(""));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Slot& s = slot(kind);
    s.state = parsed;
    ++s.version;
    return parsed;
}

SafetyState SafetyStateTracker::fetchOnce(SafetyKind kind, Duration timeout) {
    if (!source_) {
        return SafetyState::unverified(unableToVerify(kind, "verification unavailable"));
    }

    const auto started = std::chrono::steady_clock::now();
    std::optional<std::string> raw;
    try {
        raw = source_->fetch(safetyChannel(kind), timeout);
    } catch (const std::exception& e) {
        LOG_WARN("{} fetch failed: {}", safetyLabel(kind), e.what());
        return SafetyState::unverified(unableToVerify(kind, "fetch failed"));
    }

    const auto elapsed = std::chrono::steady_clock::now() - started;
    if (elapsed > timeout) {
        LOG_WARN("{} fetch exceeded {}ms", safetyLabel(kind), timeout.count());
        return SafetyState::unverified(unableToVerify(kind, "fetch timed out"));
    }
    if (!raw) {
        return SafetyState::unverified(unableToVerify(kind, "state not found"));
    }

    nlohmann::json payload = nlohmann::json::parse(*raw, nullptr, false);
    if (payload.is_discarded()) {
        return SafetyState::unverified(unableToVerify(kind, "malformed response"));
    }
    return parseSafetyState(kind, payload);
}

SafetyState SafetyStateTracker::fetchAuthoritative(SafetyKind kind, Duration timeout) {
    std::uint64_t version_before = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        version_before = slot(kind).version;
    }

    SafetyState fetched = fetchOnce(kind, timeout);

    std::lock_guard<std::mutex> lock(mutex_);
    Slot& s = slot(kind);
    if (s.version != version_before && restrictiveness(s.state) > restrictiveness(fetched)) {
        // A push that arrived mid-fetch is more restrictive; keep it.
        return s.state;
    }
    s.state = fetched;
    ++s.version;
    return fetched;
}

void SafetyStateTracker::initialize(Duration timeout) {
    const SafetyState ks = fetchAuthoritative(SafetyKind::KILL_SWITCH, timeout);
    const SafetyState cb = fetchAuthoritative(SafetyKind::CIRCUIT_BREAKER, timeout);

    std::lock_guard<std::mutex> lock(mutex_);
    initialized_ = true;
    LOG_INFO("Safety state initialized: kill_switch={} circuit_breaker={}",
             safetyStatusToString(ks.status), safetyStatusToString(cb.status));
}

SafetyState SafetyStateTracker::current(SafetyKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slot(kind).state;
}

bool SafetyStateTracker::isInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

CheckResult SafetyStateTracker::check() const {
    SafetyState ks;
    SafetyState cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!initialized_) {
            return CheckResult::block(ErrorKind::TRANSIENT_IO, "Safety state loading...");
        }
        ks = kill_switch_.state;
        cb = circuit_breaker_.state;
    }
    return checkStates(ks, cb);
}

CheckResult SafetyStateTracker::checkStates(const SafetyState& kill_switch, const SafetyState& circuit_breaker) {
    auto result = gateOne(SafetyKind::KILL_SWITCH, kill_switch);
    if (!result.allowed) {
        return result;
    }
    return gateOne(SafetyKind::CIRCUIT_BREAKER, circuit_breaker);
}

} // namespace safety
} // namespace orderguard
