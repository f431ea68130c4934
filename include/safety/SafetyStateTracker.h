#pragma once

#include <cstdint>
#include <memory>
#include <mutex>

#include <nlohmann/json.hpp>

#include "common/Errors.h"
#include "common/Types.h"
#include "core/contracts/ISafetyStateSource.h"
#include "safety/SafetyState.h"

namespace orderguard {
namespace safety {

// Fail-closed view of kill switch and circuit breaker, fed by bus pushes and
// authoritative fetches. Starts blocked until initialize() completes.
class SafetyStateTracker {
public:
    explicit SafetyStateTracker(std::shared_ptr<core::ISafetyStateSource> source);

    SafetyState applyPush(SafetyKind kind, const nlohmann::json& payload);

    // Errors, timeouts and missing keys all yield unverified UNSAFE.
    // If a push lands while the fetch is in flight the more restrictive state is kept.
    SafetyState fetchAuthoritative(SafetyKind kind, Duration timeout);

    // Fetches both states and opens the gate for cached checks.
    void initialize(Duration timeout);

    SafetyState current(SafetyKind kind) const;
    bool isInitialized() const;

    // Cached gate: loading, then kill switch, then circuit breaker.
    CheckResult check() const;

    // Gate on a specific pair of states, e.g. freshly fetched ones.
    static CheckResult checkStates(const SafetyState& kill_switch, const SafetyState& circuit_breaker);

private:
    struct Slot {
        SafetyState state;
        std::uint64_t version = 0;
    };

    Slot& slot(SafetyKind kind) { return kind == SafetyKind::KILL_SWITCH ? kill_switch_ : circuit_breaker_; }
    const Slot& slot(SafetyKind kind) const { return kind == SafetyKind::KILL_SWITCH ? kill_switch_ : circuit_breaker_; }

    SafetyState fetchOnce(SafetyKind kind, Duration timeout);

    std::shared_ptr<core::ISafetyStateSource> source_;
    mutable std::mutex mutex_;
    Slot kill_switch_;
    Slot circuit_breaker_;
    bool initialized_ = false;
};

} // namespace safety
} // namespace orderguard
