#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Decimal.h"
#include "common/ParseUtils.h"
#include "common/Types.h"
#include "core/contracts/IOrderEntryConsumer.h"

namespace orderguard {
namespace fakes {

inline Decimal dec(const std::string& text) {
    auto value = parseDecimal(text);
    if (!value) {
        throw std::invalid_argument("bad decimal literal: " + text);
    }
    return *value;
}

// Fixed reference instant so tests never depend on the wall clock.
inline Timestamp baseTime() {
    return *utils::parseIsoTimestamp(std::string("2026-03-02T14:30:00Z"));
}

inline Timestamp at(long long offset_ms) {
    return baseTime() + std::chrono::milliseconds(offset_ms);
}

inline std::string iso(Timestamp ts) {
    return utils::formatIsoTimestamp(ts);
}

inline nlohmann::json killSwitchSafe() {
    return {{"state", "ACTIVE"}};
}

inline nlohmann::json circuitBreakerSafe() {
    return {{"state", "OPEN"}};
}

inline nlohmann::json killSwitchEngaged(const std::string& reason) {
    return {{"state", "ENGAGED"}, {"engaged_at", iso(baseTime())}, {"engagement_reason", reason}};
}

// Clock the test moves by hand.
class ManualClock {
public:
    explicit ManualClock(Timestamp start = baseTime()) : now_(std::make_shared<Timestamp>(start)) {}

    Timestamp operator()() const { return *now_; }
    void advance(Duration d) { *now_ += d; }
    void set(Timestamp ts) { *now_ = ts; }

private:
    std::shared_ptr<Timestamp> now_;
};

class RecordingConsumer : public core::IOrderEntryConsumer {
public:
    void onPrice(const core::PriceTick& tick) override {
        std::lock_guard<std::mutex> lock(mutex_);
        prices.push_back(tick);
    }

    void onSafetyState(safety::SafetyKind kind, const safety::SafetyState& state) override {
        std::lock_guard<std::mutex> lock(mutex_);
        safety_updates.emplace_back(kind, state);
    }

    void onConnectionState(ConnectionState state) override {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_states.push_back(state);
    }

    void onSymbolChanged(const std::optional<std::string>& symbol) override {
        std::lock_guard<std::mutex> lock(mutex_);
        symbols.push_back(symbol);
    }

    void onSubmissionBlocked(const std::string& reason) override {
        std::lock_guard<std::mutex> lock(mutex_);
        blocked.push_back(reason);
    }

    std::size_t priceCount() {
        std::lock_guard<std::mutex> lock(mutex_);
        return prices.size();
    }

    std::vector<core::PriceTick> prices;
    std::vector<std::pair<safety::SafetyKind, safety::SafetyState>> safety_updates;
    std::vector<ConnectionState> connection_states;
    std::vector<std::optional<std::string>> symbols;
    std::vector<std::string> blocked;

private:
    std::mutex mutex_;
};

} // namespace fakes
} // namespace orderguard
