#pragma once

#include <optional>
#include <utility>

#include "common/Types.h"

namespace orderguard {
namespace safety {

// A value plus the server time it was observed at. Either may be absent.
template<typename T>
struct FieldSnapshot {
    std::optional<T> value;
    std::optional<Timestamp> observed_at;

    void set(T v, std::optional<Timestamp> ts) {
        value = std::move(v);
        observed_at = ts;
    }

    // Keeps the value for display but makes it unusable for trading.
    void invalidate() { observed_at.reset(); }

    void clear() {
        value.reset();
        observed_at.reset();
    }
};

struct StalenessThresholds {
    Duration position{std::chrono::seconds(30)};
    Duration price{std::chrono::seconds(30)};
    Duration buying_power{std::chrono::seconds(60)};
    Duration risk_limits{std::chrono::seconds(300)};
};

class StalenessPolicy {
public:
    // Absent timestamp is never fresh. Age equal to max_age is fresh.
    // A timestamp ahead of `now` (clock skew) counts as fresh.
    static bool isFresh(const std::optional<Timestamp>& observed_at, Duration max_age, Timestamp now) {
        if (!observed_at) {
            return false;
        }
        return (now - *observed_at) <= max_age;
    }

    template<typename T>
    static bool isFresh(const FieldSnapshot<T>& snapshot, Duration max_age, Timestamp now) {
        return isFresh(snapshot.observed_at, max_age, now);
    }

    // Fresh and carrying a value.
    template<typename T>
    static bool isUsable(const FieldSnapshot<T>& snapshot, Duration max_age, Timestamp now) {
        return snapshot.value.has_value() && isFresh(snapshot.observed_at, max_age, now);
    }

    static std::optional<Duration> age(const std::optional<Timestamp>& observed_at, Timestamp now) {
        if (!observed_at) {
            return std::nullopt;
        }
        return std::chrono::duration_cast<Duration>(now - *observed_at);
    }
};

} // namespace safety
} // namespace orderguard
