#pragma once

#include <optional>
#include <string>

#include "common/Types.h"

namespace orderguard {
namespace core {

// Source of truth for kill switch / circuit breaker state.
class ISafetyStateSource {
public:
    virtual ~ISafetyStateSource() = default;

    // Raw JSON for `key` ("kill_switch:state", "circuit_breaker:state"),
    // nullopt when the key does not exist. Throws on I/O failure.
    virtual std::optional<std::string> fetch(const std::string& key, Duration timeout) = 0;
};

} // namespace core
} // namespace orderguard
