#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"
#include "core/model/OrderEntryTypes.h"
#include "safety/SafetyState.h"

namespace orderguard {
namespace core {

// Display widgets register one of these. Callbacks run outside coordinator locks.
class IOrderEntryConsumer {
public:
    virtual ~IOrderEntryConsumer() = default;

    virtual void onPrice(const PriceTick&) {}
    virtual void onPositions(const PositionsSnapshot&) {}
    virtual void onAccount(const AccountSnapshot&) {}
    virtual void onSafetyState(safety::SafetyKind, const safety::SafetyState&) {}
    virtual void onConnectionState(ConnectionState) {}
    virtual void onSymbolChanged(const std::optional<std::string>&) {}
    virtual void onFills(const std::vector<FillRecord>&) {}
    virtual void onSubmissionBlocked(const std::string&) {}
};

} // namespace core
} // namespace orderguard
