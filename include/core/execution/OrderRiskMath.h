#pragma once

#include <optional>
#include <string>

#include "common/Decimal.h"
#include "common/Errors.h"
#include "core/model/OrderEntryTypes.h"

namespace orderguard {
namespace core {
namespace execution {

struct ExposureProjection {
    Decimal current_total;
    Decimal current_symbol_notional;
    Decimal proposed_symbol_notional;
    Decimal projected_total;
};

// market -> last; limit/stop-limit -> limit; stop -> max(stop, last) for both sides.
std::optional<Decimal> effectivePrice(const OrderForm& form, const std::optional<Decimal>& last_price);

// Sum of |qty * current_price|. nullopt if any row has no price.
std::optional<Decimal> totalExposure(const PositionsSnapshot& positions);

Decimal proposedPosition(const Decimal& current, OrderSide side, const Decimal& qty);

// projected = current_total - current_symbol_notional + proposed_symbol_notional
std::optional<ExposureProjection> projectExposure(
    const PositionsSnapshot& positions,
    const std::string& symbol,
    OrderSide side,
    const Decimal& qty,
    const Decimal& effective_price
);

// Informational only; warning above 50% of buying power.
BuyingPowerImpact computeBuyingPowerImpact(
    const std::optional<Decimal>& qty,
    const std::optional<Decimal>& effective_price,
    const std::optional<Decimal>& buying_power
);

// nullopt when the limit/stop prices fit the order type.
std::optional<std::string> validateOrderTypePrices(const OrderForm& form);

// Position, then per-order notional, then total exposure.
CheckResult checkLimits(
    const OrderForm& form,
    const PositionsSnapshot& positions,
    const Decimal& effective_price,
    const RiskLimits& limits
);

} // namespace execution
} // namespace core
} // namespace orderguard
