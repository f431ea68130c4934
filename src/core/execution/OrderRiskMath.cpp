#include "core/execution/OrderRiskMath.h"

namespace orderguard {
namespace core {
namespace execution {

std::optional<Decimal> effectivePrice(const OrderForm& form, const std::optional<Decimal>& last_price) {
    switch (form.order_type) {
        case OrderType::MARKET:
            return last_price;
        case OrderType::LIMIT:
        case OrderType::STOP_LIMIT:
            return form.limit_price;
        case OrderType::STOP:
            // Conservative for both sides: never under-count a gap through the stop.
            if (!form.stop_price || !last_price) {
                return std::nullopt;
            }
            return max(*form.stop_price, *last_price);
    }
    return std::nullopt;
}

std::optional<Decimal> totalExposure(const PositionsSnapshot& positions) {
    Decimal total;
    for (const auto& row : positions.rows) {
        if (!row.current_price) {
            return std::nullopt;
        }
        total += (row.qty * *row.current_price).abs();
    }
    return total;
}

Decimal proposedPosition(const Decimal& current, OrderSide side, const Decimal& qty) {
    return side == OrderSide::BUY ? current + qty : current - qty;
}

std::optional<ExposureProjection> projectExposure(
    const PositionsSnapshot& positions,
    const std::string& symbol,
    OrderSide side,
    const Decimal& qty,
    const Decimal& effective_price
) {
    const auto current_total = totalExposure(positions);
    if (!current_total) {
        return std::nullopt;
    }

    ExposureProjection projection;
    projection.current_total = *current_total;

    Decimal current_qty;
    if (const PositionRow* row = positions.find(symbol)) {
        current_qty = row->qty;
        projection.current_symbol_notional = (row->qty * *row->current_price).abs();
    }

    const Decimal proposed = proposedPosition(current_qty, side, qty);
    projection.proposed_symbol_notional = (proposed * effective_price).abs();
    projection.projected_total = projection.current_total
        - projection.current_symbol_notional
        + projection.proposed_symbol_notional;
    return projection;
}

BuyingPowerImpact computeBuyingPowerImpact(
    const std::optional<Decimal>& qty,
    const std::optional<Decimal>& effective_price,
    const std::optional<Decimal>& buying_power
) {
    BuyingPowerImpact impact;
    if (!qty || !effective_price) {
        return impact;
    }

    impact.notional = *effective_price * *qty;
    if (!buying_power || !buying_power->isPositive()) {
        impact.warning = true;
        return impact;
    }

    impact.percentage = (*impact.notional * Decimal::fromInt(100)).dividedBy(*buying_power);
    impact.remaining = *buying_power - *impact.notional;
    impact.warning = impact.percentage && *impact.percentage > Decimal::fromInt(50);
    return impact;
}

std::optional<std::string> validateOrderTypePrices(const OrderForm& form) {
    const auto& limit = form.limit_price;
    const auto& stop = form.stop_price;

    switch (form.order_type) {
        case OrderType::MARKET:
            return std::nullopt;

        case OrderType::LIMIT:
            if (!limit) return std::string("Limit orders require a limit price");
            if (!limit->isPositive()) return std::string("Limit price must be positive");
            return std::nullopt;

        case OrderType::STOP:
            if (!stop) return std::string("Stop orders require a stop price");
            if (!stop->isPositive()) return std::string("Stop price must be positive");
            return std::nullopt;

        case OrderType::STOP_LIMIT:
            if (!limit) return std::string("Stop-limit orders require a limit price");
            if (!limit->isPositive()) return std::string("Limit price must be positive");
            if (!stop) return std::string("Stop-limit orders require a stop price");
            if (!stop->isPositive()) return std::string("Stop price must be positive");
            if (form.side == OrderSide::BUY && *limit > *stop) {
                return "Buy stop-limit: limit (" + limit->toString() +
                       ") must be at or below stop (" + stop->toString() + ")";
            }
            if (form.side == OrderSide::SELL && *limit < *stop) {
                return "Sell stop-limit: limit (" + limit->toString() +
                       ") must be at or above stop (" + stop->toString() + ")";
            }
            return std::nullopt;
    }
    return std::string("Unknown order type");
}

CheckResult checkLimits(
    const OrderForm& form,
    const PositionsSnapshot& positions,
    const Decimal& effective_price,
    const RiskLimits& limits
) {
    if (!form.qty) {
        return CheckResult::block(ErrorKind::VALIDATION_FAILURE, "Enter quantity");
    }
    const Decimal& qty = *form.qty;

    Decimal current_qty;
    if (const PositionRow* row = positions.find(form.symbol)) {
        current_qty = row->qty;
    }

    if (limits.max_position_per_symbol) {
        const Decimal proposed = proposedPosition(current_qty, form.side, qty);
        if (proposed.abs() > *limits.max_position_per_symbol) {
            return CheckResult::block(ErrorKind::VALIDATION_FAILURE,
                "Order exceeds position limit (" + limits.max_position_per_symbol->toString() + " shares)");
        }
    }

    if (limits.max_notional_per_order) {
        const Decimal notional = qty * effective_price;
        if (notional > *limits.max_notional_per_order) {
            return CheckResult::block(ErrorKind::VALIDATION_FAILURE,
                "Order exceeds max notional ($" + limits.max_notional_per_order->toString() + ")");
        }
    }

    if (limits.max_total_exposure) {
        const auto projection = projectExposure(positions, form.symbol, form.side, qty, effective_price);
        if (!projection) {
            return CheckResult::block(ErrorKind::VALIDATION_FAILURE, "Unable to verify exposure limit");
        }
        if (projection->projected_total > *limits.max_total_exposure) {
            return CheckResult::block(ErrorKind::VALIDATION_FAILURE,
                "Order exceeds total exposure limit ($" + limits.max_total_exposure->toString() + ")");
        }
    }

    return CheckResult::pass();
}

} // namespace execution
} // namespace core
} // namespace orderguard
