#include "core/execution/OrderRiskMath.h"

#include <cassert>
#include <iostream>

#include "fakes/TestSupport.h"

using namespace orderguard;
using namespace orderguard::core;
using namespace orderguard::core::execution;
using orderguard::fakes::dec;

namespace {
PositionsSnapshot book() {
    PositionsSnapshot positions;
    positions.rows.push_back({"AAPL", dec("100"), dec("150"), std::nullopt});
    positions.rows.push_back({"MSFT", dec("-20"), dec("400"), std::nullopt});
    return positions;
}

OrderForm marketBuy(const std::string& qty) {
    OrderForm form;
    form.symbol = "AAPL";
    form.side = OrderSide::BUY;
    form.qty = dec(qty);
    form.order_type = OrderType::MARKET;
    return form;
}
}

int main() {
    {
        // Stop orders price at max(stop, last) on both sides.
        OrderForm form = marketBuy("10");
        form.order_type = OrderType::STOP;
        form.stop_price = dec("100");
        assert(*effectivePrice(form, dec("105")) == dec("105"));
        form.side = OrderSide::SELL;
        assert(*effectivePrice(form, dec("105")) == dec("105"));
        assert(*effectivePrice(form, dec("95")) == dec("100"));
        assert(!effectivePrice(form, std::nullopt).has_value());
    }

    {
        OrderForm form = marketBuy("10");
        assert(*effectivePrice(form, dec("150.5")) == dec("150.5"));
        form.order_type = OrderType::LIMIT;
        form.limit_price = dec("149");
        assert(*effectivePrice(form, dec("150.5")) == dec("149"));
    }

    {
        // 100*150 + |-20*400| = 23000
        assert(*totalExposure(book()) == dec("23000"));

        PositionsSnapshot missing_price = book();
        missing_price.rows[1].current_price.reset();
        assert(!totalExposure(missing_price).has_value());
    }

    {
        const auto projection = projectExposure(book(), "AAPL", OrderSide::BUY, dec("10"), dec("150"));
        assert(projection);
        assert(projection->current_symbol_notional == dec("15000"));
        assert(projection->proposed_symbol_notional == dec("16500"));
        assert(projection->projected_total == dec("24500"));

        // Selling back to the original position lands on the original total.
        PositionsSnapshot after = book();
        after.rows[0].qty = dec("110");
        const auto back = projectExposure(after, "AAPL", OrderSide::SELL, dec("10"), dec("150"));
        assert(back && back->projected_total == *totalExposure(book()));
    }

    {
        const auto projection = projectExposure(book(), "TSLA", OrderSide::SELL, dec("5"), dec("200"));
        assert(projection);
        assert(projection->current_symbol_notional.isZero());
        assert(projection->projected_total == dec("24000"));
    }

    {
        RiskLimits limits;
        limits.max_position_per_symbol = dec("105");
        auto r = checkLimits(marketBuy("10"), book(), dec("150"), limits);
        assert(!r.allowed);
        assert(r.reason == "Order exceeds position limit (105 shares)");

        limits.max_position_per_symbol = dec("110");
        assert(checkLimits(marketBuy("10"), book(), dec("150"), limits).allowed);
    }

    {
        RiskLimits limits;
        limits.max_notional_per_order = dec("1000");
        auto r = checkLimits(marketBuy("10"), book(), dec("150"), limits);
        assert(!r.allowed);
        assert(r.reason == "Order exceeds max notional ($1000)");
    }

    {
        RiskLimits limits;
        limits.max_total_exposure = dec("24000");
        auto r = checkLimits(marketBuy("10"), book(), dec("150"), limits);
        assert(!r.allowed);
        assert(r.kind == ErrorKind::VALIDATION_FAILURE);

        limits.max_total_exposure = dec("24500");
        assert(checkLimits(marketBuy("10"), book(), dec("150"), limits).allowed);
    }

    {
        // Unconfigured limits never block.
        assert(checkLimits(marketBuy("100000"), book(), dec("150"), RiskLimits{}).allowed);
    }

    {
        OrderForm form = marketBuy("1");
        form.order_type = OrderType::STOP_LIMIT;
        form.limit_price = dec("101");
        form.stop_price = dec("100");
        assert(validateOrderTypePrices(form).has_value());
        form.side = OrderSide::SELL;
        assert(!validateOrderTypePrices(form).has_value());

        form.order_type = OrderType::LIMIT;
        form.limit_price = dec("0");
        assert(*validateOrderTypePrices(form) == "Limit price must be positive");
    }

    {
        auto impact = computeBuyingPowerImpact(dec("10"), dec("150"), dec("2000"));
        assert(*impact.notional == dec("1500"));
        assert(*impact.percentage == dec("75"));
        assert(*impact.remaining == dec("500"));
        assert(impact.warning);

        impact = computeBuyingPowerImpact(dec("1"), dec("150"), dec("2000"));
        assert(!impact.warning);

        impact = computeBuyingPowerImpact(dec("1"), dec("150"), std::nullopt);
        assert(impact.notional && !impact.percentage && impact.warning);
    }

    std::cout << "[TEST] OrderRiskMath PASSED\n";
    return 0;
}
