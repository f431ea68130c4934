#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Decimal.h"
#include "common/Errors.h"
#include "common/Types.h"

namespace orderguard {
namespace core {

struct OrderForm {
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    std::optional<Decimal> qty;
    OrderType order_type = OrderType::MARKET;
    std::optional<Decimal> limit_price;
    std::optional<Decimal> stop_price;
    TimeInForce time_in_force = TimeInForce::DAY;

    bool operator==(const OrderForm& other) const {
        return symbol == other.symbol &&
               side == other.side &&
               qty == other.qty &&
               order_type == other.order_type &&
               limit_price == other.limit_price &&
               stop_price == other.stop_price &&
               time_in_force == other.time_in_force;
    }
    bool operator!=(const OrderForm& other) const { return !(*this == other); }
};

struct OrderIntent {
    std::string intent_id;
    OrderForm form;
    Timestamp created_at{};
};

struct PriceTick {
    std::string symbol;
    Decimal price;
    std::optional<Timestamp> timestamp;
    std::string event_type;
};

struct PositionRow {
    std::string symbol;
    Decimal qty;
    std::optional<Decimal> current_price;
    std::optional<Timestamp> updated_at;
};

struct PositionsSnapshot {
    std::vector<PositionRow> rows;
    // Server time; falls back to the newest row updated_at.
    std::optional<Timestamp> timestamp;

    const PositionRow* find(const std::string& symbol) const {
        for (const auto& row : rows) {
            if (row.symbol == symbol) {
                return &row;
            }
        }
        return nullptr;
    }
};

struct AccountSnapshot {
    std::optional<Decimal> buying_power;
    std::optional<Timestamp> timestamp;
};

// Each limit: nullopt means no limit configured.
struct RiskLimits {
    std::optional<Decimal> max_position_per_symbol;
    std::optional<Decimal> max_notional_per_order;
    std::optional<Decimal> max_total_exposure;
};

struct RiskLimitsSnapshot {
    RiskLimits limits;
    std::optional<Timestamp> timestamp;
};

struct FillRecord {
    std::string order_id;
    std::string symbol;
    std::string side;
    Decimal qty;
    Decimal price;
    std::optional<Timestamp> filled_at;
};

struct OrderRequest {
    std::string client_order_id;
    OrderForm form;

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["client_order_id"] = client_order_id;
        j["symbol"] = form.symbol;
        j["side"] = orderSideToString(form.side);
        j["qty"] = form.qty ? form.qty->toString() : std::string();
        j["order_type"] = orderTypeToString(form.order_type);
        j["time_in_force"] = timeInForceToString(form.time_in_force);
        if (form.limit_price) {
            j["limit_price"] = form.limit_price->toString();
        }
        if (form.stop_price) {
            j["stop_price"] = form.stop_price->toString();
        }
        return j;
    }
};

struct SubmitResponse {
    bool accepted = false;
    int http_status = 0;
    std::string status;
    std::string client_order_id;
    std::string message;
};

struct BuyingPowerImpact {
    std::optional<Decimal> notional;
    std::optional<Decimal> percentage;
    std::optional<Decimal> remaining;
    bool warning = false;
};

struct PreviewResult {
    CheckResult check;
    std::string intent_id;
    BuyingPowerImpact impact;
};

struct SubmitResult {
    CheckResult check;
    std::string client_order_id;
};

} // namespace core
} // namespace orderguard
