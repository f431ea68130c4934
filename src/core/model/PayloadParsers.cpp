#include "core/model/PayloadParsers.h"

#include <algorithm>
#include <cctype>

#include "common/Logger.h"
#include "common/ParseUtils.h"

namespace orderguard {
namespace core {

namespace {
std::optional<Decimal> optionalDecimal(const nlohmann::json& object, const char* key, const char* camel) {
    const auto* raw = utils::findField(object, key, camel);
    if (raw == nullptr || raw->is_null()) {
        return std::nullopt;
    }
    return parseDecimal(*raw);
}

std::optional<Timestamp> optionalTimestamp(const nlohmann::json& object, const char* key, const char* camel) {
    const auto* raw = utils::findField(object, key, camel);
    if (raw == nullptr || raw->is_null()) {
        return std::nullopt;
    }
    return utils::parseIsoTimestamp(*raw);
}

std::string stringField(const nlohmann::json& object, const char* key, const char* camel = nullptr) {
    const auto* raw = utils::findField(object, key, camel);
    if (raw == nullptr || !raw->is_string()) {
        return std::string();
    }
    return raw->get<std::string>();
}

std::string lowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

// Missing is fine; present must be a positive finite decimal.
bool readOptionalPrice(const nlohmann::json& object, const char* key, std::optional<Decimal>& out) {
    const auto* raw = utils::findField(object, key);
    if (raw == nullptr || raw->is_null()) {
        out.reset();
        return true;
    }
    out = parseDecimal(*raw);
    return out && out->isPositive();
}
}

std::optional<PriceTick> parsePriceTick(const nlohmann::json& payload) {
    if (!payload.is_object()) {
        return std::nullopt;
    }
    const auto symbol = utils::normalizeSymbol(stringField(payload, "symbol"));
    if (!symbol) {
        return std::nullopt;
    }
    const auto price = optionalDecimal(payload, "price", nullptr);
    if (!price || !price->isPositive()) {
        return std::nullopt;
    }

    PriceTick tick;
    tick.symbol = *symbol;
    tick.price = *price;
    tick.timestamp = optionalTimestamp(payload, "timestamp", nullptr);
    tick.event_type = stringField(payload, "event_type", "eventType");
    return tick;
}

std::optional<PositionsSnapshot> parsePositions(const nlohmann::json& payload) {
    const nlohmann::json* rows = nullptr;
    if (payload.is_array()) {
        rows = &payload;
    } else if (payload.is_object()) {
        rows = utils::findField(payload, "positions");
    }
    if (rows == nullptr || !rows->is_array()) {
        return std::nullopt;
    }

    PositionsSnapshot snapshot;
    std::optional<Timestamp> newest_row;
    for (const auto& item : *rows) {
        if (!item.is_object()) {
            return std::nullopt;
        }
        const auto symbol = utils::normalizeSymbol(stringField(item, "symbol"));
        const auto qty = optionalDecimal(item, "qty", "quantity");
        if (!symbol || !qty) {
            LOG_WARN("Malformed position row: {}", item.dump());
            return std::nullopt;
        }

        PositionRow row;
        row.symbol = *symbol;
        row.qty = *qty;
        row.current_price = optionalDecimal(item, "current_price", "currentPrice");
        row.updated_at = optionalTimestamp(item, "updated_at", "updatedAt");
        if (row.updated_at && (!newest_row || *row.updated_at > *newest_row)) {
            newest_row = row.updated_at;
        }
        snapshot.rows.push_back(std::move(row));
    }

    if (payload.is_object()) {
        snapshot.timestamp = optionalTimestamp(payload, "timestamp", nullptr);
    }
    if (!snapshot.timestamp) {
        snapshot.timestamp = newest_row;
    }
    return snapshot;
}

std::optional<AccountSnapshot> parseAccount(const nlohmann::json& payload) {
    if (!payload.is_object()) {
        return std::nullopt;
    }
    AccountSnapshot account;
    account.buying_power = optionalDecimal(payload, "buying_power", "buyingPower");
    account.timestamp = optionalTimestamp(payload, "timestamp", nullptr);
    if (!account.buying_power) {
        const auto* raw = utils::findField(payload, "buying_power", "buyingPower");
        LOG_WARN("Invalid buying power: {}", raw ? raw->dump() : std::string("<missing>"));
        // Unusable without a value; keep nothing that could pass a staleness check.
        account.timestamp.reset();
    }
    return account;
}

std::optional<RiskLimitsSnapshot> parseRiskLimits(const nlohmann::json& payload) {
    if (!payload.is_object()) {
        return std::nullopt;
    }
    const auto* limits_node = utils::findField(payload, "limits");
    const nlohmann::json& limits = (limits_node != nullptr && limits_node->is_object()) ? *limits_node : payload;

    RiskLimitsSnapshot snapshot;
    struct Entry {
        const char* key;
        const char* camel;
        std::optional<Decimal>* target;
    };
    const Entry entries[] = {
        {"max_position_per_symbol", "maxPositionPerSymbol", &snapshot.limits.max_position_per_symbol},
        {"max_notional_per_order", "maxNotionalPerOrder", &snapshot.limits.max_notional_per_order},
        {"max_total_exposure", "maxTotalExposure", &snapshot.limits.max_total_exposure},
    };
    for (const auto& entry : entries) {
        const auto* raw = utils::findField(limits, entry.key, entry.camel);
        if (raw == nullptr || raw->is_null()) {
            continue;
        }
        auto value = parseDecimal(*raw);
        if (!value || value->isNegative()) {
            LOG_WARN("Invalid risk limit {}: {}", entry.key, raw->dump());
            return std::nullopt;
        }
        *entry.target = value;
    }

    snapshot.timestamp = optionalTimestamp(payload, "timestamp", nullptr);
    return snapshot;
}

std::vector<FillRecord> parseFills(const nlohmann::json& payload) {
    std::vector<FillRecord> out;
    const nlohmann::json* rows = payload.is_array() ? &payload : utils::findField(payload, "fills");
    if (rows == nullptr || !rows->is_array()) {
        return out;
    }
    for (const auto& item : *rows) {
        if (!item.is_object()) {
            continue;
        }
        const auto symbol = utils::normalizeSymbol(stringField(item, "symbol"));
        const auto qty = optionalDecimal(item, "qty", "quantity");
        const auto price = optionalDecimal(item, "price", nullptr);
        if (!symbol || !qty || !price) {
            continue;
        }
        FillRecord fill;
        fill.order_id = stringField(item, "order_id", "orderId");
        fill.symbol = *symbol;
        fill.side = lowerCopy(stringField(item, "side"));
        fill.qty = *qty;
        fill.price = *price;
        fill.filled_at = optionalTimestamp(item, "filled_at", "filledAt");
        out.push_back(std::move(fill));
    }
    return out;
}

SubmitResponse parseSubmitResponse(int http_status, const std::string& body) {
    SubmitResponse response;
    response.http_status = http_status;

    nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        response.message = body.empty() ? "Empty response" : "Malformed response";
        return response;
    }

    response.status = lowerCopy(stringField(j, "status"));
    response.client_order_id = stringField(j, "client_order_id", "clientOrderId");
    response.message = stringField(j, "message");
    if (response.message.empty()) {
        response.message = stringField(j, "detail");
    }

    const bool ok_status = http_status >= 200 && http_status < 300;
    response.accepted = ok_status &&
        (response.status == "pending_new" || response.status == "new" || response.status == "accepted");
    return response;
}

ConnectionState parseConnectionState(const nlohmann::json& payload) {
    const auto* raw = utils::findField(payload, "state");
    if (raw == nullptr || !raw->is_string()) {
        return ConnectionState::UNKNOWN;
    }
    std::string state = raw->get<std::string>();
    std::transform(state.begin(), state.end(), state.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return connectionStateFromString(state);
}

nlohmann::json orderIntentToJson(const OrderIntent& intent) {
    nlohmann::json form;
    form["symbol"] = intent.form.symbol;
    form["side"] = orderSideToString(intent.form.side);
    form["qty"] = intent.form.qty ? nlohmann::json(intent.form.qty->toString()) : nlohmann::json();
    form["order_type"] = orderTypeToString(intent.form.order_type);
    form["limit_price"] = intent.form.limit_price ? nlohmann::json(intent.form.limit_price->toString()) : nlohmann::json();
    form["stop_price"] = intent.form.stop_price ? nlohmann::json(intent.form.stop_price->toString()) : nlohmann::json();
    form["time_in_force"] = timeInForceToString(intent.form.time_in_force);

    nlohmann::json j;
    j["intent_id"] = intent.intent_id;
    j["created_at"] = utils::formatIsoTimestamp(intent.created_at);
    j["form"] = form;
    return j;
}

std::optional<OrderIntent> parseOrderIntent(const nlohmann::json& raw) {
    if (!raw.is_object()) {
        return std::nullopt;
    }
    const std::string intent_id = stringField(raw, "intent_id");
    const auto created_at = optionalTimestamp(raw, "created_at", nullptr);
    const auto* form = utils::findField(raw, "form");
    if (intent_id.empty() || !created_at || form == nullptr || !form->is_object()) {
        return std::nullopt;
    }

    const auto symbol = utils::normalizeSymbol(stringField(*form, "symbol"));
    const auto side = orderSideFromString(lowerCopy(stringField(*form, "side")));
    const auto type = orderTypeFromString(lowerCopy(stringField(*form, "order_type")));
    const auto tif = timeInForceFromString(lowerCopy(stringField(*form, "time_in_force")));
    const auto qty = optionalDecimal(*form, "qty", nullptr);
    if (!symbol || !side || !type || !tif || !qty || !qty->isPositive()) {
        return std::nullopt;
    }

    OrderIntent intent;
    intent.intent_id = intent_id;
    intent.created_at = *created_at;
    intent.form.symbol = *symbol;
    intent.form.side = *side;
    intent.form.order_type = *type;
    intent.form.time_in_force = *tif;
    intent.form.qty = qty;
    if (!readOptionalPrice(*form, "limit_price", intent.form.limit_price) ||
        !readOptionalPrice(*form, "stop_price", intent.form.stop_price)) {
        return std::nullopt;
    }
    return intent;
}

} // namespace core
} // namespace orderguard
