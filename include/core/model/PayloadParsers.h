#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/model/OrderEntryTypes.h"

namespace orderguard {
namespace core {

// Boundary parsers: untyped JSON in, typed values out. None of these throw.
// nullopt means the payload is malformed and the field must be treated as unusable.

std::optional<PriceTick> parsePriceTick(const nlohmann::json& payload);

// Any row with a bad symbol or qty rejects the whole snapshot.
std::optional<PositionsSnapshot> parsePositions(const nlohmann::json& payload);

std::optional<AccountSnapshot> parseAccount(const nlohmann::json& payload);

// Absent or null limit = not configured. Negative or unparsable = malformed.
std::optional<RiskLimitsSnapshot> parseRiskLimits(const nlohmann::json& payload);

// Malformed rows are skipped; fills are informational.
std::vector<FillRecord> parseFills(const nlohmann::json& payload);

SubmitResponse parseSubmitResponse(int http_status, const std::string& body);

ConnectionState parseConnectionState(const nlohmann::json& payload);

nlohmann::json orderIntentToJson(const OrderIntent& intent);

// Re-validates every field of a persisted intent.
std::optional<OrderIntent> parseOrderIntent(const nlohmann::json& raw);

} // namespace core
} // namespace orderguard
