#include "core/adapters/GatewayClient.h"

#include "common/Errors.h"
#include "common/Logger.h"
#include "core/model/PayloadParsers.h"

namespace orderguard {
namespace core {

namespace {
constexpr const char* kPositionsEndpoint = "/api/v1/positions";
constexpr const char* kAccountEndpoint = "/api/v1/account";
constexpr const char* kRiskLimitsEndpoint = "/api/v1/risk/limits";
constexpr const char* kRecentFillsEndpoint = "/api/v1/fills/recent";
constexpr const char* kOrdersEndpoint = "/api/v1/orders";
}

GatewayClient::GatewayClient(std::shared_ptr<network::IHttpClient> http_client, Duration timeout)
    : http_client_(std::move(http_client))
    , timeout_(timeout) {
    if (!http_client_) {
        throw InvariantViolation("GatewayClient requires an HTTP client");
    }
}

nlohmann::json GatewayClient::getJson(
    const std::string& what,
    const std::string& endpoint,
    const std::map<std::string, std::string>& query
) {
    const auto response = http_client_->get(endpoint, query, timeout_);
    if (response.isRetryable()) {
        throw TransientIoError(what + ": HTTP " + std::to_string(response.status_code));
    }
    if (!response.isSuccess()) {
        throw OrderGuardError(ErrorKind::VALIDATION_FAILURE,
            what + ": HTTP " + std::to_string(response.status_code));
    }
    auto body = nlohmann::json::parse(response.body, nullptr, false);
    if (body.is_discarded()) {
        LOG_WARN("{} response is not valid JSON", what);
    }
    return body;
}

std::optional<PositionsSnapshot> GatewayClient::fetchPositions() {
    const auto body = getJson("positions", kPositionsEndpoint);
    if (body.is_discarded()) return std::nullopt;
    return parsePositions(body);
}

std::optional<AccountSnapshot> GatewayClient::fetchAccount() {
    const auto body = getJson("account", kAccountEndpoint);
    if (body.is_discarded()) return std::nullopt;
    return parseAccount(body);
}

std::optional<RiskLimitsSnapshot> GatewayClient::fetchRiskLimits() {
    const auto body = getJson("risk limits", kRiskLimitsEndpoint);
    if (body.is_discarded()) return std::nullopt;
    return parseRiskLimits(body);
}

std::vector<FillRecord> GatewayClient::fetchRecentFills(std::size_t limit) {
    const auto body = getJson("fills", kRecentFillsEndpoint, {{"limit", std::to_string(limit)}});
    if (body.is_discarded()) return {};
    return parseFills(body);
}

SubmitResponse GatewayClient::submitOrder(const OrderRequest& request) {
    const auto response = http_client_->post(kOrdersEndpoint, request.toJson(), timeout_);
    if (response.isRetryable()) {
        throw TransientIoError("submit order: HTTP " + std::to_string(response.status_code));
    }
    return parseSubmitResponse(response.status_code, response.body);
}

} // namespace core
} // namespace orderguard
