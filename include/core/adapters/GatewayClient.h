#pragma once

#include <map>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.h"
#include "core/contracts/ITradingGateway.h"
#include "network/IHttpClient.h"

namespace orderguard {
namespace core {

// ITradingGateway over the gateway REST API.
class GatewayClient : public ITradingGateway {
public:
    explicit GatewayClient(
        std::shared_ptr<network::IHttpClient> http_client,
        Duration timeout = std::chrono::seconds(5)
    );

    std::optional<PositionsSnapshot> fetchPositions() override;
    std::optional<AccountSnapshot> fetchAccount() override;
    std::optional<RiskLimitsSnapshot> fetchRiskLimits() override;
    std::vector<FillRecord> fetchRecentFills(std::size_t limit) override;
    SubmitResponse submitOrder(const OrderRequest& request) override;

private:
    // Throws on non-2xx. Returns a discarded value for a malformed body.
    nlohmann::json getJson(const std::string& what, const std::string& endpoint,
                           const std::map<std::string, std::string>& query = {});

    std::shared_ptr<network::IHttpClient> http_client_;
    Duration timeout_;
};

} // namespace core
} // namespace orderguard
