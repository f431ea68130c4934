#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "core/model/OrderEntryTypes.h"

namespace orderguard {
namespace core {

// REST collaborators. I/O failures throw TransientIoError; nullopt means the
// response arrived but was malformed.
class ITradingGateway {
public:
    virtual ~ITradingGateway() = default;

    virtual std::optional<PositionsSnapshot> fetchPositions() = 0;
    virtual std::optional<AccountSnapshot> fetchAccount() = 0;
    virtual std::optional<RiskLimitsSnapshot> fetchRiskLimits() = 0;
    virtual std::vector<FillRecord> fetchRecentFills(std::size_t limit) = 0;

    // client_order_id is the idempotency key.
    virtual SubmitResponse submitOrder(const OrderRequest& request) = 0;
};

} // namespace core
} // namespace orderguard
