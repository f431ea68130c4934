#pragma once

#include "common/Errors.h"
#include "common/Types.h"
#include "core/model/OrderEntryTypes.h"
#include "safety/SafetyState.h"
#include "safety/StalenessPolicy.h"

namespace orderguard {
namespace core {
namespace execution {

// Everything one validation pass looks at. Cached and freshly fetched data go
// through the same sequence.
struct ValidationInputs {
    bool safety_initialized = false;
    safety::SafetyState kill_switch;
    safety::SafetyState circuit_breaker;
    ConnectionState connection = ConnectionState::UNKNOWN;

    OrderForm form;
    safety::FieldSnapshot<PositionsSnapshot> positions;
    safety::FieldSnapshot<Decimal> last_price;
    safety::FieldSnapshot<Decimal> buying_power;
    safety::FieldSnapshot<RiskLimits> risk_limits;

    safety::StalenessThresholds thresholds;
    Timestamp now{};
};

class OrderValidator {
public:
    // First failing check wins:
    // safety loaded, connection, kill switch, circuit breaker, symbol, qty,
    // position/price/buying power staleness, order-type prices, limits loaded,
    // limits staleness, position/notional/exposure limits.
    static CheckResult validate(const ValidationInputs& in);

    // Kill switch, circuit breaker and connection only; used right before dispatch.
    static CheckResult finalGate(
        const safety::SafetyState& kill_switch,
        const safety::SafetyState& circuit_breaker,
        ConnectionState connection
    );
};

} // namespace execution
} // namespace core
} // namespace orderguard
