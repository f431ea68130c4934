#include "core/execution/OrderValidator.h"

#include "common/ParseUtils.h"
#include "core/execution/OrderRiskMath.h"
#include "safety/SafetyStateTracker.h"

namespace orderguard {
namespace core {
namespace execution {

using safety::StalenessPolicy;

namespace {
CheckResult connectionGate(ConnectionState connection) {
    if (connection == ConnectionState::UNKNOWN) {
        return CheckResult::block(ErrorKind::TRANSIENT_IO, "Connection unavailable");
    }
    if (isReadOnly(connection)) {
        return CheckResult::block(ErrorKind::TRANSIENT_IO,
            std::string("Connection: ") + connectionStateToString(connection));
    }
    return CheckResult::pass();
}

CheckResult stale(const char* what) {
    return CheckResult::block(ErrorKind::VALIDATION_FAILURE, std::string(what) + " data stale");
}
}

CheckResult OrderValidator::validate(const ValidationInputs& in) {
    if (!in.safety_initialized) {
        return CheckResult::block(ErrorKind::TRANSIENT_IO, "Safety state loading...");
    }

    auto result = connectionGate(in.connection);
    if (!result.allowed) return result;

    result = safety::SafetyStateTracker::checkStates(in.kill_switch, in.circuit_breaker);
    if (!result.allowed) return result;

    if (in.form.symbol.empty()) {
        return CheckResult::block(ErrorKind::VALIDATION_FAILURE, "Select a symbol");
    }
    const auto symbol = utils::normalizeSymbol(in.form.symbol);
    if (!symbol || *symbol != in.form.symbol) {
        return CheckResult::block(ErrorKind::VALIDATION_FAILURE, "Invalid symbol format");
    }

    if (!in.form.qty || !in.form.qty->isPositive()) {
        return CheckResult::block(ErrorKind::VALIDATION_FAILURE, "Enter quantity");
    }

    if (!StalenessPolicy::isUsable(in.positions, in.thresholds.position, in.now)) {
        return stale("Position");
    }
    if (!StalenessPolicy::isUsable(in.last_price, in.thresholds.price, in.now)) {
        return stale("Price");
    }
    if (!StalenessPolicy::isUsable(in.buying_power, in.thresholds.buying_power, in.now)) {
        return stale("Buying power");
    }

    if (const auto price_error = validateOrderTypePrices(in.form)) {
        return CheckResult::block(ErrorKind::VALIDATION_FAILURE, *price_error);
    }

    if (!in.risk_limits.value) {
        return CheckResult::block(ErrorKind::VALIDATION_FAILURE, "Risk limits loading...");
    }
    if (!StalenessPolicy::isFresh(in.risk_limits, in.thresholds.risk_limits, in.now)) {
        return CheckResult::block(ErrorKind::VALIDATION_FAILURE, "Risk limits stale");
    }

    const auto price = effectivePrice(in.form, in.last_price.value);
    if (!price) {
        return CheckResult::block(ErrorKind::VALIDATION_FAILURE, "Unable to verify order price");
    }

    return checkLimits(in.form, *in.positions.value, *price, *in.risk_limits.value);
}

CheckResult OrderValidator::finalGate(
    const safety::SafetyState& kill_switch,
    const safety::SafetyState& circuit_breaker,
    ConnectionState connection
) {
    auto result = safety::SafetyStateTracker::checkStates(kill_switch, circuit_breaker);
    if (!result.allowed) {
        return result;
    }
    if (isReadOnly(connection)) {
        return CheckResult::block(ErrorKind::TRANSIENT_IO, "Connection lost");
    }
    return CheckResult::pass();
}

} // namespace execution
} // namespace core
} // namespace orderguard
