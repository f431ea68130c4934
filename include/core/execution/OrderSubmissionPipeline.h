#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "common/Errors.h"
#include "common/Types.h"
#include "core/contracts/IIntentStore.h"
#include "core/contracts/IOrderJournal.h"
#include "core/contracts/ITradingGateway.h"
#include "core/execution/OrderEntryStateMachine.h"
#include "core/execution/OrderValidator.h"
#include "core/model/OrderEntryTypes.h"
#include "safety/SafetyStateTracker.h"
#include "safety/StalenessPolicy.h"

namespace orderguard {
namespace core {
namespace execution {

struct PipelineSettings {
    std::string session_id = "default";
    safety::StalenessThresholds thresholds;
    Duration submit_fetch_timeout{std::chrono::milliseconds(500)};
};

// Form -> intent -> submitted order, at most once per intent.
// preview() runs the cached checks; confirm() re-fetches everything, re-checks,
// gates once more on kill switch / circuit breaker / connection, then submits
// with the intent id as idempotency key.
class OrderSubmissionPipeline {
public:
    OrderSubmissionPipeline(
        PipelineSettings settings,
        std::shared_ptr<safety::SafetyStateTracker> safety,
        std::shared_ptr<ITradingGateway> gateway,
        std::shared_ptr<IIntentStore> intent_store,
        std::shared_ptr<IOrderJournal> journal,
        Clock clock = systemNow
    );

    void onPriceTick(const PriceTick& tick);
    void onPositions(const std::optional<PositionsSnapshot>& snapshot);
    void onAccount(const std::optional<AccountSnapshot>& account);
    void onRiskLimits(const std::optional<RiskLimitsSnapshot>& limits);
    void setConnectionState(ConnectionState state);

    // Symbol change drops the price snapshot and any intent for the old symbol.
    void setSelectedSymbol(const std::optional<std::string>& symbol);
    std::optional<std::string> selectedSymbol() const;

    // A changed form discards the current intent.
    void updateForm(const OrderForm& form);
    OrderForm form() const;

    CheckResult checkCached() const;
    PreviewResult preview();
    SubmitResult confirm();

    // Re-opens a draft after a restart. Returns the restored intent.
    std::optional<OrderIntent> restorePendingIntent();

    // Every check fails with `reason` until clearBlock().
    void blockAll(const std::string& reason);
    void clearBlock();

    void reset();

    OrderEntryState state() const;
    std::optional<OrderIntent> currentIntent() const;
    ConnectionState connectionState() const;

private:
    ValidationInputs cachedInputsLocked() const;
    bool applyEventLocked(OrderEntryEvent event);
    void discardIntentLocked(const std::string& why, std::optional<OrderIntent>& discarded);

    SubmitResult abortConfirm(const OrderForm& form, const std::string& intent_id, CheckResult check);
    void journal(OrderJournalEventType type, const std::string& intent_id,
                 const std::string& symbol, nlohmann::json payload);
    void auditOrder(const OrderForm& form, const std::string& intent_id,
                    const std::string& outcome, const std::string& reason);
    std::string newIntentId() const;

    PipelineSettings settings_;
    std::shared_ptr<safety::SafetyStateTracker> safety_;
    std::shared_ptr<ITradingGateway> gateway_;
    std::shared_ptr<IIntentStore> intent_store_;
    std::shared_ptr<IOrderJournal> journal_;
    Clock clock_;

    mutable std::mutex mutex_;
    OrderEntryState state_ = OrderEntryState::DRAFTING;
    OrderForm form_;
    std::optional<OrderForm> previewed_form_;
    std::optional<OrderIntent> intent_;
    std::optional<std::string> selected_symbol_;
    std::optional<std::string> blocked_reason_;
    ConnectionState connection_ = ConnectionState::UNKNOWN;

    safety::FieldSnapshot<PositionsSnapshot> positions_;
    safety::FieldSnapshot<Decimal> last_price_;
    safety::FieldSnapshot<Decimal> buying_power_;
    safety::FieldSnapshot<RiskLimits> risk_limits_;
};

} // namespace execution
} // namespace core
} // namespace orderguard
