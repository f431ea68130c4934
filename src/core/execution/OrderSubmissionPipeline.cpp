#include "core/execution/OrderSubmissionPipeline.h"

#include <algorithm>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "common/Logger.h"
#include "common/ParseUtils.h"
#include "core/execution/OrderRiskMath.h"

namespace orderguard {
namespace core {
namespace execution {

using safety::SafetyKind;

OrderSubmissionPipeline::OrderSubmissionPipeline(
    PipelineSettings settings,
    std::shared_ptr<safety::SafetyStateTracker> safety,
    std::shared_ptr<ITradingGateway> gateway,
    std::shared_ptr<IIntentStore> intent_store,
    std::shared_ptr<IOrderJournal> journal,
    Clock clock
)
    : settings_(std::move(settings))
    , safety_(std::move(safety))
    , gateway_(std::move(gateway))
    , intent_store_(std::move(intent_store))
    , journal_(std::move(journal))
    , clock_(clock ? std::move(clock) : Clock(systemNow)) {}

// ---------------------------------------------------------------------------
// Data feeds

void OrderSubmissionPipeline::onPriceTick(const PriceTick& tick) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!selected_symbol_ || tick.symbol != *selected_symbol_) {
        return;
    }
    // Out-of-order ticks never overwrite a newer observation.
    if (tick.timestamp && last_price_.observed_at && *tick.timestamp < *last_price_.observed_at) {
        return;
    }
    last_price_.set(tick.price, tick.timestamp);
}

void OrderSubmissionPipeline::onPositions(const std::optional<PositionsSnapshot>& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!snapshot) {
        positions_.invalidate();
        return;
    }
    positions_.set(*snapshot, snapshot->timestamp);
}

void OrderSubmissionPipeline::onAccount(const std::optional<AccountSnapshot>& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!account || !account->buying_power) {
        buying_power_.invalidate();
        return;
    }
    buying_power_.set(*account->buying_power, account->timestamp);
}

void OrderSubmissionPipeline::onRiskLimits(const std::optional<RiskLimitsSnapshot>& limits) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!limits) {
        risk_limits_.invalidate();
        return;
    }
    risk_limits_.set(limits->limits, limits->timestamp);
}

void OrderSubmissionPipeline::setConnectionState(ConnectionState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    connection_ = state;
}

ConnectionState OrderSubmissionPipeline::connectionState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connection_;
}

void OrderSubmissionPipeline::setSelectedSymbol(const std::optional<std::string>& symbol) {
    std::optional<OrderIntent> discarded;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (selected_symbol_ == symbol) {
            return;
        }
        selected_symbol_ = symbol;
        last_price_.clear();
        form_.symbol = symbol.value_or(std::string());
        if (state_ != OrderEntryState::CONFIRMING) {
            previewed_form_.reset();
            applyEventLocked(OrderEntryEvent::FORM_EDITED);
            if (intent_ && intent_->form != form_) {
                discardIntentLocked("symbol changed", discarded);
            }
        }
    }
    if (discarded) {
        if (intent_store_) intent_store_->clear(settings_.session_id);
        journal(OrderJournalEventType::INTENT_DISCARDED, discarded->intent_id, discarded->form.symbol,
                {{"reason", "symbol changed"}});
    }
}

std::optional<std::string> OrderSubmissionPipeline::selectedSymbol() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return selected_symbol_;
}

void OrderSubmissionPipeline::updateForm(const OrderForm& form) {
    std::optional<OrderIntent> discarded;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (form == form_) {
            return;
        }
        form_ = form;
        if (state_ == OrderEntryState::CONFIRMING) {
            // The in-flight submission keeps its snapshot; the next preview sees the edit.
            return;
        }
        applyEventLocked(OrderEntryEvent::FORM_EDITED);
        previewed_form_.reset();
        if (intent_ && intent_->form != form_) {
            discardIntentLocked("form changed", discarded);
        }
    }
    if (discarded) {
        if (intent_store_) intent_store_->clear(settings_.session_id);
        journal(OrderJournalEventType::INTENT_DISCARDED, discarded->intent_id, discarded->form.symbol,
                {{"reason", "form changed"}});
    }
}

OrderForm OrderSubmissionPipeline::form() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return form_;
}

// ---------------------------------------------------------------------------
// Checks

ValidationInputs OrderSubmissionPipeline::cachedInputsLocked() const {
    ValidationInputs in;
    in.safety_initialized = safety_ && safety_->isInitialized();
    if (safety_) {
        in.kill_switch = safety_->current(SafetyKind::KILL_SWITCH);
        in.circuit_breaker = safety_->current(SafetyKind::CIRCUIT_BREAKER);
    }
    in.connection = connection_;
    in.form = form_;
    in.positions = positions_;
    in.last_price = last_price_;
    in.buying_power = buying_power_;
    in.risk_limits = risk_limits_;
    in.thresholds = settings_.thresholds;
    in.now = clock_();
    return in;
}

CheckResult OrderSubmissionPipeline::checkCached() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (blocked_reason_) {
        return CheckResult::block(ErrorKind::TRANSIENT_IO, *blocked_reason_);
    }
    return OrderValidator::validate(cachedInputsLocked());
}

bool OrderSubmissionPipeline::applyEventLocked(OrderEntryEvent event) {
    const auto result = OrderEntryStateMachine::transition(state_, event);
    state_ = result.state;
    return result.accepted;
}

void OrderSubmissionPipeline::discardIntentLocked(const std::string& why, std::optional<OrderIntent>& discarded) {
    LOG_INFO("Discarding order intent {} ({})", intent_->intent_id, why);
    discarded = std::move(intent_);
    intent_.reset();
}

std::string OrderSubmissionPipeline::newIntentId() const {
    thread_local boost::uuids::random_generator generator;
    std::string id = boost::uuids::to_string(generator());
    id.erase(std::remove(id.begin(), id.end(), '-'), id.end());
    return id;
}

// ---------------------------------------------------------------------------
// Preview

PreviewResult OrderSubmissionPipeline::preview() {
    PreviewResult out;
    OrderForm form;
    std::optional<OrderIntent> discarded;
    std::optional<OrderIntent> created;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        form = form_;
        if (state_ == OrderEntryState::CONFIRMING) {
            out.check = CheckResult::block(ErrorKind::VALIDATION_FAILURE, "Submission already in progress");
            return out;
        }

        if (blocked_reason_) {
            out.check = CheckResult::block(ErrorKind::TRANSIENT_IO, *blocked_reason_);
        } else {
            out.check = OrderValidator::validate(cachedInputsLocked());
        }

        if (!out.check.allowed) {
            applyEventLocked(OrderEntryEvent::PREVIEW_BLOCKED);
            previewed_form_.reset();
        } else {
            if (intent_ && intent_->form == form_) {
                LOG_DEBUG("Reusing order intent {}", intent_->intent_id);
            } else {
                if (intent_) {
                    discardIntentLocked("superseded", discarded);
                }
                OrderIntent intent;
                intent.intent_id = newIntentId();
                intent.form = form_;
                intent.created_at = clock_();
                intent_ = intent;
                created = intent;
            }
            previewed_form_ = form_;
            applyEventLocked(OrderEntryEvent::PREVIEW_PASSED);
            out.intent_id = intent_->intent_id;
            out.impact = computeBuyingPowerImpact(
                form_.qty, effectivePrice(form_, last_price_.value), buying_power_.value);
        }
    }

    if (!out.check.allowed) {
        LOG_INFO("Preview blocked: {}", out.check.reason);
        journal(OrderJournalEventType::ORDER_BLOCKED, std::string(), form.symbol,
                {{"phase", "preview"}, {"kind", errorKindToString(out.check.kind)}, {"reason", out.check.reason}});
        auditOrder(form, std::string(), "BLOCKED", out.check.reason);
        return out;
    }

    if (discarded) {
        journal(OrderJournalEventType::INTENT_DISCARDED, discarded->intent_id, discarded->form.symbol,
                {{"reason", "superseded"}});
    }
    if (created) {
        if (intent_store_ && !intent_store_->save(settings_.session_id, *created)) {
            LOG_WARN("Failed to persist order intent {}", created->intent_id);
        }
        journal(OrderJournalEventType::INTENT_CREATED, created->intent_id, created->form.symbol,
                {{"side", orderSideToString(form.side)},
                 {"qty", form.qty ? form.qty->toString() : std::string()},
                 {"order_type", orderTypeToString(form.order_type)}});
    }
    return out;
}

// ---------------------------------------------------------------------------
// Confirm

SubmitResult OrderSubmissionPipeline::abortConfirm(const OrderForm& form, const std::string& intent_id, CheckResult check) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        applyEventLocked(OrderEntryEvent::CHECK_BLOCKED);
        previewed_form_.reset();
    }
    LOG_WARN("Order {} blocked at confirm: {}", intent_id, check.reason);
    journal(OrderJournalEventType::ORDER_BLOCKED, intent_id, form.symbol,
            {{"phase", "confirm"}, {"kind", errorKindToString(check.kind)}, {"reason", check.reason}});
    auditOrder(form, intent_id, "BLOCKED", check.reason);

    SubmitResult out;
    out.check = std::move(check);
    out.client_order_id = intent_id;
    return out;
}

SubmitResult OrderSubmissionPipeline::confirm() {
    OrderForm form;
    OrderIntent intent;
    safety::FieldSnapshot<Decimal> price;
    ConnectionState connection = ConnectionState::UNKNOWN;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        SubmitResult refused;
        if (blocked_reason_) {
            refused.check = CheckResult::block(ErrorKind::TRANSIENT_IO, *blocked_reason_);
            return refused;
        }
        if (state_ == OrderEntryState::CONFIRMING) {
            refused.check = CheckResult::block(ErrorKind::VALIDATION_FAILURE, "Submission already in progress");
            return refused;
        }
        if (state_ != OrderEntryState::PREVIEWING || !previewed_form_ || !intent_) {
            refused.check = CheckResult::block(ErrorKind::VALIDATION_FAILURE, "Preview the order first");
            return refused;
        }
        if (form_ != *previewed_form_ || intent_->form != form_) {
            applyEventLocked(OrderEntryEvent::FORM_EDITED);
            previewed_form_.reset();
            refused.check = CheckResult::block(ErrorKind::VALIDATION_FAILURE, "Order details changed. Preview again.");
            return refused;
        }
        applyEventLocked(OrderEntryEvent::CONFIRM_STARTED);
        form = form_;
        intent = *intent_;
        price = last_price_;
        connection = connection_;
    }

    // Phase 2: nothing cached is trusted from here on.
    safety::FieldSnapshot<PositionsSnapshot> positions;
    safety::FieldSnapshot<Decimal> buying_power;
    safety::FieldSnapshot<RiskLimits> limits;

    try {
        const auto fetched = gateway_->fetchPositions();
        onPositions(fetched);
        if (!fetched) {
            return abortConfirm(form, intent.intent_id,
                CheckResult::block(ErrorKind::VALIDATION_FAILURE, "Unable to verify positions: malformed response"));
        }
        positions.set(*fetched, fetched->timestamp);
    } catch (const std::exception& e) {
        onPositions(std::nullopt);
        return abortConfirm(form, intent.intent_id,
            CheckResult::block(ErrorKind::TRANSIENT_IO, std::string("Unable to verify positions: ") + e.what()));
    }

    try {
        const auto fetched = gateway_->fetchAccount();
        onAccount(fetched);
        if (!fetched) {
            return abortConfirm(form, intent.intent_id,
                CheckResult::block(ErrorKind::VALIDATION_FAILURE, "Unable to verify buying power: malformed response"));
        }
        if (fetched->buying_power) {
            buying_power.set(*fetched->buying_power, fetched->timestamp);
        }
    } catch (const std::exception& e) {
        onAccount(std::nullopt);
        return abortConfirm(form, intent.intent_id,
            CheckResult::block(ErrorKind::TRANSIENT_IO, std::string("Unable to verify buying power: ") + e.what()));
    }

    try {
        const auto fetched = gateway_->fetchRiskLimits();
        onRiskLimits(fetched);
        if (!fetched) {
            return abortConfirm(form, intent.intent_id,
                CheckResult::block(ErrorKind::VALIDATION_FAILURE, "Unable to verify risk limits: malformed response"));
        }
        limits.set(fetched->limits, fetched->timestamp);
    } catch (const std::exception& e) {
        onRiskLimits(std::nullopt);
        return abortConfirm(form, intent.intent_id,
            CheckResult::block(ErrorKind::TRANSIENT_IO, std::string("Unable to verify risk limits: ") + e.what()));
    }

    // The position feed also carries a mark; use it when newer than the last tick.
    if (const PositionRow* row = positions.value->find(form.symbol)) {
        const auto marked_at = row->updated_at ? row->updated_at : positions.observed_at;
        if (row->current_price && row->current_price->isPositive() && marked_at &&
            (!price.observed_at || *marked_at > *price.observed_at)) {
            price.set(*row->current_price, marked_at);
        }
    }

    ValidationInputs in;
    in.safety_initialized = safety_->isInitialized();
    in.kill_switch = safety_->fetchAuthoritative(SafetyKind::KILL_SWITCH, settings_.submit_fetch_timeout);
    in.circuit_breaker = safety_->fetchAuthoritative(SafetyKind::CIRCUIT_BREAKER, settings_.submit_fetch_timeout);
    in.connection = connection;
    in.form = form;
    in.positions = positions;
    in.last_price = price;
    in.buying_power = buying_power;
    in.risk_limits = limits;
    in.thresholds = settings_.thresholds;
    in.now = clock_();

    auto check = OrderValidator::validate(in);
    if (!check.allowed) {
        return abortConfirm(form, intent.intent_id, std::move(check));
    }

    // Phase 3: last look right before dispatch. A session block set during the
    // fetches above (dispose, failed init) wins over everything fetched.
    std::optional<std::string> blocked;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        blocked = blocked_reason_;
        connection = connection_;
    }
    if (blocked) {
        return abortConfirm(form, intent.intent_id, CheckResult::block(ErrorKind::TRANSIENT_IO, *blocked));
    }
    check = OrderValidator::finalGate(
        safety_->current(SafetyKind::KILL_SWITCH),
        safety_->current(SafetyKind::CIRCUIT_BREAKER),
        connection);
    if (!check.allowed) {
        return abortConfirm(form, intent.intent_id, std::move(check));
    }

    OrderRequest request;
    request.client_order_id = intent.intent_id;
    request.form = form;

    SubmitResponse response;
    try {
        response = gateway_->submitOrder(request);
    } catch (const std::exception& e) {
        response.accepted = false;
        response.message = e.what();
    }

    SubmitResult out;
    out.client_order_id = intent.intent_id;

    if (response.accepted) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            applyEventLocked(OrderEntryEvent::ORDER_ACCEPTED);
            if (intent_ && intent_->intent_id == intent.intent_id) {
                intent_.reset();
            }
            previewed_form_.reset();
        }
        if (intent_store_) intent_store_->clear(settings_.session_id);
        LOG_INFO("Order submitted: {} {} {} {}", intent.intent_id, orderSideToString(form.side),
                 form.qty ? form.qty->toString() : std::string(), form.symbol);
        journal(OrderJournalEventType::ORDER_SUBMITTED, intent.intent_id, form.symbol,
                {{"status", response.status}, {"request", request.toJson()}});
        auditOrder(form, intent.intent_id, "SUBMITTED", response.status);
        out.check = CheckResult::pass();
        return out;
    }

    const std::string message = response.message.empty() ? "Unknown error" : response.message;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        applyEventLocked(OrderEntryEvent::ORDER_REJECTED);
        previewed_form_.reset();
    }
    LOG_WARN("Order {} failed: {} (http {})", intent.intent_id, message, response.http_status);
    journal(OrderJournalEventType::ORDER_REJECTED, intent.intent_id, form.symbol,
            {{"http_status", response.http_status}, {"status", response.status}, {"message", message}});
    auditOrder(form, intent.intent_id, "REJECTED", message);
    out.check = CheckResult::block(ErrorKind::VALIDATION_FAILURE, "Order failed: " + message);
    return out;
}

// ---------------------------------------------------------------------------
// Lifecycle

std::optional<OrderIntent> OrderSubmissionPipeline::restorePendingIntent() {
    if (!intent_store_) {
        return std::nullopt;
    }
    auto restored = intent_store_->load(settings_.session_id);
    if (!restored) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    intent_ = restored;
    form_ = restored->form;
    previewed_form_.reset();
    state_ = OrderEntryState::DRAFTING;
    LOG_INFO("Order form restored from previous session (intent {})", restored->intent_id);
    return restored;
}

void OrderSubmissionPipeline::blockAll(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    blocked_reason_ = reason;
}

void OrderSubmissionPipeline::clearBlock() {
    std::lock_guard<std::mutex> lock(mutex_);
    blocked_reason_.reset();
}

void OrderSubmissionPipeline::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (applyEventLocked(OrderEntryEvent::RESET)) {
        previewed_form_.reset();
    }
}

OrderEntryState OrderSubmissionPipeline::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<OrderIntent> OrderSubmissionPipeline::currentIntent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return intent_;
}

void OrderSubmissionPipeline::journal(
    OrderJournalEventType type,
    const std::string& intent_id,
    const std::string& symbol,
    nlohmann::json payload
) {
    if (!journal_) {
        return;
    }
    OrderJournalEvent event;
    event.ts_ms = toEpochMs(clock_());
    event.type = type;
    event.session_id = settings_.session_id;
    event.intent_id = intent_id;
    event.symbol = symbol;
    event.payload = std::move(payload);
    if (!journal_->append(event)) {
        LOG_WARN("Order journal append failed ({})", intent_id);
    }
}

void OrderSubmissionPipeline::auditOrder(
    const OrderForm& form,
    const std::string& intent_id,
    const std::string& outcome,
    const std::string& reason
) {
    Logger::getInstance().logOrder(
        intent_id, form.symbol, orderSideToString(form.side),
        form.qty ? form.qty->toString() : std::string(),
        orderTypeToString(form.order_type), outcome, reason);
}

} // namespace execution
} // namespace core
} // namespace orderguard
