#include "core/orchestration/OrderEntryCoordinator.h"

#include <algorithm>

#include "common/Errors.h"
#include "common/Logger.h"
#include "common/ParseUtils.h"
#include "core/model/PayloadParsers.h"

namespace orderguard {
namespace core {

using safety::SafetyKind;

namespace {
const char* const kPositionsJob = "positions";
const char* const kAccountJob = "buying_power";
const char* const kRiskLimitsJob = "risk_limits";
const char* const kFillsJob = "fills";
}

OrderEntryCoordinator::OrderEntryCoordinator(
    CoordinatorSettings settings,
    std::shared_ptr<IMessageBus> bus,
    std::shared_ptr<safety::SafetyStateTracker> safety,
    std::shared_ptr<ITradingGateway> gateway,
    std::shared_ptr<execution::OrderSubmissionPipeline> pipeline
)
    : settings_(std::move(settings))
    , safety_(std::move(safety))
    , gateway_(std::move(gateway))
    , pipeline_(std::move(pipeline))
    , subscriptions_(std::move(bus)) {
    if (!safety_ || !gateway_ || !pipeline_) {
        throw InvariantViolation("OrderEntryCoordinator requires safety tracker, gateway and pipeline");
    }
    scheduler_.addJob(kPositionsJob, settings_.position_interval, [this]() { refreshPositions(); });
    scheduler_.addJob(kAccountJob, settings_.buying_power_interval, [this]() { refreshAccount(); });
    scheduler_.addJob(kRiskLimitsJob, settings_.risk_limits_interval, [this]() { refreshRiskLimits(); });
    scheduler_.addJob(kFillsJob, settings_.fills_interval, [this]() { refreshFills(); });
}

OrderEntryCoordinator::~OrderEntryCoordinator() {
    dispose();
}

// ---------------------------------------------------------------------------
// Consumers

void OrderEntryCoordinator::addConsumer(std::shared_ptr<IOrderEntryConsumer> consumer) {
    if (!consumer) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    consumers_.push_back(std::move(consumer));
}

void OrderEntryCoordinator::removeConsumer(const std::shared_ptr<IOrderEntryConsumer>& consumer) {
    std::lock_guard<std::mutex> lock(mutex_);
    consumers_.erase(std::remove(consumers_.begin(), consumers_.end(), consumer), consumers_.end());
}

template <typename Fn>
void OrderEntryCoordinator::notify(Fn&& fn) {
    std::vector<std::shared_ptr<IOrderEntryConsumer>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets = consumers_;
    }
    for (const auto& consumer : targets) {
        try {
            fn(*consumer);
        } catch (const std::exception& e) {
            LOG_WARN("Order entry consumer failed: {}", e.what());
        }
    }
}

// ---------------------------------------------------------------------------
// Session lifecycle

void OrderEntryCoordinator::initialize() {
    if (disposed_) {
        throw CancelledError("Session disposed");
    }
    if (initialized_) {
        return;
    }

    LOG_INFO("Initializing order entry session for {}", settings_.user_id);
    try {
        subscriptions_.acquire(safety::safetyChannel(SafetyKind::KILL_SWITCH), kSafetyOwner,
                               makeSafetyHandler(SafetyKind::KILL_SWITCH));
        subscriptions_.acquire(safety::safetyChannel(SafetyKind::CIRCUIT_BREAKER), kSafetyOwner,
                               makeSafetyHandler(SafetyKind::CIRCUIT_BREAKER));
        subscriptions_.acquire(connectionChannel(), kSessionOwner, makeConnectionHandler());
        subscriptions_.acquire(positionsChannel(settings_.user_id), kSessionOwner, makePositionsHandler());

        safety_->initialize(settings_.init_fetch_timeout);
        publishSafetyStates();

        refreshRiskLimits();
        refreshPositions();
        refreshAccount();

        if (const auto restored = pipeline_->restorePendingIntent()) {
            selectSymbol(restored->form.symbol);
        }

        if (settings_.enable_refresh) {
            scheduler_.start();
        }
        pipeline_->clearBlock();
        initialized_ = true;
        LOG_INFO("Order entry session ready");
    } catch (const std::exception& e) {
        LOG_ERROR("Order entry initialization failed: {}", e.what());
        // The scheduler cannot be restarted; leave it alone unless it already runs.
        if (scheduler_.isRunning()) {
            scheduler_.stop();
        }
        subscriptions_.releaseAll();
        blockSubmissions("Initialization failed - please refresh");
        throw;
    }
}

void OrderEntryCoordinator::dispose() {
    if (disposed_.exchange(true)) {
        return;
    }
    scheduler_.stop();
    subscriptions_.dispose();
    pipeline_->blockAll("Session closed");
    LOG_INFO("Order entry session disposed");
}

ConnectionState OrderEntryCoordinator::connectionState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connection_.value_or(ConnectionState::UNKNOWN);
}

// ---------------------------------------------------------------------------
// Symbol selection and watchlist

bool OrderEntryCoordinator::selectSymbol(const std::optional<std::string>& requested) {
    if (disposed_) {
        return false;
    }

    std::optional<std::string> symbol;
    if (requested) {
        symbol = utils::normalizeSymbol(*requested);
        if (!symbol) {
            LOG_WARN("Ignoring invalid symbol selection: {}", *requested);
            return false;
        }
    }

    std::uint64_t version = 0;
    {
        std::lock_guard<std::mutex> lock(selection_mutex_);
        version = ++selection_version_;
        if (symbol == selected_symbol_) {
            return true;
        }
    }

    // Each selection holds its own owner id so a superseded one can back out
    // without touching a newer claim on the same channel.
    const std::string owner = "selected#" + std::to_string(version);
    bool subscribed = true;
    if (symbol) {
        try {
            subscriptions_.acquire(priceChannel(*symbol), owner, priceHandler(*symbol));
        } catch (const CancelledError&) {
            return false;
        } catch (const TransientIoError& e) {
            LOG_WARN("Price subscription for {} failed: {}", *symbol, e.what());
            subscribed = false;
        }
    }

    std::optional<std::string> previous;
    std::string previous_owner;
    bool superseded = false;
    {
        std::lock_guard<std::mutex> lock(selection_mutex_);
        superseded = version != selection_version_ || disposed_;
        if (!superseded) {
            previous = selected_symbol_;
            previous_owner = selected_owner_;
            selected_symbol_ = symbol;
            selected_owner_ = symbol ? owner : std::string();
            pipeline_->setSelectedSymbol(symbol);
        }
    }
    if (superseded) {
        if (symbol) {
            subscriptions_.release(priceChannel(*symbol), owner);
        }
        LOG_DEBUG("Selection of {} superseded", symbol.value_or("<none>"));
        return false;
    }

    if (previous) {
        subscriptions_.release(priceChannel(*previous), previous_owner);
    }
    LOG_INFO("Selected symbol: {}", symbol.value_or("<none>"));
    notify([&symbol](IOrderEntryConsumer& c) { c.onSymbolChanged(symbol); });
    return subscribed;
}

std::optional<std::string> OrderEntryCoordinator::selectedSymbol() const {
    return pipeline_->selectedSymbol();
}

void OrderEntryCoordinator::watchlistAdd(const std::string& symbol) {
    const auto normalized = utils::normalizeSymbol(symbol);
    if (!normalized) {
        throw std::invalid_argument("Invalid symbol format: " + symbol);
    }
    subscriptions_.acquire(priceChannel(*normalized), kWatchlistOwner, priceHandler(*normalized));
}

void OrderEntryCoordinator::watchlistRemove(const std::string& symbol) {
    const auto normalized = utils::normalizeSymbol(symbol);
    if (!normalized) {
        return;
    }
    subscriptions_.release(priceChannel(*normalized), kWatchlistOwner);
}

// ---------------------------------------------------------------------------
// Order entry

void OrderEntryCoordinator::updateForm(const OrderForm& form) {
    pipeline_->updateForm(form);
}

PreviewResult OrderEntryCoordinator::preview() {
    if (disposed_) {
        PreviewResult closed;
        closed.check = CheckResult::block(ErrorKind::CANCELLED, "Session closed");
        return closed;
    }
    auto result = pipeline_->preview();
    if (!result.check.allowed) {
        const std::string reason = result.check.reason;
        notify([&reason](IOrderEntryConsumer& c) { c.onSubmissionBlocked(reason); });
    }
    return result;
}

SubmitResult OrderEntryCoordinator::confirm() {
    if (disposed_) {
        SubmitResult closed;
        closed.check = CheckResult::block(ErrorKind::CANCELLED, "Session closed");
        return closed;
    }
    auto result = pipeline_->confirm();
    if (!result.check.allowed) {
        const std::string reason = result.check.reason;
        notify([&reason](IOrderEntryConsumer& c) { c.onSubmissionBlocked(reason); });
    }
    return result;
}

void OrderEntryCoordinator::blockSubmissions(const std::string& reason) {
    pipeline_->blockAll(reason);
    notify([&reason](IOrderEntryConsumer& c) { c.onSubmissionBlocked(reason); });
}

// ---------------------------------------------------------------------------
// Refreshes. A failed fetch leaves the field unusable until the next success.

void OrderEntryCoordinator::refreshPositions() {
    if (disposed_) return;
    std::optional<PositionsSnapshot> snapshot;
    try {
        snapshot = gateway_->fetchPositions();
        if (!snapshot) {
            LOG_WARN("Positions response malformed");
        }
    } catch (const std::exception& e) {
        LOG_WARN("Positions refresh failed: {}", e.what());
    }
    pipeline_->onPositions(snapshot);
    if (snapshot) {
        notify([&snapshot](IOrderEntryConsumer& c) { c.onPositions(*snapshot); });
    }
}

void OrderEntryCoordinator::refreshAccount() {
    if (disposed_) return;
    std::optional<AccountSnapshot> account;
    try {
        account = gateway_->fetchAccount();
        if (!account) {
            LOG_WARN("Account response malformed");
        }
    } catch (const std::exception& e) {
        LOG_WARN("Buying power refresh failed: {}", e.what());
    }
    pipeline_->onAccount(account);
    if (account) {
        notify([&account](IOrderEntryConsumer& c) { c.onAccount(*account); });
    }
}

void OrderEntryCoordinator::refreshRiskLimits() {
    if (disposed_) return;
    std::optional<RiskLimitsSnapshot> limits;
    try {
        limits = gateway_->fetchRiskLimits();
        if (!limits) {
            LOG_WARN("Risk limits response malformed");
        }
    } catch (const std::exception& e) {
        LOG_WARN("Risk limits refresh failed: {}", e.what());
    }
    pipeline_->onRiskLimits(limits);
}

void OrderEntryCoordinator::refreshFills() {
    if (disposed_) return;
    std::vector<FillRecord> fills;
    try {
        fills = gateway_->fetchRecentFills(settings_.recent_fills_limit);
    } catch (const std::exception& e) {
        LOG_WARN("Fills refresh failed: {}", e.what());
        return;
    }
    notify([&fills](IOrderEntryConsumer& c) { c.onFills(fills); });
}

// ---------------------------------------------------------------------------
// Bus handlers

HandlerPtr OrderEntryCoordinator::priceHandler(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& handler = price_handlers_[symbol];
    if (!handler) {
        handler = std::make_shared<const MessageHandler>(
            [this](const nlohmann::json& payload) { onPriceMessage(payload); });
    }
    return handler;
}

void OrderEntryCoordinator::onPriceMessage(const nlohmann::json& payload) {
    if (disposed_) return;
    const auto tick = parsePriceTick(payload);
    if (!tick) {
        LOG_WARN("Dropping malformed price tick");
        return;
    }
    pipeline_->onPriceTick(*tick);
    notify([&tick](IOrderEntryConsumer& c) { c.onPrice(*tick); });
}

HandlerPtr OrderEntryCoordinator::makeSafetyHandler(SafetyKind kind) {
    return std::make_shared<const MessageHandler>([this, kind](const nlohmann::json& payload) {
        if (disposed_) return;
        const auto state = safety_->applyPush(kind, payload);
        if (!state.isSafe()) {
            LOG_WARN("{}: {}", safety::safetyLabel(kind), state.reason.value_or("unsafe"));
        }
        notify([kind, &state](IOrderEntryConsumer& c) { c.onSafetyState(kind, state); });
    });
}

HandlerPtr OrderEntryCoordinator::makePositionsHandler() {
    return std::make_shared<const MessageHandler>([this](const nlohmann::json& payload) {
        if (disposed_) return;
        const auto snapshot = parsePositions(payload);
        if (!snapshot) {
            LOG_WARN("Malformed positions push; positions unusable until next refresh");
        }
        pipeline_->onPositions(snapshot);
        if (snapshot) {
            notify([&snapshot](IOrderEntryConsumer& c) { c.onPositions(*snapshot); });
        }
    });
}

HandlerPtr OrderEntryCoordinator::makeConnectionHandler() {
    return std::make_shared<const MessageHandler>([this](const nlohmann::json& payload) {
        onConnectionMessage(payload);
    });
}

void OrderEntryCoordinator::onConnectionMessage(const nlohmann::json& payload) {
    if (disposed_) return;
    const ConnectionState state = parseConnectionState(payload);

    std::optional<ConnectionState> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = connection_;
        connection_ = state;
    }
    pipeline_->setConnectionState(state);
    if (previous != state) {
        LOG_INFO("Connection state: {}", connectionStateToString(state));
    }
    notify([state](IOrderEntryConsumer& c) { c.onConnectionState(state); });

    // The first report is not a reconnect. DEGRADED -> CONNECTED kept its
    // subscriptions; anything else may have lost them.
    const bool recovered = state == ConnectionState::CONNECTED && previous &&
        *previous != ConnectionState::CONNECTED &&
        *previous != ConnectionState::DEGRADED;
    if (recovered && initialized_) {
        if (!scheduler_.post([this]() { recoverAfterReconnect(); })) {
            recoverAfterReconnect();
        }
    }
}

void OrderEntryCoordinator::recoverAfterReconnect() {
    if (disposed_) return;
    LOG_INFO("Connection restored, re-verifying session");
    safety_->fetchAuthoritative(SafetyKind::KILL_SWITCH, settings_.init_fetch_timeout);
    safety_->fetchAuthoritative(SafetyKind::CIRCUIT_BREAKER, settings_.init_fetch_timeout);
    publishSafetyStates();

    const std::size_t resubscribe_failures = subscriptions_.resubscribeAll();
    const std::size_t retry_failures = subscriptions_.retryFailed();
    if (resubscribe_failures > 0 || retry_failures > 0) {
        LOG_WARN("Reconnect recovery incomplete: {} resubscribe, {} retry failure(s)",
                 resubscribe_failures, retry_failures);
    }
}

void OrderEntryCoordinator::publishSafetyStates() {
    const auto ks = safety_->current(SafetyKind::KILL_SWITCH);
    const auto cb = safety_->current(SafetyKind::CIRCUIT_BREAKER);
    notify([&ks, &cb](IOrderEntryConsumer& c) {
        c.onSafetyState(SafetyKind::KILL_SWITCH, ks);
        c.onSafetyState(SafetyKind::CIRCUIT_BREAKER, cb);
    });
}

} // namespace core
} // namespace orderguard
