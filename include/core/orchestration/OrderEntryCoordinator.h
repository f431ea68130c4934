#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"
#include "core/contracts/IMessageBus.h"
#include "core/contracts/IOrderEntryConsumer.h"
#include "core/contracts/ITradingGateway.h"
#include "core/execution/OrderSubmissionPipeline.h"
#include "core/orchestration/RefreshScheduler.h"
#include "core/subscription/SubscriptionCoordinator.h"
#include "safety/SafetyStateTracker.h"

namespace orderguard {
namespace core {

struct CoordinatorSettings {
    std::string user_id = "local-user";
    Duration init_fetch_timeout{std::chrono::milliseconds(2000)};

    bool enable_refresh = true;
    Duration position_interval{std::chrono::seconds(5)};
    Duration buying_power_interval{std::chrono::seconds(10)};
    Duration risk_limits_interval{std::chrono::seconds(240)};
    Duration fills_interval{std::chrono::seconds(15)};
    std::size_t recent_fills_limit = 50;
};

inline std::string priceChannel(const std::string& symbol) { return "price.updated." + symbol; }
inline std::string positionsChannel(const std::string& user_id) { return "positions:" + user_id; }
inline const char* connectionChannel() { return "connection:state"; }

// One per session. Owns the subscriptions, routes bus messages into the safety
// tracker and the order pipeline, fans them out to display consumers, and runs
// the periodic refreshes.
class OrderEntryCoordinator {
public:
    static constexpr const char* kSafetyOwner = "safety";
    static constexpr const char* kSessionOwner = "session";
    static constexpr const char* kWatchlistOwner = "watchlist";

    OrderEntryCoordinator(
        CoordinatorSettings settings,
        std::shared_ptr<IMessageBus> bus,
        std::shared_ptr<safety::SafetyStateTracker> safety,
        std::shared_ptr<ITradingGateway> gateway,
        std::shared_ptr<execution::OrderSubmissionPipeline> pipeline
    );
    ~OrderEntryCoordinator();

    OrderEntryCoordinator(const OrderEntryCoordinator&) = delete;
    OrderEntryCoordinator& operator=(const OrderEntryCoordinator&) = delete;

    void addConsumer(std::shared_ptr<IOrderEntryConsumer> consumer);
    void removeConsumer(const std::shared_ptr<IOrderEntryConsumer>& consumer);

    // Subscribes the session channels, loads safety state and account data,
    // restores a pending draft and starts the refreshes. On failure everything
    // acquired is released, the pipeline stays blocked and the error is rethrown.
    void initialize();

    // Last call wins. Returns false if the selection was superseded or its
    // price subscription failed (the channel is then retried on reconnect).
    bool selectSymbol(const std::optional<std::string>& symbol);
    std::optional<std::string> selectedSymbol() const;

    void watchlistAdd(const std::string& symbol);
    void watchlistRemove(const std::string& symbol);

    void updateForm(const OrderForm& form);
    PreviewResult preview();
    SubmitResult confirm();

    void refreshPositions();
    void refreshAccount();
    void refreshRiskLimits();
    void refreshFills();

    // Re-fetch safety state, re-issue every subscription, retry failed ones.
    void recoverAfterReconnect();

    // Idempotent. Stops refreshes, cancels pending subscribes, unsubscribes all.
    void dispose();

    bool isInitialized() const { return initialized_.load(); }
    bool isDisposed() const { return disposed_.load(); }
    ConnectionState connectionState() const;

    SubscriptionCoordinator& subscriptions() { return subscriptions_; }
    RefreshScheduler& scheduler() { return scheduler_; }

private:
    HandlerPtr priceHandler(const std::string& symbol);
    HandlerPtr makeSafetyHandler(safety::SafetyKind kind);
    HandlerPtr makePositionsHandler();
    HandlerPtr makeConnectionHandler();

    void onPriceMessage(const nlohmann::json& payload);
    void onConnectionMessage(const nlohmann::json& payload);
    void publishSafetyStates();
    void blockSubmissions(const std::string& reason);

    template <typename Fn>
    void notify(Fn&& fn);

    CoordinatorSettings settings_;
    std::shared_ptr<safety::SafetyStateTracker> safety_;
    std::shared_ptr<ITradingGateway> gateway_;
    std::shared_ptr<execution::OrderSubmissionPipeline> pipeline_;
    SubscriptionCoordinator subscriptions_;
    RefreshScheduler scheduler_;

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<IOrderEntryConsumer>> consumers_;
    std::map<std::string, HandlerPtr> price_handlers_;
    std::optional<ConnectionState> connection_;

    std::mutex selection_mutex_;
    std::uint64_t selection_version_ = 0;
    std::optional<std::string> selected_symbol_;
    std::string selected_owner_;

    std::atomic<bool> initialized_{false};
    std::atomic<bool> disposed_{false};
};

} // namespace core
} // namespace orderguard
