#include "core/subscription/SubscriptionCoordinator.h"

#include <exception>
#include <utility>

#include "common/Errors.h"
#include "common/Logger.h"

namespace orderguard {
namespace core {

SubscriptionCoordinator::SubscriptionCoordinator(std::shared_ptr<IMessageBus> bus)
    : bus_(std::move(bus)) {}

SubscriptionCoordinator::~SubscriptionCoordinator() {
    dispose();
}

std::shared_ptr<SubscriptionCoordinator::PendingOp> SubscriptionCoordinator::makeOp(OpKind kind) {
    auto op = std::make_shared<PendingOp>();
    op->kind = kind;
    op->future = op->promise.get_future().share();
    return op;
}

void SubscriptionCoordinator::acquire(const std::string& channel, const std::string& owner, HandlerPtr handler) {
    if (!handler || !*handler) {
        throw InvariantViolation("Null callback for channel " + channel);
    }

    for (;;) {
        std::shared_ptr<PendingOp> wait_unsubscribe;
        std::shared_ptr<PendingOp> wait_subscribe;
        std::shared_ptr<PendingOp> mine;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (disposed_) {
                throw CancelledError("Subscription coordinator disposed");
            }

            auto pending = pending_.find(channel);
            if (pending != pending_.end() && pending->second->kind == OpKind::UNSUBSCRIBE) {
                wait_unsubscribe = pending->second;
            } else {
                auto existing = handlers_.find(channel);
                if (existing != handlers_.end() && existing->second != handler) {
                    throw InvariantViolation("Callback mismatch for channel " + channel +
                                             " (owner " + owner + ")");
                }
                handlers_[channel] = handler;
                owners_[channel].insert(owner);

                auto failed = failed_.find(channel);
                if (failed != failed_.end()) {
                    failed->second.owners.erase(owner);
                    if (failed->second.owners.empty()) {
                        failed_.erase(failed);
                    }
                }

                if (subscribed_.count(channel) > 0) {
                    return;
                }
                if (pending != pending_.end()) {
                    wait_subscribe = pending->second;
                } else {
                    mine = makeOp(OpKind::SUBSCRIBE);
                    pending_[channel] = mine;
                }
            }
        }

        if (wait_unsubscribe) {
            wait_unsubscribe->future.wait();
            continue;
        }
        if (wait_subscribe) {
            // Rethrows the shared failure; rollback already happened.
            wait_subscribe->future.get();
            return;
        }
        performSubscribe(channel, handler, mine);
        return;
    }
}

void SubscriptionCoordinator::performSubscribe(
    const std::string& channel,
    const HandlerPtr& handler,
    const std::shared_ptr<PendingOp>& op
) {
    try {
        busSubscribe(channel, handler);
    } catch (const std::exception& e) {
        LOG_WARN("Subscribe failed for {}: {}", channel, e.what());
        const auto error = std::make_exception_ptr(
            TransientIoError("Subscribe failed for " + channel + ": " + e.what()));

        bool settle = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto pending = pending_.find(channel);
            if (pending != pending_.end() && pending->second == op) {
                pending_.erase(pending);
            }
            auto it = owners_.find(channel);
            if (it != owners_.end()) {
                if (!disposed_ && !it->second.empty()) {
                    recordFailedLocked(channel, it->second, handler);
                }
                owners_.erase(it);
            }
            handlers_.erase(channel);
            settle = !op->settled;
            op->settled = true;
        }
        if (settle) {
            op->promise.set_exception(error);
        }
        std::rethrow_exception(error);
    }

    bool cancelled = false;
    bool orphaned = false;
    bool settle = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto pending = pending_.find(channel);
        if (pending != pending_.end() && pending->second == op) {
            pending_.erase(pending);
        }
        if (disposed_) {
            cancelled = true;
        } else {
            auto it = owners_.find(channel);
            if (it == owners_.end() || it->second.empty()) {
                // Every owner left while the subscribe was in flight.
                orphaned = true;
                owners_.erase(channel);
                handlers_.erase(channel);
            } else {
                subscribed_.insert(channel);
            }
        }
        settle = !op->settled;
        op->settled = true;
    }

    if (cancelled || orphaned) {
        busUnsubscribe(channel);
    }
    if (settle) {
        if (cancelled) {
            op->promise.set_exception(std::make_exception_ptr(CancelledError("Subscription coordinator disposed")));
        } else {
            op->promise.set_value();
        }
    }
    if (cancelled) {
        throw CancelledError("Subscription coordinator disposed");
    }
    if (orphaned) {
        LOG_DEBUG("Channel {} orphaned before subscribe completed; unsubscribed", channel);
    }
}

void SubscriptionCoordinator::release(const std::string& channel, const std::string& owner) {
    std::shared_ptr<PendingOp> op;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto failed = failed_.find(channel);
        if (failed != failed_.end()) {
            failed->second.owners.erase(owner);
            if (failed->second.owners.empty()) {
                failed_.erase(failed);
            }
        }

        auto it = owners_.find(channel);
        if (it == owners_.end()) {
            return;
        }
        it->second.erase(owner);
        if (!it->second.empty()) {
            return;
        }
        owners_.erase(it);

        // A pending subscribe sees the empty owner set on completion and cleans up itself.
        if (subscribed_.erase(channel) == 0) {
            return;
        }
        handlers_.erase(channel);
        op = makeOp(OpKind::UNSUBSCRIBE);
        pending_[channel] = op;
    }

    busUnsubscribe(channel);

    bool settle = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto pending = pending_.find(channel);
        if (pending != pending_.end() && pending->second == op) {
            pending_.erase(pending);
        }
        settle = !op->settled;
        op->settled = true;
    }
    if (settle) {
        op->promise.set_value();
    }
}

std::size_t SubscriptionCoordinator::resubscribeAll() {
    std::vector<std::pair<std::string, HandlerPtr>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return 0;
        }
        for (const auto& channel : subscribed_) {
            auto handler = handlers_.find(channel);
            if (handler != handlers_.end() && handler->second) {
                targets.emplace_back(channel, handler->second);
            }
        }
    }

    std::size_t failures = 0;
    for (const auto& [channel, handler] : targets) {
        try {
            busSubscribe(channel, handler);
        } catch (const std::exception& e) {
            ++failures;
            LOG_WARN("Resubscribe failed for {}: {}", channel, e.what());
            std::lock_guard<std::mutex> lock(mutex_);
            if (disposed_ || subscribed_.erase(channel) == 0) {
                continue;
            }
            auto it = owners_.find(channel);
            if (it != owners_.end()) {
                recordFailedLocked(channel, it->second, handler);
                owners_.erase(it);
            }
            handlers_.erase(channel);
            continue;
        }

        // The last owner may have left, or the session closed, while the call was in flight.
        HandlerPtr current;
        bool stale = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = owners_.find(channel);
            if (disposed_ || subscribed_.count(channel) == 0 || it == owners_.end() || it->second.empty()) {
                stale = true;
            } else {
                auto registered = handlers_.find(channel);
                if (registered != handlers_.end() && registered->second != handler) {
                    current = registered->second;
                }
            }
        }
        if (stale) {
            LOG_DEBUG("Channel {} lost its owners during resubscribe; unsubscribed", channel);
            busUnsubscribe(channel);
        } else if (current) {
            try {
                busSubscribe(channel, current);
            } catch (const std::exception& e) {
                LOG_WARN("Handler refresh failed for {}: {}", channel, e.what());
            }
        }
    }
    LOG_INFO("Resubscribed {} channel(s), {} failed", targets.size() - failures, failures);
    return failures;
}

std::size_t SubscriptionCoordinator::retryFailed() {
    std::map<std::string, FailedSubscription> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return 0;
        }
        snapshot.swap(failed_);
    }

    std::size_t failures = 0;
    for (const auto& [channel, record] : snapshot) {
        if (record.owners.empty() || !record.handler) {
            continue;
        }
        auto owner = record.owners.begin();
        try {
            for (; owner != record.owners.end(); ++owner) {
                acquire(channel, *owner, record.handler);
            }
        } catch (const CancelledError&) {
            return failures;
        } catch (const OrderGuardError& e) {
            ++failures;
            LOG_WARN("Retry failed for {}: {}", channel, e.what());
            // Owners not yet re-acquired stay queued with the ones acquire() rolled back.
            std::set<std::string> remaining(owner, record.owners.end());
            std::lock_guard<std::mutex> lock(mutex_);
            if (!disposed_) {
                recordFailedLocked(channel, remaining, record.handler);
            }
        }
    }
    return failures;
}

void SubscriptionCoordinator::releaseAll() {
    std::vector<std::string> channels;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channels.assign(subscribed_.begin(), subscribed_.end());
        subscribed_.clear();
        owners_.clear();
        failed_.clear();
        for (const auto& channel : channels) {
            handlers_.erase(channel);
        }
    }
    for (const auto& channel : channels) {
        busUnsubscribe(channel);
    }
}

void SubscriptionCoordinator::dispose() {
    std::vector<std::string> channels;
    std::vector<std::shared_ptr<PendingOp>> to_settle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return;
        }
        disposed_ = true;
        channels.assign(subscribed_.begin(), subscribed_.end());
        for (auto& [channel, op] : pending_) {
            if (!op->settled) {
                op->settled = true;
                to_settle.push_back(op);
            }
        }
        pending_.clear();
        subscribed_.clear();
        owners_.clear();
        handlers_.clear();
        failed_.clear();
    }

    for (auto& op : to_settle) {
        if (op->kind == OpKind::SUBSCRIBE) {
            op->promise.set_exception(std::make_exception_ptr(CancelledError("Subscription coordinator disposed")));
        } else {
            op->promise.set_value();
        }
    }
    for (const auto& channel : channels) {
        busUnsubscribe(channel);
    }
}

bool SubscriptionCoordinator::isDisposed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disposed_;
}

bool SubscriptionCoordinator::isSubscribed(const std::string& channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribed_.count(channel) > 0;
}

bool SubscriptionCoordinator::isPending(const std::string& channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(channel) > 0;
}

std::set<std::string> SubscriptionCoordinator::owners(const std::string& channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = owners_.find(channel);
    return it == owners_.end() ? std::set<std::string>{} : it->second;
}

std::set<std::string> SubscriptionCoordinator::failedOwners(const std::string& channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = failed_.find(channel);
    return it == failed_.end() ? std::set<std::string>{} : it->second.owners;
}

std::vector<std::string> SubscriptionCoordinator::subscribedChannels() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(subscribed_.begin(), subscribed_.end());
}

std::vector<std::string> SubscriptionCoordinator::failedChannels() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& [channel, record] : failed_) {
        out.push_back(channel);
    }
    return out;
}

void SubscriptionCoordinator::busSubscribe(const std::string& channel, const HandlerPtr& handler) {
    HandlerPtr keep = handler;
    bus_->subscribe(channel, [keep](const nlohmann::json& data) { (*keep)(data); });
}

void SubscriptionCoordinator::busUnsubscribe(const std::string& channel) {
    try {
        bus_->unsubscribe(channel);
    } catch (const std::exception& e) {
        LOG_WARN("Unsubscribe failed for {}: {}", channel, e.what());
    }
}

void SubscriptionCoordinator::recordFailedLocked(
    const std::string& channel,
    const std::set<std::string>& owners,
    const HandlerPtr& handler
) {
    auto& record = failed_[channel];
    record.owners.insert(owners.begin(), owners.end());
    record.handler = handler;
}

} // namespace core
} // namespace orderguard
