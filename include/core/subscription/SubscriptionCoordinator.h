#pragma once

#include <cstddef>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "core/contracts/IMessageBus.h"

namespace orderguard {
namespace core {

// Callback identity is pointer identity: every owner of a channel must pass the same HandlerPtr.
using HandlerPtr = std::shared_ptr<const MessageHandler>;

// Reference-counted channel ownership on top of an IMessageBus.
// One underlying subscription per channel; subscribe on the first owner,
// unsubscribe when the last owner leaves. All state sits behind one mutex and
// bus I/O happens outside it.
class SubscriptionCoordinator {
public:
    explicit SubscriptionCoordinator(std::shared_ptr<IMessageBus> bus);
    ~SubscriptionCoordinator();

    SubscriptionCoordinator(const SubscriptionCoordinator&) = delete;
    SubscriptionCoordinator& operator=(const SubscriptionCoordinator&) = delete;

    // Throws InvariantViolation on a callback mismatch, TransientIoError when the
    // subscribe fails (owners rolled back, channel queued for retry), and
    // CancelledError after dispose().
    void acquire(const std::string& channel, const std::string& owner, HandlerPtr handler);

    void release(const std::string& channel, const std::string& owner);

    // Re-issue every live subscription. Returns the number of channels that failed.
    std::size_t resubscribeAll();

    // Re-acquire channels whose subscribe failed. Returns the number still failing.
    std::size_t retryFailed();

    // Drop every owner and unsubscribe everything; the coordinator stays usable.
    void releaseAll();

    // Cancel pending subscribes, unsubscribe everything, reject later calls.
    void dispose();

    bool isDisposed() const;
    bool isSubscribed(const std::string& channel) const;
    bool isPending(const std::string& channel) const;
    std::set<std::string> owners(const std::string& channel) const;
    std::set<std::string> failedOwners(const std::string& channel) const;
    std::vector<std::string> subscribedChannels() const;
    std::vector<std::string> failedChannels() const;

private:
    enum class OpKind { SUBSCRIBE, UNSUBSCRIBE };

    struct PendingOp {
        OpKind kind = OpKind::SUBSCRIBE;
        std::promise<void> promise;
        std::shared_future<void> future;
        bool settled = false;  // guarded by mutex_
    };

    struct FailedSubscription {
        std::set<std::string> owners;
        HandlerPtr handler;
    };

    static std::shared_ptr<PendingOp> makeOp(OpKind kind);

    void performSubscribe(const std::string& channel, const HandlerPtr& handler,
                          const std::shared_ptr<PendingOp>& op);
    void busSubscribe(const std::string& channel, const HandlerPtr& handler);
    void busUnsubscribe(const std::string& channel);
    void recordFailedLocked(const std::string& channel, const std::set<std::string>& owners,
                            const HandlerPtr& handler);

    std::shared_ptr<IMessageBus> bus_;

    mutable std::mutex mutex_;
    std::map<std::string, std::set<std::string>> owners_;
    std::map<std::string, HandlerPtr> handlers_;
    std::map<std::string, std::shared_ptr<PendingOp>> pending_;
    std::map<std::string, FailedSubscription> failed_;
    std::set<std::string> subscribed_;
    bool disposed_ = false;
};

} // namespace core
} // namespace orderguard
