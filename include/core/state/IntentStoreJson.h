#pragma once

#include <filesystem>
#include <mutex>

#include "core/contracts/IIntentStore.h"

namespace orderguard {
namespace core {

// One file per session: <dir>/order_entry_<session_id>.json, replaced atomically.
class IntentStoreJson : public IIntentStore {
public:
    explicit IntentStoreJson(std::filesystem::path directory);

    // Unreadable or invalid records are deleted and reported as absent.
    std::optional<OrderIntent> load(const std::string& session_id) override;
    bool save(const std::string& session_id, const OrderIntent& intent) override;
    void clear(const std::string& session_id) override;

    std::filesystem::path pathFor(const std::string& session_id) const;

private:
    std::filesystem::path directory_;
    std::mutex mutex_;
};

} // namespace core
} // namespace orderguard
