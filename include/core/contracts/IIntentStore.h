#pragma once

#include <optional>
#include <string>

#include "core/model/OrderEntryTypes.h"

namespace orderguard {
namespace core {

// Pending draft per session, for crash/reconnect recovery only.
class IIntentStore {
public:
    virtual ~IIntentStore() = default;

    virtual std::optional<OrderIntent> load(const std::string& session_id) = 0;
    virtual bool save(const std::string& session_id, const OrderIntent& intent) = 0;
    virtual void clear(const std::string& session_id) = 0;
};

} // namespace core
} // namespace orderguard
