#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace orderguard {
namespace core {

enum class OrderJournalEventType {
    INTENT_CREATED,
    INTENT_DISCARDED,
    ORDER_BLOCKED,
    ORDER_SUBMITTED,
    ORDER_REJECTED
};

struct OrderJournalEvent {
    std::uint64_t seq = 0;
    long long ts_ms = 0;
    OrderJournalEventType type = OrderJournalEventType::ORDER_BLOCKED;
    std::string session_id;
    std::string intent_id;
    std::string symbol;
    nlohmann::json payload = nlohmann::json::object();
};

class IOrderJournal {
public:
    virtual ~IOrderJournal() = default;

    virtual bool append(const OrderJournalEvent& event) = 0;
    virtual std::vector<OrderJournalEvent> readFrom(std::uint64_t seq_inclusive) = 0;
    virtual std::uint64_t lastSeq() const = 0;
};

} // namespace core
} // namespace orderguard
