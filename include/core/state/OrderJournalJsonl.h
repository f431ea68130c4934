#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include "core/contracts/IOrderJournal.h"

namespace orderguard {
namespace core {

// Append-only JSONL audit of order outcomes with a monotonic seq.
class OrderJournalJsonl : public IOrderJournal {
public:
    explicit OrderJournalJsonl(std::filesystem::path file_path);

    bool append(const OrderJournalEvent& event) override;
    std::vector<OrderJournalEvent> readFrom(std::uint64_t seq_inclusive) override;
    std::uint64_t lastSeq() const override;

    static const char* toString(OrderJournalEventType type);
    static std::optional<OrderJournalEventType> fromString(const std::string& value);

private:
    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
};

} // namespace core
} // namespace orderguard
