#include "core/state/OrderJournalJsonl.h"

#include <algorithm>
#include <fstream>

#include "common/Logger.h"

namespace orderguard {
namespace core {

namespace {
std::uint64_t parseSeq(const nlohmann::json& line) {
    const auto it = line.find("seq");
    if (it == line.end() || !it->is_number_unsigned()) {
        return 0;
    }
    return it->get<std::uint64_t>();
}
}

OrderJournalJsonl::OrderJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    std::size_t skipped = 0;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        const auto line = nlohmann::json::parse(row, nullptr, false);
        if (line.is_discarded() || !line.is_object()) {
            ++skipped;
            continue;
        }
        last_seq_ = (std::max)(last_seq_, parseSeq(line));
    }
    if (skipped > 0) {
        LOG_WARN("Order journal {}: skipped {} malformed line(s)", file_path_.string(), skipped);
    }
}

bool OrderJournalJsonl::append(const OrderJournalEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(file_path_.parent_path(), ec);
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        return false;
    }

    const std::uint64_t next_seq = last_seq_ + 1;
    nlohmann::json line;
    line["seq"] = next_seq;
    line["ts_ms"] = event.ts_ms;
    line["type"] = toString(event.type);
    line["session_id"] = event.session_id;
    line["intent_id"] = event.intent_id;
    line["symbol"] = event.symbol;
    line["payload"] = event.payload;

    out << line.dump() << "\n";
    out.flush();
    if (!out.good()) {
        return false;
    }
    last_seq_ = next_seq;
    return true;
}

std::vector<OrderJournalEvent> OrderJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<OrderJournalEvent> out;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        const auto line = nlohmann::json::parse(row, nullptr, false);
        if (line.is_discarded() || !line.is_object()) {
            continue;
        }

        const auto seq = parseSeq(line);
        const auto type = fromString(line.value("type", std::string()));
        if (seq < seq_inclusive || !type) {
            continue;
        }

        OrderJournalEvent event;
        event.seq = seq;
        event.ts_ms = line.value("ts_ms", 0LL);
        event.type = *type;
        event.session_id = line.value("session_id", std::string());
        event.intent_id = line.value("intent_id", std::string());
        event.symbol = line.value("symbol", std::string());
        event.payload = line.value("payload", nlohmann::json::object());
        out.push_back(std::move(event));
    }

    return out;
}

std::uint64_t OrderJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

const char* OrderJournalJsonl::toString(OrderJournalEventType type) {
    switch (type) {
        case OrderJournalEventType::INTENT_CREATED: return "INTENT_CREATED";
        case OrderJournalEventType::INTENT_DISCARDED: return "INTENT_DISCARDED";
        case OrderJournalEventType::ORDER_BLOCKED: return "ORDER_BLOCKED";
        case OrderJournalEventType::ORDER_SUBMITTED: return "ORDER_SUBMITTED";
        case OrderJournalEventType::ORDER_REJECTED: return "ORDER_REJECTED";
    }
    return "ORDER_BLOCKED";
}

std::optional<OrderJournalEventType> OrderJournalJsonl::fromString(const std::string& value) {
    if (value == "INTENT_CREATED") return OrderJournalEventType::INTENT_CREATED;
    if (value == "INTENT_DISCARDED") return OrderJournalEventType::INTENT_DISCARDED;
    if (value == "ORDER_BLOCKED") return OrderJournalEventType::ORDER_BLOCKED;
    if (value == "ORDER_SUBMITTED") return OrderJournalEventType::ORDER_SUBMITTED;
    if (value == "ORDER_REJECTED") return OrderJournalEventType::ORDER_REJECTED;
    return std::nullopt;
}

} // namespace core
} // namespace orderguard
