#include "core/state/OrderJournalJsonl.h"

#include <filesystem>
#include <fstream>
#include <iostream>

int main() {
    const auto path = std::filesystem::temp_directory_path() / "orderguard_tests" / "test_order_journal.jsonl";
    std::error_code ec;
    std::filesystem::remove(path, ec);

    orderguard::core::OrderJournalJsonl journal(path);

    orderguard::core::OrderJournalEvent first;
    first.ts_ms = 1000;
    first.type = orderguard::core::OrderJournalEventType::INTENT_CREATED;
    first.session_id = "desk-1";
    first.intent_id = "a1b2";
    first.symbol = "AAPL";
    first.payload["qty"] = "10";

    orderguard::core::OrderJournalEvent second;
    second.ts_ms = 2000;
    second.type = orderguard::core::OrderJournalEventType::ORDER_SUBMITTED;
    second.session_id = "desk-1";
    second.intent_id = "a1b2";
    second.symbol = "AAPL";
    second.payload["status"] = "accepted";

    if (!journal.append(first)) {
        std::cerr << "[TEST] append(first) failed\n";
        return 1;
    }
    if (!journal.append(second)) {
        std::cerr << "[TEST] append(second) failed\n";
        return 1;
    }

    if (journal.lastSeq() != 2) {
        std::cerr << "[TEST] lastSeq should be 2, got " << journal.lastSeq() << "\n";
        return 1;
    }

    const auto rows = journal.readFrom(2);
    if (rows.size() != 1) {
        std::cerr << "[TEST] readFrom(2) should return one row, got " << rows.size() << "\n";
        return 1;
    }
    if (rows.front().type != orderguard::core::OrderJournalEventType::ORDER_SUBMITTED ||
        rows.front().intent_id != "a1b2") {
        std::cerr << "[TEST] unexpected row at seq 2\n";
        return 1;
    }
    if (rows.front().payload.value("status", std::string()) != "accepted") {
        std::cerr << "[TEST] payload not preserved\n";
        return 1;
    }

    // A torn write must not break replay or seq recovery.
    {
        std::ofstream out(path, std::ios::binary | std::ios::app);
        out << "{\"seq\":3,\"type\":\"ORDER_BL";
        out << "\n";
    }

    orderguard::core::OrderJournalJsonl reopened(path);
    if (reopened.lastSeq() != 2) {
        std::cerr << "[TEST] reopened lastSeq should be 2, got " << reopened.lastSeq() << "\n";
        return 1;
    }
    orderguard::core::OrderJournalEvent third = first;
    third.type = orderguard::core::OrderJournalEventType::ORDER_BLOCKED;
    if (!reopened.append(third) || reopened.lastSeq() != 3) {
        std::cerr << "[TEST] append after reopen failed\n";
        return 1;
    }
    if (reopened.readFrom(1).size() != 3) {
        std::cerr << "[TEST] readFrom(1) should skip the torn line\n";
        return 1;
    }

    std::cout << "[TEST] OrderJournal PASSED\n";
    return 0;
}
