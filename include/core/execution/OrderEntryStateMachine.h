#pragma once

namespace orderguard {
namespace core {
namespace execution {

enum class OrderEntryState { DRAFTING, PREVIEWING, CONFIRMING, SUBMITTED, REJECTED, ABORTED };

enum class OrderEntryEvent {
    PREVIEW_PASSED,
    PREVIEW_BLOCKED,
    CONFIRM_STARTED,
    CHECK_BLOCKED,
    ORDER_ACCEPTED,
    ORDER_REJECTED,
    FORM_EDITED,
    RESET
};

inline const char* orderEntryStateToString(OrderEntryState state) {
    switch (state) {
        case OrderEntryState::DRAFTING: return "DRAFTING";
        case OrderEntryState::PREVIEWING: return "PREVIEWING";
        case OrderEntryState::CONFIRMING: return "CONFIRMING";
        case OrderEntryState::SUBMITTED: return "SUBMITTED";
        case OrderEntryState::REJECTED: return "REJECTED";
        case OrderEntryState::ABORTED: return "ABORTED";
    }
    return "DRAFTING";
}

inline bool isTerminalState(OrderEntryState state) {
    return state == OrderEntryState::SUBMITTED ||
           state == OrderEntryState::REJECTED ||
           state == OrderEntryState::ABORTED;
}

struct OrderEntryTransitionResult {
    OrderEntryState state = OrderEntryState::DRAFTING;
    bool accepted = false;
};

// Drafting -> Previewing -> Confirming -> Submitted | Rejected | Aborted.
// A terminal state can start a new preview. Nothing but the confirm outcome
// leaves CONFIRMING; refused events keep the current state.
class OrderEntryStateMachine {
public:
    static OrderEntryTransitionResult transition(OrderEntryState current, OrderEntryEvent event);
};

} // namespace execution
} // namespace core
} // namespace orderguard
