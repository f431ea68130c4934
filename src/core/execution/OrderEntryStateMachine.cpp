#include "core/execution/OrderEntryStateMachine.h"

namespace orderguard {
namespace core {
namespace execution {

namespace {
OrderEntryTransitionResult accept(OrderEntryState next) {
    OrderEntryTransitionResult result;
    result.state = next;
    result.accepted = true;
    return result;
}

OrderEntryTransitionResult refuse(OrderEntryState current) {
    OrderEntryTransitionResult result;
    result.state = current;
    result.accepted = false;
    return result;
}
} // namespace

OrderEntryTransitionResult OrderEntryStateMachine::transition(OrderEntryState current, OrderEntryEvent event) {
    const bool confirming = (current == OrderEntryState::CONFIRMING);

    switch (event) {
        case OrderEntryEvent::PREVIEW_PASSED:
            return confirming ? refuse(current) : accept(OrderEntryState::PREVIEWING);

        case OrderEntryEvent::PREVIEW_BLOCKED:
            return confirming ? refuse(current) : accept(OrderEntryState::ABORTED);

        case OrderEntryEvent::CONFIRM_STARTED:
            return (current == OrderEntryState::PREVIEWING) ? accept(OrderEntryState::CONFIRMING) : refuse(current);

        case OrderEntryEvent::CHECK_BLOCKED:
            return confirming ? accept(OrderEntryState::ABORTED) : refuse(current);

        case OrderEntryEvent::ORDER_ACCEPTED:
            return confirming ? accept(OrderEntryState::SUBMITTED) : refuse(current);

        case OrderEntryEvent::ORDER_REJECTED:
            return confirming ? accept(OrderEntryState::REJECTED) : refuse(current);

        case OrderEntryEvent::FORM_EDITED:
        case OrderEntryEvent::RESET:
            return confirming ? refuse(current) : accept(OrderEntryState::DRAFTING);
    }
    return refuse(current);
}

} // namespace execution
} // namespace core
} // namespace orderguard
