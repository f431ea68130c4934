#include "core/execution/OrderSubmissionPipeline.h"

#include <cassert>
#include <iostream>
#include <memory>

#include "fakes/FakeIntentStore.h"
#include "fakes/FakeSafetyStateSource.h"
#include "fakes/FakeTradingGateway.h"
#include "fakes/TestSupport.h"

using namespace orderguard;
using namespace orderguard::core;
using namespace orderguard::core::execution;
using orderguard::fakes::at;
using orderguard::fakes::dec;

namespace {
const std::string kSession = "desk-1";

struct Harness {
    std::shared_ptr<fakes::FakeSafetyStateSource> source = std::make_shared<fakes::FakeSafetyStateSource>();
    std::shared_ptr<safety::SafetyStateTracker> tracker;
    std::shared_ptr<fakes::FakeTradingGateway> gateway = std::make_shared<fakes::FakeTradingGateway>();
    std::shared_ptr<fakes::FakeIntentStore> store = std::make_shared<fakes::FakeIntentStore>();
    std::shared_ptr<fakes::MemoryJournal> journal = std::make_shared<fakes::MemoryJournal>();
    fakes::ManualClock clock{at(1000)};
    std::shared_ptr<OrderSubmissionPipeline> pipeline;

    Harness() {
        source->set("kill_switch:state", R"({"state":"ACTIVE"})");
        source->set("circuit_breaker:state", R"({"state":"OPEN"})");
        tracker = std::make_shared<safety::SafetyStateTracker>(source);
        tracker->initialize(std::chrono::milliseconds(500));

        PositionsSnapshot positions;
        positions.rows.push_back({"AAPL", dec("100"), dec("150"), at(0)});
        positions.timestamp = at(0);
        gateway->positions = positions;

        AccountSnapshot account;
        account.buying_power = dec("100000");
        account.timestamp = at(0);
        gateway->account = account;

        RiskLimitsSnapshot limits;
        limits.timestamp = at(0);
        gateway->risk_limits = limits;

        PipelineSettings settings;
        settings.session_id = kSession;
        pipeline = std::make_shared<OrderSubmissionPipeline>(
            settings, tracker, gateway, store, journal, clock);

        pipeline->setConnectionState(ConnectionState::CONNECTED);
        pipeline->setSelectedSymbol(std::string("AAPL"));
        pipeline->onPriceTick(tick("150", at(500)));
        pipeline->onPositions(gateway->positions);
        pipeline->onAccount(gateway->account);
        pipeline->onRiskLimits(gateway->risk_limits);
        pipeline->updateForm(marketBuy("10"));
    }

    static PriceTick tick(const std::string& price, Timestamp ts) {
        PriceTick t;
        t.symbol = "AAPL";
        t.price = dec(price);
        t.timestamp = ts;
        t.event_type = "trade";
        return t;
    }

    static OrderForm marketBuy(const std::string& qty) {
        OrderForm form;
        form.symbol = "AAPL";
        form.side = OrderSide::BUY;
        form.qty = dec(qty);
        form.order_type = OrderType::MARKET;
        return form;
    }
};
}

int main() {
    {
        // Same form previews to the same intent; any change yields a new one.
        Harness h;
        auto first = h.pipeline->preview();
        assert(first.check.allowed);
        assert(first.intent_id.size() == 32);
        assert(h.pipeline->state() == OrderEntryState::PREVIEWING);
        assert(h.store->has(kSession));

        auto again = h.pipeline->preview();
        assert(again.intent_id == first.intent_id);
        assert(h.journal->count(OrderJournalEventType::INTENT_CREATED) == 1);

        h.pipeline->updateForm(Harness::marketBuy("11"));
        assert(!h.pipeline->currentIntent().has_value());
        assert(!h.store->has(kSession));
        assert(h.journal->count(OrderJournalEventType::INTENT_DISCARDED) == 1);

        auto changed = h.pipeline->preview();
        assert(changed.check.allowed);
        assert(changed.intent_id != first.intent_id);

        h.pipeline->updateForm(Harness::marketBuy("10"));
        auto back = h.pipeline->preview();
        assert(back.intent_id != first.intent_id);
        assert(back.intent_id != changed.intent_id);
    }

    {
        Harness h;
        auto preview = h.pipeline->preview();
        assert(*preview.impact.notional == dec("1500"));
        assert(*preview.impact.percentage == dec("1.5"));
        assert(!preview.impact.warning);

        auto result = h.pipeline->confirm();
        assert(result.check.allowed);
        assert(result.client_order_id == preview.intent_id);
        assert(h.gateway->submitCount() == 1);
        assert(h.gateway->submitted[0].client_order_id == preview.intent_id);
        assert(h.pipeline->state() == OrderEntryState::SUBMITTED);
        assert(!h.pipeline->currentIntent().has_value());
        assert(!h.store->has(kSession));
        assert(h.journal->count(OrderJournalEventType::ORDER_SUBMITTED) == 1);

        // No second submission without a new preview.
        auto repeat = h.pipeline->confirm();
        assert(!repeat.check.allowed);
        assert(repeat.check.reason == "Preview the order first");
        assert(h.gateway->submitCount() == 1);
    }

    {
        Harness h;
        auto r = h.pipeline->confirm();
        assert(r.check.reason == "Preview the order first");

        h.pipeline->preview();
        h.pipeline->updateForm(Harness::marketBuy("12"));
        r = h.pipeline->confirm();
        assert(!r.check.allowed);
        assert(r.check.reason == "Preview the order first");
        assert(h.gateway->submitCount() == 0);
    }

    {
        // Authoritative safety state is re-read at confirm time.
        Harness h;
        assert(h.pipeline->preview().check.allowed);
        h.source->set("kill_switch:state",
            R"({"state":"ENGAGED","engaged_at":"2026-03-02T14:29:00Z","engagement_reason":"risk desk"})");

        auto r = h.pipeline->confirm();
        assert(!r.check.allowed);
        assert(r.check.kind == ErrorKind::SAFETY_BLOCKED);
        assert(r.check.reason == "Kill switch engaged: risk desk");
        assert(h.gateway->submitCount() == 0);
        assert(h.pipeline->state() == OrderEntryState::ABORTED);
        assert(h.journal->count(OrderJournalEventType::ORDER_BLOCKED) == 1);
    }

    {
        // Safety store unreachable at confirm: blocked, not submitted.
        Harness h;
        assert(h.pipeline->preview().check.allowed);
        h.source->setFail(true);
        auto r = h.pipeline->confirm();
        assert(!r.check.allowed);
        assert(r.check.reason.find("Unable to verify kill switch") == 0);
        assert(h.gateway->submitCount() == 0);
    }

    {
        Harness h;
        h.tracker->applyPush(safety::SafetyKind::CIRCUIT_BREAKER,
            {{"state", "TRIPPED"}, {"tripped_at", "2026-03-02T14:29:00Z"}, {"trip_reason", "drawdown"}});
        auto r = h.pipeline->preview();
        assert(!r.check.allowed);
        assert(r.check.reason == "Circuit breaker tripped: drawdown");
        assert(h.pipeline->state() == OrderEntryState::ABORTED);
        assert(!h.pipeline->currentIntent().has_value());
    }

    {
        // Price age exactly at the threshold passes; one millisecond older does not.
        Harness h;
        h.pipeline->setSelectedSymbol(std::string("MSFT"));
        h.pipeline->setSelectedSymbol(std::string("AAPL"));
        h.pipeline->onPriceTick(Harness::tick("150", at(1000 - 30000)));
        assert(h.pipeline->preview().check.allowed);

        h.clock.advance(std::chrono::milliseconds(1));
        auto r = h.pipeline->preview();
        assert(!r.check.allowed);
        assert(r.check.reason == "Price data stale");
    }

    {
        Harness h;
        // Older ticks never replace a newer one.
        h.pipeline->onPriceTick(Harness::tick("1", at(100)));
        auto preview = h.pipeline->preview();
        assert(*preview.impact.notional == dec("1500"));

        // Ticks for other symbols are ignored.
        PriceTick other = Harness::tick("999", at(900));
        other.symbol = "MSFT";
        h.pipeline->onPriceTick(other);
        assert(*h.pipeline->preview().impact.notional == dec("1500"));
    }

    {
        Harness h;
        h.pipeline->setConnectionState(ConnectionState::RECONNECTING);
        auto r = h.pipeline->preview();
        assert(!r.check.allowed);
        assert(r.check.reason == "Connection: RECONNECTING");

        h.pipeline->setConnectionState(ConnectionState::UNKNOWN);
        assert(h.pipeline->preview().check.reason == "Connection unavailable");
    }

    {
        // A failed refresh invalidates the cached value.
        Harness h;
        assert(h.pipeline->preview().check.allowed);
        h.gateway->fail_positions = true;
        auto r = h.pipeline->confirm();
        assert(!r.check.allowed);
        assert(r.check.kind == ErrorKind::TRANSIENT_IO);
        assert(r.check.reason == "Unable to verify positions: positions service down");
        assert(h.gateway->submitCount() == 0);

        auto after = h.pipeline->preview();
        assert(after.check.reason == "Position data stale");
    }

    {
        Harness h;
        assert(h.pipeline->preview().check.allowed);
        h.gateway->risk_limits.reset();
        auto r = h.pipeline->confirm();
        assert(r.check.kind == ErrorKind::VALIDATION_FAILURE);
        assert(r.check.reason == "Unable to verify risk limits: malformed response");
    }

    {
        // Confirm prices a market order at the newer positions mark.
        Harness h;
        RiskLimitsSnapshot limits;
        limits.limits.max_notional_per_order = dec("1600");
        limits.timestamp = at(0);
        h.gateway->risk_limits = limits;
        h.pipeline->onRiskLimits(limits);
        assert(h.pipeline->preview().check.allowed);

        h.gateway->positions->rows[0].current_price = dec("170");
        h.gateway->positions->rows[0].updated_at = at(900);
        auto r = h.pipeline->confirm();
        assert(!r.check.allowed);
        assert(r.check.reason == "Order exceeds max notional ($1600)");
        assert(h.gateway->submitCount() == 0);
    }

    {
        // Rejected orders keep the intent; the retry reuses the same idempotency key.
        Harness h;
        auto preview = h.pipeline->preview();
        h.gateway->submit_response = SubmitResponse{false, 422, "rejected", "", "Insufficient buying power"};
        auto r = h.pipeline->confirm();
        assert(!r.check.allowed);
        assert(r.check.reason == "Order failed: Insufficient buying power");
        assert(h.pipeline->state() == OrderEntryState::REJECTED);
        assert(h.pipeline->currentIntent()->intent_id == preview.intent_id);
        assert(h.journal->count(OrderJournalEventType::ORDER_REJECTED) == 1);

        h.gateway->fail_submit = true;
        assert(h.pipeline->preview().intent_id == preview.intent_id);
        r = h.pipeline->confirm();
        assert(r.check.reason == "Order failed: gateway timeout");

        h.gateway->fail_submit = false;
        h.gateway->submit_response = SubmitResponse{true, 201, "accepted", "", ""};
        assert(h.pipeline->preview().intent_id == preview.intent_id);
        assert(h.pipeline->confirm().check.allowed);
        assert(h.gateway->submitCount() == 3);
        for (const auto& request : h.gateway->submitted) {
            assert(request.client_order_id == preview.intent_id);
        }
    }

    {
        Harness h;
        h.pipeline->blockAll("Session closed");
        auto r = h.pipeline->preview();
        assert(!r.check.allowed);
        assert(r.check.reason == "Session closed");
        assert(h.pipeline->confirm().check.reason == "Session closed");
        h.pipeline->clearBlock();
        assert(h.pipeline->preview().check.allowed);
    }

    {
        // Session closed while confirm-time fetches are running: nothing is sent.
        Harness h;
        auto preview = h.pipeline->preview();
        assert(preview.check.allowed);
        auto pipeline = h.pipeline;
        h.gateway->on_risk_limits = [pipeline]() { pipeline->blockAll("Session closed"); };

        auto r = h.pipeline->confirm();
        assert(!r.check.allowed);
        assert(r.check.reason == "Session closed");
        assert(h.gateway->submitCount() == 0);
        assert(h.pipeline->state() == OrderEntryState::ABORTED);
        assert(h.journal->count(OrderJournalEventType::ORDER_BLOCKED) == 1);
        h.gateway->on_risk_limits = nullptr;
    }

    {
        // Connection drops during confirm-time fetches.
        Harness h;
        h.pipeline->preview();
        auto pipeline = h.pipeline;
        h.gateway->on_risk_limits = [pipeline]() { pipeline->setConnectionState(ConnectionState::DISCONNECTED); };

        auto r = h.pipeline->confirm();
        assert(!r.check.allowed);
        assert(h.gateway->submitCount() == 0);
        h.gateway->on_risk_limits = nullptr;
    }

    {
        // A draft persisted by an earlier session comes back with its id.
        Harness h;
        OrderIntent saved;
        saved.intent_id = "0123456789abcdef0123456789abcdef";
        saved.form = Harness::marketBuy("5");
        saved.created_at = at(-60000);
        h.store->save(kSession, saved);

        auto restored = h.pipeline->restorePendingIntent();
        assert(restored && restored->intent_id == saved.intent_id);
        assert(h.pipeline->form() == saved.form);
        assert(h.pipeline->state() == OrderEntryState::DRAFTING);
        assert(h.pipeline->preview().intent_id == saved.intent_id);
    }

    {
        // Switching symbols drops the intent and the old price.
        Harness h;
        h.pipeline->preview();
        h.pipeline->setSelectedSymbol(std::string("MSFT"));
        assert(!h.pipeline->currentIntent().has_value());
        assert(h.pipeline->form().symbol == "MSFT");
        auto r = h.pipeline->preview();
        assert(!r.check.allowed);
    }

    std::cout << "[TEST] OrderSubmissionPipeline PASSED\n";
    return 0;
}
