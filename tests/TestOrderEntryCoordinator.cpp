#include "core/orchestration/OrderEntryCoordinator.h"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

#include "fakes/FakeIntentStore.h"
#include "fakes/FakeMessageBus.h"
#include "fakes/FakeSafetyStateSource.h"
#include "fakes/FakeTradingGateway.h"
#include "fakes/TestSupport.h"

using namespace orderguard;
using namespace orderguard::core;
using orderguard::fakes::at;
using orderguard::fakes::dec;
using orderguard::fakes::iso;

namespace {
const std::string kUser = "u1";

struct Session {
    std::shared_ptr<fakes::FakeMessageBus> bus = std::make_shared<fakes::FakeMessageBus>();
    std::shared_ptr<fakes::FakeSafetyStateSource> source = std::make_shared<fakes::FakeSafetyStateSource>();
    std::shared_ptr<fakes::FakeTradingGateway> gateway = std::make_shared<fakes::FakeTradingGateway>();
    std::shared_ptr<fakes::FakeIntentStore> store = std::make_shared<fakes::FakeIntentStore>();
    std::shared_ptr<fakes::RecordingConsumer> consumer = std::make_shared<fakes::RecordingConsumer>();
    std::shared_ptr<safety::SafetyStateTracker> tracker;
    std::shared_ptr<execution::OrderSubmissionPipeline> pipeline;
    std::unique_ptr<OrderEntryCoordinator> coordinator;

    Session() {
        source->set("kill_switch:state", R"({"state":"ACTIVE"})");
        source->set("circuit_breaker:state", R"({"state":"OPEN"})");
        tracker = std::make_shared<safety::SafetyStateTracker>(source);

        PositionsSnapshot positions;
        positions.rows.push_back({"AAPL", dec("100"), dec("150"), at(0)});
        positions.timestamp = at(0);
        gateway->positions = positions;
        AccountSnapshot account;
        account.buying_power = dec("50000");
        account.timestamp = at(0);
        gateway->account = account;
        RiskLimitsSnapshot limits;
        limits.timestamp = at(0);
        gateway->risk_limits = limits;

        execution::PipelineSettings pipeline_settings;
        pipeline_settings.session_id = "desk-1";
        pipeline = std::make_shared<execution::OrderSubmissionPipeline>(
            pipeline_settings, tracker, gateway, store, std::make_shared<fakes::MemoryJournal>(),
            fakes::ManualClock(at(1000)));

        CoordinatorSettings settings;
        settings.user_id = kUser;
        settings.enable_refresh = false;
        coordinator = std::make_unique<OrderEntryCoordinator>(settings, bus, tracker, gateway, pipeline);
        coordinator->addConsumer(consumer);
    }

    void connect(const char* state = "CONNECTED") {
        bus->publish("connection:state", {{"state", state}});
    }

    void tick(const std::string& symbol, const std::string& price, long long offset_ms) {
        bus->publish(priceChannel(symbol),
            {{"symbol", symbol}, {"price", price}, {"timestamp", iso(at(offset_ms))}, {"event_type", "trade"}});
    }

    static OrderForm marketBuy(const std::string& symbol, const std::string& qty) {
        OrderForm form;
        form.symbol = symbol;
        form.qty = dec(qty);
        return form;
    }
};
}

int main() {
    {
        // Full session: init, select, price, preview, confirm.
        Session s;
        s.coordinator->initialize();
        assert(s.coordinator->isInitialized());
        assert(s.bus->subscribeCalls("kill_switch:state") == 1);
        assert(s.bus->subscribeCalls("circuit_breaker:state") == 1);
        assert(s.bus->subscribeCalls("connection:state") == 1);
        assert(s.bus->subscribeCalls(positionsChannel(kUser)) == 1);
        assert(s.consumer->safety_updates.size() == 2);
        assert(s.consumer->safety_updates[0].second.isSafe());

        s.connect();
        assert(s.coordinator->connectionState() == ConnectionState::CONNECTED);
        // The first report is not a reconnect.
        assert(s.bus->subscribeCalls("kill_switch:state") == 1);

        assert(s.coordinator->selectSymbol(std::string(" aapl ")));
        assert(*s.coordinator->selectedSymbol() == "AAPL");
        assert(s.bus->isActive(priceChannel("AAPL")));
        assert(s.consumer->symbols.size() == 1 && *s.consumer->symbols[0] == "AAPL");

        s.tick("AAPL", "150", 500);
        assert(s.consumer->priceCount() == 1);

        s.coordinator->updateForm(Session::marketBuy("AAPL", "10"));
        auto preview = s.coordinator->preview();
        assert(preview.check.allowed);
        auto result = s.coordinator->confirm();
        assert(result.check.allowed);
        assert(s.gateway->submitCount() == 1);
        assert(s.gateway->submitted[0].client_order_id == preview.intent_id);
    }

    {
        // Rapid A then B: only B stays subscribed and selected.
        Session s;
        s.coordinator->initialize();
        s.connect();

        s.bus->closeGate();
        bool a_result = true;
        bool b_result = false;
        std::thread select_a([&]() { a_result = s.coordinator->selectSymbol(std::string("MSFT")); });
        assert(s.bus->waitUntilBlocked(1));
        std::thread select_b([&]() { b_result = s.coordinator->selectSymbol(std::string("AAPL")); });
        assert(s.bus->waitUntilBlocked(2));
        s.bus->openGate();
        select_a.join();
        select_b.join();

        assert(!a_result);
        assert(b_result);
        assert(*s.coordinator->selectedSymbol() == "AAPL");
        assert(s.bus->isActive(priceChannel("AAPL")));
        assert(!s.bus->isActive(priceChannel("MSFT")));
        assert(!s.coordinator->subscriptions().isSubscribed(priceChannel("MSFT")));
        assert(s.bus->unsubscribeCalls(priceChannel("MSFT")) == 1);
        for (const auto& symbol : s.consumer->symbols) {
            assert(symbol && *symbol == "AAPL");
        }
    }

    {
        // Switching symbols releases the old channel unless someone else holds it.
        Session s;
        s.coordinator->initialize();
        s.connect();
        assert(s.coordinator->selectSymbol(std::string("AAPL")));
        s.coordinator->watchlistAdd("msft");
        assert(s.coordinator->selectSymbol(std::string("MSFT")));
        assert(s.bus->unsubscribeCalls(priceChannel("AAPL")) == 1);
        assert(s.bus->subscribeCalls(priceChannel("MSFT")) == 1);

        assert(s.coordinator->selectSymbol(std::nullopt));
        assert(!s.coordinator->selectedSymbol().has_value());
        assert(s.bus->isActive(priceChannel("MSFT")));
        s.coordinator->watchlistRemove("MSFT");
        assert(!s.bus->isActive(priceChannel("MSFT")));

        assert(!s.coordinator->selectSymbol(std::string("not a symbol")));
        bool threw = false;
        try {
            s.coordinator->watchlistAdd("$$$");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    {
        // Reconnect: two owners on one channel, one resubscribe, one delivery per message.
        Session s;
        s.coordinator->initialize();
        s.connect();
        assert(s.coordinator->selectSymbol(std::string("AAPL")));
        s.coordinator->watchlistAdd("AAPL");
        assert(s.bus->subscribeCalls(priceChannel("AAPL")) == 1);
        assert(s.coordinator->subscriptions().owners(priceChannel("AAPL")).size() == 2);

        s.bus->simulateDisconnect();
        s.connect("RECONNECTING");
        s.coordinator->updateForm(Session::marketBuy("AAPL", "1"));
        assert(s.coordinator->preview().check.reason == "Connection: RECONNECTING");
        assert(!s.consumer->blocked.empty());

        const int fetches_before = s.source->fetchCount();
        s.connect();
        assert(s.source->fetchCount() == fetches_before + 2);
        assert(s.bus->subscribeCalls(priceChannel("AAPL")) == 2);
        assert(s.bus->isActive("kill_switch:state"));
        assert(s.bus->isActive(positionsChannel(kUser)));

        const std::size_t prices_before = s.consumer->priceCount();
        s.tick("AAPL", "151", 800);
        assert(s.consumer->priceCount() == prices_before + 1);
    }

    {
        // A failed price subscription still selects the symbol and is retried on reconnect.
        Session s;
        s.coordinator->initialize();
        s.connect();
        s.bus->setFailing(priceChannel("MSFT"), true);
        assert(!s.coordinator->selectSymbol(std::string("MSFT")));
        assert(*s.coordinator->selectedSymbol() == "MSFT");
        assert(s.coordinator->subscriptions().failedChannels().size() == 1);

        s.bus->setFailing(priceChannel("MSFT"), false);
        s.connect("DISCONNECTED");
        s.connect();
        assert(s.bus->isActive(priceChannel("MSFT")));
        assert(s.coordinator->subscriptions().failedChannels().empty());
    }

    {
        // Safety and position pushes flow into the pipeline and to consumers.
        Session s;
        s.coordinator->initialize();
        s.connect();
        s.coordinator->selectSymbol(std::string("AAPL"));
        s.tick("AAPL", "150", 500);
        s.coordinator->updateForm(Session::marketBuy("AAPL", "10"));
        assert(s.coordinator->preview().check.allowed);

        s.bus->publish("kill_switch:state", fakes::killSwitchEngaged("ops"));
        assert(!s.consumer->safety_updates.back().second.isSafe());
        auto blocked = s.coordinator->preview();
        assert(blocked.check.reason == "Kill switch engaged: ops");
        assert(s.consumer->blocked.back() == "Kill switch engaged: ops");

        s.bus->publish("kill_switch:state", fakes::killSwitchSafe());
        assert(s.coordinator->preview().check.allowed);

        nlohmann::json bad_row = {{"symbol", "AAPL"}, {"qty", "oops"}};
        s.bus->publish(positionsChannel(kUser), {{"positions", nlohmann::json::array({bad_row})}});
        assert(s.coordinator->preview().check.reason == "Position data stale");
    }

    {
        // A failed refresh makes the field unusable.
        Session s;
        s.coordinator->initialize();
        s.connect();
        s.coordinator->selectSymbol(std::string("AAPL"));
        s.tick("AAPL", "150", 500);
        s.coordinator->updateForm(Session::marketBuy("AAPL", "10"));
        assert(s.coordinator->preview().check.allowed);

        s.gateway->fail_account = true;
        s.coordinator->refreshAccount();
        assert(s.coordinator->preview().check.reason == "Buying power data stale");

        s.gateway->fail_account = false;
        s.coordinator->refreshAccount();
        assert(s.coordinator->preview().check.allowed);

        s.gateway->fills.push_back({"o-1", "AAPL", "buy", dec("10"), dec("150"), at(0)});
        s.coordinator->refreshFills();
        assert(s.gateway->last_fills_limit == 50);
    }

    {
        // Initialization failure releases everything and blocks submissions.
        Session s;
        s.bus->setFailing(positionsChannel(kUser), true);
        bool threw = false;
        try {
            s.coordinator->initialize();
        } catch (const TransientIoError&) {
            threw = true;
        }
        assert(threw);
        assert(!s.coordinator->isInitialized());
        assert(s.bus->activeChannels().empty());
        assert(s.consumer->blocked.back() == "Initialization failed - please refresh");
        assert(s.pipeline->checkCached().reason == "Initialization failed - please refresh");

        // Once the bus recovers the same session initializes cleanly.
        s.bus->setFailing(positionsChannel(kUser), false);
        s.coordinator->initialize();
        assert(s.coordinator->isInitialized());
        assert(s.bus->isActive(positionsChannel(kUser)));
        assert(s.bus->isActive("kill_switch:state"));
        assert(s.pipeline->checkCached().reason != "Initialization failed - please refresh");
    }

    {
        // A draft left by a previous session is restored with its symbol.
        Session s;
        OrderIntent saved;
        saved.intent_id = "0123456789abcdef0123456789abcdef";
        saved.form = Session::marketBuy("AAPL", "3");
        saved.created_at = at(0);
        s.store->save("desk-1", saved);

        s.coordinator->initialize();
        assert(*s.coordinator->selectedSymbol() == "AAPL");
        assert(s.bus->isActive(priceChannel("AAPL")));
        assert(s.pipeline->currentIntent()->intent_id == saved.intent_id);
        assert(s.pipeline->form().qty == dec("3"));
    }

    {
        Session s;
        s.coordinator->initialize();
        s.connect();
        s.coordinator->selectSymbol(std::string("AAPL"));
        s.coordinator->dispose();
        s.coordinator->dispose();
        assert(s.coordinator->isDisposed());
        assert(s.bus->activeChannels().empty());

        auto r = s.coordinator->preview();
        assert(r.check.kind == ErrorKind::CANCELLED);
        assert(r.check.reason == "Session closed");
        assert(s.coordinator->confirm().check.reason == "Session closed");
        assert(!s.coordinator->selectSymbol(std::string("MSFT")));
    }

    {
        bool threw = false;
        try {
            OrderEntryCoordinator broken(CoordinatorSettings{}, std::make_shared<fakes::FakeMessageBus>(),
                                         nullptr, nullptr, nullptr);
        } catch (const InvariantViolation&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] OrderEntryCoordinator PASSED\n";
    return 0;
}
