#include "core/adapters/GatewayClient.h"
#include "core/adapters/HttpSafetyStateSource.h"

#include <cassert>
#include <iostream>
#include <memory>

#include "common/Errors.h"
#include "core/execution/OrderSubmissionPipeline.h"
#include "fakes/FakeHttpClient.h"
#include "fakes/FakeIntentStore.h"
#include "fakes/TestSupport.h"
#include "safety/SafetyStateTracker.h"

using namespace orderguard;
using namespace orderguard::core;
using namespace orderguard::core::execution;
using orderguard::fakes::at;
using orderguard::fakes::dec;
using orderguard::fakes::iso;

namespace {
const std::string kPositions = "/api/v1/positions";
const std::string kAccount = "/api/v1/account";
const std::string kRiskLimits = "/api/v1/risk/limits";
const std::string kFills = "/api/v1/fills/recent";
const std::string kOrders = "/api/v1/orders";

template <typename Fn>
bool throwsTransient(Fn&& fn) {
    try {
        fn();
    } catch (const TransientIoError&) {
        return true;
    }
    return false;
}

void serveFreshSession(fakes::FakeHttpClient& http) {
    nlohmann::json rows = nlohmann::json::array();
    rows.push_back({{"symbol", "AAPL"}, {"qty", "100"}, {"current_price", "150"}, {"updated_at", iso(at(0))}});
    http.onGet(kPositions, 200, nlohmann::json{{"positions", rows}, {"timestamp", iso(at(0))}}.dump());
    http.onGet(kAccount, 200, nlohmann::json{{"buying_power", "100000"}, {"timestamp", iso(at(0))}}.dump());
    http.onGet(kRiskLimits, 200, nlohmann::json{{"limits", nlohmann::json::object()}, {"timestamp", iso(at(0))}}.dump());
}
}

int main() {
    {
        // Safety store: 404 means "not found", other errors are transient.
        auto http = std::make_shared<fakes::FakeHttpClient>();
        auto source = std::make_shared<HttpSafetyStateSource>(http);
        safety::SafetyStateTracker tracker(source);

        auto missing = tracker.fetchAuthoritative(safety::SafetyKind::KILL_SWITCH, std::chrono::milliseconds(500));
        assert(!missing.isSafe());
        assert(missing.reason->find("state not found") != std::string::npos);
        assert(http->gets.back().first == "/api/v1/safety/kill_switch:state");

        http->onGet("/api/v1/safety/kill_switch:state", 503, "");
        assert(throwsTransient([&]() { source->fetch("kill_switch:state", std::chrono::milliseconds(500)); }));
        auto down = tracker.fetchAuthoritative(safety::SafetyKind::KILL_SWITCH, std::chrono::milliseconds(500));
        assert(!down.isSafe());
        assert(down.reason->find("fetch failed") != std::string::npos);

        http->onGet("/api/v1/safety/kill_switch:state", 200, "<html>maintenance</html>");
        auto garbled = tracker.fetchAuthoritative(safety::SafetyKind::KILL_SWITCH, std::chrono::milliseconds(500));
        assert(!garbled.isSafe());

        http->onGet("/api/v1/safety/kill_switch:state", 200, fakes::killSwitchSafe().dump());
        auto safe = tracker.fetchAuthoritative(safety::SafetyKind::KILL_SWITCH, std::chrono::milliseconds(500));
        assert(safe.isSafe());
        assert(http->last_timeout == std::chrono::milliseconds(500));
    }

    {
        // Gateway reads: 5xx and 429 are transient, other 4xx are validation failures.
        auto http = std::make_shared<fakes::FakeHttpClient>();
        GatewayClient gateway(http);

        http->onGet(kPositions, 503, "");
        assert(throwsTransient([&]() { gateway.fetchPositions(); }));
        http->onGet(kAccount, 429, "");
        assert(throwsTransient([&]() { gateway.fetchAccount(); }));

        http->onGet(kRiskLimits, 403, R"({"detail":"forbidden"})");
        bool validation = false;
        try {
            gateway.fetchRiskLimits();
        } catch (const TransientIoError&) {
            assert(false);
        } catch (const OrderGuardError& e) {
            validation = e.kind() == ErrorKind::VALIDATION_FAILURE;
        }
        assert(validation);

        http->transport_down = true;
        assert(throwsTransient([&]() { gateway.fetchPositions(); }));
        http->transport_down = false;
    }

    {
        // A body that is not JSON leaves the field unusable.
        auto http = std::make_shared<fakes::FakeHttpClient>();
        GatewayClient gateway(http);
        http->onGet(kPositions, 200, "upstream timeout");
        http->onGet(kAccount, 200, "");
        http->onGet(kRiskLimits, 200, "{\"limits\":");
        http->onGet(kFills, 200, "not json");
        assert(!gateway.fetchPositions());
        assert(!gateway.fetchAccount());
        assert(!gateway.fetchRiskLimits());
        assert(gateway.fetchRecentFills(50).empty());
        assert(http->gets.back().second.at("limit") == "50");
    }

    {
        auto http = std::make_shared<fakes::FakeHttpClient>();
        GatewayClient gateway(http);
        serveFreshSession(*http);
        auto positions = gateway.fetchPositions();
        assert(positions && positions->find("AAPL")->qty == dec("100"));
        assert(*positions->timestamp == at(0));
        auto account = gateway.fetchAccount();
        assert(account && *account->buying_power == dec("100000"));

        OrderRequest request;
        request.client_order_id = "0123456789abcdef0123456789abcdef";
        request.form.symbol = "AAPL";
        request.form.side = OrderSide::BUY;
        request.form.qty = dec("10");
        request.form.order_type = OrderType::MARKET;

        http->onPost(kOrders, 422, R"({"status":"rejected","message":"Insufficient buying power"})");
        auto rejected = gateway.submitOrder(request);
        assert(!rejected.accepted);
        assert(rejected.http_status == 422);
        assert(rejected.message == "Insufficient buying power");

        http->onPost(kOrders, 502, "");
        assert(throwsTransient([&]() { gateway.submitOrder(request); }));

        http->onPost(kOrders, 201, R"({"status":"accepted","client_order_id":"0123456789abcdef0123456789abcdef"})");
        auto accepted = gateway.submitOrder(request);
        assert(accepted.accepted);
        assert(http->posts.back().second.at("client_order_id") == request.client_order_id);
    }

    {
        // Order service down at submit: REJECTED, intent kept, retry reuses the id.
        auto http = std::make_shared<fakes::FakeHttpClient>();
        serveFreshSession(*http);
        http->onGet("/api/v1/safety/kill_switch:state", 200, fakes::killSwitchSafe().dump());
        http->onGet("/api/v1/safety/circuit_breaker:state", 200, fakes::circuitBreakerSafe().dump());
        http->onPost(kOrders, 503, "");

        auto gateway = std::make_shared<GatewayClient>(http);
        auto tracker = std::make_shared<safety::SafetyStateTracker>(std::make_shared<HttpSafetyStateSource>(http));
        tracker->initialize(std::chrono::milliseconds(500));
        auto store = std::make_shared<fakes::FakeIntentStore>();
        auto journal = std::make_shared<fakes::MemoryJournal>();
        fakes::ManualClock clock{at(1000)};

        PipelineSettings settings;
        settings.session_id = "desk-1";
        OrderSubmissionPipeline pipeline(settings, tracker, gateway, store, journal, clock);
        pipeline.setConnectionState(ConnectionState::CONNECTED);
        pipeline.setSelectedSymbol(std::string("AAPL"));
        pipeline.onPositions(gateway->fetchPositions());
        pipeline.onAccount(gateway->fetchAccount());
        pipeline.onRiskLimits(gateway->fetchRiskLimits());

        PriceTick tick;
        tick.symbol = "AAPL";
        tick.price = dec("150");
        tick.timestamp = at(500);
        pipeline.onPriceTick(tick);

        OrderForm form;
        form.symbol = "AAPL";
        form.side = OrderSide::BUY;
        form.qty = dec("10");
        form.order_type = OrderType::MARKET;
        pipeline.updateForm(form);

        auto preview = pipeline.preview();
        assert(preview.check.allowed);

        auto failed = pipeline.confirm();
        assert(!failed.check.allowed);
        assert(failed.check.reason.find("HTTP 503") != std::string::npos);
        assert(pipeline.state() == OrderEntryState::REJECTED);
        assert(pipeline.currentIntent()->intent_id == preview.intent_id);
        assert(store->has("desk-1"));

        http->onPost(kOrders, 201, R"({"status":"accepted"})");
        assert(pipeline.preview().intent_id == preview.intent_id);
        assert(pipeline.confirm().check.allowed);
        assert(pipeline.state() == OrderEntryState::SUBMITTED);
        assert(http->posts.size() == 2);
        for (const auto& post : http->posts) {
            assert(post.second.at("client_order_id") == preview.intent_id);
        }
    }

    std::cout << "[TEST] GatewayClient PASSED\n";
    return 0;
}
