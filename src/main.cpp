#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "core/adapters/GatewayClient.h"
#include "core/adapters/HttpSafetyStateSource.h"
#include "core/execution/OrderSubmissionPipeline.h"
#include "core/orchestration/OrderEntryCoordinator.h"
#include "core/state/IntentStoreJson.h"
#include "core/state/OrderJournalJsonl.h"
#include "network/BusWebSocketClient.h"
#include "network/HttpClient.h"
#include "safety/SafetyStateTracker.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace orderguard;

namespace {
std::atomic<bool> g_stop_requested{false};

void signalHandler(int) {
    g_stop_requested = true;
}

// Mirrors what a terminal widget would show into the log.
class LoggingConsumer : public core::IOrderEntryConsumer {
public:
    void onSafetyState(safety::SafetyKind kind, const safety::SafetyState& state) override {
        if (state.isSafe()) {
            LOG_INFO("{}: safe", safety::safetyLabel(kind));
        } else {
            LOG_WARN("{}: {}", safety::safetyLabel(kind), state.reason.value_or("unsafe"));
        }
    }

    void onConnectionState(ConnectionState state) override {
        LOG_INFO("Connection: {}", connectionStateToString(state));
    }

    void onSymbolChanged(const std::optional<std::string>& symbol) override {
        LOG_INFO("Symbol: {}", symbol.value_or("<none>"));
    }

    void onSubmissionBlocked(const std::string& reason) override {
        LOG_WARN("Order entry blocked: {}", reason);
    }
};

// False when a stop was requested before the delay elapsed.
bool sleepUnlessStopped(std::chrono::milliseconds delay) {
    const auto deadline = std::chrono::steady_clock::now() + delay;
    while (std::chrono::steady_clock::now() < deadline) {
        if (g_stop_requested.load()) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    return !g_stop_requested.load();
}

std::filesystem::path resolveStatePath(const std::string& configured) {
    std::filesystem::path path(configured);
    if (path.is_absolute()) {
        return path;
    }
    return utils::PathUtils::resolveRelativePath(configured);
}
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    const std::string config_path = argc > 1
        ? std::string(argv[1])
        : (utils::PathUtils::getConfigDir() / "orderguard.json").string();

    auto& config = Config::getInstance();
    config.load(config_path);

    try {
        Logger::getInstance().initialize(
            resolveStatePath(config.getLogDir()).string(), config.getLogLevel());
    } catch (const std::exception& e) {
        std::cerr << "Logger initialization failed: " << e.what() << std::endl;
        return 1;
    }

    const auto session = config.getSession();
    const auto endpoints = config.getEndpoints();
    const auto safety_settings = config.getSafety();
    const auto refresh = config.getRefresh();

    LOG_INFO("OrderGuard starting (user={}, session={})", session.user_id, session.session_id);
    if (config.getApiKey().empty() || config.getApiSecret().empty()) {
        LOG_WARN("ORDERGUARD_API_KEY / ORDERGUARD_API_SECRET not set; requests are unauthenticated");
    }

    network::HttpClient::globalInit();
    int exit_code = 0;
    {
        auto gateway_http = std::make_shared<network::HttpClient>(
            endpoints.gateway_base_url, config.getApiKey(), config.getApiSecret());
        auto safety_http = std::make_shared<network::HttpClient>(
            endpoints.safety_base_url, config.getApiKey(), config.getApiSecret());

        network::BusEndpoint bus_endpoint;
        bus_endpoint.host = endpoints.bus_host;
        bus_endpoint.port = endpoints.bus_port;
        bus_endpoint.target = endpoints.bus_target;
        auto bus = std::make_shared<network::BusWebSocketClient>(
            bus_endpoint, config.getApiKey(), config.getApiSecret());

        auto gateway = std::make_shared<core::GatewayClient>(gateway_http);
        auto tracker = std::make_shared<safety::SafetyStateTracker>(
            std::make_shared<core::HttpSafetyStateSource>(safety_http));
        auto intent_store = std::make_shared<core::IntentStoreJson>(resolveStatePath(session.intent_store_dir));
        auto journal = std::make_shared<core::OrderJournalJsonl>(resolveStatePath(session.journal_path));

        core::execution::PipelineSettings pipeline_settings;
        pipeline_settings.session_id = session.session_id;
        pipeline_settings.thresholds = config.getStaleness();
        pipeline_settings.submit_fetch_timeout = safety_settings.submit_fetch_timeout;
        auto pipeline = std::make_shared<core::execution::OrderSubmissionPipeline>(
            pipeline_settings, tracker, gateway, intent_store, journal);

        core::CoordinatorSettings coordinator_settings;
        coordinator_settings.user_id = session.user_id;
        coordinator_settings.init_fetch_timeout = safety_settings.init_fetch_timeout;
        coordinator_settings.position_interval = refresh.position_interval;
        coordinator_settings.buying_power_interval = refresh.buying_power_interval;
        coordinator_settings.risk_limits_interval = refresh.risk_limits_interval;
        coordinator_settings.fills_interval = refresh.fills_interval;

        core::OrderEntryCoordinator coordinator(coordinator_settings, bus, tracker, gateway, pipeline);
        coordinator.addConsumer(std::make_shared<LoggingConsumer>());

        bus->start();

        // Initialization needs the bus. Keep waiting and retrying with capped
        // backoff until it succeeds or a stop is requested.
        bool ready = false;
        for (int attempt = 1; !ready && exit_code == 0 && !g_stop_requested.load(); ++attempt) {
            if (!bus->waitConnected(std::chrono::seconds(10))) {
                LOG_WARN("Bus not connected after 10s; still waiting before session initialization");
                continue;
            }
            try {
                coordinator.initialize();
                ready = true;
            } catch (const TransientIoError& e) {
                const int delay_s = std::min(30, attempt * 2);
                LOG_WARN("Session initialization failed: {}; retrying in {}s (attempt {})",
                         e.what(), delay_s, attempt);
                if (!sleepUnlessStopped(std::chrono::seconds(delay_s))) {
                    break;
                }
            } catch (const std::exception& e) {
                LOG_ERROR("Session initialization failed: {}", e.what());
                exit_code = 1;
            }
        }

        while (exit_code == 0 && !g_stop_requested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        LOG_INFO("Shutting down");
        coordinator.dispose();
        bus->stop();
    }
    network::HttpClient::globalCleanup();

    LOG_INFO("OrderGuard stopped");
    Logger::getInstance().shutdown();
    return exit_code;
}
