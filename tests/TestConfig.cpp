#include "common/Config.h"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace orderguard;

namespace {
std::filesystem::path writeConfig(const std::string& name, const std::string& body) {
    const auto dir = std::filesystem::temp_directory_path() / "orderguard_tests";
    std::filesystem::create_directories(dir);
    const auto path = dir / name;
    std::ofstream out(path, std::ios::trunc);
    out << body;
    return path;
}
}

int main() {
    std::cout << "[TEST] Starting Config Test..." << std::endl;

    setenv("ORDERGUARD_API_KEY", "  key-123 ", 1);
    setenv("ORDERGUARD_API_SECRET", "secret-456", 1);

    Config& config = Config::getInstance();

    {
        const auto path = writeConfig("full.json", R"({
            "api": {"key": "ignored"},
            "staleness": {"position_max_age_s": 15, "price_max_age_s": 2.5},
            "safety": {"submit_fetch_timeout_ms": 250},
            "refresh": {"position_interval_s": 3, "fills_interval_s": -1},
            "session": {"user_id": "trader-7", "session_id": "desk-9"},
            "endpoints": {"gateway_base_url": "https://gw.example", "bus_host": "bus.example"},
            "logging": {"level": "debug"}
        })");
        config.load(path.string());

        assert(config.getApiKey() == "key-123");
        assert(config.getApiSecret() == "secret-456");

        const auto staleness = config.getStaleness();
        assert(staleness.position == std::chrono::seconds(15));
        assert(staleness.price == std::chrono::milliseconds(2500));
        assert(staleness.buying_power == std::chrono::seconds(60));
        assert(staleness.risk_limits == std::chrono::seconds(300));

        assert(config.getSafety().submit_fetch_timeout == std::chrono::milliseconds(250));
        assert(config.getSafety().init_fetch_timeout == std::chrono::milliseconds(2000));

        // Invalid values keep their defaults.
        assert(config.getRefresh().position_interval == std::chrono::seconds(3));
        assert(config.getRefresh().fills_interval == std::chrono::seconds(15));

        const auto session = config.getSession();
        assert(session.user_id == "trader-7");
        assert(session.session_id == "desk-9");
        assert(session.journal_path == "state/order_journal.jsonl");

        assert(config.getEndpoints().gateway_base_url == "https://gw.example");
        assert(config.getEndpoints().bus_host == "bus.example");
        assert(config.getEndpoints().bus_port == "443");
        assert(config.getLogLevel() == "debug");
        assert(config.getLogDir() == "logs");
        std::cout << "[TEST] Full config OK" << std::endl;
    }

    {
        // Unparsable file falls back to defaults wholesale.
        const auto path = writeConfig("broken.json", "{ \"staleness\": ");
        config.load(path.string());
        assert(config.getStaleness().position == std::chrono::seconds(30));
        assert(config.getSession().user_id == "local-user");
        assert(config.getLogLevel() == "info");
    }

    {
        const auto missing = std::filesystem::temp_directory_path() / "orderguard_tests" / "missing.json";
        std::error_code ec;
        std::filesystem::remove(missing, ec);
        config.load(missing.string());
        assert(config.getRefresh().risk_limits_interval == std::chrono::seconds(240));
        assert(config.getEndpoints().bus_target == "/ws/bus");
    }

    std::cout << "[TEST] Config PASSED" << std::endl;
    return 0;
}
