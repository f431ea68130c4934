#pragma once

#include <string>
#include <mutex>
#include <nlohmann/json.hpp>
#include "safety/StalenessPolicy.h"

namespace orderguard {

struct SafetySettings {
    Duration submit_fetch_timeout{std::chrono::milliseconds(500)};
    Duration init_fetch_timeout{std::chrono::milliseconds(2000)};
};

struct RefreshSettings {
    Duration position_interval{std::chrono::seconds(5)};
    Duration buying_power_interval{std::chrono::seconds(10)};
    Duration risk_limits_interval{std::chrono::seconds(240)};
    Duration fills_interval{std::chrono::seconds(15)};
};

struct SessionSettings {
    std::string user_id = "local-user";
    std::string session_id = "default";
    std::string intent_store_dir = "state";
    std::string journal_path = "state/order_journal.jsonl";
};

struct EndpointSettings {
    std::string gateway_base_url = "http://localhost:8002";
    std::string safety_base_url = "http://localhost:8002";
    std::string bus_host = "localhost";
    std::string bus_port = "443";
    std::string bus_target = "/ws/bus";
};

class Config {
public:
    static Config& getInstance();

    // Missing file keeps the defaults. Secrets are read from the environment only.
    void load(const std::string& config_path);

    std::string getApiKey() const { std::lock_guard<std::mutex> lock(mutex_); return api_key_; }
    std::string getApiSecret() const { std::lock_guard<std::mutex> lock(mutex_); return api_secret_; }
    std::string getLogLevel() const { std::lock_guard<std::mutex> lock(mutex_); return log_level_; }
    std::string getLogDir() const { std::lock_guard<std::mutex> lock(mutex_); return log_dir_; }

    safety::StalenessThresholds getStaleness() const { std::lock_guard<std::mutex> lock(mutex_); return staleness_; }
    SafetySettings getSafety() const { std::lock_guard<std::mutex> lock(mutex_); return safety_; }
    RefreshSettings getRefresh() const { std::lock_guard<std::mutex> lock(mutex_); return refresh_; }
    SessionSettings getSession() const { std::lock_guard<std::mutex> lock(mutex_); return session_; }
    EndpointSettings getEndpoints() const { std::lock_guard<std::mutex> lock(mutex_); return endpoints_; }

private:
    Config() = default;

    mutable std::mutex mutex_;
    std::string api_key_;
    std::string api_secret_;
    std::string log_level_ = "info";
    std::string log_dir_ = "logs";

    safety::StalenessThresholds staleness_;
    SafetySettings safety_;
    RefreshSettings refresh_;
    SessionSettings session_;
    EndpointSettings endpoints_;
};

} // namespace orderguard
