#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace orderguard {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

// Non-positive or non-numeric values keep the default.
template<typename Unit>
Duration readDuration(const nlohmann::json& section, const char* key, Duration fallback) {
    if (!section.contains(key)) {
        return fallback;
    }
    const auto& raw = section.at(key);
    if (!raw.is_number() || raw.get<double>() <= 0.0) {
        std::cout << "Warning: config value '" << key << "' must be a positive number; keeping default"
                  << std::endl;
        return fallback;
    }
    const auto scaled = std::chrono::duration<double, typename Unit::period>(raw.get<double>());
    return std::chrono::duration_cast<Duration>(scaled);
}

std::string readString(const nlohmann::json& section, const char* key, const std::string& fallback) {
    if (!section.contains(key) || !section.at(key).is_string()) {
        return fallback;
    }
    const std::string value = trimCopy(section.at(key).get<std::string>());
    return value.empty() ? fallback : value;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::load(const std::string& path) {
    safety::StalenessThresholds staleness;
    SafetySettings safety;
    RefreshSettings refresh;
    SessionSettings session;
    EndpointSettings endpoints;
    std::string log_level = "info";
    std::string log_dir = "logs";

    const std::string api_key = readEnvVar("ORDERGUARD_API_KEY");
    const std::string api_secret = readEnvVar("ORDERGUARD_API_SECRET");
    if (api_key.empty() || api_secret.empty()) {
        std::cout << "Warning: ORDERGUARD_API_KEY or ORDERGUARD_API_SECRET is empty" << std::endl;
    }

    try {
        std::filesystem::path config_path;
        if (std::filesystem::path(path).is_absolute()) {
            config_path = path;
        } else {
            config_path = utils::PathUtils::resolveRelativePath(path);
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cout << "Warning: config file not found: " << config_path << "; using defaults" << std::endl;
        } else {
            nlohmann::json j;
            file >> j;

            if (j.contains("api")) {
                const auto& api = j["api"];
                if (api.contains("key") || api.contains("secret")) {
                    std::cout << "Warning: api keys in the config file are ignored; "
                                 "use ORDERGUARD_API_KEY/ORDERGUARD_API_SECRET" << std::endl;
                }
            }

            if (j.contains("staleness")) {
                const auto& s = j["staleness"];
                staleness.position = readDuration<std::chrono::seconds>(s, "position_max_age_s", staleness.position);
                staleness.price = readDuration<std::chrono::seconds>(s, "price_max_age_s", staleness.price);
                staleness.buying_power = readDuration<std::chrono::seconds>(s, "buying_power_max_age_s", staleness.buying_power);
                staleness.risk_limits = readDuration<std::chrono::seconds>(s, "risk_limits_max_age_s", staleness.risk_limits);
            }

            if (j.contains("safety")) {
                const auto& s = j["safety"];
                safety.submit_fetch_timeout = readDuration<std::chrono::milliseconds>(s, "submit_fetch_timeout_ms", safety.submit_fetch_timeout);
                safety.init_fetch_timeout = readDuration<std::chrono::milliseconds>(s, "init_fetch_timeout_ms", safety.init_fetch_timeout);
            }

            if (j.contains("refresh")) {
                const auto& r = j["refresh"];
                refresh.position_interval = readDuration<std::chrono::seconds>(r, "position_interval_s", refresh.position_interval);
                refresh.buying_power_interval = readDuration<std::chrono::seconds>(r, "buying_power_interval_s", refresh.buying_power_interval);
                refresh.risk_limits_interval = readDuration<std::chrono::seconds>(r, "risk_limits_interval_s", refresh.risk_limits_interval);
                refresh.fills_interval = readDuration<std::chrono::seconds>(r, "fills_interval_s", refresh.fills_interval);
            }

            if (j.contains("session")) {
                const auto& s = j["session"];
                session.user_id = readString(s, "user_id", session.user_id);
                session.session_id = readString(s, "session_id", session.session_id);
                session.intent_store_dir = readString(s, "intent_store_dir", session.intent_store_dir);
                session.journal_path = readString(s, "journal_path", session.journal_path);
            }

            if (j.contains("endpoints")) {
                const auto& e = j["endpoints"];
                endpoints.gateway_base_url = readString(e, "gateway_base_url", endpoints.gateway_base_url);
                endpoints.safety_base_url = readString(e, "safety_base_url", endpoints.safety_base_url);
                endpoints.bus_host = readString(e, "bus_host", endpoints.bus_host);
                endpoints.bus_port = readString(e, "bus_port", endpoints.bus_port);
                endpoints.bus_target = readString(e, "bus_target", endpoints.bus_target);
            }

            if (j.contains("logging")) {
                log_level = readString(j["logging"], "level", log_level);
                log_dir = readString(j["logging"], "dir", log_dir);
            }

            std::cout << "Config loaded: " << config_path << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Config load error: " << e.what() << "; using defaults" << std::endl;
        staleness = safety::StalenessThresholds{};
        safety = SafetySettings{};
        refresh = RefreshSettings{};
        session = SessionSettings{};
        endpoints = EndpointSettings{};
        log_level = "info";
        log_dir = "logs";
    }

    std::lock_guard<std::mutex> lock(mutex_);
    api_key_ = api_key;
    api_secret_ = api_secret;
    log_level_ = log_level;
    log_dir_ = log_dir;
    staleness_ = staleness;
    safety_ = safety;
    refresh_ = refresh;
    session_ = session;
    endpoints_ = endpoints;
}

} // namespace orderguard
