#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace orderguard {

using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;
using Clock = std::function<Timestamp()>;

inline Timestamp systemNow() {
    return std::chrono::system_clock::now();
}

inline long long toEpochMs(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

enum class OrderSide { BUY, SELL };
enum class OrderType { MARKET, LIMIT, STOP, STOP_LIMIT };
enum class TimeInForce { DAY, GTC, IOC, FOK };
enum class ConnectionState { CONNECTED, DEGRADED, DISCONNECTED, RECONNECTING, UNKNOWN };

inline const char* orderSideToString(OrderSide side) {
    return (side == OrderSide::BUY) ? "buy" : "sell";
}

inline const char* orderTypeToString(OrderType type) {
    switch (type) {
        case OrderType::MARKET: return "market";
        case OrderType::LIMIT: return "limit";
        case OrderType::STOP: return "stop";
        case OrderType::STOP_LIMIT: return "stop_limit";
    }
    return "market";
}

inline const char* timeInForceToString(TimeInForce tif) {
    switch (tif) {
        case TimeInForce::DAY: return "day";
        case TimeInForce::GTC: return "gtc";
        case TimeInForce::IOC: return "ioc";
        case TimeInForce::FOK: return "fok";
    }
    return "day";
}

inline const char* connectionStateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::CONNECTED: return "CONNECTED";
        case ConnectionState::DEGRADED: return "DEGRADED";
        case ConnectionState::DISCONNECTED: return "DISCONNECTED";
        case ConnectionState::RECONNECTING: return "RECONNECTING";
        case ConnectionState::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

inline std::optional<OrderSide> orderSideFromString(const std::string& value) {
    if (value == "buy") return OrderSide::BUY;
    if (value == "sell") return OrderSide::SELL;
    return std::nullopt;
}

inline std::optional<OrderType> orderTypeFromString(const std::string& value) {
    if (value == "market") return OrderType::MARKET;
    if (value == "limit") return OrderType::LIMIT;
    if (value == "stop") return OrderType::STOP;
    if (value == "stop_limit") return OrderType::STOP_LIMIT;
    return std::nullopt;
}

inline std::optional<TimeInForce> timeInForceFromString(const std::string& value) {
    if (value == "day") return TimeInForce::DAY;
    if (value == "gtc") return TimeInForce::GTC;
    if (value == "ioc") return TimeInForce::IOC;
    if (value == "fok") return TimeInForce::FOK;
    return std::nullopt;
}

// Unrecognized values map to UNKNOWN, which is read-only.
inline ConnectionState connectionStateFromString(const std::string& value) {
    if (value == "CONNECTED") return ConnectionState::CONNECTED;
    if (value == "DEGRADED") return ConnectionState::DEGRADED;
    if (value == "DISCONNECTED") return ConnectionState::DISCONNECTED;
    if (value == "RECONNECTING") return ConnectionState::RECONNECTING;
    return ConnectionState::UNKNOWN;
}

inline bool isReadOnly(ConnectionState state) {
    return state != ConnectionState::CONNECTED;
}

} // namespace orderguard
