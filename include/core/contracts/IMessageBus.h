#pragma once

#include <functional>
#include <string>

#include <nlohmann/json.hpp>

namespace orderguard {
namespace core {

using MessageHandler = std::function<void(const nlohmann::json&)>;

// Pub/sub transport. One registration per channel; subscribing again replaces it.
class IMessageBus {
public:
    virtual ~IMessageBus() = default;

    // Throws on transport failure.
    virtual void subscribe(const std::string& channel, MessageHandler handler) = 0;
    virtual void unsubscribe(const std::string& channel) = 0;
};

} // namespace core
} // namespace orderguard
