#include "network/BusWebSocketClient.h"

#include <algorithm>
#include <chrono>

#include <boost/asio/post.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include "common/Errors.h"
#include "common/Logger.h"
#include "network/JwtGenerator.h"

namespace orderguard {
namespace network {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {
const char* const kConnectionChannel = "connection:state";
}

BusWebSocketClient::BusWebSocketClient(BusEndpoint endpoint, std::string api_key, std::string api_secret)
    : endpoint_(std::move(endpoint))
    , api_key_(std::move(api_key))
    , api_secret_(std::move(api_secret)) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

BusWebSocketClient::~BusWebSocketClient() {
    stop();
}

void BusWebSocketClient::start() {
    if (running_.exchange(true)) {
        return;
    }
    work_guard_.emplace(net::make_work_guard(ioc_));
    net::post(strand_, [this]() { doConnect(); });
    io_thread_ = std::thread([this]() {
        try {
            ioc_.run();
        } catch (const std::exception& e) {
            LOG_ERROR("Bus io thread stopped: {}", e.what());
        }
    });
    LOG_INFO("Bus client connecting to {}:{}{}", endpoint_.host, endpoint_.port, endpoint_.target);
}

void BusWebSocketClient::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    net::post(strand_, [this]() {
        ++epoch_;
        reconnect_timer_.cancel();
        ping_timer_.cancel();
        resolver_.cancel();
        if (ws_) {
            beast::error_code ec;
            beast::get_lowest_layer(*ws_).socket().close(ec);
        }
    });
    work_guard_.reset();
    ioc_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
    ws_.reset();
    connected_ = false;
    publishConnectionState(ConnectionState::DISCONNECTED);
    LOG_INFO("Bus client stopped");
}

bool BusWebSocketClient::waitConnected(Duration timeout) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    return state_cv_.wait_for(lock, timeout, [this]() { return connected_.load(); });
}

// ---------------------------------------------------------------------------
// IMessageBus

void BusWebSocketClient::subscribe(const std::string& channel, core::MessageHandler handler) {
    if (channel == kConnectionChannel) {
        {
            std::lock_guard<std::mutex> lock(handlers_mutex_);
            handlers_[channel] = handler;
        }
        net::post(strand_, [this, handler]() { emitConnectionState(handler, state_.load()); });
        return;
    }
    if (!connected_) {
        throw TransientIoError("Bus not connected");
    }
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handlers_[channel] = std::move(handler);
    }
    send({{"action", "subscribe"}, {"channel", channel}});
}

void BusWebSocketClient::unsubscribe(const std::string& channel) {
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handlers_.erase(channel);
    }
    if (channel == kConnectionChannel || !connected_) {
        return;
    }
    send({{"action", "unsubscribe"}, {"channel", channel}});
}

void BusWebSocketClient::send(nlohmann::json frame) {
    net::post(strand_, [this, text = frame.dump()]() mutable {
        if (!connected_ || !ws_) {
            return;
        }
        write_queue_.emplace_back(std::move(text));
        if (write_queue_.size() == 1) {
            doWrite(epoch_);
        }
    });
}

// ---------------------------------------------------------------------------
// Connection chain (strand)

void BusWebSocketClient::doConnect() {
    if (!running_) {
        return;
    }
    const std::uint64_t epoch = ++epoch_;
    write_queue_.clear();
    buffer_.consume(buffer_.size());
    ws_ = std::make_shared<Stream>(strand_, ssl_ctx_);

    resolver_.async_resolve(endpoint_.host, endpoint_.port,
        [this, epoch](beast::error_code ec, tcp::resolver::results_type results) {
            onResolve(epoch, ec, results);
        });
}

void BusWebSocketClient::onResolve(std::uint64_t epoch, beast::error_code ec, tcp::resolver::results_type results) {
    if (epoch != epoch_) return;
    if (ec) return fail(epoch, "resolve", ec);

    auto ws = ws_;
    beast::get_lowest_layer(*ws).expires_after(std::chrono::seconds(15));
    beast::get_lowest_layer(*ws).async_connect(results,
        [this, epoch, ws](beast::error_code ec2, tcp::resolver::results_type::endpoint_type) {
            onConnect(epoch, ec2);
        });
}

void BusWebSocketClient::onConnect(std::uint64_t epoch, beast::error_code ec) {
    if (epoch != epoch_) return;
    if (ec) return fail(epoch, "connect", ec);

    if (!SSL_set_tlsext_host_name(ws_->next_layer().native_handle(), endpoint_.host.c_str())) {
        return fail(epoch, "SNI setup",
            beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
    }
    ws_->next_layer().set_verify_callback(ssl::host_name_verification(endpoint_.host));
    auto ws = ws_;
    ws->next_layer().async_handshake(ssl::stream_base::client,
        [this, epoch, ws](beast::error_code ec2) { onSslHandshake(epoch, ec2); });
}

void BusWebSocketClient::onSslHandshake(std::uint64_t epoch, beast::error_code ec) {
    if (epoch != epoch_) return;
    if (ec) return fail(epoch, "TLS handshake", ec);

    beast::get_lowest_layer(*ws_).expires_never();
    ws_->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));

    std::string bearer;
    if (!api_key_.empty() && !api_secret_.empty()) {
        bearer = "Bearer " + JwtGenerator::generate(api_key_, api_secret_);
    }
    ws_->set_option(websocket::stream_base::decorator(
        [bearer](websocket::request_type& req) {
            if (!bearer.empty()) {
                req.set(beast::http::field::authorization, bearer);
            }
            req.set(beast::http::field::user_agent, "OrderGuard/1.0");
        }
    ));
    auto ws = ws_;
    ws->async_handshake(endpoint_.host, endpoint_.target,
        [this, epoch, ws](beast::error_code ec2) { onWsHandshake(epoch, ec2); });
}

void BusWebSocketClient::onWsHandshake(std::uint64_t epoch, beast::error_code ec) {
    if (epoch != epoch_) return;
    if (ec) return fail(epoch, "WebSocket handshake", ec);

    reconnect_attempt_ = 0;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        connected_ = true;
    }
    state_cv_.notify_all();
    LOG_INFO("Bus connected");
    publishConnectionState(ConnectionState::CONNECTED);

    doRead(epoch);
    schedulePing(epoch);
}

void BusWebSocketClient::doRead(std::uint64_t epoch) {
    auto ws = ws_;
    ws->async_read(buffer_, [this, epoch, ws](beast::error_code ec, std::size_t) {
        if (epoch != epoch_) return;
        if (ec) return fail(epoch, "read", ec);

        const std::string payload = beast::buffers_to_string(buffer_.cdata());
        buffer_.consume(buffer_.size());
            dispatchMessage(payload);
        doRead(epoch);
    });
}

void BusWebSocketClient::doWrite(std::uint64_t epoch) {
    if (write_queue_.empty() || epoch != epoch_) return;
    auto ws = ws_;
    ws->async_write(net::buffer(write_queue_.front()), [this, epoch, ws](beast::error_code ec, std::size_t) {
        if (epoch != epoch_) return;
        if (ec) return fail(epoch, "write", ec);
        write_queue_.pop_front();
        if (!write_queue_.empty()) doWrite(epoch);
    });
}

void BusWebSocketClient::schedulePing(std::uint64_t epoch) {
    ping_timer_.expires_after(std::chrono::seconds(25));
    ping_timer_.async_wait([this, epoch](beast::error_code ec) {
        if (ec || epoch != epoch_) return;
        auto ws = ws_;
        ws->async_ping({}, [this, epoch, ws](beast::error_code ec2) {
            if (epoch != epoch_) return;
            if (ec2) return fail(epoch, "ping", ec2);
            schedulePing(epoch);
        });
    });
}

void BusWebSocketClient::fail(std::uint64_t epoch, const std::string& what, beast::error_code ec) {
    if (epoch != epoch_) return;
    ++epoch_;
    ping_timer_.cancel();
    write_queue_.clear();
    if (ws_) {
        beast::error_code close_ec;
        beast::get_lowest_layer(*ws_).socket().close(close_ec);
    }
    connected_ = false;
    if (!running_) {
        return;
    }
    LOG_WARN("Bus {} failed: {}", what, ec.message());
    publishConnectionState(ConnectionState::RECONNECTING);
    scheduleReconnect();
}

void BusWebSocketClient::scheduleReconnect() {
    ++reconnect_attempt_;
    const int backoff_seconds = std::min(30, reconnect_attempt_ * 2);
    LOG_INFO("Bus reconnect in {}s (attempt {})", backoff_seconds, reconnect_attempt_);
    reconnect_timer_.expires_after(std::chrono::seconds(backoff_seconds));
    reconnect_timer_.async_wait([this](beast::error_code ec) {
        if (ec || !running_) return;
        doConnect();
    });
}

// ---------------------------------------------------------------------------
// Dispatch (io thread)

void BusWebSocketClient::dispatchMessage(const std::string& payload) {
    const auto message = nlohmann::json::parse(payload, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        LOG_WARN("Dropping malformed bus frame");
        return;
    }
    const auto channel = message.find("channel");
    if (channel == message.end() || !channel->is_string()) {
        LOG_DEBUG("Bus control frame: {}", payload);
        return;
    }
    const std::string name = channel->get<std::string>();
    if (name == kConnectionChannel) {
        return;
    }

    core::MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        auto it = handlers_.find(name);
        if (it == handlers_.end()) {
            return;
        }
        handler = it->second;
    }

    const auto data = message.find("data");
    try {
        handler(data != message.end() ? *data : nlohmann::json::object());
    } catch (const std::exception& e) {
        LOG_WARN("Bus handler for {} failed: {}", name, e.what());
    }
}

void BusWebSocketClient::publishConnectionState(ConnectionState state) {
    state_.store(state);
    core::MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        auto it = handlers_.find(kConnectionChannel);
        if (it == handlers_.end()) {
            return;
        }
        handler = it->second;
    }
    emitConnectionState(handler, state);
}

void BusWebSocketClient::emitConnectionState(const core::MessageHandler& handler, ConnectionState state) {
    if (!handler) {
        return;
    }
    try {
        handler(nlohmann::json{{"state", connectionStateToString(state)}});
    } catch (const std::exception& e) {
        LOG_WARN("Connection state handler failed: {}", e.what());
    }
}

} // namespace network
} // namespace orderguard
