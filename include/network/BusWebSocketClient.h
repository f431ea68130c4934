#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include "common/Types.h"
#include "core/contracts/IMessageBus.h"

namespace orderguard {
namespace network {

struct BusEndpoint {
    std::string host;
    std::string port = "443";
    std::string target = "/ws/bus";
};

// WebSocket client for the pub/sub relay.
// Frames out: {"action":"subscribe"|"unsubscribe","channel":...}.
// Frames in:  {"channel":...,"data":...}, dispatched on the single io thread.
// "connection:state" is local: the client publishes its own CONNECTED /
// RECONNECTING / DISCONNECTED transitions there and replays the current state
// to a new subscriber.
class BusWebSocketClient : public core::IMessageBus {
public:
    BusWebSocketClient(BusEndpoint endpoint, std::string api_key, std::string api_secret);
    ~BusWebSocketClient() override;

    BusWebSocketClient(const BusWebSocketClient&) = delete;
    BusWebSocketClient& operator=(const BusWebSocketClient&) = delete;

    void start();
    void stop();

    // Throws TransientIoError while not connected.
    void subscribe(const std::string& channel, core::MessageHandler handler) override;
    void unsubscribe(const std::string& channel) override;

    bool isConnected() const { return connected_.load(); }
    bool waitConnected(Duration timeout);

private:
    using Stream = boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>>;

    void doConnect();
    void onResolve(std::uint64_t epoch, boost::beast::error_code ec,
                   boost::asio::ip::tcp::resolver::results_type results);
    void onConnect(std::uint64_t epoch, boost::beast::error_code ec);
    void onSslHandshake(std::uint64_t epoch, boost::beast::error_code ec);
    void onWsHandshake(std::uint64_t epoch, boost::beast::error_code ec);
    void doRead(std::uint64_t epoch);
    void doWrite(std::uint64_t epoch);
    void schedulePing(std::uint64_t epoch);
    void fail(std::uint64_t epoch, const std::string& what, boost::beast::error_code ec);
    void scheduleReconnect();

    void send(nlohmann::json frame);
    void dispatchMessage(const std::string& payload);
    void publishConnectionState(ConnectionState state);
    void emitConnectionState(const core::MessageHandler& handler, ConnectionState state);

    BusEndpoint endpoint_;
    std::string api_key_;
    std::string api_secret_;

    boost::asio::io_context ioc_;
    boost::asio::ssl::context ssl_ctx_{boost::asio::ssl::context::tlsv12_client};
    boost::asio::strand<boost::asio::io_context::executor_type> strand_{ioc_.get_executor()};
    boost::asio::ip::tcp::resolver resolver_{strand_};
    boost::asio::steady_timer reconnect_timer_{strand_};
    boost::asio::steady_timer ping_timer_{strand_};
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    std::thread io_thread_;

    // Strand-only state.
    // Pending operations hold their own reference; a reconnect never frees a busy stream.
    std::shared_ptr<Stream> ws_;
    boost::beast::flat_buffer buffer_;
    std::deque<std::string> write_queue_;
    std::uint64_t epoch_ = 0;
    int reconnect_attempt_ = 0;

    mutable std::mutex handlers_mutex_;
    std::map<std::string, core::MessageHandler> handlers_;

    std::mutex state_mutex_;
    std::condition_variable state_cv_;
    std::atomic<ConnectionState> state_{ConnectionState::DISCONNECTED};

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
};

} // namespace network
} // namespace orderguard
