#pragma once

#include "common/http_client.hpp"
#include "common/retry.hpp"
#include "tunnel/transport_gateway.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <chrono>
#include <deque>
#include <memory>
#include <string>

namespace sightlink::tunnel {

namespace websocket = beast::websocket;

// ============================================================================
// WebSocket Transport (duplex)
// ============================================================================
// One JSON envelope per text frame. Unexpected drops reconnect with
// exponential backoff; a local disconnect() or a normal close frame from
// the gateway is terminal until connect() or reconnect() is called again.
class WsTransport : public TransportGateway, public std::enable_shared_from_this<WsTransport> {
public:
    struct Options {
        RetryPolicy reconnect = RetryPolicy::gateway_reconnect();
        std::chrono::milliseconds keepalive_interval{30000};
        uint32_t max_missed_pongs = 3;
        std::chrono::milliseconds handshake_timeout{10000};
    };

    static std::shared_ptr<WsTransport> create(net::io_context& ioc, Options options = {});
    ~WsTransport() override;

    WsTransport(const WsTransport&) = delete;
    WsTransport& operator=(const WsTransport&) = delete;

    void connect(const std::string& address,
                 const std::optional<std::string>& auth_code,
                 const std::optional<std::string>& base_path,
                 ConnectHandler handler) override;
    void disconnect() override;
    VoidResult send_message(const Envelope& envelope, SendHandler handler) override;

    bool is_connected() const override { return state_ == ConnectionState::CONNECTED; }
    ConnectionStatus connection_status() const override;
    TransportType transport_type() const override { return TransportType::DUPLEX; }

    // Manual reconnect: resets the attempt counter, ignores terminal reasons
    void reconnect();

    uint32_t reconnect_attempts() const { return retry_.attempt(); }
    ConnectionState state() const { return state_; }
    const std::string& url() const { return url_; }

    struct Stats {
        uint64_t frames_sent = 0;
        uint64_t frames_received = 0;
        uint64_t bytes_sent = 0;
        uint64_t bytes_received = 0;
    };
    const Stats& stats() const { return stats_; }

private:
    WsTransport(net::io_context& ioc, Options options);

    using PlainStream = websocket::stream<beast::tcp_stream>;
    using TlsStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

    template<typename Fn>
    void with_stream(Fn&& fn) {
        if (wss_) {
            fn(*wss_);
        } else if (ws_) {
            fn(*ws_);
        }
    }

    void start_connect();
    void do_resolve();
    void do_connect(const tcp::resolver::results_type& results);
    void do_tls_handshake();
    void do_ws_handshake();
    void on_connected();

    void do_read();
    void do_write();
    void start_keepalive();

    void on_connect_failed(const std::string& reason);
    void on_connection_lost(const std::string& reason, bool terminal);
    void schedule_reconnect();
    void close_streams();
    void fail_pending_writes(const std::string& reason);
    void complete_connect(VoidResult result);
    void transition_to(ConnectionState new_state);

    net::io_context& ioc_;
    Options options_;

    std::string url_;
    HttpUrl url_parts_;
    std::optional<std::string> auth_code_;

    ssl::context ssl_ctx_{ssl::context::tlsv12_client};
    tcp::resolver resolver_;
    std::unique_ptr<PlainStream> ws_;
    std::unique_ptr<TlsStream> wss_;

    ConnectionState state_ = ConnectionState::DISCONNECTED;
    bool shutdown_ = true;
    // Bumped whenever the streams are torn down; stale completions compare
    // against it and bail out
    uint64_t generation_ = 0;

    ConnectHandler connect_handler_;

    beast::flat_buffer read_buffer_;

    struct PendingWrite {
        std::shared_ptr<std::string> data;
        SendHandler handler;
    };
    std::deque<PendingWrite> write_queue_;
    bool writing_ = false;

    net::steady_timer keepalive_timer_;
    uint32_t missed_pongs_ = 0;

    net::steady_timer reconnect_timer_;
    RetryState retry_;

    Stats stats_;
};

} // namespace sightlink::tunnel
