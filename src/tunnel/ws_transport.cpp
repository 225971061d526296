#include "tunnel/ws_transport.hpp"
#include "common/log.hpp"

#include <spdlog/fmt/fmt.h>

namespace sightlink::tunnel {

namespace {

const log::Logger& logger() {
    static const log::Logger instance(log::TRANSPORT_LOGGER);
    return instance;
}

constexpr std::string_view SERVER_CLOSED = "server explicitly closed";
constexpr std::string_view CLIENT_CLOSED = "client explicitly closed";

std::string join_url(std::string address, const std::optional<std::string>& base_path) {
    // Gateways are addressed by their HTTP URL as often as by ws://
    if (address.starts_with("http://")) {
        address.replace(0, 4, "ws");
    } else if (address.starts_with("https://")) {
        address.replace(0, 5, "wss");
    }
    if (base_path && !base_path->empty()) {
        while (!address.empty() && address.back() == '/') {
            address.pop_back();
        }
        if (base_path->front() != '/') {
            address += '/';
        }
        address += *base_path;
    }
    return address;
}

} // anonymous namespace

// ============================================================================
// WsTransport Implementation
// ============================================================================

std::shared_ptr<WsTransport> WsTransport::create(net::io_context& ioc, Options options) {
    return std::shared_ptr<WsTransport>(new WsTransport(ioc, std::move(options)));
}

WsTransport::WsTransport(net::io_context& ioc, Options options)
    : ioc_(ioc)
    , options_(std::move(options))
    , resolver_(ioc)
    , keepalive_timer_(ioc)
    , reconnect_timer_(ioc)
    , retry_(options_.reconnect)
{
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

WsTransport::~WsTransport() {
    shutdown_ = true;
    keepalive_timer_.cancel();
    reconnect_timer_.cancel();
    close_streams();
}

void WsTransport::transition_to(ConnectionState new_state) {
    ConnectionState old_state = state_;
    state_ = new_state;
    if (old_state != new_state) {
        logger().debug("WsTransport: State {} -> {}",
                       connection_state_to_string(old_state),
                       connection_state_to_string(new_state));
    }
}

ConnectionStatus WsTransport::connection_status() const {
    ConnectionStatus status;
    status.connected = is_connected();
    status.device_id = device_id_;
    if (!url_.empty()) {
        status.url = url_;
    }
    return status;
}

void WsTransport::connect(const std::string& address,
                          const std::optional<std::string>& auth_code,
                          const std::optional<std::string>& base_path,
                          ConnectHandler handler) {
    url_ = join_url(address, base_path);
    auth_code_ = auth_code;

    auto parts = HttpUrl::parse(url_);
    if (!parts) {
        logger().error("WsTransport: Invalid gateway URL: {}", url_);
        net::post(ioc_, [handler = std::move(handler), url = url_]() {
            if (handler) {
                handler(std::unexpected(TunnelError::connection("invalid gateway URL: " + url)));
            }
        });
        return;
    }
    url_parts_ = *parts;

    if (state_ == ConnectionState::CONNECTED) {
        net::post(ioc_, [handler = std::move(handler)]() {
            if (handler) handler({});
        });
        return;
    }

    // A later connect() replaces the caller waiting on an in-flight attempt
    if (connect_handler_) {
        complete_connect(std::unexpected(TunnelError::connection("superseded by a newer connect")));
    }
    connect_handler_ = std::move(handler);

    shutdown_ = false;
    retry_.reset();
    reconnect_timer_.cancel();

    if (state_ == ConnectionState::DISCONNECTED) {
        start_connect();
    }
}

void WsTransport::reconnect() {
    if (url_parts_.host.empty()) {
        logger().warn("WsTransport: reconnect() before connect(), ignoring");
        return;
    }
    logger().info("WsTransport: Manual reconnect to {}", url_);

    shutdown_ = false;
    retry_.reset();
    reconnect_timer_.cancel();
    keepalive_timer_.cancel();

    bool was_connected = state_ == ConnectionState::CONNECTED;
    close_streams();
    fail_pending_writes("reconnecting");
    transition_to(ConnectionState::DISCONNECTED);
    if (was_connected) {
        notify_connection_change(false, "manual reconnect");
    }
    start_connect();
}

void WsTransport::disconnect() {
    if (shutdown_ && state_ == ConnectionState::DISCONNECTED) {
        return;
    }

    shutdown_ = true;
    retry_.reset();
    keepalive_timer_.cancel();
    reconnect_timer_.cancel();
    resolver_.cancel();

    bool was_connected = state_ == ConnectionState::CONNECTED;
    close_streams();
    fail_pending_writes("disconnected");
    complete_connect(std::unexpected(TunnelError::connection("disconnected")));
    transition_to(ConnectionState::DISCONNECTED);

    if (was_connected) {
        logger().info("WsTransport: Disconnected from {}", url_);
        notify_connection_change(false, std::string(CLIENT_CLOSED));
    }
}

void WsTransport::close_streams() {
    ++generation_;
    beast::error_code ec;
    if (wss_) {
        beast::get_lowest_layer(*wss_).socket().close(ec);
        wss_.reset();
    }
    if (ws_) {
        beast::get_lowest_layer(*ws_).socket().close(ec);
        ws_.reset();
    }
    read_buffer_.consume(read_buffer_.size());
    writing_ = false;
}

void WsTransport::complete_connect(VoidResult result) {
    if (!connect_handler_) {
        return;
    }
    auto handler = std::move(connect_handler_);
    connect_handler_ = nullptr;
    handler(std::move(result));
}

// ============================================================================
// Connect chain: resolve -> TCP -> (TLS) -> WebSocket upgrade
// ============================================================================

void WsTransport::start_connect() {
    transition_to(ConnectionState::CONNECTING);
    do_resolve();
}

void WsTransport::do_resolve() {
    logger().debug("WsTransport: Resolving {}:{}", url_parts_.host, url_parts_.port);

    resolver_.async_resolve(url_parts_.host, url_parts_.port,
        [self = shared_from_this(), gen = generation_](beast::error_code ec,
                                                       tcp::resolver::results_type results) {
            if (gen != self->generation_ || self->shutdown_) {
                return;
            }
            if (ec) {
                self->on_connect_failed("DNS resolve failed: " + ec.message());
                return;
            }
            self->do_connect(results);
        });
}

void WsTransport::do_connect(const tcp::resolver::results_type& results) {
    auto on_tcp = [self = shared_from_this(), gen = generation_](beast::error_code ec,
                                                                const tcp::endpoint&) {
        if (gen != self->generation_ || self->shutdown_) {
            return;
        }
        if (ec) {
            self->on_connect_failed("TCP connect failed: " + ec.message());
            return;
        }
        if (self->wss_) {
            self->do_tls_handshake();
        } else {
            self->do_ws_handshake();
        }
    };

    if (url_parts_.use_ssl) {
        wss_ = std::make_unique<TlsStream>(ioc_, ssl_ctx_);

        // SNI
        if (!SSL_set_tlsext_host_name(wss_->next_layer().native_handle(), url_parts_.host.c_str())) {
            on_connect_failed("failed to set SNI hostname");
            return;
        }
        beast::get_lowest_layer(*wss_).expires_after(options_.handshake_timeout);
        beast::get_lowest_layer(*wss_).async_connect(results, std::move(on_tcp));
    } else {
        ws_ = std::make_unique<PlainStream>(ioc_);
        beast::get_lowest_layer(*ws_).expires_after(options_.handshake_timeout);
        beast::get_lowest_layer(*ws_).async_connect(results, std::move(on_tcp));
    }
}

void WsTransport::do_tls_handshake() {
    beast::get_lowest_layer(*wss_).expires_after(options_.handshake_timeout);
    wss_->next_layer().async_handshake(ssl::stream_base::client,
        [self = shared_from_this(), gen = generation_](beast::error_code ec) {
            if (gen != self->generation_ || self->shutdown_) {
                return;
            }
            if (ec) {
                self->on_connect_failed("TLS handshake failed: " + ec.message());
                return;
            }
            self->do_ws_handshake();
        });
}

void WsTransport::do_ws_handshake() {
    with_stream([this](auto& stream) {
        // The websocket layer owns timeouts from here on
        beast::get_lowest_layer(stream).expires_never();

        websocket::stream_base::timeout opt{
            options_.handshake_timeout,
            websocket::stream_base::none(),
            false,
        };
        stream.set_option(opt);
        stream.set_option(websocket::stream_base::decorator(
            [auth = auth_code_](websocket::request_type& req) {
                req.set(beast::http::field::user_agent, "SightLink/1.0");
                if (auth && !auth->empty()) {
                    req.set(beast::http::field::authorization, "Bearer " + *auth);
                }
            }));
        stream.control_callback([this](websocket::frame_type kind, beast::string_view) {
            if (kind == websocket::frame_type::pong) {
                missed_pongs_ = 0;
            }
        });

        std::string host = url_parts_.host + ":" + url_parts_.port;
        stream.async_handshake(host, url_parts_.target,
            [self = shared_from_this(), gen = generation_](beast::error_code ec) {
                if (gen != self->generation_ || self->shutdown_) {
                    return;
                }
                if (ec) {
                    self->on_connect_failed("WebSocket handshake failed: " + ec.message());
                    return;
                }
                self->on_connected();
            });
    });
}

void WsTransport::on_connected() {
    logger().info("WsTransport: Connected to {}", url_);

    transition_to(ConnectionState::CONNECTED);
    retry_.reset();
    missed_pongs_ = 0;

    with_stream([](auto& stream) { stream.text(true); });

    notify_connection_change(true, "connected");
    complete_connect({});

    // Callbacks above may have disconnected us
    if (state_ != ConnectionState::CONNECTED) {
        return;
    }
    start_keepalive();
    do_read();
}

// ============================================================================
// Failure handling and reconnection
// ============================================================================

void WsTransport::on_connect_failed(const std::string& reason) {
    logger().error("WsTransport: {} ({})", reason, url_);

    close_streams();
    transition_to(ConnectionState::DISCONNECTED);
    complete_connect(std::unexpected(TunnelError::connection(reason)));
    schedule_reconnect();
}

void WsTransport::on_connection_lost(const std::string& reason, bool terminal) {
    keepalive_timer_.cancel();
    close_streams();
    fail_pending_writes(reason);
    transition_to(ConnectionState::DISCONNECTED);
    notify_connection_change(false, reason);

    if (terminal) {
        logger().info("WsTransport: Connection closed: {}, not reconnecting", reason);
        return;
    }
    logger().warn("WsTransport: Connection lost: {}", reason);
    schedule_reconnect();
}

void WsTransport::schedule_reconnect() {
    if (shutdown_) {
        return;
    }

    if (retry_.exhausted()) {
        auto error = TunnelError::connection(
            fmt::format("gave up after {} reconnect attempts", retry_.attempt()));
        logger().error("WsTransport: Max reconnect attempts exceeded for {}", url_);
        notify_error(error);
        return;
    }

    auto delay = retry_.next_delay();
    logger().info("WsTransport: Reconnecting in {}ms (attempt {}/{})", delay.count(),
                  retry_.attempt(), retry_.policy().max_attempts);

    reconnect_timer_.expires_after(delay);
    reconnect_timer_.async_wait([self = shared_from_this()](beast::error_code ec) {
        if (ec || self->shutdown_ || self->state_ != ConnectionState::DISCONNECTED) {
            return;
        }
        self->start_connect();
    });
}

// ============================================================================
// Read / write
// ============================================================================

void WsTransport::do_read() {
    with_stream([this](auto& stream) {
        stream.async_read(read_buffer_,
            [self = shared_from_this(), gen = generation_](beast::error_code ec, std::size_t bytes) {
                if (gen != self->generation_) {
                    return;
                }
                if (ec) {
                    if (ec == websocket::error::closed) {
                        std::string reason;
                        bool normal = false;
                        self->with_stream([&](auto& s) {
                            normal = s.reason().code == websocket::close_code::normal;
                            reason = std::string(s.reason().reason.c_str());
                        });
                        if (normal) {
                            self->on_connection_lost(std::string(SERVER_CLOSED), true);
                        } else {
                            self->on_connection_lost(
                                reason.empty() ? "closed by gateway" : "closed by gateway: " + reason, false);
                        }
                        return;
                    }
                    if (ec != net::error::operation_aborted && !self->shutdown_) {
                        self->on_connection_lost("read error: " + ec.message(), false);
                    }
                    return;
                }

                self->stats_.bytes_received += bytes;
                self->stats_.frames_received++;

                std::string text = beast::buffers_to_string(self->read_buffer_.data());
                self->read_buffer_.consume(self->read_buffer_.size());

                auto envelope = parse_envelope(text);
                if (envelope) {
                    self->notify_message(*envelope);
                } else {
                    logger().warn("WsTransport: Dropping frame: {}", envelope.error().to_string());
                }

                if (gen == self->generation_ && self->state_ == ConnectionState::CONNECTED) {
                    self->do_read();
                }
            });
    });
}

VoidResult WsTransport::send_message(const Envelope& envelope, SendHandler handler) {
    if (!is_connected()) {
        return std::unexpected(TunnelError::send(
            fmt::format("not connected, cannot send '{}' to {}", envelope.type, envelope.to)));
    }

    write_queue_.push_back(PendingWrite{std::make_shared<std::string>(envelope.serialize()),
                                       std::move(handler)});
    if (!writing_) {
        do_write();
    }
    return {};
}

void WsTransport::do_write() {
    if (write_queue_.empty()) {
        writing_ = false;
        return;
    }
    writing_ = true;

    auto data = write_queue_.front().data;
    with_stream([this, data](auto& stream) {
        stream.async_write(net::buffer(*data),
            [self = shared_from_this(), gen = generation_, data](beast::error_code ec, std::size_t bytes) {
                if (gen != self->generation_) {
                    return;
                }
                if (ec) {
                    logger().warn("WsTransport: Write error: {}", ec.message());
                    self->fail_pending_writes("write failed: " + ec.message());
                    self->writing_ = false;
                    return;
                }

                self->stats_.bytes_sent += bytes;
                self->stats_.frames_sent++;

                auto handler = std::move(self->write_queue_.front().handler);
                self->write_queue_.pop_front();
                if (handler) {
                    handler({});
                }
                if (gen == self->generation_) {
                    self->do_write();
                }
            });
    });
}

void WsTransport::fail_pending_writes(const std::string& reason) {
    auto pending = std::move(write_queue_);
    write_queue_.clear();
    for (auto& write : pending) {
        if (write.handler) {
            write.handler(std::unexpected(TunnelError::send(reason)));
        }
    }
}

void WsTransport::start_keepalive() {
    keepalive_timer_.expires_after(options_.keepalive_interval);
    keepalive_timer_.async_wait([self = shared_from_this(), gen = generation_](beast::error_code ec) {
        if (ec || gen != self->generation_ || self->state_ != ConnectionState::CONNECTED) {
            return;
        }

        self->missed_pongs_++;
        if (self->missed_pongs_ > self->options_.max_missed_pongs) {
            self->on_connection_lost("keepalive timeout", false);
            return;
        }

        self->with_stream([&](auto& stream) {
            stream.async_ping({}, [self, gen](beast::error_code ping_ec) {
                if (ping_ec && gen == self->generation_) {
                    logger().debug("WsTransport: Ping failed: {}", ping_ec.message());
                }
            });
        });
        self->start_keepalive();
    });
}

} // namespace sightlink::tunnel
