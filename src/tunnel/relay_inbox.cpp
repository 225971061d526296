#include "tunnel/relay_inbox.hpp"
#include "common/log.hpp"

#include <boost/core/ignore_unused.hpp>

namespace sightlink::tunnel {

namespace {

const log::Logger& logger() {
    static const log::Logger instance(log::TRANSPORT_LOGGER);
    return instance;
}

// ============================================================================
// Inbox Session (one connection, keep-alive aware)
// ============================================================================

class InboxSession : public std::enable_shared_from_this<InboxSession> {
public:
    InboxSession(tcp::socket socket, const RelayInbox& inbox)
        : stream_(std::move(socket))
        , inbox_(inbox)
    {}

    void run() { do_read(); }

private:
    void do_read() {
        request_ = {};
        buffer_.consume(buffer_.size());
        stream_.expires_after(std::chrono::seconds(30));

        http::async_read(stream_, buffer_, request_,
            beast::bind_front_handler(&InboxSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);

        if (ec == http::error::end_of_stream) {
            do_close();
            return;
        }
        if (ec) {
            if (ec != beast::error::timeout) {
                logger().warn("RelayInbox: Read error: {}", ec.message());
            }
            return;
        }

        send_response(inbox_.handle(request_));
    }

    void send_response(HttpResponse&& response) {
        response_ = std::make_shared<HttpResponse>(std::move(response));
        response_->keep_alive(request_.keep_alive());

        http::async_write(stream_, *response_,
            beast::bind_front_handler(&InboxSession::on_write, shared_from_this(),
                                      response_->need_eof()));
    }

    void on_write(bool close, beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);

        if (ec) {
            logger().warn("RelayInbox: Write error: {}", ec.message());
            return;
        }
        if (close) {
            do_close();
            return;
        }
        do_read();
    }

    void do_close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    const RelayInbox& inbox_;
    beast::flat_buffer buffer_;
    HttpRequest request_;
    std::shared_ptr<HttpResponse> response_;
};

json::object error_body(const std::string& message) {
    return json::object{{"success", false}, {"error", message}};
}

} // anonymous namespace

HttpResponse make_json_response(http::status status, const json::object& body, unsigned version) {
    HttpResponse res{status, version};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(body);
    res.prepare_payload();
    return res;
}

// ============================================================================
// RelayInbox
// ============================================================================

RelayInbox::RelayInbox(net::io_context& ioc, Options options, EnvelopeReceiver receiver)
    : ioc_(ioc)
    , options_(std::move(options))
    , receiver_(std::move(receiver))
    , acceptor_(ioc)
{
}

RelayInbox::~RelayInbox() {
    stop();
}

VoidResult RelayInbox::start() {
    if (running_) {
        return {};
    }

    beast::error_code ec;
    auto const address = net::ip::make_address(options_.listen_address, ec);
    if (ec) {
        return std::unexpected(TunnelError::connection("invalid inbox address: " + ec.message()));
    }
    auto endpoint = tcp::endpoint{address, options_.port};

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        return std::unexpected(TunnelError::connection("failed to open inbox acceptor: " + ec.message()));
    }
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);

    acceptor_.bind(endpoint, ec);
    if (ec) {
        acceptor_.close(ec);
        return std::unexpected(TunnelError::connection(
            "failed to bind inbox on port " + std::to_string(options_.port) + ": " + ec.message()));
    }

    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        acceptor_.close(ec);
        return std::unexpected(TunnelError::connection("failed to listen: " + ec.message()));
    }

    bound_port_ = acceptor_.local_endpoint(ec).port();
    running_ = true;
    logger().info("RelayInbox: Listening on {}:{}{}", options_.listen_address, bound_port_,
                  options_.receive_path);

    do_accept();
    return {};
}

void RelayInbox::stop() {
    if (!running_) return;

    running_ = false;
    beast::error_code ec;
    acceptor_.close(ec);
    logger().info("RelayInbox: Stopped");
}

void RelayInbox::do_accept() {
    acceptor_.async_accept(ioc_,
        beast::bind_front_handler(&RelayInbox::on_accept, this));
}

void RelayInbox::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (running_) {
            logger().error("RelayInbox: Accept error: {}", ec.message());
        }
        return;
    }

    std::make_shared<InboxSession>(std::move(socket), *this)->run();

    if (running_) {
        do_accept();
    }
}

HttpResponse RelayInbox::handle(const HttpRequest& request) const {
    auto target = std::string(request.target());
    if (target != options_.receive_path) {
        return make_json_response(http::status::not_found, error_body("not found: " + target),
                                  request.version());
    }
    if (request.method() != http::verb::post) {
        return make_json_response(http::status::method_not_allowed,
                                  error_body("only POST is accepted"), request.version());
    }

    auto envelope = parse_envelope(request.body());
    if (!envelope) {
        logger().warn("RelayInbox: Rejecting message: {}", envelope.error().to_string());
        return make_json_response(http::status::bad_request, error_body(envelope.error().message),
                                  request.version());
    }

    if (receiver_) {
        receiver_(*envelope);
    }
    return make_json_response(http::status::ok, json::object{{"success", true}}, request.version());
}

} // namespace sightlink::tunnel
