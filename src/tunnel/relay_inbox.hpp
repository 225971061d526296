#pragma once

#include "common/http_client.hpp"
#include "tunnel/envelope.hpp"
#include "tunnel/errors.hpp"

#include <functional>
#include <memory>
#include <string>

namespace sightlink::tunnel {

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

HttpResponse make_json_response(http::status status, const json::object& body, unsigned version = 11);

// ============================================================================
// Relay Inbox
// ============================================================================
// Loopback HTTP endpoint the relay daemon calls with inbound envelopes:
//   POST /relay/receive  {type, from, to, payload}
//   -> 200 {"success":true} | 400 {"success":false,"error":...}
class RelayInbox {
public:
    using EnvelopeReceiver = std::function<void(const Envelope&)>;

    struct Options {
        std::string listen_address = "127.0.0.1";
        uint16_t port = 4011;   // 0 picks a free port
        std::string receive_path = "/relay/receive";
    };

    RelayInbox(net::io_context& ioc, Options options, EnvelopeReceiver receiver);
    ~RelayInbox();

    RelayInbox(const RelayInbox&) = delete;
    RelayInbox& operator=(const RelayInbox&) = delete;

    VoidResult start();
    void stop();

    bool running() const { return running_; }
    // Bound port, valid after start()
    uint16_t port() const { return bound_port_; }

    // Routing and body handling for one request
    HttpResponse handle(const HttpRequest& request) const;

private:
    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);

    net::io_context& ioc_;
    Options options_;
    EnvelopeReceiver receiver_;
    tcp::acceptor acceptor_;
    uint16_t bound_port_ = 0;
    bool running_ = false;
};

} // namespace sightlink::tunnel
