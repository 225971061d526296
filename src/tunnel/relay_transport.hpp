#pragma once

#include "common/http_client.hpp"
#include "tunnel/transport_gateway.hpp"

#include <chrono>
#include <string>

namespace sightlink::tunnel {

// ============================================================================
// Relay Transport
// ============================================================================
// Hands every envelope to a local relay daemon with one POST. There is no
// held connection, so connect/disconnect do nothing and is_connected() is
// always true. Inbound envelopes arrive through receive_message().
class RelayTransport : public TransportGateway {
public:
    struct Options {
        std::string relay_host = "127.0.0.1";
        uint16_t relay_port = 4010;
        std::string send_path = "/relay/send";
        std::chrono::milliseconds request_timeout{10000};
    };

    RelayTransport(net::io_context& ioc, Options options);

    void connect(const std::string& address,
                 const std::optional<std::string>& auth_code,
                 const std::optional<std::string>& base_path,
                 ConnectHandler handler) override;
    void disconnect() override {}
    VoidResult send_message(const Envelope& envelope, SendHandler handler) override;

    bool is_connected() const override { return true; }
    ConnectionStatus connection_status() const override;
    TransportType transport_type() const override { return TransportType::RELAY; }

    void receive_message(const Envelope& envelope);

    std::string send_url() const;

private:
    net::io_context& ioc_;
    HttpClient client_;
    Options options_;
};

} // namespace sightlink::tunnel
