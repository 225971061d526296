#include "tunnel/relay_transport.hpp"
#include "common/log.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>

namespace sightlink::tunnel {

namespace {

const log::Logger& logger() {
    static const log::Logger instance(log::TRANSPORT_LOGGER);
    return instance;
}

} // anonymous namespace

RelayTransport::RelayTransport(net::io_context& ioc, Options options)
    : ioc_(ioc)
    , client_(ioc)
    , options_(std::move(options))
{
}

std::string RelayTransport::send_url() const {
    return fmt::format("http://{}:{}{}", options_.relay_host, options_.relay_port, options_.send_path);
}

void RelayTransport::connect(const std::string&,
                             const std::optional<std::string>&,
                             const std::optional<std::string>&,
                             ConnectHandler handler) {
    logger().info("RelayTransport: Using relay daemon at {}", send_url());
    net::post(ioc_, [handler = std::move(handler)]() {
        if (handler) handler({});
    });
}

ConnectionStatus RelayTransport::connection_status() const {
    ConnectionStatus status;
    status.connected = true;
    status.device_id = device_id_;
    status.url = send_url();
    return status;
}

VoidResult RelayTransport::send_message(const Envelope& envelope, SendHandler handler) {
    HttpRequestOptions request;
    request.method = http::verb::post;
    request.url = send_url();
    request.body = envelope.serialize();
    request.timeout = options_.request_timeout;

    logger().debug("RelayTransport: Sending '{}' to {} via {}", envelope.type, envelope.to, request.url);

    client_.request(std::move(request),
        [handler = std::move(handler), type = envelope.type, to = envelope.to](
            beast::error_code ec, HttpResult result) {
            if (ec || !result.ok()) {
                std::string reason = ec
                    ? ec.message()
                    : fmt::format("relay answered {}: {}", result.status,
                                  result.body.substr(0, std::min<size_t>(result.body.size(), 200)));
                logger().error("RelayTransport: Failed to send '{}' to {}: {}", type, to, reason);
                if (handler) handler(std::unexpected(TunnelError::send(reason)));
                return;
            }
            if (handler) handler({});
        });
    return {};
}

void RelayTransport::receive_message(const Envelope& envelope) {
    logger().debug("RelayTransport: Received '{}' {} -> {}", envelope.type, envelope.from, envelope.to);
    notify_message(envelope);
}

} // namespace sightlink::tunnel
