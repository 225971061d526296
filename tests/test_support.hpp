#pragma once

#include "tunnel/inference_executor.hpp"
#include "tunnel/stream_reassembler.hpp"
#include "tunnel/system_info.hpp"
#include "tunnel/transport_gateway.hpp"

#include <boost/asio.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace sightlink::test {

namespace json = boost::json;
using namespace sightlink::tunnel;

// ============================================================================
// FakeTransport
// ============================================================================
// Records sends; delivery completes synchronously unless deferred.
class FakeTransport : public TransportGateway {
public:
    void connect(const std::string& address,
                 const std::optional<std::string>& auth_code,
                 const std::optional<std::string>&,
                 ConnectHandler handler) override {
        connect_calls++;
        last_address = address;
        last_auth_code = auth_code;
        if (fail_connect) {
            if (handler) handler(std::unexpected(TunnelError::connection("refused")));
            return;
        }
        connected = true;
        if (handler) handler({});
    }

    void disconnect() override {
        disconnect_calls++;
        if (connected) {
            connected = false;
            notify_connection_change(false, "client explicitly closed");
        }
    }

    VoidResult send_message(const Envelope& envelope, SendHandler handler) override {
        if (!connected) {
            return std::unexpected(TunnelError::send("not connected"));
        }
        sent.push_back(envelope);
        if (defer_delivery) {
            deferred.push_back(std::move(handler));
            return {};
        }
        if (handler) {
            if (fail_delivery) {
                handler(std::unexpected(TunnelError::send("delivery failed")));
            } else {
                handler({});
            }
        }
        return {};
    }

    bool is_connected() const override { return connected; }

    ConnectionStatus connection_status() const override {
        ConnectionStatus status;
        status.connected = connected;
        status.device_id = device_id_;
        status.url = last_address;
        return status;
    }

    TransportType transport_type() const override { return TransportType::DUPLEX; }

    // Test drivers
    void inject(const Envelope& envelope) { notify_message(envelope); }
    void set_link(bool up, const std::string& reason) {
        connected = up;
        notify_connection_change(up, reason);
    }
    void raise(const TunnelError& error) { notify_error(error); }

    std::vector<Envelope> sent_of_type(std::string_view type) const {
        std::vector<Envelope> out;
        for (const auto& e : sent) {
            if (e.type == type) out.push_back(e);
        }
        return out;
    }

    bool connected = true;
    bool fail_connect = false;
    bool fail_delivery = false;
    bool defer_delivery = false;
    int connect_calls = 0;
    int disconnect_calls = 0;
    std::string last_address;
    std::optional<std::string> last_auth_code;
    std::vector<Envelope> sent;
    std::vector<SendHandler> deferred;
};

// ============================================================================
// FakeSystemInfo
// ============================================================================
class FakeSystemInfo : public SystemInfoCollector {
public:
    SystemInfo collect() override {
        collect_calls++;
        return info;
    }

    SystemInfo info{
        .cpu_usage = 12.5,
        .memory_usage = 40.0,
        .gpu_usage = 0.0,
        .ip = "10.0.0.7",
        .os_info = "Linux 6.1",
        .cpu_cores = 8,
        .memory_total_mb = 16384,
        .gpu_model = "rtx-4090",
    };
    int collect_calls = 0;
};

// ============================================================================
// FakeInferenceExecutor
// ============================================================================
// Keeps every call so the test can drive the sink or the proxy handler.
class FakeInferenceExecutor : public InferenceExecutor {
public:
    struct Call {
        std::string kind;   // "chat" | "complete"
        json::object request;
        std::shared_ptr<StreamSink> sink;
        std::string path;
    };

    void chat(const json::object& request, std::shared_ptr<StreamSink> sink,
              const std::string& path) override {
        calls.push_back(Call{"chat", request, std::move(sink), path});
    }

    void complete(const json::object& request, std::shared_ptr<StreamSink> sink,
                  const std::string& path) override {
        calls.push_back(Call{"complete", request, std::move(sink), path});
    }

    void forward(const ProxyRequest& request, ProxyResponseHandler handler) override {
        forwarded.push_back(request);
        proxy_handlers.push_back(std::move(handler));
    }

    std::vector<Call> calls;
    std::vector<ProxyRequest> forwarded;
    std::vector<ProxyResponseHandler> proxy_handlers;
};

// ============================================================================
// Helpers
// ============================================================================

// Runs the io_context until pred() holds or the deadline passes
template<typename Pred>
bool run_until(boost::asio::io_context& ioc, Pred pred,
               std::chrono::milliseconds deadline = std::chrono::milliseconds(5000)) {
    auto until = std::chrono::steady_clock::now() + deadline;
    ioc.restart();
    while (!pred() && std::chrono::steady_clock::now() < until) {
        ioc.run_for(std::chrono::milliseconds(5));
        if (ioc.stopped()) {
            ioc.restart();
        }
    }
    return pred();
}

inline json::object chat_request_payload(const std::string& task_id) {
    return json::object{
        {"taskId", task_id},
        {"path", "/ollama/api/chat"},
        {"data", json::object{
            {"model", "llama3"},
            {"messages", json::array{json::object{{"role", "user"}, {"content", "hi"}}}},
        }},
    };
}

inline json::object completion_request_payload(const std::string& task_id) {
    return json::object{
        {"taskId", task_id},
        {"path", "/openai/v1/completions"},
        {"data", json::object{{"model", "llama3"}, {"prompt", "Once upon"}}},
    };
}

} // namespace sightlink::test
