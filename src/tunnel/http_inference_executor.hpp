#pragma once

#include "common/http_client.hpp"
#include "tunnel/inference_executor.hpp"

#include <chrono>
#include <string>

namespace sightlink::tunnel {

// ============================================================================
// HTTP Inference Executor
// ============================================================================
// Talks to an Ollama-compatible runtime. "/ollama/..." and "/openai/..."
// request paths map to the runtime's native "/api/..." and "/v1/...".
class HttpInferenceExecutor : public InferenceExecutor {
public:
    struct Options {
        std::string base_url = "http://127.0.0.1:11434";
        std::chrono::milliseconds request_timeout{30000};
        // Gap allowed between two streamed body reads
        std::chrono::milliseconds stream_idle_timeout{300000};
    };

    HttpInferenceExecutor(net::io_context& ioc, Options options);

    void chat(const json::object& request,
              std::shared_ptr<StreamSink> sink,
              const std::string& path) override;

    void complete(const json::object& request,
                  std::shared_ptr<StreamSink> sink,
                  const std::string& path) override;

    void forward(const ProxyRequest& request, ProxyResponseHandler handler) override;

    // "/ollama/api/chat" -> "/api/chat"
    static std::string runtime_path(const std::string& path);

    // Relative URLs are joined to base_url; absolute ones must share its origin
    static Result<std::string> resolve_proxy_url(const std::string& base_url, const std::string& url);

    const Options& options() const { return options_; }

private:
    void run(const json::object& request, std::shared_ptr<StreamSink> sink, const std::string& path);

    net::io_context& ioc_;
    HttpClient client_;
    Options options_;
};

} // namespace sightlink::tunnel
