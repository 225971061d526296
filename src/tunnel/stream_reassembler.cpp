#include "tunnel/stream_reassembler.hpp"
#include "common/log.hpp"

#include <algorithm>

namespace sightlink::tunnel {

namespace {

const log::Logger& logger() {
    static const log::Logger instance(log::STREAM_LOGGER);
    return instance;
}

constexpr std::string_view DONE_SENTINEL = "[DONE]";

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
        s.remove_suffix(1);
    }
    return s;
}

int64_t unix_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Where the text of an event lives, in lookup order
enum class ContentSlot { NONE, MESSAGE, DELTA, TEXT, RESPONSE };

ContentSlot find_content_slot(const json::object& event) {
    if (auto* message = event.if_contains("message"); message && message->is_object()) {
        if (auto* c = message->as_object().if_contains("content"); c && c->is_string()) {
            return ContentSlot::MESSAGE;
        }
    }
    if (auto* choices = event.if_contains("choices");
        choices && choices->is_array() && !choices->as_array().empty() &&
        choices->as_array()[0].is_object()) {
        const auto& first = choices->as_array()[0].as_object();
        if (auto* delta = first.if_contains("delta"); delta && delta->is_object()) {
            if (auto* c = delta->as_object().if_contains("content"); c && c->is_string()) {
                return ContentSlot::DELTA;
            }
        }
        if (auto* t = first.if_contains("text"); t && t->is_string()) {
            return ContentSlot::TEXT;
        }
    }
    if (auto* r = event.if_contains("response"); r && r->is_string()) {
        return ContentSlot::RESPONSE;
    }
    return ContentSlot::NONE;
}

void replace_content(json::object& event, const std::string& text) {
    switch (find_content_slot(event)) {
        case ContentSlot::MESSAGE:
            event["message"].as_object()["content"] = text;
            break;
        case ContentSlot::DELTA:
            event["choices"].as_array()[0].as_object()["delta"].as_object()["content"] = text;
            break;
        case ContentSlot::TEXT:
            event["choices"].as_array()[0].as_object()["text"] = text;
            break;
        case ContentSlot::RESPONSE:
            event["response"] = text;
            break;
        case ContentSlot::NONE:
            break;
    }
}

// ============================================================================
// Sink bound to one key
// ============================================================================

class ReassemblySink : public StreamSink {
public:
    ReassemblySink(std::weak_ptr<StreamReassembler> engine, StreamKey key)
        : engine_(std::move(engine))
        , key_(std::move(key))
    {}

    void write(std::string_view text) override {
        if (auto engine = live()) {
            engine->feed(key_, text);
        }
    }

    void write(std::span<const std::uint8_t> bytes) override {
        write(std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
    }

    void write(const json::value& chunk) override {
        if (auto engine = live()) {
            engine->forward(key_, chunk);
        }
    }

    void end() override {
        if (auto engine = live()) {
            engine->finish(key_);
        }
        finished_ = true;
    }

    void respond(const json::value& full_response) override {
        if (auto engine = live()) {
            engine->respond(key_, full_response);
        }
        finished_ = true;
    }

    void fail(const TunnelError& error) override {
        if (auto engine = live()) {
            engine->fail(key_, error);
        }
        finished_ = true;
    }

    bool finished() const override {
        if (finished_) {
            return true;
        }
        auto engine = engine_.lock();
        return !engine || !engine->has_stream(key_);
    }

private:
    std::shared_ptr<StreamReassembler> live() {
        if (finished_) {
            return nullptr;
        }
        auto engine = engine_.lock();
        if (!engine || !engine->has_stream(key_)) {
            finished_ = true;
            return nullptr;
        }
        return engine;
    }

    std::weak_ptr<StreamReassembler> engine_;
    StreamKey key_;
    bool finished_ = false;
};

} // anonymous namespace

// ============================================================================
// StreamReassembler
// ============================================================================

std::shared_ptr<StreamReassembler> StreamReassembler::create(BatchingOptions options, Clock clock) {
    return std::shared_ptr<StreamReassembler>(new StreamReassembler(options, std::move(clock)));
}

StreamReassembler::StreamReassembler(BatchingOptions options, Clock clock)
    : options_(options)
    , clock_(std::move(clock))
{
}

std::shared_ptr<StreamSink> StreamReassembler::open(const std::string& task_id,
                                                    const std::string& target,
                                                    StreamKind kind,
                                                    StreamOutputCallback output) {
    StreamKey key{task_id, target};
    if (streams_.contains(key)) {
        logger().warn("StreamReassembler: Stream {} -> {} reopened, discarding buffers",
                      task_id, target);
        streams_.erase(key);
    }

    Stream stream;
    stream.generation = next_generation_++;
    stream.kind = kind;
    stream.output = std::move(output);
    stream.last_send = now();
    streams_.emplace(key, std::move(stream));

    logger().debug("StreamReassembler: Opened {} -> {} ({} active)", task_id, target, streams_.size());
    return std::make_shared<ReassemblySink>(weak_from_this(), std::move(key));
}

void StreamReassembler::feed(const StreamKey& key, std::string_view text) {
    auto it = streams_.find(key);
    if (it == streams_.end()) {
        return;
    }

    Stream* stream = &it->second;
    const uint64_t generation = stream->generation;
    stream->line_buffer.append(text);

    size_t pos;
    while ((pos = stream->line_buffer.find('\n')) != std::string::npos) {
        std::string line = stream->line_buffer.substr(0, pos);
        stream->line_buffer.erase(0, pos + 1);

        auto result = process_line(key, *stream, line);
        stream = find_stream(key, generation);
        if (!stream) {
            return;
        }
        if (result == LineResult::COMPLETED) {
            complete(key);
            return;
        }
    }
}

StreamReassembler::LineResult StreamReassembler::process_line(const StreamKey& key,
                                                              Stream& stream,
                                                              std::string_view line) {
    line = trim(line);
    if (line.empty() || line.front() == ':') {
        return LineResult::CONTINUE;
    }

    std::string_view payload;
    if (line.starts_with("data:")) {
        payload = trim(line.substr(5));
        if (payload == DONE_SENTINEL) {
            return LineResult::COMPLETED;
        }
    } else if (line.front() == '{') {
        // NDJSON (Ollama native)
        payload = line;
    } else {
        return LineResult::CONTINUE;
    }

    boost::system::error_code ec;
    auto parsed = json::parse(payload, ec);
    if (ec || !parsed.is_object()) {
        auto error = TunnelError::stream_parse(
            std::string(payload.substr(0, std::min<size_t>(payload.size(), 80))));
        logger().warn("StreamReassembler: Skipping line of {} -> {}: {}", key.task_id, key.target,
                      error.to_string());
        return LineResult::CONTINUE;
    }

    const auto& event = parsed.as_object();
    handle_event(key, stream, event);

    if (auto* done = event.if_contains("done"); done && done->is_bool() && done->as_bool()) {
        return LineResult::COMPLETED;
    }
    return LineResult::CONTINUE;
}

void StreamReassembler::handle_event(const StreamKey& key, Stream& stream, const json::object& event) {
    auto content = extract_content(event);
    if (!content || content->empty()) {
        return;
    }

    stream.full_content += *content;
    // Everything not yet sent or already pending
    stream.pending += stream.full_content.substr(stream.total_sent + stream.pending.size());
    stream.message_count++;
    stream.last_event = event;

    if (should_flush(stream, now())) {
        flush(key, stream, false);
    }
}

bool StreamReassembler::should_flush(const Stream& stream, TimePoint now) const {
    if (stream.pending.empty()) {
        return false;
    }
    if (stream.pending.size() >= options_.min_content_length) {
        return true;
    }
    if (now - stream.last_send >= options_.max_buffer_time) {
        return true;
    }
    return stream.message_count >= options_.max_message_count;
}

void StreamReassembler::flush(const StreamKey& key, Stream& stream, bool final) {
    if (stream.pending.empty()) {
        return;
    }

    json::object chunk = stream.last_event;
    replace_content(chunk, stream.pending);

    json::object incremental;
    incremental["messageCount"] = stream.message_count;
    incremental["incrementalLength"] = stream.pending.size();
    incremental["totalSent"] = stream.total_sent + stream.pending.size();
    if (final) {
        incremental["isFinal"] = true;
    }
    chunk["_incremental"] = std::move(incremental);

    stream.total_sent += stream.pending.size();
    stream.pending.clear();
    stream.message_count = 0;
    stream.last_send = now();

    emit(key, stream, StreamOutput{StreamOutput::Kind::CHUNK, std::move(chunk), {}});
}

void StreamReassembler::forward(const StreamKey& key, const json::value& chunk) {
    auto it = streams_.find(key);
    if (it == streams_.end()) {
        return;
    }
    const uint64_t generation = it->second.generation;

    // Keep ordering with any text still pending
    flush(key, it->second, false);
    if (auto* stream = find_stream(key, generation)) {
        emit(key, *stream, StreamOutput{StreamOutput::Kind::CHUNK, chunk, {}});
    }
}

void StreamReassembler::finish(const StreamKey& key) {
    auto it = streams_.find(key);
    if (it == streams_.end()) {
        return;
    }
    auto& stream = it->second;
    if (!trim(stream.line_buffer).empty()) {
        // Unterminated last line
        const uint64_t generation = stream.generation;
        std::string rest = std::move(stream.line_buffer);
        stream.line_buffer.clear();
        process_line(key, stream, rest);
        if (!find_stream(key, generation)) {
            return;
        }
    }
    complete(key);
}

void StreamReassembler::complete(const StreamKey& key) {
    auto it = streams_.find(key);
    if (it == streams_.end()) {
        return;
    }

    // Destroyed before emitting so a re-entrant open() starts clean
    Stream stream = std::move(it->second);
    streams_.erase(it);

    flush(key, stream, true);

    logger().debug("StreamReassembler: Completed {} -> {} ({} chars)", key.task_id, key.target,
                   stream.total_sent);
    emit(key, stream, StreamOutput{StreamOutput::Kind::COMPLETE,
                                   completion_event(stream.kind, key.task_id), {}});
}

void StreamReassembler::respond(const StreamKey& key, const json::value& full_response) {
    auto it = streams_.find(key);
    if (it == streams_.end()) {
        return;
    }
    Stream stream = std::move(it->second);
    streams_.erase(it);
    emit(key, stream, StreamOutput{StreamOutput::Kind::RESULT, full_response, {}});
}

void StreamReassembler::fail(const StreamKey& key, const TunnelError& error) {
    auto it = streams_.find(key);
    if (it == streams_.end()) {
        return;
    }
    Stream stream = std::move(it->second);
    streams_.erase(it);

    logger().warn("StreamReassembler: Stream {} -> {} failed: {}", key.task_id, key.target,
                  error.to_string());
    emit(key, stream, StreamOutput{StreamOutput::Kind::ERROR,
                                   error_event(stream.kind, key.task_id, error.message),
                                   error.message});
}

void StreamReassembler::clear() {
    if (!streams_.empty()) {
        logger().info("StreamReassembler: Dropping {} active streams", streams_.size());
    }
    streams_.clear();
}

StreamReassembler::Stream* StreamReassembler::find_stream(const StreamKey& key, uint64_t generation) {
    auto it = streams_.find(key);
    if (it == streams_.end() || it->second.generation != generation) {
        return nullptr;
    }
    return &it->second;
}

void StreamReassembler::emit(const StreamKey& key, const Stream& stream, StreamOutput output) const {
    if (!stream.output) {
        return;
    }
    // The callback may erase the stream that owns it
    auto callback = stream.output;
    try {
        callback(key, output);
    } catch (const std::exception& e) {
        logger().error("StreamReassembler: Output for {} -> {} threw: {}", key.task_id, key.target,
                       e.what());
    }
}

// ============================================================================
// Event shapes
// ============================================================================

std::optional<std::string> StreamReassembler::extract_content(const json::object& event) {
    switch (find_content_slot(event)) {
        case ContentSlot::MESSAGE:
            return std::string(event.at("message").as_object().at("content").as_string());
        case ContentSlot::DELTA:
            return std::string(event.at("choices").as_array().at(0).as_object()
                                   .at("delta").as_object().at("content").as_string());
        case ContentSlot::TEXT:
            return std::string(event.at("choices").as_array().at(0).as_object().at("text").as_string());
        case ContentSlot::RESPONSE:
            return std::string(event.at("response").as_string());
        case ContentSlot::NONE:
            break;
    }
    return std::nullopt;
}

json::object StreamReassembler::completion_event(StreamKind kind, const std::string& task_id) {
    json::object event;
    event["created"] = unix_seconds();
    event["model"] = "unknown";

    if (kind == StreamKind::CHAT) {
        event["id"] = "chatcmpl-" + task_id;
        event["object"] = "chat.completion.chunk";
        event["choices"] = json::array{json::object{
            {"index", 0},
            {"delta", json::object{}},
            {"finish_reason", "stop"},
        }};
    } else {
        event["id"] = "cmpl-" + task_id;
        event["object"] = "text_completion";
        event["choices"] = json::array{json::object{
            {"index", 0},
            {"text", ""},
            {"finish_reason", "stop"},
        }};
    }
    event["done"] = true;
    return event;
}

json::object StreamReassembler::error_event(StreamKind kind, const std::string& task_id,
                                            const std::string& error) {
    json::object event;
    event["created"] = unix_seconds();
    event["model"] = "unknown";

    if (kind == StreamKind::CHAT) {
        event["id"] = "chatcmpl-error-" + task_id;
        event["object"] = "chat.completion.chunk";
        event["choices"] = json::array{json::object{
            {"index", 0},
            {"delta", json::object{{"role", "assistant"}, {"content", "error: " + error}}},
            {"finish_reason", "stop"},
        }};
    } else {
        event["id"] = "cmpl-error-" + task_id;
        event["object"] = "text_completion";
        event["choices"] = json::array{json::object{
            {"index", 0},
            {"text", "error: " + error},
            {"finish_reason", "stop"},
        }};
    }
    event["error"] = error;
    event["done"] = true;
    return event;
}

} // namespace sightlink::tunnel
