#pragma once

#include "tunnel/errors.hpp"

#include <boost/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace sightlink::tunnel {

namespace json = boost::json;

// ============================================================================
// Stream Sink
// ============================================================================
// What an inference executor writes into while a request is in flight.
// Streaming calls write()/end(); single-shot calls respond().
class StreamSink {
public:
    virtual ~StreamSink() = default;

    // Raw SSE / NDJSON text, any split
    virtual void write(std::string_view text) = 0;
    // Raw bytes, decoded as UTF-8 text
    virtual void write(std::span<const std::uint8_t> bytes) = 0;
    // Already-structured chunk, forwarded as-is
    virtual void write(const json::value& chunk) = 0;

    virtual void end() = 0;
    virtual void respond(const json::value& full_response) = 0;
    virtual void fail(const TunnelError& error) = 0;

    virtual bool finished() const = 0;
};

// ============================================================================
// Stream Reassembler
// ============================================================================

enum class StreamKind : uint8_t {
    CHAT = 0,
    COMPLETION,
};

struct BatchingOptions {
    size_t min_content_length = 5;
    std::chrono::milliseconds max_buffer_time{200};
    uint32_t max_message_count = 3;
};

struct StreamKey {
    std::string task_id;
    std::string target;

    auto operator<=>(const StreamKey&) const = default;
};

struct StreamOutput {
    enum class Kind : uint8_t {
        CHUNK,      // one batched delta or a forwarded object chunk
        COMPLETE,   // synthetic completion event, last output of a stream
        RESULT,     // single-shot response
        ERROR,      // error chunk, last output of a stream
    };

    Kind kind = Kind::CHUNK;
    json::value data;
    std::string error;
};

using StreamOutputCallback = std::function<void(const StreamKey&, const StreamOutput&)>;

// Per-(taskId, target) line buffers and incremental batching. Buffers of
// different keys never share state; a key's buffers are destroyed by its
// completion sentinel, end(), respond(), fail() or clear().
class StreamReassembler : public std::enable_shared_from_this<StreamReassembler> {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Clock = std::function<TimePoint()>;

    static std::shared_ptr<StreamReassembler> create(BatchingOptions options = {}, Clock clock = {});

    // Opening a key that is still active discards its buffers first
    std::shared_ptr<StreamSink> open(const std::string& task_id,
                                     const std::string& target,
                                     StreamKind kind,
                                     StreamOutputCallback output);

    // Operations by key; no-ops for unknown keys
    void feed(const StreamKey& key, std::string_view text);
    void forward(const StreamKey& key, const json::value& chunk);
    void finish(const StreamKey& key);
    void respond(const StreamKey& key, const json::value& full_response);
    void fail(const StreamKey& key, const TunnelError& error);

    bool has_stream(const StreamKey& key) const { return streams_.contains(key); }
    size_t active_streams() const { return streams_.size(); }

    // Teardown: drops every buffer without emitting anything
    void clear();

    const BatchingOptions& options() const { return options_; }

    // Content field of an Ollama / OpenAI event, nullopt when it has none
    static std::optional<std::string> extract_content(const json::object& event);
    static json::object completion_event(StreamKind kind, const std::string& task_id);
    static json::object error_event(StreamKind kind, const std::string& task_id, const std::string& error);

private:
    StreamReassembler(BatchingOptions options, Clock clock);

    struct Stream {
        // Distinguishes a reopened key from the stream it replaced
        uint64_t generation = 0;
        StreamKind kind = StreamKind::CHAT;
        StreamOutputCallback output;

        // (a) carry-over of an incomplete trailing line
        std::string line_buffer;

        // (b) incremental batching
        std::string full_content;
        std::string pending;
        TimePoint last_send;
        uint32_t message_count = 0;
        size_t total_sent = 0;
        json::object last_event;
    };

    enum class LineResult { CONTINUE, COMPLETED };

    LineResult process_line(const StreamKey& key, Stream& stream, std::string_view line);
    void handle_event(const StreamKey& key, Stream& stream, const json::object& event);
    bool should_flush(const Stream& stream, TimePoint now) const;
    void flush(const StreamKey& key, Stream& stream, bool final);
    void complete(const StreamKey& key);
    void emit(const StreamKey& key, const Stream& stream, StreamOutput output) const;
    // Output callbacks may close or reopen a key; nullptr unless the same stream is still open
    Stream* find_stream(const StreamKey& key, uint64_t generation);

    TimePoint now() const { return clock_ ? clock_() : std::chrono::steady_clock::now(); }

    BatchingOptions options_;
    Clock clock_;
    std::map<StreamKey, Stream> streams_;
    uint64_t next_generation_ = 1;
};

} // namespace sightlink::tunnel
