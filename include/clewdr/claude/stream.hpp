#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>

#include "clewdr/core/error.hpp"
#include "clewdr/core/types.hpp"

namespace clewdr::claude {

/// Which inbound API the client spoke.
enum class ClientFormat {
    Messages,  // Anthropic /v1/messages
    Chat,      // OpenAI /v1/chat/completions
};

struct StreamOptions {
    ClientFormat format = ClientFormat::Messages;
    bool messages_api = true;
    std::string model;
    std::vector<std::string> stop_sequences;
};

/// Incremental re-framer from the Claude.ai event stream to client frames.
///
/// Upstream bytes may split lines and events anywhere. Messages-shaped
/// upstream events are passed through for Messages clients; legacy
/// `completion` events are re-framed as Messages events when messages_api
/// is set and kept as completion frames otherwise. Chat clients get
/// chat.completion.chunk frames and a final `data: [DONE]`.
///
/// Text is held back while it could still turn into a stop sequence; once a
/// stop sequence appears the text before it is emitted, the stream is closed
/// with stop_reason "stop_sequence" and later upstream events are ignored.
class StreamTransformer {
public:
    using Frames = std::vector<std::string>;

    explicit StreamTransformer(StreamOptions options);

    /// Feed raw upstream bytes. Returns frames ready to send.
    auto feed(std::string_view chunk) -> Frames;

    /// Upstream is exhausted: flush held text and close the stream if the
    /// upstream did not.
    auto finish() -> Frames;

    [[nodiscard]] auto closed() const noexcept -> bool { return closed_; }

    /// Text emitted to the client so far.
    [[nodiscard]] auto output() const -> std::string { return text_.substr(0, emitted_); }

    [[nodiscard]] auto stop_reason() const -> const std::string& { return stop_reason_; }
    [[nodiscard]] auto stop_sequence() const -> const std::optional<std::string>& { return stop_sequence_; }
    [[nodiscard]] auto upstream_error() const -> const std::optional<std::string>& { return upstream_error_; }

private:
    struct Event {
        std::string name;
        std::string data;
    };

    void handle(const Event& ev, Frames& out);
    void on_text(std::string_view text, Frames& out);
    void flush_text(Frames& out);
    void emit_text(std::string_view piece, Frames& out);
    void open_message(Frames& out);
    void close(std::string reason, Frames& out);
    void pass_through(const Event& ev, std::string_view type, Frames& out);
    [[nodiscard]] auto holdback() const -> size_t;

    StreamOptions opts_;
    std::string id_;
    std::string buffer_;
    std::string text_;
    size_t emitted_ = 0;

    bool upstream_shaped_ = false;
    bool opened_ = false;
    bool block_open_ = false;
    int block_index_ = 0;
    bool closed_ = false;

    std::string stop_reason_;
    std::optional<std::string> stop_sequence_;
    std::optional<std::string> upstream_error_;
};

/// SSE frame helpers.
auto sse_event(std::string_view event, const json& data) -> std::string;
auto sse_data(const json& data) -> std::string;

/// Final error event for a stream in the client's format.
auto error_frame(ClientFormat format, const Error& error) -> std::string;

/// Result of reading a whole upstream event stream at once.
struct AggregatedCompletion {
    std::string text;
    std::string stop_reason;
    std::optional<std::string> stop_sequence;
    std::optional<std::string> error;
};

/// Non-streaming path: the same parsing and stop enforcement over a full body.
auto aggregate_completion(std::string_view body, const std::vector<std::string>& stop_sequences)
    -> AggregatedCompletion;

using FrameChannel = boost::asio::experimental::concurrent_channel<
    void(boost::system::error_code, std::string)>;

/// Used by the writer once the client is gone. Wakes any producer parked on
/// a full channel with channel_cancelled, then refuses further frames. Must
/// run on the io_context thread.
void abandon(FrameChannel& channel);

enum class ForwardState {
    Idle,
    Streaming,
    Completed,
    Cancelled,
    Failed,
};

auto to_string(ForwardState s) -> std::string_view;

/// Bridges the upstream transfer to the HTTP response writer.
///
/// The upstream side pushes frames through on_chunk() (from the transfer
/// thread) and complete() / fail() (from the request coroutine). The writer
/// drains channel() until it receives an error code of net::error::eof, and
/// abandons the channel when the client goes away. A push that is refused
/// or cancelled moves the forwarder to Cancelled and makes on_chunk() return
/// false, which aborts the upstream transfer.
///
/// Sends that have to wait for room are issued from the io_context thread,
/// so abandon() always sees every parked sender.
class StreamForwarder {
public:
    static constexpr size_t kChannelCapacity = 32;

    StreamForwarder(boost::asio::io_context& ioc, StreamOptions options);

    [[nodiscard]] auto channel() const -> std::shared_ptr<FrameChannel> { return channel_; }
    [[nodiscard]] auto state() const noexcept -> ForwardState { return state_.load(); }
    [[nodiscard]] auto transformer() const -> const StreamTransformer& { return transformer_; }

    /// Chunk callback for the upstream transfer. False stops the transfer.
    auto on_chunk(const char* data, size_t length) -> bool;

    /// Upstream exhausted.
    auto complete() -> boost::asio::awaitable<void>;

    /// Upstream failed: push a final error event.
    auto fail(Error error) -> boost::asio::awaitable<void>;

private:
    auto push_blocking(std::string frame) -> bool;
    auto push(std::string frame) -> boost::asio::awaitable<bool>;
    auto push_end() -> boost::asio::awaitable<void>;

    boost::asio::io_context& ioc_;
    std::shared_ptr<FrameChannel> channel_;
    ClientFormat format_;
    StreamTransformer transformer_;
    std::atomic<ForwardState> state_{ForwardState::Idle};
};

} // namespace clewdr::claude
