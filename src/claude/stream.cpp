#include "clewdr/claude/stream.hpp"
#include "clewdr/core/logger.hpp"
#include "clewdr/core/utils.hpp"

#include <algorithm>
#include <chrono>
#include <future>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>

namespace clewdr::claude {

namespace net = boost::asio;

namespace {

auto dump(const json& j) -> std::string {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

auto finish_reason_for_chat(std::string_view stop_reason) -> std::string_view {
    return stop_reason == "max_tokens" ? "length" : "stop";
}

auto lowercase_code(ErrorCode code) -> std::string {
    return utils::to_lower(error_code_to_string(code));
}

} // anonymous namespace

auto sse_event(std::string_view event, const json& data) -> std::string {
    std::string out = "event: ";
    out += event;
    out += "\ndata: ";
    out += dump(data);
    out += "\n\n";
    return out;
}

auto sse_data(const json& data) -> std::string {
    return "data: " + dump(data) + "\n\n";
}

auto error_frame(ClientFormat format, const Error& error) -> std::string {
    if (format == ClientFormat::Chat) {
        json j = {{"error", {
            {"message", error.what()},
            {"type", lowercase_code(error.code())},
            {"code", error.status() != 0 ? json(error.status()) : json(nullptr)},
        }}};
        return sse_data(j) + "data: [DONE]\n\n";
    }
    return sse_event("error", {
        {"type", "error"},
        {"error", {{"type", lowercase_code(error.code())}, {"message", error.what()}}},
    });
}

// -- StreamTransformer --------------------------------------------------------

StreamTransformer::StreamTransformer(StreamOptions options)
    : opts_(std::move(options))
    , id_((opts_.format == ClientFormat::Chat ? "chatcmpl-" : "msg_") + utils::generate_id(24)) {}

auto StreamTransformer::feed(std::string_view chunk) -> Frames {
    Frames out;
    for (char c : chunk) {
        if (c != '\r') buffer_.push_back(c);
    }

    size_t boundary;
    while ((boundary = buffer_.find("\n\n")) != std::string::npos) {
        std::string block = buffer_.substr(0, boundary);
        buffer_.erase(0, boundary + 2);

        Event ev;
        size_t pos = 0;
        while (pos <= block.size()) {
            auto eol = block.find('\n', pos);
            if (eol == std::string::npos) eol = block.size();
            std::string_view line(block.data() + pos, eol - pos);
            pos = eol + 1;

            if (line.starts_with("event:")) {
                ev.name = utils::trim(line.substr(6));
            } else if (line.starts_with("data:")) {
                auto payload = line.substr(5);
                if (payload.starts_with(' ')) payload.remove_prefix(1);
                if (!ev.data.empty()) ev.data += '\n';
                ev.data += payload;
            }
        }
        handle(ev, out);
    }
    return out;
}

auto StreamTransformer::finish() -> Frames {
    Frames out;
    if (!buffer_.empty()) {
        auto rest = std::move(buffer_);
        buffer_.clear();
        auto tail = feed(rest + "\n\n");
        out.insert(out.end(), tail.begin(), tail.end());
    }
    if (!closed_) {
        flush_text(out);
        close(stop_reason_.empty() ? "end_turn" : stop_reason_, out);
    }
    return out;
}

void StreamTransformer::handle(const Event& ev, Frames& out) {
    if (closed_ || (ev.data.empty() && ev.name.empty())) return;

    auto j = json::parse(ev.data, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        if (ev.data != "[DONE]") {
            LOG_DEBUG("Skipping unparseable upstream event '{}'", ev.name);
        }
        return;
    }

    auto type = j.value("type", ev.name);
    bool messages = opts_.format == ClientFormat::Messages;

    if (type == "completion") {
        if (j.contains("completion") && j["completion"].is_string()) {
            on_text(j["completion"].get<std::string>(), out);
        }
        if (!closed_ && j.contains("stop_reason") && j["stop_reason"].is_string()) {
            auto reason = j["stop_reason"].get<std::string>();
            flush_text(out);
            close(reason == "max_tokens" ? "max_tokens" : "end_turn", out);
        }
    } else if (type == "message_start") {
        upstream_shaped_ = true;
        opened_ = true;
        if (messages) pass_through(ev, type, out);
    } else if (type == "content_block_start") {
        block_open_ = true;
        block_index_ = j.value("index", 0);
        if (messages) pass_through(ev, type, out);
    } else if (type == "content_block_delta") {
        const auto& delta = j.contains("delta") ? j["delta"] : json::object();
        if (delta.value("type", "") == "text_delta") {
            on_text(delta.value("text", ""), out);
        } else if (messages) {
            pass_through(ev, type, out);
        }
    } else if (type == "content_block_stop") {
        flush_text(out);
        if (messages) pass_through(ev, type, out);
        block_open_ = false;
    } else if (type == "message_delta") {
        flush_text(out);
        if (j.contains("delta") && j["delta"].contains("stop_reason") &&
            j["delta"]["stop_reason"].is_string()) {
            stop_reason_ = j["delta"]["stop_reason"].get<std::string>();
        }
        if (messages) pass_through(ev, type, out);
    } else if (type == "message_stop") {
        flush_text(out);
        if (messages) {
            pass_through(ev, type, out);
            if (stop_reason_.empty()) stop_reason_ = "end_turn";
            closed_ = true;
        } else {
            close(stop_reason_.empty() ? "end_turn" : stop_reason_, out);
        }
    } else if (type == "error") {
        std::string etype = "upstream_error";
        std::string message = dump(j);
        if (j.contains("error") && j["error"].is_object()) {
            const auto& err = j["error"];
            if (err.contains("message") && err["message"].is_string()) {
                message = err["message"].get<std::string>();
            }
            if (err.contains("type") && err["type"].is_string()) {
                etype = err["type"].get<std::string>();
            }
        }
        upstream_error_ = message;
        if (messages) {
            pass_through(ev, type, out);
        } else {
            out.push_back(sse_data({{"error", {{"message", message}, {"type", etype}}}}));
            out.emplace_back("data: [DONE]\n\n");
        }
        stop_reason_ = "error";
        closed_ = true;
    } else if (messages) {
        pass_through(ev, type, out);
    }
}

void StreamTransformer::pass_through(const Event& ev, std::string_view type, Frames& out) {
    std::string frame = "event: ";
    frame += ev.name.empty() ? type : std::string_view(ev.name);
    frame += "\ndata: ";
    frame += ev.data;
    frame += "\n\n";
    out.push_back(std::move(frame));
}

void StreamTransformer::on_text(std::string_view text, Frames& out) {
    if (closed_ || text.empty()) return;
    text_ += text;

    size_t best = std::string::npos;
    const std::string* hit = nullptr;
    for (const auto& stop : opts_.stop_sequences) {
        if (stop.empty()) continue;
        auto p = text_.find(stop, emitted_);
        if (p < best) {
            best = p;
            hit = &stop;
        }
    }

    if (hit) {
        emit_text(std::string_view(text_).substr(emitted_, best - emitted_), out);
        emitted_ = best;
        text_.resize(best);
        stop_sequence_ = *hit;
        close("stop_sequence", out);
        return;
    }

    auto safe = text_.size() - holdback();
    if (safe > emitted_) {
        emit_text(std::string_view(text_).substr(emitted_, safe - emitted_), out);
        emitted_ = safe;
    }
}

auto StreamTransformer::holdback() const -> size_t {
    size_t hold = 0;
    size_t avail = text_.size() - emitted_;
    std::string_view tail(text_);
    for (const auto& stop : opts_.stop_sequences) {
        if (stop.size() < 2) continue;
        for (size_t k = std::min(stop.size() - 1, avail); k > hold; --k) {
            if (tail.ends_with(std::string_view(stop).substr(0, k))) {
                hold = k;
                break;
            }
        }
    }
    return hold;
}

void StreamTransformer::flush_text(Frames& out) {
    if (emitted_ < text_.size()) {
        emit_text(std::string_view(text_).substr(emitted_), out);
        emitted_ = text_.size();
    }
}

void StreamTransformer::open_message(Frames& out) {
    out.push_back(sse_event("message_start", {
        {"type", "message_start"},
        {"message", {
            {"id", id_},
            {"type", "message"},
            {"role", "assistant"},
            {"model", opts_.model},
            {"content", json::array()},
            {"stop_reason", nullptr},
            {"stop_sequence", nullptr},
            {"usage", {{"input_tokens", 0}, {"output_tokens", 0}}},
        }},
    }));
    out.push_back(sse_event("content_block_start", {
        {"type", "content_block_start"},
        {"index", 0},
        {"content_block", {{"type", "text"}, {"text", ""}}},
    }));
    opened_ = true;
    block_open_ = true;
    block_index_ = 0;
}

void StreamTransformer::emit_text(std::string_view piece, Frames& out) {
    if (piece.empty()) return;

    if (opts_.format == ClientFormat::Chat) {
        json delta = {{"content", piece}};
        if (!opened_) {
            delta["role"] = "assistant";
            opened_ = true;
        }
        out.push_back(sse_data({
            {"id", id_},
            {"object", "chat.completion.chunk"},
            {"created", utils::timestamp_s()},
            {"model", opts_.model},
            {"choices", json::array({{
                {"index", 0},
                {"delta", delta},
                {"finish_reason", nullptr},
            }})},
        }));
        return;
    }

    if (!upstream_shaped_ && !opts_.messages_api) {
        out.push_back(sse_event("completion", {
            {"type", "completion"},
            {"completion", piece},
            {"stop_reason", nullptr},
            {"model", opts_.model},
        }));
        return;
    }

    if (!upstream_shaped_ && !opened_) {
        open_message(out);
    }
    out.push_back(sse_event("content_block_delta", {
        {"type", "content_block_delta"},
        {"index", block_index_},
        {"delta", {{"type", "text_delta"}, {"text", piece}}},
    }));
}

void StreamTransformer::close(std::string reason, Frames& out) {
    if (closed_) return;
    closed_ = true;
    stop_reason_ = std::move(reason);

    if (opts_.format == ClientFormat::Chat) {
        out.push_back(sse_data({
            {"id", id_},
            {"object", "chat.completion.chunk"},
            {"created", utils::timestamp_s()},
            {"model", opts_.model},
            {"choices", json::array({{
                {"index", 0},
                {"delta", json::object()},
                {"finish_reason", finish_reason_for_chat(stop_reason_)},
            }})},
        }));
        out.emplace_back("data: [DONE]\n\n");
        return;
    }

    if (!upstream_shaped_ && !opts_.messages_api) {
        out.push_back(sse_event("completion", {
            {"type", "completion"},
            {"completion", ""},
            {"stop_reason", stop_reason_},
            {"model", opts_.model},
        }));
        return;
    }

    if (!upstream_shaped_ && !opened_) {
        open_message(out);
    }
    if (block_open_) {
        out.push_back(sse_event("content_block_stop", {
            {"type", "content_block_stop"},
            {"index", block_index_},
        }));
        block_open_ = false;
    }
    out.push_back(sse_event("message_delta", {
        {"type", "message_delta"},
        {"delta", {
            {"stop_reason", stop_reason_},
            {"stop_sequence", stop_sequence_ ? json(*stop_sequence_) : json(nullptr)},
        }},
        {"usage", {{"output_tokens", 0}}},
    }));
    out.push_back(sse_event("message_stop", {{"type", "message_stop"}}));
}

auto aggregate_completion(std::string_view body, const std::vector<std::string>& stop_sequences)
    -> AggregatedCompletion {
    StreamTransformer t(StreamOptions{
        .format = ClientFormat::Chat,
        .messages_api = true,
        .model = {},
        .stop_sequences = stop_sequences,
    });
    t.feed(body);
    t.finish();

    return AggregatedCompletion{
        .text = t.output(),
        .stop_reason = t.stop_reason(),
        .stop_sequence = t.stop_sequence(),
        .error = t.upstream_error(),
    };
}

// -- StreamForwarder ----------------------------------------------------------

auto to_string(ForwardState s) -> std::string_view {
    switch (s) {
        case ForwardState::Idle: return "idle";
        case ForwardState::Streaming: return "streaming";
        case ForwardState::Completed: return "completed";
        case ForwardState::Cancelled: return "cancelled";
        case ForwardState::Failed: return "failed";
    }
    return "unknown";
}

void abandon(FrameChannel& channel) {
    channel.cancel();
    channel.close();
}

StreamForwarder::StreamForwarder(net::io_context& ioc, StreamOptions options)
    : ioc_(ioc)
    , channel_(std::make_shared<FrameChannel>(ioc, kChannelCapacity))
    , format_(options.format)
    , transformer_(std::move(options)) {}

auto StreamForwarder::on_chunk(const char* data, size_t length) -> bool {
    auto expected = ForwardState::Idle;
    state_.compare_exchange_strong(expected, ForwardState::Streaming);
    if (state_.load() == ForwardState::Cancelled) return false;

    for (auto& frame : transformer_.feed(std::string_view(data, length))) {
        if (!push_blocking(std::move(frame))) {
            state_ = ForwardState::Cancelled;
            LOG_INFO("Client went away, aborting upstream stream");
            return false;
        }
    }
    return true;
}

auto StreamForwarder::push_blocking(std::string frame) -> bool {
    if (!channel_->is_open()) return false;
    if (channel_->try_send(boost::system::error_code{}, frame)) return true;

    // Channel full: park the send on the io_context thread and wait for it.
    auto sent = net::co_spawn(ioc_,
        [channel = channel_, frame = std::move(frame)]() mutable -> net::awaitable<bool> {
            if (!channel->is_open()) co_return false;
            auto [ec] = co_await channel->async_send(boost::system::error_code{},
                                                     std::move(frame),
                                                     net::as_tuple(net::use_awaitable));
            if (ec) {
                LOG_DEBUG("Stream push failed: {}", ec.message());
            }
            co_return !ec;
        },
        net::use_future);

    while (sent.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
        if (ioc_.stopped()) {
            LOG_DEBUG("io_context stopped while a stream push was pending");
            return false;
        }
    }
    try {
        return sent.get();
    } catch (const std::exception& e) {
        LOG_DEBUG("Stream push failed: {}", e.what());
        return false;
    }
}

auto StreamForwarder::push(std::string frame) -> net::awaitable<bool> {
    if (!channel_->is_open()) co_return false;
    auto [ec] = co_await channel_->async_send(boost::system::error_code{}, std::move(frame),
                                              net::as_tuple(net::use_awaitable));
    co_return !ec;
}

auto StreamForwarder::push_end() -> net::awaitable<void> {
    if (!channel_->is_open()) co_return;
    auto [ec] = co_await channel_->async_send(boost::system::error_code(net::error::eof),
                                              std::string{},
                                              net::as_tuple(net::use_awaitable));
    if (ec) {
        LOG_DEBUG("End-of-stream marker not delivered: {}", ec.message());
    }
}

auto StreamForwarder::complete() -> net::awaitable<void> {
    if (state_.load() == ForwardState::Cancelled) co_return;

    for (auto& frame : transformer_.finish()) {
        if (!co_await push(std::move(frame))) {
            state_ = ForwardState::Cancelled;
            co_return;
        }
    }
    state_ = ForwardState::Completed;
    co_await push_end();
}

auto StreamForwarder::fail(Error error) -> net::awaitable<void> {
    if (state_.load() == ForwardState::Cancelled) co_return;

    state_ = ForwardState::Failed;
    LOG_WARN("Stream failed: {}", error.what());
    if (co_await push(error_frame(format_, error))) {
        co_await push_end();
    }
}

} // namespace clewdr::claude
