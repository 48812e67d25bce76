#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include "clewdr/claude/conversation.hpp"
#include "clewdr/claude/session.hpp"
#include "clewdr/claude/stream.hpp"
#include "clewdr/claude/transform.hpp"
#include "clewdr/core/config.hpp"
#include "clewdr/core/error.hpp"
#include "clewdr/pool/cookie_pool.hpp"

namespace clewdr::claude {

/// Prefix of the expression-classifier prompt some clients send through
/// the chat endpoint; answered locally.
inline constexpr std::string_view kOutfitPromptPrefix =
    "From the list below, choose a word that best represents a character's "
    "outfit description, action, or emotion in their dialogue";

inline constexpr std::string_view kEmptyPromptReply = "Empty message?";

struct Thinking {
    uint64_t budget_tokens = 0;
    std::string type;
};

/// One inbound completion, normalised from either endpoint.
struct CompletionRequest {
    ClientFormat format = ClientFormat::Messages;
    std::string model;
    std::vector<Message> messages;
    std::string system;
    bool stream = false;
    std::optional<double> temperature;
    std::optional<double> top_p;
    std::optional<int64_t> top_k;
    uint64_t max_tokens = 0;
    std::vector<std::string> stop;
    std::optional<Thinking> thinking;
    std::vector<ImageSource> images;
};

/// What the gateway writes back: a complete body, or a frame channel to
/// drain as a chunked event stream.
struct CompletionResponse {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;
    std::shared_ptr<FrameChannel> stream;

    [[nodiscard]] auto is_stream() const noexcept -> bool { return stream != nullptr; }
};

/// Per-request orchestration for both inbound endpoints.
///
/// Lease a cookie, bootstrap it, decide, open a fresh conversation, send the
/// transformed prompt and answer the client. Every path past the lease ends
/// in the request's CleanupGuard: error paths discharge it inline before
/// answering, the non-streaming success path defers it, and the streaming
/// path hands it to the detached forwarder task.
class CompletionService {
public:
    CompletionService(boost::asio::io_context& ioc, const Config& config, pool::CookiePool& pool);

    auto handle(CompletionRequest request) -> boost::asio::awaitable<CompletionResponse>;

    /// Answered without a cookie or upstream traffic, if at all.
    [[nodiscard]] auto short_circuit(const CompletionRequest& request) const
        -> std::optional<CompletionResponse>;

    /// Shape checks done before any lease.
    [[nodiscard]] auto validate(const CompletionRequest& request) const -> VoidResult;

    [[nodiscard]] auto models() const -> const std::vector<std::string>& { return config_.models; }

private:
    using Started = std::chrono::steady_clock::time_point;

    auto prepare(CleanupGuard& guard, const CompletionRequest& request)
        -> boost::asio::awaitable<Result<std::optional<TransformedRequest>>>;

    static auto forward(CleanupGuard guard,
                        std::shared_ptr<ConversationClient> client,
                        std::shared_ptr<StreamForwarder> forwarder,
                        RequestBody body,
                        std::vector<Message> messages,
                        Started started) -> boost::asio::awaitable<void>;

    boost::asio::io_context& ioc_;
    const Config& config_;
    pool::CookiePool& pool_;
    std::shared_ptr<ConversationClient> client_;
};

/// Records what the finished turn tells the next request on this cookie.
void remember_turn(pool::SessionMemory& memory,
                   const std::vector<Message>& messages,
                   const std::optional<std::string>& stop_sequence);

/// Non-streaming assistant reply in the client's format.
auto render_text(ClientFormat format, std::string_view model, std::string_view text,
                 std::string_view stop_reason) -> CompletionResponse;

/// Error reply: an assistant message for plain requests, a final error
/// event for streaming ones.
auto render_error(const CompletionRequest& request, const Error& error) -> CompletionResponse;

} // namespace clewdr::claude
