#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>

#include "clewdr/claude/completion.hpp"
#include "clewdr/core/config.hpp"
#include "clewdr/core/error.hpp"
#include "clewdr/gateway/auth.hpp"

namespace clewdr::gateway {

using boost::asio::awaitable;
namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

using Request = http::request<http::string_body>;
using Reply = claude::CompletionResponse;

/// Body size cap for inbound requests (prompts with pasted images get big).
inline constexpr uint64_t kMaxBodyBytes = 64ull * 1024 * 1024;

/// JSON error body in the Anthropic error envelope.
auto error_reply(int status, std::string_view type, std::string_view message) -> Reply;

/// Maps a request-level error to its HTTP status.
auto status_for(const Error& error) -> int;

/// HTTP/1.1 front door.
///
/// Routes POST /v1/messages, POST /v1/chat/completions and GET /v1/models
/// to the completion service. Each accepted socket runs its own keep-alive
/// loop as a detached coroutine. Streaming replies are written as a chunked
/// body, one chunk per frame drained from the reply's channel; a failed
/// write abandons the channel so the upstream transfer is aborted.
class GatewayServer {
public:
    GatewayServer(net::io_context& ioc, const Config& config,
                  claude::CompletionService& service, ApiKeyAuth auth);

    GatewayServer(const GatewayServer&) = delete;
    GatewayServer& operator=(const GatewayServer&) = delete;

    /// Bind and listen. Port 0 picks an ephemeral port; the bound port is
    /// returned.
    auto listen(std::string_view address, uint16_t port) -> Result<uint16_t>;

    /// Accept until stop() is called.
    auto run() -> awaitable<void>;

    /// Close the acceptor. Open connections finish their current request.
    void stop();

    /// Dispatch one parsed request.
    auto route(const Request& req) -> awaitable<Reply>;

    [[nodiscard]] auto connection_count() const noexcept -> size_t { return active_; }
    [[nodiscard]] auto is_running() const noexcept -> bool { return running_; }

private:
    auto accept_loop() -> awaitable<void>;
    auto handle_connection(tcp::socket socket) -> awaitable<void>;

    /// Writes a complete reply. Returns false when the socket failed.
    auto write_reply(beast::tcp_stream& stream, const Request& req, Reply& reply)
        -> awaitable<bool>;

    /// Drains the frame channel into a chunked body. Returns false when the
    /// client went away.
    auto write_stream(beast::tcp_stream& stream, const Request& req, Reply& reply)
        -> awaitable<bool>;

    auto authorize(const Request& req) const -> VoidResult;

    net::io_context& ioc_;
    const Config& config_;
    claude::CompletionService& service_;
    ApiKeyAuth auth_;
    tcp::acceptor acceptor_;

    std::atomic<bool> running_{false};
    std::atomic<size_t> active_{0};
};

} // namespace clewdr::gateway
