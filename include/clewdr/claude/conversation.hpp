#pragma once

#include <map>
#include <string>
#include <string_view>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include "clewdr/claude/session.hpp"
#include "clewdr/claude/transform.hpp"
#include "clewdr/core/config.hpp"
#include "clewdr/core/error.hpp"
#include "clewdr/infra/http_client.hpp"

namespace clewdr::claude {

using boost::asio::awaitable;

/// Drives the Claude.ai web API for one session at a time: organization
/// lookup, conversation create / completion / delete. Every call carries the
/// session cookie and browser headers, and refreshes the session cookie from
/// the response before looking at the status.
class ConversationClient {
public:
    static constexpr std::string_view kUserAgent =
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
        "(KHTML, like Gecko) Chrome/124.0.0.0 Safari/537.36";

    ConversationClient(boost::asio::io_context& ioc, const Config& config);

    /// Resolve the organization and pro status when the lease lacks them.
    auto bootstrap(Session& session) -> awaitable<VoidResult>;

    /// Delete any live conversation, then create a new one.
    /// `thinking_model` non-empty switches on extended thinking.
    auto create(Session& session, std::string_view thinking_model = {})
        -> awaitable<VoidResult>;

    /// Send a turn and buffer the whole event stream.
    auto complete(Session& session, const RequestBody& body) -> awaitable<Result<std::string>>;

    /// Send a turn, handing event-stream bytes to `on_chunk` as they arrive.
    /// Returning false from the callback aborts the transfer.
    auto complete_stream(Session& session, const RequestBody& body,
                         infra::HttpChunkCallback on_chunk) -> awaitable<VoidResult>;

    /// Delete the live conversation, if any. Never fails; errors are logged.
    auto delete_conversation(Session& session) -> awaitable<void>;

    [[nodiscard]] auto endpoint() const -> const std::string& { return endpoint_; }

private:
    [[nodiscard]] auto headers(const Session& session) const -> std::map<std::string, std::string>;
    [[nodiscard]] auto conversations_path(const Session& session) const -> std::string;

    /// Adopt a rotated sessionKey from set-cookie headers.
    static void refresh_cookie(Session& session, const infra::HttpResponse& response);

    std::string endpoint_;
    infra::HttpClient http_;
};

} // namespace clewdr::claude
