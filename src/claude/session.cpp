#include "clewdr/claude/session.hpp"
#include "clewdr/claude/conversation.hpp"
#include "clewdr/core/logger.hpp"
#include "clewdr/core/utils.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace clewdr::claude {

namespace net = boost::asio;

namespace {

auto return_cookie(Session& session, std::optional<Reason> reason) -> net::awaitable<void> {
    if (!session.returns) {
        LOG_WARN("Session has no return channel, cookie {} dropped",
                 utils::mask_secret(session.cookie.cookie));
        co_return;
    }
    auto [ec] = co_await session.returns->async_send(
        boost::system::error_code{},
        pool::CookieReturn{std::move(session.cookie), reason},
        net::as_tuple(net::use_awaitable));
    if (ec) {
        LOG_WARN("Failed to return cookie to pool: {}", ec.message());
    }
}

} // anonymous namespace

CleanupGuard::CleanupGuard(net::any_io_executor executor,
                           std::unique_ptr<Session> session,
                           std::shared_ptr<ConversationClient> client)
    : executor_(std::move(executor))
    , session_(std::move(session))
    , client_(std::move(client)) {}

CleanupGuard::CleanupGuard(CleanupGuard&& other) noexcept
    : executor_(std::move(other.executor_))
    , session_(std::move(other.session_))
    , client_(std::move(other.client_))
    , discharged_(other.discharged_) {
    other.discharged_ = true;
}

CleanupGuard::~CleanupGuard() {
    if (!discharged_ && session_) {
        defer(std::nullopt);
    }
}

auto CleanupGuard::finish(std::optional<Reason> reason) -> net::awaitable<void> {
    if (discharged_ || !session_) co_return;
    discharged_ = true;

    if (client_) {
        co_await client_->delete_conversation(*session_);
    }
    co_await return_cookie(*session_, reason);
}

void CleanupGuard::defer(std::optional<Reason> reason) {
    if (discharged_ || !session_) return;
    discharged_ = true;
    net::co_spawn(executor_, cleanup(std::move(session_), client_, reason), net::detached);
}

auto CleanupGuard::cleanup(std::unique_ptr<Session> session,
                           std::shared_ptr<ConversationClient> client,
                           std::optional<Reason> reason) -> net::awaitable<void> {
    if (client) {
        co_await client->delete_conversation(*session);
    }
    co_await return_cookie(*session, reason);
}

} // namespace clewdr::claude
