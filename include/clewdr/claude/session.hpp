#pragma once

#include <memory>
#include <optional>
#include <string>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include "clewdr/core/types.hpp"
#include "clewdr/pool/cookie_pool.hpp"

namespace clewdr::claude {

class ConversationClient;

/// Per-request context. Owned by exactly one request.
struct Session {
    pool::CookieState cookie;
    std::optional<std::string> conv_uuid;
    int conv_depth = 0;
    std::optional<std::string> model;  // explicit upstream model, pro accounts only
    std::shared_ptr<pool::ReturnChannel> returns;

    [[nodiscard]] auto org_uuid() const -> const std::string& { return cookie.org_uuid; }
    [[nodiscard]] auto is_pro() const -> bool { return cookie.is_pro.value_or(false); }
    [[nodiscard]] auto memory() -> pool::SessionMemory& { return cookie.memory; }
};

/// Scoped cleanup obligation for one request.
///
/// Owns the session. Discharging deletes the upstream conversation and sends
/// the cookie back to the pool, exactly once. finish() discharges inline;
/// defer() or the destructor spawn the same cleanup on the executor and
/// return immediately.
class CleanupGuard {
public:
    CleanupGuard(boost::asio::any_io_executor executor,
                 std::unique_ptr<Session> session,
                 std::shared_ptr<ConversationClient> client);
    ~CleanupGuard();

    CleanupGuard(CleanupGuard&& other) noexcept;
    CleanupGuard& operator=(CleanupGuard&&) = delete;
    CleanupGuard(const CleanupGuard&) = delete;
    CleanupGuard& operator=(const CleanupGuard&) = delete;

    [[nodiscard]] auto session() -> Session& { return *session_; }

    /// Delete the conversation and return the cookie before resuming.
    auto finish(std::optional<Reason> reason) -> boost::asio::awaitable<void>;

    /// Fire-and-forget discharge.
    void defer(std::optional<Reason> reason = std::nullopt);

    [[nodiscard]] auto discharged() const noexcept -> bool { return discharged_; }

private:
    static auto cleanup(std::unique_ptr<Session> session,
                        std::shared_ptr<ConversationClient> client,
                        std::optional<Reason> reason) -> boost::asio::awaitable<void>;

    boost::asio::any_io_executor executor_;
    std::unique_ptr<Session> session_;
    std::shared_ptr<ConversationClient> client_;
    bool discharged_ = false;
};

} // namespace clewdr::claude
