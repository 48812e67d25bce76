#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

#include "clewdr/core/config.hpp"
#include "clewdr/core/error.hpp"
#include "clewdr/core/types.hpp"

namespace clewdr::pool {

namespace net = boost::asio;
using boost::asio::awaitable;

/// Per-cookie conversation memory. It travels with the lease so the next
/// request on the same cookie can compare against what it saw last.
struct SessionMemory {
    std::vector<Message> prev_messages;
    bool prev_impersonated = false;
    std::optional<std::string> conv_char;
};

/// A leased cookie. Exclusively owned by one request until returned.
struct CookieState {
    std::string cookie;          // sessionKey value, without the "sessionKey=" prefix
    std::string org_uuid;        // empty until bootstrap resolves it
    std::optional<bool> is_pro;
    SessionMemory memory;
    int64_t reset_at = 0;        // unix seconds; cooling down until then

    /// Value for the upstream Cookie header.
    [[nodiscard]] auto header() const -> std::string { return "sessionKey=" + cookie; }
};

/// Strips an optional "sessionKey=" prefix, surrounding whitespace and any
/// trailing attributes ("; Path=/").
auto normalize_cookie(std::string_view raw) -> std::string;

/// What a finished request hands back to the pool.
struct CookieReturn {
    CookieState cookie;
    std::optional<Reason> reason;
};

using ReturnChannel = net::experimental::concurrent_channel<
    void(boost::system::error_code, CookieReturn)>;

struct PoolStatus {
    size_t valid = 0;
    size_t leased = 0;
    size_t cooling = 0;
    size_t invalid = 0;
    uint64_t returns = 0;
};

/// Cookie pool actor.
///
/// Requests talk to the pool only through two channels: acquire (a request
/// carrying a private reply channel) and return. All pool state is confined
/// to the pool's strand. Leases are exclusive; returned cookies rotate to
/// the back of the queue, cooled-down cookies come back once their reset
/// time has passed, and cookies returned with a terminal reason are evicted.
class CookiePool {
public:
    static constexpr size_t kChannelCapacity = 64;

    /// Cooldown applied when an exhaustion signal carries no reset time.
    static constexpr int64_t kDefaultCooldownSeconds = 3600;

    CookiePool(net::io_context& ioc, const std::vector<CookieConfig>& cookies);

    CookiePool(const CookiePool&) = delete;
    CookiePool& operator=(const CookiePool&) = delete;

    /// Spawn the acquire and return loops on the pool strand.
    void start();

    /// Lease a cookie. Fails with NoValidKey when none is available or the
    /// pool is shutting down.
    auto acquire() -> awaitable<Result<CookieState>>;

    /// Channel every request sends its single CookieReturn on.
    [[nodiscard]] auto return_channel() const -> std::shared_ptr<ReturnChannel>;

    /// Snapshot of the pool counters, taken on the pool strand.
    auto status() -> awaitable<PoolStatus>;

    /// Stop handing out leases. The return loop exits once every leased
    /// cookie has come back.
    void shutdown();

private:
    using Reply = net::experimental::concurrent_channel<
        void(boost::system::error_code, Result<CookieState>)>;
    using AcquireChannel = net::experimental::concurrent_channel<
        void(boost::system::error_code, std::shared_ptr<Reply>)>;

    auto acquire_loop() -> awaitable<void>;
    auto return_loop() -> awaitable<void>;

    void serve(Reply& reply);
    void handle_return(CookieReturn ret);
    void promote_cooled();

    net::io_context& ioc_;
    net::strand<net::io_context::executor_type> strand_;
    std::shared_ptr<AcquireChannel> acquire_ch_;
    std::shared_ptr<ReturnChannel> return_ch_;

    std::deque<CookieState> valid_;
    std::vector<CookieState> cooling_;
    std::vector<std::pair<CookieState, Reason>> invalid_;
    size_t leased_ = 0;
    uint64_t returns_ = 0;
    bool stopping_ = false;
};

} // namespace clewdr::pool
