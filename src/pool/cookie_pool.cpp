#include "clewdr/pool/cookie_pool.hpp"

#include "clewdr/core/logger.hpp"
#include "clewdr/core/utils.hpp"

#include <algorithm>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace clewdr::pool {

auto normalize_cookie(std::string_view raw) -> std::string {
    auto value = utils::trim(raw);
    constexpr std::string_view kPrefix = "sessionKey=";
    if (value.starts_with(kPrefix)) {
        value.erase(0, kPrefix.size());
    }
    if (auto semi = value.find(';'); semi != std::string::npos) {
        value.erase(semi);
    }
    return utils::trim(value);
}

CookiePool::CookiePool(net::io_context& ioc, const std::vector<CookieConfig>& cookies)
    : ioc_(ioc)
    , strand_(net::make_strand(ioc))
    , acquire_ch_(std::make_shared<AcquireChannel>(ioc, kChannelCapacity))
    , return_ch_(std::make_shared<ReturnChannel>(ioc, kChannelCapacity))
{
    for (const auto& c : cookies) {
        auto value = normalize_cookie(c.cookie);
        if (value.empty()) continue;
        bool duplicate = std::ranges::any_of(valid_, [&](const CookieState& s) {
            return s.cookie == value;
        });
        if (duplicate) {
            LOG_WARN("Cookie pool: skipping duplicate cookie {}", utils::mask_secret(value));
            continue;
        }
        CookieState state;
        state.cookie = std::move(value);
        state.org_uuid = c.org_uuid.value_or("");
        valid_.push_back(std::move(state));
    }
    LOG_INFO("Cookie pool initialized with {} cookies", valid_.size());
}

void CookiePool::start() {
    net::co_spawn(strand_, acquire_loop(), net::detached);
    net::co_spawn(strand_, return_loop(), net::detached);
}

auto CookiePool::acquire() -> awaitable<Result<CookieState>> {
    auto reply = std::make_shared<Reply>(ioc_, 1);

    auto [send_ec] = co_await acquire_ch_->async_send(
        boost::system::error_code{}, reply, net::as_tuple(net::use_awaitable));
    if (send_ec) {
        co_return make_fail(make_error(ErrorCode::NoValidKey,
                                       "Cookie pool is shutting down"));
    }

    auto [recv_ec, result] = co_await reply->async_receive(
        net::as_tuple(net::use_awaitable));
    if (recv_ec) {
        co_return make_fail(make_error(ErrorCode::NoValidKey,
                                       "Cookie pool dropped the acquire request",
                                       recv_ec.message()));
    }
    co_return std::move(result);
}

auto CookiePool::return_channel() const -> std::shared_ptr<ReturnChannel> {
    return return_ch_;
}

auto CookiePool::status() -> awaitable<PoolStatus> {
    co_await net::post(strand_, net::use_awaitable);
    co_return PoolStatus{
        .valid = valid_.size(),
        .leased = leased_,
        .cooling = cooling_.size(),
        .invalid = invalid_.size(),
        .returns = returns_,
    };
}

void CookiePool::shutdown() {
    net::post(strand_, [this] {
        if (stopping_) return;
        stopping_ = true;
        acquire_ch_->close();
        LOG_INFO("Cookie pool shutting down, {} leases outstanding", leased_);
        if (leased_ == 0) {
            return_ch_->close();
        }
    });
}

auto CookiePool::acquire_loop() -> awaitable<void> {
    for (;;) {
        auto [ec, reply] = co_await acquire_ch_->async_receive(
            net::as_tuple(net::use_awaitable));
        if (ec) break;
        if (reply) serve(*reply);
    }
    LOG_DEBUG("Cookie pool acquire loop stopped");
}

auto CookiePool::return_loop() -> awaitable<void> {
    for (;;) {
        auto [ec, ret] = co_await return_ch_->async_receive(
            net::as_tuple(net::use_awaitable));
        if (ec) break;
        handle_return(std::move(ret));
        if (stopping_ && leased_ == 0) {
            return_ch_->close();
            break;
        }
    }
    LOG_DEBUG("Cookie pool return loop stopped");
}

void CookiePool::serve(Reply& reply) {
    promote_cooled();

    if (valid_.empty()) {
        LOG_WARN("Cookie pool: no valid cookie (leased={}, cooling={}, invalid={})",
                 leased_, cooling_.size(), invalid_.size());
        reply.try_send(boost::system::error_code{},
                       Result<CookieState>(std::unexpected(make_error(
                           ErrorCode::NoValidKey, "No valid cookie available"))));
        return;
    }

    auto state = std::move(valid_.front());
    valid_.pop_front();
    ++leased_;
    LOG_DEBUG("Cookie pool: leased {}", utils::mask_secret(state.cookie));
    reply.try_send(boost::system::error_code{}, Result<CookieState>(std::move(state)));
}

void CookiePool::handle_return(CookieReturn ret) {
    if (leased_ > 0) --leased_;
    ++returns_;

    auto masked = utils::mask_secret(ret.cookie.cookie);
    if (!ret.reason) {
        LOG_DEBUG("Cookie pool: {} returned healthy", masked);
        valid_.push_back(std::move(ret.cookie));
        return;
    }

    if (ret.reason->is_cooldown()) {
        auto wait = ret.reason->retry_after > 0 ? ret.reason->retry_after
                                                : kDefaultCooldownSeconds;
        ret.cookie.reset_at = utils::timestamp_s() + wait;
        LOG_INFO("Cookie pool: {} cooling down for {}s ({})",
                 masked, wait, to_string(*ret.reason));
        cooling_.push_back(std::move(ret.cookie));
        return;
    }

    LOG_WARN("Cookie pool: evicting {} ({})", masked, to_string(*ret.reason));
    invalid_.emplace_back(std::move(ret.cookie), *ret.reason);
}

void CookiePool::promote_cooled() {
    auto now = utils::timestamp_s();
    auto it = std::partition(cooling_.begin(), cooling_.end(),
                             [now](const CookieState& c) { return c.reset_at > now; });
    for (auto ready = it; ready != cooling_.end(); ++ready) {
        ready->reset_at = 0;
        LOG_INFO("Cookie pool: {} back from cooldown", utils::mask_secret(ready->cookie));
        valid_.push_back(std::move(*ready));
    }
    cooling_.erase(it, cooling_.end());
}

} // namespace clewdr::pool
