#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <exception>

#include <boost/asio.hpp>

#include "clewdr/pool/cookie_pool.hpp"

using namespace clewdr;
using namespace clewdr::pool;
namespace net = boost::asio;

namespace {

// Runs a coroutine to completion and stops the io_context, so the pool's
// loops do not keep run() alive. Assertion failures inside the coroutine
// are rethrown here.
void run_until_done(net::io_context& ioc, net::awaitable<void> coro) {
    std::exception_ptr failure;
    net::co_spawn(ioc, std::move(coro), [&](std::exception_ptr e) {
        failure = e;
        ioc.stop();
    });
    ioc.run();
    if (failure) std::rethrow_exception(failure);
}

auto sleep_for(std::chrono::milliseconds d) -> net::awaitable<void> {
    net::steady_timer timer(co_await net::this_coro::executor, d);
    co_await timer.async_wait(net::use_awaitable);
}

auto give_back(CookiePool& pool, CookieState cookie, std::optional<Reason> reason)
    -> net::awaitable<void> {
    co_await pool.return_channel()->async_send(
        boost::system::error_code{}, CookieReturn{std::move(cookie), reason},
        net::use_awaitable);
}

/// Polls the pool until `returns` reaches the expected count.
auto wait_for_returns(CookiePool& pool, uint64_t expected) -> net::awaitable<PoolStatus> {
    for (int i = 0; i < 100; ++i) {
        auto status = co_await pool.status();
        if (status.returns >= expected) co_return status;
        co_await sleep_for(std::chrono::milliseconds(5));
    }
    co_return co_await pool.status();
}

auto cookies(std::initializer_list<const char*> values) -> std::vector<CookieConfig> {
    std::vector<CookieConfig> out;
    for (const auto* v : values) out.push_back(CookieConfig{v, std::nullopt});
    return out;
}

} // anonymous namespace

TEST_CASE("normalize_cookie", "[pool]") {
    CHECK(normalize_cookie("sk-ant-sid01-abc") == "sk-ant-sid01-abc");
    CHECK(normalize_cookie("  sessionKey=sk-ant-sid01-abc; Path=/; HttpOnly ") == "sk-ant-sid01-abc");
    CHECK(normalize_cookie("sessionKey=") == "");

    CookieState state{.cookie = "sk-1"};
    CHECK(state.header() == "sessionKey=sk-1");
}

TEST_CASE("CookiePool deduplicates configured cookies", "[pool]") {
    net::io_context ioc;
    CookiePool pool(ioc, cookies({"sessionKey=sk-a", "sk-a", " sk-b ", ""}));
    pool.start();

    run_until_done(ioc, [&]() -> net::awaitable<void> {
        auto status = co_await pool.status();
        CHECK(status.valid == 2);
        CHECK(status.leased == 0);
    }());
}

TEST_CASE("CookiePool leases are exclusive and rotate", "[pool]") {
    net::io_context ioc;
    CookiePool pool(ioc, cookies({"sk-a", "sk-b"}));
    pool.start();

    run_until_done(ioc, [&]() -> net::awaitable<void> {
        auto first = co_await pool.acquire();
        auto second = co_await pool.acquire();
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        CHECK(first->cookie == "sk-a");
        CHECK(second->cookie == "sk-b");

        // Both are out: the third request finds nothing.
        auto third = co_await pool.acquire();
        REQUIRE_FALSE(third.has_value());
        CHECK(third.error().code() == ErrorCode::NoValidKey);

        co_await give_back(pool, std::move(*first), std::nullopt);
        auto status = co_await wait_for_returns(pool, 1);
        CHECK(status.valid == 1);
        CHECK(status.leased == 1);

        auto again = co_await pool.acquire();
        REQUIRE(again.has_value());
        CHECK(again->cookie == "sk-a");
    }());
}

TEST_CASE("CookiePool keeps session memory across leases", "[pool]") {
    net::io_context ioc;
    CookiePool pool(ioc, cookies({"sk-a"}));
    pool.start();

    run_until_done(ioc, [&]() -> net::awaitable<void> {
        auto lease = co_await pool.acquire();
        REQUIRE(lease.has_value());
        lease->org_uuid = "org-1";
        lease->is_pro = true;
        lease->memory.conv_char = "Alice";

        co_await give_back(pool, std::move(*lease), std::nullopt);
        co_await wait_for_returns(pool, 1);

        auto again = co_await pool.acquire();
        REQUIRE(again.has_value());
        CHECK(again->org_uuid == "org-1");
        CHECK(again->is_pro == true);
        CHECK(again->memory.conv_char == "Alice");
    }());
}

TEST_CASE("CookiePool cools down exhausted cookies", "[pool]") {
    net::io_context ioc;
    CookiePool pool(ioc, cookies({"sk-a"}));
    pool.start();

    run_until_done(ioc, [&]() -> net::awaitable<void> {
        auto lease = co_await pool.acquire();
        REQUIRE(lease.has_value());

        co_await give_back(pool, std::move(*lease), Reason::exhausted(1));
        auto status = co_await wait_for_returns(pool, 1);
        CHECK(status.cooling == 1);
        CHECK(status.valid == 0);

        auto blocked = co_await pool.acquire();
        CHECK_FALSE(blocked.has_value());

        co_await sleep_for(std::chrono::milliseconds(2100));

        auto back = co_await pool.acquire();
        REQUIRE(back.has_value());
        CHECK(back->cookie == "sk-a");
        CHECK(back->reset_at == 0);
    }());
}

TEST_CASE("CookiePool applies the default cooldown without a reset time", "[pool]") {
    net::io_context ioc;
    CookiePool pool(ioc, cookies({"sk-a"}));
    pool.start();

    run_until_done(ioc, [&]() -> net::awaitable<void> {
        auto lease = co_await pool.acquire();
        REQUIRE(lease.has_value());

        co_await give_back(pool, std::move(*lease), Reason::restricted(0));
        auto status = co_await wait_for_returns(pool, 1);
        CHECK(status.cooling == 1);

        auto blocked = co_await pool.acquire();
        CHECK_FALSE(blocked.has_value());
    }());
}

TEST_CASE("CookiePool evicts terminally invalid cookies", "[pool]") {
    for (auto reason : {Reason::banned(), Reason::disabled(), Reason::non_pro(), Reason::null()}) {
        net::io_context ioc;
        CookiePool pool(ioc, cookies({"sk-a", "sk-b"}));
        pool.start();

        run_until_done(ioc, [&]() -> net::awaitable<void> {
            auto lease = co_await pool.acquire();
            REQUIRE(lease.has_value());
            CHECK(lease->cookie == "sk-a");

            co_await give_back(pool, std::move(*lease), reason);
            auto status = co_await wait_for_returns(pool, 1);
            CHECK(status.invalid == 1);
            CHECK(status.valid == 1);

            // Only sk-b is left, and it stays in rotation.
            auto next = co_await pool.acquire();
            REQUIRE(next.has_value());
            CHECK(next->cookie == "sk-b");
            co_await give_back(pool, std::move(*next), std::nullopt);
            co_await wait_for_returns(pool, 2);

            auto again = co_await pool.acquire();
            REQUIRE(again.has_value());
            CHECK(again->cookie == "sk-b");
        }());
    }
}

TEST_CASE("CookiePool with no cookies", "[pool]") {
    net::io_context ioc;
    CookiePool pool(ioc, {});
    pool.start();

    run_until_done(ioc, [&]() -> net::awaitable<void> {
        auto lease = co_await pool.acquire();
        REQUIRE_FALSE(lease.has_value());
        CHECK(lease.error().code() == ErrorCode::NoValidKey);
    }());
}

TEST_CASE("CookiePool shutdown waits for outstanding leases", "[pool]") {
    net::io_context ioc;
    CookiePool pool(ioc, cookies({"sk-a", "sk-b"}));
    pool.start();

    run_until_done(ioc, [&]() -> net::awaitable<void> {
        auto lease = co_await pool.acquire();
        REQUIRE(lease.has_value());

        pool.shutdown();
        co_await pool.status();

        auto refused = co_await pool.acquire();
        REQUIRE_FALSE(refused.has_value());
        CHECK(refused.error().code() == ErrorCode::NoValidKey);
        CHECK(pool.return_channel()->is_open());

        co_await give_back(pool, std::move(*lease), std::nullopt);
        auto status = co_await wait_for_returns(pool, 1);
        CHECK(status.leased == 0);
        CHECK_FALSE(pool.return_channel()->is_open());
    }());
}
