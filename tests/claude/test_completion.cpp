#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <exception>
#include <mutex>
#include <string>
#include <thread>

#include <boost/asio.hpp>
#include <httplib.h>

#include "clewdr/claude/completion.hpp"
#include "clewdr/core/version.hpp"

using namespace clewdr;
using namespace clewdr::claude;
namespace net = boost::asio;

namespace {

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

auto wait_for_returns(pool::CookiePool& pool, uint64_t expected) -> net::awaitable<pool::PoolStatus> {
    for (int i = 0; i < 200; ++i) {
        auto status = co_await pool.status();
        if (status.returns >= expected) co_return status;
        co_await sleep_for(std::chrono::milliseconds(10));
    }
    co_return co_await pool.status();
}

auto completion_event(std::string_view text, const char* stop_reason = nullptr) -> std::string {
    json j = {
        {"type", "completion"},
        {"completion", text},
        {"stop_reason", stop_reason ? json(stop_reason) : json(nullptr)},
    };
    return "event: completion\ndata: " + j.dump() + "\n\n";
}

/// In-process stand-in for the Claude.ai web API.
struct FakeClaude {
    httplib::Server server;
    std::thread thread;
    int port = 0;

    std::atomic<int> organizations{0};
    std::atomic<int> creates{0};
    std::atomic<int> completions{0};
    std::atomic<int> deletes{0};
    std::atomic<int> completion_status{200};
    std::atomic<int> create_delay_ms{0};

    std::mutex mtx;
    std::string last_completion;

    FakeClaude() {
        server.Get("/api/organizations", [this](const httplib::Request&, httplib::Response& res) {
            ++organizations;
            res.set_content(R"([{"uuid":"org-1","capabilities":["chat"]}])", "application/json");
        });

        server.Post("/api/organizations/org-1/chat_conversations",
                    [this](const httplib::Request&, httplib::Response& res) {
            ++creates;
            if (create_delay_ms > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(create_delay_ms.load()));
            }
            res.status = 201;
            res.set_content("{}", "application/json");
        });

        server.Post(R"(/api/organizations/org-1/chat_conversations/([^/]+)/completion)",
                    [this](const httplib::Request& req, httplib::Response& res) {
            ++completions;
            {
                std::lock_guard lock(mtx);
                last_completion = req.body;
            }
            if (completion_status != 200) {
                res.status = completion_status;
                res.set_header("Retry-After", "60");
                res.set_content(R"({"type":"error","error":{"type":"rate_limit_error","message":"Rate limited"}})",
                                "application/json");
                return;
            }
            res.set_content(completion_event("Hello") +
                            completion_event(" world\n\nHuman: extra") +
                            completion_event("", "stop_sequence"),
                            "text/event-stream");
        });

        server.Delete(R"(/api/organizations/org-1/chat_conversations/([^/]+))",
                      [this](const httplib::Request&, httplib::Response& res) {
            ++deletes;
            res.status = 204;
        });

        port = server.bind_to_any_port("127.0.0.1");
        thread = std::thread([this] { server.listen_after_bind(); });
        server.wait_until_ready();
    }

    ~FakeClaude() {
        server.stop();
        if (thread.joinable()) thread.join();
    }

    [[nodiscard]] auto url() const -> std::string {
        return "http://127.0.0.1:" + std::to_string(port);
    }

    [[nodiscard]] auto total() const -> int {
        return organizations + creates + completions + deletes;
    }

    auto completion_body() -> json {
        std::lock_guard lock(mtx);
        return json::parse(last_completion);
    }
};

auto make_config(const std::string& url, std::initializer_list<const char*> cookies) -> Config {
    Config config;
    config.endpoint = url;
    config.upstream_timeout_seconds = 5;
    for (const auto* c : cookies) config.cookies.push_back(CookieConfig{c, std::nullopt});
    return config;
}

auto request(ClientFormat format, std::string text, bool stream = false) -> CompletionRequest {
    return CompletionRequest{
        .format = format,
        .model = "claude-3-5-sonnet-20241022",
        .messages = {Message{.role = Role::User, .content = std::move(text)}},
        .stream = stream,
        .max_tokens = 1024,
    };
}

auto drain(FrameChannel& channel) -> net::awaitable<std::string> {
    std::string body;
    for (;;) {
        auto [ec, frame] = co_await channel.async_receive(net::as_tuple(net::use_awaitable));
        if (ec) break;
        body += frame;
    }
    co_return body;
}

/// Everything a test needs around one service instance.
struct Harness {
    FakeClaude upstream;
    Config config;
    net::io_context ioc;
    pool::CookiePool pool;
    CompletionService service;

    explicit Harness(std::initializer_list<const char*> cookies = {"sk-test-1"})
        : config(make_config(upstream.url(), cookies))
        , pool(ioc, config.cookies)
        , service(ioc, config, pool) {
        pool.start();
    }
};

} // anonymous namespace

TEST_CASE("connection tests are answered locally", "[claude][completion]") {
    Harness h;

    run_until_done(h.ioc, [&]() -> net::awaitable<void> {
        auto messages = co_await h.service.handle(request(ClientFormat::Messages, "Hi"));
        auto m = json::parse(messages.body);
        CHECK(m["role"] == "assistant");
        CHECK(m["content"] == std::string(kTitle));

        auto chat = co_await h.service.handle(request(ClientFormat::Chat, "Hi"));
        CHECK(json::parse(chat.body)["choices"][0]["message"]["content"] == std::string(kTitle));

        auto outfit = co_await h.service.handle(request(
            ClientFormat::Chat, std::string(kOutfitPromptPrefix) + ": happy, sad"));
        CHECK(json::parse(outfit.body)["choices"][0]["message"]["content"] == "neutral");

        auto status = co_await h.pool.status();
        CHECK(status.returns == 0);
        CHECK(status.leased == 0);
    }());

    CHECK(h.upstream.total() == 0);
}

TEST_CASE("invalid requests never lease a cookie", "[claude][completion]") {
    Harness h;

    run_until_done(h.ioc, [&]() -> net::awaitable<void> {
        auto empty = request(ClientFormat::Messages, "x");
        empty.messages.clear();
        auto res = co_await h.service.handle(empty);
        CHECK(json::parse(res.body)["content"] == "Error: Request has no messages");

        auto bad_model = request(ClientFormat::Chat, "hello");
        bad_model.model = "gpt-4o";
        res = co_await h.service.handle(bad_model);
        CHECK(json::parse(res.body)["choices"][0]["message"]["content"] == "Error: Invalid model: gpt-4o");

        auto streaming = request(ClientFormat::Messages, "x", true);
        streaming.messages.clear();
        res = co_await h.service.handle(streaming);
        CHECK(res.status == 200);
        CHECK(res.content_type == "text/event-stream");
        CHECK_FALSE(res.is_stream());
        CHECK(res.body.starts_with("event: error\n"));

        auto status = co_await h.pool.status();
        CHECK(status.returns == 0);
        CHECK(status.valid == 1);
    }());

    CHECK(h.upstream.total() == 0);
}

TEST_CASE("an empty pool reports no valid cookie", "[claude][completion]") {
    Harness h({});

    run_until_done(h.ioc, [&]() -> net::awaitable<void> {
        auto res = co_await h.service.handle(request(ClientFormat::Messages, "hello"));
        CHECK(json::parse(res.body)["content"] == "Error: No valid cookie available");
    }());

    CHECK(h.upstream.total() == 0);
}

TEST_CASE("non-streaming completion", "[claude][completion]") {
    Harness h;

    run_until_done(h.ioc, [&]() -> net::awaitable<void> {
        auto first = co_await h.service.handle(request(ClientFormat::Messages, "Tell me something"));
        auto m = json::parse(first.body);
        CHECK(m["type"] == "message");
        CHECK(m["content"] == "Hello world");
        CHECK(m["stop_reason"] == "stop_sequence");

        auto status = co_await wait_for_returns(h.pool, 1);
        CHECK(status.returns == 1);
        CHECK(status.valid == 1);
        CHECK(status.leased == 0);

        auto second = co_await h.service.handle(request(ClientFormat::Chat, "And another"));
        auto c = json::parse(second.body);
        CHECK(c["object"] == "chat.completion");
        CHECK(c["choices"][0]["message"]["content"] == "Hello world");
        CHECK(c["choices"][0]["finish_reason"] == "stop");

        co_await wait_for_returns(h.pool, 2);
    }());

    // The organization is remembered on the cookie between leases.
    CHECK(h.upstream.organizations == 1);
    CHECK(h.upstream.creates == 2);
    CHECK(h.upstream.completions == 2);
    CHECK(h.upstream.deletes == 2);

    auto body = h.upstream.completion_body();
    CHECK(body["prompt"] == "Human: And another");
    CHECK(body["max_tokens_to_sample"] == 1024);
    CHECK(body["rendering_mode"] == "raw");
    // Free accounts let the web app pick the model.
    CHECK_FALSE(body.contains("model"));
}

TEST_CASE("concurrent requests each return their cookie once", "[claude][completion]") {
    Harness h({"sk-a", "sk-b", "sk-c"});
    constexpr size_t kRequests = 3;

    run_until_done(h.ioc, [&]() -> net::awaitable<void> {
        std::atomic<size_t> done{0};
        std::atomic<size_t> succeeded{0};
        for (size_t i = 0; i < kRequests; ++i) {
            net::co_spawn(h.ioc, [&]() -> net::awaitable<void> {
                auto res = co_await h.service.handle(request(ClientFormat::Messages, "hello"));
                if (res.body.find("Hello world") != std::string::npos) ++succeeded;
                ++done;
            }, net::detached);
        }

        for (int i = 0; i < 500 && done < kRequests; ++i) {
            co_await sleep_for(std::chrono::milliseconds(10));
        }
        CHECK(done == kRequests);
        CHECK(succeeded == kRequests);

        auto status = co_await wait_for_returns(h.pool, kRequests);
        CHECK(status.returns == kRequests);
        CHECK(status.valid == kRequests);
        CHECK(status.leased == 0);

        // Nothing else trickles back later.
        co_await sleep_for(std::chrono::milliseconds(50));
        auto later = co_await h.pool.status();
        CHECK(later.returns == kRequests);
    }());

    CHECK(h.upstream.deletes == static_cast<int>(kRequests));
}

TEST_CASE("slow upstream calls do not stall other requests", "[claude][completion]") {
    Harness h;
    h.upstream.create_delay_ms = 600;

    run_until_done(h.ioc, [&]() -> net::awaitable<void> {
        std::atomic<bool> slow_done{false};
        net::co_spawn(h.ioc, [&]() -> net::awaitable<void> {
            auto res = co_await h.service.handle(request(ClientFormat::Messages, "hello"));
            CHECK(res.body.find("Hello world") != std::string::npos);
            slow_done = true;
        }, net::detached);

        co_await sleep_for(std::chrono::milliseconds(50));
        auto started = std::chrono::steady_clock::now();
        auto hi = co_await h.service.handle(request(ClientFormat::Messages, "Hi"));
        auto waited = std::chrono::steady_clock::now() - started;

        CHECK(json::parse(hi.body)["content"] == std::string(kTitle));
        CHECK_FALSE(slow_done);
        CHECK(waited < std::chrono::milliseconds(300));

        for (int i = 0; i < 300 && !slow_done; ++i) {
            co_await sleep_for(std::chrono::milliseconds(10));
        }
        CHECK(slow_done);
        co_await wait_for_returns(h.pool, 1);
    }());

    CHECK(h.upstream.creates == 1);
}

TEST_CASE("rate limited completions cool the cookie down", "[claude][completion]") {
    Harness h;
    h.upstream.completion_status = 429;

    run_until_done(h.ioc, [&]() -> net::awaitable<void> {
        auto res = co_await h.service.handle(request(ClientFormat::Messages, "hello"));

        // Cleanup ran before the error was rendered.
        CHECK(h.upstream.deletes == 1);
        auto m = json::parse(res.body);
        CHECK(m["role"] == "assistant");
        CHECK(m["content"].get<std::string>().starts_with("Error: Too many requests"));

        auto status = co_await wait_for_returns(h.pool, 1);
        CHECK(status.returns == 1);
        CHECK(status.cooling == 1);
        CHECK(status.valid == 0);

        auto again = co_await h.service.handle(request(ClientFormat::Messages, "hello"));
        CHECK(json::parse(again.body)["content"] == "Error: No valid cookie available");
    }());

    CHECK(h.upstream.completions == 1);
}

TEST_CASE("streaming completion", "[claude][completion]") {
    Harness h;

    run_until_done(h.ioc, [&]() -> net::awaitable<void> {
        auto res = co_await h.service.handle(request(ClientFormat::Messages, "Stream it", true));
        REQUIRE(res.is_stream());
        CHECK(res.content_type == "text/event-stream");

        auto body = co_await drain(*res.stream);
        CHECK(body.starts_with("event: message_start\n"));
        CHECK(body.find(R"("text":"Hello")") != std::string::npos);
        CHECK(body.find(R"("text":" world")") != std::string::npos);
        CHECK(body.find("extra") == std::string::npos);
        CHECK(body.find(R"("stop_reason":"stop_sequence")") != std::string::npos);
        CHECK(body.ends_with("event: message_stop\ndata: {\"type\":\"message_stop\"}\n\n"));

        auto status = co_await wait_for_returns(h.pool, 1);
        CHECK(status.returns == 1);
        CHECK(status.valid == 1);
    }());

    CHECK(h.upstream.deletes == 1);
}

TEST_CASE("streaming failures end with an error event", "[claude][completion]") {
    Harness h;
    h.upstream.completion_status = 429;

    run_until_done(h.ioc, [&]() -> net::awaitable<void> {
        auto res = co_await h.service.handle(request(ClientFormat::Chat, "Stream it", true));
        REQUIRE(res.is_stream());

        auto body = co_await drain(*res.stream);
        CHECK(body.find(R"("type":"too_many_request")") != std::string::npos);
        CHECK(body.ends_with("data: [DONE]\n\n"));

        auto status = co_await wait_for_returns(h.pool, 1);
        CHECK(status.cooling == 1);
    }());

    CHECK(h.upstream.deletes == 1);
}

TEST_CASE("a client dropping the stream still cleans up once", "[claude][completion]") {
    Harness h;

    run_until_done(h.ioc, [&]() -> net::awaitable<void> {
        auto res = co_await h.service.handle(request(ClientFormat::Messages, "Stream it", true));
        REQUIRE(res.is_stream());
        abandon(*res.stream);

        auto status = co_await wait_for_returns(h.pool, 1);
        CHECK(status.returns == 1);
        CHECK(status.valid == 1);
        CHECK(status.leased == 0);

        co_await sleep_for(std::chrono::milliseconds(50));
        auto later = co_await h.pool.status();
        CHECK(later.returns == 1);
    }());

    CHECK(h.upstream.deletes == 1);
}

TEST_CASE("remember_turn tracks character and impersonation", "[claude][completion]") {
    pool::SessionMemory memory;
    Message reply{.role = Role::Assistant, .content = "Hi", .name = "Alice"};
    std::vector<Message> messages = {Message{.role = Role::User, .content = "Hello"}, reply};

    remember_turn(memory, messages, std::string("\n\nHuman:"));
    CHECK(memory.prev_impersonated);
    CHECK(memory.conv_char == "Alice");

    remember_turn(memory, messages, std::nullopt);
    CHECK_FALSE(memory.prev_impersonated);
}
