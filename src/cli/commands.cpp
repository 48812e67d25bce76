#include "clewdr/cli/commands.hpp"
#include "clewdr/claude/completion.hpp"
#include "clewdr/core/logger.hpp"
#include "clewdr/core/version.hpp"
#include "clewdr/gateway/auth.hpp"
#include "clewdr/gateway/server.hpp"
#include "clewdr/pool/cookie_pool.hpp"

#include <chrono>
#include <iostream>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace clewdr::cli {

namespace net = boost::asio;

namespace {

/// Time given to in-flight requests after a shutdown signal.
constexpr auto kShutdownGrace = std::chrono::seconds(10);

/// Waits for open connections to finish, up to the grace period, then
/// stops the io_context.
auto drain(net::io_context& ioc, gateway::GatewayServer& server) -> net::awaitable<void> {
    auto deadline = std::chrono::steady_clock::now() + kShutdownGrace;
    net::steady_timer tick(ioc);
    while (server.connection_count() > 0 && std::chrono::steady_clock::now() < deadline) {
        tick.expires_after(std::chrono::milliseconds(100));
        co_await tick.async_wait(net::use_awaitable);
    }
    if (server.connection_count() > 0) {
        LOG_WARN("Dropping {} open connections", server.connection_count());
    }
    ioc.stop();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// serve command
// ---------------------------------------------------------------------------

auto register_serve_command(CLI::App& app, ServeOptions& options) -> CLI::App* {
    auto* sub = app.add_subcommand("serve", "Run the proxy gateway");

    sub->add_option("-p,--port", options.port, "Listen port (overrides config)");
    sub->add_option("-b,--bind", options.bind, "Bind address (overrides config)");

    return sub;
}

auto run_serve(Config& config, const ServeOptions& options) -> int {
    if (options.port != 0) {
        config.port = options.port;
    }
    if (!options.bind.empty()) {
        config.ip = options.bind;
    }

    LOG_INFO("{} starting, upstream {}", kTitle, config.endpoint_url());
    if (config.cookies.empty()) {
        LOG_WARN("No cookies configured; completions will fail until cookies are added");
    }

    net::io_context ioc;

    pool::CookiePool pool(ioc, config.cookies);
    pool.start();

    claude::CompletionService service(ioc, config, pool);
    gateway::GatewayServer server(ioc, config, service, gateway::ApiKeyAuth(config.api_keys));

    auto bound = server.listen(config.ip, config.port);
    if (!bound) {
        LOG_ERROR("{}", bound.error().what());
        pool.shutdown();
        return 1;
    }

    net::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int sig) {
        if (ec) return;
        LOG_INFO("Received signal {}, shutting down", sig);
        server.stop();
        pool.shutdown();
        net::co_spawn(ioc, drain(ioc, server), net::detached);
    });

    net::co_spawn(ioc, server.run(), net::detached);

    LOG_INFO("Gateway running on {}:{}. Press Ctrl+C to stop.", config.ip, *bound);
    ioc.run();

    LOG_INFO("Gateway stopped.");
    Logger::flush();
    return 0;
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

auto register_config_command(CLI::App& app) -> CLI::App* {
    return app.add_subcommand("config", "Print the effective configuration (secrets masked)");
}

auto run_config(const Config& config) -> int {
    std::cout << redacted_config_json(config).dump(2) << "\n";
    return 0;
}

} // namespace clewdr::cli
