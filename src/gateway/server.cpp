#include "clewdr/gateway/server.hpp"
#include "clewdr/gateway/requests.hpp"

#include "clewdr/core/logger.hpp"
#include "clewdr/core/utils.hpp"
#include "clewdr/core/version.hpp"

#include <chrono>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/flat_buffer.hpp>

namespace clewdr::gateway {

namespace {

constexpr auto kReadTimeout = std::chrono::seconds(60);
constexpr std::string_view kServerName = "clewdr++/" CLEWDR_VERSION_STRING;

auto to_sv(beast::string_view v) -> std::string_view {
    return {v.data(), v.size()};
}

auto header_value(const Request& req, std::string_view name) -> std::string_view {
    auto it = req.find(beast::string_view(name.data(), name.size()));
    if (it == req.end()) return {};
    return to_sv(it->value());
}

auto request_path(const Request& req) -> std::string_view {
    auto target = to_sv(req.target());
    if (auto pos = target.find('?'); pos != std::string_view::npos) {
        target = target.substr(0, pos);
    }
    while (target.size() > 1 && target.back() == '/') target.remove_suffix(1);
    return target;
}

auto models_reply(const std::vector<std::string>& models) -> Reply {
    json data = json::array();
    for (const auto& id : models) {
        data.push_back({
            {"id", id},
            {"object", "model"},
            {"created", 0},
            {"owned_by", "anthropic"},
        });
    }
    json body = {{"object", "list"}, {"data", std::move(data)}};
    return Reply{.status = 200, .content_type = "application/json", .body = body.dump()};
}

} // anonymous namespace

auto error_reply(int status, std::string_view type, std::string_view message) -> Reply {
    json body = {
        {"type", "error"},
        {"error", {{"type", type}, {"message", message}}},
    };
    return Reply{.status = status, .content_type = "application/json", .body = body.dump()};
}

auto status_for(const Error& error) -> int {
    if (error.code() == ErrorCode::Unauthorized) return 401;
    if (is_validation_error(error) || error.code() == ErrorCode::SerializationError) return 400;
    return 500;
}

GatewayServer::GatewayServer(net::io_context& ioc, const Config& config,
                             claude::CompletionService& service, ApiKeyAuth auth)
    : ioc_(ioc)
    , config_(config)
    , service_(service)
    , auth_(std::move(auth))
    , acceptor_(ioc) {}

auto GatewayServer::listen(std::string_view address, uint16_t port) -> Result<uint16_t> {
    boost::system::error_code ec;
    auto addr = net::ip::make_address(std::string(address), ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                          "Invalid bind address", std::string(address)));
    }

    auto endpoint = tcp::endpoint{addr, port};
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::ConnectionFailed,
            "Failed to listen on " + std::string(address) + ":" + std::to_string(port),
            ec.message()));
    }

    auto bound = acceptor_.local_endpoint().port();
    running_ = true;
    LOG_INFO("Gateway listening on {}:{}", addr.to_string(), bound);
    return bound;
}

auto GatewayServer::run() -> awaitable<void> {
    co_await accept_loop();
}

void GatewayServer::stop() {
    if (!running_.exchange(false)) return;

    LOG_INFO("Gateway shutting down ({} connections open)", active_.load());
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        LOG_WARN("Closing acceptor: {}", ec.message());
    }
}

auto GatewayServer::accept_loop() -> awaitable<void> {
    while (running_) {
        try {
            auto socket = co_await acceptor_.async_accept(net::use_awaitable);

            if (active_ >= config_.max_connections) {
                LOG_WARN("Max connections ({}) reached, rejecting", config_.max_connections);
                boost::system::error_code ignored;
                socket.close(ignored);
                continue;
            }

            net::co_spawn(ioc_, handle_connection(std::move(socket)), net::detached);

        } catch (const boost::system::system_error& e) {
            if (!running_) break;  // acceptor closed by stop()
            LOG_ERROR("Accept error: {}", e.what());
        }
    }
}

auto GatewayServer::handle_connection(tcp::socket socket) -> awaitable<void> {
    auto conn_id = utils::generate_id(8);
    boost::system::error_code ep_ec;
    auto remote = socket.remote_endpoint(ep_ec);
    ++active_;
    LOG_DEBUG("Connection {} from {}:{}", conn_id,
              ep_ec ? std::string("?") : remote.address().to_string(),
              ep_ec ? 0 : remote.port());

    beast::tcp_stream stream(std::move(socket));
    beast::flat_buffer buffer;

    for (;;) {
        http::request_parser<http::string_body> parser;
        parser.body_limit(kMaxBodyBytes);

        stream.expires_after(kReadTimeout);
        auto [ec, bytes] = co_await http::async_read(stream, buffer, parser,
                                                     net::as_tuple(net::use_awaitable));
        if (ec == http::error::end_of_stream) break;
        if (ec) {
            if (ec != beast::error::timeout) {
                LOG_DEBUG("Connection {}: read error: {}", conn_id, ec.message());
            }
            break;
        }
        stream.expires_never();

        auto req = parser.release();
        auto keep_alive = req.keep_alive();

        Reply reply;
        try {
            reply = co_await route(req);
        } catch (const std::exception& e) {
            LOG_ERROR("Connection {}: {} {} failed: {}", conn_id,
                      to_sv(req.method_string()), to_sv(req.target()), e.what());
            reply = error_reply(500, "api_error", "Internal server error");
        }

        bool written = reply.is_stream()
            ? co_await write_stream(stream, req, reply)
            : co_await write_reply(stream, req, reply);
        if (!written || !keep_alive) break;
    }

    boost::system::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_send, ignored);
    --active_;
    LOG_DEBUG("Connection {} closed", conn_id);
}

auto GatewayServer::authorize(const Request& req) const -> VoidResult {
    return auth_.check(header_value(req, "x-api-key"),
                       header_value(req, "authorization"));
}

auto GatewayServer::route(const Request& req) -> awaitable<Reply> {
    auto path = request_path(req);
    auto method = req.method();

    bool messages = path == "/v1/messages" && method == http::verb::post;
    bool chat = path == "/v1/chat/completions" && method == http::verb::post;
    bool models = path == "/v1/models" && method == http::verb::get;

    if (!messages && !chat && !models) {
        co_return error_reply(404, "not_found_error",
                              "No route for " + std::string(to_sv(req.method_string())) + " " +
                              std::string(path));
    }

    if (auto ok = authorize(req); !ok) {
        LOG_WARN("Rejected {}: {}", path, ok.error().what());
        co_return error_reply(401, "authentication_error", ok.error().what());
    }

    if (models) {
        co_return models_reply(service_.models());
    }

    auto parsed = messages ? parse_messages_request(req.body()) : parse_chat_request(req.body());
    if (!parsed) {
        LOG_WARN("Bad request on {}: {}", path, parsed.error().what());
        co_return error_reply(status_for(parsed.error()), "invalid_request_error",
                              parsed.error().what());
    }

    co_return co_await service_.handle(std::move(*parsed));
}

auto GatewayServer::write_reply(beast::tcp_stream& stream, const Request& req, Reply& reply)
    -> awaitable<bool> {
    http::response<http::string_body> res{static_cast<http::status>(reply.status), req.version()};
    res.set(http::field::server, std::string(kServerName));
    res.set(http::field::content_type, reply.content_type);
    res.keep_alive(req.keep_alive());
    res.body() = std::move(reply.body);
    res.prepare_payload();

    auto [ec, bytes] = co_await http::async_write(stream, res, net::as_tuple(net::use_awaitable));
    if (ec) {
        LOG_DEBUG("Write failed: {}", ec.message());
        co_return false;
    }
    co_return true;
}

auto GatewayServer::write_stream(beast::tcp_stream& stream, const Request& req, Reply& reply)
    -> awaitable<bool> {
    http::response<http::empty_body> res{http::status::ok, req.version()};
    res.set(http::field::server, std::string(kServerName));
    res.set(http::field::content_type, reply.content_type);
    res.set(http::field::cache_control, "no-cache");
    res.keep_alive(req.keep_alive());
    res.chunked(true);

    http::response_serializer<http::empty_body> sr{res};
    auto [hec, hbytes] = co_await http::async_write_header(stream, sr,
                                                           net::as_tuple(net::use_awaitable));
    if (hec) {
        LOG_INFO("Client left before the stream started: {}", hec.message());
        claude::abandon(*reply.stream);
        co_return false;
    }

    for (;;) {
        auto [ec, frame] = co_await reply.stream->async_receive(net::as_tuple(net::use_awaitable));
        if (ec) break;  // eof marks the end of the stream
        if (frame.empty()) continue;

        auto [wec, wbytes] = co_await net::async_write(
            stream, http::make_chunk(net::buffer(frame)), net::as_tuple(net::use_awaitable));
        if (wec) {
            LOG_INFO("Client disconnected mid-stream: {}", wec.message());
            claude::abandon(*reply.stream);
            co_return false;
        }
    }

    auto [lec, lbytes] = co_await net::async_write(stream, http::make_chunk_last(),
                                                   net::as_tuple(net::use_awaitable));
    co_return !lec;
}

} // namespace clewdr::gateway
