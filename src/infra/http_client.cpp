#include "clewdr/infra/http_client.hpp"
#include "clewdr/core/logger.hpp"
#include "clewdr/core/utils.hpp"

#include <httplib.h>

#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace clewdr::infra {

namespace {

auto describe(httplib::Error err) -> std::string {
    switch (err) {
        case httplib::Error::Connection: return "Connection failed";
        case httplib::Error::BindIPAddress: return "Bind IP address failed";
        case httplib::Error::Read: return "Read error";
        case httplib::Error::Write: return "Write error";
        case httplib::Error::ExceedRedirectCount: return "Exceeded redirect count";
        case httplib::Error::Canceled: return "Request canceled";
        case httplib::Error::SSLConnection: return "SSL connection error";
        case httplib::Error::SSLLoadingCerts: return "SSL certificate loading error";
        case httplib::Error::SSLServerVerification: return "SSL server verification failed";
        case httplib::Error::ConnectionTimeout: return "Connection timeout";
        default: return "httplib error code " + std::to_string(static_cast<int>(err));
    }
}

auto transport_error(httplib::Error err, std::string_view what) -> Error {
    if (err == httplib::Error::ConnectionTimeout) {
        return make_error(ErrorCode::Timeout, std::string(what) + " timed out", describe(err));
    }
    if (err == httplib::Error::Canceled) {
        return make_error(ErrorCode::ConnectionClosed, std::string(what) + " was cancelled",
                          describe(err));
    }
    return make_error(ErrorCode::ConnectionFailed, std::string(what) + " failed", describe(err));
}

auto to_http_response(const httplib::Result& result) -> Result<HttpResponse> {
    if (!result) {
        return std::unexpected(transport_error(result.error(), "HTTP request"));
    }

    HttpResponse response;
    response.status = result->status;
    response.body = result->body;
    for (const auto& [key, value] : result->headers) {
        response.headers.emplace(key, value);
    }
    return response;
}

/// Splits "http://host:port" / "host:port" into host and port.
auto parse_proxy(std::string_view proxy) -> std::optional<std::pair<std::string, int>> {
    if (auto scheme = proxy.find("://"); scheme != std::string_view::npos) {
        proxy.remove_prefix(scheme + 3);
    }
    while (!proxy.empty() && proxy.back() == '/') proxy.remove_suffix(1);

    auto colon = proxy.rfind(':');
    if (colon == std::string_view::npos || colon == 0) return std::nullopt;
    try {
        int port = std::stoi(std::string(proxy.substr(colon + 1)));
        return std::make_pair(std::string(proxy.substr(0, colon)), port);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void configure_client(httplib::Client& client, const HttpClientConfig& config) {
    client.set_connection_timeout(config.timeout_seconds);
    client.set_read_timeout(config.timeout_seconds);
    client.set_write_timeout(config.timeout_seconds);

    if (!config.verify_ssl) {
        client.enable_server_certificate_verification(false);
    }

    if (config.proxy) {
        if (auto hp = parse_proxy(*config.proxy)) {
            client.set_proxy(hp->first, hp->second);
        } else {
            LOG_WARN("Ignoring malformed proxy '{}'", *config.proxy);
        }
    }

    httplib::Headers hdrs;
    for (const auto& [key, value] : config.default_headers) {
        hdrs.emplace(key, value);
    }
    client.set_default_headers(hdrs);
}

auto to_httplib_headers(const std::map<std::string, std::string>& extra) -> httplib::Headers {
    httplib::Headers hdrs;
    for (const auto& [k, v] : extra) {
        hdrs.emplace(k, v);
    }
    return hdrs;
}

} // anonymous namespace

auto HttpResponse::header(std::string_view name) const -> std::optional<std::string> {
    for (const auto& [k, v] : headers) {
        if (utils::iequals(k, name)) return v;
    }
    return std::nullopt;
}

auto HttpResponse::header_values(std::string_view name) const -> std::vector<std::string> {
    std::vector<std::string> values;
    for (const auto& [k, v] : headers) {
        if (utils::iequals(k, name)) values.push_back(v);
    }
    return values;
}

using BlockingCall = std::function<Result<HttpResponse>(httplib::Client&)>;

struct HttpClient::Impl {
    boost::asio::io_context& ioc;
    HttpClientConfig config;

    Impl(boost::asio::io_context& ioc_, HttpClientConfig config_)
        : ioc(ioc_), config(std::move(config_)) {
        LOG_DEBUG("HTTP client created for {}", config.base_url);
    }

    /// Runs a blocking httplib call on a detached thread and suspends the
    /// calling coroutine until it finishes. The thread signals completion by
    /// cancelling a timer on the io_context.
    auto offload(BlockingCall call, std::string what)
        -> boost::asio::awaitable<Result<HttpResponse>> {
        struct CallState {
            std::mutex mtx;
            std::optional<Result<HttpResponse>> result;
        };

        auto state = std::make_shared<CallState>();
        auto timer = std::make_shared<boost::asio::steady_timer>(
            ioc, boost::asio::steady_timer::time_point::max());

        std::thread([state, timer, call = std::move(call), config = config]() mutable {
            // httplib::Client is not thread-safe; use a private one.
            httplib::Client client(config.base_url);
            configure_client(client, config);

            auto result = call(client);
            {
                std::lock_guard lock(state->mtx);
                state->result = std::move(result);
            }
            // Post cancel to the timer's executor for thread safety.
            boost::asio::post(timer->get_executor(), [timer] { timer->cancel(); });
        }).detach();

        boost::system::error_code ec;
        co_await timer->async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        std::lock_guard lock(state->mtx);
        if (!state->result.has_value()) {
            // Timer was cancelled by io_context shutdown, not by our thread.
            co_return std::unexpected(make_error(ErrorCode::ConnectionClosed,
                                                 what + " was cancelled", ec.message()));
        }
        co_return std::move(*state->result);
    }
};

HttpClient::HttpClient(boost::asio::io_context& ioc, HttpClientConfig config)
    : impl_(std::make_unique<Impl>(ioc, std::move(config))) {}

HttpClient::~HttpClient() = default;

auto HttpClient::get(std::string_view path,
                     const std::map<std::string, std::string>& headers)
    -> boost::asio::awaitable<Result<HttpResponse>> {
    LOG_DEBUG("GET {}{}", impl_->config.base_url, path);
    co_return co_await impl_->offload(
        [p = std::string(path), hdrs = to_httplib_headers(headers)](httplib::Client& client) {
            return to_http_response(client.Get(p, hdrs));
        },
        "HTTP GET");
}

auto HttpClient::post(std::string_view path,
                      std::string_view body,
                      std::string_view content_type,
                      const std::map<std::string, std::string>& headers)
    -> boost::asio::awaitable<Result<HttpResponse>> {
    LOG_DEBUG("POST {}{}", impl_->config.base_url, path);
    co_return co_await impl_->offload(
        [p = std::string(path), b = std::string(body), ct = std::string(content_type),
         hdrs = to_httplib_headers(headers)](httplib::Client& client) {
            return to_http_response(client.Post(p, hdrs, b, ct));
        },
        "HTTP POST");
}

auto HttpClient::delete_(std::string_view path,
                         const std::map<std::string, std::string>& headers)
    -> boost::asio::awaitable<Result<HttpResponse>> {
    LOG_DEBUG("DELETE {}{}", impl_->config.base_url, path);
    co_return co_await impl_->offload(
        [p = std::string(path), hdrs = to_httplib_headers(headers)](httplib::Client& client) {
            return to_http_response(client.Delete(p, hdrs));
        },
        "HTTP DELETE");
}

auto HttpClient::post_stream(std::string_view path,
                             std::string_view body,
                             std::string_view content_type,
                             const std::map<std::string, std::string>& headers,
                             HttpChunkCallback chunk_cb)
    -> boost::asio::awaitable<Result<HttpResponse>> {
    LOG_DEBUG("POST (stream) {}{}", impl_->config.base_url, path);
    co_return co_await impl_->offload(
        [chunk_cb = std::move(chunk_cb), p = std::string(path), b = std::string(body),
         ct = std::string(content_type),
         extra_hdrs = to_httplib_headers(headers)](httplib::Client& client) -> Result<HttpResponse> {
            httplib::Request req;
            req.method = "POST";
            req.path = p;
            req.headers = extra_hdrs;
            req.body = b;
            req.set_header("Content-Type", ct);

            // Track status to distinguish success (stream) vs error (buffer).
            int status_code = 0;
            std::string error_body;

            req.response_handler = [&status_code](const httplib::Response& r) -> bool {
                status_code = r.status;
                return true;
            };

            req.content_receiver =
                [&chunk_cb, &error_body, &status_code](
                    const char* data, size_t data_length,
                    uint64_t /*offset*/, uint64_t /*total_length*/) -> bool {
                    if (status_code >= 200 && status_code < 300) {
                        return chunk_cb(data, data_length);
                    }
                    error_body.append(data, data_length);
                    return true;
                };

            httplib::Response res;
            httplib::Error error = httplib::Error::Success;
            if (!client.send(req, res, error)) {
                return std::unexpected(transport_error(error, "HTTP streaming request"));
            }

            HttpResponse http_resp;
            http_resp.status = res.status;
            http_resp.body = std::move(error_body);
            for (const auto& [k, v] : res.headers) {
                http_resp.headers.emplace(k, v);
            }
            LOG_DEBUG("post_stream finished, status={}", status_code);
            return http_resp;
        },
        "HTTP streaming request");
}

} // namespace clewdr::infra
