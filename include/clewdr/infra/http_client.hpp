#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>

#include "clewdr/core/error.hpp"

namespace clewdr::infra {

/// Callback invoked for each chunk of response data during streaming.
/// Return true to continue receiving data, false to abort the request.
using HttpChunkCallback = std::function<bool(const char* data, size_t length)>;

/// Header map that keeps repeated fields (set-cookie).
using HttpHeaders = std::multimap<std::string, std::string>;

/// HTTP response from the client.
struct HttpResponse {
    int status = 0;
    HttpHeaders headers;
    std::string body;

    /// Returns true if the status code indicates success (2xx).
    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status >= 200 && status < 300;
    }

    /// First value of a header, matched case-insensitively.
    [[nodiscard]] auto header(std::string_view name) const -> std::optional<std::string>;

    /// Every value of a header, matched case-insensitively.
    [[nodiscard]] auto header_values(std::string_view name) const -> std::vector<std::string>;
};

/// Configuration for the HTTP client.
struct HttpClientConfig {
    std::string base_url;
    int timeout_seconds = 30;
    bool verify_ssl = true;
    std::optional<std::string> proxy;  // "http://host:port" or "host:port"
    std::map<std::string, std::string> default_headers;
};

/// Asynchronous HTTP client wrapping cpp-httplib.
/// Provides awaitable methods compatible with boost::asio coroutines. Each
/// request runs on its own background thread with a private httplib::Client,
/// so a slow upstream never blocks the io_context.
class HttpClient {
public:
    explicit HttpClient(boost::asio::io_context& ioc, HttpClientConfig config);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /// Performs an asynchronous HTTP GET request.
    auto get(std::string_view path,
             const std::map<std::string, std::string>& headers = {})
        -> boost::asio::awaitable<Result<HttpResponse>>;

    /// Performs an asynchronous HTTP POST request.
    auto post(std::string_view path,
              std::string_view body,
              std::string_view content_type = "application/json",
              const std::map<std::string, std::string>& headers = {})
        -> boost::asio::awaitable<Result<HttpResponse>>;

    /// Performs a streaming HTTP POST request on a background thread.
    /// The chunk_callback is invoked for each chunk of the response body
    /// as it arrives (on the background thread). For error responses
    /// (non-2xx), the body is buffered and returned in HttpResponse::body.
    /// When the callback returns false the transfer is aborted and the
    /// result is a ConnectionClosed error.
    auto post_stream(std::string_view path,
                     std::string_view body,
                     std::string_view content_type,
                     const std::map<std::string, std::string>& headers,
                     HttpChunkCallback chunk_callback)
        -> boost::asio::awaitable<Result<HttpResponse>>;

    /// Performs an asynchronous HTTP DELETE request.
    auto delete_(std::string_view path,
                 const std::map<std::string, std::string>& headers = {})
        -> boost::asio::awaitable<Result<HttpResponse>>;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace clewdr::infra
