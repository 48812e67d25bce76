#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "clewdr/core/error.hpp"

namespace clewdr::gateway {

/// Checks inbound API keys against the configured set.
///
/// Clients send the key either as `x-api-key` or as
/// `Authorization: Bearer <key>`. With no keys configured every request is
/// accepted.
class ApiKeyAuth {
public:
    ApiKeyAuth() = default;
    explicit ApiKeyAuth(std::vector<std::string> keys);

    /// Constant-time comparison against every configured key.
    [[nodiscard]] auto verify(std::string_view key) const -> VoidResult;

    /// Picks the credential from the request headers, then verifies it.
    [[nodiscard]] auto check(std::string_view x_api_key,
                             std::string_view authorization) const -> VoidResult;

    [[nodiscard]] auto is_open() const noexcept -> bool { return keys_.empty(); }

    /// Extract the token from an "Authorization: Bearer <token>" header value.
    static auto extract_bearer_token(std::string_view header_value)
        -> std::optional<std::string_view>;

private:
    std::vector<std::string> keys_;
};

} // namespace clewdr::gateway
