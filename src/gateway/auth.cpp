#include "clewdr/gateway/auth.hpp"

#include "clewdr/core/logger.hpp"
#include "clewdr/core/utils.hpp"

#include <algorithm>

namespace clewdr::gateway {

namespace {

auto constant_time_equals(std::string_view a, std::string_view b) -> bool {
    if (a.size() != b.size()) return false;

    volatile unsigned char diff = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        diff |= static_cast<unsigned char>(a[i] ^ b[i]);
    }
    return diff == 0;
}

} // anonymous namespace

ApiKeyAuth::ApiKeyAuth(std::vector<std::string> keys) {
    for (auto& key : keys) {
        auto trimmed = utils::trim(key);
        if (!trimmed.empty()) keys_.push_back(std::move(trimmed));
    }
    if (keys_.empty()) {
        LOG_WARN("No api_keys configured: the API is open to anyone who can reach it");
    } else {
        LOG_INFO("API key authentication enabled ({} keys)", keys_.size());
    }
}

auto ApiKeyAuth::verify(std::string_view key) const -> VoidResult {
    if (is_open()) return {};

    bool match = false;
    for (const auto& configured : keys_) {
        // No early exit, every key is compared.
        match |= constant_time_equals(key, configured);
    }
    if (!match) {
        return std::unexpected(make_error(ErrorCode::Unauthorized, "Invalid API key"));
    }
    return {};
}

auto ApiKeyAuth::check(std::string_view x_api_key, std::string_view authorization) const
    -> VoidResult {
    if (is_open()) return {};

    if (!x_api_key.empty()) {
        return verify(x_api_key);
    }
    if (auto token = extract_bearer_token(authorization)) {
        return verify(*token);
    }
    return std::unexpected(make_error(ErrorCode::Unauthorized, "Missing API key"));
}

auto ApiKeyAuth::extract_bearer_token(std::string_view header_value)
    -> std::optional<std::string_view> {
    constexpr std::string_view prefix = "Bearer ";
    if (header_value.size() <= prefix.size()) return std::nullopt;
    if (!utils::iequals(header_value.substr(0, prefix.size()), prefix)) return std::nullopt;

    auto token = header_value.substr(prefix.size());
    while (!token.empty() && token.front() == ' ') token.remove_prefix(1);
    while (!token.empty() && token.back() == ' ') token.remove_suffix(1);

    if (token.empty()) return std::nullopt;
    return token;
}

} // namespace clewdr::gateway
