#include "clewdr/claude/classifier.hpp"
#include "clewdr/core/logger.hpp"
#include "clewdr/core/utils.hpp"

#include <algorithm>

namespace clewdr::claude {

namespace {

struct ErrorBody {
    std::string type;
    std::string message;
};

/// Pulls error.type / error.message out of a Claude.ai error body.
auto parse_error_body(std::string_view body) -> std::optional<ErrorBody> {
    auto j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    ErrorBody out;
    if (j.contains("error") && j["error"].is_object()) {
        const auto& err = j["error"];
        out.type = err.value("type", "");
        if (err.contains("message") && err["message"].is_string()) {
            out.message = err["message"].get<std::string>();
        }
    } else {
        out.type = j.value("type", "");
        if (j.contains("detail") && j["detail"].is_string()) {
            out.message = j["detail"].get<std::string>();
        }
    }
    return out;
}

auto resets_at_from_message(std::string_view message) -> std::optional<int64_t> {
    auto inner = json::parse(message, nullptr, false);
    if (inner.is_discarded() || !inner.is_object()) return std::nullopt;
    if (!inner.contains("resetsAt") || !inner["resetsAt"].is_number()) return std::nullopt;
    return inner["resetsAt"].get<int64_t>();
}

} // anonymous namespace

auto parse_retry_after(const infra::HttpResponse& response) -> int64_t {
    if (auto header = response.header("retry-after")) {
        try {
            return std::max<int64_t>(0, std::stoll(*header));
        } catch (const std::exception&) {
            LOG_DEBUG("Ignoring non-numeric Retry-After '{}'", *header);
        }
    }

    if (auto body = parse_error_body(response.body)) {
        if (auto resets_at = resets_at_from_message(body->message)) {
            return std::max<int64_t>(0, *resets_at - utils::timestamp_s());
        }
    }
    return 0;
}

auto classify_error(const infra::HttpResponse& response) -> Error {
    auto status = response.status;
    auto body = parse_error_body(response.body);
    std::string type = body ? body->type : "";
    std::string message = body ? body->message : "";

    bool exhausted = type == "exceeded_limit"
        || utils::icontains(message, "exceeded_limit")
        || (!body && utils::icontains(response.body, "exceeded_limit"));
    if (exhausted) {
        auto retry = parse_retry_after(response);
        return make_error(ErrorCode::ExhaustedCookie, "Cookie usage exhausted",
                          "retry after " + std::to_string(retry) + "s")
            .with_status(status)
            .with_retry_after(retry);
    }

    if (status == 429 || type == "rate_limit_error") {
        auto retry = parse_retry_after(response);
        return make_error(ErrorCode::TooManyRequest, "Too many requests",
                          "retry after " + std::to_string(retry) + "s")
            .with_status(status)
            .with_retry_after(retry);
    }

    if (status == 401) {
        return make_error(ErrorCode::InvalidCookie, "Cookie rejected", "401 Unauthorized")
            .with_status(status)
            .with_reason(Reason::null());
    }

    if (status == 403) {
        auto reason = Reason::null();
        if (utils::icontains(response.body, "disabled")) {
            reason = Reason::disabled();
        } else if (utils::icontains(response.body, "banned") || type == "permission_error") {
            reason = Reason::banned();
        }
        return make_error(ErrorCode::InvalidCookie, "Cookie forbidden", to_string(reason))
            .with_status(status)
            .with_reason(reason);
    }

    std::string_view source = message.empty() ? std::string_view(response.body)
                                              : std::string_view(message);
    return make_error(ErrorCode::UpstreamError,
                      "Upstream returned " + std::to_string(status),
                      utils::truncate_utf8(source, kExcerptLimit))
        .with_status(status);
}

auto check_response(const infra::HttpResponse& response) -> VoidResult {
    if (response.is_success()) {
        return {};
    }
    auto err = classify_error(response);
    LOG_WARN("Upstream error: {} ({})", err.what(), error_code_to_string(err.code()));
    return std::unexpected(std::move(err));
}

} // namespace clewdr::claude
