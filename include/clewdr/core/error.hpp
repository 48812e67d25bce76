#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "clewdr/core/types.hpp"

namespace clewdr {

enum class ErrorCode {
    Unknown = 1,
    InvalidConfig,
    InvalidArgument,
    Unauthorized,
    NoValidKey,
    WrongCompletionFormat,
    InvalidModel,
    TooManyRequest,
    ExhaustedCookie,
    InvalidCookie,
    UpstreamError,
    Timeout,
    ConnectionFailed,
    ConnectionClosed,
    SerializationError,
    InternalError,
};

class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string detail)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto message() const noexcept -> std::string_view { return message_; }
    [[nodiscard]] auto detail() const noexcept -> std::string_view { return detail_; }

    /// Upstream HTTP status, when the error came from a classified response.
    [[nodiscard]] auto status() const noexcept -> int { return status_; }
    /// Seconds until the upstream limit resets (TooManyRequest / ExhaustedCookie).
    [[nodiscard]] auto retry_after() const noexcept -> int64_t { return retry_after_; }
    /// Cookie health carried by InvalidCookie.
    [[nodiscard]] auto reason() const noexcept -> const std::optional<Reason>& { return reason_; }

    auto with_status(int status) && -> Error {
        status_ = status;
        return std::move(*this);
    }

    auto with_retry_after(int64_t seconds) && -> Error {
        retry_after_ = seconds;
        return std::move(*this);
    }

    auto with_reason(Reason reason) && -> Error {
        reason_ = reason;
        return std::move(*this);
    }

    [[nodiscard]] auto what() const -> std::string {
        if (detail_.empty()) return message_;
        return message_ + ": " + detail_;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string detail_;
    int status_ = 0;
    int64_t retry_after_ = 0;
    std::optional<Reason> reason_;
};

template <typename T>
using Result = std::expected<T, Error>;

using VoidResult = std::expected<void, Error>;

inline auto make_error(ErrorCode code, std::string message) -> Error {
    return Error(code, std::move(message));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail) -> Error {
    return Error(code, std::move(message), std::move(detail));
}

inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::Unauthorized: return "UNAUTHORIZED";
        case ErrorCode::NoValidKey: return "NO_VALID_KEY";
        case ErrorCode::WrongCompletionFormat: return "WRONG_COMPLETION_FORMAT";
        case ErrorCode::InvalidModel: return "INVALID_MODEL";
        case ErrorCode::TooManyRequest: return "TOO_MANY_REQUEST";
        case ErrorCode::ExhaustedCookie: return "EXHAUSTED_COOKIE";
        case ErrorCode::InvalidCookie: return "INVALID_COOKIE";
        case ErrorCode::UpstreamError: return "UPSTREAM_ERROR";
        case ErrorCode::Timeout: return "TIMEOUT";
        case ErrorCode::ConnectionFailed: return "CONNECTION_FAILED";
        case ErrorCode::ConnectionClosed: return "CONNECTION_CLOSED";
        case ErrorCode::SerializationError: return "SERIALIZATION_ERROR";
        case ErrorCode::InternalError: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

/// True for errors raised from request shape alone, before any upstream call.
inline auto is_validation_error(const Error& e) noexcept -> bool {
    return e.code() == ErrorCode::WrongCompletionFormat ||
           e.code() == ErrorCode::InvalidModel ||
           e.code() == ErrorCode::InvalidArgument;
}

/// Maps an error onto the health signal handed back to the cookie pool.
/// Rate limits and exhaustion cool the cookie down; InvalidCookie carries
/// its own reason; everything else returns the cookie as healthy.
inline auto cookie_reason(const Error& e) -> std::optional<Reason> {
    switch (e.code()) {
        case ErrorCode::TooManyRequest:
        case ErrorCode::ExhaustedCookie:
            return Reason::exhausted(e.retry_after());
        case ErrorCode::InvalidCookie:
            return e.reason().value_or(Reason::null());
        default:
            return std::nullopt;
    }
}

// GCC 14 ICE workaround for co_return std::unexpected(...) in coroutines.
// GCC 14 crashes (internal compiler error) when a coroutine uses
// co_return std::unexpected(...) due to bugs in special member call
// resolution within coroutine frames. This wrapper defers the
// std::unexpected -> std::expected conversion to a user-defined
// conversion operator outside the coroutine frame.
// See: https://gcc.gnu.org/bugzilla/show_bug.cgi?id=112341
struct Fail {
    Error error;

    explicit Fail(Error e) : error(std::move(e)) {}

    template <typename T>
    operator Result<T>() && { return std::unexpected(std::move(error)); }
};

/// Use co_return make_fail(err) instead of co_return std::unexpected(err).
inline auto make_fail(Error e) -> Fail { return Fail(std::move(e)); }

/// Use co_return ok_result() instead of co_return Result<void>{}.
inline auto ok_result() -> Result<void> { return {}; }

} // namespace clewdr
