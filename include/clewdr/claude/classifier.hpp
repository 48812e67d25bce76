#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "clewdr/core/error.hpp"
#include "clewdr/infra/http_client.hpp"

namespace clewdr::claude {

/// Longest upstream body excerpt carried in an UpstreamError.
inline constexpr size_t kExcerptLimit = 512;

/// Maps a non-2xx upstream response onto the error taxonomy.
/// ExhaustedCookie / TooManyRequest carry retry_after, InvalidCookie carries
/// a Reason, everything else is UpstreamError with status and excerpt.
auto classify_error(const infra::HttpResponse& response) -> Error;

/// Ok for 2xx responses, classify_error() otherwise.
auto check_response(const infra::HttpResponse& response) -> VoidResult;

/// Seconds until the upstream limit resets: the Retry-After header when
/// present, else `resetsAt - now` from the JSON inside error.message,
/// floored at zero.
auto parse_retry_after(const infra::HttpResponse& response) -> int64_t;

} // namespace clewdr::claude
