#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace clewdr::utils {

auto generate_id(std::size_t length = 16) -> std::string;
auto generate_uuid() -> std::string;
auto timestamp_ms() -> int64_t;
auto timestamp_s() -> int64_t;
auto trim(std::string_view s) -> std::string;
auto to_lower(std::string_view s) -> std::string;

/// ASCII case-insensitive equality.
auto iequals(std::string_view a, std::string_view b) -> bool;

/// ASCII case-insensitive substring search.
auto icontains(std::string_view haystack, std::string_view needle) -> bool;

/// Truncates to at most max_bytes without splitting a UTF-8 sequence.
auto truncate_utf8(std::string_view s, std::size_t max_bytes) -> std::string;

/// Masks all but the first and last few characters of a secret.
auto mask_secret(std::string_view secret) -> std::string;

} // namespace clewdr::utils
