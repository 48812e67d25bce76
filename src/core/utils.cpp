#include "clewdr/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <random>

#include <uuid.h>

namespace clewdr::utils {

namespace {

auto lower_char(char c) -> char {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

} // anonymous namespace

auto generate_id(std::size_t length) -> std::string {
    static constexpr std::string_view chars =
        "abcdefghijklmnopqrstuvwxyz0123456789";
    static thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<size_t> dist(0, chars.size() - 1);

    std::string result;
    result.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        result += chars[dist(rng)];
    }
    return result;
}

auto generate_uuid() -> std::string {
    static thread_local std::mt19937 rng(std::random_device{}());
    auto gen = uuids::uuid_random_generator(rng);
    return uuids::to_string(gen());
}

auto timestamp_ms() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

auto timestamp_s() -> int64_t {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r\f\v");
    return std::string(s.substr(start, end - start + 1));
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(), lower_char);
    return result;
}

auto iequals(std::string_view a, std::string_view b) -> bool {
    return std::ranges::equal(a, b, [](char x, char y) {
        return lower_char(x) == lower_char(y);
    });
}

auto icontains(std::string_view haystack, std::string_view needle) -> bool {
    if (needle.empty()) return true;
    auto it = std::search(haystack.begin(), haystack.end(),
                          needle.begin(), needle.end(),
                          [](char x, char y) { return lower_char(x) == lower_char(y); });
    return it != haystack.end();
}

auto truncate_utf8(std::string_view s, std::size_t max_bytes) -> std::string {
    if (s.size() <= max_bytes) return std::string(s);
    auto cut = max_bytes;
    // Back off continuation bytes (10xxxxxx).
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return std::string(s.substr(0, cut));
}

auto mask_secret(std::string_view secret) -> std::string {
    if (secret.size() <= 12) return std::string(secret.size(), '*');
    return std::string(secret.substr(0, 6)) + "..." +
           std::string(secret.substr(secret.size() - 4));
}

} // namespace clewdr::utils
