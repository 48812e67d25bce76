#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace clewdr {

using json = nlohmann::json;
using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock>;

enum class Role {
    System,
    User,
    Assistant,
};

NLOHMANN_JSON_SERIALIZE_ENUM(Role, {
    {Role::System, "system"},
    {Role::User, "user"},
    {Role::Assistant, "assistant"},
})

/// Chat message as sent by SillyTavern-style clients.
///
/// The flag fields are optional booleans carried through from the client's
/// prompt manager. Comparison is member-wise in declaration order, which is
/// the total order used to detect resubmitted prompts.
struct Message {
    Role role = Role::User;
    std::string content;
    std::optional<bool> customname;
    std::optional<std::string> name;
    std::optional<bool> strip;
    std::optional<bool> jailbreak;
    std::optional<bool> main;
    std::optional<bool> discard;
    std::optional<bool> merged;
    std::optional<bool> personality;
    std::optional<bool> scenario;

    auto operator<=>(const Message&) const = default;
    auto operator==(const Message&) const -> bool = default;
};

void to_json(json& j, const Message& m);
void from_json(const json& j, Message& m);

/// Base64 image carried in a content block. Parsed but never uploaded.
struct ImageSource {
    std::string type;        // "base64"
    std::string media_type;  // "image/png", ...
    std::string data;
};

void to_json(json& j, const ImageSource& s);
void from_json(const json& j, ImageSource& s);

/// Collects image blocks from a raw messages array.
auto extract_images(const json& messages) -> std::vector<ImageSource>;

enum class ReasonKind {
    Exhausted,
    Restricted,
    NonPro,
    Disabled,
    Banned,
    Null,
};

/// Why a cookie is handed back unhealthy.
struct Reason {
    ReasonKind kind = ReasonKind::Null;
    int64_t retry_after = 0;  // seconds, only for Exhausted / Restricted

    static auto exhausted(int64_t seconds) -> Reason { return {ReasonKind::Exhausted, seconds}; }
    static auto restricted(int64_t seconds) -> Reason { return {ReasonKind::Restricted, seconds}; }
    static auto non_pro() -> Reason { return {ReasonKind::NonPro, 0}; }
    static auto disabled() -> Reason { return {ReasonKind::Disabled, 0}; }
    static auto banned() -> Reason { return {ReasonKind::Banned, 0}; }
    static auto null() -> Reason { return {ReasonKind::Null, 0}; }

    /// Exhausted and Restricted cookies come back after a cooldown;
    /// every other reason evicts the cookie.
    [[nodiscard]] auto is_cooldown() const noexcept -> bool {
        return kind == ReasonKind::Exhausted || kind == ReasonKind::Restricted;
    }

    auto operator==(const Reason&) const -> bool = default;
};

auto to_string(const Reason& r) -> std::string;

} // namespace clewdr
