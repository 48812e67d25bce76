#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "clewdr/core/types.hpp"

namespace clewdr::claude {

/// System content SillyTavern inserts between chats; never part of a prompt.
inline constexpr std::string_view kNewChatMarker = "[Start a new chat]";

/// Non-owning view of the first and last message of each role.
/// Pointers refer into the vector passed to find() and must not outlive it.
struct PromptsGroup {
    const Message* first_user = nullptr;
    const Message* last_user = nullptr;
    const Message* first_assistant = nullptr;
    const Message* last_assistant = nullptr;
    const Message* first_system = nullptr;
    const Message* last_system = nullptr;

    static auto find(const std::vector<Message>& messages) -> PromptsGroup;

    [[nodiscard]] auto first_user_content() const -> std::optional<std::string>;
    [[nodiscard]] auto first_system_content() const -> std::optional<std::string>;
};

/// True when both lists hold the same non-system messages, ignoring order.
auto same_prompts(const std::vector<Message>& a, const std::vector<Message>& b) -> bool;

} // namespace clewdr::claude
