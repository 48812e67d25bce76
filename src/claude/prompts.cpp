#include "clewdr/claude/prompts.hpp"

#include <algorithm>
#include <functional>

namespace clewdr::claude {

namespace {

auto sorted_non_system(const std::vector<Message>& messages)
    -> std::vector<std::reference_wrapper<const Message>> {
    std::vector<std::reference_wrapper<const Message>> out;
    for (const auto& m : messages) {
        if (m.role != Role::System) out.emplace_back(m);
    }
    std::ranges::sort(out, [](const Message& a, const Message& b) { return a < b; });
    return out;
}

} // anonymous namespace

auto PromptsGroup::find(const std::vector<Message>& messages) -> PromptsGroup {
    PromptsGroup group;
    for (const auto& m : messages) {
        switch (m.role) {
            case Role::User:
                if (!group.first_user) group.first_user = &m;
                group.last_user = &m;
                break;
            case Role::Assistant:
                if (!group.first_assistant) group.first_assistant = &m;
                group.last_assistant = &m;
                break;
            case Role::System:
                if (m.content == kNewChatMarker) break;
                if (!group.first_system) group.first_system = &m;
                group.last_system = &m;
                break;
        }
    }
    return group;
}

auto PromptsGroup::first_user_content() const -> std::optional<std::string> {
    if (!first_user) return std::nullopt;
    return first_user->content;
}

auto PromptsGroup::first_system_content() const -> std::optional<std::string> {
    if (!first_system) return std::nullopt;
    return first_system->content;
}

auto same_prompts(const std::vector<Message>& a, const std::vector<Message>& b) -> bool {
    auto lhs = sorted_non_system(a);
    auto rhs = sorted_non_system(b);
    return std::ranges::equal(lhs, rhs, [](const Message& x, const Message& y) {
        return x == y;
    });
}

} // namespace clewdr::claude
