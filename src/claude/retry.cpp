#include "clewdr/claude/retry.hpp"
#include "clewdr/claude/prompts.hpp"
#include "clewdr/core/logger.hpp"

namespace clewdr::claude {

auto to_string(RetryStrategy s) -> std::string_view {
    switch (s) {
        case RetryStrategy::Api: return "api";
        case RetryStrategy::Renew: return "renew";
        case RetryStrategy::RetryRegen: return "retry_regen";
        case RetryStrategy::CurrentRenew: return "current_renew";
        case RetryStrategy::CurrentContinue: return "current_continue";
    }
    return "unknown";
}

auto evaluate(const std::vector<Message>& current,
              const pool::SessionMemory& memory,
              bool has_conversation,
              const RetryPolicy& policy) -> Decision {
    Decision d;

    auto cur = PromptsGroup::find(current);
    auto prev = PromptsGroup::find(memory.prev_messages);

    d.same_prompts = same_prompts(current, memory.prev_messages);
    d.same_char_diff_chat = !d.same_prompts
        && cur.first_system_content() == prev.first_system_content()
        && cur.first_user_content() == prev.first_user_content();

    d.should_renew = policy.renew_always
        || !has_conversation
        || memory.prev_impersonated
        || (!policy.renew_always && d.same_prompts)
        || d.same_char_diff_chat;

    d.retry_regen = policy.retry_regenerate
        && d.same_prompts
        && memory.conv_char.has_value();

    if (d.should_renew) {
        d.strategy = RetryStrategy::Renew;
    } else if (d.retry_regen) {
        d.strategy = RetryStrategy::RetryRegen;
    } else {
        d.strategy = RetryStrategy::CurrentContinue;
    }
    return d;
}

auto decide(const std::vector<Message>& current,
            pool::SessionMemory& memory,
            bool has_conversation,
            const RetryPolicy& policy) -> Decision {
    auto d = evaluate(current, memory, has_conversation, policy);
    if (!d.same_prompts) {
        memory.prev_messages = current;
    }
    LOG_DEBUG("Retry decision: strategy={}, same_prompts={}, same_char_diff_chat={}",
              to_string(d.strategy), d.same_prompts, d.same_char_diff_chat);
    return d;
}

} // namespace clewdr::claude
