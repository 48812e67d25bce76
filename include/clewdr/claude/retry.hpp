#pragma once

#include <string_view>
#include <vector>

#include "clewdr/core/types.hpp"
#include "clewdr/pool/cookie_pool.hpp"

namespace clewdr::claude {

enum class RetryStrategy {
    Api,
    Renew,
    RetryRegen,
    CurrentRenew,
    CurrentContinue,
};

/// Current strategies reuse the live conversation.
[[nodiscard]] constexpr auto is_current(RetryStrategy s) noexcept -> bool {
    return s == RetryStrategy::CurrentRenew || s == RetryStrategy::CurrentContinue;
}

auto to_string(RetryStrategy s) -> std::string_view;

struct RetryPolicy {
    bool renew_always = true;
    bool retry_regenerate = false;
};

/// Outcome of comparing a request against the previous one on the same cookie.
struct Decision {
    bool same_prompts = false;
    bool same_char_diff_chat = false;
    bool should_renew = false;
    bool retry_regen = false;
    RetryStrategy strategy = RetryStrategy::Renew;
};

/// Pure decision over the current and previous message lists.
auto evaluate(const std::vector<Message>& current,
              const pool::SessionMemory& memory,
              bool has_conversation,
              const RetryPolicy& policy) -> Decision;

/// evaluate(), then records the current messages as the previous ones
/// when the prompts differ.
auto decide(const std::vector<Message>& current,
            pool::SessionMemory& memory,
            bool has_conversation,
            const RetryPolicy& policy) -> Decision;

} // namespace clewdr::claude
