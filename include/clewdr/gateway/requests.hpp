#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "clewdr/claude/completion.hpp"
#include "clewdr/core/error.hpp"
#include "clewdr/core/types.hpp"

namespace clewdr::gateway {

/// Default when a client leaves max_tokens out.
inline constexpr uint64_t kDefaultMaxTokens = 4096;

/// Body of POST /v1/messages.
struct ClientRequestBody {
    std::string model;
    std::vector<Message> messages;
    std::string system;
    bool stream = false;
    std::optional<double> temperature;
    std::optional<double> top_p;
    std::optional<int64_t> top_k;
    uint64_t max_tokens = kDefaultMaxTokens;
    std::vector<std::string> stop_sequences;
    std::optional<claude::Thinking> thinking;
    std::vector<ImageSource> images;
};

void from_json(const json& j, ClientRequestBody& body);

/// Body of POST /v1/chat/completions.
struct ClientRequestInfo {
    std::string model;
    std::vector<Message> messages;
    bool stream = false;
    std::optional<double> temperature;
    std::optional<double> top_p;
    std::optional<int64_t> top_k;
    uint64_t max_tokens = kDefaultMaxTokens;
    std::vector<std::string> stop;
    std::vector<ImageSource> images;
};

void from_json(const json& j, ClientRequestInfo& info);

/// Temperature is accepted in [0, 1] only.
auto clamp_temperature(std::optional<double> t) -> std::optional<double>;

/// Parse and normalise an inbound body. Malformed JSON or wrongly typed
/// fields yield InvalidArgument.
auto parse_messages_request(std::string_view body) -> Result<claude::CompletionRequest>;
auto parse_chat_request(std::string_view body) -> Result<claude::CompletionRequest>;

} // namespace clewdr::gateway
