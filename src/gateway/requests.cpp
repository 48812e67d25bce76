#include "clewdr/gateway/requests.hpp"

#include <algorithm>
#include <stdexcept>

namespace clewdr::gateway {

namespace {

template <typename T>
void read_optional(const json& j, const char* key, std::optional<T>& out) {
    if (j.contains(key) && !j[key].is_null()) {
        out = j[key].get<T>();
    }
}

/// "system" is either a string or an array of text blocks.
auto read_system(const json& system) -> std::string {
    if (system.is_string()) return system.get<std::string>();
    if (!system.is_array()) return {};

    std::string text;
    for (const auto& block : system) {
        if (!block.is_object() || block.value("type", "") != "text") continue;
        if (!text.empty()) text += '\n';
        text += block.value("text", "");
    }
    return text;
}

/// "stop" is either a single string or an array of strings.
auto read_stop(const json& stop) -> std::vector<std::string> {
    if (stop.is_string()) return {stop.get<std::string>()};
    if (stop.is_array()) return stop.get<std::vector<std::string>>();
    return {};
}

template <typename Body>
auto parse_body(std::string_view text) -> Result<Body> {
    try {
        auto j = json::parse(text);
        if (!j.is_object()) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                              "Request body must be a JSON object"));
        }
        return j.get<Body>();
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "Malformed request body", e.what()));
    } catch (const std::invalid_argument& e) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "Malformed request body", e.what()));
    }
}

} // anonymous namespace

void from_json(const json& j, ClientRequestBody& body) {
    body.model = j.value("model", "");
    body.messages = j.value("messages", std::vector<Message>{});
    if (j.contains("system")) body.system = read_system(j["system"]);
    body.stream = j.value("stream", false);
    read_optional(j, "temperature", body.temperature);
    read_optional(j, "top_p", body.top_p);
    read_optional(j, "top_k", body.top_k);
    body.max_tokens = j.value("max_tokens", kDefaultMaxTokens);
    if (j.contains("stop_sequences")) body.stop_sequences = read_stop(j["stop_sequences"]);
    if (j.contains("thinking") && j["thinking"].is_object()) {
        const auto& t = j["thinking"];
        body.thinking = claude::Thinking{
            .budget_tokens = t.value("budget_tokens", uint64_t{0}),
            .type = t.value("type", ""),
        };
    }
    if (j.contains("messages")) body.images = extract_images(j["messages"]);
}

void from_json(const json& j, ClientRequestInfo& info) {
    info.model = j.value("model", "");
    info.messages = j.value("messages", std::vector<Message>{});
    info.stream = j.value("stream", false);
    read_optional(j, "temperature", info.temperature);
    read_optional(j, "top_p", info.top_p);
    read_optional(j, "top_k", info.top_k);
    info.max_tokens = j.value("max_tokens", kDefaultMaxTokens);
    if (j.contains("stop")) info.stop = read_stop(j["stop"]);
    if (j.contains("messages")) info.images = extract_images(j["messages"]);
}

auto clamp_temperature(std::optional<double> t) -> std::optional<double> {
    if (!t) return std::nullopt;
    return std::clamp(*t, 0.0, 1.0);
}

auto parse_messages_request(std::string_view body) -> Result<claude::CompletionRequest> {
    auto parsed = parse_body<ClientRequestBody>(body);
    if (!parsed) return std::unexpected(std::move(parsed.error()));

    auto& b = *parsed;
    return claude::CompletionRequest{
        .format = claude::ClientFormat::Messages,
        .model = std::move(b.model),
        .messages = std::move(b.messages),
        .system = std::move(b.system),
        .stream = b.stream,
        .temperature = clamp_temperature(b.temperature),
        .top_p = b.top_p,
        .top_k = b.top_k,
        .max_tokens = b.max_tokens,
        .stop = std::move(b.stop_sequences),
        .thinking = std::move(b.thinking),
        .images = std::move(b.images),
    };
}

auto parse_chat_request(std::string_view body) -> Result<claude::CompletionRequest> {
    auto parsed = parse_body<ClientRequestInfo>(body);
    if (!parsed) return std::unexpected(std::move(parsed.error()));

    auto& info = *parsed;
    return claude::CompletionRequest{
        .format = claude::ClientFormat::Chat,
        .model = std::move(info.model),
        .messages = std::move(info.messages),
        .stream = info.stream,
        .temperature = clamp_temperature(info.temperature),
        .top_p = info.top_p,
        .top_k = info.top_k,
        .max_tokens = info.max_tokens,
        .stop = std::move(info.stop),
        .images = std::move(info.images),
    };
}

} // namespace clewdr::gateway
