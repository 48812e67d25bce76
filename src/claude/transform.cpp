#include "clewdr/claude/transform.hpp"
#include "clewdr/claude/prompts.hpp"
#include "clewdr/core/logger.hpp"
#include "clewdr/core/utils.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <utility>

namespace clewdr::claude {

namespace {

constexpr std::array<std::string_view, 2> kDefaultStops = {"\n\nHuman:", "\n\nAssistant:"};

auto role_label(Role role) -> std::string_view {
    switch (role) {
        case Role::User: return "Human";
        case Role::Assistant: return "Assistant";
        case Role::System: return "";
    }
    return "";
}

/// Case-insensitive search for a marker; npos when absent.
auto ifind(std::string_view haystack, std::string_view needle, size_t from = 0) -> size_t {
    if (needle.empty() || haystack.size() < needle.size()) return std::string_view::npos;
    for (size_t i = from; i + needle.size() <= haystack.size(); ++i) {
        if (utils::iequals(haystack.substr(i, needle.size()), needle)) return i;
    }
    return std::string_view::npos;
}

/// Span of a `[...]` payload opening at `open`: ends at the first `]`
/// followed by optional spaces and `|>`, all on one line. Returns the
/// payload length and the offset just past the closing `|>`.
auto marker_payload(std::string_view prompt, size_t open)
    -> std::optional<std::pair<size_t, size_t>> {
    for (size_t j = open + 1; j < prompt.size() && prompt[j] != '\n'; ++j) {
        if (prompt[j] != ']') continue;
        size_t k = j + 1;
        while (k < prompt.size() && prompt[k] == ' ') ++k;
        if (prompt.substr(k, 2) == "|>") {
            return std::make_pair(j + 1 - open, k + 2);
        }
    }
    return std::nullopt;
}

/// Payload of the second `<|{tag} [...]|>` marker, parsed as a string array.
auto second_marker_list(std::string_view prompt, std::string_view tag) -> std::vector<std::string> {
    std::string open = "<|" + std::string(tag);
    int seen = 0;
    size_t pos = 0;
    while ((pos = prompt.find(open, pos)) != std::string_view::npos) {
        size_t start = pos + open.size();
        while (start < prompt.size() && prompt[start] == ' ') ++start;

        auto span = start < prompt.size() && prompt[start] == '['
            ? marker_payload(prompt, start)
            : std::nullopt;
        if (!span) {
            ++pos;
            continue;
        }
        auto payload = prompt.substr(start, span->first);
        pos = span->second;
        if (++seen < 2) continue;

        try {
            auto parsed = json::parse(payload);
            std::vector<std::string> out;
            for (const auto& item : parsed) {
                if (!item.is_string()) return {};
                out.push_back(item.get<std::string>());
            }
            return out;
        } catch (const json::exception& e) {
            LOG_DEBUG("Malformed {} marker payload: {}", tag, e.what());
            return {};
        }
    }
    return {};
}

auto is_legacy_model(std::string_view model) -> bool {
    return utils::icontains(model, "claude-1")
        || utils::icontains(model, "claude-2")
        || utils::icontains(model, "claude-instant");
}

} // anonymous namespace

auto Attachment::from_text(std::string content) -> Attachment {
    Attachment a;
    a.file_size = content.size();
    a.extracted_content = std::move(content);
    return a;
}

void to_json(json& j, const Attachment& a) {
    j = json{
        {"extracted_content", a.extracted_content},
        {"file_name", a.file_name},
        {"file_type", a.file_type},
        {"file_size", a.file_size},
    };
}

void to_json(json& j, const RequestBody& b) {
    j = json{
        {"prompt", b.prompt},
        {"max_tokens_to_sample", b.max_tokens_to_sample},
        {"attachments", b.attachments},
        {"files", b.files},
        {"rendering_mode", b.rendering_mode},
        {"timezone", b.timezone},
    };
    if (!b.model.empty()) {
        j["model"] = b.model;
    }
}

auto build_prompt(const std::vector<Message>& messages, std::string_view system) -> std::string {
    std::vector<std::string> blocks;

    if (auto sys = utils::trim(system); !sys.empty()) {
        blocks.push_back(std::move(sys));
    }

    for (const auto& m : messages) {
        if (m.discard.value_or(false)) continue;
        if (m.role == Role::System && m.content == kNewChatMarker) continue;

        std::string content = m.strip.value_or(false) ? utils::trim(m.content) : m.content;

        std::string label(role_label(m.role));
        if (m.customname.value_or(false) && m.name && !m.name->empty()) {
            label = *m.name;
        }

        if (label.empty()) {
            blocks.push_back(std::move(content));
        } else {
            blocks.push_back(label + ": " + content);
        }
    }

    std::string prompt;
    for (size_t i = 0; i < blocks.size(); ++i) {
        if (i > 0) prompt += "\n\n";
        prompt += blocks[i];
    }
    return prompt;
}

auto extract_control_signals(std::string_view model, std::string_view prompt) -> ControlSignals {
    ControlSignals s;
    s.legacy = is_legacy_model(model);

    bool complete_api = ifind(prompt, "<|completeAPI|>") != std::string_view::npos;
    bool force_messages = prompt.find("<|messagesAPI|>") != std::string_view::npos;
    s.messages_api = !(s.legacy || complete_api) || force_messages;
    s.messages_log = prompt.find("<|messagesLog|>") != std::string_view::npos;
    s.fusion = s.messages_api && prompt.find("<|Fusion Mode|>") != std::string_view::npos;

    s.stop_set = second_marker_list(prompt, "stopSet");
    s.stop_revoke = second_marker_list(prompt, "stopRevoke");
    return s;
}

auto assemble_stop_sequences(const std::vector<std::string>& stop_set,
                             const std::vector<std::string>& client_stop,
                             const std::vector<std::string>& stop_revoke)
    -> std::vector<std::string> {
    std::vector<std::string> out;

    auto consider = [&](std::string_view entry) {
        auto trimmed = utils::trim(entry);
        if (trimmed.empty()) return;
        for (const auto& revoked : stop_revoke) {
            if (utils::iequals(utils::trim(revoked), trimmed)) return;
        }
        out.emplace_back(entry);
    };

    for (const auto& s : stop_set) consider(s);
    for (const auto& s : client_stop) consider(s);
    for (auto s : kDefaultStops) consider(s);
    return out;
}

auto strip_control_markers(std::string_view prompt) -> std::string {
    std::string out;
    out.reserve(prompt.size());

    size_t pos = 0;
    while (pos < prompt.size()) {
        auto open = prompt.find("<|", pos);
        if (open == std::string_view::npos) break;

        auto close = prompt.find("|>", open + 2);
        auto newline = prompt.find('\n', open);
        if (close == std::string_view::npos) break;
        if (newline != std::string_view::npos && newline < close) {
            // Not a marker on this line; keep the text and move on.
            out.append(prompt.substr(pos, open + 2 - pos));
            pos = open + 2;
            continue;
        }

        out.append(prompt.substr(pos, open - pos));
        pos = close + 2;
    }
    out.append(prompt.substr(std::min(pos, prompt.size())));
    return out;
}

auto transform_request(TransformInput input, const TransformOptions& options)
    -> std::optional<TransformedRequest> {
    auto raw = build_prompt(input.messages, input.system);
    auto signals = extract_control_signals(input.request_model, raw);

    auto prompt = utils::trim(strip_control_markers(raw));
    if (prompt.empty()) {
        return std::nullopt;
    }

    if (signals.messages_log) {
        LOG_INFO("Prompt ({} bytes):\n{}", prompt.size(), prompt);
    }
    if (signals.fusion) {
        LOG_INFO("Fusion mode requested");
    }

    TransformedRequest out;
    out.stop_sequences = assemble_stop_sequences(signals.stop_set, input.client_stop,
                                                 signals.stop_revoke);
    out.signals = std::move(signals);

    auto& body = out.body;
    body.model = std::move(input.upstream_model);
    body.max_tokens_to_sample = input.max_tokens;
    body.timezone = options.timezone;
    body.images = std::move(input.images);

    if (options.prompt_as_attachment) {
        body.attachments.push_back(Attachment::from_text(std::move(prompt)));
        body.prompt = options.custom_prompt;
    } else {
        body.prompt = std::move(prompt);
    }
    return out;
}

} // namespace clewdr::claude
