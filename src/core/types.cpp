#include "clewdr/core/types.hpp"

#include <stdexcept>

namespace clewdr {

namespace {

void read_flag(const json& j, const char* key, std::optional<bool>& out) {
    if (j.contains(key) && j[key].is_boolean()) {
        out = j[key].get<bool>();
    }
}

void write_flag(json& j, const char* key, const std::optional<bool>& in) {
    if (in) j[key] = *in;
}

/// Content is either a plain string or an array of typed blocks; text
/// blocks are joined with a newline, everything else is skipped here.
auto flatten_content(const json& content) -> std::string {
    if (content.is_string()) return content.get<std::string>();
    if (!content.is_array()) return {};

    std::string text;
    bool first = true;
    for (const auto& block : content) {
        if (block.is_string()) {
            if (!first) text += '\n';
            text += block.get<std::string>();
            first = false;
        } else if (block.is_object() && block.value("type", "") == "text") {
            if (!first) text += '\n';
            text += block.value("text", "");
            first = false;
        }
    }
    return text;
}

} // anonymous namespace

void to_json(json& j, const Message& m) {
    j = json{{"role", m.role}, {"content", m.content}};
    write_flag(j, "customname", m.customname);
    if (m.name) j["name"] = *m.name;
    write_flag(j, "strip", m.strip);
    write_flag(j, "jailbreak", m.jailbreak);
    write_flag(j, "main", m.main);
    write_flag(j, "discard", m.discard);
    write_flag(j, "merged", m.merged);
    write_flag(j, "personality", m.personality);
    write_flag(j, "scenario", m.scenario);
}

void from_json(const json& j, Message& m) {
    // The enum mapping falls back to its first entry for unknown strings.
    auto role = j.at("role").get<std::string>();
    if (role == "system") {
        m.role = Role::System;
    } else if (role == "user") {
        m.role = Role::User;
    } else if (role == "assistant") {
        m.role = Role::Assistant;
    } else {
        throw std::invalid_argument("Unknown message role '" + role + "'");
    }
    m.content = j.contains("content") ? flatten_content(j["content"]) : std::string{};
    read_flag(j, "customname", m.customname);
    if (j.contains("name") && j["name"].is_string()) {
        m.name = j["name"].get<std::string>();
    }
    read_flag(j, "strip", m.strip);
    read_flag(j, "jailbreak", m.jailbreak);
    read_flag(j, "main", m.main);
    read_flag(j, "discard", m.discard);
    read_flag(j, "merged", m.merged);
    read_flag(j, "personality", m.personality);
    read_flag(j, "scenario", m.scenario);
}

void to_json(json& j, const ImageSource& s) {
    j = json{{"type", s.type}, {"media_type", s.media_type}, {"data", s.data}};
}

void from_json(const json& j, ImageSource& s) {
    s.type = j.value("type", "base64");
    s.media_type = j.value("media_type", "");
    s.data = j.value("data", "");
}

auto extract_images(const json& messages) -> std::vector<ImageSource> {
    std::vector<ImageSource> images;
    if (!messages.is_array()) return images;

    for (const auto& msg : messages) {
        if (!msg.is_object() || !msg.contains("content") || !msg["content"].is_array()) {
            continue;
        }
        for (const auto& block : msg["content"]) {
            if (block.is_object() && block.value("type", "") == "image" &&
                block.contains("source") && block["source"].is_object()) {
                images.push_back(block["source"].get<ImageSource>());
            }
        }
    }
    return images;
}

auto to_string(const Reason& r) -> std::string {
    switch (r.kind) {
        case ReasonKind::Exhausted: return "exhausted(" + std::to_string(r.retry_after) + "s)";
        case ReasonKind::Restricted: return "restricted(" + std::to_string(r.retry_after) + "s)";
        case ReasonKind::NonPro: return "non-pro";
        case ReasonKind::Disabled: return "disabled";
        case ReasonKind::Banned: return "banned";
        case ReasonKind::Null: return "null";
    }
    return "unknown";
}

} // namespace clewdr
