#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "clewdr/core/types.hpp"

namespace clewdr::claude {

/// Behaviour flags scanned from the assembled prompt.
struct ControlSignals {
    bool legacy = false;
    bool messages_api = true;
    bool messages_log = false;
    bool fusion = false;
    std::vector<std::string> stop_set;
    std::vector<std::string> stop_revoke;
};

/// Claude.ai text attachment.
struct Attachment {
    std::string extracted_content;
    std::string file_name = "paste.txt";
    std::string file_type = "txt";
    uint64_t file_size = 0;

    static auto from_text(std::string content) -> Attachment;
};

void to_json(json& j, const Attachment& a);

/// Body of the upstream completion call.
struct RequestBody {
    std::string prompt;
    std::string model;  // empty: let the web app pick
    uint64_t max_tokens_to_sample = 0;
    std::vector<Attachment> attachments;
    std::vector<std::string> files;
    std::string rendering_mode = "raw";
    std::string timezone;
    std::vector<ImageSource> images;  // kept for the caller, never serialised
};

void to_json(json& j, const RequestBody& b);

struct TransformOptions {
    bool prompt_as_attachment = false;
    std::string custom_prompt;
    std::string timezone = "America/New_York";
};

/// Everything the transformer needs from one inbound request.
struct TransformInput {
    std::vector<Message> messages;
    std::string system;
    std::string request_model;   // as sent by the client
    std::string upstream_model;  // empty for free accounts
    uint64_t max_tokens = 0;
    std::vector<std::string> client_stop;
    std::vector<ImageSource> images;
};

struct TransformedRequest {
    RequestBody body;
    ControlSignals signals;
    std::vector<std::string> stop_sequences;
};

/// Renders messages into the "Human: ... \n\nAssistant: ..." prompt.
auto build_prompt(const std::vector<Message>& messages, std::string_view system) -> std::string;

auto extract_control_signals(std::string_view model, std::string_view prompt) -> ControlSignals;

/// stop_set ++ client ++ defaults, minus empty and revoked entries.
auto assemble_stop_sequences(const std::vector<std::string>& stop_set,
                             const std::vector<std::string>& client_stop,
                             const std::vector<std::string>& stop_revoke)
    -> std::vector<std::string>;

/// Removes every single-line <|...|> marker.
auto strip_control_markers(std::string_view prompt) -> std::string;

/// Full pipeline. Returns nullopt when nothing is left to send.
auto transform_request(TransformInput input, const TransformOptions& options)
    -> std::optional<TransformedRequest>;

} // namespace clewdr::claude
