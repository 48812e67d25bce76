#include "clewdr/claude/completion.hpp"
#include "clewdr/claude/prompts.hpp"
#include "clewdr/claude/retry.hpp"
#include "clewdr/core/logger.hpp"
#include "clewdr/core/utils.hpp"
#include "clewdr/core/version.hpp"

#include <algorithm>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

namespace clewdr::claude {

namespace net = boost::asio;

namespace {

auto format_name(ClientFormat f) -> std::string_view {
    return f == ClientFormat::Chat ? "chat" : "messages";
}

auto elapsed_ms(std::chrono::steady_clock::time_point started) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
}

auto json_response(const json& j) -> CompletionResponse {
    return CompletionResponse{.status = 200, .content_type = "application/json", .body = j.dump()};
}

auto chat_message_response(std::string_view content) -> CompletionResponse {
    json message = {{"content", content}};
    json choice = {{"message", message}};
    return json_response({{"choices", json::array({choice})}});
}

auto is_test_message(const std::vector<Message>& messages) -> bool {
    return messages.size() == 1 && messages.front() == Message{.role = Role::User, .content = "Hi"};
}

/// "claude-3-opus--force " -> "claude-3-opus"
auto upstream_model_name(std::string_view model) -> std::string {
    auto name = std::string(model);
    if (auto pos = name.find("--force"); pos != std::string::npos) {
        name.erase(pos, 7);
    }
    return utils::trim(name);
}

} // anonymous namespace

void remember_turn(pool::SessionMemory& memory,
                   const std::vector<Message>& messages,
                   const std::optional<std::string>& stop_sequence) {
    memory.prev_impersonated = stop_sequence && utils::icontains(*stop_sequence, "Human");

    auto group = PromptsGroup::find(messages);
    if (group.last_assistant && group.last_assistant->name) {
        memory.conv_char = group.last_assistant->name;
    }
}

auto render_text(ClientFormat format, std::string_view model, std::string_view text,
                 std::string_view stop_reason) -> CompletionResponse {
    if (format == ClientFormat::Chat) {
        return json_response({
            {"id", "chatcmpl-" + utils::generate_id(24)},
            {"object", "chat.completion"},
            {"created", utils::timestamp_s()},
            {"model", model},
            {"choices", json::array({{
                {"index", 0},
                {"message", {{"role", "assistant"}, {"content", text}}},
                {"finish_reason", stop_reason == "max_tokens" ? "length" : "stop"},
            }})},
        });
    }
    return json_response({
        {"id", "msg_" + utils::generate_id(24)},
        {"type", "message"},
        {"role", "assistant"},
        {"model", model},
        {"content", text},
        {"stop_reason", stop_reason},
    });
}

auto render_error(const CompletionRequest& request, const Error& error) -> CompletionResponse {
    if (request.stream) {
        return CompletionResponse{
            .status = 200,
            .content_type = "text/event-stream",
            .body = error_frame(request.format, error),
        };
    }
    auto text = "Error: " + error.what();
    if (request.format == ClientFormat::Chat) {
        return chat_message_response(text);
    }
    return json_response({{"role", "assistant"}, {"content", text}});
}

CompletionService::CompletionService(net::io_context& ioc, const Config& config,
                                     pool::CookiePool& pool)
    : ioc_(ioc)
    , config_(config)
    , pool_(pool)
    , client_(std::make_shared<ConversationClient>(ioc, config)) {}

auto CompletionService::short_circuit(const CompletionRequest& request) const
    -> std::optional<CompletionResponse> {
    if (request.stream) return std::nullopt;

    if (is_test_message(request.messages)) {
        LOG_INFO("Answering connection test locally");
        if (request.format == ClientFormat::Chat) {
            return chat_message_response(kTitle);
        }
        return json_response({{"role", "assistant"}, {"content", kTitle}});
    }

    if (request.format == ClientFormat::Chat && !request.messages.empty() &&
        request.messages.front().content.starts_with(kOutfitPromptPrefix)) {
        return chat_message_response("neutral");
    }
    return std::nullopt;
}

auto CompletionService::validate(const CompletionRequest& request) const -> VoidResult {
    if (request.messages.empty()) {
        return std::unexpected(make_error(ErrorCode::WrongCompletionFormat,
                                          "Request has no messages"));
    }
    bool known = std::ranges::find(config_.models, request.model) != config_.models.end();
    if (!known && request.model.find("claude-") == std::string::npos) {
        return std::unexpected(make_error(ErrorCode::InvalidModel,
                                          "Invalid model", request.model));
    }
    return {};
}

auto CompletionService::handle(CompletionRequest request) -> net::awaitable<CompletionResponse> {
    auto started = std::chrono::steady_clock::now();
    LOG_INFO("Request received: endpoint={}, stream={}, model={}, messages={}",
             format_name(request.format), request.stream, request.model,
             request.messages.size());

    if (auto canned = short_circuit(request)) {
        co_return std::move(*canned);
    }

    if (auto ok = validate(request); !ok) {
        LOG_WARN("Rejected request: {}", ok.error().what());
        co_return render_error(request, ok.error());
    }

    auto lease = co_await pool_.acquire();
    if (!lease) {
        LOG_WARN("No cookie for request: {}", lease.error().what());
        co_return render_error(request, lease.error());
    }

    auto session = std::make_unique<Session>();
    session->cookie = std::move(*lease);
    session->returns = pool_.return_channel();
    CleanupGuard guard(ioc_.get_executor(), std::move(session), client_);

    auto prepared = co_await prepare(guard, request);
    if (!prepared) {
        auto err = std::move(prepared.error());
        co_await guard.finish(cookie_reason(err));
        LOG_WARN("Request failed after {} ms: {}", elapsed_ms(started), err.what());
        co_return render_error(request, err);
    }

    if (!prepared->has_value()) {
        guard.defer();
        co_return render_text(request.format, request.model, kEmptyPromptReply, "end_turn");
    }
    auto transformed = std::move(**prepared);

    if (request.stream) {
        auto forwarder = std::make_shared<StreamForwarder>(ioc_, StreamOptions{
            .format = request.format,
            .messages_api = transformed.signals.messages_api,
            .model = request.model,
            .stop_sequences = transformed.stop_sequences,
        });
        auto channel = forwarder->channel();
        net::co_spawn(ioc_,
                      forward(std::move(guard), client_, std::move(forwarder),
                              std::move(transformed.body), std::move(request.messages), started),
                      net::detached);
        co_return CompletionResponse{
            .status = 200,
            .content_type = "text/event-stream",
            .stream = std::move(channel),
        };
    }

    auto body = co_await client_->complete(guard.session(), transformed.body);
    if (!body) {
        auto err = std::move(body.error());
        co_await guard.finish(cookie_reason(err));
        LOG_WARN("Request failed after {} ms: {}", elapsed_ms(started), err.what());
        co_return render_error(request, err);
    }

    auto result = aggregate_completion(*body, transformed.stop_sequences);
    if (result.error) {
        auto err = make_error(ErrorCode::UpstreamError, "Upstream stream error", *result.error);
        co_await guard.finish(std::nullopt);
        LOG_WARN("Request failed after {} ms: {}", elapsed_ms(started), err.what());
        co_return render_error(request, err);
    }

    remember_turn(guard.session().memory(), request.messages, result.stop_sequence);
    guard.defer();
    LOG_INFO("Request finished in {} ms ({} bytes, stop_reason={})",
             elapsed_ms(started), result.text.size(), result.stop_reason);
    co_return render_text(request.format, request.model, result.text, result.stop_reason);
}

auto CompletionService::prepare(CleanupGuard& guard, const CompletionRequest& request)
    -> net::awaitable<Result<std::optional<TransformedRequest>>> {
    auto& session = guard.session();

    if (auto ok = co_await client_->bootstrap(session); !ok) {
        co_return make_fail(ok.error());
    }

    if (session.is_pro()) {
        session.model = upstream_model_name(request.model);
    } else {
        session.model.reset();
    }

    auto decision = decide(request.messages, session.memory(), session.conv_uuid.has_value(),
                           RetryPolicy{
                               .renew_always = config_.renew_always,
                               .retry_regenerate = config_.retry_regenerate,
                           });
    if (is_current(decision.strategy) && session.conv_uuid) {
        LOG_DEBUG("Continuing conversation {}", *session.conv_uuid);
    } else {
        auto thinking_model = request.thinking ? upstream_model_name(request.model) : std::string{};
        if (auto ok = co_await client_->create(session, thinking_model); !ok) {
            co_return make_fail(ok.error());
        }
    }

    co_return transform_request(
        TransformInput{
            .messages = request.messages,
            .system = request.system,
            .request_model = request.model,
            .upstream_model = session.model.value_or(""),
            .max_tokens = request.max_tokens,
            .client_stop = request.stop,
            .images = request.images,
        },
        TransformOptions{
            .prompt_as_attachment = config_.prompt_as_attachment,
            .custom_prompt = config_.custom_prompt,
            .timezone = config_.timezone,
        });
}

auto CompletionService::forward(CleanupGuard guard,
                                std::shared_ptr<ConversationClient> client,
                                std::shared_ptr<StreamForwarder> forwarder,
                                RequestBody body,
                                std::vector<Message> messages,
                                Started started) -> net::awaitable<void> {
    auto result = co_await client->complete_stream(
        guard.session(), body,
        [forwarder](const char* data, size_t length) {
            return forwarder->on_chunk(data, length);
        });

    if (!result) {
        if (forwarder->state() == ForwardState::Cancelled) {
            LOG_INFO("Stream cancelled by client after {} ms", elapsed_ms(started));
            co_await guard.finish(std::nullopt);
            co_return;
        }
        auto err = std::move(result.error());
        co_await guard.finish(cookie_reason(err));
        co_await forwarder->fail(std::move(err));
        LOG_WARN("Stream failed after {} ms", elapsed_ms(started));
        co_return;
    }

    remember_turn(guard.session().memory(), messages, forwarder->transformer().stop_sequence());
    co_await forwarder->complete();
    co_await guard.finish(std::nullopt);
    LOG_INFO("Stream finished in {} ms ({})", elapsed_ms(started),
             to_string(forwarder->state()));
}

} // namespace clewdr::claude
