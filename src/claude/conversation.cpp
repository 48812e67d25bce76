#include "clewdr/claude/conversation.hpp"
#include "clewdr/claude/classifier.hpp"
#include "clewdr/core/logger.hpp"
#include "clewdr/core/utils.hpp"

#include <memory>
#include <mutex>

namespace clewdr::claude {

namespace {

auto has_pro_capability(const json& org) -> bool {
    if (!org.contains("capabilities") || !org["capabilities"].is_array()) return false;
    for (const auto& cap : org["capabilities"]) {
        if (!cap.is_string()) continue;
        auto c = cap.get<std::string>();
        if (c == "claude_pro" || c == "raven") return true;
    }
    return false;
}

} // anonymous namespace

ConversationClient::ConversationClient(boost::asio::io_context& ioc, const Config& config)
    : endpoint_(config.endpoint_url())
    , http_(ioc, infra::HttpClientConfig{
          .base_url = config.endpoint_url(),
          .timeout_seconds = config.upstream_timeout_seconds,
          .verify_ssl = config.verify_ssl,
          .proxy = config.proxy,
          .default_headers = {
              {"User-Agent", std::string(kUserAgent)},
          },
      })
{
    LOG_INFO("Claude.ai endpoint: {}", endpoint_);
}

auto ConversationClient::headers(const Session& session) const
    -> std::map<std::string, std::string> {
    return {
        {"Cookie", session.cookie.header()},
        {"Origin", endpoint_},
        {"Referer", endpoint_ + "/new"},
    };
}

auto ConversationClient::conversations_path(const Session& session) const -> std::string {
    return "/api/organizations/" + session.org_uuid() + "/chat_conversations";
}

void ConversationClient::refresh_cookie(Session& session, const infra::HttpResponse& response) {
    for (const auto& value : response.header_values("set-cookie")) {
        auto trimmed = utils::trim(value);
        if (!trimmed.starts_with("sessionKey=")) continue;

        auto fresh = pool::normalize_cookie(trimmed);
        if (!fresh.empty() && fresh != session.cookie.cookie) {
            LOG_DEBUG("Cookie rotated: {} -> {}",
                      utils::mask_secret(session.cookie.cookie), utils::mask_secret(fresh));
            session.cookie.cookie = std::move(fresh);
        }
    }
}

auto ConversationClient::bootstrap(Session& session) -> awaitable<VoidResult> {
    if (!session.cookie.org_uuid.empty() && session.cookie.is_pro.has_value()) {
        co_return ok_result();
    }

    auto res = co_await http_.get("/api/organizations", headers(session));
    if (!res) {
        co_return make_fail(res.error());
    }
    refresh_cookie(session, *res);
    if (auto ok = check_response(*res); !ok) {
        co_return make_fail(ok.error());
    }

    json orgs;
    try {
        orgs = json::parse(res->body);
    } catch (const json::exception& e) {
        co_return make_fail(make_error(ErrorCode::SerializationError,
                                       "Invalid organizations response", e.what()));
    }
    if (!orgs.is_array()) {
        co_return make_fail(make_error(ErrorCode::NoValidKey,
                                       "Organizations response is not a list"));
    }

    const json* chosen = nullptr;
    for (const auto& org : orgs) {
        if (!org.is_object() || !org.contains("uuid") || !org["uuid"].is_string()) continue;
        if (session.cookie.org_uuid.empty() ||
            org["uuid"].get<std::string>() == session.cookie.org_uuid) {
            chosen = &org;
            break;
        }
    }
    if (!chosen) {
        co_return make_fail(make_error(ErrorCode::NoValidKey,
                                       "No organization available for cookie"));
    }

    session.cookie.org_uuid = (*chosen)["uuid"].get<std::string>();
    session.cookie.is_pro = has_pro_capability(*chosen);
    LOG_INFO("Cookie {} bound to organization {} (pro: {})",
             utils::mask_secret(session.cookie.cookie), session.cookie.org_uuid,
             *session.cookie.is_pro);
    co_return ok_result();
}

auto ConversationClient::create(Session& session, std::string_view thinking_model)
    -> awaitable<VoidResult> {
    if (session.conv_uuid) {
        co_await delete_conversation(session);
    }

    auto uuid = utils::generate_uuid();
    json body = {{"uuid", uuid}, {"name", ""}};
    if (!thinking_model.empty()) {
        body["paprika_mode"] = "extended";
        body["model"] = std::string(thinking_model);
    }

    LOG_DEBUG("Creating conversation {}", uuid);
    auto res = co_await http_.post(conversations_path(session), body.dump(),
                                   "application/json", headers(session));
    if (!res) {
        co_return make_fail(res.error());
    }
    refresh_cookie(session, *res);
    if (auto ok = check_response(*res); !ok) {
        co_return make_fail(ok.error());
    }

    session.conv_uuid = std::move(uuid);
    session.conv_depth = 0;
    co_return ok_result();
}

auto ConversationClient::complete(Session& session, const RequestBody& body)
    -> awaitable<Result<std::string>> {
    auto collected = std::make_shared<std::string>();
    auto mtx = std::make_shared<std::mutex>();

    auto ok = co_await complete_stream(session, body,
        [collected, mtx](const char* data, size_t len) {
            std::lock_guard lock(*mtx);
            collected->append(data, len);
            return true;
        });
    if (!ok) {
        co_return make_fail(ok.error());
    }

    std::lock_guard lock(*mtx);
    co_return std::move(*collected);
}

auto ConversationClient::complete_stream(Session& session, const RequestBody& body,
                                         infra::HttpChunkCallback on_chunk)
    -> awaitable<VoidResult> {
    if (!session.conv_uuid) {
        co_return make_fail(make_error(ErrorCode::InternalError,
                                       "Completion requested without a conversation"));
    }

    auto path = conversations_path(session) + "/" + *session.conv_uuid + "/completion";
    auto hdrs = headers(session);
    hdrs["Accept"] = "text/event-stream";

    json payload = body;
    LOG_DEBUG("Sending completion to conversation {} ({} prompt bytes)",
              *session.conv_uuid, body.prompt.size());

    auto res = co_await http_.post_stream(path, payload.dump(), "application/json",
                                          hdrs, std::move(on_chunk));
    if (!res) {
        co_return make_fail(res.error());
    }
    refresh_cookie(session, *res);
    if (auto ok = check_response(*res); !ok) {
        co_return make_fail(ok.error());
    }

    ++session.conv_depth;
    co_return ok_result();
}

auto ConversationClient::delete_conversation(Session& session) -> awaitable<void> {
    if (!session.conv_uuid) co_return;

    auto uuid = std::move(*session.conv_uuid);
    session.conv_uuid.reset();

    auto res = co_await http_.delete_(conversations_path(session) + "/" + uuid,
                                      headers(session));
    if (!res) {
        LOG_WARN("Failed to delete conversation {}: {}", uuid, res.error().what());
        co_return;
    }
    refresh_cookie(session, *res);
    if (!res->is_success()) {
        LOG_WARN("Failed to delete conversation {}: HTTP {}", uuid, res->status);
        co_return;
    }
    LOG_DEBUG("Deleted conversation {}", uuid);
}

} // namespace clewdr::claude
