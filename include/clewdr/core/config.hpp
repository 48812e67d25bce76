#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "clewdr/core/types.hpp"

// std::optional serializer for nlohmann/json; enables NLOHMANN_DEFINE macros
// to work with optional fields via j.value("key", default_val)
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace clewdr {

/// A configured session cookie. Accepts either a bare string or
/// {"cookie": "...", "org_uuid": "..."} in the config file.
struct CookieConfig {
    std::string cookie;
    std::optional<std::string> org_uuid;
};

void to_json(json& j, const CookieConfig& c);
void from_json(const json& j, CookieConfig& c);

auto default_models() -> std::vector<std::string>;

struct Config {
    std::string ip = "127.0.0.1";
    uint16_t port = 8484;
    std::vector<std::string> api_keys;
    std::vector<CookieConfig> cookies;

    std::string endpoint = "https://claude.ai";
    std::string rproxy;               // replaces endpoint when non-empty
    std::optional<std::string> proxy; // http://host:port for outbound calls
    bool verify_ssl = true;
    int upstream_timeout_seconds = 300;

    bool renew_always = true;
    bool retry_regenerate = false;
    bool prompt_as_attachment = false;
    std::string custom_prompt;
    std::string timezone = "America/New_York";
    std::vector<std::string> models = default_models();

    size_t max_connections = 256;
    std::string log_level = "info";
    std::optional<std::string> log_file;

    /// Upstream base URL without a trailing slash.
    [[nodiscard]] auto endpoint_url() const -> std::string;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, ip, port, api_keys, cookies,
    endpoint, rproxy, proxy, verify_ssl, upstream_timeout_seconds, renew_always,
    retry_regenerate, prompt_as_attachment, custom_prompt, timezone, models,
    max_connections, log_level, log_file)

auto load_config(const std::filesystem::path& path) -> Config;
auto default_config() -> Config;

/// Applies CLEWDR_* environment variables on top of a loaded config.
void apply_env_overrides(Config& config);

/// Resolves `${VAR}` environment variable references in a string.
/// Supports `$${VAR}` escape (literal `${VAR}`).
auto resolve_env_refs(std::string_view input) -> std::string;

/// Config as JSON with api keys and cookies masked.
auto redacted_config_json(const Config& config) -> json;

} // namespace clewdr
