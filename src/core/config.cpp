#include "clewdr/core/config.hpp"
#include "clewdr/core/logger.hpp"
#include "clewdr/core/utils.hpp"

#include <cstdlib>
#include <fstream>

namespace clewdr {

namespace {

/// Applies resolve_env_refs to every string leaf of a JSON document.
void resolve_env_refs_in(json& j) {
    if (j.is_string()) {
        j = resolve_env_refs(j.get<std::string>());
    } else if (j.is_object() || j.is_array()) {
        for (auto& child : j) {
            resolve_env_refs_in(child);
        }
    }
}

auto split_list(std::string_view value) -> std::vector<std::string> {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos <= value.size()) {
        auto next = value.find(',', pos);
        if (next == std::string_view::npos) next = value.size();
        auto item = utils::trim(value.substr(pos, next - pos));
        if (!item.empty()) out.push_back(std::move(item));
        pos = next + 1;
    }
    return out;
}

} // anonymous namespace

void to_json(json& j, const CookieConfig& c) {
    j = json{{"cookie", c.cookie}};
    if (c.org_uuid) j["org_uuid"] = *c.org_uuid;
}

void from_json(const json& j, CookieConfig& c) {
    if (j.is_string()) {
        c.cookie = j.get<std::string>();
        c.org_uuid.reset();
        return;
    }
    c.cookie = j.value("cookie", "");
    if (j.contains("org_uuid") && j["org_uuid"].is_string()) {
        c.org_uuid = j["org_uuid"].get<std::string>();
    }
}

auto default_models() -> std::vector<std::string> {
    return {
        "claude-3-7-sonnet-20250219",
        "claude-3-5-sonnet-20241022",
        "claude-3-5-haiku-20241022",
        "claude-3-opus-20240229",
        "claude-sonnet-4-20250514",
        "claude-opus-4-20250514",
    };
}

auto Config::endpoint_url() const -> std::string {
    std::string url = rproxy.empty() ? endpoint : rproxy;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        resolve_env_refs_in(j);

        auto config = j.get<Config>();
        std::erase_if(config.cookies, [](const CookieConfig& c) {
            if (utils::trim(c.cookie).empty()) {
                LOG_WARN("Config: dropping empty cookie entry");
                return true;
            }
            return false;
        });
        if (config.models.empty()) {
            config.models = default_models();
        }
        return config;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto default_config() -> Config {
    return Config{};
}

void apply_env_overrides(Config& config) {
    if (auto* val = std::getenv("CLEWDR_PORT")) {
        try {
            config.port = static_cast<uint16_t>(std::stoi(val));
        } catch (const std::exception&) {
            LOG_WARN("Ignoring invalid CLEWDR_PORT '{}'", val);
        }
    }
    if (auto* val = std::getenv("CLEWDR_IP")) {
        config.ip = val;
    }
    if (auto* val = std::getenv("CLEWDR_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("CLEWDR_ENDPOINT")) {
        config.endpoint = val;
    }
    if (auto* val = std::getenv("CLEWDR_API_KEY")) {
        for (auto& key : split_list(val)) {
            config.api_keys.push_back(std::move(key));
        }
    }
    if (auto* val = std::getenv("CLEWDR_COOKIE")) {
        for (auto& cookie : split_list(val)) {
            config.cookies.push_back(CookieConfig{std::move(cookie), std::nullopt});
        }
    }
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '$') {
            result += '$';
            i += 2;
            continue;
        }

        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                std::string var_name(input.substr(i + 2, close - i - 2));

                if (auto* val = std::getenv(var_name.c_str())) {
                    result += val;
                } else {
                    // Unresolved refs stay verbatim.
                    result += input.substr(i, close - i + 1);
                    LOG_DEBUG("Config: unresolved env ref ${{{}}}", var_name);
                }
                i = close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }

    return result;
}

auto redacted_config_json(const Config& config) -> json {
    json j = config;
    for (auto& key : j["api_keys"]) {
        key = utils::mask_secret(key.get<std::string>());
    }
    for (auto& cookie : j["cookies"]) {
        cookie["cookie"] = utils::mask_secret(cookie["cookie"].get<std::string>());
    }
    return j;
}

} // namespace clewdr
