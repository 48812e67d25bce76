#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "clewdr/core/config.hpp"

namespace fs = std::filesystem;

namespace {

auto write_temp(const std::string& name, const std::string& content) -> fs::path {
    auto path = fs::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path;
}

} // anonymous namespace

TEST_CASE("default_config returns sane defaults", "[config]") {
    auto cfg = clewdr::default_config();

    CHECK(cfg.ip == "127.0.0.1");
    CHECK(cfg.port == 8484);
    CHECK(cfg.endpoint == "https://claude.ai");
    CHECK(cfg.rproxy.empty());
    CHECK(cfg.renew_always == true);
    CHECK(cfg.retry_regenerate == false);
    CHECK(cfg.prompt_as_attachment == false);
    CHECK(cfg.timezone == "America/New_York");
    CHECK(cfg.log_level == "info");
    CHECK_FALSE(cfg.models.empty());
    CHECK(cfg.cookies.empty());
    CHECK(cfg.api_keys.empty());
}

TEST_CASE("endpoint_url prefers rproxy and strips trailing slashes", "[config]") {
    clewdr::Config cfg;
    CHECK(cfg.endpoint_url() == "https://claude.ai");

    cfg.endpoint = "https://claude.ai/";
    CHECK(cfg.endpoint_url() == "https://claude.ai");

    cfg.rproxy = "http://127.0.0.1:9000//";
    CHECK(cfg.endpoint_url() == "http://127.0.0.1:9000");
}

TEST_CASE("load_config parses JSON file", "[config]") {
    auto path = write_temp("clewdr_test_config.json", R"({
        "port": 9999,
        "api_keys": ["k1"],
        "cookies": [
            "sessionKey=sk-ant-sid01-aaaa",
            {"cookie": "sk-ant-sid01-bbbb", "org_uuid": "org-1"},
            ""
        ],
        "renew_always": false,
        "log_level": "debug"
    })");

    auto cfg = clewdr::load_config(path);

    CHECK(cfg.port == 9999);
    CHECK(cfg.api_keys == std::vector<std::string>{"k1"});
    REQUIRE(cfg.cookies.size() == 2);
    CHECK(cfg.cookies[0].cookie == "sessionKey=sk-ant-sid01-aaaa");
    CHECK_FALSE(cfg.cookies[0].org_uuid.has_value());
    CHECK(cfg.cookies[1].org_uuid == "org-1");
    CHECK(cfg.renew_always == false);
    CHECK(cfg.log_level == "debug");
    // Unspecified fields keep defaults
    CHECK(cfg.endpoint == "https://claude.ai");
    CHECK(cfg.timezone == "America/New_York");

    fs::remove(path);
}

TEST_CASE("load_config falls back to defaults", "[config]") {
    SECTION("missing file") {
        auto cfg = clewdr::load_config("/nonexistent/clewdr.json");
        CHECK(cfg.port == 8484);
    }

    SECTION("malformed file") {
        auto path = write_temp("clewdr_bad_config.json", "{ not json");
        auto cfg = clewdr::load_config(path);
        CHECK(cfg.port == 8484);
        fs::remove(path);
    }
}

TEST_CASE("load_config resolves env refs", "[config]") {
    setenv("CLEWDR_TEST_COOKIE", "sk-ant-sid01-from-env", 1);
    auto path = write_temp("clewdr_env_config.json",
                           R"({"cookies": ["${CLEWDR_TEST_COOKIE}"]})");

    auto cfg = clewdr::load_config(path);
    REQUIRE(cfg.cookies.size() == 1);
    CHECK(cfg.cookies[0].cookie == "sk-ant-sid01-from-env");

    fs::remove(path);
    unsetenv("CLEWDR_TEST_COOKIE");
}

TEST_CASE("resolve_env_refs", "[config]") {
    setenv("CLEWDR_TEST_A", "aaa", 1);

    CHECK(clewdr::resolve_env_refs("x=${CLEWDR_TEST_A}") == "x=aaa");
    CHECK(clewdr::resolve_env_refs("${CLEWDR_NOT_SET_12345}") == "${CLEWDR_NOT_SET_12345}");
    CHECK(clewdr::resolve_env_refs("$${CLEWDR_TEST_A}") == "${CLEWDR_TEST_A}");
    CHECK(clewdr::resolve_env_refs("plain") == "plain");

    unsetenv("CLEWDR_TEST_A");
}

TEST_CASE("apply_env_overrides", "[config]") {
    setenv("CLEWDR_PORT", "7000", 1);
    setenv("CLEWDR_API_KEY", "a, b", 1);
    setenv("CLEWDR_COOKIE", "sk-1,sk-2", 1);

    clewdr::Config cfg;
    clewdr::apply_env_overrides(cfg);

    CHECK(cfg.port == 7000);
    CHECK(cfg.api_keys == std::vector<std::string>{"a", "b"});
    REQUIRE(cfg.cookies.size() == 2);
    CHECK(cfg.cookies[1].cookie == "sk-2");

    unsetenv("CLEWDR_PORT");
    unsetenv("CLEWDR_API_KEY");
    unsetenv("CLEWDR_COOKIE");
}

TEST_CASE("redacted_config_json masks secrets", "[config]") {
    clewdr::Config cfg;
    cfg.api_keys = {"super-secret-api-key-123"};
    cfg.cookies = {{"sk-ant-REDACTED", std::nullopt}};

    auto j = clewdr::redacted_config_json(cfg);
    auto dumped = j.dump();

    CHECK(dumped.find("super-secret-api-key-123") == std::string::npos);
    CHECK(dumped.find("sk-ant-REDACTED") == std::string::npos);
    CHECK(j["api_keys"][0] == "super-...-123");
    CHECK(j["port"] == 8484);
}
