#include <catch2/catch_test_macros.hpp>

#include "clewdr/gateway/auth.hpp"

using namespace clewdr;
using namespace clewdr::gateway;

TEST_CASE("extract_bearer_token parses Authorization header", "[auth]") {
    SECTION("valid bearer token") {
        auto token = ApiKeyAuth::extract_bearer_token("Bearer abc123xyz");
        REQUIRE(token.has_value());
        CHECK(*token == "abc123xyz");
    }

    SECTION("scheme is case-insensitive") {
        auto token = ApiKeyAuth::extract_bearer_token("bearer abc");
        REQUIRE(token.has_value());
        CHECK(*token == "abc");
    }

    SECTION("surrounding spaces are dropped") {
        auto token = ApiKeyAuth::extract_bearer_token("Bearer   sk-1  ");
        REQUIRE(token.has_value());
        CHECK(*token == "sk-1");
    }

    SECTION("non-bearer scheme returns nullopt") {
        CHECK_FALSE(ApiKeyAuth::extract_bearer_token("Basic dXNlcjpwYXNz").has_value());
    }

    SECTION("empty or missing token returns nullopt") {
        CHECK_FALSE(ApiKeyAuth::extract_bearer_token("").has_value());
        CHECK_FALSE(ApiKeyAuth::extract_bearer_token("Bearer ").has_value());
        CHECK_FALSE(ApiKeyAuth::extract_bearer_token("Bearer     ").has_value());
    }
}

TEST_CASE("ApiKeyAuth with no keys is open", "[auth]") {
    ApiKeyAuth auth({"", "   "});
    CHECK(auth.is_open());
    CHECK(auth.check("", "").has_value());
    CHECK(auth.check("anything", "").has_value());
    CHECK(auth.verify("whatever").has_value());

    ApiKeyAuth defaulted;
    CHECK(defaulted.is_open());
}

TEST_CASE("ApiKeyAuth verifies configured keys", "[auth]") {
    ApiKeyAuth auth({" key-one ", "key-two"});
    REQUIRE_FALSE(auth.is_open());

    SECTION("verify") {
        CHECK(auth.verify("key-one").has_value());
        CHECK(auth.verify("key-two").has_value());

        auto wrong = auth.verify("key-three");
        REQUIRE_FALSE(wrong.has_value());
        CHECK(wrong.error().code() == ErrorCode::Unauthorized);
        CHECK(wrong.error().what() == "Invalid API key");

        CHECK_FALSE(auth.verify("key-on").has_value());
        CHECK_FALSE(auth.verify("").has_value());
    }

    SECTION("x-api-key header") {
        CHECK(auth.check("key-one", "").has_value());
        CHECK_FALSE(auth.check("nope", "").has_value());
    }

    SECTION("bearer token") {
        CHECK(auth.check("", "Bearer key-two").has_value());
        CHECK_FALSE(auth.check("", "Bearer nope").has_value());
    }

    SECTION("x-api-key takes precedence") {
        CHECK_FALSE(auth.check("nope", "Bearer key-two").has_value());
        CHECK(auth.check("key-one", "Bearer nope").has_value());
    }

    SECTION("missing credentials") {
        auto missing = auth.check("", "");
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code() == ErrorCode::Unauthorized);
        CHECK(missing.error().what() == "Missing API key");

        CHECK(auth.check("", "Basic abc").error().what() == "Missing API key");
    }
}
