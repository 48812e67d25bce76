#include <catch2/catch_test_macros.hpp>

#include "clewdr/core/utils.hpp"

using namespace clewdr;

TEST_CASE("generate_id produces expected length", "[utils]") {
    SECTION("default length") {
        REQUIRE(utils::generate_id().size() == 16);
    }

    SECTION("custom length") {
        REQUIRE(utils::generate_id(24).size() == 24);
    }

    SECTION("contains only lowercase alphanumeric characters") {
        for (char c : utils::generate_id(100)) {
            bool valid = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
            CHECK(valid);
        }
    }

    SECTION("successive calls differ") {
        CHECK(utils::generate_id(16) != utils::generate_id(16));
    }
}

TEST_CASE("generate_uuid produces valid format", "[utils]") {
    auto uuid = utils::generate_uuid();
    REQUIRE(uuid.size() == 36);
    CHECK(uuid[8] == '-');
    CHECK(uuid[13] == '-');
    CHECK(uuid[18] == '-');
    CHECK(uuid[23] == '-');
    CHECK(uuid != utils::generate_uuid());
}

TEST_CASE("trim removes whitespace", "[utils]") {
    CHECK(utils::trim("  hello  ") == "hello");
    CHECK(utils::trim("\t\nhello\r\n") == "hello");
    CHECK(utils::trim("hello") == "hello");
    CHECK(utils::trim("   ") == "");
    CHECK(utils::trim("") == "");
}

TEST_CASE("case-insensitive helpers", "[utils]") {
    CHECK(utils::to_lower("HeLLo") == "hello");
    CHECK(utils::iequals("Human:", "human:"));
    CHECK_FALSE(utils::iequals("Human", "Human:"));
    CHECK(utils::icontains("Your account has been DISABLED", "disabled"));
    CHECK_FALSE(utils::icontains("ok", "disabled"));
    CHECK(utils::icontains("anything", ""));
}

TEST_CASE("truncate_utf8 keeps sequences whole", "[utils]") {
    CHECK(utils::truncate_utf8("abcdef", 3) == "abc");
    CHECK(utils::truncate_utf8("abc", 10) == "abc");

    // "é" is two bytes; cutting in the middle backs off to before it.
    std::string text = "a\xC3\xA9z";
    CHECK(utils::truncate_utf8(text, 2) == "a");
    CHECK(utils::truncate_utf8(text, 3) == "a\xC3\xA9");
}

TEST_CASE("mask_secret hides the middle", "[utils]") {
    CHECK(utils::mask_secret("short") == "*****");
    CHECK(utils::mask_secret("sk-ant-sid01-abcdefghijkl") == "sk-ant...ijkl");
}

TEST_CASE("timestamps are consistent", "[utils]") {
    auto s = utils::timestamp_s();
    auto ms = utils::timestamp_ms();
    CHECK(s > 1'600'000'000);
    CHECK(ms / 1000 >= s);
}
