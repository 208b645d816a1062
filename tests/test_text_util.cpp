#include <doctest/doctest.h>
#include "meshbot/text_util.hpp"

using namespace meshbot;

TEST_CASE("clamp keeps short text untouched") {
    CHECK(clamp("pong", 220) == "pong");
    CHECK(clamp("abc", 3) == "abc");
    CHECK(clamp("", 5) == "");
}

TEST_CASE("clamp cuts to exactly n code points with the marker last") {
    const std::string out = clamp("hello world", 5);
    CHECK(out == std::string("hell") + ELLIPSIS);
    CHECK(utf8_length(out) == 5);

    CHECK(clamp("abcd", 1) == ELLIPSIS);
    CHECK(clamp("abcd", 0) == "");
}

TEST_CASE("clamp never splits a multi-byte sequence") {
    // "žluťoučký kůň" - 13 code points, several two-byte ones
    const std::string s = "\xC5\xBElu\xC5\xA5ou\xC4\x8Dk\xC3\xBD k\xC5\xAF\xC5\x88";
    REQUIRE(utf8_length(s) == 13);

    const std::string out = clamp(s, 4);
    CHECK(out == std::string("\xC5\xBElu") + ELLIPSIS);
    CHECK(utf8_length(out) == 4);
}

TEST_CASE("trim, to_lower, iequals, split_ws, join") {
    CHECK(trim("  !ping \t\n") == "!ping");
    CHECK(trim("   ") == "");
    CHECK(to_lower("BoB Base") == "bob base");
    CHECK(iequals("Bob", "bOB"));
    CHECK_FALSE(iequals("Bob", "Bobby"));

    auto parts = split_ws("  msg   BOB\thello  there ");
    REQUIRE(parts.size() == 4);
    CHECK(parts[0] == "msg");
    CHECK(parts[1] == "BOB");
    CHECK(parts[3] == "there");
    CHECK(split_ws(" \t ").empty());

    CHECK(join({"a", "b", "c"}, ", ") == "a, b, c");
    CHECK(join({}, ", ") == "");
}

TEST_CASE("format_duration omits zero parts but always shows seconds") {
    CHECK(format_duration(0) == "0s");
    CHECK(format_duration(59) == "59s");
    CHECK(format_duration(3600) == "1h 0s");
    CHECK(format_duration(90061) == "1d 1h 1m 1s");
    CHECK(format_duration(2 * 86400 + 5) == "2d 5s");
}

TEST_CASE("format_age picks the two most useful units") {
    CHECK(format_age(0) == "0s");
    CHECK(format_age(59) == "59s");
    CHECK(format_age(60) == "1m");
    CHECK(format_age(3599) == "59m");
    CHECK(format_age(3661) == "1h 1m");
    CHECK(format_age(25 * 3600) == "1d 1h");
}

TEST_CASE("format_percent and format_number") {
    CHECK(format_percent(12.0) == "12%");
    CHECK(format_percent(12.5) == "12.5%");
    CHECK(format_percent(7.46) == "7.5%");
    CHECK(format_percent(std::nullopt) == "?");

    CHECK(format_number(6.25) == "6.25");
    CHECK(format_number(-97) == "-97");
}
