#include <catch2/catch_test_macros.hpp>
#include "core/utils.hpp"
#include "core/error.hpp"

using namespace clipstash;

TEST_CASE("truncate_utf8", "[utils]") {
    SECTION("Short text is untouched") {
        CHECK(utils::truncate_utf8("hello", 10) == "hello");
        CHECK(utils::truncate_utf8("hello", 5) == "hello");
    }

    SECTION("Long text is cut with an ellipsis counted in the limit") {
        CHECK(utils::truncate_utf8("abcdefghij", 8) == "abcde...");
    }

    SECTION("Multi-byte characters are never split") {
        // 6 code points, 2 bytes each
        const std::string text = "éééééé";
        const auto cut = utils::truncate_utf8(text, 5);
        CHECK(cut == "éé...");
    }

    SECTION("Emoji count as one character") {
        const std::string text = "😀😀😀";
        CHECK(utils::truncate_utf8(text, 3) == text);
    }
}

TEST_CASE("make_preview collapses whitespace", "[utils]") {
    CHECK(utils::make_preview("  line one\n\tline   two  ", 60) == "line one line two");
    CHECK(utils::make_preview("\n\n", 60).empty());
    CHECK(utils::make_preview("a b c d e f g h", 8) == "a b c...");
}

TEST_CASE("escape_json", "[utils]") {
    CHECK(utils::escape_json("plain") == "plain");
    CHECK(utils::escape_json("say \"hi\"") == "say \\\"hi\\\"");
    CHECK(utils::escape_json("a\\b") == "a\\\\b");
    CHECK(utils::escape_json("l1\nl2\tx") == "l1\\nl2\\tx");
    CHECK(utils::escape_json(std::string("\x01", 1)) == "\\u0001");
}

TEST_CASE("try_parse_int", "[utils]") {
    CHECK(utils::try_parse_int<int64_t>("42") == 42);
    CHECK(utils::try_parse_int<int64_t>("-7") == -7);
    CHECK_FALSE(utils::try_parse_int<int64_t>("").has_value());
    CHECK_FALSE(utils::try_parse_int<int64_t>("12abc").has_value());
    CHECK_FALSE(utils::try_parse_int<int>("99999999999").has_value());
}

TEST_CASE("String helpers", "[utils]") {
    CHECK(utils::trim("  x y \n") == "x y");
    CHECK(utils::trim("   ").empty());
    CHECK(utils::to_lower("WARN") == "warn");
    CHECK(utils::split("/a\n/b", '\n') == std::vector<std::string>{"/a", "/b"});
    CHECK(utils::bytes_to_hex(reinterpret_cast<const uint8_t*>("\x00\xff"), 2) == "00ff");
}

TEST_CASE("Timestamps round-trip through microseconds", "[utils]") {
    const auto now = utils::now();
    const auto us = utils::to_micros(now);
    const auto back = utils::from_micros(us);
    CHECK(utils::to_micros(back) == us);
    CHECK(std::chrono::abs(back - now) < std::chrono::microseconds{1});
}

TEST_CASE("Log level parsing", "[utils][log]") {
    CHECK(utils::log::parse_level("DEBUG") == utils::log::Level::DEBUG);
    CHECK(utils::log::parse_level("warning") == utils::log::Level::WARN);
    CHECK_FALSE(utils::log::parse_level("verbose").has_value());
}

TEST_CASE("Result carries values and errors", "[utils][error]") {
    auto good = Result<int>::ok(5);
    REQUIRE(good.is_ok());
    CHECK(good.value() == 5);

    auto bad = Result<int>::error(ErrorCategory::NOT_FOUND, "missing");
    REQUIRE(bad.is_error());
    CHECK(bad.error_category() == ErrorCategory::NOT_FOUND);
    CHECK(bad.error_message() == "missing");

    auto forwarded = Status::error_from(bad);
    CHECK(forwarded.error_category() == ErrorCategory::NOT_FOUND);
    CHECK(std::string(error_category_name(ErrorCategory::INTEGRITY_VIOLATION)) == "integrity_violation");
}
