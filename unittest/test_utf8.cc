#include <doctest/doctest.h>
#include <pngchunk/utf8.hh>

#include <string>

using namespace pngchunk;

namespace {
    std::optional<std::size_t> check(const std::string& s) {
        return utf8_invalid_offset(s.data(), s.size());
    }
}

TEST_CASE("utf8 validation") {
    SUBCASE("well-formed input") {
        CHECK_FALSE(check("").has_value());
        CHECK_FALSE(check("plain ascii").has_value());
        CHECK_FALSE(check("\xC2\xA9").has_value());                 // U+00A9
        CHECK_FALSE(check("\xDF\xBF").has_value());                 // U+07FF
        CHECK_FALSE(check("\xE0\xA0\x80").has_value());             // U+0800
        CHECK_FALSE(check("\xED\x9F\xBF").has_value());             // U+D7FF
        CHECK_FALSE(check("\xEE\x80\x80").has_value());             // U+E000
        CHECK_FALSE(check("\xEF\xBF\xBF").has_value());             // U+FFFF
        CHECK_FALSE(check("\xF0\x90\x80\x80").has_value());         // U+10000
        CHECK_FALSE(check("\xF4\x8F\xBF\xBF").has_value());         // U+10FFFF
        CHECK(is_valid_utf8("abc", 3));
    }

    SUBCASE("embedded NUL is valid") {
        std::string s("a\0b", 3);
        CHECK_FALSE(check(s).has_value());
    }

    SUBCASE("stray continuation bytes") {
        CHECK(check("\x80") == std::optional<std::size_t>(0));
        CHECK(check("ab\xBF") == std::optional<std::size_t>(2));
    }

    SUBCASE("overlong encodings") {
        CHECK(check("\xC0\xAF") == std::optional<std::size_t>(0));
        CHECK(check("\xC1\xBF") == std::optional<std::size_t>(0));
        CHECK(check("\xE0\x9F\xBF") == std::optional<std::size_t>(0));
        CHECK(check("\xF0\x8F\xBF\xBF") == std::optional<std::size_t>(0));
    }

    SUBCASE("surrogates and out of range") {
        CHECK(check("\xED\xA0\x80") == std::optional<std::size_t>(0));     // U+D800
        CHECK(check("\xED\xBF\xBF") == std::optional<std::size_t>(0));     // U+DFFF
        CHECK(check("\xF4\x90\x80\x80") == std::optional<std::size_t>(0)); // U+110000
        CHECK(check("\xF5\x80\x80\x80") == std::optional<std::size_t>(0));
        CHECK(check("x\xFF") == std::optional<std::size_t>(1));
        CHECK(check("x\xFE") == std::optional<std::size_t>(1));
    }

    SUBCASE("truncated sequences") {
        CHECK(check("ok\xE2\x82") == std::optional<std::size_t>(2));
        CHECK(check("\xF0\x9F\x98") == std::optional<std::size_t>(0));
        CHECK(check("\xC3") == std::optional<std::size_t>(0));
    }

    SUBCASE("bad continuation in the middle") {
        CHECK(check("\xE2\x28\xA1") == std::optional<std::size_t>(0));
        CHECK(check("abc\xF0\x9F\x28\x80") == std::optional<std::size_t>(3));
    }
}
