// Unit tests for string parsing utilities
#include <catch2/catch_test_macros.hpp>
#include "util/string_parsing.hpp"
#include <limits>

using namespace parley::util;

TEST_CASE("SafeParseInt64 - valid inputs", "[util][string_parsing]") {
    SECTION("Parse valid positive integer") {
        auto result = SafeParseInt64("42", 0, 100);
        REQUIRE(result.has_value());
        REQUIRE(*result == 42);
    }

    SECTION("Parse valid negative integer") {
        auto result = SafeParseInt64("-50", -100, 100);
        REQUIRE(result.has_value());
        REQUIRE(*result == -50);
    }

    SECTION("Parse at bounds") {
        REQUIRE(SafeParseInt64("0", 0, 100) == int64_t{0});
        REQUIRE(SafeParseInt64("100", 0, 100) == int64_t{100});
    }
}

TEST_CASE("SafeParseInt64 - invalid inputs", "[util][string_parsing]") {
    SECTION("Empty string") {
        REQUIRE_FALSE(SafeParseInt64("", 0, 100).has_value());
    }

    SECTION("Non-numeric string") {
        REQUIRE_FALSE(SafeParseInt64("abc", 0, 100).has_value());
    }

    SECTION("Trailing characters") {
        REQUIRE_FALSE(SafeParseInt64("42x", 0, 100).has_value());
    }

    SECTION("Leading whitespace") {
        REQUIRE_FALSE(SafeParseInt64(" 42", 0, 100).has_value());
    }

    SECTION("Out of bounds") {
        REQUIRE_FALSE(SafeParseInt64("-1", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt64("101", 0, 100).has_value());
    }

    SECTION("Overflow") {
        REQUIRE_FALSE(SafeParseInt64("99999999999999999999", 0,
                                     std::numeric_limits<int64_t>::max())
                          .has_value());
    }
}

TEST_CASE("SafeParsePort", "[util][string_parsing]") {
    REQUIRE(SafeParsePort("5050") == uint16_t{5050});
    REQUIRE(SafeParsePort("1") == uint16_t{1});
    REQUIRE(SafeParsePort("65535") == uint16_t{65535});

    REQUIRE_FALSE(SafeParsePort("0").has_value());
    REQUIRE_FALSE(SafeParsePort("65536").has_value());
    REQUIRE_FALSE(SafeParsePort("-5050").has_value());
    REQUIRE_FALSE(SafeParsePort("50 50").has_value());
}

TEST_CASE("SafeParseInt64 - full range", "[util][string_parsing]") {
    const int64_t max = std::numeric_limits<int64_t>::max();
    const int64_t min = std::numeric_limits<int64_t>::min();

    REQUIRE(SafeParseInt64("9223372036854775807", min, max) == max);
    REQUIRE(SafeParseInt64("-9223372036854775808", min, max) == min);
    REQUIRE_FALSE(SafeParseInt64("9223372036854775808", min, max).has_value());
}

TEST_CASE("Hex encoding", "[util][string_parsing][hex]") {
    SECTION("HexStr is lowercase and zero padded") {
        std::vector<uint8_t> data{0x00, 0x0f, 0xab, 0xff};
        REQUIRE(HexStr(data) == "000fabff");
        REQUIRE(HexStr(std::vector<uint8_t>{}) == "");
    }

    SECTION("ParseHex accepts both cases") {
        auto parsed = ParseHex("00FfaB");
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == std::vector<uint8_t>{0x00, 0xff, 0xab});
    }

    SECTION("ParseHex rejects odd length and junk") {
        REQUIRE_FALSE(ParseHex("abc").has_value());
        REQUIRE_FALSE(ParseHex("zz").has_value());
        REQUIRE_FALSE(ParseHex("0x12").has_value());
    }

    SECTION("Empty string decodes to nothing") {
        auto parsed = ParseHex("");
        REQUIRE(parsed.has_value());
        REQUIRE(parsed->empty());
    }

    SECTION("IsValidHex") {
        REQUIRE(IsValidHex("deadBEEF"));
        REQUIRE_FALSE(IsValidHex(""));
        REQUIRE_FALSE(IsValidHex("dead beef"));
        REQUIRE_FALSE(IsValidHex("g0"));
    }
}

TEST_CASE("SplitHostPort", "[util][string_parsing]") {
    SECTION("IPv4") {
        auto result = SplitHostPort("127.0.0.1:5050");
        REQUIRE(result.has_value());
        REQUIRE(result->first == "127.0.0.1");
        REQUIRE(result->second == 5050);
    }

    SECTION("Bracketed IPv6") {
        auto result = SplitHostPort("[::1]:6000");
        REQUIRE(result.has_value());
        REQUIRE(result->first == "::1");
        REQUIRE(result->second == 6000);
    }

    SECTION("Malformed") {
        REQUIRE_FALSE(SplitHostPort("localhost").has_value());
        REQUIRE_FALSE(SplitHostPort(":5050").has_value());
        REQUIRE_FALSE(SplitHostPort("::1:5050").has_value());
        REQUIRE_FALSE(SplitHostPort("[::1]5050").has_value());
        REQUIRE_FALSE(SplitHostPort("[::1]:").has_value());
        REQUIRE_FALSE(SplitHostPort("host:0").has_value());
    }
}

TEST_CASE("Trim", "[util][string_parsing]") {
    REQUIRE(Trim("  /msg abc hi \t\n") == "/msg abc hi");
    REQUIRE(Trim("") == "");
    REQUIRE(Trim(" \t ") == "");
    REQUIRE(Trim("x") == "x");
}
