#include <catch2/catch_test_macros.hpp>

#include "processing/EncodingValidator.hpp"

#include <string>

using trim::processing::EncodingIssue;
using trim::processing::validateUtf8;

TEST_CASE("validateUtf8 - accepts ASCII and multibyte text", "[encoding]")
{
    EncodingIssue issue;
    REQUIRE(validateUtf8("", issue));
    REQUIRE(validateUtf8("plain ascii \t\r\n", issue));
    REQUIRE(validateUtf8("こんにちは世界 ✓ 😀", issue));
}

TEST_CASE("validateUtf8 - rejects malformed sequences with their offset", "[encoding]")
{
    EncodingIssue issue;
    const std::string truncated = std::string("ok ") + "\xE3\x81";
    REQUIRE_FALSE(validateUtf8(truncated, issue));
    REQUIRE(issue.offset == 3);
    REQUIRE_FALSE(issue.reason.empty());

    const std::string latin1 = "caf\xE9";
    REQUIRE_FALSE(validateUtf8(latin1, issue));
    REQUIRE(issue.offset == 3);
}

TEST_CASE("validateUtf8 - rejects NUL bytes as binary content", "[encoding]")
{
    EncodingIssue issue;
    const std::string binary("ab\0cd", 5);
    REQUIRE_FALSE(validateUtf8(binary, issue));
    REQUIRE(issue.offset == 2);
}
