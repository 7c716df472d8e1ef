#include <catch2/catch_test_macros.hpp>
#include "sentinel/token.hpp"

using namespace sentinel;

TEST_CASE("Generated tokens have the agent format", "[token]")
{
    auto a = token::generate();
    auto b = token::generate();
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(a->size() == 4 + 48);
    REQUIRE(a->starts_with("agt_"));
    REQUIRE(token::is_valid_format(*a));
    REQUIRE(*a != *b);
}

TEST_CASE("Token format validation", "[token]")
{
    std::string hex48(48, 'a');
    REQUIRE(token::is_valid_format("agt_" + hex48));
    REQUIRE_FALSE(token::is_valid_format("agt_" + std::string(47, 'a')));
    REQUIRE_FALSE(token::is_valid_format("agt_" + std::string(48, 'A')));
    REQUIRE_FALSE(token::is_valid_format("tok_" + hex48));
    REQUIRE_FALSE(token::is_valid_format(""));
}

TEST_CASE("Constant-time comparison", "[token]")
{
    REQUIRE(token::constant_time_equals("abc", "abc"));
    REQUIRE_FALSE(token::constant_time_equals("abc", "abd"));
    REQUIRE_FALSE(token::constant_time_equals("abc", "abcd"));
    REQUIRE(token::constant_time_equals("", ""));
}
