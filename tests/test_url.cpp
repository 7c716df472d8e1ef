#include <catch2/catch_test_macros.hpp>
#include "sentinel/url.hpp"

using namespace sentinel;

TEST_CASE("Url parses scheme, host, port, path and query", "[url]")
{
    auto url = Url::parse("HTTPS://API.Example.com:8443/v1/items?x=1#frag");
    REQUIRE(url.has_value());
    REQUIRE(url->scheme == "https");
    REQUIRE(url->host == "api.example.com");
    REQUIRE(url->port == "8443");
    REQUIRE(url->path == "/v1/items");
    REQUIRE(url->query == "x=1");
    REQUIRE(url->host_header() == "api.example.com:8443");
    REQUIRE(url->target() == "/v1/items?x=1");
}

TEST_CASE("Url defaults", "[url]")
{
    auto url = Url::parse("https://api.example.com");
    REQUIRE(url.has_value());
    REQUIRE(url->path == "/");
    REQUIRE(url->port_or_default() == "443");
    REQUIRE(url->host_header() == "api.example.com");

    auto plain = Url::parse("http://127.0.0.1:9000");
    REQUIRE(plain.has_value());
    REQUIRE_FALSE(plain->is_https());
    REQUIRE(plain->port_or_default() == "9000");
}

TEST_CASE("Url rejects other schemes and malformed input", "[url]")
{
    REQUIRE_FALSE(Url::parse("ftp://example.com/").has_value());
    REQUIRE_FALSE(Url::parse("example.com/path").has_value());
    REQUIRE_FALSE(Url::parse("https://user@example.com/").has_value());
    REQUIRE_FALSE(Url::parse("https://example.com:99999/").has_value());
}

TEST_CASE("Resolving a path keeps the authority", "[url]")
{
    auto base = Url::parse("https://api.example.com/base?key=old");
    REQUIRE(base.has_value());
    auto out = base->resolve("/v1/chat?stream=true#top");
    REQUIRE(out.host == "api.example.com");
    REQUIRE(out.path == "/v1/chat");
    REQUIRE(out.query == "stream=true");
    REQUIRE(out.to_string() == "https://api.example.com/v1/chat?stream=true");
}

TEST_CASE("Query parameters are replaced, not duplicated", "[url]")
{
    auto url = Url::parse("https://maps.example.com/geo?q=paris&key=agent-supplied&lang=fr");
    REQUIRE(url.has_value());
    url->set_query_param("key", "s3cr et");
    REQUIRE(url->query == "q=paris&lang=fr&key=s3cr%20et");

    auto bare = Url::parse("https://maps.example.com/geo");
    REQUIRE(bare.has_value());
    bare->set_query_param("key", "abc");
    REQUIRE(bare->query == "key=abc");
}
