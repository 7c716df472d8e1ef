#include <catch2/catch_test_macros.hpp>
#include "sentinel/secret_injector.hpp"
#include <cstdlib>

using namespace sentinel;

namespace
{
    ServiceDefinition header_service()
    {
        ServiceDefinition svc;
        svc.name = "openai";
        svc.base_url = "https://api.openai.com";
        svc.allowed_hosts = {"api.openai.com"};
        svc.auth = HeaderAuth{"Authorization", "Bearer ${SECRET}"};
        svc.secret_env = "OPENAI_API_KEY";
        return svc;
    }

    UpstreamRequest request_for(const std::string &url)
    {
        UpstreamRequest req;
        req.method = "GET";
        req.url = *Url::parse(url);
        return req;
    }
}

TEST_CASE("Header templates render the credential", "[secret_injector]")
{
    StaticSecretSource secrets({{"OPENAI_API_KEY", "sk-live-123"}});
    SecretInjector injector(secrets);

    auto rendered = injector.render(header_service());
    REQUIRE(rendered.has_value());
    REQUIRE(*rendered == "Bearer sk-live-123");
}

TEST_CASE("Only the first placeholder is substituted", "[secret_injector]")
{
    REQUIRE(substitute_once("${SECRET}:${SECRET}", kSecretPlaceholder, "x") == "x:${SECRET}");
    REQUIRE(substitute_once("no placeholder", kSecretPlaceholder, "x") == "no placeholder");
}

TEST_CASE("Missing or empty secrets name only the variable", "[secret_injector]")
{
    StaticSecretSource empty_source({{"OPENAI_API_KEY", ""}});
    SecretInjector injector(empty_source);

    auto rendered = injector.render(header_service());
    REQUIRE_FALSE(rendered.has_value());
    REQUIRE(rendered.error().code == ErrorCode::SecretMissing);
    REQUIRE(rendered.error().http_status() == 500);
    REQUIRE(std::string(rendered.error().what()) == "Server misconfigured: env var \"OPENAI_API_KEY\" is not set");

    StaticSecretSource none(std::map<std::string, std::string>{});
    REQUIRE_FALSE(SecretInjector(none).render(header_service()).has_value());
}

TEST_CASE("Header injection overrides caller-supplied headers of any case", "[secret_injector]")
{
    auto req = request_for("https://api.openai.com/v1/models");
    req.headers = {{"authorization", "Bearer agent-guess"}, {"Accept", "application/json"}};

    SecretInjector::inject(HeaderAuth{"Authorization", "Bearer ${SECRET}"}, "Bearer sk-live-123", req);

    REQUIRE(req.headers.size() == 2);
    REQUIRE(req.headers[0].first == "Accept");
    REQUIRE(req.headers[1].first == "Authorization");
    REQUIRE(req.headers[1].second == "Bearer sk-live-123");
}

TEST_CASE("Query injection sets the URL parameter", "[secret_injector]")
{
    auto req = request_for("https://maps.example.com/geocode?address=x&key=mine");

    SecretInjector::inject(QueryAuth{"key", "${SECRET}"}, "abc/123", req);

    REQUIRE(req.url.query == "address=x&key=abc%2F123");
    REQUIRE(req.headers.empty());
}

TEST_CASE("Environment source reads the process environment", "[secret_injector]")
{
    ::setenv("SENTINEL_TEST_SECRET", "from-env", 1);
    EnvironmentSecretSource env;
    REQUIRE(env.lookup("SENTINEL_TEST_SECRET") == std::optional<std::string>("from-env"));
    ::unsetenv("SENTINEL_TEST_SECRET");
    REQUIRE_FALSE(env.lookup("SENTINEL_TEST_SECRET").has_value());
}
