#include <catch2/catch_test_macros.hpp>
#include "sentinel/config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace sentinel;

namespace
{
    const char *kServices = R"(
allowed_ips = ["10.0.0.0/8"]

[server]
port = 9090
trust_proxy = true

[services.openai]
base_url = "https://api.openai.com"
allowed_hosts = ["api.openai.com"]
secret_env = "OPENAI_API_KEY"
allowed_methods = ["POST"]
allowed_path_prefixes = ["/v1/"]
rate_limit_per_minute = 60
timeout_ms = 5000

[services.openai.auth]
type = "header"
header_name = "Authorization"
template = "Bearer ${SECRET}"

[services.maps]
base_url = "https://maps.example.com/api"
allowed_hosts = ["maps.example.com"]
secret_env = "MAPS_KEY"
allowed_ips = []

[services.maps.auth]
type = "query"
query_param = "key"
template = "${SECRET}"
)";

    const char *kAgents = R"(
[agents.alpha]
token = "agt_aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa"
allowed_services = ["openai", "maps"]
rate_limit_per_minute = 2

[agents.beta]
token = "agt_bbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb"
allowed_services = ["maps"]
allowed_ips = ["192.168.1.10"]
)";

    std::string service_with(const std::string &extra_fields, const std::string &auth)
    {
        return "[services.svc]\n"
               "base_url = \"https://svc.example.com\"\n"
               "allowed_hosts = [\"svc.example.com\"]\n"
               "secret_env = \"SVC_KEY\"\n" +
               extra_fields + "\n[services.svc.auth]\n" + auth;
    }

    const std::string kHeaderAuth = "type = \"header\"\nheader_name = \"X-Key\"\ntemplate = \"${SECRET}\"\n";

    std::string config_error(const Result<GatewayConfig> &r)
    {
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == ErrorCode::ConfigError);
        return r.error().what();
    }
}

TEST_CASE("Services file parses into definitions", "[config]")
{
    auto cfg = ConfigLoader::services_from_string(kServices);
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->service_names() == std::vector<std::string>{"maps", "openai"});
    REQUIRE(cfg->server.port == 9090);
    REQUIRE(cfg->server.trust_proxy);
    REQUIRE(cfg->global.allowed_ips == std::optional<std::vector<std::string>>({"10.0.0.0/8"}));

    const auto &openai = cfg->services.at("openai");
    REQUIRE(std::holds_alternative<HeaderAuth>(openai.auth));
    REQUIRE(std::get<HeaderAuth>(openai.auth).header_name == "Authorization");
    REQUIRE(openai.rate_limit_per_minute == std::optional<std::int64_t>(60));
    REQUIRE(openai.timeout == std::chrono::milliseconds(5000));
    REQUIRE_FALSE(openai.allowed_ips.has_value());

    const auto &maps = cfg->services.at("maps");
    REQUIRE(std::get<QueryAuth>(maps.auth).query_param == "key");
    REQUIRE(maps.timeout == kDefaultTimeout);
    REQUIRE(maps.allowed_ips.has_value());
    REQUIRE(maps.allowed_ips->empty());
    REQUIRE_FALSE(maps.allowed_methods.has_value());
}

TEST_CASE("Agents file parses and cross-checks services", "[config]")
{
    auto cfg = ConfigLoader::services_from_string(kServices);
    REQUIRE(cfg.has_value());

    auto agents = ConfigLoader::agents_from_string(kAgents, cfg->services);
    REQUIRE(agents.has_value());
    REQUIRE(agents->size() == 2);
    REQUIRE(agents->at("alpha").rate_limit_per_minute == std::optional<std::int64_t>(2));
    REQUIRE(agents->at("beta").allowed_ips == std::optional<std::vector<std::string>>({"192.168.1.10"}));
}

TEST_CASE("Agent definitions are validated", "[config]")
{
    auto cfg = ConfigLoader::services_from_string(kServices);
    REQUIRE(cfg.has_value());

    SECTION("token prefix")
    {
        auto r = ConfigLoader::agents_from_string("[agents.x]\ntoken = \"tok_1\"\nallowed_services = [\"maps\"]\n", cfg->services);
        REQUIRE_FALSE(r.has_value());
    }
    SECTION("unknown service")
    {
        auto r = ConfigLoader::agents_from_string("[agents.x]\ntoken = \"agt_1\"\nallowed_services = [\"stripe\"]\n", cfg->services);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(std::string(r.error().what()).find("unknown service \"stripe\"") != std::string::npos);
    }
    SECTION("empty scope")
    {
        auto r = ConfigLoader::agents_from_string("[agents.x]\ntoken = \"agt_1\"\nallowed_services = []\n", cfg->services);
        REQUIRE_FALSE(r.has_value());
    }
    SECTION("duplicate tokens")
    {
        auto r = ConfigLoader::agents_from_string(
            "[agents.x]\ntoken = \"agt_1\"\nallowed_services = [\"maps\"]\n"
            "[agents.y]\ntoken = \"agt_1\"\nallowed_services = [\"maps\"]\n",
            cfg->services);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(std::string(r.error().what()).starts_with("Duplicate agent token"));
    }
    SECTION("non-positive limit")
    {
        auto r = ConfigLoader::agents_from_string(
            "[agents.x]\ntoken = \"agt_1\"\nallowed_services = [\"maps\"]\nrate_limit_per_minute = 0\n", cfg->services);
        REQUIRE_FALSE(r.has_value());
    }
}

TEST_CASE("Service definitions are validated at load time", "[config]")
{
    REQUIRE(ConfigLoader::services_from_string(service_with("", kHeaderAuth)).has_value());

    REQUIRE(config_error(ConfigLoader::services_from_string("title = \"x\"\n")) ==
            "Config must have a top-level 'services' table");
    REQUIRE(config_error(ConfigLoader::services_from_string("services = [")).starts_with("Failed to parse TOML"));

    auto http_base = "[services.svc]\nbase_url = \"http://svc.example.com\"\nallowed_hosts = [\"svc.example.com\"]\n"
                     "secret_env = \"K\"\n[services.svc.auth]\n" + kHeaderAuth;
    REQUIRE(config_error(ConfigLoader::services_from_string(http_base)).find("https") != std::string::npos);

    auto missing_host = "[services.svc]\nbase_url = \"https://svc.example.com\"\nallowed_hosts = [\"other.example.com\"]\n"
                        "secret_env = \"K\"\n[services.svc.auth]\n" + kHeaderAuth;
    REQUIRE(config_error(ConfigLoader::services_from_string(missing_host)).find("must be in allowed_hosts") != std::string::npos);

    REQUIRE(config_error(ConfigLoader::services_from_string(
                service_with("", "type = \"header\"\nheader_name = \"X-Key\"\ntemplate = \"static\"\n")))
                .find("${SECRET}") != std::string::npos);
    REQUIRE(config_error(ConfigLoader::services_from_string(
                service_with("", "type = \"header\"\ntemplate = \"${SECRET}\"\n")))
                .find("header_name") != std::string::npos);
    REQUIRE(config_error(ConfigLoader::services_from_string(
                service_with("", "type = \"basic\"\ntemplate = \"${SECRET}\"\n")))
                .find("auth.type") != std::string::npos);

    REQUIRE_FALSE(ConfigLoader::services_from_string(service_with("allowed_path_prefixes = [\"v1\"]", kHeaderAuth)).has_value());
    REQUIRE_FALSE(ConfigLoader::services_from_string(service_with("timeout_ms = 0", kHeaderAuth)).has_value());
    REQUIRE_FALSE(ConfigLoader::services_from_string(service_with("rate_limit_per_minute = -1", kHeaderAuth)).has_value());
    REQUIRE_FALSE(ConfigLoader::services_from_string(service_with("allowed_ips = \"10.0.0.1\"", kHeaderAuth)).has_value());
}

TEST_CASE("Redacted JSON never contains tokens", "[config]")
{
    auto cfg = ConfigLoader::services_from_string(kServices);
    REQUIRE(cfg.has_value());
    auto agents = ConfigLoader::agents_from_string(kAgents, cfg->services);
    REQUIRE(agents.has_value());
    cfg->agents = *agents;

    auto j = ConfigLoader::to_json(*cfg);
    REQUIRE(j["auth_mode"] == "agents");
    REQUIRE(j["agents"]["alpha"]["token"] == "agt_***");
    REQUIRE(j["services"]["openai"]["auth"]["type"] == "header");
    REQUIRE(j.dump().find("aaaaaaaa") == std::string::npos);

    cfg->agents.reset();
    cfg->legacy_token = "legacy-secret";
    auto legacy = ConfigLoader::to_json(*cfg);
    REQUIRE(legacy["auth_mode"] == "legacy");
    REQUIRE(legacy.dump().find("legacy-secret") == std::string::npos);
}

TEST_CASE("Missing agents file selects legacy mode and needs AGENT_TOKEN", "[config]")
{
    auto dir = std::filesystem::temp_directory_path() / "sentinel_config_test";
    std::filesystem::create_directories(dir);
    auto services_path = (dir / "services.toml").string();
    auto agents_path = (dir / "agents.toml").string();
    {
        std::ofstream out(services_path);
        out << kServices;
    }
    std::filesystem::remove(agents_path);

    ::unsetenv("AGENT_TOKEN");
    auto missing = ConfigLoader::load(services_path, agents_path);
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(std::string(missing.error().what()).starts_with("AGENT_TOKEN environment variable is required"));

    ::setenv("AGENT_TOKEN", "shared-token", 1);
    auto legacy = ConfigLoader::load(services_path, agents_path);
    ::unsetenv("AGENT_TOKEN");
    REQUIRE(legacy.has_value());
    REQUIRE_FALSE(legacy->agents.has_value());
    REQUIRE(legacy->legacy_token == std::optional<std::string>("shared-token"));

    {
        std::ofstream out(agents_path);
        out << kAgents;
    }
    auto per_agent = ConfigLoader::load(services_path, agents_path);
    REQUIRE(per_agent.has_value());
    REQUIRE(per_agent->agents.has_value());
    REQUIRE_FALSE(per_agent->legacy_token.has_value());

    REQUIRE_FALSE(ConfigLoader::load((dir / "nope.toml").string(), agents_path).has_value());
    std::filesystem::remove_all(dir);
}

TEST_CASE("Environment overrides server settings", "[config]")
{
    auto dir = std::filesystem::temp_directory_path() / "sentinel_config_env_test";
    std::filesystem::create_directories(dir);
    auto services_path = (dir / "services.toml").string();
    auto agents_path = (dir / "agents.toml").string();
    {
        std::ofstream out(services_path);
        out << kServices;
    }
    {
        std::ofstream out(agents_path);
        out << kAgents;
    }

    ::setenv("PORT", "7000", 1);
    ::setenv("SENTINEL_TRUST_PROXY", "0", 1);
    auto cfg = ConfigLoader::load(services_path, agents_path);
    ::unsetenv("PORT");
    ::unsetenv("SENTINEL_TRUST_PROXY");

    REQUIRE(cfg.has_value());
    REQUIRE(cfg->server.port == 7000);
    REQUIRE_FALSE(cfg->server.trust_proxy);
    std::filesystem::remove_all(dir);
}

TEST_CASE("Server settings are range-checked", "[config]")
{
    auto with_server = [](const std::string &server) {
        return "[server]\n" + server + "\n" + service_with("", kHeaderAuth);
    };

    REQUIRE(ConfigLoader::services_from_string(with_server("port = 65535"))->server.port == 65535);
    REQUIRE(config_error(ConfigLoader::services_from_string(with_server("port = 70000"))) ==
            "server.port must be between 1 and 65535 (got 70000)");
    REQUIRE(config_error(ConfigLoader::services_from_string(with_server("port = 0"))) ==
            "server.port must be between 1 and 65535 (got 0)");
    REQUIRE(config_error(ConfigLoader::services_from_string(with_server("port = -1"))) ==
            "server.port must be between 1 and 65535 (got -1)");
    REQUIRE(config_error(ConfigLoader::services_from_string(with_server("port = \"8080\""))) ==
            "server.port must be an integer");
    REQUIRE(config_error(ConfigLoader::services_from_string(with_server("threads = 0"))) ==
            "server.threads must be a positive integer");
    REQUIRE(config_error(ConfigLoader::services_from_string(with_server("body_limit = -5"))) ==
            "server.body_limit must be a positive integer");
}

TEST_CASE("Unparsable or out-of-range environment overrides are fatal", "[config]")
{
    auto dir = std::filesystem::temp_directory_path() / "sentinel_config_env_range_test";
    std::filesystem::create_directories(dir);
    auto services_path = (dir / "services.toml").string();
    auto agents_path = (dir / "agents.toml").string();
    {
        std::ofstream out(services_path);
        out << kServices;
    }
    {
        std::ofstream out(agents_path);
        out << kAgents;
    }

    auto load_with = [&](const char *name, const char *value) {
        ::setenv(name, value, 1);
        auto cfg = ConfigLoader::load(services_path, agents_path);
        ::unsetenv(name);
        return cfg;
    };

    REQUIRE(config_error(load_with("PORT", "abc")) == "PORT must be an integer (got \"abc\")");
    REQUIRE(config_error(load_with("PORT", "80x")) == "PORT must be an integer (got \"80x\")");
    REQUIRE(config_error(load_with("PORT", "")) == "PORT must be an integer (got \"\")");
    REQUIRE(config_error(load_with("PORT", "70000")) == "PORT must be between 1 and 65535 (got 70000)");
    REQUIRE(config_error(load_with("SENTINEL_THREADS", "0")) == "SENTINEL_THREADS must be a positive integer");
    REQUIRE(config_error(load_with("SENTINEL_THREADS", "many")) ==
            "SENTINEL_THREADS must be an integer (got \"many\")");

    auto ok = load_with("SENTINEL_THREADS", "3");
    REQUIRE(ok.has_value());
    REQUIRE(ok->server.threads == 3);
    std::filesystem::remove_all(dir);
}
