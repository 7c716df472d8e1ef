#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace sentinel
{

    inline constexpr std::string_view kSecretPlaceholder = "${SECRET}";
    inline constexpr std::string_view kAgentTokenPrefix = "agt_";
    inline constexpr std::chrono::milliseconds kDefaultTimeout{30000};

    /** Credential rendered into a request header. */
    struct HeaderAuth
    {
        std::string header_name;
        std::string template_text; // e.g. "Bearer ${SECRET}"
    };

    /** Credential rendered into a URL query parameter. */
    struct QueryAuth
    {
        std::string query_param;
        std::string template_text;
    };

    using AuthInjection = std::variant<HeaderAuth, QueryAuth>;

    struct ServiceDefinition
    {
        std::string name;
        std::string base_url;
        std::vector<std::string> allowed_hosts;
        AuthInjection auth;
        std::string secret_env;
        std::optional<std::vector<std::string>> allowed_methods;
        std::optional<std::vector<std::string>> allowed_path_prefixes;
        std::optional<std::int64_t> rate_limit_per_minute;
        std::optional<std::vector<std::string>> allowed_ips;
        std::optional<std::vector<std::string>> allowed_origins;
        std::chrono::milliseconds timeout{kDefaultTimeout};
    };

    struct AgentIdentity
    {
        std::string name;
        std::string token;
        std::vector<std::string> allowed_services;
        std::optional<std::int64_t> rate_limit_per_minute;
        std::optional<std::vector<std::string>> allowed_ips;
    };

    /** Defaults applied when a service carries no list of its own. */
    struct GlobalPolicy
    {
        std::optional<std::vector<std::string>> allowed_ips;
        std::optional<std::vector<std::string>> allowed_origins;
    };

    struct ServerConfig
    {
        std::string bind_address{"0.0.0.0"};
        std::uint16_t port{8080};
        std::size_t threads{std::thread::hardware_concurrency() ? std::thread::hardware_concurrency() : 4};
        bool trust_proxy{false};      // take the client address from X-Forwarded-For
        std::size_t body_limit{1024 * 1024};
    };

    using ServiceTable = std::map<std::string, ServiceDefinition>;
    using AgentTable = std::map<std::string, AgentIdentity>;

    struct GatewayConfig
    {
        ServerConfig server{};
        GlobalPolicy global{};
        ServiceTable services;
        std::optional<AgentTable> agents;        // nullopt selects single-token mode
        std::optional<std::string> legacy_token; // AGENT_TOKEN, single-token mode only

        std::vector<std::string> service_names() const;
    };

    /**
     * ConfigLoader reads the services and agents TOML files, validates every
     * definition and applies environment overrides. Any failure is a
     * ConfigError: the gateway refuses to serve a partially loaded policy.
     */
    class ConfigLoader
    {
    public:
        /**
         * Load both files. Empty paths fall back to SERVICES_CONFIG_PATH /
         * AGENTS_CONFIG_PATH and then to services.toml / agents.toml. A missing
         * agents file selects single-token mode, which requires AGENT_TOKEN.
         */
        static Result<GatewayConfig> load(const std::string &services_path = {},
                                          const std::string &agents_path = {});

        /** Parse the services file content (services, global lists, [server]). */
        static Result<GatewayConfig> services_from_string(const std::string &toml_content);

        /** Parse the agents file content and cross-check it against known services. */
        static Result<AgentTable> agents_from_string(const std::string &toml_content,
                                                     const ServiceTable &services);

        /** Check a single service definition's invariants. */
        static Result<void> validate_service(const ServiceDefinition &svc);

        /** Serialize config to JSON for inspection; tokens are redacted. */
        static nlohmann::json to_json(const GatewayConfig &cfg);

    private:
        static Result<void> apply_env_overrides(GatewayConfig &cfg);
    };

} // namespace sentinel
