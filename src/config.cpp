#include "sentinel/config.hpp"
#include "sentinel/url.hpp"
#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <type_traits>
#include <toml++/toml.h>

namespace sentinel
{
    namespace
    {
        using StringList = std::optional<std::vector<std::string>>;

        std::string env_or(const char *name, const std::string &fallback)
        {
            if (const char *value = std::getenv(name); value && *value)
                return value;
            return fallback;
        }

        Result<std::string> read_file(const std::string &path)
        {
            std::ifstream file(path);
            if (!file.is_open())
            {
                return std::unexpected(SentinelError::config("Unable to open config file: " + path));
            }
            std::stringstream buffer;
            buffer << file.rdbuf();
            return buffer.str();
        }

        Result<toml::table> parse_document(const std::string &content)
        {
            try
            {
                return toml::parse(content);
            }
            catch (const toml::parse_error &e)
            {
                return std::unexpected(SentinelError::config(std::string("Failed to parse TOML: ") + e.what()));
            }
        }

        Result<StringList> string_list(toml::node_view<toml::node> node, const std::string &label)
        {
            if (!node)
                return StringList{};

            auto *arr = node.as_array();
            if (!arr)
            {
                return std::unexpected(SentinelError::config(label + " must be an array"));
            }
            std::vector<std::string> out;
            out.reserve(arr->size());
            for (auto &el : *arr)
            {
                auto value = el.value<std::string>();
                if (!value)
                {
                    return std::unexpected(SentinelError::config(label + " entries must be strings"));
                }
                out.push_back(*value);
            }
            return StringList{std::move(out)};
        }

        Result<std::optional<std::int64_t>> positive_int(toml::node_view<toml::node> node, const std::string &label)
        {
            if (!node)
                return std::optional<std::int64_t>{};
            auto value = node.value<std::int64_t>();
            if (!node.is_integer() || !value || *value <= 0)
            {
                return std::unexpected(SentinelError::config(label + " must be a positive integer"));
            }
            return value;
        }

        Result<std::string> required_string(toml::node_view<toml::node> node, const std::string &label)
        {
            auto value = node.value<std::string>();
            if (!node.is_string() || !value || value->empty())
            {
                return std::unexpected(SentinelError::config(label));
            }
            return *value;
        }

        Result<AuthInjection> parse_auth(toml::table &auth, const std::string &name)
        {
            auto type = auth["type"].value<std::string>();
            auto template_text = auth["template"].value<std::string>();

            if (type == "header")
            {
                auto header_name = auth["header_name"].value<std::string>();
                if (!header_name || header_name->empty() || !template_text || template_text->empty())
                {
                    return std::unexpected(SentinelError::config(
                        "Service \"" + name + "\": header auth requires header_name and template"));
                }
                return AuthInjection{HeaderAuth{*header_name, *template_text}};
            }
            if (type == "query")
            {
                auto query_param = auth["query_param"].value<std::string>();
                if (!query_param || query_param->empty() || !template_text || template_text->empty())
                {
                    return std::unexpected(SentinelError::config(
                        "Service \"" + name + "\": query auth requires query_param and template"));
                }
                return AuthInjection{QueryAuth{*query_param, *template_text}};
            }
            return std::unexpected(SentinelError::config(
                "Service \"" + name + "\": auth.type must be \"header\" or \"query\""));
        }

        Result<ServiceDefinition> parse_service(const std::string &name, toml::table &tbl)
        {
            const std::string prefix = "Service \"" + name + "\"";
            ServiceDefinition svc;
            svc.name = name;

            for (const char *field : {"base_url", "allowed_hosts", "auth", "secret_env"})
            {
                if (!tbl.contains(field))
                {
                    return std::unexpected(SentinelError::config(
                        prefix + " is missing required field \"" + field + "\""));
                }
            }

            auto base_url = required_string(tbl["base_url"], prefix + ": base_url must be a string");
            if (!base_url)
                return std::unexpected(base_url.error());
            svc.base_url = *base_url;

            auto secret_env = required_string(tbl["secret_env"], prefix + ": secret_env must be a string");
            if (!secret_env)
                return std::unexpected(secret_env.error());
            svc.secret_env = *secret_env;

            auto hosts = string_list(tbl["allowed_hosts"], prefix + ": allowed_hosts");
            if (!hosts)
                return std::unexpected(hosts.error());
            svc.allowed_hosts = hosts->value_or(std::vector<std::string>{});

            auto *auth = tbl["auth"].as_table();
            if (!auth)
            {
                return std::unexpected(SentinelError::config(prefix + ": auth must be a table"));
            }
            auto parsed_auth = parse_auth(*auth, name);
            if (!parsed_auth)
                return std::unexpected(parsed_auth.error());
            svc.auth = *parsed_auth;

            auto methods = string_list(tbl["allowed_methods"], prefix + ": allowed_methods");
            if (!methods)
                return std::unexpected(methods.error());
            svc.allowed_methods = *methods;

            auto prefixes = string_list(tbl["allowed_path_prefixes"], prefix + ": allowed_path_prefixes");
            if (!prefixes)
                return std::unexpected(prefixes.error());
            svc.allowed_path_prefixes = *prefixes;

            auto ips = string_list(tbl["allowed_ips"], prefix + " allowed_ips");
            if (!ips)
                return std::unexpected(ips.error());
            svc.allowed_ips = *ips;

            auto origins = string_list(tbl["allowed_origins"], prefix + " allowed_origins");
            if (!origins)
                return std::unexpected(origins.error());
            svc.allowed_origins = *origins;

            auto rate = positive_int(tbl["rate_limit_per_minute"], prefix + ": rate_limit_per_minute");
            if (!rate)
                return std::unexpected(rate.error());
            svc.rate_limit_per_minute = *rate;

            auto timeout = positive_int(tbl["timeout_ms"], prefix + ": timeout_ms");
            if (!timeout)
                return std::unexpected(timeout.error());
            if (*timeout)
                svc.timeout = std::chrono::milliseconds(**timeout);

            if (auto valid = ConfigLoader::validate_service(svc); !valid)
                return std::unexpected(valid.error());
            return svc;
        }

        Result<std::uint16_t> port_number(std::int64_t value, const std::string &label)
        {
            if (value < 1 || value > 65535)
            {
                return std::unexpected(SentinelError::config(
                    label + " must be between 1 and 65535 (got " + std::to_string(value) + ")"));
            }
            return static_cast<std::uint16_t>(value);
        }

        Result<std::int64_t> env_integer(const char *name, std::string_view text)
        {
            std::int64_t value{};
            auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || end != text.data() + text.size())
            {
                return std::unexpected(SentinelError::config(
                    std::string(name) + " must be an integer (got \"" + std::string(text) + "\")"));
            }
            return value;
        }

        Result<void> parse_server(toml::table &tbl, ServerConfig &server)
        {
            if (auto addr = tbl["bind_address"].value<std::string>())
                server.bind_address = *addr;

            if (tbl.contains("port"))
            {
                auto port = tbl["port"].value<std::int64_t>();
                if (!tbl["port"].is_integer() || !port)
                    return std::unexpected(SentinelError::config("server.port must be an integer"));
                auto checked = port_number(*port, "server.port");
                if (!checked)
                    return std::unexpected(checked.error());
                server.port = *checked;
            }

            auto threads = positive_int(tbl["threads"], "server.threads");
            if (!threads)
                return std::unexpected(threads.error());
            if (*threads)
                server.threads = static_cast<std::size_t>(**threads);

            if (auto trust = tbl["trust_proxy"].value<bool>())
                server.trust_proxy = *trust;

            auto limit = positive_int(tbl["body_limit"], "server.body_limit");
            if (!limit)
                return std::unexpected(limit.error());
            if (*limit)
                server.body_limit = static_cast<std::size_t>(**limit);
            return {};
        }

        std::string join(const std::vector<std::string> &items)
        {
            std::string out;
            for (const auto &item : items)
            {
                if (!out.empty())
                    out += ", ";
                out += item;
            }
            return out;
        }

        nlohmann::json optional_list(const std::optional<std::vector<std::string>> &list)
        {
            if (!list)
                return nullptr;
            return *list;
        }
    } // namespace

    std::vector<std::string> GatewayConfig::service_names() const
    {
        std::vector<std::string> names;
        names.reserve(services.size());
        for (const auto &[name, _] : services)
            names.push_back(name);
        return names;
    }

    Result<void> ConfigLoader::validate_service(const ServiceDefinition &svc)
    {
        const std::string prefix = "Service \"" + svc.name + "\"";

        if (!svc.base_url.starts_with("https://"))
        {
            return std::unexpected(SentinelError::config(
                prefix + ": base_url must use https (got \"" + svc.base_url + "\")"));
        }
        auto base = Url::parse(svc.base_url);
        if (!base)
        {
            return std::unexpected(SentinelError::config(prefix + ": " + base.error().what()));
        }

        if (svc.allowed_hosts.empty())
        {
            return std::unexpected(SentinelError::config(prefix + ": allowed_hosts must be a non-empty array"));
        }
        if (std::find(svc.allowed_hosts.begin(), svc.allowed_hosts.end(), base->host) == svc.allowed_hosts.end())
        {
            return std::unexpected(SentinelError::config(
                prefix + ": base_url host \"" + base->host + "\" must be in allowed_hosts"));
        }

        const auto &template_text = std::visit([](const auto &auth) -> const std::string & { return auth.template_text; }, svc.auth);
        if (template_text.find(kSecretPlaceholder) == std::string::npos)
        {
            return std::unexpected(SentinelError::config(prefix + ": auth.template must contain ${SECRET} placeholder"));
        }

        if (svc.allowed_path_prefixes)
        {
            for (const auto &p : *svc.allowed_path_prefixes)
            {
                if (!p.starts_with("/"))
                {
                    return std::unexpected(SentinelError::config(
                        prefix + ": allowed_path_prefixes entries must start with \"/\""));
                }
            }
        }

        if (svc.timeout.count() <= 0)
        {
            return std::unexpected(SentinelError::config(prefix + ": timeout_ms must be a positive integer"));
        }
        return {};
    }

    Result<GatewayConfig> ConfigLoader::services_from_string(const std::string &toml_content)
    {
        auto doc = parse_document(toml_content);
        if (!doc)
            return std::unexpected(doc.error());
        auto &tbl = *doc;

        GatewayConfig cfg{};

        auto *services = tbl["services"].as_table();
        if (!services)
        {
            return std::unexpected(SentinelError::config("Config must have a top-level 'services' table"));
        }

        auto global_ips = string_list(tbl["allowed_ips"], "Global allowed_ips");
        if (!global_ips)
            return std::unexpected(global_ips.error());
        cfg.global.allowed_ips = *global_ips;

        auto global_origins = string_list(tbl["allowed_origins"], "Global allowed_origins");
        if (!global_origins)
            return std::unexpected(global_origins.error());
        cfg.global.allowed_origins = *global_origins;

        if (auto *server = tbl["server"].as_table())
        {
            if (auto parsed = parse_server(*server, cfg.server); !parsed)
                return std::unexpected(parsed.error());
        }

        for (auto &&[key, node] : *services)
        {
            std::string name(key.str());
            auto *svc_tbl = node.as_table();
            if (!svc_tbl)
            {
                return std::unexpected(SentinelError::config("Service \"" + name + "\" must be a table"));
            }
            auto svc = parse_service(name, *svc_tbl);
            if (!svc)
                return std::unexpected(svc.error());
            cfg.services.emplace(name, std::move(*svc));
        }
        return cfg;
    }

    Result<AgentTable> ConfigLoader::agents_from_string(const std::string &toml_content,
                                                        const ServiceTable &services)
    {
        auto doc = parse_document(toml_content);
        if (!doc)
            return std::unexpected(doc.error());

        auto *agents = (*doc)["agents"].as_table();
        if (!agents)
        {
            return std::unexpected(SentinelError::config("agents file must have a top-level 'agents' table"));
        }

        std::vector<std::string> known;
        for (const auto &[name, _] : services)
            known.push_back(name);

        AgentTable table;
        std::map<std::string, std::string> owner_by_token;
        for (auto &&[key, node] : *agents)
        {
            std::string name(key.str());
            const std::string prefix = "Agent \"" + name + "\"";
            auto *tbl = node.as_table();
            if (!tbl)
            {
                return std::unexpected(SentinelError::config(prefix + " must be a table"));
            }

            AgentIdentity agent;
            agent.name = name;

            auto token = required_string((*tbl)["token"], prefix + ": missing or invalid token");
            if (!token)
                return std::unexpected(token.error());
            if (!token->starts_with(kAgentTokenPrefix))
            {
                return std::unexpected(SentinelError::config(prefix + ": token must start with \"agt_\""));
            }
            agent.token = *token;

            auto allowed = string_list((*tbl)["allowed_services"], prefix + ": allowed_services");
            if (!allowed)
                return std::unexpected(allowed.error());
            if (!*allowed || (*allowed)->empty())
            {
                return std::unexpected(SentinelError::config(prefix + ": allowed_services must be a non-empty array"));
            }
            for (const auto &svc : **allowed)
            {
                if (!services.contains(svc))
                {
                    return std::unexpected(SentinelError::config(
                        prefix + " references unknown service \"" + svc + "\". Available: " + join(known)));
                }
            }
            agent.allowed_services = **allowed;

            auto rate = positive_int((*tbl)["rate_limit_per_minute"], prefix + ": rate_limit_per_minute");
            if (!rate)
                return std::unexpected(rate.error());
            agent.rate_limit_per_minute = *rate;

            auto ips = string_list((*tbl)["allowed_ips"], prefix + " allowed_ips");
            if (!ips)
                return std::unexpected(ips.error());
            agent.allowed_ips = *ips;

            if (auto it = owner_by_token.find(agent.token); it != owner_by_token.end())
            {
                return std::unexpected(SentinelError::config(
                    "Duplicate agent token: agents \"" + it->second + "\" and \"" + name + "\" share the same token"));
            }
            owner_by_token.emplace(agent.token, name);
            table.emplace(name, std::move(agent));
        }
        return table;
    }

    Result<GatewayConfig> ConfigLoader::load(const std::string &services_path, const std::string &agents_path)
    {
        auto svc_path = services_path.empty() ? env_or("SERVICES_CONFIG_PATH", "services.toml") : services_path;
        auto agt_path = agents_path.empty() ? env_or("AGENTS_CONFIG_PATH", "agents.toml") : agents_path;

        auto svc_content = read_file(svc_path);
        if (!svc_content)
            return std::unexpected(svc_content.error());
        auto cfg = services_from_string(*svc_content);
        if (!cfg)
            return cfg;

        std::error_code ec;
        if (std::filesystem::exists(agt_path, ec))
        {
            auto agt_content = read_file(agt_path);
            if (!agt_content)
                return std::unexpected(agt_content.error());
            auto agents = agents_from_string(*agt_content, cfg->services);
            if (!agents)
                return std::unexpected(agents.error());
            cfg->agents = std::move(*agents);
        }

        if (auto overridden = apply_env_overrides(*cfg); !overridden)
            return std::unexpected(overridden.error());

        if (!cfg->agents && !cfg->legacy_token)
        {
            return std::unexpected(SentinelError::config(
                "AGENT_TOKEN environment variable is required (no agents file found at " + agt_path + ")"));
        }
        return cfg;
    }

    Result<void> ConfigLoader::apply_env_overrides(GatewayConfig &cfg)
    {
        if (const char *addr = std::getenv("SENTINEL_BIND_ADDRESS"))
            cfg.server.bind_address = addr;
        if (const char *port = std::getenv("PORT"))
        {
            auto value = env_integer("PORT", port);
            if (!value)
                return std::unexpected(value.error());
            auto checked = port_number(*value, "PORT");
            if (!checked)
                return std::unexpected(checked.error());
            cfg.server.port = *checked;
        }
        if (const char *threads = std::getenv("SENTINEL_THREADS"))
        {
            auto value = env_integer("SENTINEL_THREADS", threads);
            if (!value)
                return std::unexpected(value.error());
            if (*value <= 0)
                return std::unexpected(SentinelError::config("SENTINEL_THREADS must be a positive integer"));
            cfg.server.threads = static_cast<std::size_t>(*value);
        }
        if (const char *trust = std::getenv("SENTINEL_TRUST_PROXY"))
            cfg.server.trust_proxy = std::string(trust) != "0";

        if (!cfg.agents)
        {
            if (const char *token = std::getenv("AGENT_TOKEN"); token && *token)
                cfg.legacy_token = token;
        }
        return {};
    }

    nlohmann::json ConfigLoader::to_json(const GatewayConfig &cfg)
    {
        nlohmann::json j;
        j["server"] = {
            {"bind_address", cfg.server.bind_address},
            {"port", cfg.server.port},
            {"threads", cfg.server.threads},
            {"trust_proxy", cfg.server.trust_proxy},
            {"body_limit", cfg.server.body_limit}};
        j["allowed_ips"] = optional_list(cfg.global.allowed_ips);
        j["allowed_origins"] = optional_list(cfg.global.allowed_origins);

        j["services"] = nlohmann::json::object();
        for (const auto &[name, svc] : cfg.services)
        {
            nlohmann::json auth = std::visit(
                [](const auto &a) -> nlohmann::json {
                    using T = std::decay_t<decltype(a)>;
                    if constexpr (std::is_same_v<T, HeaderAuth>)
                        return {{"type", "header"}, {"header_name", a.header_name}, {"template", a.template_text}};
                    else
                        return {{"type", "query"}, {"query_param", a.query_param}, {"template", a.template_text}};
                },
                svc.auth);

            j["services"][name] = {
                {"base_url", svc.base_url},
                {"allowed_hosts", svc.allowed_hosts},
                {"auth", auth},
                {"secret_env", svc.secret_env},
                {"allowed_methods", optional_list(svc.allowed_methods)},
                {"allowed_path_prefixes", optional_list(svc.allowed_path_prefixes)},
                {"allowed_ips", optional_list(svc.allowed_ips)},
                {"allowed_origins", optional_list(svc.allowed_origins)},
                {"timeout_ms", svc.timeout.count()}};
            j["services"][name]["rate_limit_per_minute"] =
                svc.rate_limit_per_minute ? nlohmann::json(*svc.rate_limit_per_minute) : nlohmann::json(nullptr);
        }

        if (cfg.agents)
        {
            j["auth_mode"] = "agents";
            j["agents"] = nlohmann::json::object();
            for (const auto &[name, agent] : *cfg.agents)
            {
                j["agents"][name] = {
                    {"token", "agt_***"},
                    {"allowed_services", agent.allowed_services},
                    {"allowed_ips", optional_list(agent.allowed_ips)}};
                j["agents"][name]["rate_limit_per_minute"] =
                    agent.rate_limit_per_minute ? nlohmann::json(*agent.rate_limit_per_minute) : nlohmann::json(nullptr);
            }
        }
        else
        {
            j["auth_mode"] = "legacy";
            j["has_agent_token"] = cfg.legacy_token.has_value();
        }
        return j;
    }

} // namespace sentinel
