#include "sentinel/identity_resolver.hpp"
#include "sentinel/token.hpp"

namespace sentinel
{

    Result<IdentityResolver> IdentityResolver::from_agents(const AgentTable &agents)
    {
        IdentityResolver resolver;
        for (const auto &[name, agent] : agents)
        {
            auto [it, inserted] = resolver.by_token_.emplace(agent.token, &agent);
            if (!inserted)
            {
                return std::unexpected(SentinelError::config(
                    "Duplicate agent token: agents \"" + it->second->name + "\" and \"" + name + "\" share the same token"));
            }
        }
        return resolver;
    }

    IdentityResolver IdentityResolver::single_token(std::string expected_token)
    {
        IdentityResolver resolver;
        resolver.expected_token_ = std::move(expected_token);
        return resolver;
    }

    Result<IdentityResolver> IdentityResolver::from_config(const GatewayConfig &cfg)
    {
        if (cfg.agents)
            return from_agents(*cfg.agents);
        if (!cfg.legacy_token || cfg.legacy_token->empty())
        {
            return std::unexpected(SentinelError::config("AGENT_TOKEN environment variable is required (no agents file found)"));
        }
        return single_token(*cfg.legacy_token);
    }

    Result<Identity> IdentityResolver::resolve(const std::optional<std::string> &token) const
    {
        if (!token || token->empty())
        {
            return std::unexpected(SentinelError::authentication("Unauthorized: missing x-agent-token"));
        }

        if (expected_token_)
        {
            if (!token::constant_time_equals(*token, *expected_token_))
            {
                return std::unexpected(SentinelError::authentication("Unauthorized: invalid or missing x-agent-token"));
            }
            return Identity{std::string(kLegacyIdentityName), nullptr};
        }

        auto it = by_token_.find(*token);
        if (it == by_token_.end())
        {
            return std::unexpected(SentinelError::authentication("Unauthorized: invalid agent token"));
        }
        return Identity{it->second->name, it->second};
    }

} // namespace sentinel
