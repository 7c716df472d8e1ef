#pragma once

#include "config.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace sentinel
{

    inline constexpr std::string_view kLegacyIdentityName = "legacy";

    /**
     * Caller resolved from a gateway token. In single-token mode agent is null
     * and the caller is the implicit "legacy" identity.
     */
    struct Identity
    {
        std::string name;
        const AgentIdentity *agent{nullptr};

        bool is_legacy() const { return agent == nullptr; }
    };

    /**
     * Maps x-agent-token values to identities. Holds pointers into the agent
     * table, which must outlive the resolver.
     */
    class IdentityResolver
    {
    public:
        /** Per-agent mode; fails on duplicate tokens. */
        static Result<IdentityResolver> from_agents(const AgentTable &agents);

        /** Single shared token mode. */
        static IdentityResolver single_token(std::string expected_token);

        /** Pick the mode from a loaded config. */
        static Result<IdentityResolver> from_config(const GatewayConfig &cfg);

        /**
         * Resolve a presented token. Missing or unknown tokens are an
         * AuthenticationError.
         */
        Result<Identity> resolve(const std::optional<std::string> &token) const;

        bool per_agent() const { return !expected_token_.has_value(); }
        std::size_t agent_count() const { return by_token_.size(); }

    private:
        IdentityResolver() = default;

        std::unordered_map<std::string, const AgentIdentity *> by_token_;
        std::optional<std::string> expected_token_;
    };

} // namespace sentinel
