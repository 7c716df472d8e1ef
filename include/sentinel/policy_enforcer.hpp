#pragma once

#include "config.hpp"
#include "identity_resolver.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sentinel
{

    /** Network facts about the inbound call, as seen by the HTTP layer. */
    struct RequestContext
    {
        std::string client_address;
        std::optional<std::string> origin;
        std::optional<std::string> referer;
    };

    /**
     * Lists that apply to one service after override resolution: a list on
     * the service replaces the global one outright, never merges with it.
     * An absent or empty list places no restriction.
     */
    struct EffectivePolicy
    {
        std::optional<std::vector<std::string>> allowed_ips;
        std::optional<std::vector<std::string>> allowed_origins;
    };

    EffectivePolicy resolve_effective_policy(const ServiceDefinition &service, const GlobalPolicy &global);

    /** Strip trailing '/' characters (used for Origin comparison). */
    std::string strip_trailing_slashes(std::string_view text);

    /**
     * Evaluates, in order and stopping at the first failure:
     * service exists, identity scope, effective IP list, identity IP list,
     * effective Origin list.
     */
    class PolicyEnforcer
    {
    public:
        PolicyEnforcer(const ServiceTable &services, const GlobalPolicy &global);

        /** Returns the target service when every check passes. */
        Result<const ServiceDefinition *> enforce(const std::string &service_name,
                                                  const Identity &identity,
                                                  const RequestContext &ctx) const;

    private:
        Result<void> check_ip(const std::vector<std::string> &allowed, const std::string &client,
                              const std::string &what) const;

        const ServiceTable &services_;
        const GlobalPolicy &global_;
    };

} // namespace sentinel
