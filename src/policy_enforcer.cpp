#include "sentinel/policy_enforcer.hpp"
#include "sentinel/address_matcher.hpp"
#include <algorithm>

namespace sentinel
{

    namespace
    {
        bool restricts(const std::optional<std::vector<std::string>> &list)
        {
            return list && !list->empty();
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
    } // namespace

    EffectivePolicy resolve_effective_policy(const ServiceDefinition &service, const GlobalPolicy &global)
    {
        EffectivePolicy policy;
        policy.allowed_ips = service.allowed_ips ? service.allowed_ips : global.allowed_ips;
        policy.allowed_origins = service.allowed_origins ? service.allowed_origins : global.allowed_origins;
        return policy;
    }

    std::string strip_trailing_slashes(std::string_view text)
    {
        while (!text.empty() && text.back() == '/')
            text.remove_suffix(1);
        return std::string(text);
    }

    PolicyEnforcer::PolicyEnforcer(const ServiceTable &services, const GlobalPolicy &global)
        : services_(services), global_(global)
    {
    }

    Result<void> PolicyEnforcer::check_ip(const std::vector<std::string> &allowed, const std::string &client,
                                          const std::string &what) const
    {
        if (client.empty() || !parse_ip(client))
        {
            return std::unexpected(SentinelError::authorization("Unable to determine client IP address"));
        }
        if (!matches_any(client, allowed))
        {
            return std::unexpected(SentinelError::authorization("IP \"" + client + "\" not allowed for " + what));
        }
        return {};
    }

    Result<const ServiceDefinition *> PolicyEnforcer::enforce(const std::string &service_name,
                                                              const Identity &identity,
                                                              const RequestContext &ctx) const
    {
        auto it = services_.find(service_name);
        if (it == services_.end())
        {
            std::vector<std::string> names;
            for (const auto &[name, _] : services_)
                names.push_back(name);
            return std::unexpected(SentinelError::not_found(
                "Unknown service: \"" + service_name + "\". Available: " + join(names)));
        }
        const ServiceDefinition &service = it->second;

        if (identity.agent)
        {
            const auto &allowed = identity.agent->allowed_services;
            if (std::find(allowed.begin(), allowed.end(), service_name) == allowed.end())
            {
                return std::unexpected(SentinelError::authorization(
                    "Agent \"" + identity.name + "\" is not authorized for service \"" + service_name + "\""));
            }
        }

        auto effective = resolve_effective_policy(service, global_);
        auto client = normalize_client_address(ctx.client_address);

        if (restricts(effective.allowed_ips))
        {
            if (auto ok = check_ip(*effective.allowed_ips, client, "service \"" + service_name + "\""); !ok)
                return std::unexpected(ok.error());
        }

        if (identity.agent && restricts(identity.agent->allowed_ips))
        {
            if (auto ok = check_ip(*identity.agent->allowed_ips, client, "agent \"" + identity.name + "\""); !ok)
                return std::unexpected(ok.error());
        }

        if (restricts(effective.allowed_origins))
        {
            const auto &source = ctx.origin ? ctx.origin : ctx.referer;
            if (!source || source->empty())
            {
                return std::unexpected(SentinelError::authorization(
                    "Origin header required for service \"" + service_name + "\""));
            }
            auto presented = strip_trailing_slashes(*source);
            const auto &origins = *effective.allowed_origins;
            bool ok = std::any_of(origins.begin(), origins.end(), [&](const std::string &entry) {
                return strip_trailing_slashes(entry) == presented;
            });
            if (!ok)
            {
                return std::unexpected(SentinelError::authorization(
                    "Origin \"" + presented + "\" not allowed for service \"" + service_name + "\""));
            }
        }

        return &service;
    }

} // namespace sentinel
