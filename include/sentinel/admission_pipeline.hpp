#pragma once

#include "audit.hpp"
#include "config.hpp"
#include "forwarding_gateway.hpp"
#include "identity_resolver.hpp"
#include "policy_enforcer.hpp"
#include "rate_window.hpp"
#include "request_validator.hpp"
#include "secret_injector.hpp"
#include "types.hpp"
#include <optional>
#include <string>

namespace sentinel
{

    /** Inbound POST /v1/proxy/{service} as handed over by the HTTP layer. */
    struct ProxyCall
    {
        std::string service_name;
        std::optional<std::string> token; // x-agent-token
        RequestContext context;
        std::string body; // raw JSON
    };

    /** A request that passed every local check and carries its credential. */
    struct Admission
    {
        Identity identity;
        const ServiceDefinition *service{nullptr};
        ProxyRequest request;
        UpstreamRequest upstream;
    };

    /**
     * Runs one proxy call through authentication, policy, shape validation,
     * rate limiting and secret injection, then forwards it. Checks run in a
     * fixed order and the first failure ends the request with a terminal
     * decision; no upstream call is made for refused requests.
     *
     * Rate limits are checked service first, then agent. A request refused by
     * the service window never charges the agent window; one refused by the
     * agent window has already been counted against the service.
     */
    class AdmissionPipeline
    {
    public:
        AdmissionPipeline(const GatewayConfig &config,
                          const IdentityResolver &identities,
                          RateWindow &rates,
                          const SecretSource &secrets,
                          ForwardingGateway &gateway,
                          AuditLogger &logger);

        /** Every pre-forwarding step; synchronous and side-effect free apart from rate counters. */
        Result<Admission> admit(const ProxyCall &call);

        /** admit() then forward; done receives exactly one outcome. */
        void handle(const ProxyCall &call, ForwardingGateway::Completion done);

    private:
        const IdentityResolver &identities_;
        PolicyEnforcer policy_;
        RateWindow &rates_;
        SecretInjector injector_;
        ForwardingGateway &gateway_;
        AuditLogger &logger_;
    };

} // namespace sentinel
