#include "sentinel/admission_pipeline.hpp"

namespace sentinel
{

    AdmissionPipeline::AdmissionPipeline(const GatewayConfig &config,
                                         const IdentityResolver &identities,
                                         RateWindow &rates,
                                         const SecretSource &secrets,
                                         ForwardingGateway &gateway,
                                         AuditLogger &logger)
        : identities_(identities),
          policy_(config.services, config.global),
          rates_(rates),
          injector_(secrets),
          gateway_(gateway),
          logger_(logger)
    {
    }

    Result<Admission> AdmissionPipeline::admit(const ProxyCall &call)
    {
        auto identity = identities_.resolve(call.token);
        if (!identity)
            return std::unexpected(identity.error());

        auto service = policy_.enforce(call.service_name, *identity, call.context);
        if (!service)
            return std::unexpected(service.error());
        const ServiceDefinition &svc = **service;

        auto body = parse_proxy_body(call.body);
        if (!body)
            return std::unexpected(body.error());
        auto request = validate_request(svc, *body);
        if (!request)
            return std::unexpected(request.error());

        if (!rates_.allow(svc.name, svc.rate_limit_per_minute))
        {
            return std::unexpected(SentinelError::rate_limited(
                "Rate limit exceeded for service \"" + svc.name + "\". Limit: " +
                std::to_string(*svc.rate_limit_per_minute) + "/min"));
        }

        if (identity->agent)
        {
            const auto &limit = identity->agent->rate_limit_per_minute;
            if (!rates_.allow("agent:" + identity->name, limit))
            {
                return std::unexpected(SentinelError::rate_limited(
                    "Rate limit exceeded for agent \"" + identity->name + "\". Limit: " +
                    std::to_string(*limit) + "/min"));
            }
        }

        auto credential = injector_.render(svc);
        if (!credential)
            return std::unexpected(credential.error());

        auto upstream = ForwardingGateway::build_request(svc, *request);
        if (!upstream)
            return std::unexpected(upstream.error());
        SecretInjector::inject(svc.auth, *credential, *upstream);

        return Admission{std::move(*identity), &svc, std::move(*request), std::move(*upstream)};
    }

    void AdmissionPipeline::handle(const ProxyCall &call, ForwardingGateway::Completion done)
    {
        auto admission = admit(call);
        if (!admission)
        {
            auto agent = identities_.per_agent() ? std::string("-") : std::string(kLegacyIdentityName);
            if (admission.error().code != ErrorCode::AuthenticationError)
            {
                if (auto id = identities_.resolve(call.token))
                    agent = id->name;
            }
            logger_.log_denied(agent, call.service_name, admission.error());
            done(TerminalDecision::from_error(admission.error()));
            return;
        }

        gateway_.forward(admission->identity.name,
                         *admission->service,
                         admission->request,
                         std::move(admission->upstream),
                         std::move(done));
    }

} // namespace sentinel
