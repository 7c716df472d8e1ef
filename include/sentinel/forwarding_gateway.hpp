#pragma once

#include "audit.hpp"
#include "config.hpp"
#include "request_validator.hpp"
#include "types.hpp"
#include "upstream.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <variant>

namespace sentinel
{

    /** Upstream reply relayed to the caller unchanged. */
    struct ForwardedResponse
    {
        unsigned status{200};
        std::optional<std::string> content_type;
        std::string body;
    };

    /** Refusal or failure answered by the gateway itself as {"error": message}. */
    struct TerminalDecision
    {
        unsigned status{500};
        std::string message;

        static TerminalDecision from_error(const SentinelError &error)
        {
            return TerminalDecision{error.http_status(), error.what()};
        }
    };

    using ProxyOutcome = std::variant<ForwardedResponse, TerminalDecision>;

    unsigned outcome_status(const ProxyOutcome &outcome);

    /** True for the caller headers that are always removed before forwarding. */
    bool is_stripped_header(std::string_view name);

    /** Copy headers, dropping authorization, cookie, set-cookie, proxy-authorization, x-api-key and host. */
    HeaderList sanitize_headers(const HeaderList &headers);

    /**
     * Issues the upstream call for an admitted request, bounded by the
     * service's timeout, and turns the result into a ProxyOutcome.
     */
    class ForwardingGateway
    {
    public:
        using Completion = std::function<void(ProxyOutcome)>;

        ForwardingGateway(std::shared_ptr<UpstreamTransport> transport, AuditLogger &logger);

        /**
         * Resolve the caller's path against the service base, strip reserved
         * headers and attach the body for non-GET/HEAD methods. The credential
         * is injected afterwards by the caller.
         */
        static Result<UpstreamRequest> build_request(const ServiceDefinition &service, const ProxyRequest &request);

        /**
         * Send request and complete with the relayed response, 504 when the
         * service timeout elapses or 502 for any other transport failure.
         * Emits one access-log line per call.
         */
        void forward(const std::string &agent_name,
                     const ServiceDefinition &service,
                     const ProxyRequest &original,
                     UpstreamRequest request,
                     Completion done);

    private:
        std::shared_ptr<UpstreamTransport> transport_;
        AuditLogger &logger_;
    };

} // namespace sentinel
