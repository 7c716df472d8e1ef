#include "sentinel/forwarding_gateway.hpp"
#include <boost/asio/error.hpp>
#include <boost/beast/core/error.hpp>
#include <algorithm>
#include <array>

namespace sentinel
{

    namespace
    {
        constexpr std::array<std::string_view, 6> kStrippedHeaders = {
            "authorization",
            "cookie",
            "set-cookie",
            "proxy-authorization",
            "x-api-key",
            "host",
        };

        bool is_timeout(const boost::system::error_code &ec)
        {
            return ec == boost::beast::error::timeout || ec == boost::asio::error::timed_out;
        }
    } // namespace

    unsigned outcome_status(const ProxyOutcome &outcome)
    {
        return std::visit([](const auto &o) { return o.status; }, outcome);
    }

    bool is_stripped_header(std::string_view name)
    {
        return std::any_of(kStrippedHeaders.begin(), kStrippedHeaders.end(),
                           [&](std::string_view stripped) { return iequals(name, stripped); });
    }

    HeaderList sanitize_headers(const HeaderList &headers)
    {
        HeaderList clean;
        for (const auto &[name, value] : headers)
        {
            if (!is_stripped_header(name))
                clean.emplace_back(name, value);
        }
        return clean;
    }

    ForwardingGateway::ForwardingGateway(std::shared_ptr<UpstreamTransport> transport, AuditLogger &logger)
        : transport_(std::move(transport)), logger_(logger)
    {
    }

    Result<UpstreamRequest> ForwardingGateway::build_request(const ServiceDefinition &service, const ProxyRequest &request)
    {
        auto base = Url::parse(service.base_url);
        if (!base)
        {
            return std::unexpected(SentinelError::internal("Service \"" + service.name + "\" has an invalid base_url"));
        }

        UpstreamRequest out;
        out.method = request.method;
        out.url = base->resolve(request.path);
        if (std::find(service.allowed_hosts.begin(), service.allowed_hosts.end(), out.url.host) == service.allowed_hosts.end())
        {
            return std::unexpected(SentinelError::validation("Host \"" + out.url.host + "\" is not allowed"));
        }
        out.headers = sanitize_headers(request.headers);
        if (request.method != "GET" && request.method != "HEAD")
            out.body = request.body;
        return out;
    }

    void ForwardingGateway::forward(const std::string &agent_name,
                                    const ServiceDefinition &service,
                                    const ProxyRequest &original,
                                    UpstreamRequest request,
                                    Completion done)
    {
        auto start = std::chrono::steady_clock::now();
        auto deadline = start + service.timeout;

        AccessEvent event;
        event.agent = agent_name;
        event.service = service.name;
        event.method = original.method;
        event.path = original.path;

        transport_->async_send(
            std::move(request), deadline,
            [this, event = std::move(event), timeout = service.timeout, start, done = std::move(done)](
                boost::system::error_code ec, UpstreamResponse response) mutable {
                event.ts = now_ts();
                event.latency_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                       std::chrono::steady_clock::now() - start)
                                       .count();

                if (!ec)
                {
                    event.status = response.status;
                    logger_.log(event);
                    done(ForwardedResponse{response.status, std::move(response.content_type), std::move(response.body)});
                    return;
                }

                event.error = ec.message();
                logger_.log(event);

                if (is_timeout(ec))
                {
                    done(TerminalDecision::from_error(SentinelError::upstream_timeout(
                        "Upstream request timed out (" + std::to_string(timeout.count()) + "ms)")));
                    return;
                }
                done(TerminalDecision::from_error(SentinelError::upstream_transport(
                    "Upstream request failed: " + ec.message())));
            });
    }

} // namespace sentinel
