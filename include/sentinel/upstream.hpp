#pragma once

#include "request_validator.hpp"
#include "url.hpp"
#include <boost/system/error_code.hpp>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace sentinel
{

    /** Fully resolved call to an upstream service. */
    struct UpstreamRequest
    {
        std::string method;
        Url url;
        HeaderList headers;
        std::optional<std::string> body;
    };

    struct UpstreamResponse
    {
        unsigned status{0};
        std::optional<std::string> content_type;
        std::string body;
    };

    /** ASCII case-insensitive comparison for header names. */
    bool iequals(std::string_view a, std::string_view b);

    /** Remove every header named name (case-insensitive), then append name: value. */
    void set_header(HeaderList &headers, const std::string &name, const std::string &value);

    /**
     * Issues one upstream call. Implementations must abort in-flight I/O when
     * the deadline passes and then complete with boost::beast::error::timeout;
     * the handler is invoked exactly once.
     */
    class UpstreamTransport
    {
    public:
        using Handler = std::function<void(boost::system::error_code, UpstreamResponse)>;

        virtual ~UpstreamTransport() = default;

        virtual void async_send(UpstreamRequest request,
                                std::chrono::steady_clock::time_point deadline,
                                Handler handler) = 0;
    };

} // namespace sentinel
