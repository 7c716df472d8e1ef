#pragma once

#include "sentinel/upstream.hpp"
#include <spdlog/logger.h>
#include <spdlog/sinks/ostream_sink.h>
#include <memory>
#include <sstream>
#include <vector>

namespace sentinel::testing
{
    /** Records every request and completes synchronously with a canned result. */
    class RecordingTransport : public UpstreamTransport
    {
    public:
        void async_send(UpstreamRequest request,
                        std::chrono::steady_clock::time_point deadline,
                        Handler handler) override
        {
            requests.push_back(std::move(request));
            deadlines.push_back(deadline);
            handler(next_error, next_response);
        }

        std::vector<UpstreamRequest> requests;
        std::vector<std::chrono::steady_clock::time_point> deadlines;
        boost::system::error_code next_error;
        UpstreamResponse next_response{200, std::string("application/json"), R"({"ok":true})"};
    };

    /** spdlog logger writing into a string stream. */
    struct CapturedLog
    {
        std::ostringstream stream;
        std::shared_ptr<spdlog::logger> logger;

        CapturedLog()
        {
            auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream);
            sink->set_pattern("%l %v");
            logger = std::make_shared<spdlog::logger>("captured", sink);
            logger->set_level(spdlog::level::trace);
        }

        std::string text() const { return stream.str(); }
    };
}
