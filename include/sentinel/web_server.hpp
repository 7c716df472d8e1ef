#pragma once

#include "config.hpp"
#include <spdlog/logger.h>
#include <cstdint>
#include <memory>

namespace sentinel
{
    /**
     * HTTP front end using Boost.Beast. Exposes GET /health and
     * POST /v1/proxy/{service}; every other route is 404. Each connection
     * runs on its own strand over a shared worker pool, and upstream calls
     * complete asynchronously without holding a worker.
     */
    class WebServer
    {
    public:
        /**
         * Takes ownership of a validated config. Credentials are read from the
         * process environment at request time. Throws SentinelError when the
         * agent table cannot be indexed (duplicate tokens).
         */
        explicit WebServer(GatewayConfig cfg, std::shared_ptr<spdlog::logger> access_logger = nullptr);
        ~WebServer();

        /** Bind, listen and start the worker threads. Returns the bound port. */
        std::uint16_t start();

        /** start() and block until stopped. */
        void run();

        /** Stop accepting, stop the io_context and join the workers. */
        void stop();

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };
}
