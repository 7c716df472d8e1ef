#pragma once

#include "upstream.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <cstdint>

namespace sentinel
{

    /**
     * UpstreamTransport over Boost.Beast. https uses TLS with SNI and peer
     * verification against the system trust store; plain http is supported
     * for local upstreams. One connection per call, closed on completion.
     *
     * The deadline bounds resolve, connect, handshake, write and read
     * together. When it expires the resolver is cancelled and the socket
     * closed, and the handler receives beast::error::timeout.
     */
    class HttpTransport : public UpstreamTransport
    {
    public:
        static constexpr std::uint64_t kMaxResponseBody = 64ull * 1024 * 1024;

        explicit HttpTransport(boost::asio::io_context &ioc);

        void async_send(UpstreamRequest request,
                        std::chrono::steady_clock::time_point deadline,
                        Handler handler) override;

    private:
        boost::asio::io_context &ioc_;
        boost::asio::ssl::context ssl_ctx_;
    };

} // namespace sentinel
