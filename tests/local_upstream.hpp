#pragma once

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <cstdint>
#include <functional>
#include <thread>

namespace sentinel::testing
{
    /**
     * Plain-HTTP upstream on 127.0.0.1 serving exactly one connection from a
     * background thread. The request is read in full before behaviour runs.
     */
    class LocalUpstream
    {
    public:
        using Behaviour = std::function<void(boost::asio::ip::tcp::socket &,
                                             const boost::beast::http::request<boost::beast::http::string_body> &)>;

        explicit LocalUpstream(Behaviour behaviour)
            : acceptor_(ioc_, {boost::asio::ip::make_address("127.0.0.1"), 0})
        {
            port_ = acceptor_.local_endpoint().port();
            thread_ = std::thread([this, behaviour = std::move(behaviour)] {
                boost::asio::ip::tcp::socket socket(ioc_);
                boost::beast::error_code ec;
                acceptor_.accept(socket, ec);
                if (ec)
                    return;
                boost::beast::flat_buffer buffer;
                boost::beast::http::read(socket, buffer, request, ec);
                if (ec)
                    return;
                behaviour(socket, request);
            });
        }

        ~LocalUpstream() { join(); }

        void join()
        {
            if (thread_.joinable())
                thread_.join();
        }

        std::uint16_t port() const { return port_; }

        boost::beast::http::request<boost::beast::http::string_body> request;

    private:
        boost::asio::io_context ioc_;
        boost::asio::ip::tcp::acceptor acceptor_;
        std::uint16_t port_{0};
        std::thread thread_;
    };
}
