#include "sentinel/http_transport.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <memory>
#include <type_traits>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace sentinel
{
    namespace
    {
        using SslStream = beast::ssl_stream<beast::tcp_stream>;

        // Recomputed by Beast for the outgoing message.
        bool is_framing_header(std::string_view name)
        {
            return iequals(name, "content-length") || iequals(name, "transfer-encoding") ||
                   iequals(name, "connection");
        }

        http::request<http::string_body> to_beast_request(const UpstreamRequest &in)
        {
            http::request<http::string_body> req;
            auto verb = http::string_to_verb(in.method);
            if (verb == http::verb::unknown)
                req.method_string(in.method);
            else
                req.method(verb);
            req.target(in.url.target());
            req.version(11);
            req.set(http::field::host, in.url.host_header());
            req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);

            for (const auto &[name, value] : in.headers)
            {
                if (!is_framing_header(name))
                    req.set(name, value);
            }

            if (in.body)
                req.body() = *in.body;
            req.keep_alive(false);
            req.prepare_payload();
            return req;
        }

        /**
         * One request/response exchange. Every handler runs on the exchange's
         * strand, so the deadline timer and the I/O chain never race.
         */
        template <class Stream>
        class Exchange : public std::enable_shared_from_this<Exchange<Stream>>
        {
        public:
            template <class... StreamArgs>
            Exchange(net::strand<net::io_context::executor_type> strand,
                     UpstreamRequest request,
                     std::chrono::steady_clock::time_point deadline,
                     UpstreamTransport::Handler handler,
                     StreamArgs &&...stream_args)
                : resolver_(strand),
                  stream_(strand, std::forward<StreamArgs>(stream_args)...),
                  timer_(strand),
                  host_(request.url.host),
                  port_(request.url.port_or_default()),
                  deadline_(deadline),
                  handler_(std::move(handler))
            {
                req_ = to_beast_request(request);
                parser_.body_limit(HttpTransport::kMaxResponseBody);
                if (req_.method() == http::verb::head)
                    parser_.skip(true);
            }

            void run()
            {
                net::dispatch(resolver_.get_executor(),
                              beast::bind_front_handler(&Exchange::start, this->shared_from_this()));
            }

        private:
            void start()
            {
                if constexpr (std::is_same_v<Stream, SslStream>)
                {
                    if (!SSL_set_tlsext_host_name(stream_.native_handle(), host_.c_str()))
                    {
                        beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
                        return finish(ec);
                    }
                    stream_.set_verify_callback(net::ssl::host_name_verification(host_));
                }

                timer_.expires_at(deadline_);
                timer_.async_wait(beast::bind_front_handler(&Exchange::on_deadline, this->shared_from_this()));

                resolver_.async_resolve(host_, port_,
                                        beast::bind_front_handler(&Exchange::on_resolve, this->shared_from_this()));
            }

            void on_deadline(beast::error_code ec)
            {
                if (ec == net::error::operation_aborted || done_)
                    return;
                timed_out_ = true;
                resolver_.cancel();
                beast::get_lowest_layer(stream_).close();
            }

            void on_resolve(beast::error_code ec, tcp::resolver::results_type results)
            {
                if (ec)
                    return finish(ec);
                beast::get_lowest_layer(stream_).async_connect(
                    results, beast::bind_front_handler(&Exchange::on_connect, this->shared_from_this()));
            }

            void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type)
            {
                if (ec)
                    return finish(ec);

                if constexpr (std::is_same_v<Stream, SslStream>)
                {
                    stream_.async_handshake(net::ssl::stream_base::client,
                                            beast::bind_front_handler(&Exchange::on_handshake, this->shared_from_this()));
                }
                else
                {
                    on_handshake({});
                }
            }

            void on_handshake(beast::error_code ec)
            {
                if (ec)
                    return finish(ec);
                http::async_write(stream_, req_,
                                  beast::bind_front_handler(&Exchange::on_write, this->shared_from_this()));
            }

            void on_write(beast::error_code ec, std::size_t)
            {
                if (ec)
                    return finish(ec);
                http::async_read(stream_, buffer_, parser_,
                                 beast::bind_front_handler(&Exchange::on_read, this->shared_from_this()));
            }

            void on_read(beast::error_code ec, std::size_t)
            {
                if (ec)
                    return finish(ec);

                auto res = parser_.release();
                UpstreamResponse out;
                out.status = res.result_int();
                if (auto ct = res.find(http::field::content_type); ct != res.end())
                    out.content_type = std::string(ct->value());
                out.body = std::move(res.body());
                finish({}, std::move(out));
            }

            void finish(beast::error_code ec, UpstreamResponse response = {})
            {
                if (done_)
                    return;
                done_ = true;
                timer_.cancel();

                // No TLS close_notify: the connection is never reused.
                beast::error_code ignored;
                beast::get_lowest_layer(stream_).socket().shutdown(tcp::socket::shutdown_both, ignored);
                beast::get_lowest_layer(stream_).close();

                if (timed_out_)
                    ec = beast::error::timeout;
                handler_(ec, std::move(response));
            }

            tcp::resolver resolver_;
            Stream stream_;
            net::steady_timer timer_;
            std::string host_;
            std::string port_;
            std::chrono::steady_clock::time_point deadline_;
            UpstreamTransport::Handler handler_;
            http::request<http::string_body> req_;
            http::response_parser<http::string_body> parser_;
            beast::flat_buffer buffer_;
            bool timed_out_{false};
            bool done_{false};
        };
    } // namespace

    HttpTransport::HttpTransport(net::io_context &ioc)
        : ioc_(ioc), ssl_ctx_(net::ssl::context::tls_client)
    {
        ssl_ctx_.set_default_verify_paths();
        ssl_ctx_.set_verify_mode(net::ssl::verify_peer);
    }

    void HttpTransport::async_send(UpstreamRequest request,
                                   std::chrono::steady_clock::time_point deadline,
                                   Handler handler)
    {
        auto strand = net::make_strand(ioc_);
        if (request.url.is_https())
        {
            std::make_shared<Exchange<SslStream>>(strand, std::move(request), deadline, std::move(handler), ssl_ctx_)->run();
        }
        else
        {
            std::make_shared<Exchange<beast::tcp_stream>>(strand, std::move(request), deadline, std::move(handler))->run();
        }
    }

} // namespace sentinel
