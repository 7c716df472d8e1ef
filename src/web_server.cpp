#include "sentinel/web_server.hpp"
#include "sentinel/address_matcher.hpp"
#include "sentinel/admission_pipeline.hpp"
#include "sentinel/audit.hpp"
#include "sentinel/forwarding_gateway.hpp"
#include "sentinel/http_transport.hpp"
#include "sentinel/identity_resolver.hpp"
#include "sentinel/rate_window.hpp"
#include "sentinel/secret_injector.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <csignal>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace sentinel
{
    namespace
    {
        constexpr std::string_view kProxyPrefix = "/v1/proxy/";

        http::response<http::string_body> json_response(http::status status, const nlohmann::json &j)
        {
            http::response<http::string_body> res{status, 11};
            res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
            res.set(http::field::content_type, "application/json");
            // Service names and Origin values are raw request bytes.
            res.body() = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            res.prepare_payload();
            return res;
        }

        http::response<http::string_body> error_response(unsigned status, const std::string &message)
        {
            return json_response(static_cast<http::status>(status), {{"error", message}});
        }

        http::response<http::string_body> not_found()
        {
            return error_response(404, "not found");
        }

        http::response<http::string_body> to_response(ProxyOutcome outcome)
        {
            if (auto *decision = std::get_if<TerminalDecision>(&outcome))
                return error_response(decision->status, decision->message);

            auto &forwarded = std::get<ForwardedResponse>(outcome);
            http::response<http::string_body> res;
            res.version(11);
            res.result(forwarded.status);
            res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
            if (forwarded.content_type)
                res.set(http::field::content_type, *forwarded.content_type);
            res.body() = std::move(forwarded.body);
            res.prepare_payload();
            return res;
        }

        std::optional<std::string> header_value(const http::request<http::string_body> &req, const char *name)
        {
            if (auto it = req.find(name); it != req.end())
                return std::string(it->value());
            return std::nullopt;
        }

        std::string trim(std::string_view text)
        {
            while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
                text.remove_prefix(1);
            while (!text.empty() && (text.back() == ' ' || text.back() == '\t'))
                text.remove_suffix(1);
            return std::string(text);
        }

        /** Left-most X-Forwarded-For entry, or empty when the header is absent. */
        std::string forwarded_for(const http::request<http::string_body> &req)
        {
            auto xff = header_value(req, "X-Forwarded-For");
            if (!xff)
                return {};
            auto comma = xff->find(',');
            return trim(std::string_view(*xff).substr(0, comma));
        }

        std::string_view route_path(beast::string_view raw)
        {
            std::string_view target(raw.data(), raw.size());
            auto q = target.find('?');
            return q == std::string_view::npos ? target : target.substr(0, q);
        }

        IdentityResolver make_resolver(const GatewayConfig &cfg)
        {
            auto resolver = IdentityResolver::from_config(cfg);
            if (!resolver)
                throw resolver.error();
            return std::move(*resolver);
        }
    } // namespace

    class WebServer::Impl
    {
    public:
        Impl(GatewayConfig cfg, std::shared_ptr<spdlog::logger> access_logger)
            : cfg_(std::move(cfg)),
              ioc_(static_cast<int>(cfg_.server.threads)),
              acceptor_(ioc_),
              signals_(ioc_, SIGINT, SIGTERM),
              audit_(std::move(access_logger)),
              identities_(make_resolver(cfg_)),
              gateway_(std::make_shared<HttpTransport>(ioc_), audit_),
              pipeline_(cfg_, identities_, rates_, secrets_, gateway_, audit_)
        {
        }

        ~Impl()
        {
            stop();
        }

        std::uint16_t start()
        {
            beast::error_code ec;
            auto address = net::ip::make_address(cfg_.server.bind_address, ec);
            if (ec)
                throw beast::system_error{ec};
            tcp::endpoint endpoint{address, cfg_.server.port};

            acceptor_.open(endpoint.protocol(), ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.set_option(net::socket_base::reuse_address(true), ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.bind(endpoint, ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.listen(net::socket_base::max_listen_connections, ec);
            if (ec)
                throw beast::system_error{ec};

            auto port = acceptor_.local_endpoint().port();
            spdlog::info("sentinel listening on {}:{} ({} threads)", cfg_.server.bind_address, port,
                         cfg_.server.threads);

            signals_.async_wait([this](beast::error_code sig_ec, int) {
                if (sig_ec)
                    return;
                spdlog::info("shutdown signal received");
                beast::error_code ignored;
                acceptor_.close(ignored);
                ioc_.stop();
            });

            do_accept();

            threads_.reserve(cfg_.server.threads);
            for (std::size_t i = 0; i < cfg_.server.threads; ++i)
            {
                threads_.emplace_back([this] { ioc_.run(); });
            }
            return port;
        }

        void wait()
        {
            for (auto &t : threads_)
            {
                if (t.joinable())
                    t.join();
            }
        }

        void stop()
        {
            beast::error_code ec;
            acceptor_.cancel(ec);
            acceptor_.close(ec);
            signals_.cancel(ec);
            ioc_.stop();
            for (auto &t : threads_)
            {
                if (t.joinable() && t.get_id() != std::this_thread::get_id())
                    t.join();
            }
        }

    private:
        void do_accept()
        {
            acceptor_.async_accept(
                net::make_strand(ioc_),
                beast::bind_front_handler(&Impl::on_accept, this));
        }

        void on_accept(beast::error_code ec, tcp::socket socket)
        {
            if (ec == net::error::operation_aborted)
                return;
            if (!ec)
            {
                std::make_shared<Session>(std::move(socket), *this)->run();
            }
            do_accept();
        }

        class Session : public std::enable_shared_from_this<Session>
        {
        public:
            Session(tcp::socket socket, Impl &server)
                : stream_(std::move(socket)),
                  server_(server)
            {
            }

            void run()
            {
                net::dispatch(stream_.get_executor(),
                              beast::bind_front_handler(&Session::do_read, shared_from_this()));
            }

        private:
            void do_read()
            {
                parser_.emplace();
                parser_->body_limit(server_.cfg_.server.body_limit);
                stream_.expires_after(std::chrono::seconds(30));
                http::async_read(stream_, buffer_, *parser_,
                                 beast::bind_front_handler(&Session::on_read, shared_from_this()));
            }

            void on_read(beast::error_code ec, std::size_t)
            {
                if (ec == http::error::end_of_stream)
                {
                    return do_close();
                }
                if (ec == http::error::body_limit)
                {
                    res_ = error_response(413, "Request body too large");
                    return do_write();
                }
                if (ec)
                {
                    return;
                }

                req_ = parser_->release();
                handle_request();
            }

            void handle_request()
            {
                try
                {
                    route();
                }
                catch (const std::exception &e)
                {
                    spdlog::error("request handling failed: {}", e.what());
                    res_ = error_response(500, "Internal server error");
                    do_write();
                }
            }

            void route()
            {
                auto path = route_path(req_.target());

                if (path == "/health" && req_.method() == http::verb::get)
                {
                    res_ = json_response(http::status::ok,
                                         {{"status", "ok"}, {"services", server_.cfg_.service_names()}});
                    return do_write();
                }

                if (path.starts_with(kProxyPrefix) && req_.method() == http::verb::post)
                {
                    auto service = path.substr(kProxyPrefix.size());
                    if (service.empty() || service.find('/') != std::string_view::npos)
                    {
                        res_ = not_found();
                        return do_write();
                    }

                    ProxyCall call;
                    call.service_name = std::string(service);
                    call.token = header_value(req_, "x-agent-token");
                    call.context.client_address = client_address();
                    call.context.origin = header_value(req_, "Origin");
                    call.context.referer = header_value(req_, "Referer");
                    call.body = std::move(req_.body());

                    // Upstream completion arrives on the transport's strand.
                    server_.pipeline_.handle(call, [self = shared_from_this()](ProxyOutcome outcome) {
                        net::dispatch(self->stream_.get_executor(),
                                      [self, outcome = std::move(outcome)]() mutable {
                                          self->res_ = to_response(std::move(outcome));
                                          self->do_write();
                                      });
                    });
                    return;
                }

                res_ = not_found();
                do_write();
            }

            std::string client_address()
            {
                if (server_.cfg_.server.trust_proxy)
                {
                    if (auto forwarded = forwarded_for(req_); !forwarded.empty())
                        return normalize_client_address(forwarded);
                }
                beast::error_code ec;
                auto remote = stream_.socket().remote_endpoint(ec);
                if (ec)
                    return {};
                return normalize_client_address(remote.address().to_string());
            }

            void do_write()
            {
                res_.keep_alive(false);
                auto self = shared_from_this();
                http::async_write(stream_, res_,
                                  [self](beast::error_code ec, std::size_t) {
                                      self->on_write(ec);
                                  });
            }

            void on_write(beast::error_code ec)
            {
                if (ec)
                {
                    return;
                }
                stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            }

            void do_close()
            {
                beast::error_code ec;
                stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            }

            beast::tcp_stream stream_;
            beast::flat_buffer buffer_;
            std::optional<http::request_parser<http::string_body>> parser_;
            http::request<http::string_body> req_;
            http::response<http::string_body> res_;
            Impl &server_;
        };

        GatewayConfig cfg_;
        net::io_context ioc_;
        tcp::acceptor acceptor_;
        net::signal_set signals_;
        std::vector<std::thread> threads_;
        AuditLogger audit_;
        IdentityResolver identities_;
        RateWindow rates_;
        EnvironmentSecretSource secrets_;
        ForwardingGateway gateway_;
        AdmissionPipeline pipeline_;
    };

    WebServer::WebServer(GatewayConfig cfg, std::shared_ptr<spdlog::logger> access_logger)
        : impl_(std::make_unique<Impl>(std::move(cfg), std::move(access_logger)))
    {
    }

    WebServer::~WebServer() = default;

    std::uint16_t WebServer::start() { return impl_->start(); }

    void WebServer::run()
    {
        impl_->start();
        impl_->wait();
    }

    void WebServer::stop() { impl_->stop(); }

} // namespace sentinel
