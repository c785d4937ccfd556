#include "ferry/rpc_server.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace ferry
{
    namespace
    {
        template <class Body, class Allocator>
        std::string client_id(const http::request<Body, http::basic_fields<Allocator>> &req,
                              const tcp::endpoint &remote)
        {
            if (auto cid = req.find("X-Client-Id"); cid != req.end())
            {
                return std::string(cid->value());
            }
            return remote.address().to_string();
        }

        http::response<http::string_body> to_http(const RpcResponse &response, unsigned version)
        {
            http::response<http::string_body> res{static_cast<http::status>(response.status), version};
            res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
            res.set(http::field::content_type, "application/json");
            res.body() = response.body.dump();
            res.prepare_payload();
            return res;
        }
    } // namespace

    class RpcServer::Impl
    {
    public:
        Impl(Deployment &deployment, RpcServerConfig cfg)
            : cfg_(std::move(cfg)),
              ioc_(static_cast<int>(cfg_.threads)),
              acceptor_(ioc_),
              router_(deployment, cfg_.rate_limit)
        {
        }

        ~Impl()
        {
            stop();
        }

        void run()
        {
            tcp::endpoint endpoint{tcp::v4(), cfg_.port};
            beast::error_code ec;

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

            spdlog::info("ferry gateway listening on port {} ({} threads)", cfg_.port, cfg_.threads);
            do_accept();

            std::vector<std::thread> threads;
            threads.reserve(cfg_.threads);
            for (std::size_t i = 0; i < cfg_.threads; ++i)
            {
                threads.emplace_back([this] { ioc_.run(); });
            }

            for (auto &t : threads)
                t.join();
        }

        void stop()
        {
            beast::error_code ec;
            acceptor_.cancel(ec);
            acceptor_.close(ec);
            ioc_.stop();
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
            if (ec)
            {
                spdlog::debug("accept failed: {}", ec.message());
            }
            else
            {
                std::make_shared<Session>(std::move(socket), router_)->run();
            }
            if (acceptor_.is_open())
                do_accept();
        }

        class Session : public std::enable_shared_from_this<Session>
        {
        public:
            Session(tcp::socket socket, RpcRouter &router)
                : stream_(std::move(socket)),
                  router_(router)
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
                req_ = {};
                stream_.expires_after(std::chrono::seconds(30));
                http::async_read(stream_, buffer_, req_,
                                 beast::bind_front_handler(&Session::on_read, shared_from_this()));
            }

            void on_read(beast::error_code ec, std::size_t)
            {
                if (ec == http::error::end_of_stream)
                {
                    return do_close();
                }
                if (ec)
                {
                    return;
                }

                beast::error_code remote_ec;
                auto remote = stream_.socket().remote_endpoint(remote_ec);
                auto key = remote_ec ? std::string("unknown") : client_id(req_, remote);

                auto response = router_.handle(std::string(req_.method_string()),
                                               std::string(req_.target()),
                                               req_.body(),
                                               key);
                spdlog::debug("{} {} -> {}", std::string(req_.method_string()), std::string(req_.target()), response.status);
                res_ = to_http(response, req_.version());
                do_write();
            }

            void do_write()
            {
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
            http::request<http::string_body> req_;
            http::response<http::string_body> res_;
            RpcRouter &router_;
        };

        RpcServerConfig cfg_;
        net::io_context ioc_;
        tcp::acceptor acceptor_;
        RpcRouter router_;
    };

    RpcServer::RpcServer(Deployment &deployment, const RpcServerConfig &cfg)
        : impl_(std::make_unique<Impl>(deployment, cfg)) {}
    RpcServer::~RpcServer() = default;
    void RpcServer::run() { impl_->run(); }
    void RpcServer::stop() { impl_->stop(); }
} // namespace ferry
