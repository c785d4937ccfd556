#pragma once

#include "rate_limiter.hpp"
#include "rpc_router.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace ferry
{
    struct RpcServerConfig
    {
        std::uint16_t port{8080};
        std::size_t threads{std::thread::hardware_concurrency() ? std::thread::hardware_concurrency() : 4};
        RateLimiter::Config rate_limit{};
    };

    /**
     * HTTP gateway over a Deployment using Boost.Beast. Requests are handed to
     * an RpcRouter; clients are keyed by X-Client-Id or their remote address.
     */
    class RpcServer
    {
    public:
        RpcServer(Deployment &deployment, const RpcServerConfig &cfg = RpcServerConfig{});
        ~RpcServer();

        /** Start the server and block until stopped. */
        void run();

        /** Request a stop; active connections complete gracefully. */
        void stop();

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };
}
