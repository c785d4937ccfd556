#pragma once

#include "deployment.hpp"
#include "envelope.hpp"
#include "rate_limiter.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace ferry
{
    struct RpcResponse
    {
        unsigned status{200};
        nlohmann::json body = nlohmann::json::object();
    };

    /** HTTP status for a ledger error */
    unsigned status_for(ErrorCode code);

    /**
     * Transport-independent request handling for the gateway.
     *
     * GET routes are read-only inspection. POST routes carry a SignedEnvelope
     * whose route must equal the request path; the envelope's caller becomes
     * the acting identity of the ledger call. Calls are serialized so ledgers
     * see one call at a time. Every request spends the client's rate budget;
     * POSTs also spend the budget of their verified caller.
     */
    class RpcRouter
    {
    public:
        explicit RpcRouter(Deployment &deployment, RateLimiter::Config rate_limit = {});

        RpcResponse handle(std::string_view method,
                           std::string_view target,
                           const std::string &body,
                           const std::string &client_key);

        const NonceTracker &nonces() const { return nonces_; }

    private:
        RpcResponse handle_get(const std::vector<std::string> &path);
        RpcResponse handle_post(std::string_view route,
                                const std::vector<std::string> &path,
                                const std::string &body,
                                const std::string &client_key);

        RpcResponse dispatch(BridgeLedger &ledger,
                             std::string_view action,
                             const Identity &caller,
                             const nlohmann::json &body);

        Deployment &deployment_;
        NonceTracker nonces_;
        RateLimiter limiter_;        // per client address
        RateLimiter caller_limiter_; // per verified envelope caller
        std::mutex mutex_;
    };

} // namespace ferry
