#pragma once

#include "crypto.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ferry
{
    /**
     * Authenticated RPC request. The caller signs the canonical JSON of
     * {caller, nonce, route, body} with the Ed25519 key that is its identity.
     */
    struct SignedEnvelope
    {
        Identity caller{};
        std::uint64_t nonce{0};
        std::string route;
        nlohmann::json body = nlohmann::json::object();
        std::string signature; // base64 Ed25519 signature

        static SignedEnvelope sign(const crypto::Ed25519KeyPair &keypair,
                                   std::uint64_t nonce,
                                   std::string route,
                                   nlohmann::json body);

        static Result<SignedEnvelope> from_json(const nlohmann::json &j);
        nlohmann::json to_json() const;

        /** Canonical bytes covered by the signature */
        std::string signing_payload() const;

        /** Check the signature against the caller identity */
        Result<void> verify() const;
    };

    /**
     * Per-caller sequential nonces. Each caller starts at zero and must present
     * exactly the next value.
     */
    class NonceTracker
    {
    public:
        std::uint64_t expected(const Identity &caller) const;

        /** Accept nonce if it is the next one for caller */
        Result<void> consume(const Identity &caller, std::uint64_t nonce);

    private:
        mutable std::mutex mutex_;
        std::unordered_map<Identity, std::uint64_t, ByteArrayHash> next_;
    };

} // namespace ferry
